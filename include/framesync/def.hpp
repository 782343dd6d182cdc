#pragma once

#include <new> // IWYU pragma: keep

#ifndef FRAMESYNC_CLONEABLE
#define FRAMESYNC_CLONEABLE(Type__)                                                                                    \
  Type__ *clone_at(void *mem__) const override { return new (mem__) Type__(*this); }                                   \
  size_t clone_size() const noexcept override { return sizeof(Type__); }                                               \
  size_t clone_align() const noexcept override { return alignof(Type__); }
#endif

#ifndef FRAMESYNC_NO_UNIQUE_ADDRESS
#if defined(_MSC_VER)
// [[no_unique_address]] is ignored by MSVC even in C++20 mode; instead, [[msvc::no_unique_address]] is provided.
// Ref: https://en.cppreference.com/w/cpp/language/attributes/no_unique_address
#define FRAMESYNC_NO_UNIQUE_ADDRESS [[msvc::no_unique_address]]
#else
#define FRAMESYNC_NO_UNIQUE_ADDRESS [[no_unique_address]]
#endif
#endif
