#pragma once

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace framesync {

/**
 * @brief Logging level policy.
 *
 * - `error`: the requested operation fails.
 * - `warn`: failure being propagated to the caller, or suspicious input.
 * - `info`: high-level summaries.
 * - `debug`: per-call diagnostics (segment counts, worker counts, clipping).
 */
enum class log_verbosity { error = 0, warn = 1, info = 2, debug = 3 };

namespace detail {
inline std::atomic<int> g_log_level{static_cast<int>(log_verbosity::warn)};
} // namespace detail

inline void set_log_verbosity(log_verbosity level) noexcept {
  detail::g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

inline log_verbosity get_log_verbosity() noexcept {
  return static_cast<log_verbosity>(detail::g_log_level.load(std::memory_order_relaxed));
}

constexpr std::optional<log_verbosity> parse_log_verbosity(std::string_view tag) noexcept {
  if (tag == "error") {
    return log_verbosity::error;
  }
  if (tag == "warn" || tag == "warning") {
    return log_verbosity::warn;
  }
  if (tag == "info") {
    return log_verbosity::info;
  }
  if (tag == "debug") {
    return log_verbosity::debug;
  }
  return std::nullopt;
}

/**
 * @brief Set verbosity from the FRAMESYNC_LOG_LEVEL environment variable
 *
 * Unknown or missing values leave the current level untouched.
 *
 * @return true if the level was changed
 */
inline bool set_log_verbosity_from_env() {
  char const *env = std::getenv("FRAMESYNC_LOG_LEVEL");
  if (env == nullptr) {
    return false;
  }
  auto level = parse_log_verbosity(env);
  if (!level) {
    return false;
  }
  set_log_verbosity(*level);
  return true;
}

inline bool should_log(log_verbosity level) noexcept {
  return static_cast<int>(level) <= static_cast<int>(get_log_verbosity());
}

constexpr std::string_view log_label(log_verbosity level) noexcept {
  switch (level) {
  case log_verbosity::error:
    return "error";
  case log_verbosity::warn:
    return "warn";
  case log_verbosity::info:
    return "info";
  case log_verbosity::debug:
    return "debug";
  }
  return "debug";
}

namespace detail {
inline void log_line(log_verbosity level, std::string_view message, char const *file, int line, char const *func) {
  if (level == log_verbosity::error) {
    std::cerr << "[framesync][" << log_label(level) << "][" << file << ":" << line << " " << func << "] " << message
              << "\n";
    return;
  }
  std::cerr << "[framesync][" << log_label(level) << "] " << message << "\n";
}

inline void log_multiline(log_verbosity level, std::string const &message, char const *file, int line,
                          char const *func) {
  size_t start = 0;
  while (start <= message.size()) {
    size_t const end = message.find('\n', start);
    size_t const len = (end == std::string::npos) ? (message.size() - start) : (end - start);
    if (len > 0 || message.empty()) {
      log_line(level, std::string_view(message).substr(start, len), file, line, func);
    }
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
}
} // namespace detail

/**
 * @brief Stream-style logger for messages built across several statements
 */
class log_stream {
public:
  log_stream(log_verbosity level, char const *file, int line, char const *func)
      : level(level), file(file), line(line), func(func), enabled(should_log(level)) {}

  log_stream(log_stream const &) = delete;
  log_stream &operator=(log_stream const &) = delete;

  template <typename T>
  log_stream &operator<<(T const &value) {
    if (enabled) {
      stream << value;
    }
    return *this;
  }

  ~log_stream() {
    if (enabled) {
      detail::log_multiline(level, stream.str(), file, line, func);
    }
  }

private:
  log_verbosity level;
  char const *file;
  int line;
  char const *func;
  bool enabled;
  std::ostringstream stream;
};
} // namespace framesync

#define FRAMESYNC_LOG(level, message)                                                                                  \
  do {                                                                                                                 \
    if (::framesync::should_log(level)) {                                                                              \
      std::ostringstream framesync_log_stream__;                                                                       \
      framesync_log_stream__ << message;                                                                               \
      ::framesync::detail::log_multiline(level, framesync_log_stream__.str(), __FILE__, __LINE__, __func__);           \
    }                                                                                                                  \
  } while (0)

#define FRAMESYNC_LOG_STREAM(level) ::framesync::log_stream(level, __FILE__, __LINE__, __func__)

#define FRAMESYNC_LOG_ERROR(message) FRAMESYNC_LOG(::framesync::log_verbosity::error, message)
#define FRAMESYNC_LOG_WARN(message) FRAMESYNC_LOG(::framesync::log_verbosity::warn, message)
#define FRAMESYNC_LOG_INFO(message) FRAMESYNC_LOG(::framesync::log_verbosity::info, message)
#define FRAMESYNC_LOG_DEBUG(message) FRAMESYNC_LOG(::framesync::log_verbosity::debug, message)
