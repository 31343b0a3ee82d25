#ifndef REVHIST_LOGGER_HPP
#define REVHIST_LOGGER_HPP

#include <spdlog/spdlog.h>

#include <concepts>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace revhist {

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

/**
 * Format string that remembers where it was written.
 * The location is taken when the literal converts at the call site, so a
 * message logged through any of the helpers below reports the caller's
 * file and line.
 */
template <typename... Args>
struct LocatedFormat {
  template <typename S>
    requires std::convertible_to<const S&, std::string_view>
  consteval LocatedFormat(
      const S& text,
      std::source_location loc = std::source_location::current())
      : fmt(text), location(loc) {}

  spdlog::format_string_t<Args...> fmt;
  std::source_location location;
};

template <typename... Args>
using format_at = LocatedFormat<std::type_identity_t<Args>...>;

class Logger {
 public:
  static Logger& get_instance() {
    static Logger instance;
    return instance;
  }

  void set_level(LogLevel level) {
    switch (level) {
      case LogLevel::DEBUG:
        spdlog::set_level(spdlog::level::debug);
        break;
      case LogLevel::INFO:
        spdlog::set_level(spdlog::level::info);
        break;
      case LogLevel::WARN:
        spdlog::set_level(spdlog::level::warn);
        break;
      case LogLevel::ERROR:
        spdlog::set_level(spdlog::level::err);
        break;
    }
  }

  LogLevel get_level() const {
    switch (spdlog::get_level()) {
      case spdlog::level::trace:
      case spdlog::level::debug:
        return LogLevel::DEBUG;
      case spdlog::level::warn:
        return LogLevel::WARN;
      case spdlog::level::err:
      case spdlog::level::critical:
        return LogLevel::ERROR;
      default:
        return LogLevel::INFO;
    }
  }

  template <typename... Args>
  void log_at(spdlog::level::level_enum level,
              const std::source_location& location,
              spdlog::format_string_t<Args...> fmt, Args&&... args) {
    // Containers log on hot paths; skip formatting when the level is off
    if (!spdlog::should_log(level)) {
      return;
    }

    std::string_view path(location.file_name());
    size_t pos = path.find_last_of("/\\");
    std::string_view filename =
        (pos == std::string_view::npos) ? path : path.substr(pos + 1);

    std::string message =
        spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...);
    spdlog::log(level, "{} [{}:{}]", message, filename, location.line());
  }

 private:
  Logger() {
    // Set default pattern to include file and line
    spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
};

template <typename... Args>
inline void log_debug(format_at<Args...> fmt, Args&&... args) {
  Logger::get_instance().log_at(spdlog::level::debug, fmt.location, fmt.fmt,
                                std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_info(format_at<Args...> fmt, Args&&... args) {
  Logger::get_instance().log_at(spdlog::level::info, fmt.location, fmt.fmt,
                                std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_warn(format_at<Args...> fmt, Args&&... args) {
  Logger::get_instance().log_at(spdlog::level::warn, fmt.location, fmt.fmt,
                                std::forward<Args>(args)...);
}

/**
 * Logger bound to one component. Every message is prefixed with the
 * component name, e.g. "RevisionWindowedMap: truncated at 8".
 */
class ContextLogger {
 public:
  explicit ContextLogger(std::string prefix) : prefix_(std::move(prefix)) {}

  template <typename... Args>
  void debug(format_at<Args...> fmt, Args&&... args) const {
    write(spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(format_at<Args...> fmt, Args&&... args) const {
    write(spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }

 private:
  template <typename... Args>
  void write(spdlog::level::level_enum level, const format_at<Args...>& fmt,
             Args&&... args) const {
    if (!spdlog::should_log(level)) return;
    std::string message =
        spdlog::fmt_lib::format(fmt.fmt, std::forward<Args>(args)...);
    Logger::get_instance().log_at(level, fmt.location, "{}: {}", prefix_,
                                  message);
  }

  std::string prefix_;
};

}  // namespace revhist

#endif  // REVHIST_LOGGER_HPP
