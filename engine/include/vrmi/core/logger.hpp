#pragma once

/**
 * @file logger.hpp
 * @brief Centralized logging facade using spdlog
 */

#include <memory>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <cpptrace/basic.hpp>

namespace vrmi::core {

namespace detail {
  spdlog::logger *activeLogger();
  std::string scopePrefix();
} // namespace detail

// Category channel. Every channel writes through the shared "vrmi" logger and
// prefixes its tag plus the active log scopes of the calling thread.
class LogChannel {
public:
  explicit constexpr LogChannel(std::string_view tag) : m_tag(tag) {}

  template <typename... Args>
  void trace(spdlog::format_string_t<Args...> fmtStr, Args &&...args) const {
    log(spdlog::level::trace, fmtStr, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(spdlog::format_string_t<Args...> fmtStr, Args &&...args) const {
    log(spdlog::level::debug, fmtStr, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(spdlog::format_string_t<Args...> fmtStr, Args &&...args) const {
    log(spdlog::level::info, fmtStr, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(spdlog::format_string_t<Args...> fmtStr, Args &&...args) const {
    log(spdlog::level::warn, fmtStr, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(spdlog::format_string_t<Args...> fmtStr, Args &&...args) const {
    log(spdlog::level::err, fmtStr, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void critical(spdlog::format_string_t<Args...> fmtStr, Args &&...args) const {
    log(spdlog::level::critical, fmtStr, std::forward<Args>(args)...);
  }

  [[nodiscard]] std::string_view tag() const { return m_tag; }

private:
  template <typename... Args>
  void log(spdlog::level::level_enum level, spdlog::format_string_t<Args...> fmtStr,
           Args &&...args) const {
    spdlog::logger *logger = detail::activeLogger();
    if (logger == nullptr || !logger->should_log(level)) {
      return;
    }
    logger->log(level, "[{}]{} {}", m_tag, detail::scopePrefix(),
                fmt::format(fmtStr, std::forward<Args>(args)...));
  }

  std::string_view m_tag;
};

class Logger {
public:
  // Static-only interface
  Logger() = delete;
  ~Logger() = delete;
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  // Initialize logger (call once on startup)
  static void init(const std::string &pattern = "[%H:%M:%S] [%l] %v");
  static void shutdown();

  static void setLevel(spdlog::level::level_enum level);
  static spdlog::level::level_enum getLevel();

  static spdlog::logger *get() { return sLogger.get(); }

  template <typename... Args>
  static void trace(spdlog::format_string_t<Args...> fmtStr, Args &&...args) {
    if (sLogger)
      sLogger->trace(fmtStr, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void debug(spdlog::format_string_t<Args...> fmtStr, Args &&...args) {
    if (sLogger)
      sLogger->debug(fmtStr, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void info(spdlog::format_string_t<Args...> fmtStr, Args &&...args) {
    if (sLogger)
      sLogger->info(fmtStr, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void warn(spdlog::format_string_t<Args...> fmtStr, Args &&...args) {
    if (sLogger)
      sLogger->warn(fmtStr, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void error(spdlog::format_string_t<Args...> fmtStr, Args &&...args) {
    if (sLogger) {
      sLogger->error(fmtStr, std::forward<Args>(args)...);
    }
  }

  template <typename... Args>
  static void critical(spdlog::format_string_t<Args...> fmtStr, Args &&...args) {
    if (sLogger) {
      sLogger->critical(fmtStr, std::forward<Args>(args)...);
    }
  }

  template <typename... Args>
  static void fatal(spdlog::format_string_t<Args...> fmtStr, Args &&...args) {
    if (sLogger) {
      std::string userMsg = fmt::format(fmtStr, std::forward<Args>(args)...);
      std::string trace = cpptrace::generate_trace().to_string();
      sLogger->critical("{}\nStack Trace:\n{}", userMsg, trace);
    }
  }

  static const LogChannel Asset;
  static const LogChannel Scene;
  static const LogChannel Import;
  static const LogChannel Runtime;

private:
  static std::shared_ptr<spdlog::logger> sLogger;
};

// Pushes a named scope for the lifetime of the object; nested scopes show up
// as "/a/b" after the channel tag.
class LogScope {
public:
  explicit LogScope(std::string name);
  ~LogScope();

  LogScope(const LogScope &) = delete;
  LogScope &operator=(const LogScope &) = delete;
};

} // namespace vrmi::core

#define VRMI_LOG_CONCAT_INNER(a, b) a##b
#define VRMI_LOG_CONCAT(a, b) VRMI_LOG_CONCAT_INNER(a, b)
#define VRMI_LOG_SCOPE(name)                                                   \
  ::vrmi::core::LogScope VRMI_LOG_CONCAT(vrmiLogScope_, __LINE__) { name }
