#include "vrmi/core/logger.hpp"

#include <vector>

namespace vrmi::core {

std::shared_ptr<spdlog::logger> Logger::sLogger;

const LogChannel Logger::Asset{"Asset"};
const LogChannel Logger::Scene{"Scene"};
const LogChannel Logger::Import{"Import"};
const LogChannel Logger::Runtime{"Runtime"};

namespace {
  std::vector<std::string> &scopeStack() {
    thread_local std::vector<std::string> stack;
    return stack;
  }
} // namespace

namespace detail {

  spdlog::logger *activeLogger() { return Logger::get(); }

  std::string scopePrefix() {
    const auto &stack = scopeStack();
    if (stack.empty()) {
      return {};
    }
    std::string prefix = " [";
    for (size_t i = 0; i < stack.size(); ++i) {
      if (i > 0) {
        prefix += '/';
      }
      prefix += stack[i];
    }
    prefix += ']';
    return prefix;
  }

} // namespace detail

void Logger::init(const std::string &pattern) {
  if (sLogger) {
    return; // Already initialized
  }

  auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  const auto logger = std::make_shared<spdlog::logger>("vrmi", consoleSink);

  logger->set_pattern(pattern);

#ifdef DEBUG
  logger->set_level(spdlog::level::debug);
#else
  logger->set_level(spdlog::level::info);
#endif

  spdlog::register_logger(logger);
  sLogger = logger;

  info("Logger initialized");
}

void Logger::shutdown() {
  if (!sLogger) {
    return;
  }
  sLogger->flush();
  spdlog::drop(sLogger->name());
  sLogger.reset();
}

void Logger::setLevel(spdlog::level::level_enum level) {
  if (sLogger) {
    sLogger->set_level(level);
  }
}

spdlog::level::level_enum Logger::getLevel() {
  return sLogger ? sLogger->level() : spdlog::level::off;
}

LogScope::LogScope(std::string name) { scopeStack().push_back(std::move(name)); }

LogScope::~LogScope() {
  auto &stack = scopeStack();
  if (!stack.empty()) {
    stack.pop_back();
  }
}

} // namespace vrmi::core
