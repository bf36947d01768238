#include "core/Log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace Log {

namespace {

constexpr const char *kLoggerName = "ESCAPERUN";

std::shared_ptr<spdlog::logger> s_Logger;

std::shared_ptr<spdlog::logger> MakeLogger(const char *logFile) {
  std::vector<spdlog::sink_ptr> sinks;

  auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  consoleSink->set_pattern("%^[%T] %n: %v%$");
  sinks.push_back(consoleSink);

  if (logFile != nullptr) {
    auto fileSink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
    fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %n: %v");
    sinks.push_back(fileSink);
  }

  auto logger =
      std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_level(spdlog::level::trace);
  logger->flush_on(spdlog::level::warn);
  return logger;
}

} // namespace

void Init(const char *logFile) {
  if (s_Logger) {
    spdlog::drop(kLoggerName);
  }
  s_Logger = MakeLogger(logFile);
  spdlog::register_logger(s_Logger);

  LOG_INFO("Logging initialized{}", logFile ? "" : " (console only)");
}

void Shutdown() {
  if (s_Logger) {
    s_Logger->flush();
  }
  s_Logger.reset();
  spdlog::shutdown();
}

void SetLevel(const spdlog::level::level_enum level) {
  GetLogger()->set_level(level);
}

std::shared_ptr<spdlog::logger> &GetLogger() {
  if (!s_Logger) {
    s_Logger = MakeLogger(nullptr);
  }
  return s_Logger;
}

} // namespace Log
