#include "scapi/util/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <vector>

#include "scapi/config/config.hpp"

namespace scapi::util {

namespace {

constexpr size_t kMaxLogFileSize = 1024 * 1024 * 5;
constexpr size_t kMaxLogFiles = 3;

spdlog::level::level_enum toSpdlogLevel(const std::string& level) {
  auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to "off"
  if (parsed == spdlog::level::off && level != "off") {
    return spdlog::level::info;
  }
  return parsed;
}

}  // namespace

void initializeLogging(const config::LoggingConfig& config) {
  const auto level = toSpdlogLevel(config.level);

  try {
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(level);
    sinks.push_back(console_sink);

    if (!config.file.empty()) {
      auto parent = config.file.parent_path();
      if (!parent.empty()) {
        std::filesystem::create_directories(parent);
      }
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        config.file.string(), kMaxLogFileSize, kMaxLogFiles);
      file_sink->set_level(spdlog::level::debug);
      sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("scapi", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    logger->set_level(config.file.empty() ? level : spdlog::level::debug);

    spdlog::set_default_logger(logger);

  } catch (const std::exception& e) {
    // Fallback to console-only logging if file setup fails
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    spdlog::set_level(level);
    spdlog::warn("Failed to setup file logging: {}", e.what());
  }
}

void logContextualError(const ContextualError& error) {
  std::string message = fmt::format("[{}:{}] {}",
    static_cast<int>(error.code()),
    static_cast<int>(error.severity()),
    error.message());

  switch (error.severity()) {
    case ErrorSeverity::kInfo:
      spdlog::info(message);
      break;
    case ErrorSeverity::kWarning:
      spdlog::warn(message);
      break;
    case ErrorSeverity::kError:
      spdlog::error(message);
      break;
    case ErrorSeverity::kCritical:
      spdlog::critical(message);
      break;
  }

  if (error.context()) {
    const auto& ctx = *error.context();
    if (!ctx.uri.empty()) {
      spdlog::debug("  Uri: {}", ctx.uri);
    }
    if (!ctx.operation.empty()) {
      spdlog::debug("  Operation: {}", ctx.operation);
    }
    if (!ctx.stack.empty()) {
      spdlog::debug("  Stack: [{}]", error.stackTrace());
    }
  }
}

} // namespace scapi::util
