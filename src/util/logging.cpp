#include "hrec/util/logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace hrec::util {

namespace {

constexpr const char* kLoggerName = "hrec";

spdlog::level::level_enum toLevel(const std::string& level) {
  return spdlog::level::from_str(level);
}

}  // namespace

bool isValidLogLevel(const std::string& level) {
  // from_str maps unknown names to "off"
  return level == "off" || toLevel(level) != spdlog::level::off;
}

Result<void> initializeLogging(const LogSettings& settings) {
  if (!isValidLogLevel(settings.level)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Unknown log level: " + settings.level));
  }

  try {
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink for warnings and above unless running verbose
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(settings.verbose_console ? spdlog::level::trace : spdlog::level::warn);
    console_sink->set_pattern("[%l] %v");
    sinks.push_back(console_sink);

    if (!settings.file.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(settings.file.parent_path(), ec);
      if (ec) {
        return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                         "Cannot create log directory: " + ec.message()));
      }

      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          settings.file.string(), settings.max_size_mb * 1024 * 1024, settings.max_files);
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
      sinks.push_back(file_sink);
    }

    spdlog::drop(kLoggerName);
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(toLevel(settings.level));
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    return {};

  } catch (const spdlog::spdlog_ex& e) {
    // Fallback to console-only logging if file setup fails
    spdlog::set_pattern("[%l] %v");
    spdlog::warn("Failed to setup file logging: {}", e.what());
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to setup logging: " + std::string(e.what())));
  }
}

}  // namespace hrec::util
