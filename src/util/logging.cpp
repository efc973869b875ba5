#include "hdt/util/logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace hdt::util {

Result<void> Logging::initialize(const std::string& level, const std::filesystem::path& log_file) {
  auto parsed_level = parseLevel(level);
  if (!parsed_level.has_value()) {
    return std::unexpected(parsed_level.error());
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  if (!log_file.empty()) {
    try {
      auto parent = log_file.parent_path();
      if (!parent.empty()) {
        std::filesystem::create_directories(parent);
      }
      // 5MB files, 3 backups
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file.string(), 1024 * 1024 * 5, 3));
    } catch (const std::exception& e) {
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Failed to setup file logging: " + std::string(e.what())));
    }
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(kPattern);
  logger->set_level(*parsed_level);

  spdlog::set_default_logger(logger);
  return {};
}

Result<spdlog::level::level_enum> Logging::parseLevel(const std::string& level) {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn" || level == "warning") return spdlog::level::warn;
  if (level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;

  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Unknown log level: " + level));
}

}  // namespace hdt::util
