#pragma once

#include <filesystem>
#include <string>

#include <spdlog/common.h>

#include "hdt/common.hpp"

namespace hdt::util {

/**
 * @brief Logger setup for the hdt tool
 *
 * Installs a default spdlog logger named "hdt" that writes to stderr and,
 * when a log file is configured, to a rotating file as well. Library code
 * logs through the spdlog free functions and never configures sinks itself.
 */
class Logging {
 public:
  /**
   * @brief Install the default logger
   * @param level One of trace, debug, info, warn, error, critical, off
   * @param log_file Optional rotating log file (empty: stderr only)
   * @return Error when the level is unknown or the file cannot be opened
   */
  static Result<void> initialize(const std::string& level,
                                 const std::filesystem::path& log_file = {});

  /**
   * @brief Convert a level name to the spdlog level
   */
  static Result<spdlog::level::level_enum> parseLevel(const std::string& level);

  static constexpr const char* kLoggerName = "hdt";
  static constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";
};

}  // namespace hdt::util
