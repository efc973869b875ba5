#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "hdt/common.hpp"
#include "hdt/human_time.hpp"

namespace hdt::config {

// Configuration for the hdt command line tool
class Config {
 public:
  // Defaults only; call load() to read a file
  Config() = default;

  // Output format used when --json is not given
  enum class OutputFormat {
    kText,
    kJson
  };
  OutputFormat output = OutputFormat::kText;

  // Logging
  std::string log_level = "warn";   // trace, debug, info, warn(ing), error, critical, off
  std::filesystem::path log_file;   // empty: stderr only

  // Parser limits
  std::size_t max_nesting_depth = 16;

  // Load configuration from file
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file (default: the path it was loaded from)
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Get/set a value by key ("output", "log_level", ...)
  Result<std::string> get(const std::string& key) const;
  Result<void> set(const std::string& key, const std::string& value);

  // Validate configuration values
  Result<void> validate() const;

  // Parser options derived from this configuration
  ParseOptions parseOptions() const;

  const std::filesystem::path& configPath() const noexcept { return config_path_; }

  // Default config file location (~/.config/hdt/config.toml)
  static std::filesystem::path defaultConfigPath();

  // Known keys, in file order
  static const std::vector<std::string>& keys();

  static std::string outputFormatToString(OutputFormat format);
  static Result<OutputFormat> stringToOutputFormat(const std::string& str);

 private:
  std::filesystem::path config_path_;
};

}  // namespace hdt::config
