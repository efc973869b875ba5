#include "hdt/config/config.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>

#include <toml++/toml.hpp>

#include "hdt/util/xdg.hpp"

namespace hdt::config {

namespace {

constexpr std::size_t kMaxNestingDepthLimit = 256;

constexpr std::array<std::string_view, 8> kLogLevels = {
    "trace", "debug", "info", "warn", "warning", "error", "critical", "off"};

bool isLogLevel(const std::string& level) {
  return std::find(kLogLevels.begin(), kLogLevels.end(), level) != kLogLevels.end();
}

}  // namespace

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["output"].value<std::string>()) {
      auto format = stringToOutputFormat(*value);
      if (!format.has_value()) {
        return std::unexpected(format.error());
      }
      output = *format;
    }

    if (auto value = config_data["log_level"].value<std::string>()) {
      log_level = *value;
    }
    if (auto value = config_data["log_file"].value<std::string>()) {
      log_file = *value;
    }

    if (auto value = config_data["max_nesting_depth"].value<std::int64_t>()) {
      if (*value < 0) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "max_nesting_depth must not be negative"));
      }
      max_nesting_depth = static_cast<std::size_t>(*value);
    }

    return validate();

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  try {
    toml::table config_data;
    config_data.insert_or_assign("output", outputFormatToString(output));
    config_data.insert_or_assign("log_level", log_level);
    if (!log_file.empty()) config_data.insert_or_assign("log_file", log_file.string());
    config_data.insert_or_assign("max_nesting_depth", static_cast<std::int64_t>(max_nesting_depth));

    // Ensure parent directory exists
    auto parent = save_path.parent_path();
    if (!parent.empty() && !hdt::util::Xdg::ensureDirectory(parent, std::filesystem::perms::owner_all)) {
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Cannot create config directory: " + parent.string()));
    }

    std::ofstream file(save_path, std::ios::trunc);
    if (!file) {
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Cannot write config file: " + save_path.string()));
    }
    file << config_data << "\n";
    if (!file) {
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Failed writing config file: " + save_path.string()));
    }
    return {};
  } catch (const std::exception& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config save error: " + std::string(e.what())));
  }
}

Result<std::string> Config::get(const std::string& key) const {
  if (key == "output") return outputFormatToString(output);
  if (key == "log_level") return log_level;
  if (key == "log_file") return log_file.string();
  if (key == "max_nesting_depth") return std::to_string(max_nesting_depth);

  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + key));
}

Result<void> Config::set(const std::string& key, const std::string& value) {
  if (key == "output") {
    auto format = stringToOutputFormat(value);
    if (!format.has_value()) {
      return std::unexpected(format.error());
    }
    output = *format;
    return {};
  }

  if (key == "log_level") {
    if (!isLogLevel(value)) {
      return std::unexpected(makeError(ErrorCode::kConfigError, "Invalid log level: " + value));
    }
    log_level = value;
    return {};
  }

  if (key == "log_file") {
    log_file = value;
    return {};
  }

  if (key == "max_nesting_depth") {
    std::size_t parsed = 0;
    std::istringstream iss(value);
    if (!(iss >> parsed) || !iss.eof()) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "max_nesting_depth must be a non-negative integer"));
    }
    if (parsed > kMaxNestingDepthLimit) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "max_nesting_depth must be at most " +
                                           std::to_string(kMaxNestingDepthLimit)));
    }
    max_nesting_depth = parsed;
    return {};
  }

  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + key));
}

Result<void> Config::validate() const {
  if (!isLogLevel(log_level)) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Invalid log level: " + log_level));
  }

  if (max_nesting_depth > kMaxNestingDepthLimit) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "max_nesting_depth must be at most " +
                                         std::to_string(kMaxNestingDepthLimit)));
  }

  return {};
}

ParseOptions Config::parseOptions() const {
  ParseOptions options;
  options.max_nesting_depth = max_nesting_depth;
  return options;
}

std::filesystem::path Config::defaultConfigPath() {
  return hdt::util::Xdg::configFile();
}

const std::vector<std::string>& Config::keys() {
  static const std::vector<std::string> kKeys = {
      "output", "log_level", "log_file", "max_nesting_depth"};
  return kKeys;
}

std::string Config::outputFormatToString(OutputFormat format) {
  switch (format) {
    case OutputFormat::kText: return "text";
    case OutputFormat::kJson: return "json";
  }
  return "text";
}

Result<Config::OutputFormat> Config::stringToOutputFormat(const std::string& str) {
  if (str == "text") return OutputFormat::kText;
  if (str == "json") return OutputFormat::kJson;
  return std::unexpected(makeError(ErrorCode::kConfigError, "Invalid output format: " + str));
}

}  // namespace hdt::config
