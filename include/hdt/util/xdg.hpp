#pragma once

#include <filesystem>
#include <string>

namespace hdt::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG config home directory (~/.config/hdt)
  static std::filesystem::path configHome();

  // Get config file path
  static std::filesystem::path configFile();

  // Ensure directory exists with proper permissions
  static bool ensureDirectory(const std::filesystem::path& path, std::filesystem::perms perms);

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace hdt::util
