#include "hdt/util/xdg.hpp"

#include <cstdlib>

namespace hdt::util {

std::filesystem::path Xdg::configHome() {
  std::string xdg_config_home = getEnvVar("XDG_CONFIG_HOME", "");
  if (!xdg_config_home.empty()) {
    return std::filesystem::path(xdg_config_home) / "hdt";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".hdt_config";
  }

  return std::filesystem::path(home) / ".config" / "hdt";
}

std::filesystem::path Xdg::configFile() {
  return configHome() / "config.toml";
}

bool Xdg::ensureDirectory(const std::filesystem::path& path, std::filesystem::perms perms) {
  std::error_code ec;

  if (std::filesystem::exists(path, ec)) {
    return !ec;
  }

  if (!std::filesystem::create_directories(path, ec)) {
    return false;
  }

  std::filesystem::permissions(path, perms, ec);
  return !ec;
}

std::string Xdg::getEnvVar(const std::string& name, const std::string& default_value) {
  const char* value = std::getenv(name.c_str());
  return value ? std::string(value) : default_value;
}

}  // namespace hdt::util
