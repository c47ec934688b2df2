#include "hrec/util/xdg.hpp"

#include <cstdlib>

namespace hrec::util {

std::filesystem::path Xdg::dataHome() {
  std::string xdg_data_home = getEnvVar("XDG_DATA_HOME", "");
  if (!xdg_data_home.empty()) {
    return std::filesystem::path(xdg_data_home) / "hrec";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".hrec_data";
  }

  return std::filesystem::path(home) / ".local" / "share" / "hrec";
}

std::filesystem::path Xdg::configHome() {
  std::string xdg_config_home = getEnvVar("XDG_CONFIG_HOME", "");
  if (!xdg_config_home.empty()) {
    return std::filesystem::path(xdg_config_home) / "hrec";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".hrec_config";
  }

  return std::filesystem::path(home) / ".config" / "hrec";
}

std::filesystem::path Xdg::databasesDir() {
  return dataHome() / "data";
}

std::filesystem::path Xdg::archiveDir() {
  return dataHome() / "attachments";
}

std::filesystem::path Xdg::logsDir() {
  return dataHome() / "logs";
}

std::filesystem::path Xdg::configFile() {
  return configHome() / "config.toml";
}

std::string Xdg::getEnvVar(const std::string& name, const std::string& default_value) {
  const char* value = std::getenv(name.c_str());
  return value ? std::string(value) : default_value;
}

}  // namespace hrec::util
