#pragma once

#include <filesystem>
#include <string>

namespace hrec::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG data home directory (~/.local/share/hrec)
  static std::filesystem::path dataHome();

  // Get XDG config home directory (~/.config/hrec)
  static std::filesystem::path configHome();

  // Per-user visit databases
  static std::filesystem::path databasesDir();

  // Managed attachment archive root
  static std::filesystem::path archiveDir();

  // Log directory
  static std::filesystem::path logsDir();

  // Get config file path
  static std::filesystem::path configFile();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace hrec::util
