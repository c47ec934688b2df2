#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "hrec/common.hpp"

namespace hrec::config {

// Configuration for the hrec application
class Config {
 public:
  // Defaults rooted in the XDG directories
  Config();

  // Core paths
  std::filesystem::path data_dir;      // Per-user record databases
  std::filesystem::path archive_root;  // Managed attachment files

  // Attachment naming and intake
  struct AttachmentsConfig {
    std::int64_t max_name_length = 100;  // Code points in the managed file name
    std::size_t max_file_size_mb = 0;    // 0 = no limit
  };
  AttachmentsConfig attachments;

  // User selected when --user is not given
  std::string default_user;

  // Logging
  struct LoggingConfig {
    std::string level = "info";
    std::filesystem::path file;
    std::size_t max_size_mb = 5;
    std::size_t max_files = 3;
  };
  LoggingConfig logging;

  // Performance tuning
  struct PerformanceConfig {
    std::string sqlite_journal_mode = "WAL";
    std::string sqlite_synchronous = "NORMAL";
  };
  PerformanceConfig performance;

  // Load configuration from file
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Get/set configuration values using dot notation
  Result<std::string> get(const std::string& key) const;
  Result<void> set(const std::string& key, const std::string& value);

  // Every key accepted by get/set
  static std::vector<std::string> keys();

  // Validate configuration
  Result<void> validate() const;

  // File used by load/save when no path is given
  const std::filesystem::path& configPath() const { return config_path_; }
  void setConfigPath(std::filesystem::path path) { config_path_ = std::move(path); }

  // Get default configuration file path
  static std::filesystem::path defaultConfigPath();

  // Shortest managed name that still leaves room for a prefix and a name
  static constexpr std::int64_t kMinNameLength = 8;

 private:
  std::filesystem::path config_path_;

  // Dot notation helpers
  Result<std::string> getValueByPath(const std::vector<std::string>& path) const;
  Result<void> setValueByPath(const std::vector<std::string>& path, const std::string& value);

  std::vector<std::string> splitPath(const std::string& path) const;
};

}  // namespace hrec::config
