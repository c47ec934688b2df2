#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "hrec/common.hpp"

namespace hrec::util {

struct LogSettings {
  std::filesystem::path file;     // Empty disables the file sink
  std::string level = "info";     // trace, debug, info, warn, error, critical, off
  std::size_t max_size_mb = 5;
  std::size_t max_files = 3;
  bool verbose_console = false;   // Mirror everything to stderr, not only warnings
};

// Check that a level name is one spdlog understands
bool isValidLogLevel(const std::string& level);

// Install the default hrec logger. Safe to call more than once; later calls
// reconfigure the sinks.
Result<void> initializeLogging(const LogSettings& settings);

}  // namespace hrec::util
