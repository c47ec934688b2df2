#include "hrec/config/config.hpp"

#include <charconv>
#include <sstream>

#include <toml++/toml.hpp>

#include "hrec/store/sqlite_record_repository.hpp"
#include "hrec/util/filesystem.hpp"
#include "hrec/util/logging.hpp"
#include "hrec/util/xdg.hpp"

namespace hrec::config {

namespace {

template <typename T>
Result<T> parseNumber(const std::string& key, const std::string& value) {
  T parsed{};
  const char* first = value.data();
  const char* last = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc{} || ptr != last) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid number for " + key + ": " + value));
  }
  return parsed;
}

}  // namespace

Config::Config() {
  data_dir = hrec::util::Xdg::databasesDir();
  archive_root = hrec::util::Xdg::archiveDir();
  logging.file = hrec::util::Xdg::logsDir() / "hrec.log";
  config_path_ = defaultConfigPath();
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    // Core paths
    if (auto value = config_data["data_dir"].value<std::string>()) {
      data_dir = *value;
    }
    if (auto value = config_data["archive_root"].value<std::string>()) {
      archive_root = *value;
    }

    // Attachments
    if (auto attachments_table = config_data["attachments"].as_table()) {
      if (auto value = (*attachments_table)["max_name_length"].value<std::int64_t>()) {
        attachments.max_name_length = *value;
      }
      if (auto value = (*attachments_table)["max_file_size_mb"].value<std::int64_t>()) {
        attachments.max_file_size_mb = static_cast<std::size_t>(*value);
      }
    }

    // Defaults
    if (auto defaults_table = config_data["defaults"].as_table()) {
      if (auto value = (*defaults_table)["user"].value<std::string>()) {
        default_user = *value;
      }
    }

    // Logging
    if (auto logging_table = config_data["logging"].as_table()) {
      if (auto value = (*logging_table)["level"].value<std::string>()) {
        logging.level = *value;
      }
      if (auto value = (*logging_table)["file"].value<std::string>()) {
        logging.file = *value;
      }
      if (auto value = (*logging_table)["max_size_mb"].value<std::int64_t>()) {
        logging.max_size_mb = static_cast<std::size_t>(*value);
      }
      if (auto value = (*logging_table)["max_files"].value<std::int64_t>()) {
        logging.max_files = static_cast<std::size_t>(*value);
      }
    }

    // Performance
    if (auto perf_table = config_data["performance"].as_table()) {
      if (auto value = (*perf_table)["sqlite_journal_mode"].value<std::string>()) {
        performance.sqlite_journal_mode = *value;
      }
      if (auto value = (*perf_table)["sqlite_synchronous"].value<std::string>()) {
        performance.sqlite_synchronous = *value;
      }
    }

    return {};

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

  toml::table config_data;

  // Core paths
  config_data.insert_or_assign("data_dir", data_dir.string());
  config_data.insert_or_assign("archive_root", archive_root.string());

  auto attachments_table = toml::table{};
  attachments_table.insert_or_assign("max_name_length", attachments.max_name_length);
  attachments_table.insert_or_assign("max_file_size_mb",
                                     static_cast<std::int64_t>(attachments.max_file_size_mb));
  config_data.insert_or_assign("attachments", attachments_table);

  auto defaults_table = toml::table{};
  defaults_table.insert_or_assign("user", default_user);
  config_data.insert_or_assign("defaults", defaults_table);

  auto logging_table = toml::table{};
  logging_table.insert_or_assign("level", logging.level);
  logging_table.insert_or_assign("file", logging.file.string());
  logging_table.insert_or_assign("max_size_mb", static_cast<std::int64_t>(logging.max_size_mb));
  logging_table.insert_or_assign("max_files", static_cast<std::int64_t>(logging.max_files));
  config_data.insert_or_assign("logging", logging_table);

  auto perf_table = toml::table{};
  perf_table.insert_or_assign("sqlite_journal_mode", performance.sqlite_journal_mode);
  perf_table.insert_or_assign("sqlite_synchronous", performance.sqlite_synchronous);
  config_data.insert_or_assign("performance", perf_table);

  // Ensure parent directory exists
  auto parent = save_path.parent_path();
  if (!parent.empty()) {
    auto dir_result = hrec::util::FileSystem::createDirectories(parent);
    if (!dir_result.has_value()) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Cannot create config directory: " + dir_result.error().message()));
    }
  }

  // Write to file atomically
  std::stringstream ss;
  ss << config_data;
  auto write_result = hrec::util::FileSystem::writeFileAtomic(save_path, ss.str());
  if (!write_result.has_value()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Cannot write config file: " + write_result.error().message()));
  }

  return {};
}

Result<std::string> Config::get(const std::string& key) const {
  auto path = splitPath(key);
  return getValueByPath(path);
}

Result<void> Config::set(const std::string& key, const std::string& value) {
  auto path = splitPath(key);
  return setValueByPath(path, value);
}

std::vector<std::string> Config::keys() {
  return {
    "data_dir",
    "archive_root",
    "attachments.max_name_length",
    "attachments.max_file_size_mb",
    "defaults.user",
    "logging.level",
    "logging.file",
    "logging.max_size_mb",
    "logging.max_files",
    "performance.sqlite_journal_mode",
    "performance.sqlite_synchronous"
  };
}

Result<void> Config::validate() const {
  if (data_dir.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "data_dir must not be empty"));
  }
  if (archive_root.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "archive_root must not be empty"));
  }

  if (attachments.max_name_length < kMinNameLength) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "attachments.max_name_length must be at least " +
                                     std::to_string(kMinNameLength)));
  }

  if (!hrec::util::isValidLogLevel(logging.level)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid log level: " + logging.level));
  }
  if (logging.max_size_mb == 0 || logging.max_files == 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Log rotation needs a positive size and file count"));
  }

  if (!hrec::store::isValidJournalMode(performance.sqlite_journal_mode)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid sqlite_journal_mode: " + performance.sqlite_journal_mode));
  }
  if (!hrec::store::isValidSynchronousMode(performance.sqlite_synchronous)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid sqlite_synchronous: " + performance.sqlite_synchronous));
  }

  return {};
}

std::filesystem::path Config::defaultConfigPath() {
  return hrec::util::Xdg::configFile();
}

Result<std::string> Config::getValueByPath(const std::vector<std::string>& path) const {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1) {
    const std::string& key = path[0];

    if (key == "data_dir") return data_dir.string();
    if (key == "archive_root") return archive_root.string();
  } else if (path.size() == 2) {
    const std::string& section = path[0];
    const std::string& key = path[1];

    if (section == "attachments") {
      if (key == "max_name_length") return std::to_string(attachments.max_name_length);
      if (key == "max_file_size_mb") return std::to_string(attachments.max_file_size_mb);
    } else if (section == "defaults") {
      if (key == "user") return default_user;
    } else if (section == "logging") {
      if (key == "level") return logging.level;
      if (key == "file") return logging.file.string();
      if (key == "max_size_mb") return std::to_string(logging.max_size_mb);
      if (key == "max_files") return std::to_string(logging.max_files);
    } else if (section == "performance") {
      if (key == "sqlite_journal_mode") return performance.sqlite_journal_mode;
      if (key == "sqlite_synchronous") return performance.sqlite_synchronous;
    }
  }

  std::string joined = path[0];
  for (std::size_t i = 1; i < path.size(); ++i) {
    joined += "." + path[i];
  }
  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + joined));
}

Result<void> Config::setValueByPath(const std::vector<std::string>& path, const std::string& value) {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1) {
    const std::string& key = path[0];

    if (key == "data_dir") { data_dir = value; return {}; }
    if (key == "archive_root") { archive_root = value; return {}; }
  } else if (path.size() == 2) {
    const std::string& section = path[0];
    const std::string& key = path[1];

    if (section == "attachments") {
      if (key == "max_name_length") {
        auto parsed = parseNumber<std::int64_t>(key, value);
        if (!parsed.has_value()) return std::unexpected(parsed.error());
        attachments.max_name_length = *parsed;
        return {};
      }
      if (key == "max_file_size_mb") {
        auto parsed = parseNumber<std::size_t>(key, value);
        if (!parsed.has_value()) return std::unexpected(parsed.error());
        attachments.max_file_size_mb = *parsed;
        return {};
      }
    } else if (section == "defaults") {
      if (key == "user") { default_user = value; return {}; }
    } else if (section == "logging") {
      if (key == "level") { logging.level = value; return {}; }
      if (key == "file") { logging.file = value; return {}; }
      if (key == "max_size_mb" || key == "max_files") {
        auto parsed = parseNumber<std::size_t>(key, value);
        if (!parsed.has_value()) return std::unexpected(parsed.error());
        (key == "max_size_mb" ? logging.max_size_mb : logging.max_files) = *parsed;
        return {};
      }
    } else if (section == "performance") {
      if (key == "sqlite_journal_mode") { performance.sqlite_journal_mode = value; return {}; }
      if (key == "sqlite_synchronous") { performance.sqlite_synchronous = value; return {}; }
    }
  }

  std::string joined = path[0];
  for (std::size_t i = 1; i < path.size(); ++i) {
    joined += "." + path[i];
  }
  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + joined));
}

std::vector<std::string> Config::splitPath(const std::string& path) const {
  std::vector<std::string> parts;
  std::istringstream stream(path);
  std::string part;

  while (std::getline(stream, part, '.')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }

  return parts;
}

}  // namespace hrec::config
