#include "hrec/cli/commands/config_command.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>

#include <nlohmann/json.hpp>

namespace hrec::cli {

ConfigCommand::ConfigCommand(Application& app) : app_(app) {}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  auto get_cmd = cmd->add_subcommand("get", "Get configuration value");
  get_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  get_cmd->callback([this]() { get_mode_ = true; });

  auto set_cmd = cmd->add_subcommand("set", "Set configuration value");
  set_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  set_cmd->add_option("value", value_, "Configuration value")->required();
  set_cmd->callback([this]() { set_mode_ = true; });

  auto list_cmd = cmd->add_subcommand("list", "List all configuration settings");
  list_cmd->callback([this]() { list_mode_ = true; });

  auto path_cmd = cmd->add_subcommand("path", "Show configuration file path");
  path_cmd->callback([this]() { path_mode_ = true; });

  auto validate_cmd = cmd->add_subcommand("validate", "Validate current configuration");
  validate_cmd->callback([this]() { validate_mode_ = true; });

  cmd->require_subcommand(1, 1);
}

Result<int> ConfigCommand::execute(const GlobalOptions& options) {
  if (get_mode_) {
    return executeGet(options);
  } else if (set_mode_) {
    return executeSet(options);
  } else if (list_mode_) {
    return executeList(options);
  } else if (path_mode_) {
    return executePath(options);
  } else if (validate_mode_) {
    return executeValidate(options);
  }

  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

Result<int> ConfigCommand::executeGet(const GlobalOptions& options) {
  auto value = app_.config().get(key_);
  if (!value.has_value()) {
    return std::unexpected(value.error());
  }

  if (options.json) {
    nlohmann::json output = {
      {"key", key_},
      {"value", *value}
    };
    std::cout << output.dump(2) << std::endl;
  } else {
    std::cout << *value << std::endl;
  }
  return 0;
}

Result<int> ConfigCommand::executeSet(const GlobalOptions& options) {
  auto& config = app_.config();

  auto set_result = config.set(key_, value_);
  if (!set_result.has_value()) {
    return std::unexpected(set_result.error());
  }

  // Reject values that the next load would fail on
  auto validate_result = config.validate();
  if (!validate_result.has_value()) {
    return std::unexpected(validate_result.error());
  }

  auto save_result = config.save();
  if (!save_result.has_value()) {
    return std::unexpected(makeError(save_result.error().code(),
                                     "Failed to save configuration: " + save_result.error().message()));
  }

  if (options.json) {
    nlohmann::json output = {
      {"success", true},
      {"key", key_},
      {"value", value_}
    };
    std::cout << output.dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Configuration updated: " << key_ << " = " << value_ << std::endl;
  }
  return 0;
}

Result<int> ConfigCommand::executeList(const GlobalOptions& options) {
  const auto& config = app_.config();

  nlohmann::json output = nlohmann::json::object();
  std::size_t width = 0;
  for (const auto& key : config::Config::keys()) {
    auto value = config.get(key);
    if (!value.has_value()) {
      return std::unexpected(value.error());
    }
    output[key] = *value;
    width = std::max(width, key.size());
  }

  if (options.json) {
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  for (const auto& key : config::Config::keys()) {
    std::cout << std::left << std::setw(static_cast<int>(width + 2)) << key
              << output[key].get<std::string>() << std::endl;
  }
  return 0;
}

Result<int> ConfigCommand::executePath(const GlobalOptions& options) {
  auto config_path = app_.config().configPath();
  if (config_path.empty()) {
    config_path = config::Config::defaultConfigPath();
  }

  if (options.json) {
    nlohmann::json output = {
      {"config_path", config_path.string()},
      {"exists", std::filesystem::exists(config_path)}
    };
    std::cout << output.dump(2) << std::endl;
  } else {
    std::cout << config_path.string() << std::endl;
  }
  return 0;
}

Result<int> ConfigCommand::executeValidate(const GlobalOptions& options) {
  auto result = app_.config().validate();
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (options.json) {
    nlohmann::json output = {{"valid", true}};
    std::cout << output.dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Configuration is valid." << std::endl;
  }
  return 0;
}

} // namespace hrec::cli
