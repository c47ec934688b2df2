#include "hrec/cli/commands/user_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

namespace hrec::cli {

UserCommand::UserCommand(Application& app) : app_(app) {}

Result<int> UserCommand::execute(const GlobalOptions& options) {
  switch (sub_command_) {
    case SubCommand::List:
      return executeList(options);
    case SubCommand::Create:
      return executeCreate(options);
    case SubCommand::Delete:
      return executeDelete(options);
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid subcommand"));
}

std::string UserCommand::name() const {
  return "user";
}

std::string UserCommand::description() const {
  return "Manage users";
}

void UserCommand::setupCommand(CLI::App* cmd) {
  auto list_cmd = cmd->add_subcommand("list", "List all users");
  list_cmd->callback([this]() { sub_command_ = SubCommand::List; });

  auto create_cmd = cmd->add_subcommand("create", "Create a new user");
  create_cmd->add_option("name", user_name_, "User name")->required();
  create_cmd->callback([this]() { sub_command_ = SubCommand::Create; });

  auto delete_cmd = cmd->add_subcommand("delete", "Delete a user and their records");
  delete_cmd->add_option("name", user_name_, "User name")->required();
  delete_cmd->add_flag("--keep-archive", keep_archive_, "Keep the user's attachment files");
  delete_cmd->callback([this]() { sub_command_ = SubCommand::Delete; });

  cmd->require_subcommand(1, 1);
}

Result<int> UserCommand::executeList(const GlobalOptions& options) {
  auto users = app_.userDirectory().listUsers();
  if (!users.has_value()) {
    return std::unexpected(users.error());
  }

  if (options.json) {
    nlohmann::json output = {{"users", *users}};
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  if (users->empty()) {
    if (!options.quiet) {
      std::cout << "No users found." << std::endl;
    }
    return 0;
  }

  for (const auto& user : *users) {
    std::cout << user << std::endl;
  }
  return 0;
}

Result<int> UserCommand::executeCreate(const GlobalOptions& options) {
  auto result = app_.userDirectory().createUser(user_name_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (options.json) {
    nlohmann::json output = {
      {"success", true},
      {"user", user_name_}
    };
    std::cout << output.dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Created user: " << user_name_ << std::endl;
  }
  return 0;
}

Result<int> UserCommand::executeDelete(const GlobalOptions& options) {
  auto result = app_.userDirectory().deleteUser(user_name_, !keep_archive_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (options.json) {
    nlohmann::json output = {
      {"success", true},
      {"user", user_name_},
      {"archive_removed", !keep_archive_}
    };
    std::cout << output.dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Deleted user: " << user_name_;
    if (keep_archive_) {
      std::cout << " (attachments kept)";
    }
    std::cout << std::endl;
  }
  return 0;
}

} // namespace hrec::cli
