#pragma once

#include "hrec/cli/application.hpp"
#include "hrec/common.hpp"

namespace hrec::cli {

/**
 * @brief User management command
 *
 * Supports subcommands:
 * - list: List all users
 * - create: Create a user and their record database
 * - delete: Delete a user's database and, unless --keep-archive, their attachments
 */
class UserCommand : public Command {
public:
  explicit UserCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override;
  std::string description() const override;
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  enum class SubCommand {
    List,
    Create,
    Delete
  };

  SubCommand sub_command_ = SubCommand::List;

  std::string user_name_;
  bool keep_archive_ = false;

  Result<int> executeList(const GlobalOptions& options);
  Result<int> executeCreate(const GlobalOptions& options);
  Result<int> executeDelete(const GlobalOptions& options);
};

} // namespace hrec::cli
