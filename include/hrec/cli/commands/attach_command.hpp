#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hrec/cli/application.hpp"
#include "hrec/common.hpp"
#include "hrec/core/visit_record.hpp"

namespace hrec::cli {

/**
 * @brief Attachment command
 *
 * Supports subcommands:
 * - add: Copy files into the archive and attach them to a visit
 * - list: List the attachments of a visit
 * - remove: Delete an attachment and its managed file
 * - replace: Swap the file behind an attachment
 * - export: Copy a managed file out of the archive
 */
class AttachCommand : public Command {
public:
  explicit AttachCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override;
  std::string description() const override;
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  enum class SubCommand {
    Add,
    List,
    Remove,
    Replace,
    Export
  };

  SubCommand sub_command_ = SubCommand::List;

  core::VisitRecordId visit_id_ = 0;
  core::AttachmentId attachment_id_ = 0;
  std::vector<std::string> files_;
  std::string file_;
  std::string destination_;

  Result<int> executeAdd(const GlobalOptions& options);
  Result<int> executeList(const GlobalOptions& options);
  Result<int> executeRemove(const GlobalOptions& options);
  Result<int> executeReplace(const GlobalOptions& options);
  Result<int> executeExport(const GlobalOptions& options);
};

nlohmann::json attachmentToJson(const core::AttachmentRecord& attachment);

} // namespace hrec::cli
