#include "hrec/cli/commands/attach_command.hpp"

#include <iomanip>
#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace hrec::cli {

nlohmann::json attachmentToJson(const core::AttachmentRecord& attachment) {
  return {
    {"id", attachment.id},
    {"visit_record_id", attachment.visit_record_id},
    {"name", attachment.displayName()},
    {"path", attachment.file_path}
  };
}

AttachCommand::AttachCommand(Application& app) : app_(app) {}

Result<int> AttachCommand::execute(const GlobalOptions& options) {
  switch (sub_command_) {
    case SubCommand::Add:
      return executeAdd(options);
    case SubCommand::List:
      return executeList(options);
    case SubCommand::Remove:
      return executeRemove(options);
    case SubCommand::Replace:
      return executeReplace(options);
    case SubCommand::Export:
      return executeExport(options);
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid subcommand"));
}

std::string AttachCommand::name() const {
  return "attach";
}

std::string AttachCommand::description() const {
  return "Manage visit attachments";
}

void AttachCommand::setupCommand(CLI::App* cmd) {
  auto add_cmd = cmd->add_subcommand("add", "Attach files to a visit");
  add_cmd->add_option("visit_id", visit_id_, "Visit record ID")->required();
  add_cmd->add_option("files", files_, "Files to attach")->required();
  add_cmd->callback([this]() { sub_command_ = SubCommand::Add; });

  auto list_cmd = cmd->add_subcommand("list", "List attachments of a visit");
  list_cmd->add_option("visit_id", visit_id_, "Visit record ID")->required();
  list_cmd->callback([this]() { sub_command_ = SubCommand::List; });

  auto remove_cmd = cmd->add_subcommand("remove", "Delete an attachment");
  remove_cmd->add_option("id", attachment_id_, "Attachment ID")->required();
  remove_cmd->callback([this]() { sub_command_ = SubCommand::Remove; });

  auto replace_cmd = cmd->add_subcommand("replace", "Replace the file of an attachment");
  replace_cmd->add_option("id", attachment_id_, "Attachment ID")->required();
  replace_cmd->add_option("file", file_, "New file")->required();
  replace_cmd->callback([this]() { sub_command_ = SubCommand::Replace; });

  auto export_cmd = cmd->add_subcommand("export", "Copy an attachment out of the archive");
  export_cmd->add_option("id", attachment_id_, "Attachment ID")->required();
  export_cmd->add_option("destination", destination_, "Target file or directory")->required();
  export_cmd->callback([this]() { sub_command_ = SubCommand::Export; });

  cmd->require_subcommand(1, 1);
}

Result<int> AttachCommand::executeAdd(const GlobalOptions& options) {
  auto repo = app_.openRepository();
  if (!repo.has_value()) {
    return std::unexpected(repo.error());
  }

  nlohmann::json created = nlohmann::json::array();
  for (const auto& file : files_) {
    auto attachment = (*repo)->createAttachment(visit_id_, file);
    if (!attachment.has_value()) {
      if (!created.empty()) {
        spdlog::warn("Stopped after {} of {} attachments for visit {}",
                     created.size(), files_.size(), visit_id_);
      }
      return std::unexpected(attachment.error());
    }

    if (options.json) {
      created.push_back(attachmentToJson(*attachment));
    } else if (!options.quiet) {
      std::cout << "Attached [" << attachment->id << "] " << attachment->displayName() << std::endl;
    }
  }

  if (options.json) {
    std::cout << created.dump(2) << std::endl;
  }
  return 0;
}

Result<int> AttachCommand::executeList(const GlobalOptions& options) {
  auto repo = app_.openRepository();
  if (!repo.has_value()) {
    return std::unexpected(repo.error());
  }

  auto visit = (*repo)->getVisit(visit_id_);
  if (!visit.has_value()) {
    return std::unexpected(visit.error());
  }

  auto attachments = (*repo)->listAttachments(visit_id_);
  if (!attachments.has_value()) {
    return std::unexpected(attachments.error());
  }

  if (options.json) {
    nlohmann::json output = nlohmann::json::array();
    for (const auto& attachment : *attachments) {
      output.push_back(attachmentToJson(attachment));
    }
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  if (attachments->empty()) {
    if (!options.quiet) {
      std::cout << "No attachments for visit " << visit_id_ << "." << std::endl;
    }
    return 0;
  }

  for (const auto& attachment : *attachments) {
    std::cout << std::left << std::setw(6) << attachment.id
              << attachment.displayName() << std::endl;
  }
  return 0;
}

Result<int> AttachCommand::executeRemove(const GlobalOptions& options) {
  auto repo = app_.openRepository();
  if (!repo.has_value()) {
    return std::unexpected(repo.error());
  }

  auto result = (*repo)->deleteAttachment(attachment_id_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (options.json) {
    nlohmann::json output = {
      {"success", true},
      {"id", attachment_id_}
    };
    std::cout << output.dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Removed attachment " << attachment_id_ << std::endl;
  }
  return 0;
}

Result<int> AttachCommand::executeReplace(const GlobalOptions& options) {
  auto repo = app_.openRepository();
  if (!repo.has_value()) {
    return std::unexpected(repo.error());
  }

  auto attachment = (*repo)->replaceAttachment(attachment_id_, file_);
  if (!attachment.has_value()) {
    return std::unexpected(attachment.error());
  }

  if (options.json) {
    std::cout << attachmentToJson(*attachment).dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Replaced attachment [" << attachment->id << "] with "
              << attachment->displayName() << std::endl;
  }
  return 0;
}

Result<int> AttachCommand::executeExport(const GlobalOptions& options) {
  auto repo = app_.openRepository();
  if (!repo.has_value()) {
    return std::unexpected(repo.error());
  }

  auto attachment = (*repo)->getAttachment(attachment_id_);
  if (!attachment.has_value()) {
    return std::unexpected(attachment.error());
  }

  auto result = app_.attachmentStore().exportTo(attachment->file_path, destination_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (options.json) {
    nlohmann::json output = {
      {"success", true},
      {"id", attachment_id_},
      {"destination", destination_}
    };
    std::cout << output.dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Exported " << attachment->displayName() << " to " << destination_ << std::endl;
  }
  return 0;
}

} // namespace hrec::cli
