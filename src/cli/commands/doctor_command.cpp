#include "hrec/cli/commands/doctor_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

namespace hrec::cli {

DoctorCommand::DoctorCommand(Application& app) : app_(app) {}

std::string DoctorCommand::name() const {
  return "doctor";
}

std::string DoctorCommand::description() const {
  return "Check the attachment archive against the database";
}

void DoctorCommand::setupCommand(CLI::App* cmd) {
  cmd->add_flag("--fix", fix_, "Delete archive files that have no attachment record");
}

Result<int> DoctorCommand::execute(const GlobalOptions& options) {
  auto repo = app_.openRepository();
  if (!repo.has_value()) {
    return std::unexpected(repo.error());
  }

  auto report = (*repo)->findOrphans();
  if (!report.has_value()) {
    return std::unexpected(report.error());
  }

  std::size_t removed = 0;
  if (fix_ && !report->orphaned_files.empty()) {
    auto result = (*repo)->removeOrphanedFiles();
    if (!result.has_value()) {
      return std::unexpected(result.error());
    }
    removed = *result;
  }

  if (options.json) {
    nlohmann::json missing = nlohmann::json::array();
    for (const auto& attachment : report->missing_files) {
      missing.push_back({
        {"id", attachment.id},
        {"visit_record_id", attachment.visit_record_id},
        {"file_path", attachment.file_path}
      });
    }
    nlohmann::json output = {
      {"healthy", report->clean()},
      {"orphaned_files", report->orphaned_files},
      {"missing_files", missing},
      {"removed", removed}
    };
    std::cout << output.dump(2) << std::endl;
  } else {
    if (report->clean()) {
      if (!options.quiet) {
        std::cout << "Archive and database agree." << std::endl;
      }
      return 0;
    }

    if (!report->orphaned_files.empty()) {
      std::cout << "Files without an attachment record:" << std::endl;
      for (const auto& path : report->orphaned_files) {
        std::cout << "  " << path << std::endl;
      }
    }
    if (!report->missing_files.empty()) {
      std::cout << "Attachment records whose file is missing:" << std::endl;
      for (const auto& attachment : report->missing_files) {
        std::cout << "  [" << attachment.id << "] visit " << attachment.visit_record_id
                  << ": " << attachment.file_path << std::endl;
      }
    }
    if (fix_) {
      std::cout << "Removed " << removed << " orphaned file(s)." << std::endl;
    } else if (!report->orphaned_files.empty()) {
      std::cout << "Run 'hrec doctor --fix' to remove orphaned files." << std::endl;
    }
  }

  // Missing files cannot be repaired here
  bool healthy = report->missing_files.empty() &&
                 (report->orphaned_files.empty() || fix_);
  return healthy ? 0 : 1;
}

} // namespace hrec::cli
