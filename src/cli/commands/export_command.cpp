#include "hrec/cli/commands/export_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "hrec/import_export/exporter.hpp"

namespace hrec::cli {

ExportCommand::ExportCommand(Application& app) : app_(app) {}

std::string ExportCommand::name() const {
  return "export";
}

std::string ExportCommand::description() const {
  return "Export visit records to JSON";
}

void ExportCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("--visit", visit_ids_, "Visit record IDs to export (default: all)");
  cmd->add_option("-o,--output", output_path_, "Output JSON file or directory")->required();
  cmd->add_option("--attachments-dir", attachments_dir_,
                  "Also copy the attachments of the exported visits here");
}

Result<int> ExportCommand::execute(const GlobalOptions& options) {
  auto repo_result = app_.openRepository();
  if (!repo_result.has_value()) {
    return std::unexpected(repo_result.error());
  }
  auto& repo = **repo_result;

  std::vector<core::VisitRecord> visits;
  if (visit_ids_.empty()) {
    auto all = repo.listVisits({});
    if (!all.has_value()) {
      return std::unexpected(all.error());
    }
    visits = std::move(*all);
  } else {
    for (auto id : visit_ids_) {
      auto visit = repo.getVisit(id);
      if (!visit.has_value()) {
        return std::unexpected(visit.error());
      }
      visits.push_back(std::move(*visit));
    }
  }

  import_export::AttachmentsByVisit attachments;
  std::vector<core::VisitRecordId> ids;
  for (const auto& visit : visits) {
    auto list = repo.listAttachments(visit.id);
    if (!list.has_value()) {
      return std::unexpected(list.error());
    }
    attachments[visit.id] = std::move(*list);
    ids.push_back(visit.id);
  }

  import_export::RecordExporter exporter;
  auto written = exporter.exportJson(repo.user(), visits, attachments, output_path_);
  if (!written.has_value()) {
    return std::unexpected(written.error());
  }

  import_export::ExportSummary summary;
  if (!attachments_dir_.empty()) {
    import_export::AttachmentBundleExporter bundle_exporter;
    auto bundle = bundle_exporter.exportBundle(repo, app_.attachmentStore(), ids, attachments_dir_);
    if (!bundle.has_value()) {
      return std::unexpected(bundle.error());
    }
    summary = std::move(*bundle);
  }

  for (const auto& failure : summary.failed) {
    spdlog::warn("Attachment {} not exported: {}", failure.attachment.id, failure.message);
  }

  if (options.json) {
    nlohmann::json failed = nlohmann::json::array();
    for (const auto& failure : summary.failed) {
      failed.push_back({
        {"id", failure.attachment.id},
        {"file_path", failure.attachment.file_path},
        {"error", failure.message}
      });
    }
    nlohmann::json output = {
      {"success", summary.failed.empty()},
      {"output", written->string()},
      {"visits", visits.size()},
      {"attachments_copied", summary.copied.size()},
      {"attachments_failed", failed}
    };
    std::cout << output.dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Exported " << visits.size() << " visit(s) to " << written->string() << std::endl;
    if (!attachments_dir_.empty()) {
      std::cout << "Copied " << summary.copied.size() << " attachment(s) to "
                << attachments_dir_ << std::endl;
    }
    for (const auto& failure : summary.failed) {
      std::cerr << "Failed to export " << failure.attachment.displayName() << ": "
                << failure.message << std::endl;
    }
  }

  return summary.failed.empty() ? 0 : 1;
}

} // namespace hrec::cli
