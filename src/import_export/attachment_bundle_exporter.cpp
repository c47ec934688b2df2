#include "hrec/import_export/exporter.hpp"

#include <spdlog/spdlog.h>

#include "hrec/store/filename_sanitizer.hpp"
#include "hrec/util/filesystem.hpp"

namespace hrec::import_export {

Result<ExportSummary> AttachmentBundleExporter::exportBundle(
    hrec::store::RecordRepository& repository,
    hrec::store::AttachmentStore& store,
    const std::vector<hrec::core::VisitRecordId>& visit_ids,
    const std::filesystem::path& output_dir) const {
  std::vector<hrec::core::AttachmentRecord> attachments;
  for (auto visit_id : visit_ids) {
    auto listed = repository.listAttachments(visit_id);
    if (!listed.has_value()) {
      return std::unexpected(listed.error());
    }
    attachments.insert(attachments.end(), listed->begin(), listed->end());
  }

  ExportSummary summary;
  if (attachments.empty()) {
    return summary;
  }

  auto dir_result = hrec::util::FileSystem::createDirectories(output_dir);
  if (!dir_result.has_value()) {
    return std::unexpected(dir_result.error());
  }

  for (const auto& attachment : attachments) {
    auto target = uniqueTarget(output_dir, attachment.displayName());
    auto export_result = store.exportTo(attachment.file_path, target);
    if (!export_result.has_value()) {
      spdlog::warn("Could not export {}: {}", attachment.file_path,
                   export_result.error().message());
      summary.failed.push_back({attachment, export_result.error().message()});
      continue;
    }
    summary.copied.push_back(target);
  }

  spdlog::info("Exported {} attachment(s) to {} ({} failed)", summary.copied.size(),
               output_dir.string(), summary.failed.size());
  return summary;
}

std::filesystem::path AttachmentBundleExporter::uniqueTarget(const std::filesystem::path& dir,
                                                             const std::string& name) {
  auto target = dir / name;
  auto parts = hrec::store::FilenameSanitizer::splitExtension(name);

  std::error_code ec;
  for (int counter = 1; std::filesystem::exists(target, ec); ++counter) {
    target = dir / (parts.base + "_" + std::to_string(counter) + parts.extension);
  }

  return target;
}

}  // namespace hrec::import_export
