#pragma once

#include <cstdint>
#include <string>

#include "hrec/common.hpp"
#include "hrec/core/visit_record.hpp"

namespace hrec::store {

// Components of a managed relative path "{user}/{v}_{a}_{name}"
struct ManagedName {
  std::string user;
  hrec::core::VisitRecordId visit_record_id = 0;
  hrec::core::AttachmentId attachment_id = 0;
  std::string name;
};

/**
 * @brief Computes the canonical archive name of an attachment.
 *
 * The final segment is "{visit_record_id}_{attachment_id}_{name}" where
 * `name` is the sanitized original name, truncated from the end of its base
 * so that the whole segment stays within `max_total_length` code points.
 */
class AttachmentNamer {
 public:
  struct Config {
    std::int64_t max_total_length = 100;
  };

  AttachmentNamer();
  explicit AttachmentNamer(Config config);

  // "{v}_{a}_"
  static std::string prefix(hrec::core::VisitRecordId visit_record_id,
                            hrec::core::AttachmentId attachment_id);

  Result<std::string> canonicalName(hrec::core::VisitRecordId visit_record_id,
                                    hrec::core::AttachmentId attachment_id,
                                    const std::string& original_name) const;

  // "{user}/{canonicalName}", relative to the archive root
  Result<std::string> relativePath(const std::string& user,
                                   hrec::core::VisitRecordId visit_record_id,
                                   hrec::core::AttachmentId attachment_id,
                                   const std::string& original_name) const;

  // Inverse of relativePath for canonical paths
  static Result<ManagedName> parse(const std::string& relative_path);

  // A user name must be usable as a single directory segment
  static Result<void> validateUserName(const std::string& user);

  const Config& config() const { return config_; }

 private:
  Config config_;
};

}  // namespace hrec::store
