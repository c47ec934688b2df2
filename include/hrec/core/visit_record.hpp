#pragma once

#include <cstdint>
#include <string>

#include "hrec/common.hpp"

namespace hrec::core {

using VisitRecordId = std::int64_t;
using AttachmentId = std::int64_t;

// One clinic visit. Text fields are optional and stored trimmed.
struct VisitRecord {
  VisitRecordId id = 0;         // Assigned by the repository
  std::string date;             // YYYY-MM-DD, required
  std::string hospital;
  std::string department;
  std::string doctor;
  std::string organ_system;
  std::string reason;
  std::string diagnosis;
  std::string medication;
  std::string remark;
  std::string created_at;       // System-assigned, "YYYY-MM-DD HH:MM:SS" UTC
  std::string updated_at;

  // Trim surrounding whitespace from all free-text fields
  void normalize();

  // Check required fields and the date
  Result<void> validate() const;
};

// A managed file owned by a visit record
struct AttachmentRecord {
  AttachmentId id = 0;
  VisitRecordId visit_record_id = 0;
  std::string file_path;        // Relative to the archive root: {user}/{v}_{a}_{name}

  // Final path segment
  std::string fileName() const;

  // File name with the "{v}_{a}_" prefix removed
  std::string displayName() const;
};

// Trim ASCII whitespace from both ends
std::string trim(const std::string& text);

}  // namespace hrec::core
