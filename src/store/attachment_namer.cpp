#include "hrec/store/attachment_namer.hpp"

#include <charconv>

#include "hrec/store/filename_sanitizer.hpp"

namespace hrec::store {

namespace {

// Parse a positive decimal id terminated by '_' starting at `pos`
bool parseId(const std::string& text, std::size_t& pos, std::int64_t& out) {
  auto underscore = text.find('_', pos);
  if (underscore == std::string::npos || underscore == pos) {
    return false;
  }

  const char* first = text.data() + pos;
  const char* last = text.data() + underscore;
  auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec != std::errc{} || ptr != last || out <= 0) {
    return false;
  }

  pos = underscore + 1;
  return true;
}

}  // namespace

AttachmentNamer::AttachmentNamer() : AttachmentNamer(Config{}) {
}

AttachmentNamer::AttachmentNamer(Config config) : config_(config) {
}

std::string AttachmentNamer::prefix(hrec::core::VisitRecordId visit_record_id,
                                    hrec::core::AttachmentId attachment_id) {
  return std::to_string(visit_record_id) + "_" + std::to_string(attachment_id) + "_";
}

Result<std::string> AttachmentNamer::canonicalName(hrec::core::VisitRecordId visit_record_id,
                                                   hrec::core::AttachmentId attachment_id,
                                                   const std::string& original_name) const {
  if (visit_record_id <= 0 || attachment_id <= 0) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Record ids must be positive"));
  }

  auto sanitized = FilenameSanitizer::sanitize(original_name);
  if (!sanitized.has_value()) {
    return std::unexpected(sanitized.error());
  }

  auto head = prefix(visit_record_id, attachment_id);
  // The prefix is ASCII, so bytes and code points agree
  auto budget = config_.max_total_length - static_cast<std::int64_t>(head.size());

  auto fitted = FilenameSanitizer::truncate(*sanitized, budget);
  if (!fitted.has_value()) {
    return std::unexpected(fitted.error());
  }

  return head + *fitted;
}

Result<std::string> AttachmentNamer::relativePath(const std::string& user,
                                                  hrec::core::VisitRecordId visit_record_id,
                                                  hrec::core::AttachmentId attachment_id,
                                                  const std::string& original_name) const {
  auto user_check = validateUserName(user);
  if (!user_check.has_value()) {
    return std::unexpected(user_check.error());
  }

  auto name = canonicalName(visit_record_id, attachment_id, original_name);
  if (!name.has_value()) {
    return std::unexpected(name.error());
  }

  return user + "/" + *name;
}

Result<ManagedName> AttachmentNamer::parse(const std::string& relative_path) {
  auto slash = relative_path.find('/');
  if (slash == std::string::npos || relative_path.find('/', slash + 1) != std::string::npos) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Not a managed attachment path: " + relative_path));
  }

  ManagedName parsed;
  parsed.user = relative_path.substr(0, slash);
  if (!validateUserName(parsed.user).has_value()) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid user segment in: " + relative_path));
  }

  std::string file_name = relative_path.substr(slash + 1);
  std::size_t pos = 0;
  if (!parseId(file_name, pos, parsed.visit_record_id) ||
      !parseId(file_name, pos, parsed.attachment_id) ||
      pos >= file_name.size()) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Not a managed attachment name: " + file_name));
  }

  parsed.name = file_name.substr(pos);
  return parsed;
}

Result<void> AttachmentNamer::validateUserName(const std::string& user) {
  if (user.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "User name is empty"));
  }
  if (user.front() == '.') {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "User name cannot start with '.': " + user));
  }

  auto sanitized = FilenameSanitizer::sanitize(user);
  if (!sanitized.has_value() || *sanitized != user) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "User name contains reserved characters: " + user));
  }

  return {};
}

}  // namespace hrec::store
