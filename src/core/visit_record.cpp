#include "hrec/core/visit_record.hpp"

#include "hrec/util/time.hpp"

namespace hrec::core {

std::string trim(const std::string& text) {
  constexpr const char* kWhitespace = " \t\r\n\f\v";
  auto begin = text.find_first_not_of(kWhitespace);
  if (begin == std::string::npos) {
    return {};
  }
  auto end = text.find_last_not_of(kWhitespace);
  return text.substr(begin, end - begin + 1);
}

void VisitRecord::normalize() {
  date = trim(date);
  for (auto* field : {&hospital, &department, &doctor, &organ_system,
                      &reason, &diagnosis, &medication, &remark}) {
    *field = trim(*field);
  }
}

Result<void> VisitRecord::validate() const {
  if (date.empty()) {
    return std::unexpected(makeError(ErrorCode::kValidationError, "Visit date is required"));
  }

  auto parsed = hrec::util::Time::parseDate(date);
  if (!parsed.has_value()) {
    return std::unexpected(makeError(ErrorCode::kValidationError, parsed.error().message()));
  }

  return {};
}

std::string AttachmentRecord::fileName() const {
  auto slash = file_path.find_last_of('/');
  return slash == std::string::npos ? file_path : file_path.substr(slash + 1);
}

std::string AttachmentRecord::displayName() const {
  std::string name = fileName();

  // Skip "{visit}_" and "{attachment}_"
  std::size_t pos = 0;
  for (int part = 0; part < 2; ++part) {
    auto underscore = name.find('_', pos);
    if (underscore == std::string::npos) {
      return name;
    }
    pos = underscore + 1;
  }
  return name.substr(pos);
}

}  // namespace hrec::core
