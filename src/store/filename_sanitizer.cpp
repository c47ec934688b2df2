#include "hrec/store/filename_sanitizer.hpp"

#include <limits>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace hrec::store {

namespace {

bool isReservedAscii(UChar32 c) {
  switch (c) {
    case '/': case '\\': case ':': case '*': case '?':
    case '"': case '<': case '>': case '|':
      return true;
    default:
      return false;
  }
}

const uint8_t* bytes(const std::string& text) {
  return reinterpret_cast<const uint8_t*>(text.data());
}

}  // namespace

NameParts FilenameSanitizer::splitExtension(const std::string& name) {
  auto dot_pos = name.find_last_of('.');
  if (dot_pos == std::string::npos) {
    return {name, ""};
  }

  // Leading dots do not start an extension
  auto first_non_dot = name.find_first_not_of('.');
  if (first_non_dot == std::string::npos || first_non_dot > dot_pos) {
    return {name, ""};
  }

  return {name.substr(0, dot_pos), name.substr(dot_pos)};
}

Result<std::size_t> FilenameSanitizer::codePointLength(const std::string& text) {
  if (text.size() > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Name too large to process"));
  }

  const auto* s = bytes(text);
  const auto length = static_cast<int32_t>(text.size());
  int32_t i = 0;
  std::size_t count = 0;

  while (i < length) {
    UChar32 c;
    U8_NEXT(s, i, length, c);
    if (c < 0) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "File name is not valid UTF-8"));
    }
    ++count;
  }

  return count;
}

std::size_t FilenameSanitizer::prefixBytes(const std::string& text, std::size_t count) {
  const auto* s = bytes(text);
  const auto length = static_cast<int32_t>(text.size());
  int32_t i = 0;

  for (std::size_t n = 0; n < count && i < length; ++n) {
    U8_FWD_1(s, i, length);
  }

  return static_cast<std::size_t>(i);
}

Result<std::string> FilenameSanitizer::sanitize(const std::string& name) {
  if (name.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "File name is empty"));
  }
  if (name == "." || name == "..") {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid file name: " + name));
  }
  if (name.size() > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Name too large to process"));
  }

  const auto* s = bytes(name);
  const auto length = static_cast<int32_t>(name.size());
  int32_t i = 0;

  std::string sanitized;
  sanitized.reserve(name.size());

  while (i < length) {
    int32_t start = i;
    UChar32 c;
    U8_NEXT(s, i, length, c);
    if (c < 0) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "File name is not valid UTF-8"));
    }

    if (isReservedAscii(c) || u_iscntrl(c)) {
      sanitized.push_back('_');
    } else {
      sanitized.append(name, static_cast<std::size_t>(start), static_cast<std::size_t>(i - start));
    }
  }

  return sanitized;
}

Result<std::string> FilenameSanitizer::truncate(const std::string& name, std::int64_t budget) {
  if (budget <= 0) {
    return std::unexpected(makeError(ErrorCode::kNameTooLong,
                                     "No room left for a file name (budget " +
                                     std::to_string(budget) + ")"));
  }

  auto parts = splitExtension(name);

  auto base_len = codePointLength(parts.base);
  if (!base_len.has_value()) {
    return std::unexpected(base_len.error());
  }
  auto ext_len = codePointLength(parts.extension);
  if (!ext_len.has_value()) {
    return std::unexpected(ext_len.error());
  }

  const auto limit = static_cast<std::size_t>(budget);
  if (*ext_len > limit) {
    return std::unexpected(makeError(ErrorCode::kNameTooLong,
                                     "Extension '" + parts.extension + "' does not fit in " +
                                     std::to_string(budget) + " characters"));
  }

  if (*base_len + *ext_len <= limit) {
    return name;
  }

  auto keep = prefixBytes(parts.base, limit - *ext_len);
  return parts.base.substr(0, keep) + parts.extension;
}

}  // namespace hrec::store
