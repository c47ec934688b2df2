#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "hrec/common.hpp"

namespace hrec::store {

struct NameParts {
  std::string base;
  std::string extension;  // Includes the leading '.', empty when absent
};

/**
 * @brief Pure helpers that turn an uploaded file name into a safe,
 * extension-preserving name of bounded length.
 *
 * Lengths are Unicode code points of the UTF-8 text. Truncation never
 * splits a multi-byte sequence and never touches the extension.
 */
class FilenameSanitizer {
 public:
  /**
   * @brief Split at the last '.'; names whose only dots are leading
   * (".bashrc") have no extension
   */
  static NameParts splitExtension(const std::string& name);

  /**
   * @brief Replace path separators, reserved characters and control code
   * points with '_'. The code point length is unchanged.
   * @return kInvalidArgument for empty names, "." / ".." or invalid UTF-8
   */
  static Result<std::string> sanitize(const std::string& name);

  /**
   * @brief Fit `name` into `budget` code points by cutting the end of the
   * base name. Names that already fit are returned unchanged.
   * @return kNameTooLong when budget <= 0 or the extension alone exceeds it
   */
  static Result<std::string> truncate(const std::string& name, std::int64_t budget);

  /**
   * @brief Number of code points in UTF-8 text
   * @return kInvalidArgument on malformed UTF-8
   */
  static Result<std::size_t> codePointLength(const std::string& text);

 private:
  // Byte length of the first `count` code points of valid UTF-8 text
  static std::size_t prefixBytes(const std::string& text, std::size_t count);
};

}  // namespace hrec::store
