#pragma once

#include <chrono>
#include <string>

#include "hrec/common.hpp"

namespace hrec::util {

// Time utilities for visit dates and export timestamps
class Time {
 public:
  // Format time as RFC3339 string (ISO 8601)
  static std::string toRfc3339(std::chrono::system_clock::time_point time);

  // Parse a calendar date in YYYY-MM-DD form, rejecting impossible dates
  static Result<std::chrono::year_month_day> parseDate(const std::string& str);

  // Format a calendar date as YYYY-MM-DD
  static std::string formatDate(std::chrono::year_month_day date);

  // Today's local date as YYYY-MM-DD
  static std::string today();

  // Get current time
  static std::chrono::system_clock::time_point now();
};

}  // namespace hrec::util
