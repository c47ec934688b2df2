#include "hrec/util/time.hpp"

#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace hrec::util {

std::string Time::toRfc3339(std::chrono::system_clock::time_point time) {
  auto time_t = std::chrono::system_clock::to_time_t(time);
  auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
      time.time_since_epoch()) % 1000;

  std::ostringstream oss;
  oss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << milliseconds.count() << 'Z';

  return oss.str();
}

Result<std::chrono::year_month_day> Time::parseDate(const std::string& str) {
  static const std::regex date_regex(R"((\d{4})-(\d{2})-(\d{2}))");

  std::smatch match;
  if (!std::regex_match(str, match, date_regex)) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid date format (expected YYYY-MM-DD): " + str));
  }

  std::chrono::year_month_day date{
      std::chrono::year{std::stoi(match[1])},
      std::chrono::month{static_cast<unsigned>(std::stoi(match[2]))},
      std::chrono::day{static_cast<unsigned>(std::stoi(match[3]))}};

  if (!date.ok()) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid calendar date: " + str));
  }

  return date;
}

std::string Time::formatDate(std::chrono::year_month_day date) {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(date.year()) << '-'
      << std::setw(2) << static_cast<unsigned>(date.month()) << '-'
      << std::setw(2) << static_cast<unsigned>(date.day());
  return oss.str();
}

std::string Time::today() {
  auto time_t = std::chrono::system_clock::to_time_t(now());
  std::tm local_tm{};
#ifdef _WIN32
  localtime_s(&local_tm, &time_t);
#else
  localtime_r(&time_t, &local_tm);
#endif

  std::ostringstream oss;
  oss << std::put_time(&local_tm, "%Y-%m-%d");
  return oss.str();
}

std::chrono::system_clock::time_point Time::now() {
  return std::chrono::system_clock::now();
}

}  // namespace hrec::util
