#include "hdt/util/time.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace hdt::util {

DateTime Time::localNow() {
  auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

  std::tm tm = {};
  localtime_r(&time_t, &tm);

  const Date date{std::chrono::year{tm.tm_year + 1900},
                  std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
                  std::chrono::day{static_cast<unsigned>(tm.tm_mday)}};
  // tm_sec may be 60 during a leap second
  const auto seconds = std::min(tm.tm_sec, 59);
  return calendar::combine(date, TimeOfDay{std::chrono::hours{tm.tm_hour} +
                                           std::chrono::minutes{tm.tm_min} +
                                           std::chrono::seconds{seconds}});
}

Result<DateTime> Time::parseDateTime(const std::string& str) {
  std::regex iso_regex(R"((\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2}))?)?)");

  std::smatch match;
  if (!std::regex_match(str, match, iso_regex)) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid ISO 8601 date-time: " + str));
  }

  auto date = calendar::makeDate(std::stoi(match[1]), static_cast<unsigned>(std::stoi(match[2])),
                                 static_cast<unsigned>(std::stoi(match[3])));
  if (!date) {
    return std::unexpected(makeError(ErrorCode::kParseError, "Invalid date values: " + str));
  }

  TimeOfDay time;
  if (match[4].matched) {
    auto parsed = calendar::makeTime(static_cast<unsigned>(std::stoi(match[4])),
                                     static_cast<unsigned>(std::stoi(match[5])),
                                     match[6].matched ? static_cast<unsigned>(std::stoi(match[6]))
                                                      : 0u);
    if (!parsed) {
      return std::unexpected(makeError(ErrorCode::kParseError, "Invalid time values: " + str));
    }
    time = *parsed;
  }

  return calendar::combine(*date, time);
}

std::string Time::toIso(DateTime time) {
  return toIso(calendar::dateOf(time)) + "T" + toIso(calendar::timeOf(time));
}

std::string Time::toIso(const Date& date) {
  std::ostringstream oss;
  const int year = static_cast<int>(date.year());
  if (year < 0) {
    oss << '-';
  }
  oss << std::setfill('0') << std::setw(4) << (year < 0 ? -year : year) << '-'
      << std::setw(2) << static_cast<unsigned>(date.month()) << '-'
      << std::setw(2) << static_cast<unsigned>(date.day());
  return oss.str();
}

std::string Time::toIso(const TimeOfDay& time) {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << time.hour() << ':'
      << std::setw(2) << time.minute() << ':'
      << std::setw(2) << time.second();
  return oss.str();
}

}  // namespace hdt::util
