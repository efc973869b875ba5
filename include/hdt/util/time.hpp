#pragma once

#include <string>

#include "hdt/common.hpp"
#include "hdt/resolve/calendar.hpp"

namespace hdt::util {

// Time utilities for reading the local clock and ISO 8601 text
class Time {
 public:
  // Current wall-clock time in the local timezone, truncated to seconds
  static DateTime localNow();

  // Parse "YYYY-MM-DD", "YYYY-MM-DDTHH:MM" or "YYYY-MM-DD HH:MM:SS"
  static Result<DateTime> parseDateTime(const std::string& str);

  // Format as "YYYY-MM-DDTHH:MM:SS"
  static std::string toIso(DateTime time);

  // Format as "YYYY-MM-DD"
  static std::string toIso(const Date& date);

  // Format as "HH:MM:SS"
  static std::string toIso(const TimeOfDay& time);
};

}  // namespace hdt::util
