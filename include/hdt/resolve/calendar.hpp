#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace hdt {

// Wall-clock instant in the zone of the reference "now" (no zone attached)
using DateTime = std::chrono::local_seconds;

// Calendar date
using Date = std::chrono::year_month_day;

// Time of day with second resolution, always in [00:00:00, 23:59:59]
class TimeOfDay {
 public:
  TimeOfDay() = default;

  // Build from a duration since midnight; the value is wrapped into one day
  explicit TimeOfDay(std::chrono::seconds since_midnight);

  unsigned hour() const noexcept;
  unsigned minute() const noexcept;
  unsigned second() const noexcept;

  std::chrono::seconds sinceMidnight() const noexcept { return since_midnight_; }

  bool operator==(const TimeOfDay& other) const noexcept = default;

 private:
  std::chrono::seconds since_midnight_{0};
};

}  // namespace hdt

namespace hdt::calendar {

enum class Direction {
  kForward,
  kBackward
};

// Construct a date, or nothing when the combination does not exist
std::optional<Date> makeDate(std::int64_t year, unsigned month, unsigned day);

// Construct a time of day, or nothing when a field is out of range
std::optional<TimeOfDay> makeTime(unsigned hour, unsigned minute, unsigned second = 0);

Date dateOf(DateTime instant);
TimeOfDay timeOf(DateTime instant);
DateTime combine(const Date& date, const TimeOfDay& time);

DateTime addDays(DateTime instant, std::int64_t days);
Date addDays(const Date& date, std::int64_t days);

// Shift by whole calendar months keeping the day of month. Returns nothing
// when the resulting day does not exist in the target month.
std::optional<DateTime> addMonths(DateTime instant, std::int64_t months);

std::chrono::weekday weekdayOf(const Date& date);

// True when the instant falls on a date std::chrono::year can represent
bool inRange(DateTime instant);

}  // namespace hdt::calendar
