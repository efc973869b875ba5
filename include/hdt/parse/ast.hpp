#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hdt::ast {

enum class Month : unsigned {
  kJanuary = 1,
  kFebruary,
  kMarch,
  kApril,
  kMay,
  kJune,
  kJuly,
  kAugust,
  kSeptember,
  kOctober,
  kNovember,
  kDecember
};

// Monday-based, independent of std::chrono::weekday
enum class Weekday {
  kMonday,
  kTuesday,
  kWednesday,
  kThursday,
  kFriday,
  kSaturday,
  kSunday
};

enum class RelativeSpecifier {
  kThis,
  kNext,
  kLast
};

enum class TimeUnit {
  kYear,
  kMonth,
  kWeek,
  kDay,
  kHour,
  kMinute,
  kSecond
};

struct Quantifier {
  std::uint32_t count;
  TimeUnit unit;

  bool operator==(const Quantifier& other) const = default;
};

// Non-empty, in input order
struct Duration {
  std::vector<Quantifier> quantifiers;

  bool operator==(const Duration& other) const = default;
};

// Date variants
struct Today {};
struct Tomorrow {};
struct Overmorrow {};
struct Yesterday {};

struct IsoDate {
  std::uint32_t year;
  std::uint32_t month;
  std::uint32_t day;
};

struct DayMonthYear {
  std::uint32_t day;
  Month month;
  std::uint32_t year;
};

struct DayMonth {
  std::uint32_t day;
  Month month;
};

// "next week friday"
struct RelativeWeekWeekday {
  RelativeSpecifier specifier;
  Weekday weekday;
};

// "next friday"
struct RelativeWeekday {
  RelativeSpecifier specifier;
  Weekday weekday;
};

// "next month"; unit is one of year, month, week, day
struct RelativeTimeUnit {
  RelativeSpecifier specifier;
  TimeUnit unit;
};

// bare "friday"
struct UpcomingWeekday {
  Weekday weekday;
};

using Date = std::variant<Today, Tomorrow, Overmorrow, Yesterday, IsoDate, DayMonthYear, DayMonth,
                          RelativeWeekWeekday, RelativeWeekday, RelativeTimeUnit, UpcomingWeekday>;

// Time variants; ranges are only checked during resolution
struct HourMinute {
  std::uint32_t hour;
  std::uint32_t minute;
};

struct HourMinuteSecond {
  std::uint32_t hour;
  std::uint32_t minute;
  std::uint32_t second;
};

using Time = std::variant<HourMinute, HourMinuteSecond>;

struct DateTime {
  Date date;
  Time time;
};

struct In {
  Duration duration;
};

struct HumanTime;

// "<duration> ago [at <anchor>]"
struct Ago {
  explicit Ago(Duration duration, std::unique_ptr<HumanTime> anchor = nullptr);
  Ago(Ago&& other) noexcept;
  Ago& operator=(Ago&& other) noexcept;
  ~Ago();

  Duration duration;
  std::unique_ptr<HumanTime> anchor;
};

struct Now {};

struct HumanTime {
  std::variant<DateTime, Date, Time, In, Ago, Now> value;
};

// Debug rendering, e.g. "Ago(Duration[7 Day], HumanTime(Time(HourMinute(4, 0))))"
std::string describe(const HumanTime& human_time);
std::string describe(const Date& date);
std::string describe(const Time& time);
std::string describe(const Duration& duration);

std::string_view toString(Month month);
std::string_view toString(Weekday weekday);
std::string_view toString(RelativeSpecifier specifier);
std::string_view toString(TimeUnit unit);

// Helper for std::visit over the variants above
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace hdt::ast
