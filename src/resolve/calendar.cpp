#include "hdt/resolve/calendar.hpp"

namespace hdt {

namespace {

constexpr std::chrono::seconds kSecondsPerDay{86400};

}  // namespace

TimeOfDay::TimeOfDay(std::chrono::seconds since_midnight) {
  auto wrapped = since_midnight % kSecondsPerDay;
  if (wrapped < std::chrono::seconds::zero()) {
    wrapped += kSecondsPerDay;
  }
  since_midnight_ = wrapped;
}

unsigned TimeOfDay::hour() const noexcept {
  return static_cast<unsigned>(
      std::chrono::duration_cast<std::chrono::hours>(since_midnight_).count());
}

unsigned TimeOfDay::minute() const noexcept {
  return static_cast<unsigned>(
      std::chrono::duration_cast<std::chrono::minutes>(since_midnight_).count() % 60);
}

unsigned TimeOfDay::second() const noexcept {
  return static_cast<unsigned>(since_midnight_.count() % 60);
}

}  // namespace hdt

namespace hdt::calendar {

std::optional<Date> makeDate(std::int64_t year, unsigned month, unsigned day) {
  if (year < static_cast<int>(std::chrono::year::min()) ||
      year > static_cast<int>(std::chrono::year::max())) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31) {
    return std::nullopt;
  }

  Date date{std::chrono::year{static_cast<int>(year)}, std::chrono::month{month},
            std::chrono::day{day}};
  if (!date.ok()) {
    return std::nullopt;
  }
  return date;
}

std::optional<TimeOfDay> makeTime(unsigned hour, unsigned minute, unsigned second) {
  if (hour > 23 || minute > 59 || second > 59) {
    return std::nullopt;
  }
  return TimeOfDay{std::chrono::hours{hour} + std::chrono::minutes{minute} +
                   std::chrono::seconds{second}};
}

Date dateOf(DateTime instant) {
  return Date{std::chrono::floor<std::chrono::days>(instant)};
}

TimeOfDay timeOf(DateTime instant) {
  return TimeOfDay{instant - std::chrono::floor<std::chrono::days>(instant)};
}

DateTime combine(const Date& date, const TimeOfDay& time) {
  return DateTime{std::chrono::local_days{date}} + time.sinceMidnight();
}

DateTime addDays(DateTime instant, std::int64_t days) {
  return instant + std::chrono::days{days};
}

Date addDays(const Date& date, std::int64_t days) {
  return Date{std::chrono::sys_days{date} + std::chrono::days{days}};
}

std::optional<DateTime> addMonths(DateTime instant, std::int64_t months) {
  const auto date = dateOf(instant);

  // Months counted from year 0, January
  const std::int64_t index = static_cast<std::int64_t>(static_cast<int>(date.year())) * 12 +
                             static_cast<std::int64_t>(static_cast<unsigned>(date.month())) - 1 +
                             months;
  const std::int64_t year = index >= 0 ? index / 12 : (index - 11) / 12;
  const auto month = static_cast<unsigned>(index - year * 12) + 1;

  auto target = makeDate(year, month, static_cast<unsigned>(date.day()));
  if (!target) {
    return std::nullopt;
  }
  return combine(*target, timeOf(instant));
}

std::chrono::weekday weekdayOf(const Date& date) {
  return std::chrono::weekday{std::chrono::sys_days{date}};
}

bool inRange(DateTime instant) {
  using namespace std::chrono;
  const auto day = floor<days>(instant);
  return day >= local_days{year::min() / January / 1} &&
         day <= local_days{year::max() / December / 31};
}

}  // namespace hdt::calendar
