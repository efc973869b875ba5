#include "hdt/parse/ast.hpp"

#include <sstream>

namespace hdt::ast {

Ago::Ago(Duration duration, std::unique_ptr<HumanTime> anchor)
    : duration(std::move(duration)), anchor(std::move(anchor)) {}

Ago::Ago(Ago&& other) noexcept = default;
Ago& Ago::operator=(Ago&& other) noexcept = default;
Ago::~Ago() = default;

std::string_view toString(Month month) {
  switch (month) {
    case Month::kJanuary: return "January";
    case Month::kFebruary: return "February";
    case Month::kMarch: return "March";
    case Month::kApril: return "April";
    case Month::kMay: return "May";
    case Month::kJune: return "June";
    case Month::kJuly: return "July";
    case Month::kAugust: return "August";
    case Month::kSeptember: return "September";
    case Month::kOctober: return "October";
    case Month::kNovember: return "November";
    case Month::kDecember: return "December";
  }
  return "Unknown";
}

std::string_view toString(Weekday weekday) {
  switch (weekday) {
    case Weekday::kMonday: return "Monday";
    case Weekday::kTuesday: return "Tuesday";
    case Weekday::kWednesday: return "Wednesday";
    case Weekday::kThursday: return "Thursday";
    case Weekday::kFriday: return "Friday";
    case Weekday::kSaturday: return "Saturday";
    case Weekday::kSunday: return "Sunday";
  }
  return "Unknown";
}

std::string_view toString(RelativeSpecifier specifier) {
  switch (specifier) {
    case RelativeSpecifier::kThis: return "This";
    case RelativeSpecifier::kNext: return "Next";
    case RelativeSpecifier::kLast: return "Last";
  }
  return "Unknown";
}

std::string_view toString(TimeUnit unit) {
  switch (unit) {
    case TimeUnit::kYear: return "Year";
    case TimeUnit::kMonth: return "Month";
    case TimeUnit::kWeek: return "Week";
    case TimeUnit::kDay: return "Day";
    case TimeUnit::kHour: return "Hour";
    case TimeUnit::kMinute: return "Minute";
    case TimeUnit::kSecond: return "Second";
  }
  return "Unknown";
}

std::string describe(const Duration& duration) {
  std::ostringstream oss;
  oss << "Duration[";
  for (std::size_t i = 0; i < duration.quantifiers.size(); ++i) {
    if (i > 0) oss << ", ";
    oss << duration.quantifiers[i].count << " " << toString(duration.quantifiers[i].unit);
  }
  oss << "]";
  return oss.str();
}

std::string describe(const Date& date) {
  std::ostringstream oss;
  oss << "Date(";
  std::visit(Overloaded{
      [&](const Today&) { oss << "Today"; },
      [&](const Tomorrow&) { oss << "Tomorrow"; },
      [&](const Overmorrow&) { oss << "Overmorrow"; },
      [&](const Yesterday&) { oss << "Yesterday"; },
      [&](const IsoDate& d) {
        oss << "IsoDate(" << d.year << ", " << d.month << ", " << d.day << ")";
      },
      [&](const DayMonthYear& d) {
        oss << "DayMonthYear(" << d.day << ", " << toString(d.month) << ", " << d.year << ")";
      },
      [&](const DayMonth& d) {
        oss << "DayMonth(" << d.day << ", " << toString(d.month) << ")";
      },
      [&](const RelativeWeekWeekday& d) {
        oss << "RelativeWeekWeekday(" << toString(d.specifier) << ", " << toString(d.weekday)
            << ")";
      },
      [&](const RelativeWeekday& d) {
        oss << "RelativeWeekday(" << toString(d.specifier) << ", " << toString(d.weekday) << ")";
      },
      [&](const RelativeTimeUnit& d) {
        oss << "RelativeTimeUnit(" << toString(d.specifier) << ", " << toString(d.unit) << ")";
      },
      [&](const UpcomingWeekday& d) {
        oss << "UpcomingWeekday(" << toString(d.weekday) << ")";
      },
  }, date);
  oss << ")";
  return oss.str();
}

std::string describe(const Time& time) {
  std::ostringstream oss;
  oss << "Time(";
  std::visit(Overloaded{
      [&](const HourMinute& t) { oss << "HourMinute(" << t.hour << ", " << t.minute << ")"; },
      [&](const HourMinuteSecond& t) {
        oss << "HourMinuteSecond(" << t.hour << ", " << t.minute << ", " << t.second << ")";
      },
  }, time);
  oss << ")";
  return oss.str();
}

std::string describe(const HumanTime& human_time) {
  std::ostringstream oss;
  oss << "HumanTime(";
  std::visit(Overloaded{
      [&](const DateTime& dt) {
        oss << "DateTime(" << describe(dt.date) << ", " << describe(dt.time) << ")";
      },
      [&](const Date& d) { oss << describe(d); },
      [&](const Time& t) { oss << describe(t); },
      [&](const In& in) { oss << "In(" << describe(in.duration) << ")"; },
      [&](const Ago& ago) {
        oss << "Ago(" << describe(ago.duration);
        if (ago.anchor) {
          oss << ", " << describe(*ago.anchor);
        }
        oss << ")";
      },
      [&](const Now&) { oss << "Now"; },
  }, human_time.value);
  oss << ")";
  return oss.str();
}

}  // namespace hdt::ast
