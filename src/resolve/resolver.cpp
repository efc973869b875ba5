#include "hdt/resolve/resolver.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

#include "hdt/util/time.hpp"

namespace hdt::resolve {

namespace {

std::chrono::weekday toChrono(ast::Weekday weekday) {
  // ast::Weekday counts from Monday = 0; chrono encodes Monday as 1, Sunday as 7 or 0
  return std::chrono::weekday{static_cast<unsigned>(weekday) + 1};
}

std::int64_t signFor(calendar::Direction direction) {
  return direction == calendar::Direction::kForward ? 1 : -1;
}

ProcessingError invalidDate(std::int64_t year, unsigned month, unsigned day) {
  std::ostringstream oss;
  oss << "Invalid date: year " << year << ", month " << month << ", day " << day;
  return ProcessingError(ProcessingError::Kind::kInvalidDate, oss.str());
}

ProcessingError overflow(const ast::Quantifier& quantifier, DateTime instant,
                         calendar::Direction direction) {
  const bool forward = direction == calendar::Direction::kForward;
  std::ostringstream oss;
  oss << "Cannot " << (forward ? "add " : "subtract ") << quantifier.count << " "
      << ast::toString(quantifier.unit) << (forward ? " to " : " from ")
      << util::Time::toIso(instant) << ": the resulting date does not exist";
  return ProcessingError(forward ? ProcessingError::Kind::kAddToDate
                                 : ProcessingError::Kind::kSubtractFromDate,
                         oss.str());
}

}  // namespace

Resolved<ParseResult> Resolver::resolve(const ast::HumanTime& human_time) const {
  return std::visit(ast::Overloaded{
      [&](const ast::DateTime& dt) -> Resolved<ParseResult> {
        auto date = resolveDate(dt.date);
        auto time = resolveTime(dt.time);

        // Report both halves so the caller sees every problem at once
        std::vector<ProcessingError> errors;
        if (!date.has_value()) {
          errors.push_back(date.error());
        }
        if (!time.has_value()) {
          errors.push_back(time.error());
        }
        if (!errors.empty()) {
          return std::unexpected(std::move(errors));
        }
        return ParseResult{calendar::combine(*date, *time)};
      },
      [&](const ast::Date& d) -> Resolved<ParseResult> {
        auto date = resolveDate(d);
        if (!date.has_value()) {
          return std::unexpected(std::vector<ProcessingError>{date.error()});
        }
        return ParseResult{*date};
      },
      [&](const ast::Time& t) -> Resolved<ParseResult> {
        auto time = resolveTime(t);
        if (!time.has_value()) {
          return std::unexpected(std::vector<ProcessingError>{time.error()});
        }
        return ParseResult{*time};
      },
      [&](const ast::In& in) -> Resolved<ParseResult> {
        auto shifted = applyDuration(in.duration, now_, calendar::Direction::kForward);
        if (!shifted.has_value()) {
          return std::unexpected(std::vector<ProcessingError>{shifted.error()});
        }
        return ParseResult{*shifted};
      },
      [&](const ast::Ago& ago) -> Resolved<ParseResult> { return resolveAgo(ago); },
      [&](const ast::Now&) -> Resolved<ParseResult> { return ParseResult{now_}; },
  }, human_time.value);
}

Resolved<ParseResult> Resolver::resolveAgo(const ast::Ago& ago) const {
  DateTime anchor = now_;

  if (ago.anchor) {
    auto inner = resolve(*ago.anchor);
    if (!inner.has_value()) {
      return std::unexpected(std::vector<ProcessingError>{ProcessingError(
          ProcessingError::Kind::kAnchorResolution,
          "Cannot resolve the time the duration is counted back from", inner.error())});
    }

    switch (inner->kind()) {
      case ParseResult::Kind::kDateTime:
        anchor = inner->dateTime();
        break;
      case ParseResult::Kind::kDate:
        anchor = calendar::combine(inner->date(), calendar::timeOf(now_));
        break;
      case ParseResult::Kind::kTime:
        anchor = calendar::combine(calendar::dateOf(now_), inner->time());
        break;
    }
    spdlog::trace("Counting back from anchor {}", util::Time::toIso(anchor));
  }

  auto shifted = applyDuration(ago.duration, anchor, calendar::Direction::kBackward);
  if (!shifted.has_value()) {
    return std::unexpected(std::vector<ProcessingError>{shifted.error()});
  }
  return ParseResult{*shifted};
}

std::expected<Date, ProcessingError> Resolver::resolveDate(const ast::Date& date) const {
  const auto today = calendar::dateOf(now_);

  return std::visit(ast::Overloaded{
      [&](const ast::Today&) -> std::expected<Date, ProcessingError> { return today; },
      [&](const ast::Tomorrow&) -> std::expected<Date, ProcessingError> {
        return calendar::addDays(today, 1);
      },
      [&](const ast::Overmorrow&) -> std::expected<Date, ProcessingError> {
        return calendar::addDays(today, 2);
      },
      [&](const ast::Yesterday&) -> std::expected<Date, ProcessingError> {
        return calendar::addDays(today, -1);
      },
      [&](const ast::IsoDate& d) -> std::expected<Date, ProcessingError> {
        auto built = calendar::makeDate(d.year, d.month, d.day);
        if (!built) {
          return std::unexpected(invalidDate(d.year, d.month, d.day));
        }
        return *built;
      },
      [&](const ast::DayMonthYear& d) -> std::expected<Date, ProcessingError> {
        const auto month = static_cast<unsigned>(d.month);
        auto built = calendar::makeDate(d.year, month, d.day);
        if (!built) {
          return std::unexpected(invalidDate(d.year, month, d.day));
        }
        return *built;
      },
      [&](const ast::DayMonth& d) -> std::expected<Date, ProcessingError> {
        const std::int64_t year = static_cast<int>(today.year());
        const auto month = static_cast<unsigned>(d.month);
        auto built = calendar::makeDate(year, month, d.day);
        if (!built) {
          return std::unexpected(invalidDate(year, month, d.day));
        }
        return *built;
      },
      [&](const ast::RelativeWeekWeekday& d) -> std::expected<Date, ProcessingError> {
        return resolveRelativeWeekWeekday(d);
      },
      [&](const ast::RelativeWeekday& d) -> std::expected<Date, ProcessingError> {
        return resolveRelativeWeekday(d.specifier, d.weekday);
      },
      [&](const ast::RelativeTimeUnit& d) -> std::expected<Date, ProcessingError> {
        return resolveRelativeTimeUnit(d);
      },
      [&](const ast::UpcomingWeekday& d) -> std::expected<Date, ProcessingError> {
        return resolveRelativeWeekday(ast::RelativeSpecifier::kNext, d.weekday);
      },
  }, date);
}

Date Resolver::resolveRelativeWeekWeekday(const ast::RelativeWeekWeekday& date) const {
  const auto today = calendar::dateOf(now_);
  const auto days_since_monday =
      static_cast<std::int64_t>(calendar::weekdayOf(today).iso_encoding()) - 1;

  std::int64_t week_offset = 0;
  switch (date.specifier) {
    case ast::RelativeSpecifier::kThis:
      week_offset = 0;
      break;
    case ast::RelativeSpecifier::kNext:
      week_offset = 7;
      break;
    case ast::RelativeSpecifier::kLast:
      week_offset = -7;
      break;
  }

  const auto monday = calendar::addDays(today, week_offset - days_since_monday);
  return calendar::addDays(monday, static_cast<std::int64_t>(date.weekday));
}

Date Resolver::resolveRelativeWeekday(ast::RelativeSpecifier specifier,
                                      ast::Weekday weekday) const {
  const auto today = calendar::dateOf(now_);
  const auto current = calendar::weekdayOf(today);
  const auto target = toChrono(weekday);

  switch (specifier) {
    case ast::RelativeSpecifier::kThis:
      if (current == target) {
        return today;
      }
      [[fallthrough]];
    case ast::RelativeSpecifier::kNext: {
      // weekday difference is always in [0, 6]; today itself never counts
      auto ahead = (target - current).count();
      if (ahead == 0) {
        ahead = 7;
      }
      return calendar::addDays(today, static_cast<std::int64_t>(ahead));
    }
    case ast::RelativeSpecifier::kLast: {
      auto behind = (current - target).count();
      if (behind == 0) {
        behind = 7;
      }
      return calendar::addDays(today, -static_cast<std::int64_t>(behind));
    }
  }
  return today;
}

std::expected<Date, ProcessingError> Resolver::resolveRelativeTimeUnit(
    const ast::RelativeTimeUnit& date) const {
  if (date.specifier == ast::RelativeSpecifier::kThis) {
    return calendar::dateOf(now_);
  }

  const auto direction = date.specifier == ast::RelativeSpecifier::kNext
                             ? calendar::Direction::kForward
                             : calendar::Direction::kBackward;
  auto shifted = applyDuration(ast::Duration{{ast::Quantifier{1, date.unit}}}, now_, direction);
  if (!shifted.has_value()) {
    return std::unexpected(shifted.error());
  }
  return calendar::dateOf(*shifted);
}

std::expected<TimeOfDay, ProcessingError> Resolver::resolveTime(const ast::Time& time) const {
  return std::visit(ast::Overloaded{
      [](const ast::HourMinute& t) -> std::expected<TimeOfDay, ProcessingError> {
        auto built = calendar::makeTime(t.hour, t.minute);
        if (!built) {
          std::ostringstream oss;
          oss << "Invalid time: hour " << t.hour << ", minute " << t.minute;
          return std::unexpected(ProcessingError(ProcessingError::Kind::kInvalidTime, oss.str()));
        }
        return *built;
      },
      [](const ast::HourMinuteSecond& t) -> std::expected<TimeOfDay, ProcessingError> {
        auto built = calendar::makeTime(t.hour, t.minute, t.second);
        if (!built) {
          std::ostringstream oss;
          oss << "Invalid time: hour " << t.hour << ", minute " << t.minute << ", second "
              << t.second;
          return std::unexpected(ProcessingError(ProcessingError::Kind::kInvalidTime, oss.str()));
        }
        return *built;
      },
  }, time);
}

std::expected<DateTime, ProcessingError> Resolver::applyDuration(
    const ast::Duration& duration, DateTime instant, calendar::Direction direction) const {
  const auto sign = signFor(direction);
  DateTime current = instant;

  for (const auto& quantifier : duration.quantifiers) {
    const auto count = static_cast<std::int64_t>(quantifier.count);
    const DateTime before = current;

    switch (quantifier.unit) {
      case ast::TimeUnit::kYear:
      case ast::TimeUnit::kMonth: {
        const auto months = quantifier.unit == ast::TimeUnit::kYear ? count * 12 : count;
        auto shifted = calendar::addMonths(current, sign * months);
        if (!shifted) {
          spdlog::debug("Month arithmetic overflowed at {}", util::Time::toIso(current));
          return std::unexpected(overflow(quantifier, current, direction));
        }
        current = *shifted;
        break;
      }
      case ast::TimeUnit::kWeek:
        current = calendar::addDays(current, sign * count * 7);
        break;
      case ast::TimeUnit::kDay:
        current = calendar::addDays(current, sign * count);
        break;
      case ast::TimeUnit::kHour:
        current += std::chrono::hours{sign * count};
        break;
      case ast::TimeUnit::kMinute:
        current += std::chrono::minutes{sign * count};
        break;
      case ast::TimeUnit::kSecond:
        current += std::chrono::seconds{sign * count};
        break;
    }

    // year_month_day wraps outside its year range instead of failing
    if (!calendar::inRange(current)) {
      spdlog::debug("Duration left the representable range at {}", util::Time::toIso(before));
      return std::unexpected(overflow(quantifier, before, direction));
    }
  }

  return current;
}

}  // namespace hdt::resolve
