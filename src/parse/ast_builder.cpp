#include "hdt/parse/ast_builder.hpp"

#include <charconv>
#include <initializer_list>
#include <sstream>

#include <spdlog/spdlog.h>

namespace hdt::parse {

namespace {

// True when the children of node have exactly these rules, in order
bool hasShape(const ParseNode& node, std::initializer_list<Rule> rules) {
  const auto& children = node.children();
  if (children.size() != rules.size()) {
    return false;
  }
  std::size_t i = 0;
  for (auto rule : rules) {
    if (children[i++].rule() != rule) {
      return false;
    }
  }
  return true;
}

// Rule of the single leaf below a wrapper node (Weekday > Monday)
const ParseNode* onlyChild(const ParseNode& node) {
  if (node.children().size() != 1) {
    return nullptr;
  }
  return &node.children().front();
}

}  // namespace

Result<ast::HumanTime> AstBuilder::build(const ParseNode& root) {
  auto result = buildHumanTime(root);
  if (!result.has_value()) {
    spdlog::error("Failed to build AST for '{}': {}", root.text(), result.error().message());
  }
  return result;
}

Error AstBuilder::unexpectedShape(const ParseNode& node) {
  std::ostringstream oss;
  oss << "Failed to build AST: unexpected " << ruleName(node.rule()) << " shape (";
  for (std::size_t i = 0; i < node.children().size(); ++i) {
    if (i > 0) oss << ", ";
    oss << ruleName(node.children()[i].rule());
  }
  oss << ")";
  return makeError(ErrorCode::kInternalError, oss.str());
}

Result<ast::HumanTime> AstBuilder::buildHumanTime(const ParseNode& node) {
  if (node.rule() != Rule::kHumanTime) {
    return std::unexpected(unexpectedShape(node));
  }
  const auto* child = onlyChild(node);
  if (child == nullptr) {
    return std::unexpected(unexpectedShape(node));
  }

  switch (child->rule()) {
    case Rule::kDateTime: {
      auto dt = buildDateTime(*child);
      if (!dt.has_value()) {
        return std::unexpected(dt.error());
      }
      return ast::HumanTime{std::move(*dt)};
    }
    case Rule::kDate: {
      auto date = buildDate(*child);
      if (!date.has_value()) {
        return std::unexpected(date.error());
      }
      return ast::HumanTime{std::move(*date)};
    }
    case Rule::kTime: {
      auto time = buildTime(*child);
      if (!time.has_value()) {
        return std::unexpected(time.error());
      }
      return ast::HumanTime{std::move(*time)};
    }
    case Rule::kIn: {
      if (!hasShape(*child, {Rule::kDuration})) {
        return std::unexpected(unexpectedShape(*child));
      }
      auto duration = buildDuration(child->children()[0]);
      if (!duration.has_value()) {
        return std::unexpected(duration.error());
      }
      return ast::HumanTime{ast::In{std::move(*duration)}};
    }
    case Rule::kAgo: {
      auto ago = buildAgo(*child);
      if (!ago.has_value()) {
        return std::unexpected(ago.error());
      }
      return ast::HumanTime{std::move(*ago)};
    }
    case Rule::kNow:
      return ast::HumanTime{ast::Now{}};
    default:
      return std::unexpected(unexpectedShape(node));
  }
}

Result<ast::DateTime> AstBuilder::buildDateTime(const ParseNode& node) {
  const ParseNode* date_node = nullptr;
  const ParseNode* time_node = nullptr;

  if (hasShape(node, {Rule::kDate, Rule::kTime})) {
    date_node = &node.children()[0];
    time_node = &node.children()[1];
  } else if (hasShape(node, {Rule::kTime, Rule::kDate})) {
    time_node = &node.children()[0];
    date_node = &node.children()[1];
  } else {
    return std::unexpected(unexpectedShape(node));
  }

  auto date = buildDate(*date_node);
  if (!date.has_value()) {
    return std::unexpected(date.error());
  }
  auto time = buildTime(*time_node);
  if (!time.has_value()) {
    return std::unexpected(time.error());
  }
  return ast::DateTime{std::move(*date), std::move(*time)};
}

Result<ast::Date> AstBuilder::buildDate(const ParseNode& node) {
  const auto& c = node.children();

  if (const auto* only = onlyChild(node)) {
    switch (only->rule()) {
      case Rule::kToday:
        return ast::Date{ast::Today{}};
      case Rule::kTomorrow:
        return ast::Date{ast::Tomorrow{}};
      case Rule::kOvermorrow:
        return ast::Date{ast::Overmorrow{}};
      case Rule::kYesterday:
        return ast::Date{ast::Yesterday{}};
      case Rule::kIsoDate: {
        auto iso = buildIsoDate(*only);
        if (!iso.has_value()) {
          return std::unexpected(iso.error());
        }
        return ast::Date{*iso};
      }
      case Rule::kWeekday: {
        auto weekday = buildWeekday(*only);
        if (!weekday.has_value()) {
          return std::unexpected(weekday.error());
        }
        return ast::Date{ast::UpcomingWeekday{*weekday}};
      }
      default:
        return std::unexpected(unexpectedShape(node));
    }
  }

  if (hasShape(node, {Rule::kNum, Rule::kMonthName, Rule::kNum})) {
    auto day = buildNum(c[0]);
    auto month = buildMonth(c[1]);
    auto year = buildNum(c[2]);
    if (!day.has_value()) return std::unexpected(day.error());
    if (!month.has_value()) return std::unexpected(month.error());
    if (!year.has_value()) return std::unexpected(year.error());
    return ast::Date{ast::DayMonthYear{*day, *month, *year}};
  }

  if (hasShape(node, {Rule::kNum, Rule::kMonthName})) {
    auto day = buildNum(c[0]);
    auto month = buildMonth(c[1]);
    if (!day.has_value()) return std::unexpected(day.error());
    if (!month.has_value()) return std::unexpected(month.error());
    return ast::Date{ast::DayMonth{*day, *month}};
  }

  if (hasShape(node, {Rule::kRelativeSpecifier, Rule::kWeek, Rule::kWeekday})) {
    auto specifier = buildRelativeSpecifier(c[0]);
    auto weekday = buildWeekday(c[2]);
    if (!specifier.has_value()) return std::unexpected(specifier.error());
    if (!weekday.has_value()) return std::unexpected(weekday.error());
    return ast::Date{ast::RelativeWeekWeekday{*specifier, *weekday}};
  }

  if (hasShape(node, {Rule::kRelativeSpecifier, Rule::kTimeUnit})) {
    auto specifier = buildRelativeSpecifier(c[0]);
    auto unit = buildTimeUnit(c[1]);
    if (!specifier.has_value()) return std::unexpected(specifier.error());
    if (!unit.has_value()) return std::unexpected(unit.error());
    return ast::Date{ast::RelativeTimeUnit{*specifier, *unit}};
  }

  if (hasShape(node, {Rule::kRelativeSpecifier, Rule::kWeekday})) {
    auto specifier = buildRelativeSpecifier(c[0]);
    auto weekday = buildWeekday(c[1]);
    if (!specifier.has_value()) return std::unexpected(specifier.error());
    if (!weekday.has_value()) return std::unexpected(weekday.error());
    return ast::Date{ast::RelativeWeekday{*specifier, *weekday}};
  }

  return std::unexpected(unexpectedShape(node));
}

Result<ast::IsoDate> AstBuilder::buildIsoDate(const ParseNode& node) {
  if (!hasShape(node, {Rule::kNum, Rule::kNum, Rule::kNum})) {
    return std::unexpected(unexpectedShape(node));
  }
  auto year = buildNum(node.children()[0]);
  auto month = buildNum(node.children()[1]);
  auto day = buildNum(node.children()[2]);
  if (!year.has_value()) return std::unexpected(year.error());
  if (!month.has_value()) return std::unexpected(month.error());
  if (!day.has_value()) return std::unexpected(day.error());
  return ast::IsoDate{*year, *month, *day};
}

Result<ast::Time> AstBuilder::buildTime(const ParseNode& node) {
  const auto& c = node.children();

  if (hasShape(node, {Rule::kNum, Rule::kNum})) {
    auto hour = buildNum(c[0]);
    auto minute = buildNum(c[1]);
    if (!hour.has_value()) return std::unexpected(hour.error());
    if (!minute.has_value()) return std::unexpected(minute.error());
    return ast::Time{ast::HourMinute{*hour, *minute}};
  }

  if (hasShape(node, {Rule::kNum, Rule::kNum, Rule::kNum})) {
    auto hour = buildNum(c[0]);
    auto minute = buildNum(c[1]);
    auto second = buildNum(c[2]);
    if (!hour.has_value()) return std::unexpected(hour.error());
    if (!minute.has_value()) return std::unexpected(minute.error());
    if (!second.has_value()) return std::unexpected(second.error());
    return ast::Time{ast::HourMinuteSecond{*hour, *minute, *second}};
  }

  return std::unexpected(unexpectedShape(node));
}

Result<ast::Ago> AstBuilder::buildAgo(const ParseNode& node) {
  if (hasShape(node, {Rule::kDuration})) {
    auto duration = buildDuration(node.children()[0]);
    if (!duration.has_value()) {
      return std::unexpected(duration.error());
    }
    return ast::Ago{std::move(*duration)};
  }

  if (hasShape(node, {Rule::kDuration, Rule::kHumanTime})) {
    auto duration = buildDuration(node.children()[0]);
    if (!duration.has_value()) {
      return std::unexpected(duration.error());
    }
    auto anchor = buildHumanTime(node.children()[1]);
    if (!anchor.has_value()) {
      return std::unexpected(anchor.error());
    }
    return ast::Ago{std::move(*duration), std::make_unique<ast::HumanTime>(std::move(*anchor))};
  }

  return std::unexpected(unexpectedShape(node));
}

Result<ast::Duration> AstBuilder::buildDuration(const ParseNode& node) {
  const auto& c = node.children();

  // "a day", "an hour"
  if (hasShape(node, {Rule::kSingleUnit})) {
    const auto* unit_node = onlyChild(c[0]);
    if (unit_node == nullptr || unit_node->rule() != Rule::kTimeUnit) {
      return std::unexpected(unexpectedShape(c[0]));
    }
    auto unit = buildTimeUnit(*unit_node);
    if (!unit.has_value()) {
      return std::unexpected(unit.error());
    }
    return ast::Duration{{ast::Quantifier{1, *unit}}};
  }

  if (c.empty()) {
    return std::unexpected(unexpectedShape(node));
  }

  ast::Duration duration;
  duration.quantifiers.reserve(c.size());
  for (const auto& child : c) {
    if (child.rule() != Rule::kQuantifier) {
      return std::unexpected(unexpectedShape(node));
    }
    auto quantifier = buildQuantifier(child);
    if (!quantifier.has_value()) {
      return std::unexpected(quantifier.error());
    }
    duration.quantifiers.push_back(*quantifier);
  }
  return duration;
}

Result<ast::Quantifier> AstBuilder::buildQuantifier(const ParseNode& node) {
  if (!hasShape(node, {Rule::kNum, Rule::kTimeUnit})) {
    return std::unexpected(unexpectedShape(node));
  }
  auto count = buildNum(node.children()[0]);
  auto unit = buildTimeUnit(node.children()[1]);
  if (!count.has_value()) return std::unexpected(count.error());
  if (!unit.has_value()) return std::unexpected(unit.error());
  return ast::Quantifier{*count, *unit};
}

Result<std::uint32_t> AstBuilder::buildNum(const ParseNode& node) {
  if (node.rule() != Rule::kNum) {
    return std::unexpected(unexpectedShape(node));
  }
  const auto text = node.text();
  std::uint32_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::unexpected(makeError(ErrorCode::kInternalError,
                                     "Failed to build AST: cannot convert number '" +
                                         std::string(text) + "'"));
  }
  return value;
}

Result<ast::TimeUnit> AstBuilder::buildTimeUnit(const ParseNode& node) {
  const auto* unit = onlyChild(node);
  if (node.rule() != Rule::kTimeUnit || unit == nullptr) {
    return std::unexpected(unexpectedShape(node));
  }
  switch (unit->rule()) {
    case Rule::kYear: return ast::TimeUnit::kYear;
    case Rule::kMonth: return ast::TimeUnit::kMonth;
    case Rule::kWeek: return ast::TimeUnit::kWeek;
    case Rule::kDay: return ast::TimeUnit::kDay;
    case Rule::kHour: return ast::TimeUnit::kHour;
    case Rule::kMinute: return ast::TimeUnit::kMinute;
    case Rule::kSecond: return ast::TimeUnit::kSecond;
    default: return std::unexpected(unexpectedShape(node));
  }
}

Result<ast::Weekday> AstBuilder::buildWeekday(const ParseNode& node) {
  const auto* day = onlyChild(node);
  if (node.rule() != Rule::kWeekday || day == nullptr) {
    return std::unexpected(unexpectedShape(node));
  }
  switch (day->rule()) {
    case Rule::kMonday: return ast::Weekday::kMonday;
    case Rule::kTuesday: return ast::Weekday::kTuesday;
    case Rule::kWednesday: return ast::Weekday::kWednesday;
    case Rule::kThursday: return ast::Weekday::kThursday;
    case Rule::kFriday: return ast::Weekday::kFriday;
    case Rule::kSaturday: return ast::Weekday::kSaturday;
    case Rule::kSunday: return ast::Weekday::kSunday;
    default: return std::unexpected(unexpectedShape(node));
  }
}

Result<ast::Month> AstBuilder::buildMonth(const ParseNode& node) {
  const auto* month = onlyChild(node);
  if (node.rule() != Rule::kMonthName || month == nullptr) {
    return std::unexpected(unexpectedShape(node));
  }
  switch (month->rule()) {
    case Rule::kJanuary: return ast::Month::kJanuary;
    case Rule::kFebruary: return ast::Month::kFebruary;
    case Rule::kMarch: return ast::Month::kMarch;
    case Rule::kApril: return ast::Month::kApril;
    case Rule::kMay: return ast::Month::kMay;
    case Rule::kJune: return ast::Month::kJune;
    case Rule::kJuly: return ast::Month::kJuly;
    case Rule::kAugust: return ast::Month::kAugust;
    case Rule::kSeptember: return ast::Month::kSeptember;
    case Rule::kOctober: return ast::Month::kOctober;
    case Rule::kNovember: return ast::Month::kNovember;
    case Rule::kDecember: return ast::Month::kDecember;
    default: return std::unexpected(unexpectedShape(node));
  }
}

Result<ast::RelativeSpecifier> AstBuilder::buildRelativeSpecifier(const ParseNode& node) {
  const auto* specifier = onlyChild(node);
  if (node.rule() != Rule::kRelativeSpecifier || specifier == nullptr) {
    return std::unexpected(unexpectedShape(node));
  }
  switch (specifier->rule()) {
    case Rule::kThis: return ast::RelativeSpecifier::kThis;
    case Rule::kNext: return ast::RelativeSpecifier::kNext;
    case Rule::kLast: return ast::RelativeSpecifier::kLast;
    default: return std::unexpected(unexpectedShape(node));
  }
}

}  // namespace hdt::parse
