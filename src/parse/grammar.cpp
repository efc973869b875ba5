#include "hdt/parse/grammar.hpp"

#include <array>
#include <cctype>
#include <optional>
#include <span>
#include <sstream>

#include <spdlog/spdlog.h>

namespace hdt::parse {

namespace {

struct Keyword {
  std::string_view text;
  Rule rule;
};

constexpr std::array<Keyword, 7> kWeekdays = {{
    {"monday", Rule::kMonday},
    {"tuesday", Rule::kTuesday},
    {"wednesday", Rule::kWednesday},
    {"thursday", Rule::kThursday},
    {"friday", Rule::kFriday},
    {"saturday", Rule::kSaturday},
    {"sunday", Rule::kSunday},
}};

constexpr std::array<Keyword, 12> kMonths = {{
    {"january", Rule::kJanuary},
    {"february", Rule::kFebruary},
    {"march", Rule::kMarch},
    {"april", Rule::kApril},
    {"may", Rule::kMay},
    {"june", Rule::kJune},
    {"july", Rule::kJuly},
    {"august", Rule::kAugust},
    {"september", Rule::kSeptember},
    {"october", Rule::kOctober},
    {"november", Rule::kNovember},
    {"december", Rule::kDecember},
}};

constexpr std::array<Keyword, 7> kTimeUnits = {{
    {"year", Rule::kYear},
    {"month", Rule::kMonth},
    {"week", Rule::kWeek},
    {"day", Rule::kDay},
    {"hour", Rule::kHour},
    {"minute", Rule::kMinute},
    {"second", Rule::kSecond},
}};

// Units allowed after this/next/last
constexpr std::array<Keyword, 4> kDateUnits = {{
    {"year", Rule::kYear},
    {"month", Rule::kMonth},
    {"week", Rule::kWeek},
    {"day", Rule::kDay},
}};

constexpr std::array<Keyword, 4> kNamedDays = {{
    {"today", Rule::kToday},
    {"tomorrow", Rule::kTomorrow},
    {"overmorrow", Rule::kOvermorrow},
    {"yesterday", Rule::kYesterday},
}};

constexpr std::array<Keyword, 3> kSpecifiers = {{
    {"this", Rule::kThis},
    {"next", Rule::kNext},
    {"last", Rule::kLast},
}};

bool isSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool isDigit(char c) {
  return c >= '0' && c <= '9';
}

char toLower(char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

// Recursive descent matcher. Every rule either consumes input and returns a
// node, or leaves the position untouched and returns nothing.
class Matcher {
 public:
  Matcher(std::string_view input, const GrammarOptions& options)
      : input_(input), options_(options) {}

  std::optional<ParseNode> humanTime();

 private:
  using Alternative = std::optional<ParseNode> (Matcher::*)();
  using DateAlternative = std::optional<std::vector<ParseNode>> (Matcher::*)();

  // Terminals
  bool atEnd() const { return pos_ >= input_.size(); }
  bool peek(char c) const { return !atEnd() && input_[pos_] == c; }
  void skipSpace();
  bool spaces();
  bool literal(std::string_view word);
  std::optional<ParseNode> keyword(Rule rule, std::string_view word);
  std::optional<ParseNode> num(std::size_t min_digits = 1, std::size_t max_digits = 0);
  std::optional<ParseNode> oneOf(Rule parent, std::span<const Keyword> keywords,
                                 bool allow_plural = false);

  // HumanTime alternatives
  std::optional<ParseNode> dateTime();
  std::optional<ParseNode> date();
  std::optional<ParseNode> time();
  std::optional<ParseNode> in();
  std::optional<ParseNode> ago();
  std::optional<ParseNode> now();

  bool dateTimeSeparator();

  // Date alternatives
  std::optional<std::vector<ParseNode>> namedDay();
  std::optional<std::vector<ParseNode>> isoDate();
  std::optional<std::vector<ParseNode>> dayMonthYear();
  std::optional<std::vector<ParseNode>> dayMonth();
  std::optional<std::vector<ParseNode>> relativeWeekWeekday();
  std::optional<std::vector<ParseNode>> relativeTimeUnit();
  std::optional<std::vector<ParseNode>> relativeWeekday();
  std::optional<std::vector<ParseNode>> upcomingWeekday();

  std::optional<ParseNode> weekday() { return oneOf(Rule::kWeekday, kWeekdays); }
  std::optional<ParseNode> monthName() { return oneOf(Rule::kMonthName, kMonths); }
  std::optional<ParseNode> relativeSpecifier() {
    return oneOf(Rule::kRelativeSpecifier, kSpecifiers);
  }

  // Durations
  std::optional<ParseNode> duration();
  std::optional<ParseNode> quantifier();
  std::optional<ParseNode> singleUnit();
  bool durationSeparator();

  ParseNode node(Rule rule, std::size_t begin, std::vector<ParseNode> children = {}) const {
    return ParseNode(rule, input_, begin, pos_, std::move(children));
  }

  std::string_view input_;
  const GrammarOptions& options_;
  std::size_t pos_ = 0;
  std::size_t depth_ = 0;
};

void Matcher::skipSpace() {
  while (!atEnd() && isSpace(input_[pos_])) {
    ++pos_;
  }
}

bool Matcher::spaces() {
  const auto start = pos_;
  skipSpace();
  return pos_ > start;
}

bool Matcher::literal(std::string_view word) {
  if (input_.size() - pos_ < word.size()) {
    return false;
  }
  for (std::size_t i = 0; i < word.size(); ++i) {
    if (toLower(input_[pos_ + i]) != word[i]) {
      return false;
    }
  }
  pos_ += word.size();
  return true;
}

std::optional<ParseNode> Matcher::keyword(Rule rule, std::string_view word) {
  const auto start = pos_;
  if (!literal(word)) {
    return std::nullopt;
  }
  return node(rule, start);
}

std::optional<ParseNode> Matcher::num(std::size_t min_digits, std::size_t max_digits) {
  const auto start = pos_;
  while (!atEnd() && isDigit(input_[pos_])) {
    ++pos_;
  }
  const auto digits = pos_ - start;
  if (digits == 0 || digits < min_digits || (max_digits != 0 && digits > max_digits)) {
    pos_ = start;
    return std::nullopt;
  }
  return node(Rule::kNum, start);
}

std::optional<ParseNode> Matcher::oneOf(Rule parent, std::span<const Keyword> keywords,
                                        bool allow_plural) {
  const auto start = pos_;
  for (const auto& kw : keywords) {
    if (literal(kw.text)) {
      if (allow_plural && (peek('s') || peek('S'))) {
        ++pos_;
      }
      std::vector<ParseNode> children;
      children.push_back(node(kw.rule, start));
      return node(parent, start, std::move(children));
    }
  }
  return std::nullopt;
}

std::optional<ParseNode> Matcher::humanTime() {
  const auto start = pos_;
  skipSpace();
  const auto body_start = pos_;

  const Alternative alternatives[] = {
      &Matcher::dateTime, &Matcher::date, &Matcher::time,
      &Matcher::in,       &Matcher::ago,  &Matcher::now,
  };

  // A HumanTime always runs to the end of the input, so an alternative only
  // wins when nothing but whitespace follows it.
  for (auto alternative : alternatives) {
    pos_ = body_start;
    auto matched = (this->*alternative)();
    if (!matched) {
      continue;
    }
    const auto body_end = pos_;
    skipSpace();
    if (atEnd()) {
      std::vector<ParseNode> children;
      children.push_back(std::move(*matched));
      return ParseNode(Rule::kHumanTime, input_, body_start, body_end, std::move(children));
    }
  }

  pos_ = start;
  return std::nullopt;
}

std::optional<ParseNode> Matcher::dateTime() {
  const auto start = pos_;

  if (auto d = date()) {
    if (dateTimeSeparator()) {
      if (auto t = time()) {
        std::vector<ParseNode> children;
        children.push_back(std::move(*d));
        children.push_back(std::move(*t));
        return node(Rule::kDateTime, start, std::move(children));
      }
    }
  }

  pos_ = start;
  if (auto t = time()) {
    if (dateTimeSeparator()) {
      if (auto d = date()) {
        std::vector<ParseNode> children;
        children.push_back(std::move(*t));
        children.push_back(std::move(*d));
        return node(Rule::kDateTime, start, std::move(children));
      }
    }
  }

  pos_ = start;
  return std::nullopt;
}

bool Matcher::dateTimeSeparator() {
  const auto start = pos_;

  skipSpace();
  if (peek(',')) {
    ++pos_;
    skipSpace();
    return true;
  }

  pos_ = start;
  if (spaces() && literal("at") && spaces()) {
    return true;
  }

  pos_ = start;
  return spaces();
}

std::optional<ParseNode> Matcher::date() {
  const auto start = pos_;

  const DateAlternative alternatives[] = {
      &Matcher::namedDay,          &Matcher::isoDate,          &Matcher::dayMonthYear,
      &Matcher::dayMonth,          &Matcher::relativeWeekWeekday, &Matcher::relativeTimeUnit,
      &Matcher::relativeWeekday,   &Matcher::upcomingWeekday,
  };

  for (auto alternative : alternatives) {
    pos_ = start;
    if (auto children = (this->*alternative)()) {
      return node(Rule::kDate, start, std::move(*children));
    }
  }

  pos_ = start;
  return std::nullopt;
}

std::optional<std::vector<ParseNode>> Matcher::namedDay() {
  for (const auto& kw : kNamedDays) {
    if (auto matched = keyword(kw.rule, kw.text)) {
      std::vector<ParseNode> children;
      children.push_back(std::move(*matched));
      return children;
    }
  }
  return std::nullopt;
}

std::optional<std::vector<ParseNode>> Matcher::isoDate() {
  const auto start = pos_;

  auto year = num(4, 4);
  if (!year || !literal("-")) {
    pos_ = start;
    return std::nullopt;
  }
  auto month = num(2, 2);
  if (!month || !literal("-")) {
    pos_ = start;
    return std::nullopt;
  }
  auto day = num(2, 2);
  if (!day) {
    pos_ = start;
    return std::nullopt;
  }

  std::vector<ParseNode> parts;
  parts.push_back(std::move(*year));
  parts.push_back(std::move(*month));
  parts.push_back(std::move(*day));

  std::vector<ParseNode> children;
  children.push_back(node(Rule::kIsoDate, start, std::move(parts)));
  return children;
}

std::optional<std::vector<ParseNode>> Matcher::dayMonthYear() {
  const auto start = pos_;

  auto day = num();
  if (!day || !spaces()) {
    pos_ = start;
    return std::nullopt;
  }
  auto month = monthName();
  if (!month || !spaces()) {
    pos_ = start;
    return std::nullopt;
  }
  auto year = num();
  // "13 november 17:00" is a day-month followed by a time
  if (!year || peek(':')) {
    pos_ = start;
    return std::nullopt;
  }

  std::vector<ParseNode> children;
  children.push_back(std::move(*day));
  children.push_back(std::move(*month));
  children.push_back(std::move(*year));
  return children;
}

std::optional<std::vector<ParseNode>> Matcher::dayMonth() {
  const auto start = pos_;

  auto day = num();
  if (!day || !spaces()) {
    pos_ = start;
    return std::nullopt;
  }
  auto month = monthName();
  if (!month) {
    pos_ = start;
    return std::nullopt;
  }

  std::vector<ParseNode> children;
  children.push_back(std::move(*day));
  children.push_back(std::move(*month));
  return children;
}

std::optional<std::vector<ParseNode>> Matcher::relativeWeekWeekday() {
  const auto start = pos_;

  auto specifier = relativeSpecifier();
  if (!specifier || !spaces()) {
    pos_ = start;
    return std::nullopt;
  }
  auto week = keyword(Rule::kWeek, "week");
  if (!week || !spaces()) {
    pos_ = start;
    return std::nullopt;
  }
  auto day = weekday();
  if (!day) {
    pos_ = start;
    return std::nullopt;
  }

  std::vector<ParseNode> children;
  children.push_back(std::move(*specifier));
  children.push_back(std::move(*week));
  children.push_back(std::move(*day));
  return children;
}

std::optional<std::vector<ParseNode>> Matcher::relativeTimeUnit() {
  const auto start = pos_;

  auto specifier = relativeSpecifier();
  if (!specifier || !spaces()) {
    pos_ = start;
    return std::nullopt;
  }
  auto unit = oneOf(Rule::kTimeUnit, kDateUnits);
  if (!unit) {
    pos_ = start;
    return std::nullopt;
  }

  std::vector<ParseNode> children;
  children.push_back(std::move(*specifier));
  children.push_back(std::move(*unit));
  return children;
}

std::optional<std::vector<ParseNode>> Matcher::relativeWeekday() {
  const auto start = pos_;

  auto specifier = relativeSpecifier();
  if (!specifier || !spaces()) {
    pos_ = start;
    return std::nullopt;
  }
  auto day = weekday();
  if (!day) {
    pos_ = start;
    return std::nullopt;
  }

  std::vector<ParseNode> children;
  children.push_back(std::move(*specifier));
  children.push_back(std::move(*day));
  return children;
}

std::optional<std::vector<ParseNode>> Matcher::upcomingWeekday() {
  auto day = weekday();
  if (!day) {
    return std::nullopt;
  }
  std::vector<ParseNode> children;
  children.push_back(std::move(*day));
  return children;
}

std::optional<ParseNode> Matcher::time() {
  const auto start = pos_;

  auto hour = num();
  if (!hour || !literal(":")) {
    pos_ = start;
    return std::nullopt;
  }
  auto minute = num();
  if (!minute) {
    pos_ = start;
    return std::nullopt;
  }

  std::vector<ParseNode> children;
  children.push_back(std::move(*hour));
  children.push_back(std::move(*minute));

  const auto before_seconds = pos_;
  if (literal(":")) {
    if (auto second = num()) {
      children.push_back(std::move(*second));
    } else {
      pos_ = before_seconds;
    }
  }

  return node(Rule::kTime, start, std::move(children));
}

std::optional<ParseNode> Matcher::in() {
  const auto start = pos_;

  if (!literal("in") || !spaces()) {
    pos_ = start;
    return std::nullopt;
  }
  auto d = duration();
  if (!d) {
    pos_ = start;
    return std::nullopt;
  }

  std::vector<ParseNode> children;
  children.push_back(std::move(*d));
  return node(Rule::kIn, start, std::move(children));
}

std::optional<ParseNode> Matcher::ago() {
  const auto start = pos_;

  auto d = duration();
  if (!d || !spaces() || !literal("ago")) {
    pos_ = start;
    return std::nullopt;
  }

  std::vector<ParseNode> children;
  children.push_back(std::move(*d));

  const auto after_ago = pos_;
  if (spaces() && literal("at") && spaces()) {
    if (depth_ >= options_.max_nesting_depth) {
      spdlog::debug("Nested 'ago ... at' deeper than {} levels", options_.max_nesting_depth);
      pos_ = start;
      return std::nullopt;
    }
    ++depth_;
    auto anchor = humanTime();
    --depth_;
    if (anchor) {
      children.push_back(std::move(*anchor));
    } else {
      pos_ = after_ago;
    }
  } else {
    pos_ = after_ago;
  }

  return node(Rule::kAgo, start, std::move(children));
}

std::optional<ParseNode> Matcher::now() {
  return keyword(Rule::kNow, "now");
}

std::optional<ParseNode> Matcher::duration() {
  const auto start = pos_;

  if (auto single = singleUnit()) {
    std::vector<ParseNode> children;
    children.push_back(std::move(*single));
    return node(Rule::kDuration, start, std::move(children));
  }

  pos_ = start;
  auto first = quantifier();
  if (!first) {
    pos_ = start;
    return std::nullopt;
  }

  std::vector<ParseNode> quantifiers;
  quantifiers.push_back(std::move(*first));

  while (true) {
    const auto before = pos_;
    if (durationSeparator()) {
      if (auto next = quantifier()) {
        quantifiers.push_back(std::move(*next));
        continue;
      }
    }
    pos_ = before;
    break;
  }

  return node(Rule::kDuration, start, std::move(quantifiers));
}

bool Matcher::durationSeparator() {
  const auto start = pos_;

  skipSpace();
  if (peek(',')) {
    ++pos_;
    skipSpace();
    const auto after_comma = pos_;
    if (!(literal("and") && spaces())) {
      pos_ = after_comma;
    }
    return true;
  }

  pos_ = start;
  if (spaces() && literal("and") && spaces()) {
    return true;
  }

  pos_ = start;
  return false;
}

std::optional<ParseNode> Matcher::quantifier() {
  const auto start = pos_;

  auto count = num();
  if (!count || !spaces()) {
    pos_ = start;
    return std::nullopt;
  }
  auto unit = oneOf(Rule::kTimeUnit, kTimeUnits, true);
  if (!unit) {
    pos_ = start;
    return std::nullopt;
  }

  std::vector<ParseNode> children;
  children.push_back(std::move(*count));
  children.push_back(std::move(*unit));
  return node(Rule::kQuantifier, start, std::move(children));
}

std::optional<ParseNode> Matcher::singleUnit() {
  const auto start = pos_;

  if (!(literal("an") && spaces())) {
    pos_ = start;
    if (!(literal("a") && spaces())) {
      pos_ = start;
      return std::nullopt;
    }
  }
  auto unit = oneOf(Rule::kTimeUnit, kTimeUnits);
  if (!unit) {
    pos_ = start;
    return std::nullopt;
  }

  std::vector<ParseNode> children;
  children.push_back(std::move(*unit));
  return node(Rule::kSingleUnit, start, std::move(children));
}

void dumpNode(std::ostringstream& out, const ParseNode& node, std::size_t indent_level,
              bool is_newline) {
  if (is_newline) {
    out << std::string(indent_level * 2, ' ') << "- ";
  }

  const auto& children = node.children();
  if (children.empty()) {
    out << ruleName(node.rule()) << ": \"" << node.text() << "\"";
    return;
  }
  if (children.size() == 1) {
    out << ruleName(node.rule()) << " > ";
    dumpNode(out, children.front(), indent_level, false);
    return;
  }

  out << ruleName(node.rule());
  for (const auto& child : children) {
    out << "\n";
    dumpNode(out, child, indent_level + 1, true);
  }
}

}  // namespace

std::string_view ruleName(Rule rule) {
  switch (rule) {
    case Rule::kHumanTime: return "HumanTime";
    case Rule::kDateTime: return "DateTime";
    case Rule::kDate: return "Date";
    case Rule::kTime: return "Time";
    case Rule::kIn: return "In";
    case Rule::kAgo: return "Ago";
    case Rule::kNow: return "Now";
    case Rule::kToday: return "Today";
    case Rule::kTomorrow: return "Tomorrow";
    case Rule::kOvermorrow: return "Overmorrow";
    case Rule::kYesterday: return "Yesterday";
    case Rule::kIsoDate: return "IsoDate";
    case Rule::kNum: return "Num";
    case Rule::kMonthName: return "MonthName";
    case Rule::kWeekday: return "Weekday";
    case Rule::kRelativeSpecifier: return "RelativeSpecifier";
    case Rule::kThis: return "This";
    case Rule::kNext: return "Next";
    case Rule::kLast: return "Last";
    case Rule::kTimeUnit: return "TimeUnit";
    case Rule::kDuration: return "Duration";
    case Rule::kQuantifier: return "Quantifier";
    case Rule::kSingleUnit: return "SingleUnit";
    case Rule::kYear: return "Year";
    case Rule::kMonth: return "Month";
    case Rule::kWeek: return "Week";
    case Rule::kDay: return "Day";
    case Rule::kHour: return "Hour";
    case Rule::kMinute: return "Minute";
    case Rule::kSecond: return "Second";
    case Rule::kMonday: return "Monday";
    case Rule::kTuesday: return "Tuesday";
    case Rule::kWednesday: return "Wednesday";
    case Rule::kThursday: return "Thursday";
    case Rule::kFriday: return "Friday";
    case Rule::kSaturday: return "Saturday";
    case Rule::kSunday: return "Sunday";
    case Rule::kJanuary: return "January";
    case Rule::kFebruary: return "February";
    case Rule::kMarch: return "March";
    case Rule::kApril: return "April";
    case Rule::kMay: return "May";
    case Rule::kJune: return "June";
    case Rule::kJuly: return "July";
    case Rule::kAugust: return "August";
    case Rule::kSeptember: return "September";
    case Rule::kOctober: return "October";
    case Rule::kNovember: return "November";
    case Rule::kDecember: return "December";
  }
  return "Unknown";
}

ParseNode::ParseNode(Rule rule, std::string_view input, std::size_t begin, std::size_t end,
                     std::vector<ParseNode> children)
    : rule_(rule),
      begin_(begin),
      end_(end),
      text_(input.substr(begin, end - begin)),
      children_(std::move(children)) {}

Result<ParseNode> Grammar::match(std::string_view input, const GrammarOptions& options) {
  Matcher matcher(input, options);
  auto root = matcher.humanTime();
  if (!root) {
    spdlog::debug("No grammar match for '{}'", input);
    return std::unexpected(makeError(ErrorCode::kInvalidFormat,
                                     "Input does not match any supported time format"));
  }
  spdlog::trace("Matched '{}' as {}", input, ruleName(root->children().front().rule()));
  return std::move(*root);
}

std::string dumpTree(const ParseNode& node) {
  std::ostringstream out;
  dumpNode(out, node, 0, false);
  return out.str();
}

}  // namespace hdt::parse
