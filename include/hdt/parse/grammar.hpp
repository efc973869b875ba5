#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "hdt/common.hpp"

namespace hdt::parse {

// Grammar rules. Leaf rules (weekdays, months, units, keywords) carry the
// matched text only; composite rules carry children in input order.
enum class Rule {
  kHumanTime,
  kDateTime,
  kDate,
  kTime,
  kIn,
  kAgo,
  kNow,
  kToday,
  kTomorrow,
  kOvermorrow,
  kYesterday,
  kIsoDate,
  kNum,
  kMonthName,
  kWeekday,
  kRelativeSpecifier,
  kThis,
  kNext,
  kLast,
  kTimeUnit,
  kDuration,
  kQuantifier,
  kSingleUnit,
  kYear,
  kMonth,
  kWeek,
  kDay,
  kHour,
  kMinute,
  kSecond,
  kMonday,
  kTuesday,
  kWednesday,
  kThursday,
  kFriday,
  kSaturday,
  kSunday,
  kJanuary,
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

std::string_view ruleName(Rule rule);

/**
 * @brief One matched rule span. The text view points into the matched input,
 * so a node must not outlive the string it was matched against.
 */
class ParseNode {
 public:
  ParseNode(Rule rule, std::string_view input, std::size_t begin, std::size_t end,
            std::vector<ParseNode> children = {});

  Rule rule() const noexcept { return rule_; }
  std::size_t begin() const noexcept { return begin_; }
  std::size_t end() const noexcept { return end_; }
  std::string_view text() const noexcept { return text_; }
  const std::vector<ParseNode>& children() const noexcept { return children_; }

 private:
  Rule rule_;
  std::size_t begin_;
  std::size_t end_;
  std::string_view text_;
  std::vector<ParseNode> children_;
};

struct GrammarOptions {
  // How many "<duration> ago at ..." levels may nest inside each other
  std::size_t max_nesting_depth = 16;
};

/**
 * @brief Recognizer for the supported time phrasings.
 *
 * Matches the whole input against the HumanTime rule:
 * - "<date> <time>", "<time>, <date>", "<date> at <time>"
 * - "today", "2022-11-07", "13 november 2024", "next week monday", "friday"
 * - "13:25", "13:25:30"
 * - "in 3 days", "in 5 minutes and 30 seconds"
 * - "2 hours, 32 minutes and 7 seconds ago", "a day ago at 12:00"
 * - "now"
 *
 * Keywords and names match case-insensitively. Leading and trailing
 * whitespace is ignored. No range or calendar validation is done here.
 */
class Grammar {
 public:
  /**
   * @brief Match the complete input
   * @return HumanTime root node, or kInvalidFormat when the input is not a
   *         supported phrasing
   */
  static Result<ParseNode> match(std::string_view input, const GrammarOptions& options = {});
};

// Render a parse tree, one rule per line, for diagnostics
std::string dumpTree(const ParseNode& node);

}  // namespace hdt::parse
