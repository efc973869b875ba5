#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "hdt/parse/grammar.hpp"
#include "common/test_helpers.hpp"

using namespace hdt;
using namespace hdt::parse;

namespace {

// Rules of the direct children, for compact shape checks
std::vector<Rule> childRules(const ParseNode& node) {
  std::vector<Rule> rules;
  for (const auto& child : node.children()) {
    rules.push_back(child.rule());
  }
  return rules;
}

// The single child of the HumanTime root
const ParseNode& body(const ParseNode& root) {
  return root.children().front();
}

}  // namespace

class GrammarTest : public ::testing::Test {
 protected:
  void SetUp() override {}
  void TearDown() override {}
};

TEST_F(GrammarTest, MatchNow) {
  auto result = Grammar::match("now");
  ASSERT_OK(result);

  EXPECT_EQ(result->rule(), Rule::kHumanTime);
  ASSERT_EQ(result->children().size(), 1u);
  EXPECT_EQ(body(*result).rule(), Rule::kNow);
}

TEST_F(GrammarTest, MatchNamedDays) {
  const std::vector<std::pair<std::string, Rule>> cases = {
      {"today", Rule::kToday},
      {"tomorrow", Rule::kTomorrow},
      {"overmorrow", Rule::kOvermorrow},
      {"yesterday", Rule::kYesterday},
  };

  for (const auto& [input, rule] : cases) {
    auto result = Grammar::match(input);
    ASSERT_OK(result);

    const auto& date = body(*result);
    EXPECT_EQ(date.rule(), Rule::kDate) << input;
    EXPECT_EQ(childRules(date), std::vector<Rule>{rule}) << input;
  }
}

TEST_F(GrammarTest, MatchIsoDate) {
  auto result = Grammar::match("2022-11-07");
  ASSERT_OK(result);

  const auto& date = body(*result);
  ASSERT_EQ(date.rule(), Rule::kDate);
  const auto& iso = date.children().front();
  EXPECT_EQ(iso.rule(), Rule::kIsoDate);
  ASSERT_EQ(iso.children().size(), 3u);
  EXPECT_EQ(iso.children()[0].text(), "2022");
  EXPECT_EQ(iso.children()[1].text(), "11");
  EXPECT_EQ(iso.children()[2].text(), "07");
}

TEST_F(GrammarTest, IsoDateRequiresFixedWidthFields) {
  EXPECT_ERROR(Grammar::match("2022-1-07"), ErrorCode::kInvalidFormat);
  EXPECT_ERROR(Grammar::match("22-11-07"), ErrorCode::kInvalidFormat);
  EXPECT_ERROR(Grammar::match("2022-11-007"), ErrorCode::kInvalidFormat);
}

TEST_F(GrammarTest, MatchDayMonthAndDayMonthYear) {
  auto day_month = Grammar::match("13 November");
  ASSERT_OK(day_month);
  EXPECT_EQ(childRules(body(*day_month)),
            (std::vector<Rule>{Rule::kNum, Rule::kMonthName}));

  auto day_month_year = Grammar::match("13 november 2024");
  ASSERT_OK(day_month_year);
  EXPECT_EQ(childRules(body(*day_month_year)),
            (std::vector<Rule>{Rule::kNum, Rule::kMonthName, Rule::kNum}));
}

TEST_F(GrammarTest, DayMonthFollowedByTimeIsDateTime) {
  auto result = Grammar::match("13 november 17:00");
  ASSERT_OK(result);

  const auto& date_time = body(*result);
  ASSERT_EQ(date_time.rule(), Rule::kDateTime);
  ASSERT_EQ(childRules(date_time), (std::vector<Rule>{Rule::kDate, Rule::kTime}));
  EXPECT_EQ(childRules(date_time.children()[0]),
            (std::vector<Rule>{Rule::kNum, Rule::kMonthName}));
  EXPECT_EQ(date_time.children()[1].text(), "17:00");
}

TEST_F(GrammarTest, MatchTimes) {
  auto hour_minute = Grammar::match("18:30");
  ASSERT_OK(hour_minute);
  EXPECT_EQ(body(*hour_minute).rule(), Rule::kTime);
  EXPECT_EQ(body(*hour_minute).children().size(), 2u);

  auto with_seconds = Grammar::match("13:25:30");
  ASSERT_OK(with_seconds);
  EXPECT_EQ(body(*with_seconds).children().size(), 3u);

  // Out-of-range values are a resolution concern, not a grammar one
  EXPECT_OK(Grammar::match("25:61"));
}

TEST_F(GrammarTest, MatchDateTimeSeparators) {
  for (const auto* input : {"2022-11-07 13:25:30", "today at 12:00", "tomorrow, 9:15",
                            "12:00 today", "19:45, last friday"}) {
    auto result = Grammar::match(input);
    ASSERT_OK(result);
    EXPECT_EQ(body(*result).rule(), Rule::kDateTime) << input;
  }

  auto time_first = Grammar::match("12:00 today");
  ASSERT_OK(time_first);
  EXPECT_EQ(childRules(body(*time_first)), (std::vector<Rule>{Rule::kTime, Rule::kDate}));
}

TEST_F(GrammarTest, MatchRelativeDates) {
  auto week_weekday = Grammar::match("next week monday");
  ASSERT_OK(week_weekday);
  EXPECT_EQ(childRules(body(*week_weekday)),
            (std::vector<Rule>{Rule::kRelativeSpecifier, Rule::kWeek, Rule::kWeekday}));

  auto time_unit = Grammar::match("last month");
  ASSERT_OK(time_unit);
  EXPECT_EQ(childRules(body(*time_unit)),
            (std::vector<Rule>{Rule::kRelativeSpecifier, Rule::kTimeUnit}));

  auto this_week = Grammar::match("this week");
  ASSERT_OK(this_week);
  EXPECT_EQ(childRules(body(*this_week)),
            (std::vector<Rule>{Rule::kRelativeSpecifier, Rule::kTimeUnit}));

  auto weekday = Grammar::match("this friday");
  ASSERT_OK(weekday);
  EXPECT_EQ(childRules(body(*weekday)),
            (std::vector<Rule>{Rule::kRelativeSpecifier, Rule::kWeekday}));

  auto upcoming = Grammar::match("sunday");
  ASSERT_OK(upcoming);
  EXPECT_EQ(childRules(body(*upcoming)), std::vector<Rule>{Rule::kWeekday});
}

TEST_F(GrammarTest, RelativeTimeUnitOnlyAcceptsCalendarUnits) {
  EXPECT_ERROR(Grammar::match("next hour"), ErrorCode::kInvalidFormat);
  EXPECT_ERROR(Grammar::match("last minute"), ErrorCode::kInvalidFormat);
  EXPECT_ERROR(Grammar::match("next weeks"), ErrorCode::kInvalidFormat);
}

TEST_F(GrammarTest, MatchInDuration) {
  auto result = Grammar::match("in 5 minutes and 30 seconds");
  ASSERT_OK(result);

  const auto& in = body(*result);
  ASSERT_EQ(in.rule(), Rule::kIn);
  const auto& duration = in.children().front();
  ASSERT_EQ(duration.rule(), Rule::kDuration);
  ASSERT_EQ(childRules(duration), (std::vector<Rule>{Rule::kQuantifier, Rule::kQuantifier}));
  EXPECT_EQ(duration.children()[0].text(), "5 minutes");
  EXPECT_EQ(duration.children()[1].text(), "30 seconds");
}

TEST_F(GrammarTest, DurationSeparators) {
  auto result = Grammar::match("1 year, 1 month, 1 week, 1 day, 1 hour, 1 minute and 1 second ago");
  ASSERT_OK(result);
  EXPECT_EQ(body(*result).children().front().children().size(), 7u);

  auto oxford = Grammar::match("in 2 days, and 3 hours");
  ASSERT_OK(oxford);
  EXPECT_EQ(body(*oxford).children().front().children().size(), 2u);

  // Quantifiers need a separator between them
  EXPECT_ERROR(Grammar::match("in 5 minutes 30 seconds"), ErrorCode::kInvalidFormat);
}

TEST_F(GrammarTest, MatchSingleUnitDurations) {
  for (const auto* input : {"a day ago", "an hour ago", "in a week"}) {
    auto result = Grammar::match(input);
    ASSERT_OK(result);
  }

  auto result = Grammar::match("an hour ago");
  ASSERT_OK(result);
  const auto& duration = body(*result).children().front();
  EXPECT_EQ(childRules(duration), std::vector<Rule>{Rule::kSingleUnit});
}

TEST_F(GrammarTest, MatchAgoWithAnchor) {
  auto result = Grammar::match("12 hours ago at 7 days ago");
  ASSERT_OK(result);

  const auto& ago = body(*result);
  ASSERT_EQ(ago.rule(), Rule::kAgo);
  ASSERT_EQ(childRules(ago), (std::vector<Rule>{Rule::kDuration, Rule::kHumanTime}));

  const auto& anchor = ago.children()[1];
  EXPECT_EQ(anchor.text(), "7 days ago");
  EXPECT_EQ(body(anchor).rule(), Rule::kAgo);
  EXPECT_EQ(body(anchor).children().size(), 1u);
}

TEST_F(GrammarTest, CaseInsensitiveKeywords) {
  EXPECT_OK(Grammar::match("NEXT Friday"));
  EXPECT_OK(Grammar::match("In 3 DAYS"));
  EXPECT_OK(Grammar::match("1 December 2020"));
}

TEST_F(GrammarTest, SurroundingWhitespaceIsIgnored) {
  auto result = Grammar::match("  today \n");
  ASSERT_OK(result);
  EXPECT_EQ(result->text(), "today");
  EXPECT_EQ(result->begin(), 2u);
  EXPECT_EQ(result->end(), 7u);
}

TEST_F(GrammarTest, RejectUnsupportedInput) {
  for (const auto* input : {"", "   ", "next", "tomorow", "13 nov", "fridays", "today today",
                            "in", "5 days", "13:25:", "every monday", "now please"}) {
    EXPECT_ERROR(Grammar::match(input), ErrorCode::kInvalidFormat);
  }
}

TEST_F(GrammarTest, NestingDepthIsBounded) {
  GrammarOptions options;
  options.max_nesting_depth = 1;

  EXPECT_OK(Grammar::match("1 day ago at 2 days ago", options));
  EXPECT_ERROR(Grammar::match("1 day ago at 2 days ago at 3 days ago", options),
               ErrorCode::kInvalidFormat);

  options.max_nesting_depth = 0;
  EXPECT_OK(Grammar::match("1 day ago", options));
  EXPECT_ERROR(Grammar::match("1 day ago at 12:00", options), ErrorCode::kInvalidFormat);
}

TEST_F(GrammarTest, DumpTree) {
  auto today = Grammar::match("today");
  ASSERT_OK(today);
  EXPECT_EQ(dumpTree(*today), "HumanTime > Date > Today: \"today\"");

  auto time = Grammar::match("10:30");
  ASSERT_OK(time);
  EXPECT_EQ(dumpTree(*time), "HumanTime > Time\n  - Num: \"10\"\n  - Num: \"30\"");
}

TEST_F(GrammarTest, RuleNames) {
  EXPECT_EQ(ruleName(Rule::kHumanTime), "HumanTime");
  EXPECT_EQ(ruleName(Rule::kRelativeSpecifier), "RelativeSpecifier");
  EXPECT_EQ(ruleName(Rule::kDecember), "December");
}
