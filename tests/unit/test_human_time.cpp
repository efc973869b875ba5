#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "hdt/human_time.hpp"
#include "hdt/parse/ast.hpp"
#include "common/test_helpers.hpp"

using namespace hdt;
using namespace hdt::test;

class HumanTimeTest : public ::testing::Test {
 protected:
  // 2010-01-01 is a Friday
  DateTime now_ = makeDateTime(2010, 1, 1);
};

TEST_F(HumanTimeTest, FixedReferenceTable) {
  const std::vector<std::pair<std::string, std::string>> cases = {
      {"last friday", "2009-12-25"},
      {"next friday", "2010-01-08"},
      {"this friday", "2010-01-01"},
      {"friday", "2010-01-08"},
      {"next week monday", "2010-01-04"},
      {"in 5 minutes and 30 seconds", "2010-01-01T00:05:30"},
      // Units apply in input order: 2009-01-01, 2008-12-01, 2008-11-24, 2008-11-23, then
      // 1:01:01 back crosses midnight into the 22nd
      {"1 year, 1 month, 1 week, 1 day, 1 hour, 1 minute and 1 second ago",
       "2008-11-22T22:58:59"},
      {"12 hours ago at 7 days ago", "2009-12-24T12:00:00"},
      {"today", "2010-01-01"},
      {"tomorrow", "2010-01-02"},
      {"overmorrow", "2010-01-03"},
      {"yesterday", "2009-12-31"},
      {"13 november", "2010-11-13"},
      {"13 November 2024 17:00", "2024-11-13T17:00:00"},
      {"18:30", "18:30:00"},
      {"tomorrow at 9:15", "2010-01-02T09:15:00"},
      {"19:45, last friday", "2009-12-25T19:45:00"},
      {"next month", "2010-02-01"},
      {"last year", "2009-01-01"},
      {"in a week", "2010-01-08T00:00:00"},
      {"an hour ago", "2009-12-31T23:00:00"},
      {"3 days ago at 14:00", "2009-12-29T14:00:00"},
      {"2 days ago at yesterday", "2009-12-29T00:00:00"},
  };

  for (const auto& [input, expected] : cases) {
    EXPECT_EQ(resolveToString(input, now_), expected) << input;
  }
}

TEST_F(HumanTimeTest, NowReturnsReferenceInstant) {
  const std::vector<DateTime> instants = {now_, makeDateTime(2022, 11, 7, 13, 25, 30),
                                          makeDateTime(1970, 1, 1)};
  for (const auto instant : instants) {
    auto result = fromHumanTime("now", instant);
    ASSERT_OK(result);
    ASSERT_TRUE(result->isDateTime());
    EXPECT_EQ(result->dateTime(), instant);
  }
}

TEST_F(HumanTimeTest, IsoDateTimeIgnoresReference) {
  for (const auto instant : {now_, makeDateTime(1999, 5, 5, 5, 5, 5)}) {
    auto result = fromHumanTime("2022-11-07 13:25:30", instant);
    ASSERT_OK(result);
    EXPECT_EQ(result->dateTime(), makeDateTime(2022, 11, 7, 13, 25, 30));
  }
}

TEST_F(HumanTimeTest, InvalidDateIsProcessingError) {
  auto result = fromHumanTime("2023-11-31", now_);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kProcessingError);
  ASSERT_EQ(result.error().processingErrors().size(), 1u);
  EXPECT_EQ(result.error().processingErrors()[0].kind(), ProcessingError::Kind::kInvalidDate);
  EXPECT_EQ(result.error().message(),
            "Failed to process input: Invalid date: year 2023, month 11, day 31");
}

TEST_F(HumanTimeTest, DateTimeReportsEveryProblem) {
  auto result = fromHumanTime("2023-02-30 24:00", now_);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kProcessingError);
  EXPECT_EQ(result.error().processingErrors().size(), 2u);
}

TEST_F(HumanTimeTest, MonthOverflowIsProcessingError) {
  auto result = fromHumanTime("in 1 month", makeDateTime(2010, 1, 31));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kProcessingError);
  EXPECT_NE(result.error().message().find("Cannot add 1 Month to 2010-01-31T00:00:00"),
            std::string::npos);
}

TEST_F(HumanTimeTest, HugeDayCountIsProcessingError) {
  auto result = fromHumanTime("in 4294967295 days", now_);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kProcessingError);
  ASSERT_EQ(result.error().processingErrors().size(), 1u);
  EXPECT_EQ(result.error().processingErrors()[0].kind(), ProcessingError::Kind::kAddToDate);

  EXPECT_ERROR(fromHumanTime("20000000 days ago", now_), ErrorCode::kProcessingError);
  EXPECT_ERROR(fromHumanTime("4294967295 hours ago", now_), ErrorCode::kProcessingError);
}

TEST_F(HumanTimeTest, AnchorFailureNamesCause) {
  auto result = fromHumanTime("1 day ago at 31 february", now_);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kProcessingError);
  ASSERT_EQ(result.error().processingErrors().size(), 1u);
  EXPECT_EQ(result.error().processingErrors()[0].kind(),
            ProcessingError::Kind::kAnchorResolution);
  EXPECT_NE(result.error().message().find("Invalid date: year 2010, month 2, day 31"),
            std::string::npos);
}

TEST_F(HumanTimeTest, UnsupportedTextIsFormatError) {
  for (const auto* input : {"", "next hour", "the day after tomorrow", "in 5 minutes 30 seconds"}) {
    auto result = fromHumanTime(input, now_);
    ASSERT_FALSE(result.has_value()) << input;
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidFormat);
    EXPECT_TRUE(result.error().processingErrors().empty());
  }
}

TEST_F(HumanTimeTest, OversizedNumberIsInternalError) {
  auto result = fromHumanTime("in 4294967296 seconds", now_);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kInternalError);
}

TEST_F(HumanTimeTest, NestingLimitFromOptions) {
  ParseOptions options;
  options.max_nesting_depth = 0;

  EXPECT_ERROR(fromHumanTime("1 day ago at 12:00", now_, options), ErrorCode::kInvalidFormat);
  EXPECT_OK(fromHumanTime("1 day ago at 12:00", now_));
}

TEST_F(HumanTimeTest, BuildAstWithoutResolving) {
  auto result = buildAst("7 days ago at 4:00");
  ASSERT_OK(result);
  EXPECT_EQ(ast::describe(*result),
            "HumanTime(Ago(Duration[7 Day], HumanTime(Time(HourMinute(4, 0)))))");

  // Semantically invalid input still parses
  EXPECT_OK(buildAst("2023-11-31"));
  EXPECT_ERROR(buildAst("someday"), ErrorCode::kInvalidFormat);
}

TEST_F(HumanTimeTest, ResultKindsAndFormatting) {
  auto date_time = fromHumanTime("now", now_);
  auto date = fromHumanTime("today", now_);
  auto time = fromHumanTime("7:05:09", now_);
  ASSERT_OK(date_time);
  ASSERT_OK(date);
  ASSERT_OK(time);

  EXPECT_EQ(date_time->kind(), ParseResult::Kind::kDateTime);
  EXPECT_EQ(date->kind(), ParseResult::Kind::kDate);
  EXPECT_EQ(time->kind(), ParseResult::Kind::kTime);

  EXPECT_EQ(toString(date_time->kind()), "datetime");
  EXPECT_EQ(toString(date->kind()), "date");
  EXPECT_EQ(toString(time->kind()), "time");

  EXPECT_EQ(date_time->toString(), "2010-01-01T00:00:00");
  EXPECT_EQ(date->toString(), "2010-01-01");
  EXPECT_EQ(time->toString(), "07:05:09");

  EXPECT_EQ(date->date(), makeDate(2010, 1, 1));
  EXPECT_EQ(time->time(), makeTime(7, 5, 9));
  EXPECT_THROW(date->time(), std::bad_variant_access);
}

TEST_F(HumanTimeTest, RepeatedCallsAgree) {
  for (const auto* input : {"last monday", "3 months ago at next week sunday", "in 2 days"}) {
    auto first = fromHumanTime(input, now_);
    auto second = fromHumanTime(input, now_);
    ASSERT_OK(first);
    ASSERT_OK(second);
    EXPECT_EQ(*first, *second) << input;
  }
}
