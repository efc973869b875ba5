#pragma once

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "hdt/human_time.hpp"
#include "hdt/resolve/calendar.hpp"

namespace hdt::test {

// Test fixture base class for tests that need temporary directories
class TempDirTest : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  std::filesystem::path temp_dir_;
};

// Build calendar values; the arguments must name an existing date/time
Date makeDate(std::int64_t year, unsigned month, unsigned day);
TimeOfDay makeTime(unsigned hour, unsigned minute, unsigned second = 0);
DateTime makeDateTime(std::int64_t year, unsigned month, unsigned day, unsigned hour = 0,
                      unsigned minute = 0, unsigned second = 0);

// Resolve and render: the ISO text of the result, or "error: <message>"
std::string resolveToString(std::string_view text, DateTime now);

// Generate random string for testing
std::string randomString(size_t length);

// Assertion helpers
#define EXPECT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define ASSERT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    ASSERT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define EXPECT_ERROR(result, expected_code)                                                        \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_FALSE(r.has_value()) << "Expected error but got success";                              \
    if (!r.has_value()) {                                                                          \
      EXPECT_EQ(r.error().code(), expected_code);                                                  \
    }                                                                                              \
  } while (0)

}  // namespace hdt::test
