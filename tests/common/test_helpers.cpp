#include "test_helpers.hpp"

#include <random>
#include <stdexcept>

namespace hdt::test {

void TempDirTest::SetUp() {
  temp_dir_ = std::filesystem::temp_directory_path() / "hdt_test";
  temp_dir_ /= randomString(8);
  std::filesystem::create_directories(temp_dir_);
}

void TempDirTest::TearDown() {
  if (std::filesystem::exists(temp_dir_)) {
    std::filesystem::remove_all(temp_dir_);
  }
}

Date makeDate(std::int64_t year, unsigned month, unsigned day) {
  auto date = calendar::makeDate(year, month, day);
  if (!date) {
    throw std::invalid_argument("test date does not exist");
  }
  return *date;
}

TimeOfDay makeTime(unsigned hour, unsigned minute, unsigned second) {
  auto time = calendar::makeTime(hour, minute, second);
  if (!time) {
    throw std::invalid_argument("test time is out of range");
  }
  return *time;
}

DateTime makeDateTime(std::int64_t year, unsigned month, unsigned day, unsigned hour,
                      unsigned minute, unsigned second) {
  return calendar::combine(makeDate(year, month, day), makeTime(hour, minute, second));
}

std::string resolveToString(std::string_view text, DateTime now) {
  auto result = fromHumanTime(text, now);
  if (!result.has_value()) {
    return "error: " + result.error().message();
  }
  return result->toString();
}

std::string randomString(size_t length) {
  static const char charset[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, sizeof(charset) - 2);

  std::string result;
  result.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    result += charset[dis(gen)];
  }
  return result;
}

}  // namespace hdt::test
