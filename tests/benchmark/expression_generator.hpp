#pragma once

#include <cstddef>
#include <random>
#include <string>
#include <vector>

namespace hdt::test {

// Synthetic expression generator for performance testing
class ExpressionGenerator {
 public:
  struct Config {
    std::size_t expression_count = 1000;
    std::size_t max_quantifiers = 4;     // per duration
    std::size_t max_nesting = 3;         // "ago at ... ago at ..."
    double anchor_probability = 0.3;     // chance an "ago" gets an anchor
    unsigned seed = 42;
  };

  ExpressionGenerator();
  explicit ExpressionGenerator(Config config);

  // Generate a mixed corpus of supported expressions
  std::vector<std::string> generateCorpus();

  // Generate one expression of any supported shape
  std::string generateExpression(std::size_t depth = 0);

  // Generate "<n> <unit>, <n> <unit> and <n> <unit>"
  std::string generateDuration();

  std::string generateDate();
  std::string generateTime();

 private:
  Config config_;
  std::mt19937 rng_;

  std::size_t pick(std::size_t count);
  unsigned number(unsigned low, unsigned high);
};

}  // namespace hdt::test
