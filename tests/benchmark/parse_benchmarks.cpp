#include <benchmark/benchmark.h>

#include <string>
#include <vector>

#include "hdt/human_time.hpp"
#include "hdt/parse/grammar.hpp"
#include "hdt/resolve/resolver.hpp"
#include "expression_generator.hpp"

using namespace hdt;
using namespace hdt::test;

namespace {

DateTime referenceInstant() {
  return calendar::combine(*calendar::makeDate(2010, 1, 1), TimeOfDay{});
}

const std::vector<std::string> kSamples = {
    "now",
    "last friday",
    "13 november 2024 17:00",
    "in 2 hours, 32 minutes and 7 seconds",
    "1 year, 1 month, 1 week, 1 day, 1 hour, 1 minute and 1 second ago",
    "12 hours ago at 7 days ago",
};

}  // namespace

// Benchmark grammar matching alone, per sample expression
static void BM_GrammarMatch(benchmark::State& state) {
  const auto& input = kSamples[static_cast<std::size_t>(state.range(0))];

  for (auto _ : state) {
    auto tree = parse::Grammar::match(input);
    benchmark::DoNotOptimize(tree);
  }
  state.SetLabel(input);
}
BENCHMARK(BM_GrammarMatch)->DenseRange(0, 5);

// Benchmark the full parse and resolve path, per sample expression
static void BM_FromHumanTime(benchmark::State& state) {
  const auto& input = kSamples[static_cast<std::size_t>(state.range(0))];
  const auto now = referenceInstant();

  for (auto _ : state) {
    auto result = fromHumanTime(input, now);
    benchmark::DoNotOptimize(result);
  }
  state.SetLabel(input);
}
BENCHMARK(BM_FromHumanTime)->DenseRange(0, 5);

// Benchmark resolving a prebuilt AST against a moving reference instant
static void BM_ResolvePrebuiltAst(benchmark::State& state) {
  auto human_time = buildAst("3 months ago at next week sunday");
  if (!human_time.has_value()) {
    state.SkipWithError(human_time.error().message().c_str());
    return;
  }

  auto now = referenceInstant();
  for (auto _ : state) {
    resolve::Resolver resolver(now);
    auto result = resolver.resolve(*human_time);
    benchmark::DoNotOptimize(result);
    now += std::chrono::hours{1};
  }
}
BENCHMARK(BM_ResolvePrebuiltAst);

// Benchmark "ago at" chains of increasing depth
static void BM_NestedAgo(benchmark::State& state) {
  std::string input = "1 day ago";
  for (int64_t i = 0; i < state.range(0); ++i) {
    input += " at 1 day ago";
  }

  ParseOptions options;
  options.max_nesting_depth = static_cast<std::size_t>(state.range(0));
  const auto now = referenceInstant();

  for (auto _ : state) {
    auto result = fromHumanTime(input, now, options);
    benchmark::DoNotOptimize(result);
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_NestedAgo)->RangeMultiplier(2)->Range(1, 64)->Complexity();

// Benchmark a mixed generated corpus
static void BM_GeneratedCorpus(benchmark::State& state) {
  ExpressionGenerator generator({.expression_count = static_cast<std::size_t>(state.range(0))});
  const auto corpus = generator.generateCorpus();
  const auto now = referenceInstant();

  std::size_t failures = 0;
  for (auto _ : state) {
    for (const auto& expression : corpus) {
      auto result = fromHumanTime(expression, now);
      if (!result.has_value()) {
        ++failures;
      }
      benchmark::DoNotOptimize(result);
    }
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
  state.counters["failures"] = static_cast<double>(failures);
}
BENCHMARK(BM_GeneratedCorpus)->Arg(100)->Arg(1000);
