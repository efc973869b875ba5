#include "hdt/human_time.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

#include "hdt/parse/ast_builder.hpp"
#include "hdt/parse/grammar.hpp"
#include "hdt/resolve/resolver.hpp"
#include "hdt/util/time.hpp"

namespace hdt {

namespace {

void appendMessage(std::ostringstream& oss, const ProcessingError& error) {
  oss << error.message();
  if (!error.causes().empty()) {
    oss << " (";
    for (std::size_t i = 0; i < error.causes().size(); ++i) {
      if (i > 0) oss << "; ";
      appendMessage(oss, error.causes()[i]);
    }
    oss << ")";
  }
}

}  // namespace

ParseResult::Kind ParseResult::kind() const noexcept {
  if (std::holds_alternative<DateTime>(value_)) {
    return Kind::kDateTime;
  }
  if (std::holds_alternative<Date>(value_)) {
    return Kind::kDate;
  }
  return Kind::kTime;
}

std::string ParseResult::toString() const {
  switch (kind()) {
    case Kind::kDateTime:
      return util::Time::toIso(std::get<DateTime>(value_));
    case Kind::kDate:
      return util::Time::toIso(std::get<Date>(value_));
    case Kind::kTime:
      return util::Time::toIso(std::get<TimeOfDay>(value_));
  }
  return {};
}

std::string_view toString(ParseResult::Kind kind) {
  switch (kind) {
    case ParseResult::Kind::kDateTime:
      return "datetime";
    case ParseResult::Kind::kDate:
      return "date";
    case ParseResult::Kind::kTime:
      return "time";
  }
  return "unknown";
}

ParseError ParseError::invalidFormat() {
  return ParseError(ErrorCode::kInvalidFormat, "Input does not match any supported time format");
}

ParseError ParseError::processing(std::vector<ProcessingError> errors) {
  std::ostringstream oss;
  oss << "Failed to process input: ";
  for (std::size_t i = 0; i < errors.size(); ++i) {
    if (i > 0) oss << "; ";
    appendMessage(oss, errors[i]);
  }
  return ParseError(ErrorCode::kProcessingError, oss.str(), std::move(errors));
}

ParseError ParseError::internal(std::string detail) {
  return ParseError(ErrorCode::kInternalError, "Internal parser error: " + detail);
}

ParseOutcome<ast::HumanTime> buildAst(std::string_view text, const ParseOptions& options) {
  parse::GrammarOptions grammar_options;
  grammar_options.max_nesting_depth = options.max_nesting_depth;

  auto tree = parse::Grammar::match(text, grammar_options);
  if (!tree.has_value()) {
    return std::unexpected(ParseError::invalidFormat());
  }

  auto human_time = parse::AstBuilder::build(*tree);
  if (!human_time.has_value()) {
    return std::unexpected(ParseError::internal(human_time.error().message()));
  }
  return std::move(*human_time);
}

ParseOutcome<ParseResult> fromHumanTime(std::string_view text, DateTime now,
                                        const ParseOptions& options) {
  auto human_time = buildAst(text, options);
  if (!human_time.has_value()) {
    return std::unexpected(std::move(human_time.error()));
  }

  resolve::Resolver resolver(now);
  auto resolved = resolver.resolve(*human_time);
  if (!resolved.has_value()) {
    auto error = ParseError::processing(std::move(resolved.error()));
    spdlog::debug("Resolving '{}' failed: {}", text, error.message());
    return std::unexpected(std::move(error));
  }

  spdlog::debug("Resolved '{}' to {}", text, resolved->toString());
  return *resolved;
}

}  // namespace hdt
