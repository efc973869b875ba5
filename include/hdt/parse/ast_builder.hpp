#pragma once

#include <cstdint>

#include "hdt/common.hpp"
#include "hdt/parse/ast.hpp"
#include "hdt/parse/grammar.hpp"

namespace hdt::parse {

/**
 * @brief Translates a matched parse tree into the typed AST
 *
 * Every shape the grammar can produce maps to exactly one AST variant. A shape
 * the builder does not know, or a digit run that does not fit 32 bits, is
 * reported as kInternalError: it means the grammar and the builder disagree,
 * not that the user typed something wrong.
 */
class AstBuilder {
public:
  /**
   * @brief Build the AST from a HumanTime root node
   * @param root Node returned by Grammar::match
   * @return HumanTime AST on success, kInternalError otherwise
   */
  static Result<ast::HumanTime> build(const ParseNode& root);

private:
  static Result<ast::HumanTime> buildHumanTime(const ParseNode& node);
  static Result<ast::DateTime> buildDateTime(const ParseNode& node);
  static Result<ast::Date> buildDate(const ParseNode& node);
  static Result<ast::Time> buildTime(const ParseNode& node);
  static Result<ast::Ago> buildAgo(const ParseNode& node);
  static Result<ast::Duration> buildDuration(const ParseNode& node);
  static Result<ast::Quantifier> buildQuantifier(const ParseNode& node);
  static Result<ast::IsoDate> buildIsoDate(const ParseNode& node);

  static Result<std::uint32_t> buildNum(const ParseNode& node);
  static Result<ast::TimeUnit> buildTimeUnit(const ParseNode& node);
  static Result<ast::Weekday> buildWeekday(const ParseNode& node);
  static Result<ast::Month> buildMonth(const ParseNode& node);
  static Result<ast::RelativeSpecifier> buildRelativeSpecifier(const ParseNode& node);

  static Error unexpectedShape(const ParseNode& node);
};

} // namespace hdt::parse
