#pragma once

#include <expected>
#include <vector>

#include "hdt/human_time.hpp"
#include "hdt/parse/ast.hpp"
#include "hdt/resolve/calendar.hpp"

namespace hdt::resolve {

template <typename T>
using Resolved = std::expected<T, std::vector<ProcessingError>>;

/**
 * @brief Evaluates an AST against a fixed reference instant
 *
 * The resolver holds only the reference instant, so the same AST resolved
 * twice against the same instant yields the same result.
 */
class Resolver {
 public:
  explicit Resolver(DateTime now) : now_(now) {}

  DateTime now() const noexcept { return now_; }

  /**
   * @brief Resolve a complete expression
   * @return DateTime for timestamps, "in" and "ago"; Date for date-only
   *         input; Time for time-only input. Sibling failures of a date+time
   *         expression are all reported.
   */
  Resolved<ParseResult> resolve(const ast::HumanTime& human_time) const;

  std::expected<Date, ProcessingError> resolveDate(const ast::Date& date) const;
  std::expected<TimeOfDay, ProcessingError> resolveTime(const ast::Time& time) const;

  /**
   * @brief Apply every quantifier, in input order, starting at instant
   *
   * Year and month steps keep the day of month and fail when that day does
   * not exist in the target month. The first failure aborts the whole
   * duration.
   */
  std::expected<DateTime, ProcessingError> applyDuration(const ast::Duration& duration,
                                                         DateTime instant,
                                                         calendar::Direction direction) const;

 private:
  Resolved<ParseResult> resolveAgo(const ast::Ago& ago) const;
  Date resolveRelativeWeekWeekday(const ast::RelativeWeekWeekday& date) const;
  Date resolveRelativeWeekday(ast::RelativeSpecifier specifier, ast::Weekday weekday) const;
  std::expected<Date, ProcessingError> resolveRelativeTimeUnit(
      const ast::RelativeTimeUnit& date) const;

  DateTime now_;
};

}  // namespace hdt::resolve
