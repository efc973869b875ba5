#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "hdt/common.hpp"
#include "hdt/parse/ast.hpp"
#include "hdt/resolve/calendar.hpp"

namespace hdt {

// Resolved value: a full timestamp, a date only, or a time of day only
class ParseResult {
 public:
  enum class Kind {
    kDateTime,
    kDate,
    kTime
  };

  ParseResult(DateTime value) : value_(value) {}
  ParseResult(Date value) : value_(value) {}
  ParseResult(TimeOfDay value) : value_(value) {}

  Kind kind() const noexcept;

  bool isDateTime() const noexcept { return kind() == Kind::kDateTime; }
  bool isDate() const noexcept { return kind() == Kind::kDate; }
  bool isTime() const noexcept { return kind() == Kind::kTime; }

  // Accessors throw std::bad_variant_access on the wrong kind
  DateTime dateTime() const { return std::get<DateTime>(value_); }
  Date date() const { return std::get<Date>(value_); }
  TimeOfDay time() const { return std::get<TimeOfDay>(value_); }

  // "2010-01-01T00:05:30", "2010-01-01" or "18:30:00"
  std::string toString() const;

  bool operator==(const ParseResult& other) const = default;

 private:
  std::variant<DateTime, Date, TimeOfDay> value_;
};

std::string_view toString(ParseResult::Kind kind);

// Semantic failure of an input that matched the grammar
class ProcessingError {
 public:
  enum class Kind {
    kInvalidTime,        // hour, minute or second out of range
    kInvalidDate,        // day/month/year combination does not exist
    kAddToDate,          // month/year addition landed on a missing day
    kSubtractFromDate,   // month/year subtraction landed on a missing day
    kAnchorResolution    // the expression after "ago at" failed
  };

  ProcessingError(Kind kind, std::string message, std::vector<ProcessingError> causes = {})
      : kind_(kind), message_(std::move(message)), causes_(std::move(causes)) {}

  Kind kind() const noexcept { return kind_; }
  const std::string& message() const noexcept { return message_; }
  const std::vector<ProcessingError>& causes() const noexcept { return causes_; }

 private:
  Kind kind_;
  std::string message_;
  std::vector<ProcessingError> causes_;
};

/**
 * @brief Failure of fromHumanTime
 *
 * code() is one of:
 * - kInvalidFormat: the text is not a supported phrasing
 * - kProcessingError: it is, but could not be resolved; see processingErrors()
 * - kInternalError: the parser and AST builder disagree (a library defect)
 */
class ParseError {
 public:
  static ParseError invalidFormat();
  static ParseError processing(std::vector<ProcessingError> errors);
  static ParseError internal(std::string detail);

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const std::vector<ProcessingError>& processingErrors() const noexcept { return errors_; }

 private:
  ParseError(ErrorCode code, std::string message, std::vector<ProcessingError> errors = {})
      : code_(code), message_(std::move(message)), errors_(std::move(errors)) {}

  ErrorCode code_;
  std::string message_;
  std::vector<ProcessingError> errors_;
};

template <typename T>
using ParseOutcome = std::expected<T, ParseError>;

struct ParseOptions {
  // Bound on nested "<duration> ago at ..." expressions
  std::size_t max_nesting_depth = 16;
};

/**
 * @brief Parse and resolve a human time expression
 * @param text Expression such as "last friday at 19:45" or "3 days ago"
 * @param now Reference instant all relative parts are resolved against
 * @return DateTime, Date or Time result, or the reason it failed
 */
ParseOutcome<ParseResult> fromHumanTime(std::string_view text, DateTime now,
                                        const ParseOptions& options = {});

/**
 * @brief Parse only, for callers resolving one expression against several
 * reference instants
 */
ParseOutcome<ast::HumanTime> buildAst(std::string_view text, const ParseOptions& options = {});

}  // namespace hdt
