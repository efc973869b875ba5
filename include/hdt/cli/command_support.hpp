#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "hdt/cli/application.hpp"
#include "hdt/human_time.hpp"
#include "hdt/parse/grammar.hpp"

namespace hdt::cli {

// Reference instant for a command: the --now value, or the local clock
Result<DateTime> referenceInstant(const std::string& now_option);

// Words of a positional argument list joined by single spaces
std::string joinWords(const std::vector<std::string>& words);

// {"input", "kind", "value"}
nlohmann::json resultToJson(std::string_view input, const ParseResult& result);

// {"input", "error", "code", "details"}; details lists processing errors
nlohmann::json parseErrorToJson(std::string_view input, const ParseError& error);

// {"rule", "text", "children"}
nlohmann::json parseTreeToJson(const parse::ParseNode& node);

/**
 * @brief Print a failed expression in the selected output format
 * @return Exit code for the command
 */
int printParseError(std::string_view input, const ParseError& error, const GlobalOptions& options);

}  // namespace hdt::cli
