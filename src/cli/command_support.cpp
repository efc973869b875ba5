#include "hdt/cli/command_support.hpp"

#include <iostream>

#include "hdt/util/time.hpp"

namespace hdt::cli {

namespace {

std::string_view processingKindToString(ProcessingError::Kind kind) {
  switch (kind) {
    case ProcessingError::Kind::kInvalidTime: return "invalid_time";
    case ProcessingError::Kind::kInvalidDate: return "invalid_date";
    case ProcessingError::Kind::kAddToDate: return "add_to_date";
    case ProcessingError::Kind::kSubtractFromDate: return "subtract_from_date";
    case ProcessingError::Kind::kAnchorResolution: return "anchor_resolution";
  }
  return "unknown";
}

nlohmann::json processingErrorToJson(const ProcessingError& error) {
  nlohmann::json json;
  json["kind"] = std::string(processingKindToString(error.kind()));
  json["message"] = error.message();
  if (!error.causes().empty()) {
    json["causes"] = nlohmann::json::array();
    for (const auto& cause : error.causes()) {
      json["causes"].push_back(processingErrorToJson(cause));
    }
  }
  return json;
}

}  // namespace

Result<DateTime> referenceInstant(const std::string& now_option) {
  if (now_option.empty()) {
    return util::Time::localNow();
  }
  auto parsed = util::Time::parseDateTime(now_option);
  if (!parsed.has_value()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid --now value: " + parsed.error().message()));
  }
  return *parsed;
}

std::string joinWords(const std::vector<std::string>& words) {
  std::string text;
  for (const auto& word : words) {
    if (!text.empty()) text += ' ';
    text += word;
  }
  return text;
}

nlohmann::json resultToJson(std::string_view input, const ParseResult& result) {
  nlohmann::json json;
  json["input"] = std::string(input);
  json["kind"] = std::string(toString(result.kind()));
  json["value"] = result.toString();
  return json;
}

nlohmann::json parseErrorToJson(std::string_view input, const ParseError& error) {
  nlohmann::json json;
  json["input"] = std::string(input);
  json["error"] = error.message();
  json["code"] = static_cast<int>(error.code());
  json["details"] = nlohmann::json::array();
  for (const auto& processing_error : error.processingErrors()) {
    json["details"].push_back(processingErrorToJson(processing_error));
  }
  return json;
}

nlohmann::json parseTreeToJson(const parse::ParseNode& node) {
  nlohmann::json json;
  json["rule"] = std::string(parse::ruleName(node.rule()));
  json["text"] = std::string(node.text());
  if (!node.children().empty()) {
    json["children"] = nlohmann::json::array();
    for (const auto& child : node.children()) {
      json["children"].push_back(parseTreeToJson(child));
    }
  }
  return json;
}

int printParseError(std::string_view input, const ParseError& error, const GlobalOptions& options) {
  if (options.json) {
    std::cout << parseErrorToJson(input, error).dump(2) << "\n";
  } else {
    std::cout << "Error: " << error.message() << "\n";
  }
  return 1;
}

}  // namespace hdt::cli
