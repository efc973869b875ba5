#include "hdt/cli/commands/repl_command.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include <spdlog/spdlog.h>

#include "hdt/cli/command_support.hpp"
#include "hdt/human_time.hpp"
#include "hdt/util/time.hpp"

namespace hdt::cli {

namespace {

std::string normalizeLine(const std::string& line) {
  auto first = std::find_if_not(line.begin(), line.end(),
                                [](unsigned char c) { return std::isspace(c); });
  auto last = std::find_if_not(line.rbegin(), line.rend(),
                               [](unsigned char c) { return std::isspace(c); }).base();
  if (first >= last) {
    return {};
  }

  std::string normalized(first, last);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return normalized;
}

}  // namespace

ReplCommand::ReplCommand(Application& app) : app_(app) {}

void ReplCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("--now", now_, "Fixed reference instant instead of the local clock");
}

Result<int> ReplCommand::execute(const GlobalOptions& options) {
  // Validate a fixed --now once, before reading any input
  if (!now_.empty()) {
    auto fixed = referenceInstant(now_);
    if (!fixed.has_value()) {
      return std::unexpected(fixed.error());
    }
  }

  std::size_t line_count = 0;
  std::string line;
  while (std::getline(app_.input(), line)) {
    const std::string text = normalizeLine(line);
    if (text.empty()) {
      continue;
    }
    ++line_count;

    auto now = referenceInstant(now_);
    if (!now.has_value()) {
      return std::unexpected(now.error());
    }
    processLine(text, *now, options);
  }

  spdlog::debug("repl: processed {} expressions", line_count);
  return 0;
}

void ReplCommand::processLine(const std::string& line, DateTime now, const GlobalOptions& options) {
  auto result = fromHumanTime(line, now, app_.config().parseOptions());

  if (options.json) {
    auto json = result.has_value() ? resultToJson(line, *result)
                                   : parseErrorToJson(line, result.error());
    json["now"] = util::Time::toIso(now);
    std::cout << json.dump() << std::endl;
    return;
  }

  if (!result.has_value()) {
    std::cout << result.error().message() << std::endl;
    return;
  }

  std::cout << "Time now: " << util::Time::toIso(now) << "\n";
  std::cout << "Calculated: " << result->toString() << "\n" << std::endl;
}

}  // namespace hdt::cli
