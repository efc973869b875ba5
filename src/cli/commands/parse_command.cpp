#include "hdt/cli/commands/parse_command.hpp"

#include <iostream>

#include <spdlog/spdlog.h>

#include "hdt/cli/command_support.hpp"
#include "hdt/human_time.hpp"
#include "hdt/util/time.hpp"

namespace hdt::cli {

ParseCommand::ParseCommand(Application& app) : app_(app) {}

void ParseCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("expression", words_, "Expression, e.g. \"3 days ago at 14:00\"")->required();
  cmd->add_option("--now", now_, "Reference instant (YYYY-MM-DD[THH:MM[:SS]]), default: local time");
}

Result<int> ParseCommand::execute(const GlobalOptions& options) {
  auto now = referenceInstant(now_);
  if (!now.has_value()) {
    return std::unexpected(now.error());
  }

  const std::string text = joinWords(words_);
  spdlog::debug("Resolving '{}' against {}", text, util::Time::toIso(*now));

  auto result = fromHumanTime(text, *now, app_.config().parseOptions());
  if (!result.has_value()) {
    return printParseError(text, result.error(), options);
  }

  if (options.json) {
    std::cout << resultToJson(text, *result).dump(2) << "\n";
  } else {
    std::cout << result->toString() << "\n";
  }
  return 0;
}

}  // namespace hdt::cli
