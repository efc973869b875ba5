#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include "hdt/cli/application.hpp"

namespace hdt::cli {

/**
 * @brief Resolve expressions read line by line until end of input
 * Usage: hdt repl [--now <iso>]
 *
 * Each line is trimmed and lowercased. Without --now the local clock is read
 * again for every line. A failing line prints its error and the loop goes on.
 */
class ReplCommand : public Command {
 public:
  explicit ReplCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "repl"; }
  std::string description() const override { return "Resolve expressions read from standard input"; }

  void setupCommand(CLI::App* cmd) override;

 private:
  Application& app_;

  std::string now_;

  void processLine(const std::string& line, DateTime now, const GlobalOptions& options);
};

}  // namespace hdt::cli
