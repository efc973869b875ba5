#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include "hdt/cli/application.hpp"

namespace hdt::cli {

/**
 * @brief Resolve one expression
 * Usage: hdt parse <words...> [--now <iso>]
 */
class ParseCommand : public Command {
 public:
  explicit ParseCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "parse"; }
  std::string description() const override { return "Resolve a human time expression"; }

  void setupCommand(CLI::App* cmd) override;

 private:
  Application& app_;

  // Command options
  std::vector<std::string> words_;
  std::string now_;
};

}  // namespace hdt::cli
