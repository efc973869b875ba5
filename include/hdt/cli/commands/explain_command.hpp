#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include "hdt/cli/application.hpp"

namespace hdt::cli {

/**
 * @brief Show how an expression is recognized, without resolving it
 * Usage: hdt explain <words...>
 */
class ExplainCommand : public Command {
 public:
  explicit ExplainCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "explain"; }
  std::string description() const override { return "Print the parse tree and expression structure"; }

  void setupCommand(CLI::App* cmd) override;

 private:
  Application& app_;

  std::vector<std::string> words_;
};

}  // namespace hdt::cli
