#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include "hdt/cli/application.hpp"

namespace hdt::cli {

/**
 * Command for managing configuration
 *
 * Subcommands:
 * - get <key>: Get configuration value
 * - set <key> <value>: Set configuration value and save the file
 * - list: List all configuration
 * - path: Show configuration file path
 */
class ConfigCommand : public Command {
 public:
  explicit ConfigCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return "config"; }
  std::string description() const override { return "Manage configuration settings"; }

 private:
  Application& app_;

  // Subcommand flags
  bool get_mode_ = false;
  bool set_mode_ = false;
  bool list_mode_ = false;
  bool path_mode_ = false;

  // Command arguments
  std::string key_;
  std::string value_;

  Result<int> executeGet(const GlobalOptions& options);
  Result<int> executeSet(const GlobalOptions& options);
  Result<int> executeList(const GlobalOptions& options);
  Result<int> executePath(const GlobalOptions& options);
};

}  // namespace hdt::cli
