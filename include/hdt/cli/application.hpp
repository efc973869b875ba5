#pragma once

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "hdt/common.hpp"
#include "hdt/config/config.hpp"

namespace hdt::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
 public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  /**
   * @brief Get the command name
   */
  virtual std::string name() const = 0;

  /**
   * @brief Get the command description
   */
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

/**
 * @brief Main CLI application
 */
class Application {
 public:
  Application();

  /**
   * @brief Create an application with an already loaded configuration
   *
   * The configuration file is not read; --config is ignored.
   */
  explicit Application(config::Config config);
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @param argc Argument count
   * @param argv Argument vector
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  /**
   * @brief Load configuration and install logging without running CLI
   * @return Result indicating success or failure
   */
  Result<void> initialize();

  // Accessors for commands
  const GlobalOptions& globalOptions() const;
  config::Config& config();

  // Input stream used by interactive commands (std::cin unless replaced)
  std::istream& input();
  void setInput(std::istream& in);

 private:
  // Setup methods
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  // Command registration
  void registerCommand(std::unique_ptr<Command> command);

  // Error reporting for failed commands
  void printError(const Error& error) const;

  // Logging level from config and -v/-q flags
  std::string effectiveLogLevel() const;

  // CLI framework
  CLI::App app_;
  GlobalOptions global_options_;

  config::Config config_;
  bool config_preloaded_ = false;
  bool initialized_ = false;

  std::istream* input_;

  // Registered commands
  std::vector<std::unique_ptr<Command>> commands_;
};

}  // namespace hdt::cli
