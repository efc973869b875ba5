#include "hdt/cli/application.hpp"

#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "hdt/util/logging.hpp"

// Command includes
#include "hdt/cli/commands/config_command.hpp"
#include "hdt/cli/commands/explain_command.hpp"
#include "hdt/cli/commands/parse_command.hpp"
#include "hdt/cli/commands/repl_command.hpp"

namespace hdt::cli {

Application::Application()
    : app_("hdt", "Parse human readable date and time expressions")
    , input_(&std::cin) {

  // Set up the application
  app_.set_version_flag("--version", hdt::getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

Application::Application(config::Config config)
    : Application() {
  config_ = std::move(config);
  config_preloaded_ = true;
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

Result<void> Application::initialize() {
  if (initialized_) {
    return {};
  }

  if (!config_preloaded_) {
    if (!global_options_.config_file.empty()) {
      // An explicitly requested file must exist and parse
      auto load_result = config_.load(global_options_.config_file);
      if (!load_result.has_value()) {
        return std::unexpected(load_result.error());
      }
    } else {
      auto default_path = config::Config::defaultConfigPath();
      if (std::filesystem::exists(default_path)) {
        auto load_result = config_.load(default_path);
        if (!load_result.has_value()) {
          return std::unexpected(load_result.error());
        }
      }
    }
  }

  auto log_result = util::Logging::initialize(effectiveLogLevel(), config_.log_file);
  if (!log_result.has_value()) {
    return std::unexpected(log_result.error());
  }

  if (config_.output == config::Config::OutputFormat::kJson) {
    global_options_.json = true;
  }

  spdlog::debug("hdt {} initialized (config: {})", getVersion().toString(),
                config_.configPath().empty() ? "defaults" : config_.configPath().string());

  initialized_ = true;
  return {};
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output (-vv for trace)");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Only log errors");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
}

void Application::setupCommands() {
  registerCommand(std::make_unique<ParseCommand>(*this));
  registerCommand(std::make_unique<ReplCommand>(*this));
  registerCommand(std::make_unique<ExplainCommand>(*this));
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  // Add footer with examples
  app_.footer(R"(Examples:
  hdt parse next friday
  hdt parse 3 days ago at 14:00 --now 2010-01-01T00:00:00
  hdt parse in 2 hours and 30 minutes --json
  hdt explain 1 week ago at last monday
  echo "tomorrow" | hdt repl

For more information on a specific command, run:
  hdt <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  // Create CLI11 subcommand
  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  // Let the command setup its specific options
  cmd_ptr->setupCommand(sub);

  // Set callback to execute the command
  sub->callback([this, cmd_ptr]() {
    auto init_result = initialize();
    if (!init_result.has_value()) {
      printError(init_result.error());
      throw CLI::RuntimeError(1);
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      spdlog::debug("Command '{}' failed: {}", cmd_ptr->name(), result.error().message());
      printError(result.error());
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  // Store the command
  commands_.push_back(std::move(command));
}

void Application::printError(const Error& error) const {
  if (global_options_.json) {
    nlohmann::json output;
    output["error"] = error.message();
    output["code"] = static_cast<int>(error.code());
    output["details"] = std::string(errorCodeToString(error.code()));
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << "Error: " << error.message() << "\n";
  }
}

std::string Application::effectiveLogLevel() const {
  if (global_options_.quiet) {
    return "error";
  }
  if (global_options_.verbose >= 2) {
    return "trace";
  }
  if (global_options_.verbose == 1) {
    return "debug";
  }
  return config_.log_level;
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

config::Config& Application::config() {
  return config_;
}

std::istream& Application::input() {
  return *input_;
}

void Application::setInput(std::istream& in) {
  input_ = &in;
}

}  // namespace hdt::cli
