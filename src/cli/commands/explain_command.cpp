#include "hdt/cli/commands/explain_command.hpp"

#include <iostream>

#include "hdt/cli/command_support.hpp"
#include "hdt/parse/ast.hpp"
#include "hdt/parse/ast_builder.hpp"
#include "hdt/parse/grammar.hpp"

namespace hdt::cli {

ExplainCommand::ExplainCommand(Application& app) : app_(app) {}

void ExplainCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("expression", words_, "Expression to explain")->required();
}

Result<int> ExplainCommand::execute(const GlobalOptions& options) {
  const std::string text = joinWords(words_);

  parse::GrammarOptions grammar_options;
  grammar_options.max_nesting_depth = app_.config().max_nesting_depth;

  auto tree = parse::Grammar::match(text, grammar_options);
  if (!tree.has_value()) {
    return printParseError(text, ParseError::invalidFormat(), options);
  }

  auto human_time = parse::AstBuilder::build(*tree);
  if (!human_time.has_value()) {
    return printParseError(text, ParseError::internal(human_time.error().message()), options);
  }

  if (options.json) {
    nlohmann::json output;
    output["input"] = text;
    output["tree"] = parseTreeToJson(*tree);
    output["expression"] = ast::describe(*human_time);
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << "Parse tree:\n" << parse::dumpTree(*tree);
    std::cout << "\nExpression: " << ast::describe(*human_time) << "\n";
  }
  return 0;
}

}  // namespace hdt::cli
