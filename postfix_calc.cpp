#include "postfix.h"

#include <lexcomb.h>

#include <iostream>
#include <string>

#include <cstdlib>
#include <cstring>

namespace {

void
printUsage(const char* programName)
{
  std::cout << "usage: " << programName << " [--no-skip-whitespace]"
            << std::endl;
  std::cout << std::endl;
  std::cout << "Reads postfix expressions from the standard input, one per"
            << std::endl;
  std::cout << "line, and prints their values. An empty line ends the session."
            << std::endl;
}

void
handleLine(const lexcomb::RulePtr& rule,
           const std::string& line,
           bool ignoreWhitespace)
{
  auto lexResult = lexcomb::lex(rule, lexcomb::Stream(line), ignoreWhitespace);

  if (lexResult.hasFailure()) {
    std::cerr << "syntax error: '" << line << "'" << std::endl;
    lexResult.printFailure(std::cerr, "<stdin>");
    return;
  }

  const auto& tokens = lexResult.getTokens();

  long long value = 0;

  if (lexcomb::postfix::evaluatePostfix(tokens, value, std::cerr))
    std::cout << value << std::endl;
}

} // namespace

int
main(int argc, char** argv)
{
  bool ignoreWhitespace = true;

  for (int i = 1; i < argc; i++) {

    if (std::strcmp(argv[i], "--no-skip-whitespace") == 0) {
      ignoreWhitespace = false;
      continue;
    }

    if (std::strcmp(argv[i], "--help") == 0) {
      printUsage(argv[0]);
      return EXIT_SUCCESS;
    }

    std::cerr << "Unknown option '" << argv[i] << "'" << std::endl;
    return EXIT_FAILURE;
  }

  auto rule = lexcomb::postfix::makePostfixRule();

  std::string line;

  for (;;) {

    std::cout << "$ " << std::flush;

    if (!std::getline(std::cin, line) || line.empty())
      break;

    handleLine(rule, line, ignoreWhitespace);
  }

  return EXIT_SUCCESS;
}
