#pragma once

#include <iosfwd>

struct TestResults final
{
  bool failed = false;
};

/// @brief Runs the case found in the directory @p testPath.
///
/// @detail A case directory contains:
///  - input.txt: a postfix expression, lexed with whitespace skipping.
///  - expected_output.txt: the tokens, one per line, or the diagnostic.
///  - expected_result.txt (optional): the value of the expression, or the
///    evaluation error.
///  - no_skip_whitespace.txt (optional): turns whitespace skipping off.
///
/// The lexer output (tokens or diagnostic) is written to @p outLog and the
/// reasons for a failure are written to @p errLog.
TestResults
runTest(const char* testPath, std::ostream& outLog, std::ostream& errLog);
