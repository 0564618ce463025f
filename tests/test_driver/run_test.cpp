#include "run_test.h"

#include "postfix.h"

#include <lexcomb.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace {

bool
fileExists(const char* path);

std::string
readFile(const char* path);

std::vector<std::string>
splitLines(const std::string& in);

void
printStringComparison(const std::string& a,
                      const std::string& b,
                      std::ostream& errLog);

/// The input files end with a newline, which is not part of the expression.
std::string
readInput(const char* path)
{
  auto input = readFile(path);

  if ((input.size() > 0) && (input.back() == '\n'))
    input.pop_back();

  return input;
}

std::string
lexResultToString(const lexcomb::LexResult& lexResult)
{
  std::ostringstream printStream;

  if (lexResult.hasFailure()) {
    lexResult.printFailure(printStream, "input.txt");
    return printStream.str();
  }

  for (const auto& token : lexResult.getTokens())
    printStream << token << std::endl;

  return printStream.str();
}

bool
verifyLexerOutput(const lexcomb::LexResult& lexResult,
                  const char* expectedOutputPath,
                  std::ostream& errLog)
{
  auto expectedOut = readFile(expectedOutputPath);

  auto actualOut = lexResultToString(lexResult);

  if (expectedOut != actualOut) {
    errLog << "Lexer did not print expected tokens" << std::endl;
    errLog << std::endl;
    errLog << "Expected vs. Actual:" << std::endl;
    printStringComparison(expectedOut, actualOut, errLog);
    return false;
  }

  return true;
}

bool
verifyResult(const lexcomb::LexResult& lexResult,
             const char* expectedResultPath,
             std::ostream& errLog)
{
  if (lexResult.hasFailure()) {
    errLog << "Cannot evaluate an input that failed to lex." << std::endl;
    return false;
  }

  long long value = 0;

  std::ostringstream evalErrStream;

  auto success = lexcomb::postfix::evaluatePostfix(
    lexResult.getTokens(), value, evalErrStream);

  std::ostringstream actualStream;

  if (success)
    actualStream << value << std::endl;
  else
    actualStream << evalErrStream.str();

  auto expectedResult = readFile(expectedResultPath);

  auto actualResult = actualStream.str();

  if (expectedResult != actualResult) {
    errLog << "Evaluation did not give the expected result" << std::endl;
    errLog << std::endl;
    errLog << "Expected vs. Actual:" << std::endl;
    printStringComparison(expectedResult, actualResult, errLog);
    return false;
  }

  return true;
}

std::string
makePath(const char* testBasePath, const char* filename)
{
  std::string path(testBasePath);

  if ((path.size() > 0) && ((path.back() != '/') && (path.back() != '\\')))
    path.push_back('/');

  path += filename;

  return path;
}

TestResults
fail()
{
  TestResults results;
  results.failed = true;
  return results;
}

TestResults
pass()
{
  TestResults results;
  results.failed = false;
  return results;
}

} // namespace

TestResults
runTest(const char* testPath, std::ostream& outLog, std::ostream& errLog)
{
  auto inPath = makePath(testPath, "input.txt");

  if (!fileExists(inPath.c_str())) {
    errLog << "Failed to open '" << inPath << "'" << std::endl;
    return fail();
  }

  auto input = readInput(inPath.c_str());

  auto noSkipPath = makePath(testPath, "no_skip_whitespace.txt");

  auto ignoreWhitespace = !fileExists(noSkipPath.c_str());

  auto rule = lexcomb::postfix::makePostfixRule();

  auto lexResult = lexcomb::lex(rule, lexcomb::Stream(input), ignoreWhitespace);

  outLog << lexResultToString(lexResult);

  auto outPath = makePath(testPath, "expected_output.txt");

  if (!verifyLexerOutput(lexResult, outPath.c_str(), errLog))
    return fail();

  auto resultPath = makePath(testPath, "expected_result.txt");

  if (fileExists(resultPath.c_str())) {
    if (!verifyResult(lexResult, resultPath.c_str(), errLog))
      return fail();
  }

  return pass();
}

namespace {

bool
fileExists(const char* path)
{
  std::ifstream file(path);
  return file.good();
}

std::string
readFile(const char* path)
{
  std::ifstream file(path);

  if (!file.good())
    return "<failed-to-open>";

  std::ostringstream fileStream;

  fileStream << file.rdbuf();

  return fileStream.str();
}

std::vector<std::string>
splitLines(const std::string& in)
{
  std::istringstream stream(in);

  std::vector<std::string> lines;

  std::string line;

  while (std::getline(stream, line))
    lines.emplace_back(line);

  return lines;
}

size_t
getColumnCount(const std::string& str)
{
  size_t count = 0;

  for (const auto& c : str) {
    if ((c & 0xc0) == 0x80)
      continue;
    count++;
  }

  return count;
}

std::size_t
getMaxColumnCount(const std::vector<std::string>& lineVec)
{
  size_t maxColCount = 0;

  for (const auto& s : lineVec)
    maxColCount = std::max(maxColCount, getColumnCount(s));

  return maxColCount;
}

void
printStringComparison(const std::string& a,
                      const std::string& b,
                      std::ostream& errLog)
{
  auto aLines = splitLines(a);
  auto bLines = splitLines(b);

  auto maxLineCount = std::max(aLines.size(), bLines.size());

  auto maxColCount = getMaxColumnCount(aLines);

  for (size_t i = 0; i < maxLineCount; i++) {

    errLog << "  ";

    if (i < aLines.size()) {
      errLog << aLines[i];

      size_t remainingCols = maxColCount - getColumnCount(aLines[i]);

      for (size_t i = 0; i < remainingCols; i++)
        errLog << ' ';

    } else {

      for (size_t i = 0; i < maxColCount; i++)
        errLog << ' ';
    }

    if (i < bLines.size())
      errLog << " | " << bLines[i];
    else
      errLog << " |";

    errLog << std::endl;
  }
}

} // namespace
