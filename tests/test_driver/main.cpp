#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

#include <cstdlib>
#include <cstring>

#include "run_test.h"

namespace {

/// The list of case directories read when no case is given on the command
/// line. Paths in it are relative to the working directory.
const char* defaultTestListPath = "lexcomb_tests.txt";

struct DriverOptions final
{
  std::vector<std::string> testPaths;

  /// Print passing cases and their lexer output too, not only failures.
  bool verbose = false;
};

bool
registerTestList(std::vector<std::string>& testPaths, const char* testListPath)
{
  std::ifstream file(testListPath);

  if (!file.good()) {
    std::cerr << "Failed to open '" << testListPath << "'" << std::endl;
    return false;
  }

  std::string path;

  while (std::getline(file, path)) {

    // Blank lines and lines starting with '#' are skipped.
    if (path.empty() || (path[0] == '#'))
      continue;

    testPaths.emplace_back(std::move(path));
  }

  return true;
}

bool
fileExists(const char* path)
{
  std::ifstream file(path);

  return file.good();
}

bool
parseOptions(DriverOptions& options, int argc, char** argv)
{
  for (int i = 1; i < argc; i++) {

    if (std::strcmp(argv[i], "--test-list") == 0) {

      if ((i + 1) >= argc) {
        std::cerr << "Test list path not specified." << std::endl;
        return false;
      }

      if (!registerTestList(options.testPaths, argv[++i]))
        return false;

      continue;
    }

    if (std::strcmp(argv[i], "--verbose") == 0) {
      options.verbose = true;
      continue;
    }

    if (argv[i][0] == '-') {
      std::cerr << "Unknown option '" << argv[i] << "'" << std::endl;
      return false;
    }

    options.testPaths.emplace_back(argv[i]);
  }

  if (options.testPaths.empty() && fileExists(defaultTestListPath))
    return registerTestList(options.testPaths, defaultTestListPath);

  return true;
}

void
writeIndented(std::ostream& dstStream, const std::string& log, const char* tag)
{
  if (log.empty())
    return;

  std::istringstream logStream(log);

  std::string line;

  while (std::getline(logStream, line))
    dstStream << "  " << tag << " | " << line << std::endl;
}

} // namespace

int
main(int argc, char** argv)
{
  DriverOptions options;

  if (!parseOptions(options, argc, argv))
    return EXIT_FAILURE;

  if (options.testPaths.empty()) {
    std::cerr << "No test cases given." << std::endl;
    return EXIT_FAILURE;
  }

  size_t failureCount = 0;

  for (const auto& testPath : options.testPaths) {

    std::ostringstream outLog;

    std::ostringstream errLog;

    TestResults results = runTest(testPath.c_str(), outLog, errLog);

    if (results.failed) {

      std::cerr << "FAIL " << testPath << std::endl;

      writeIndented(std::cerr, outLog.str(), "out");
      writeIndented(std::cerr, errLog.str(), "err");

      failureCount++;

    } else if (options.verbose) {

      std::cout << "PASS " << testPath << std::endl;

      writeIndented(std::cout, outLog.str(), "out");
    }
  }

  std::cout << (options.testPaths.size() - failureCount) << " out of "
            << options.testPaths.size() << " cases passed." << std::endl;

  return failureCount ? EXIT_FAILURE : EXIT_SUCCESS;
}
