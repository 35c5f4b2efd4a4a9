#include "unittest.h"
#include <algorithm>
#include <string>
#include <vector>
#include "log.h"

using std::string;
using std::vector;

namespace textdate {

Test::~Test() {}

void Test::run(const vector<string>& testNames) {
  int numTestCases = 0;
  for (const TestCase& testCase : m_testCases) {
    if (!testNames.empty() && std::find(testNames.begin(), testNames.end(), testCase.name) == testNames.end()) {
      continue;
    }
    TEXTDATE_DEBUG << "Running " << testCase.name;
    setUp();
    testCase.f();
    tearDown();
    numTestCases++;
  }
  TEXTDATE_ASSERT(numTestCases > 0) << "No test case matched";
}

void Test::run(int argc, const char* const* argv) {
  vector<string> testNames;
  for (int i = 1; i < argc; i++) {
    testNames.push_back(argv[i]);
  }
  run(testNames);
}

}  // namespace textdate
