// Minimal unit test framework.
// Usage:
//   class MyTest : public textdate::Test {
//     TEXTDATE_TEST_CASE(addition) { TEXTDATE_ASSERT_EQ(1 + 1, 2); }
//     TEXTDATE_TEST_CASE(multiplication) { TEXTDATE_ASSERT_EQ(2 * 2, 4); }
//   };
//   int main(int argc, char** argv) {
//     MyTest().run(argc, argv);  // Runs all test cases, or only those named on the command line.
//     return 0;
//   }
// A failing assertion ends the process with a non-zero exit code, which is what CTest checks.

#ifndef TEXTDATE_UNITTEST_H
#define TEXTDATE_UNITTEST_H

#include <functional>
#include <string>
#include <vector>

#define TEXTDATE_TEST_CASE(x)                                         \
  int testCaseRunner##x = [this]() {                                  \
    m_testCases.push_back({#x, [this]() { testCaseFunction##x(); }}); \
    return 0;                                                         \
  }();                                                                \
  void testCaseFunction##x()

namespace textdate {

class Test {
public:
  virtual ~Test();
  // Runs all test cases if testNames is empty, otherwise only the ones with these names.
  // Fails if no test case was run.
  void run(const std::vector<std::string>& testNames = {});
  // Same as run(), taking the names of test cases to run from the command line.
  void run(int argc, const char* const* argv);
  // Executed before each test case.
  virtual void setUp() {}
  // Executed after each test case.
  virtual void tearDown() {}

protected:
  struct TestCase {
    std::string name;
    std::function<void()> f;
  };
  std::vector<TestCase> m_testCases;
};

}  // namespace textdate

#endif
