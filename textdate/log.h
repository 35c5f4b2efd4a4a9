// Logging to std::cerr, prefixed with the level and the source file.
// Usage:
//   TEXTDATE_DEBUG << "Only printed with --verbose";
//   TEXTDATE_INFO << "Today is " << today;
//   TEXTDATE_WARNING << "Something strange is happening";
//   TEXTDATE_ERROR << "Something wrong is happening";
//   TEXTDATE_FATAL << "Something wrong happened and the process will end now";
//
// TEXTDATE_ASSERT is similar to assert but is always enabled and allows extra logging:
//   TEXTDATE_ASSERT(!date.isNull()) << "input=" << input;
// TEXTDATE_ASSERT_EQ prints both values on failure:
//   TEXTDATE_ASSERT_EQ(date.toISO8601(), "2024-03-15") << "input=" << input;
#ifndef TEXTDATE_LOG_H
#define TEXTDATE_LOG_H

#include <cstdlib>
#include <iostream>
#include <ostream>

namespace textdate {

// Enables or disables TEXTDATE_DEBUG messages. They are disabled by default.
void setVerboseLogging(bool verbose);
bool isVerboseLoggingEnabled();

}  // namespace textdate

// Kept outside of textdate so that operator<< overloads of textdate types do not hide the ones of the global namespace.
namespace textdate_internal_log {

enum class LogLevel {
  DEBUG,
  INFO,
  WARNING,
  ERROR,
  FATAL,
};

struct EndOfLog {};

struct EndOfNonFatalLog : public EndOfLog {
  ~EndOfNonFatalLog() { std::cerr << '\n'; }
};

struct EndOfFatalLog : public EndOfLog {
  [[noreturn]] ~EndOfFatalLog() {
    std::cerr << '\n';
    exit(1);
  }
};

// Swallows everything written to it. Used for disabled debug messages.
class NullStream : public std::ostream {
public:
  NullStream() : std::ostream(nullptr) {}
};

struct EndOfDebugLog : public EndOfLog {
  ~EndOfDebugLog() {
    if (textdate::isVerboseLoggingEnabled()) std::cerr << '\n';
  }
};

std::ostream& getLogStream(const EndOfLog&);
std::ostream& printLogLinePrefix(LogLevel level, const char* fileName, const EndOfLog&);
std::ostream& printDebugLogLinePrefix(const char* fileName, const EndOfDebugLog&);

template <class X, class Y>
bool assertEqShouldFail(const X& x, const Y& y, const char* assertionText, const char* fileName) {
  if (!(x == y)) {
    printLogLinePrefix(LogLevel::FATAL, fileName, EndOfLog())
        << "Assertion " << assertionText << " failed (" << x << " != " << y << ") ";
    return true;
  }
  return false;
}

}  // namespace textdate_internal_log

#define TEXTDATE_INTERNAL_STRINGIFY1(x) #x
#define TEXTDATE_INTERNAL_STRINGIFY2(x) TEXTDATE_INTERNAL_STRINGIFY1(x)
#define TEXTDATE_HERE __FILE__ ":" TEXTDATE_INTERNAL_STRINGIFY2(__LINE__)
#define TEXTDATE_INTERNAL_LOG(level, endClass)                                                               \
  ::textdate_internal_log::printLogLinePrefix(::textdate_internal_log::LogLevel::level, TEXTDATE_HERE, \
                                              ::textdate_internal_log::endClass())

#define TEXTDATE_DEBUG \
  ::textdate_internal_log::printDebugLogLinePrefix(TEXTDATE_HERE, ::textdate_internal_log::EndOfDebugLog())
#define TEXTDATE_INFO TEXTDATE_INTERNAL_LOG(INFO, EndOfNonFatalLog)
#define TEXTDATE_WARNING TEXTDATE_INTERNAL_LOG(WARNING, EndOfNonFatalLog)
#define TEXTDATE_ERROR TEXTDATE_INTERNAL_LOG(ERROR, EndOfNonFatalLog)

#define TEXTDATE_FATAL TEXTDATE_INTERNAL_LOG(FATAL, EndOfFatalLog)

#define TEXTDATE_ASSERT(condition) \
  if (!(condition)) TEXTDATE_FATAL << "Assertion " #condition " failed "

#define TEXTDATE_ASSERT_EQ(x, y)                                                           \
  if (::textdate_internal_log::assertEqShouldFail(x, y, #x " == " #y, TEXTDATE_HERE)) \
  ::textdate_internal_log::getLogStream(::textdate_internal_log::EndOfFatalLog())

#endif
