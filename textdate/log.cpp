#include "log.h"
#include <atomic>
#include <cstring>
#include <iostream>
#include <ostream>

namespace textdate {

static std::atomic<bool> verboseLogging(false);

void setVerboseLogging(bool verbose) {
  verboseLogging = verbose;
}

bool isVerboseLoggingEnabled() {
  return verboseLogging;
}

}  // namespace textdate

namespace textdate_internal_log {

static const char* getBaseName(const char* fileName) {
  const char* baseName = fileName + strlen(fileName);
  for (; baseName > fileName && *(baseName - 1) != '/'; baseName--) {}
  return baseName;
}

std::ostream& getLogStream(const EndOfLog&) {
  return std::cerr;
}

std::ostream& printLogLinePrefix(LogLevel level, const char* fileName, const EndOfLog&) {
  const char* prefix = "";
  switch (level) {
    case LogLevel::DEBUG:
      prefix = "[DEBUG ";
      break;
    case LogLevel::INFO:
      prefix = "[INFO ";
      break;
    case LogLevel::WARNING:
      prefix = "[WARNING ";
      break;
    case LogLevel::ERROR:
      prefix = "[ERROR ";
      break;
    case LogLevel::FATAL:
      prefix = "[FATAL ";
      break;
  }
  return std::cerr << prefix << getBaseName(fileName) << "] ";
}

std::ostream& printDebugLogLinePrefix(const char* fileName, const EndOfDebugLog& endOfLog) {
  if (!textdate::isVerboseLoggingEnabled()) {
    static NullStream nullStream;
    return nullStream;
  }
  return printLogLinePrefix(LogLevel::DEBUG, fileName, endOfLog);
}

}  // namespace textdate_internal_log
