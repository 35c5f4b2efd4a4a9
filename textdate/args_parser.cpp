#include "args_parser.h"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "error.h"

using std::string;
using std::unordered_map;
using std::vector;

namespace textdate {

// The only thing that matters for bool flags is whether their value is null or not null.
const char ARBITRARY_VALUE_FOR_TRUE_BOOL[] = "1";

// An argument is a flag if it starts with "-", unless it is a negative integer (e.g. "-123"). This allows negative
// offsets such as "-3" to be passed as values of valued flags.
static bool isFlagArg(const char* arg) {
  if (*arg != '-') return false;
  arg++;
  for (; *arg >= '0' && *arg <= '9'; arg++) {}
  return *arg != '\0';
}

// Extracts the flag name from arg and sets endOfName to the end of the flag name (first '\0' or '=').
// Precondition: isFlagArg(arg) must be true.
static string parseFlagName(const char* arg, const char** endOfName) {
  const char* start = arg + 1;
  if (*start == '-') {
    start++;
  }
  const char* end = start;
  for (; *end && *end != '='; end++) {}
  *endOfName = end;
  return string(start, end - start);
}

void ArgsParser::addArgWithCallback(const char* name, const SetFlagCallback& setCallback, FlagType type) {
  if (!isFlagArg(name)) {
    throw std::invalid_argument("Invalid flag name '" + string(name) + "'");
  }
  const char* endOfName = nullptr;
  string flagName = parseFlagName(name, &endOfName);
  if (*endOfName != '\0' || flagName.empty() || flagName[0] == '-') {
    throw std::invalid_argument("Invalid flag name '" + string(name) + "'");
  }
  if (!m_flags.emplace(std::move(flagName), Flag(type, m_flags.size(), setCallback)).second) {
    throw std::invalid_argument("Duplicate flag '" + string(name) + "'");
  }
}

void ArgsParser::addArg(const char* name, string* value) {
  addArgWithCallback(name, [value](const string& rawValue) { *value = rawValue; });
}

void ArgsParser::addArg(const char* name, bool* value) {
  addArgWithCallback(
      name, [value](const string&) { *value = true; }, BOOL_FLAG);
}

void ArgsParser::printHelp(const string& binary) const {
  size_t lastSlash = binary.rfind('/');
  std::cerr << "Usage: " << (lastSlash == string::npos ? binary : binary.substr(lastSlash + 1));

  using FlagIt = unordered_map<string, Flag>::const_iterator;
  vector<FlagIt> sortedFlags;
  for (FlagIt it = m_flags.begin(); it != m_flags.end(); ++it) {
    sortedFlags.push_back(it);
  }
  std::sort(sortedFlags.begin(), sortedFlags.end(),
            [](FlagIt it1, FlagIt it2) { return it1->second.index < it2->second.index; });
  for (FlagIt flagIt : sortedFlags) {
    const string& name = flagIt->first;
    std::cerr << " [--" << name;
    if (flagIt->second.type == VALUED_FLAG) {
      string placeholder = name;
      for (char& c : placeholder) {
        if (c >= 'a' && c <= 'z') {
          c += 'A' - 'a';
        } else if (c == '-') {
          c = '_';
        }
      }
      std::cerr << '=' << placeholder;
    }
    std::cerr << ']';
  }
  std::cerr << '\n';
  exit(0);
}

void ArgsParser::run(int argc, const char* const* argv) {
  // First step: sets the 'value' member of flags, so that only the last value of a repeated flag is used.
  for (int i = 1; i < argc; i++) {
    const char* arg = argv[i];
    if (!isFlagArg(arg)) {
      throw FlagParsingError("Unexpected argument '" + string(arg) + "'");
    }
    const char* endOfName = nullptr;
    string flagName = parseFlagName(arg, &endOfName);
    unordered_map<string, Flag>::iterator flagIt = m_flags.find(flagName);
    if (flagIt == m_flags.end()) {
      if (flagName == "help") {
        printHelp(argv[0]);
      }
      throw FlagParsingError("Invalid flag --" + flagName);
    }
    Flag& flag = flagIt->second;
    switch (flag.type) {
      case VALUED_FLAG:
        // Two syntaxes are supported: "--someflag=value" or "--someflag value".
        if (*endOfName == '=') {
          flag.value = endOfName + 1;
        } else if (i + 1 < argc && !isFlagArg(argv[i + 1])) {
          flag.value = argv[i + 1];
          i++;
        } else {
          throw FlagParsingError("Missing value for flag --" + flagName);
        }
        break;
      case BOOL_FLAG:
        if (*endOfName == '=') {
          throw FlagParsingError("Flag --" + flagName + " does not take a value");
        }
        flag.value = ARBITRARY_VALUE_FOR_TRUE_BOOL;
        break;
    }
  }

  // Second step: call callbacks to parse values.
  for (const auto& [name, flag] : m_flags) {
    if (flag.value != nullptr) {
      flag.setCallback(flag.value);
    }
  }
}

}  // namespace textdate
