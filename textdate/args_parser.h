// Module to parse command line flags.
//
// Example: to extract a flag --today=<date> and a flag --verbose, call parseArgs in your main function in this way:
//   int main(int argc, char** argv) {
//     textdate::Date today = textdate::Date::today();  // Preserved if the flag is not passed to the binary.
//     bool verbose = false;  // This means that values with POD types must always be initialized.
//     textdate::parseArgs(argc, argv, "--today", &today, "--verbose", &verbose);
//     ...
//   }
//
// This binary can parse the following command lines:
//   ./binary --today=2024-03-15           # Valued flag.
//   ./binary --today 2024-03-15           # The equal sign can be replaced by a space.
//   ./binary -today=2024-03-15 --verbose  # '-' works the same as '--'. --verbose takes no value.
//   ./binary --help                       # --help is supported internally, although it can be overridden.
//
// Adding a initFromFlagValue(const string&, T&) function in the namespace of T allows T to be used as a flag value.
#ifndef TEXTDATE_ARGS_PARSER_H
#define TEXTDATE_ARGS_PARSER_H

#include <functional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include "error.h"

namespace textdate {

// Exception if command line arguments cannot be parsed according to the declared flags.
// Note: in case of error in the declaration itself, parseArgs throws std::invalid_argument, not FlagParsingError.
class FlagParsingError : public Error {
public:
  using Error::Error;
};

// Helper class for parseArgs.
class ArgsParser {
public:
  // Declares flags. Each name must start with "-" or "--".
  template <typename T, typename... Args>
  void addArgs(const char* name, T* value, Args... args) {
    if (value == nullptr) {
      throw std::invalid_argument("Flag value must not be null");
    }
    addArg(name, value);
    addArgs(args...);
  }

  void addArgs() {}

  // Parses command line arguments.
  void run(int argc, const char* const* argv);

private:
  using SetFlagCallback = std::function<void(const std::string&)>;
  enum FlagType {
    VALUED_FLAG,
    BOOL_FLAG,
  };
  struct Flag {
    Flag(FlagType type, int index, const SetFlagCallback& setCallback)
        : type(type), index(index), setCallback(setCallback) {}
    FlagType type;
    int index = 0;
    const char* value = nullptr;
    SetFlagCallback setCallback;
  };

  void addArgWithCallback(const char* name, const SetFlagCallback& setCallback, FlagType type = VALUED_FLAG);
  // Prints declared flags in the order of declaration and exits.
  [[noreturn]] void printHelp(const std::string& binary) const;

  template <class T>
  void addArg(const char* name, T* value) {
    addArgWithCallback(name, [value](const std::string& rawValue) { initFromFlagValue(rawValue, *value); });
  }
  void addArg(const char* name, std::string* value);
  // Passing the flag sets the value to true. There is no way to explicitly set the value of a bool flag to false.
  void addArg(const char* name, bool* value);

  std::unordered_map<std::string, Flag> m_flags;
};

// Parses command line flags. See the top of the file for details.
// Throws: FlagParsingError.
template <typename... Args>
void parseArgs(int argc, const char* const* argv, Args... args) {
  ArgsParser parser;
  parser.addArgs(args...);
  parser.run(argc, argv);
}

}  // namespace textdate

#endif
