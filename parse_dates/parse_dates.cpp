// Reads lines from stdin and prints the date recognized in each of them.
// Example:
//   $ echo "tomorrow" | parse_dates --today=2024-03-15
//   Today is: 2024-03-15
//   recognized: 2024-03-16
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "dateparsers/match.h"
#include "dateparsers/registry.h"
#include "textdate/args_parser.h"
#include "textdate/date.h"
#include "textdate/error.h"
#include "textdate/log.h"
#include "textdate/string.h"

using dateparsers::ErrorKind;
using dateparsers::Match;
using dateparsers::RecognizerInfo;
using std::string;
using std::vector;
using textdate::Date;

static void listRecognizers() {
  for (const RecognizerInfo& info : dateparsers::getRecognizers()) {
    std::cout << info.name << "\t" << info.pattern << "\n";
  }
}

static void processLine(const RecognizerInfo& info, const string& line, const Date& today, bool standalone) {
  vector<ErrorKind> memberErrors;
  Match match = standalone ? dateparsers::parseEntireText(info, line, today, &memberErrors)
                           : dateparsers::parse(info, line, today, &memberErrors);
  if (match.ok()) {
    TEXTDATE_DEBUG << "Consumed " << match.length << " bytes of '" << line << "'";
    std::cout << "recognized: " << match.date << std::endl;
  } else {
    if (!memberErrors.empty()) {
      vector<string> errors;
      for (ErrorKind error : memberErrors) {
        errors.emplace_back(dateparsers::getStringOfErrorKind(error));
      }
      TEXTDATE_DEBUG << "Errors of the members of " << info.name << ": " << textdate::join(errors, ", ");
    }
    std::cout << "unable to recognize the input as a date: " << match.error << std::endl;
  }
}

int main(int argc, char** argv) {
  Date today = Date::today();
  string lang = "en";
  string parser;
  bool standalone = false;
  bool list = false;
  bool verbose = false;
  try {
    textdate::parseArgs(argc, argv, "--today", &today, "--lang", &lang, "--parser", &parser, "--standalone",
                        &standalone, "--list", &list, "--verbose", &verbose);
  } catch (const textdate::FlagParsingError& error) {
    TEXTDATE_ERROR << error.what();
    return 1;
  } catch (const textdate::ParseError& error) {
    TEXTDATE_ERROR << error.what();
    return 1;
  }
  textdate::setVerboseLogging(verbose);
  if (list) {
    listRecognizers();
    return 0;
  }
  if (lang != "en" && lang != "ru") {
    TEXTDATE_ERROR << "Invalid value for --lang: '" << lang << "' (expected 'en' or 'ru')";
    return 1;
  }
  if (parser.empty()) {
    parser = dateparsers::getDefaultRecognizerName(lang);
  }
  const RecognizerInfo* info = dateparsers::findRecognizer(parser);
  if (info == nullptr) {
    TEXTDATE_ERROR << "Unknown parser '" << parser << "' (use --list to show available parsers)";
    return 1;
  }

  std::cout << "Today is: " << today << std::endl;
  string line;
  while (std::getline(std::cin, line)) {
    processLine(*info, line, today, standalone);
  }
  return 0;
}
