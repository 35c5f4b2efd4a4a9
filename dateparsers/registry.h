// Lookup of recognizers by name, e.g. "dd_mm_y4", "en.named_weekday", "ru.bundle".
#ifndef DATEPARSERS_REGISTRY_H
#define DATEPARSERS_REGISTRY_H

#include <string>
#include <string_view>
#include <vector>
#include "textdate/date.h"
#include "match.h"

namespace dateparsers {

struct RecognizerInfo {
  std::string_view name;
  // Human-readable description of the accepted input.
  std::string_view pattern;
  Recognizer recognizer;
  // For bundles, returns the members in the order they are tried. Null for other recognizers.
  const std::vector<Recognizer>& (*getMembers)();
};

// All recognizers compiled in, sorted by name.
const std::vector<RecognizerInfo>& getRecognizers();
// Returns nullptr if there is no recognizer with this name.
const RecognizerInfo* findRecognizer(std::string_view name);

// Name of the most general recognizer of language `lang` ("en" or "ru") among those compiled in, e.g. "en.versatile".
// The language itself is not checked: the name may not exist in the registry if the language was not compiled in.
std::string getDefaultRecognizerName(std::string_view lang);

// Runs the recognizer `name` on the start of `text`.
// Throws: std::invalid_argument if there is no recognizer with this name.
Match parse(std::string_view name, std::string_view text, const textdate::Date& reference);

// Same as above, for a recognizer already looked up. If it is a bundle whose members all fail and memberErrors is not
// null, memberErrors receives the error of each member (see tryInOrder).
Match parse(const RecognizerInfo& info, std::string_view text, const textdate::Date& reference,
            std::vector<ErrorKind>* memberErrors = nullptr);

// Runs `recognizer` on `text` without its leading and trailing whitespace, and fails with LEXICAL_MISMATCH if the
// recognized date is followed by anything else. On success, the length does not include the whitespace.
Match parseEntireText(Recognizer recognizer, std::string_view text, const textdate::Date& reference);
Match parseEntireText(const RecognizerInfo& info, std::string_view text, const textdate::Date& reference,
                      std::vector<ErrorKind>* memberErrors = nullptr);

}  // namespace dateparsers

#endif
