// Lexical matchers for the parts of numeric dates.
// They only check the number of digits and the range of each field. Whether the fields form a real date is checked
// later, when the date is built (see resolveFields in numeric.h).
#ifndef DATEPARSERS_FIELDS_H
#define DATEPARSERS_FIELDS_H

#include <string_view>
#include "match.h"

namespace dateparsers {

// One or two digits in the range 1-31.
ValueMatch matchDay(std::string_view text);
// One or two digits in the range 1-12.
ValueMatch matchMonth(std::string_view text);
// Exactly four digits.
ValueMatch matchYear4(std::string_view text);

// Returns the length of the longest prefix of `text` made of '/', '-', '.', spaces and tabs. It may be 0.
int matchSeparator(std::string_view text);

}  // namespace dateparsers

#endif
