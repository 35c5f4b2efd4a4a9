#ifndef DATEPARSERS_BUNDLE_H
#define DATEPARSERS_BUNDLE_H

#include <string_view>
#include <vector>
#include "textdate/date.h"
#include "match.h"

namespace dateparsers {

// Tries the recognizers one after the other and returns the first success. The order of `recognizers` is the
// priority: a later member is never tried once an earlier one succeeded, even if it would consume more text.
// If all members fail, returns NO_ALTERNATIVE_MATCHED and, if memberErrors is not null, fills it with the error of
// each member in the same order.
Match tryInOrder(const std::vector<Recognizer>& recognizers, std::string_view text, const textdate::Date& reference,
                 std::vector<ErrorKind>* memberErrors = nullptr);

}  // namespace dateparsers

#endif
