// Recognizers of numeric dates in the six supported layouts.
// Fields are separated by any number of '/', '-', '.', spaces or tabs, and the separators of a single date do not need
// to be identical ("13/06-2024" is accepted). Fields that are not part of the layout are taken from the reference date.
#ifndef DATEPARSERS_NUMERIC_H
#define DATEPARSERS_NUMERIC_H

#include <optional>
#include <string_view>
#include "textdate/date.h"
#include "match.h"

namespace dateparsers {

struct FieldSet {
  std::optional<int> day;
  std::optional<int> month;
  std::optional<int> year;
};

// Replaces missing fields with the ones of `reference` and builds the date.
// Fails with CALENDAR_INVALID if the result is not a real date. `length` is copied to the result on success.
Match resolveFields(const FieldSet& fields, const textdate::Date& reference, int length);

// dd, e.g. "13".
Match ddOnly(std::string_view text, const textdate::Date& reference);
// dd*mm, e.g. "13/07".
Match ddMmOnly(std::string_view text, const textdate::Date& reference);
// mm*dd, e.g. "07/13".
Match mmDdOnly(std::string_view text, const textdate::Date& reference);
// dd*mm*yyyy, e.g. "13/07/2024".
Match ddMmY4(std::string_view text, const textdate::Date& reference);
// mm*dd*yyyy, e.g. "07-13-2024".
Match mmDdY4(std::string_view text, const textdate::Date& reference);
// yyyy*mm*dd, e.g. "2024-07-13".
Match y4MmDd(std::string_view text, const textdate::Date& reference);

}  // namespace dateparsers

#endif
