// Language-specific recognizers, implemented once on top of the lexicons of a language.
#ifndef DATEPARSERS_LANGUAGE_H
#define DATEPARSERS_LANGUAGE_H

#include <string_view>
#include "textdate/date.h"
#include "lexicon.h"
#include "match.h"

namespace dateparsers {

// Static tables of a supported language.
struct Language {
  std::string_view code;
  // Values are days of the week, 0 = Monday.
  const Lexicon& fullWeekdays;
  const Lexicon& shortWeekdaysWithDot;
  const Lexicon& shortWeekdays;
  // Values are offsets in days relative to the reference date (yesterday = -1).
  const Lexicon& relativeDays;
  // Values are numbers of days per unit (day = 1, week = 7).
  const Lexicon& offsetUnits;

  // Returns a reference to the internally-owned tables for language `code`. It remains valid forever.
  // Supported languages are "en" and "ru", if they were enabled at build time.
  // Throws: std::invalid_argument for other values.
  static const Language& getByCode(std::string_view code);
};

// Full name, then short name followed by a dot, then short name. The value is the day of the week.
ValueMatch matchNamedWeekday(const Language& language, std::string_view text);

// Next day falling on the named day of the week, which is the reference date itself if it already falls on it.
Match namedWeekday(const Language& language, std::string_view text, const textdate::Date& reference);
// The reference date if it falls on the named day of the week, DAY_MISMATCH otherwise.
Match currentNamedWeekdayOnly(const Language& language, std::string_view text, const textdate::Date& reference);
// Day of the week of the reference date (from Monday to Sunday) falling on the named day. It can be in the past.
Match weekdayOfCurrentWeek(const Language& language, std::string_view text, const textdate::Date& reference);

// Any word of the relativeDays lexicon.
Match relativeDay(const Language& language, std::string_view text, const textdate::Date& reference);
// Words of the relativeDays lexicon meaning exactly `offset` days. Other words are a LEXICAL_MISMATCH.
Match relativeDayWithOffset(const Language& language, std::string_view text, const textdate::Date& reference,
                            int offset);

}  // namespace dateparsers

#endif
