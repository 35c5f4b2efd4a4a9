#include "language.h"
#include <stdexcept>
#include <string>
#include <string_view>
#include "textdate/date.h"
#ifdef TEXTDATE_WITH_EN
#include "en.h"
#endif
#ifdef TEXTDATE_WITH_RU
#include "ru.h"
#endif

using std::string;
using std::string_view;
using textdate::Date;
using textdate::DateDiff;

namespace dateparsers {

constexpr int DAYS_PER_WEEK = 7;

const Language& Language::getByCode(string_view code) {
#ifdef TEXTDATE_WITH_EN
  if (code == "en") {
    return en::getLanguage();
  }
#endif
#ifdef TEXTDATE_WITH_RU
  if (code == "ru") {
    return ru::getLanguage();
  }
#endif
  throw std::invalid_argument("Unsupported language '" + string(code) + "'");
}

ValueMatch matchNamedWeekday(const Language& language, string_view text) {
  for (const Lexicon* lexicon : {&language.fullWeekdays, &language.shortWeekdaysWithDot, &language.shortWeekdays}) {
    ValueMatch weekday = lexicon->match(text);
    if (weekday.ok()) {
      return weekday;
    }
  }
  return ValueMatch::failure(ErrorKind::LEXICAL_MISMATCH);
}

Match namedWeekday(const Language& language, string_view text, const Date& reference) {
  ValueMatch weekday = matchNamedWeekday(language, text);
  if (!weekday.ok()) {
    return Match::failure(weekday.error);
  }
  int daysForward = (weekday.value - reference.dayOfWeek() + DAYS_PER_WEEK) % DAYS_PER_WEEK;
  return Match::ofDate(reference + DateDiff::fromDays(daysForward), weekday.length);
}

Match currentNamedWeekdayOnly(const Language& language, string_view text, const Date& reference) {
  ValueMatch weekday = matchNamedWeekday(language, text);
  if (!weekday.ok()) {
    return Match::failure(weekday.error);
  } else if (weekday.value != reference.dayOfWeek()) {
    return Match::failure(ErrorKind::DAY_MISMATCH);
  }
  return Match::success(reference, weekday.length);
}

Match weekdayOfCurrentWeek(const Language& language, string_view text, const Date& reference) {
  ValueMatch weekday = matchNamedWeekday(language, text);
  if (!weekday.ok()) {
    return Match::failure(weekday.error);
  }
  return Match::ofDate(reference + DateDiff::fromDays(weekday.value - reference.dayOfWeek()), weekday.length);
}

Match relativeDay(const Language& language, string_view text, const Date& reference) {
  ValueMatch offset = language.relativeDays.match(text);
  if (!offset.ok()) {
    return Match::failure(offset.error);
  }
  return Match::ofDate(reference + DateDiff::fromDays(offset.value), offset.length);
}

Match relativeDayWithOffset(const Language& language, string_view text, const Date& reference, int offset) {
  ValueMatch word = language.relativeDays.match(text);
  if (!word.ok()) {
    return Match::failure(word.error);
  } else if (word.value != offset) {
    return Match::failure(ErrorKind::LEXICAL_MISMATCH);
  }
  return Match::ofDate(reference + DateDiff::fromDays(offset), word.length);
}

}  // namespace dateparsers
