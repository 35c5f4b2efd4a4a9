// Results shared by all recognizers.
#ifndef DATEPARSERS_MATCH_H
#define DATEPARSERS_MATCH_H

#include <ostream>
#include <string_view>
#include "textdate/date.h"

namespace dateparsers {

enum class ErrorKind {
  NONE,
  // The input does not have the expected shape (wrong characters, not enough digits, unknown word).
  LEXICAL_MISMATCH,
  // Digits were matched but the value is not allowed for the field (e.g. month 13).
  OUT_OF_RANGE,
  // All fields are valid but do not form a real date (e.g. April 31), or the result is outside years 1-9999.
  CALENDAR_INVALID,
  // The reference date does not fall on the requested day of the week.
  DAY_MISMATCH,
  // Returned by bundles when all their members failed.
  NO_ALTERNATIVE_MATCHED,
};

std::string_view getStringOfErrorKind(ErrorKind errorKind);
std::ostream& operator<<(std::ostream& os, ErrorKind errorKind);

// Result of a recognizer. On success, `date` is not null and `length` is the number of bytes consumed from the start
// of the input. On failure, only `error` is meaningful.
struct Match {
  textdate::Date date;
  int length = 0;
  ErrorKind error = ErrorKind::NONE;

  bool ok() const { return error == ErrorKind::NONE; }

  static Match success(const textdate::Date& date, int length) { return {date, length, ErrorKind::NONE}; }
  static Match failure(ErrorKind error) { return {textdate::Date(), 0, error}; }
  // Success if `date` is not null, CALENDAR_INVALID otherwise.
  static Match ofDate(const textdate::Date& date, int length) {
    return date.isNull() ? failure(ErrorKind::CALENDAR_INVALID) : success(date, length);
  }
};

// Result of a matcher that produces a number instead of a date (numeric field, word of a lexicon).
struct ValueMatch {
  int value = 0;
  int length = 0;
  ErrorKind error = ErrorKind::NONE;

  bool ok() const { return error == ErrorKind::NONE; }

  static ValueMatch success(int value, int length) { return {value, length, ErrorKind::NONE}; }
  static ValueMatch failure(ErrorKind error) { return {0, 0, error}; }
};

// A recognizer reads a date at the start of `text`, resolving missing or relative parts with `reference`.
// Recognizers are pure functions: they do not have any state and do not read the clock.
using Recognizer = Match (*)(std::string_view text, const textdate::Date& reference);

}  // namespace dateparsers

#endif
