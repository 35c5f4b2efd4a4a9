#include "fields.h"
#include <re2/re2.h>
#include <string_view>

using std::string_view;

namespace dateparsers {
namespace {

// reDigits must have exactly one capturing group containing the digits.
ValueMatch consumeNumber(string_view text, const re2::RE2& reDigits, int minValue, int maxValue) {
  re2::StringPiece input(text.data(), text.size());
  re2::StringPiece digits;
  if (!RE2::Consume(&input, reDigits, &digits)) {
    return ValueMatch::failure(ErrorKind::LEXICAL_MISMATCH);
  }
  int value = 0;
  for (char c : digits) {
    value = value * 10 + c - '0';
  }
  if (value < minValue || value > maxValue) {
    return ValueMatch::failure(ErrorKind::OUT_OF_RANGE);
  }
  return ValueMatch::success(value, static_cast<int>(digits.size()));
}

}  // namespace

ValueMatch matchDay(string_view text) {
  static const re2::RE2 reDay(R"((\d{1,2}))");
  return consumeNumber(text, reDay, 1, 31);
}

ValueMatch matchMonth(string_view text) {
  static const re2::RE2 reMonth(R"((\d{1,2}))");
  return consumeNumber(text, reMonth, 1, 12);
}

ValueMatch matchYear4(string_view text) {
  static const re2::RE2 reYear(R"((\d{4}))");
  return consumeNumber(text, reYear, 0, 9999);
}

int matchSeparator(string_view text) {
  static const re2::RE2 reSeparator(R"([/\-. \t]*)");
  re2::StringPiece input(text.data(), text.size());
  if (!RE2::Consume(&input, reSeparator)) {
    return 0;
  }
  return static_cast<int>(text.size() - input.size());
}

}  // namespace dateparsers
