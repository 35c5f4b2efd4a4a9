#include "quick.h"
#include <re2/re2.h>
#include <cstdint>
#include <string_view>
#include <vector>
#include "textdate/date.h"
#include "bundle.h"

using std::string_view;
using std::vector;
using textdate::Date;
using textdate::DateDiff;

namespace dateparsers {
namespace {

// Any larger quantity moves out of years 1-9999 whatever the unit and the reference date.
constexpr int64_t MAX_QUANTITY = 10'000'000;

Match forwardWithSign(string_view text, const Date& reference) {
  return matchOffset(text, reference, Direction::FORWARD, SIGN_REQUIRED);
}

Match backwardWithSign(string_view text, const Date& reference) {
  return matchOffset(text, reference, Direction::BACKWARD, SIGN_REQUIRED);
}

}  // namespace

Match matchOffset(string_view text, const Date& reference, Direction direction, SignOptions signOptions,
                  const Lexicon* units) {
  static const re2::RE2 reQuantity(R"((?:([+-])[ \t]*)?(\d+))");
  static const re2::RE2 reSpaces(R"([ \t]*)");
  re2::StringPiece input(text.data(), text.size());
  re2::StringPiece sign, digits;
  if (!RE2::Consume(&input, reQuantity, &sign, &digits)) {
    return Match::failure(ErrorKind::LEXICAL_MISMATCH);
  }
  if (sign.empty()) {
    if (signOptions == SIGN_REQUIRED) {
      return Match::failure(ErrorKind::LEXICAL_MISMATCH);
    }
  } else if ((sign[0] == '+') != (direction == Direction::FORWARD)) {
    return Match::failure(ErrorKind::LEXICAL_MISMATCH);
  }

  bool tooLarge = false;
  int64_t quantity = 0;
  for (char c : digits) {
    quantity = quantity * 10 + c - '0';
    if (quantity > MAX_QUANTITY) {
      tooLarge = true;
      quantity = MAX_QUANTITY;
    }
  }
  int length = static_cast<int>(text.size() - input.size());

  if (units != nullptr) {
    re2::StringPiece afterSpaces = input;
    if (RE2::Consume(&afterSpaces, reSpaces)) {
      string_view remaining(afterSpaces.data(), afterSpaces.size());
      ValueMatch unit = units->match(remaining);
      if (unit.ok()) {
        quantity *= unit.value;
        length = static_cast<int>(text.size() - remaining.size()) + unit.length;
      }
    }
  }

  if (tooLarge) {
    return Match::failure(ErrorKind::CALENDAR_INVALID);
  }
  DateDiff offset = DateDiff::fromDays(direction == Direction::FORWARD ? quantity : -quantity);
  return Match::ofDate(reference + offset, length);
}

namespace quick {

Match forwardFromNow(string_view text, const Date& reference) {
  return matchOffset(text, reference, Direction::FORWARD, SIGN_OPTIONAL);
}

Match backwardFromNow(string_view text, const Date& reference) {
  return matchOffset(text, reference, Direction::BACKWARD, SIGN_OPTIONAL);
}

const vector<Recognizer>& getBundleMembers() {
  static const vector<Recognizer> members = {forwardWithSign, backwardWithSign};
  return members;
}

Match bundle(string_view text, const Date& reference) {
  return tryInOrder(getBundleMembers(), text, reference);
}

}  // namespace quick
}  // namespace dateparsers
