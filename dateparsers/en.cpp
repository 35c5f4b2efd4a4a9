#include "en.h"
#include <string_view>
#include <vector>
#include "textdate/date.h"
#include "bundle.h"
#include "language.h"
#include "lexicon.h"
#include "numeric.h"
#ifdef TEXTDATE_WITH_QUICK
#include "quick.h"
#endif

using std::string_view;
using std::vector;
using textdate::Date;

namespace dateparsers {
namespace en {

const Language& getLanguage() {
  static const Lexicon fullWeekdays = {
      {"monday", 0}, {"tuesday", 1}, {"wednesday", 2}, {"thursday", 3},
      {"friday", 4}, {"saturday", 5}, {"sunday", 6},
  };
  static const Lexicon shortWeekdaysWithDot = {
      {"mon.", 0},   {"tue.", 1}, {"tues.", 1}, {"wed.", 2}, {"thu.", 3},
      {"thur.", 3}, {"thurs.", 3}, {"fri.", 4}, {"sat.", 5}, {"sun.", 6},
  };
  static const Lexicon shortWeekdays = {
      {"mon", 0},   {"tue", 1},   {"tues", 1}, {"wed", 2}, {"thu", 3},
      {"thur", 3}, {"thurs", 3}, {"fri", 4},  {"sat", 5}, {"sun", 6},
  };
  static const Lexicon relativeDays = {
      {"the day before yesterday", -2},
      {"day before yesterday", -2},
      {"yesterday", -1},
      {"today", 0},
      {"tomorrow", 1},
      {"the day after tomorrow", 2},
      {"day after tomorrow", 2},
  };
  static const Lexicon offsetUnits = {
      {"days", 1}, {"day", 1}, {"d", 1}, {"weeks", 7}, {"week", 7}, {"wk", 7}, {"w", 7},
  };
  static const Language language = {"en", fullWeekdays, shortWeekdaysWithDot, shortWeekdays, relativeDays,
                                    offsetUnits};
  return language;
}

Match dayBeforeYesterday(string_view text, const Date& reference) {
  return relativeDayWithOffset(getLanguage(), text, reference, -2);
}

Match yesterday(string_view text, const Date& reference) {
  return relativeDayWithOffset(getLanguage(), text, reference, -1);
}

Match today(string_view text, const Date& reference) {
  return relativeDayWithOffset(getLanguage(), text, reference, 0);
}

Match tomorrow(string_view text, const Date& reference) {
  return relativeDayWithOffset(getLanguage(), text, reference, 1);
}

Match dayAfterTomorrow(string_view text, const Date& reference) {
  return relativeDayWithOffset(getLanguage(), text, reference, 2);
}

Match relativeDay(string_view text, const Date& reference) {
  return dateparsers::relativeDay(getLanguage(), text, reference);
}

Match namedWeekday(string_view text, const Date& reference) {
  return dateparsers::namedWeekday(getLanguage(), text, reference);
}

Match currentNamedWeekdayOnly(string_view text, const Date& reference) {
  return dateparsers::currentNamedWeekdayOnly(getLanguage(), text, reference);
}

Match weekdayOfCurrentWeek(string_view text, const Date& reference) {
  return dateparsers::weekdayOfCurrentWeek(getLanguage(), text, reference);
}

const vector<Recognizer>& getBundleDmyMembers() {
  static const vector<Recognizer> members = {
      ddMmY4, ddMmOnly, ddOnly, dayBeforeYesterday, yesterday, today, tomorrow, dayAfterTomorrow,
      weekdayOfCurrentWeek,
  };
  return members;
}

Match bundleDmy(string_view text, const Date& reference) {
  return tryInOrder(getBundleDmyMembers(), text, reference);
}

const vector<Recognizer>& getBundleMdyMembers() {
  static const vector<Recognizer> members = {
      mmDdY4, mmDdOnly, ddOnly, dayBeforeYesterday, yesterday, today, tomorrow, dayAfterTomorrow,
      weekdayOfCurrentWeek,
  };
  return members;
}

Match bundleMdy(string_view text, const Date& reference) {
  return tryInOrder(getBundleMdyMembers(), text, reference);
}

#ifdef TEXTDATE_WITH_QUICK

static Match forwardWithUnit(string_view text, const Date& reference) {
  return matchOffset(text, reference, Direction::FORWARD, SIGN_REQUIRED, &getLanguage().offsetUnits);
}

static Match backwardWithUnit(string_view text, const Date& reference) {
  return matchOffset(text, reference, Direction::BACKWARD, SIGN_REQUIRED, &getLanguage().offsetUnits);
}

const vector<Recognizer>& getQuickBundleMembers() {
  static const vector<Recognizer> members = {forwardWithUnit, backwardWithUnit};
  return members;
}

Match quickBundle(string_view text, const Date& reference) {
  return tryInOrder(getQuickBundleMembers(), text, reference);
}

const vector<Recognizer>& getVersatileMembers() {
  static const vector<Recognizer> members = {quickBundle, bundleDmy};
  return members;
}

Match versatile(string_view text, const Date& reference) {
  return tryInOrder(getVersatileMembers(), text, reference);
}

#endif

}  // namespace en
}  // namespace dateparsers
