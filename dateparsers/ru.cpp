#include "ru.h"
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
namespace ru {

const Language& getLanguage() {
  static const Lexicon fullWeekdays = {
      {"понедельник", 0}, {"вторник", 1}, {"среда", 2},       {"четверг", 3},
      {"пятница", 4},     {"суббота", 5}, {"воскресенье", 6},
  };
  static const Lexicon shortWeekdaysWithDot = {
      {"пн.", 0}, {"вт.", 1}, {"ср.", 2}, {"чт.", 3}, {"пт.", 4}, {"сб.", 5}, {"вс.", 6},
  };
  static const Lexicon shortWeekdays = {
      {"пн", 0}, {"вт", 1}, {"ср", 2}, {"чт", 3}, {"пт", 4}, {"сб", 5}, {"вс", 6},
  };
  static const Lexicon relativeDays = {
      {"позавчера", -2}, {"вчера", -1}, {"сегодня", 0}, {"завтра", 1}, {"послезавтра", 2},
  };
  static const Lexicon offsetUnits = {
      {"дней", 1},   {"дня", 1},    {"день", 1},   {"дн", 1}, {"д", 1},
      {"недель", 7}, {"недели", 7}, {"неделя", 7}, {"нед", 7}, {"н", 7},
  };
  static const Language language = {"ru", fullWeekdays, shortWeekdaysWithDot, shortWeekdays, relativeDays,
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

const vector<Recognizer>& getBundleMembers() {
  static const vector<Recognizer> members = {
      ddMmY4, ddMmOnly, ddOnly, dayBeforeYesterday, yesterday, today, tomorrow, dayAfterTomorrow,
      weekdayOfCurrentWeek,
  };
  return members;
}

Match bundle(string_view text, const Date& reference) {
  return tryInOrder(getBundleMembers(), text, reference);
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
  static const vector<Recognizer> members = {quickBundle, bundle};
  return members;
}

Match versatile(string_view text, const Date& reference) {
  return tryInOrder(getVersatileMembers(), text, reference);
}

#endif

}  // namespace ru
}  // namespace dateparsers
