#include "registry.h"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "textdate/date.h"
#include "textdate/string.h"
#include "bundle.h"
#include "numeric.h"
#ifdef TEXTDATE_WITH_EN
#include "en.h"
#endif
#ifdef TEXTDATE_WITH_QUICK
#include "quick.h"
#endif
#ifdef TEXTDATE_WITH_RU
#include "ru.h"
#endif

using std::string;
using std::string_view;
using std::vector;
using textdate::Date;

namespace dateparsers {

static vector<RecognizerInfo> buildRecognizers() {
  vector<RecognizerInfo> recognizers = {
      {"dd_mm_only", "dd*mm", ddMmOnly, nullptr},
      {"dd_mm_y4", "dd*mm*yyyy", ddMmY4, nullptr},
      {"dd_only", "dd", ddOnly, nullptr},
      {"mm_dd_only", "mm*dd", mmDdOnly, nullptr},
      {"mm_dd_y4", "mm*dd*yyyy", mmDdY4, nullptr},
      {"y4_mm_dd", "yyyy*mm*dd", y4MmDd, nullptr},
#ifdef TEXTDATE_WITH_QUICK
      {"quick.backward_from_now", "[-]N", quick::backwardFromNow, nullptr},
      {"quick.bundle", "+N | -N", quick::bundle, quick::getBundleMembers},
      {"quick.forward_from_now", "[+]N", quick::forwardFromNow, nullptr},
#endif
#ifdef TEXTDATE_WITH_EN
      {"en.bundle_dmy", "dd*mm*yyyy | dd*mm | dd | relative day | weekday", en::bundleDmy, en::getBundleDmyMembers},
      {"en.bundle_mdy", "mm*dd*yyyy | mm*dd | dd | relative day | weekday", en::bundleMdy, en::getBundleMdyMembers},
      {"en.current_named_weekday_only", "weekday, only if it is the current day", en::currentNamedWeekdayOnly,
       nullptr},
      {"en.day_after_tomorrow", "[the] day after tomorrow", en::dayAfterTomorrow, nullptr},
      {"en.day_before_yesterday", "[the] day before yesterday", en::dayBeforeYesterday, nullptr},
      {"en.named_weekday", "Monday | mon. | mon | ...", en::namedWeekday, nullptr},
      {"en.relative_day", "yesterday | today | tomorrow | ...", en::relativeDay, nullptr},
      {"en.today", "today", en::today, nullptr},
      {"en.tomorrow", "tomorrow", en::tomorrow, nullptr},
      {"en.weekday_of_current_week", "weekday of the current week (Monday to Sunday)", en::weekdayOfCurrentWeek,
       nullptr},
      {"en.yesterday", "yesterday", en::yesterday, nullptr},
#ifdef TEXTDATE_WITH_QUICK
      {"en.quick_bundle", "+N [unit] | -N [unit]", en::quickBundle, en::getQuickBundleMembers},
      {"en.versatile", "en.quick_bundle | en.bundle_dmy", en::versatile, en::getVersatileMembers},
#endif
#endif
#ifdef TEXTDATE_WITH_RU
      {"ru.bundle", "dd*mm*yyyy | dd*mm | dd | relative day | weekday", ru::bundle, ru::getBundleMembers},
      {"ru.current_named_weekday_only", "weekday, only if it is the current day", ru::currentNamedWeekdayOnly,
       nullptr},
      {"ru.day_after_tomorrow", "послезавтра", ru::dayAfterTomorrow, nullptr},
      {"ru.day_before_yesterday", "позавчера", ru::dayBeforeYesterday, nullptr},
      {"ru.named_weekday", "понедельник | пн. | пн | ...", ru::namedWeekday, nullptr},
      {"ru.relative_day", "вчера | сегодня | завтра | ...", ru::relativeDay, nullptr},
      {"ru.today", "сегодня", ru::today, nullptr},
      {"ru.tomorrow", "завтра", ru::tomorrow, nullptr},
      {"ru.weekday_of_current_week", "weekday of the current week (Monday to Sunday)", ru::weekdayOfCurrentWeek,
       nullptr},
      {"ru.yesterday", "вчера", ru::yesterday, nullptr},
#ifdef TEXTDATE_WITH_QUICK
      {"ru.quick_bundle", "+N [unit] | -N [unit]", ru::quickBundle, ru::getQuickBundleMembers},
      {"ru.versatile", "ru.quick_bundle | ru.bundle", ru::versatile, ru::getVersatileMembers},
#endif
#endif
  };
  std::sort(recognizers.begin(), recognizers.end(),
            [](const RecognizerInfo& r1, const RecognizerInfo& r2) { return r1.name < r2.name; });
  return recognizers;
}

const vector<RecognizerInfo>& getRecognizers() {
  static const vector<RecognizerInfo> recognizers = buildRecognizers();
  return recognizers;
}

const RecognizerInfo* findRecognizer(string_view name) {
  const vector<RecognizerInfo>& recognizers = getRecognizers();
  auto it = std::lower_bound(recognizers.begin(), recognizers.end(), name,
                             [](const RecognizerInfo& info, string_view name) { return info.name < name; });
  return it != recognizers.end() && it->name == name ? &*it : nullptr;
}

string getDefaultRecognizerName(string_view lang) {
#ifdef TEXTDATE_WITH_QUICK
  return string(lang) + ".versatile";
#else
  return lang == "ru" ? "ru.bundle" : string(lang) + ".bundle_dmy";
#endif
}

template <class RecognizerFunction>
static Match recognizeEntireText(RecognizerFunction recognizer, string_view text) {
  string_view trimmedText = textdate::trim(text);
  Match match = recognizer(trimmedText);
  if (match.ok() && match.length != static_cast<int>(trimmedText.size())) {
    return Match::failure(ErrorKind::LEXICAL_MISMATCH);
  }
  return match;
}

Match parse(string_view name, string_view text, const Date& reference) {
  const RecognizerInfo* info = findRecognizer(name);
  if (info == nullptr) {
    throw std::invalid_argument("Unknown recognizer '" + string(name) + "'");
  }
  return parse(*info, text, reference);
}

Match parse(const RecognizerInfo& info, string_view text, const Date& reference, vector<ErrorKind>* memberErrors) {
  if (info.getMembers != nullptr) {
    return tryInOrder(info.getMembers(), text, reference, memberErrors);
  }
  if (memberErrors != nullptr) {
    memberErrors->clear();
  }
  return info.recognizer(text, reference);
}

Match parseEntireText(Recognizer recognizer, string_view text, const Date& reference) {
  return recognizeEntireText([&](string_view trimmedText) { return recognizer(trimmedText, reference); }, text);
}

Match parseEntireText(const RecognizerInfo& info, string_view text, const Date& reference,
                      vector<ErrorKind>* memberErrors) {
  return recognizeEntireText(
      [&](string_view trimmedText) { return parse(info, trimmedText, reference, memberErrors); }, text);
}

}  // namespace dateparsers
