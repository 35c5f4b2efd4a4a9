// English words for dates.
#ifndef DATEPARSERS_EN_H
#define DATEPARSERS_EN_H

#include <string_view>
#include <vector>
#include "textdate/date.h"
#include "language.h"
#include "match.h"

namespace dateparsers {
namespace en {

const Language& getLanguage();

// "the day before yesterday", "day before yesterday".
Match dayBeforeYesterday(std::string_view text, const textdate::Date& reference);
Match yesterday(std::string_view text, const textdate::Date& reference);
Match today(std::string_view text, const textdate::Date& reference);
Match tomorrow(std::string_view text, const textdate::Date& reference);
// "the day after tomorrow", "day after tomorrow".
Match dayAfterTomorrow(std::string_view text, const textdate::Date& reference);
Match relativeDay(std::string_view text, const textdate::Date& reference);

// "Monday", "mon.", "mon", etc.
Match namedWeekday(std::string_view text, const textdate::Date& reference);
Match currentNamedWeekdayOnly(std::string_view text, const textdate::Date& reference);
Match weekdayOfCurrentWeek(std::string_view text, const textdate::Date& reference);

// Day first: "13/07/2024", "13/07", "13", then the relative days above, then weekdayOfCurrentWeek.
Match bundleDmy(std::string_view text, const textdate::Date& reference);
const std::vector<Recognizer>& getBundleDmyMembers();
// Month first: "07/13/2024", "07/13", "13", then the relative days above, then weekdayOfCurrentWeek.
Match bundleMdy(std::string_view text, const textdate::Date& reference);
const std::vector<Recognizer>& getBundleMdyMembers();

#ifdef TEXTDATE_WITH_QUICK
// "+3", "-2 days", "+ 1 week", etc. The sign is required.
Match quickBundle(std::string_view text, const textdate::Date& reference);
const std::vector<Recognizer>& getQuickBundleMembers();
// quickBundle, then bundleDmy.
Match versatile(std::string_view text, const textdate::Date& reference);
const std::vector<Recognizer>& getVersatileMembers();
#endif

}  // namespace en
}  // namespace dateparsers

#endif
