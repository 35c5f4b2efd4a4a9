// Russian words for dates.
#ifndef DATEPARSERS_RU_H
#define DATEPARSERS_RU_H

#include <string_view>
#include <vector>
#include "textdate/date.h"
#include "language.h"
#include "match.h"

namespace dateparsers {
namespace ru {

const Language& getLanguage();

// "позавчера".
Match dayBeforeYesterday(std::string_view text, const textdate::Date& reference);
Match yesterday(std::string_view text, const textdate::Date& reference);
Match today(std::string_view text, const textdate::Date& reference);
Match tomorrow(std::string_view text, const textdate::Date& reference);
// "послезавтра".
Match dayAfterTomorrow(std::string_view text, const textdate::Date& reference);
Match relativeDay(std::string_view text, const textdate::Date& reference);

// "понедельник", "пн.", "пн", etc.
Match namedWeekday(std::string_view text, const textdate::Date& reference);
Match currentNamedWeekdayOnly(std::string_view text, const textdate::Date& reference);
Match weekdayOfCurrentWeek(std::string_view text, const textdate::Date& reference);

// "13.07.2024", "13.07", "13", then the relative days above, then weekdayOfCurrentWeek.
Match bundle(std::string_view text, const textdate::Date& reference);
const std::vector<Recognizer>& getBundleMembers();

#ifdef TEXTDATE_WITH_QUICK
// "+3", "-2 дня", "+ 1 неделя", etc. The sign is required.
Match quickBundle(std::string_view text, const textdate::Date& reference);
const std::vector<Recognizer>& getQuickBundleMembers();
// quickBundle, then bundle.
Match versatile(std::string_view text, const textdate::Date& reference);
const std::vector<Recognizer>& getVersatileMembers();
#endif

}  // namespace ru
}  // namespace dateparsers

#endif
