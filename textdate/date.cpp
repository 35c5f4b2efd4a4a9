#include "date.h"
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>
#include <string_view>
#include "error.h"

using std::string;
using std::string_view;

namespace textdate {

constexpr string_view ISO8601_PATTERN = "####-##-##";
constexpr int EXTRA_SNPRINTF_MARGIN = 20;
constexpr int DAYS_PER_MONTH[13] = {0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
// Julian day numbers of 0001-01-01 and 9999-12-31.
constexpr int64_t MIN_JULIAN_DAY = 1721426;
constexpr int64_t MAX_JULIAN_DAY = 5373484;

Date::Date(int y, int mo, int d) {
  if (isValidDay(y, mo, d)) {
    m_year = static_cast<int16_t>(y);
    m_month = static_cast<int8_t>(mo);
    m_day = static_cast<int8_t>(d);
  }
}

bool Date::isValidDay(int y, int mo, int d) {
  return y >= 1 && y <= 9999 && d >= 1 && d <= getNumDaysInMonth(mo, y);
}

int Date::getNumDaysInMonth(int month, int year) {
  if (month == 2 && year % 4 == 0 && (year % 100 != 0 || year % 400 == 0)) {
    return 29;
  } else if (month >= 1 && month <= 12) {
    return DAYS_PER_MONTH[month];
  } else {
    return 0;
  }
}

// Fliegel and Van Flandern algorithm for the Gregorian calendar.
int64_t Date::julianDay() const {
  int64_t y = m_year, mo = m_month, d = m_day;
  int64_t o = mo <= 2 ? -1 : 0;
  return (1461 * (y + 4800 + o)) / 4 + (367 * (mo - 2 - 12 * o)) / 12 - (3 * ((y + 4900 + o) / 100)) / 4 + d -
         32075;
}

Date Date::fromJulianDay(int64_t julianDay) {
  if (julianDay < MIN_JULIAN_DAY || julianDay > MAX_JULIAN_DAY) {
    return Date();
  }
  int64_t l = julianDay + 68569;
  int64_t n = (4 * l) / 146097;
  l = l - (146097 * n + 3) / 4;
  int64_t i = (4000 * (l + 1)) / 1461001;
  l = l - (1461 * i) / 4 + 31;
  int64_t j = (80 * l) / 2447;
  int day = static_cast<int>(l - (2447 * j) / 80);
  l = j / 11;
  int month = static_cast<int>(j + 2 - 12 * l);
  int year = static_cast<int>(100 * (n - 49) + i + l);
  return Date(year, month, day);
}

int Date::dayOfWeek() const {
  // The Julian day 0 was a Monday.
  return static_cast<int>(julianDay() % 7);
}

Date Date::operator+(const DateDiff& diff) const {
  if (isNull()) return Date();
  // Avoids overflows for huge differences. Anything beyond that is out of range anyway.
  if (diff.days() > MAX_JULIAN_DAY || diff.days() < -MAX_JULIAN_DAY) return Date();
  return fromJulianDay(julianDay() + diff.days());
}

Date Date::operator-(const DateDiff& diff) const {
  return *this + (-diff);
}

DateDiff Date::operator-(const Date& d) const {
  return DateDiff::fromDays(julianDay() - d.julianDay());
}

string Date::toISO8601() const {
  char buffer[11 + EXTRA_SNPRINTF_MARGIN];
  snprintf(buffer, sizeof(buffer), "%04i-%02i-%02i", static_cast<int>(m_year), static_cast<int>(m_month),
           static_cast<int>(m_day));
  return buffer;
}

Date Date::today() {
  time_t t = time(nullptr);
  tm localDate;
  localtime_r(&t, &localDate);
  return Date(localDate.tm_year + 1900, localDate.tm_mon + 1, localDate.tm_mday);
}

Date Date::fromISO8601(string_view s) {
  if (s.size() != ISO8601_PATTERN.size()) {
    throw ParseError("Invalid ISO8601 date '" + string(s) + "'");
  }
  int fields[3] = {0, 0, 0};
  int fieldIndex = 0;
  for (size_t i = 0; i < s.size(); i++) {
    char c = s[i];
    if (ISO8601_PATTERN[i] == '#') {
      if (c < '0' || c > '9') {
        throw ParseError("Invalid ISO8601 date '" + string(s) + "'");
      }
      fields[fieldIndex] = fields[fieldIndex] * 10 + (c - '0');
    } else if (c == ISO8601_PATTERN[i]) {
      fieldIndex++;
    } else {
      throw ParseError("Invalid ISO8601 date '" + string(s) + "'");
    }
  }
  Date date(fields[0], fields[1], fields[2]);
  if (date.isNull()) {
    throw ParseError("Non-existent date '" + string(s) + "'");
  }
  return date;
}

Date Date::fromISO8601OrEmpty(string_view s) {
  return s.empty() ? Date() : Date::fromISO8601(s);
}

void initFromFlagValue(const string& rawValue, Date& date) {
  date = Date::fromISO8601OrEmpty(rawValue);
  if (date.isNull()) {
    throw ParseError("Cannot parse flag value '" + rawValue + "' as a date");
  }
}

}  // namespace textdate
