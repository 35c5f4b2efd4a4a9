// Calendar dates without time of the day.
#ifndef TEXTDATE_DATE_H
#define TEXTDATE_DATE_H

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace textdate {

// Represents a difference between two dates, with the same granularity as Date (1 day).
class DateDiff {
public:
  constexpr DateDiff() = default;
  static constexpr DateDiff fromDays(int64_t days) { return DateDiff(days); }

  constexpr int64_t days() const { return m_days; }
  bool operator==(const DateDiff& d) const { return m_days == d.m_days; }
  bool operator!=(const DateDiff& d) const { return m_days != d.m_days; }
  bool operator<(const DateDiff& d) const { return m_days < d.m_days; }
  bool operator>(const DateDiff& d) const { return m_days > d.m_days; }
  DateDiff operator+(const DateDiff& diff) const { return DateDiff(m_days + diff.m_days); }
  DateDiff operator-(const DateDiff& diff) const { return DateDiff(m_days - diff.m_days); }
  DateDiff operator-() const { return DateDiff(-m_days); }

private:
  explicit constexpr DateDiff(int64_t days) : m_days(days) {}

  int64_t m_days = 0;
};

// A day of the proleptic Gregorian calendar. The supported year range is 1-9999.
// The value of a default-constructed Date object is the null date, which does not represent a valid date.
// All its members are equal to 0 and it is lower than all other dates.
// Constructing a date that does not exist (e.g. February 30, month 13) gives the null date.
class Date {
public:
  // Parses a date in the format "YYYY-MM-DD".
  // Throws: ParseError if the format is wrong or the date does not exist.
  static Date fromISO8601(std::string_view s);
  // Same as fromISO8601 but returns the null date if s is empty.
  static Date fromISO8601OrEmpty(std::string_view s);

  // Days are counted from the Julian day number 0 (November 24, 4714 BC).
  static Date fromJulianDay(int64_t julianDay);

  static bool isValidDay(int y, int mo, int d);
  // Returns 0 if month is not in [1, 12].
  static int getNumDaysInMonth(int month, int year);

  constexpr Date() = default;
  Date(int y, int mo, int d);

  int year() const { return m_year; }
  int month() const { return m_month; }
  int day() const { return m_day; }  // Day of month.
  // 0 = Monday, 1 = Tuesday, ..., 6 = Sunday. Not supported for null dates.
  int dayOfWeek() const;
  // Not supported for null dates.
  int64_t julianDay() const;

  bool operator==(const Date& d) const { return sortKey() == d.sortKey(); }
  bool operator!=(const Date& d) const { return sortKey() != d.sortKey(); }
  bool operator<=(const Date& d) const { return sortKey() <= d.sortKey(); }
  bool operator>=(const Date& d) const { return sortKey() >= d.sortKey(); }
  bool operator<(const Date& d) const { return sortKey() < d.sortKey(); }
  bool operator>(const Date& d) const { return sortKey() > d.sortKey(); }
  // Return the null date if the result is out of the supported range or if this date is null.
  Date operator+(const DateDiff& diff) const;
  Date operator-(const DateDiff& diff) const;
  // Not supported for null dates.
  DateDiff operator-(const Date& d) const;

  // Serializes in ISO8601 format, e.g. "2001-02-03". The null date is serialized as "0000-00-00".
  std::string toISO8601() const;
  bool isNull() const { return sortKey() == 0; }

  // Returns the current day in the local time zone.
  static Date today();

private:
  int32_t sortKey() const { return (static_cast<int32_t>(m_year) << 16) + (m_month << 8) + m_day; }

  int16_t m_year = 0;
  int8_t m_month = 0;
  int8_t m_day = 0;
};

inline std::ostream& operator<<(std::ostream& os, const Date& date) {
  return os << date.toISO8601();
}

// Overload for args_parser.
void initFromFlagValue(const std::string& rawValue, Date& date);

}  // namespace textdate

#endif
