#ifndef TEXTDATE_STRING_H
#define TEXTDATE_STRING_H

#include <string>
#include <string_view>

namespace textdate {

enum TrimOptions {
  TRIM_LEFT = 1,
  TRIM_RIGHT = 2,
  TRIM_BOTH = TRIM_LEFT | TRIM_RIGHT,
};

// Removes ASCII whitespace. trimOptions is a combination of flags from TrimOptions.
std::string_view trim(std::string_view s, int trimOptions = TRIM_BOTH);
template <class T>
std::string join(const T& begin, const T& end, std::string_view delimiter) {
  std::string result;
  T it = begin;
  if (it != end) {
    result += *it;
    for (++it; it != end; ++it) {
      result += delimiter;
      result += *it;
    }
  }
  return result;
}

template <class T>
inline std::string join(const T& items, std::string_view delimiter) {
  return join(items.begin(), items.end(), delimiter);
}

}  // namespace textdate

#endif
