#include "match.h"
#include <ostream>
#include <string_view>

using std::string_view;

namespace dateparsers {

string_view getStringOfErrorKind(ErrorKind errorKind) {
  switch (errorKind) {
    case ErrorKind::NONE:
      return "NONE";
    case ErrorKind::LEXICAL_MISMATCH:
      return "LEXICAL_MISMATCH";
    case ErrorKind::OUT_OF_RANGE:
      return "OUT_OF_RANGE";
    case ErrorKind::CALENDAR_INVALID:
      return "CALENDAR_INVALID";
    case ErrorKind::DAY_MISMATCH:
      return "DAY_MISMATCH";
    case ErrorKind::NO_ALTERNATIVE_MATCHED:
      return "NO_ALTERNATIVE_MATCHED";
  }
  return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, ErrorKind errorKind) {
  return os << getStringOfErrorKind(errorKind);
}

}  // namespace dateparsers
