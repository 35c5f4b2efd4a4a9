#include "string.h"
#include <ctype.h>
#include <string_view>

using std::string_view;

namespace textdate {

string_view trim(string_view s, int trimOptions) {
  const char* start = s.data();
  const char* end = start + s.size();
  if (trimOptions & TRIM_LEFT) {
    for (; start < end && isspace(static_cast<unsigned char>(*start)); start++) {}
  }
  if (trimOptions & TRIM_RIGHT) {
    for (; start < end && isspace(static_cast<unsigned char>(*(end - 1))); end--) {}
  }
  return string_view(start, end - start);
}

}  // namespace textdate
