#include "bundle.h"
#include <string_view>
#include <vector>
#include "textdate/date.h"

using std::string_view;
using std::vector;
using textdate::Date;

namespace dateparsers {

Match tryInOrder(const vector<Recognizer>& recognizers, string_view text, const Date& reference,
                 vector<ErrorKind>* memberErrors) {
  if (memberErrors != nullptr) {
    memberErrors->clear();
  }
  for (Recognizer recognizer : recognizers) {
    Match match = recognizer(text, reference);
    if (match.ok()) {
      if (memberErrors != nullptr) {
        memberErrors->clear();
      }
      return match;
    } else if (memberErrors != nullptr) {
      memberErrors->push_back(match.error);
    }
  }
  return Match::failure(ErrorKind::NO_ALTERNATIVE_MATCHED);
}

}  // namespace dateparsers
