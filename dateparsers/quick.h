// Offsets in days from the reference date, e.g. "+3", "- 2", "10". With a table of units, "+2 weeks" is also accepted.
#ifndef DATEPARSERS_QUICK_H
#define DATEPARSERS_QUICK_H

#include <string_view>
#include <vector>
#include "textdate/date.h"
#include "lexicon.h"
#include "match.h"

namespace dateparsers {

enum class Direction {
  FORWARD,
  BACKWARD,
};

enum SignOptions {
  // A number without sign is accepted and moves in the direction passed to matchOffset.
  SIGN_OPTIONAL,
  SIGN_REQUIRED,
};

// Reads an optional sign, optional spaces or tabs, a decimal integer and, if `units` is not null, optional spaces or
// tabs followed by a unit multiplying the integer. A sign that does not agree with `direction` is a LEXICAL_MISMATCH.
Match matchOffset(std::string_view text, const textdate::Date& reference, Direction direction,
                  SignOptions signOptions, const Lexicon* units = nullptr);

namespace quick {

// "+N" or "N": reference + N days.
Match forwardFromNow(std::string_view text, const textdate::Date& reference);
// "-N" or "N": reference - N days.
Match backwardFromNow(std::string_view text, const textdate::Date& reference);
// "+N" or "-N". The sign is required.
Match bundle(std::string_view text, const textdate::Date& reference);

const std::vector<Recognizer>& getBundleMembers();

}  // namespace quick
}  // namespace dateparsers

#endif
