#ifndef DATEPARSERS_LEXICON_H
#define DATEPARSERS_LEXICON_H

#include <initializer_list>
#include <memory>
#include <string_view>
#include <vector>
#include "match.h"

namespace re2 {
class RE2;
}

namespace dateparsers {

// A token and its meaning. Depending on the lexicon, the value is a day of the week (0 = Monday), a number of days
// relative to the reference date, or the number of days in a unit.
struct LexiconEntry {
  std::string_view token;
  int value;
};

// Closed table of words of a language. Tokens are matched case-insensitively (with Unicode case folding) and only as
// whole words: a token is not matched if it is immediately followed by a letter.
// When several tokens match, the first one in the table wins, so longer tokens should be listed before shorter ones
// sharing the same start (e.g. "the day after tomorrow" before "day after tomorrow").
// Lexicons are meant to be static constants: they are immutable and can be shared between threads.
class Lexicon {
public:
  // Token data must remain valid for the lifetime of the lexicon (typically, string literals).
  Lexicon(std::initializer_list<LexiconEntry> entries);
  ~Lexicon();

  ValueMatch match(std::string_view text) const;
  const std::vector<LexiconEntry>& entries() const { return m_entries; }

private:
  std::vector<LexiconEntry> m_entries;
  std::unique_ptr<re2::RE2> m_regexp;
};

}  // namespace dateparsers

#endif
