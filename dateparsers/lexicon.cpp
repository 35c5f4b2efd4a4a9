#include "lexicon.h"
#include <re2/re2.h>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "textdate/log.h"

using std::string;
using std::string_view;
using std::vector;

namespace dateparsers {

Lexicon::Lexicon(std::initializer_list<LexiconEntry> entries) : m_entries(entries) {
  // One capturing group per entry, in the order of the table. Alternatives are tried from left to right.
  string pattern = "(?i)(?:";
  for (size_t i = 0; i < m_entries.size(); i++) {
    if (i > 0) pattern += '|';
    pattern += '(';
    pattern += RE2::QuoteMeta(re2::StringPiece(m_entries[i].token.data(), m_entries[i].token.size()));
    pattern += ')';
  }
  pattern += R"()(?:[^\pL]|$))";
  m_regexp = std::make_unique<re2::RE2>(pattern);
  TEXTDATE_ASSERT(m_regexp->ok()) << "Cannot compile lexicon: " << m_regexp->error();
}

Lexicon::~Lexicon() = default;

ValueMatch Lexicon::match(string_view text) const {
  re2::StringPiece input(text.data(), text.size());
  // Group 0 is the whole match, including the character following the token.
  vector<re2::StringPiece> groups(m_entries.size() + 1);
  if (!m_regexp->Match(input, 0, input.size(), RE2::ANCHOR_START, groups.data(), groups.size())) {
    return ValueMatch::failure(ErrorKind::LEXICAL_MISMATCH);
  }
  for (size_t i = 0; i < m_entries.size(); i++) {
    const re2::StringPiece& token = groups[i + 1];
    if (token.data() != nullptr) {
      return ValueMatch::success(m_entries[i].value, static_cast<int>(token.size()));
    }
  }
  return ValueMatch::failure(ErrorKind::LEXICAL_MISMATCH);
}

}  // namespace dateparsers
