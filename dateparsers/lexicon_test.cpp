#include "lexicon.h"
#include "textdate/log.h"
#include "textdate/unittest.h"
#include "test_util.h"

namespace dateparsers {

class LexiconTest : public textdate::Test {
private:
  TEXTDATE_TEST_CASE(firstEntryWins) {
    Lexicon lexicon = {{"day after", 2}, {"day", 1}, {"d", 5}};
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("day after tomorrow")), "2|9");
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("day")), "1|3");
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("day, after")), "1|3");
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("d.")), "5|1");
    TEXTDATE_ASSERT_EQ(lexicon.entries().size(), 3u);
  }

  TEXTDATE_TEST_CASE(caseInsensitivity) {
    Lexicon lexicon = {{"monday", 0}, {"среда", 2}};
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("Monday")), "0|6");
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("MONDAY")), "0|6");
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("среда")), "2|10");
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("СРЕДА")), "2|10");
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("Среда")), "2|10");
  }

  TEXTDATE_TEST_CASE(wholeWordsOnly) {
    Lexicon lexicon = {{"day", 1}, {"d", 5}, {"среда", 2}};
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("days")), "LEXICAL_MISMATCH");
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("dx")), "LEXICAL_MISMATCH");
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("средам")), "LEXICAL_MISMATCH");
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("day1")), "1|3");
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("среда!")), "2|10");
    // Matching is anchored at the start of the text.
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match(" day")), "LEXICAL_MISMATCH");
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("")), "LEXICAL_MISMATCH");
  }

  TEXTDATE_TEST_CASE(specialCharacters) {
    Lexicon lexicon = {{"mon.", 0}, {"a+b", 1}};
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("mon.")), "0|4");
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("MON. 12")), "0|4");
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("monx")), "LEXICAL_MISMATCH");
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("a+b")), "1|3");
    TEXTDATE_ASSERT_EQ(debugStringOfValueMatch(lexicon.match("aab")), "LEXICAL_MISMATCH");
  }
};

}  // namespace dateparsers

int main(int argc, char** argv) {
  dateparsers::LexiconTest().run(argc, argv);
  return 0;
}
