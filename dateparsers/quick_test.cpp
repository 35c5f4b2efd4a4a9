#include "quick.h"
#include "textdate/date.h"
#include "textdate/log.h"
#include "textdate/unittest.h"
#include "lexicon.h"
#include "test_util.h"

using textdate::Date;

namespace dateparsers {

class QuickTest : public textdate::Test {
private:
  void setUp() { m_reference = getTestReferenceDate(); }

  TEXTDATE_TEST_CASE(forwardFromNow) {
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::forwardFromNow("1", m_reference)), "2024-03-16|1");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::forwardFromNow("+1", m_reference)), "2024-03-16|2");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::forwardFromNow("+ 1", m_reference)), "2024-03-16|3");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::forwardFromNow("+\t42", m_reference)), "2024-04-26|4");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::forwardFromNow("0", m_reference)), "2024-03-15|1");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::forwardFromNow("-1", m_reference)), "LEXICAL_MISMATCH");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::forwardFromNow("+", m_reference)), "LEXICAL_MISMATCH");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::forwardFromNow("", m_reference)), "LEXICAL_MISMATCH");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::forwardFromNow("abc", m_reference)), "LEXICAL_MISMATCH");
    // Units are only accepted by the language-specific variants.
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::forwardFromNow("+2 days", m_reference)), "2024-03-17|2");
  }

  TEXTDATE_TEST_CASE(backwardFromNow) {
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::backwardFromNow("5", m_reference)), "2024-03-10|1");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::backwardFromNow("-123", m_reference)), "2023-11-13|4");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::backwardFromNow("- 15", m_reference)), "2024-02-29|4");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::backwardFromNow("+1", m_reference)), "LEXICAL_MISMATCH");
  }

  TEXTDATE_TEST_CASE(bundle) {
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::bundle("+ 42", m_reference)), "2024-04-26|4");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::bundle("-123", m_reference)), "2023-11-13|4");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::bundle("+\t42", m_reference)), "2024-04-26|4");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::bundle("42", m_reference)), "NO_ALTERNATIVE_MATCHED");
    TEXTDATE_ASSERT_EQ(quick::getBundleMembers().size(), 2u);
  }

  TEXTDATE_TEST_CASE(outOfRange) {
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::forwardFromNow("3000000", m_reference)), "CALENDAR_INVALID");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::backwardFromNow("-3000000", m_reference)), "CALENDAR_INVALID");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::forwardFromNow("99999999999999999999999", m_reference)),
                       "CALENDAR_INVALID");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(quick::forwardFromNow("1", Date(9999, 12, 31))), "CALENDAR_INVALID");
  }

  TEXTDATE_TEST_CASE(matchOffsetWithUnits) {
    Lexicon units = {{"x", 10}};
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(matchOffset("+2 x", m_reference, Direction::FORWARD, SIGN_REQUIRED, &units)),
                       "2024-04-04|4");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(matchOffset("2x", m_reference, Direction::FORWARD, SIGN_OPTIONAL, &units)),
                       "2024-04-04|2");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(matchOffset("2 y", m_reference, Direction::BACKWARD, SIGN_OPTIONAL, &units)),
                       "2024-03-13|1");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(matchOffset("2", m_reference, Direction::BACKWARD, SIGN_REQUIRED, &units)),
                       "LEXICAL_MISMATCH");
  }

  Date m_reference;
};

}  // namespace dateparsers

int main(int argc, char** argv) {
  dateparsers::QuickTest().run(argc, argv);
  return 0;
}
