#include "registry.h"
#include <stdexcept>
#include <string_view>
#include <vector>
#include "textdate/date.h"
#include "textdate/log.h"
#include "textdate/unittest.h"
#include "numeric.h"
#include "test_util.h"

using std::string_view;
using std::vector;
using textdate::Date;

namespace dateparsers {

class RegistryTest : public textdate::Test {
private:
  void setUp() { m_reference = getTestReferenceDate(); }

  TEXTDATE_TEST_CASE(findRecognizer) {
    const RecognizerInfo* info = findRecognizer("dd_mm_y4");
    TEXTDATE_ASSERT(info != nullptr);
    TEXTDATE_ASSERT_EQ(info->name, "dd_mm_y4");
    TEXTDATE_ASSERT(info->recognizer == ddMmY4);
    TEXTDATE_ASSERT(info->getMembers == nullptr);
    TEXTDATE_ASSERT(findRecognizer("dd_mm_y2") == nullptr);
    TEXTDATE_ASSERT(findRecognizer("") == nullptr);
  }

  TEXTDATE_TEST_CASE(namesAreSortedAndUnique) {
    const auto& recognizers = getRecognizers();
    TEXTDATE_ASSERT(recognizers.size() >= 6);
    for (size_t i = 1; i < recognizers.size(); i++) {
      TEXTDATE_ASSERT(recognizers[i - 1].name < recognizers[i].name) << recognizers[i].name;
    }
    for (const RecognizerInfo& info : recognizers) {
      TEXTDATE_ASSERT(findRecognizer(info.name) == &info) << info.name;
      // Empty text is never a date.
      TEXTDATE_ASSERT(!info.recognizer("", m_reference).ok()) << info.name;
    }
  }

  TEXTDATE_TEST_CASE(parse) {
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(parse("dd_mm_only", "01/02", m_reference)), "2024-02-01|5");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(parse("y4_mm_dd", "2024-07-13", m_reference)), "2024-07-13|10");
#ifdef TEXTDATE_WITH_QUICK
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(parse("quick.forward_from_now", "1", m_reference)), "2024-03-16|1");
#endif
#ifdef TEXTDATE_WITH_EN
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(parse("en.yesterday", "yesterday", m_reference)), "2024-03-14|9");
    TEXTDATE_ASSERT_EQ(findRecognizer("en.bundle_dmy")->getMembers().size(), 9u);
#endif
#ifdef TEXTDATE_WITH_RU
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(parse("ru.bundle", "вчера", m_reference)), "2024-03-14|10");
#endif
    bool errorThrown = false;
    try {
      parse("fr.bundle", "hier", m_reference);
    } catch (const std::invalid_argument&) {
      errorThrown = true;
    }
    TEXTDATE_ASSERT(errorThrown);
  }

  TEXTDATE_TEST_CASE(defaultRecognizerIsRegistered) {
#ifdef TEXTDATE_WITH_EN
    TEXTDATE_ASSERT(findRecognizer(getDefaultRecognizerName("en")) != nullptr) << getDefaultRecognizerName("en");
#endif
#ifdef TEXTDATE_WITH_RU
    TEXTDATE_ASSERT(findRecognizer(getDefaultRecognizerName("ru")) != nullptr) << getDefaultRecognizerName("ru");
#endif
#ifdef TEXTDATE_WITH_QUICK
    TEXTDATE_ASSERT_EQ(getDefaultRecognizerName("ru"), "ru.versatile");
#else
    TEXTDATE_ASSERT_EQ(getDefaultRecognizerName("en"), "en.bundle_dmy");
    TEXTDATE_ASSERT_EQ(getDefaultRecognizerName("ru"), "ru.bundle");
#endif
  }

  TEXTDATE_TEST_CASE(memberErrors) {
    vector<ErrorKind> memberErrors;
    const RecognizerInfo* ddMm = findRecognizer("dd_mm_only");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(parse(*ddMm, "xx", m_reference, &memberErrors)), "LEXICAL_MISMATCH");
    TEXTDATE_ASSERT(memberErrors.empty());
#ifdef TEXTDATE_WITH_EN
    const RecognizerInfo& bundle = *findRecognizer("en.bundle_mdy");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(parse(bundle, "13/45", m_reference, &memberErrors)), "2024-03-13|2");
    TEXTDATE_ASSERT(memberErrors.empty());
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(parse(bundle, "hello", m_reference, &memberErrors)),
                       "NO_ALTERNATIVE_MATCHED");
    TEXTDATE_ASSERT_EQ(memberErrors.size(), 9u);
    TEXTDATE_ASSERT_EQ(memberErrors[0], ErrorKind::LEXICAL_MISMATCH);
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(parseEntireText(bundle, " 45 ", m_reference, &memberErrors)),
                       "NO_ALTERNATIVE_MATCHED");
    TEXTDATE_ASSERT_EQ(memberErrors.size(), 9u);
    TEXTDATE_ASSERT_EQ(memberErrors[0], ErrorKind::OUT_OF_RANGE);
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(parseEntireText(bundle, " 12/13 ", m_reference)), "2024-12-13|5");
#endif
  }

  TEXTDATE_TEST_CASE(parseEntireText) {
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(parseEntireText(ddMmOnly, "01/02", m_reference)), "2024-02-01|5");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(parseEntireText(ddMmOnly, "  01/02\t\n", m_reference)), "2024-02-01|5");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(parseEntireText(ddMmOnly, "01/02x", m_reference)), "LEXICAL_MISMATCH");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(parseEntireText(ddOnly, "13/07", m_reference)), "LEXICAL_MISMATCH");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(parseEntireText(ddOnly, "   ", m_reference)), "LEXICAL_MISMATCH");
    TEXTDATE_ASSERT_EQ(debugStringOfMatch(parseEntireText(ddMmOnly, "31/04", m_reference)), "CALENDAR_INVALID");
  }

  Date m_reference;
};

}  // namespace dateparsers

int main(int argc, char** argv) {
  dateparsers::RegistryTest().run(argc, argv);
  return 0;
}
