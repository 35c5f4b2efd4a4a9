#include "numeric.h"
#include <optional>
#include <string_view>
#include "textdate/date.h"
#include "fields.h"

using std::optional;
using std::string_view;
using textdate::Date;

namespace dateparsers {
namespace {

using FieldMatcher = ValueMatch (*)(string_view text);

// Reads fields and separators one after the other. After the first failure, error() tells why and the lexer must not
// be used anymore.
class NumericLexer {
public:
  explicit NumericLexer(string_view text) : m_text(text) {}

  bool consumeField(FieldMatcher matcher, optional<int>& value);
  bool consumeSeparator();

  int position() const { return m_position; }
  ErrorKind error() const { return m_error; }

private:
  string_view m_text;
  int m_position = 0;
  ErrorKind m_error = ErrorKind::NONE;
};

bool NumericLexer::consumeField(FieldMatcher matcher, optional<int>& value) {
  ValueMatch field = matcher(m_text.substr(m_position));
  if (!field.ok()) {
    m_error = field.error;
    return false;
  }
  value = field.value;
  m_position += field.length;
  return true;
}

bool NumericLexer::consumeSeparator() {
  m_position += matchSeparator(m_text.substr(m_position));
  return true;
}

Match resolveLexer(const NumericLexer& lexer, bool matched, const FieldSet& fields, const Date& reference) {
  return matched ? resolveFields(fields, reference, lexer.position()) : Match::failure(lexer.error());
}

}  // namespace

Match resolveFields(const FieldSet& fields, const Date& reference, int length) {
  int year = fields.year ? *fields.year : reference.year();
  int month = fields.month ? *fields.month : reference.month();
  int day = fields.day ? *fields.day : reference.day();
  return Match::ofDate(Date(year, month, day), length);
}

Match ddOnly(string_view text, const Date& reference) {
  NumericLexer lexer(text);
  FieldSet fields;
  bool matched = lexer.consumeField(matchDay, fields.day);
  return resolveLexer(lexer, matched, fields, reference);
}

Match ddMmOnly(string_view text, const Date& reference) {
  NumericLexer lexer(text);
  FieldSet fields;
  bool matched = lexer.consumeField(matchDay, fields.day) && lexer.consumeSeparator() &&
                 lexer.consumeField(matchMonth, fields.month);
  return resolveLexer(lexer, matched, fields, reference);
}

Match mmDdOnly(string_view text, const Date& reference) {
  NumericLexer lexer(text);
  FieldSet fields;
  bool matched = lexer.consumeField(matchMonth, fields.month) && lexer.consumeSeparator() &&
                 lexer.consumeField(matchDay, fields.day);
  return resolveLexer(lexer, matched, fields, reference);
}

Match ddMmY4(string_view text, const Date& reference) {
  NumericLexer lexer(text);
  FieldSet fields;
  bool matched = lexer.consumeField(matchDay, fields.day) && lexer.consumeSeparator() &&
                 lexer.consumeField(matchMonth, fields.month) && lexer.consumeSeparator() &&
                 lexer.consumeField(matchYear4, fields.year);
  return resolveLexer(lexer, matched, fields, reference);
}

Match mmDdY4(string_view text, const Date& reference) {
  NumericLexer lexer(text);
  FieldSet fields;
  bool matched = lexer.consumeField(matchMonth, fields.month) && lexer.consumeSeparator() &&
                 lexer.consumeField(matchDay, fields.day) && lexer.consumeSeparator() &&
                 lexer.consumeField(matchYear4, fields.year);
  return resolveLexer(lexer, matched, fields, reference);
}

Match y4MmDd(string_view text, const Date& reference) {
  NumericLexer lexer(text);
  FieldSet fields;
  bool matched = lexer.consumeField(matchYear4, fields.year) && lexer.consumeSeparator() &&
                 lexer.consumeField(matchMonth, fields.month) && lexer.consumeSeparator() &&
                 lexer.consumeField(matchDay, fields.day);
  return resolveLexer(lexer, matched, fields, reference);
}

}  // namespace dateparsers
