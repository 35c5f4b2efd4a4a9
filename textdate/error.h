#ifndef TEXTDATE_ERROR_H
#define TEXTDATE_ERROR_H

#include <stdexcept>

namespace textdate {

// Base class for all exceptions in the textdate namespace.
// Should not be catched, except at the top level of a binary.
class Error : public std::runtime_error {
public:
  using runtime_error::runtime_error;
};

// Invalid string input, e.g. a malformed ISO 8601 date or integer.
// Recognizers of free-form dates never throw it: their failures are reported in dateparsers::Match.
class ParseError : public Error {
public:
  using Error::Error;
};

}  // namespace textdate

#endif
