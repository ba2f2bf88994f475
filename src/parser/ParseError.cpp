#include "ParseError.hpp"

#include <sstream>

ParseError::ParseError(Kind kind, const std::string& message, std::size_t line,
                       std::size_t column)
    : std::runtime_error(format(kind, message, line, column)),
      kind_(kind),
      line_(line),
      column_(column),
      message_(message) {}

ParseError::~ParseError() throw() {}

ParseError::Kind ParseError::kind() const {
  return kind_;
}

std::size_t ParseError::line() const {
  return line_;
}

std::size_t ParseError::column() const {
  return column_;
}

const std::string& ParseError::message() const {
  return message_;
}

// line 0 means the position is unknown
std::string ParseError::format(Kind kind, const std::string& message,
                               std::size_t line, std::size_t column) {
  std::ostringstream oss;
  oss << parseErrorKindToString(kind) << " error: " << message;
  if (line > 0) {
    oss << " at line " << line << ", column " << column;
  }
  return oss.str();
}

std::string parseErrorKindToString(ParseError::Kind kind) {
  switch (kind) {
    case ParseError::LEXICAL:
      return "lexical";
    case ParseError::SYNTAX:
      return "syntax";
    case ParseError::SEMANTIC:
      return "semantic";
    default:
      return "unknown";
  }
}
