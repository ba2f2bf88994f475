#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

// Raised for every malformed input. The first error aborts the parse.
//   LEXICAL  - the tokenizer could not produce a token (unterminated string)
//   SYNTAX   - a token appeared where the grammar allows none
//   SEMANTIC - a well formed directive broke a typed node's shape rule
class ParseError : public std::runtime_error {
 public:
  enum Kind { LEXICAL, SYNTAX, SEMANTIC };

  ParseError(Kind kind, const std::string& message, std::size_t line = 0,
             std::size_t column = 0);
  virtual ~ParseError() throw();

  Kind kind() const;
  std::size_t line() const;
  std::size_t column() const;
  // The message without kind and position decorations
  const std::string& message() const;

 private:
  static std::string format(Kind kind, const std::string& message,
                            std::size_t line, std::size_t column);

  Kind kind_;
  std::size_t line_;
  std::size_t column_;
  std::string message_;
};

std::string parseErrorKindToString(ParseError::Kind kind);
