#pragma once

#include <cstddef>
#include <istream>
#include <sstream>
#include <string>
#include <vector>

#include "Token.hpp"

// Turns configuration text into tokens, one scan() at a time.
// Example: "listen 0.0.0.0:8080;" -> KEYWORD(listen) KEYWORD(0.0.0.0:8080)
// SEMICOLON END_OF_INPUT
//
// Whitespace is skipped, '#' comments run to the end of the line, quoted
// strings are decoded, and every token remembers the 1-based line and column
// of its first character. Once the input is exhausted scan() keeps returning
// END_OF_INPUT.
class Lexer {
 public:
  // Lexes a private copy of `content`
  explicit Lexer(const std::string& content);
  // Lexes `in`, which must outlive the Lexer
  explicit Lexer(std::istream& in);
  ~Lexer();

  // Throws ParseError(LEXICAL) on an unterminated quoted string
  Token scan();
  // Scans up to (not including) END_OF_INPUT
  std::vector<Token> all();

  std::size_t line() const;
  std::size_t column() const;

 private:
  Lexer(const Lexer& other);
  Lexer& operator=(const Lexer& other);

  int peek();
  int read();

  std::string readUntilTerminator();
  Token scanComment(std::size_t line, std::size_t column);
  Token scanQuotedString(char delimiter, std::size_t line, std::size_t column);

  std::istringstream owned_;  // backing stream for the string constructor
  std::istream& in_;
  std::size_t line_;
  std::size_t column_;
};
