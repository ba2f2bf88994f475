#pragma once

#include <cstddef>
#include <string>

// One lexical unit of a configuration file.
// For QUOTED_STRING tokens `literal` holds the decoded content without the
// delimiters and `quote` holds the delimiter that was used.
struct Token {
  enum Kind {
    END_OF_INPUT,
    KEYWORD,
    SEMICOLON,
    BLOCK_START,
    BLOCK_END,
    COMMENT,
    VARIABLE,
    QUOTED_STRING
  };

  Token();
  Token(Kind kind, const std::string& literal, std::size_t line,
        std::size_t column, char quote = 0);

  // Keywords, variables, quoted strings and comments may follow a directive
  // name as parameters.
  bool isParameterEligible() const;

  Kind kind;
  std::string literal;
  std::size_t line;
  std::size_t column;
  char quote;
};

std::string tokenKindToString(Token::Kind kind);
