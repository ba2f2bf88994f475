#include "Token.hpp"

Token::Token() : kind(END_OF_INPUT), literal(), line(0), column(0), quote(0) {}

Token::Token(Kind k, const std::string& lit, std::size_t l, std::size_t c,
             char q)
    : kind(k), literal(lit), line(l), column(c), quote(q) {}

bool Token::isParameterEligible() const {
  switch (kind) {
    case KEYWORD:
    case VARIABLE:
    case QUOTED_STRING:
    case COMMENT:
      return true;
    default:
      return false;
  }
}

std::string tokenKindToString(Token::Kind kind) {
  switch (kind) {
    case Token::END_OF_INPUT:
      return "end of input";
    case Token::KEYWORD:
      return "keyword";
    case Token::SEMICOLON:
      return "semicolon";
    case Token::BLOCK_START:
      return "block start";
    case Token::BLOCK_END:
      return "block end";
    case Token::COMMENT:
      return "comment";
    case Token::VARIABLE:
      return "variable";
    case Token::QUOTED_STRING:
      return "quoted string";
    default:
      return "unknown";
  }
}
