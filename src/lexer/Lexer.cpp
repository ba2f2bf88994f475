#include "Lexer.hpp"

#include <string>

#include "Logger.hpp"
#include "ParseError.hpp"

namespace {

const int kEof = std::char_traits<char>::eof();

bool isEndOfLine(int ch) {
  return ch == '\r' || ch == '\n';
}

bool isSpace(int ch) {
  return ch == ' ' || ch == '\t' || isEndOfLine(ch);
}

bool isQuote(int ch) {
  return ch == '"' || ch == '\'' || ch == '`';
}

// Characters ending a keyword or a variable. '}' is not one of them, so
// "a}" is a single keyword.
bool isKeywordTerminator(int ch) {
  return isSpace(ch) || ch == '{' || ch == ';';
}

// Backslash sequences decoded inside a quoted string
bool needsEscape(int ch, char delimiter) {
  return ch == delimiter || ch == 'n' || ch == 't' || ch == 'r' || ch == '\\';
}

}  // namespace

Lexer::Lexer(const std::string& content)
    : owned_(content), in_(owned_), line_(1), column_(1) {}

Lexer::Lexer(std::istream& in) : owned_(), in_(in), line_(1), column_(1) {}

Lexer::~Lexer() {}

std::size_t Lexer::line() const {
  return line_;
}

std::size_t Lexer::column() const {
  return column_;
}

int Lexer::peek() {
  return in_.peek();
}

int Lexer::read() {
  int ch = in_.get();
  if (ch == kEof) {
    return kEof;
  }
  if (ch == '\n') {
    ++line_;
    column_ = 1;
  } else {
    ++column_;
  }
  return ch;
}

Token Lexer::scan() {
  for (;;) {
    int ch = peek();
    if (ch == kEof) {
      return Token(Token::END_OF_INPUT, "", line_, column_);
    }
    if (isSpace(ch)) {
      read();
      continue;
    }

    std::size_t line = line_;
    std::size_t column = column_;
    switch (ch) {
      case ';':
        read();
        return Token(Token::SEMICOLON, ";", line, column);
      case '{':
        read();
        return Token(Token::BLOCK_START, "{", line, column);
      case '}':
        read();
        return Token(Token::BLOCK_END, "}", line, column);
      case '#':
        return scanComment(line, column);
      case '$':
        return Token(Token::VARIABLE, readUntilTerminator(), line, column);
      default:
        if (isQuote(ch)) {
          return scanQuotedString(static_cast<char>(ch), line, column);
        }
        return Token(Token::KEYWORD, readUntilTerminator(), line, column);
    }
  }
}

std::vector<Token> Lexer::all() {
  std::vector<Token> tokens;
  for (;;) {
    Token tok = scan();
    if (tok.kind == Token::END_OF_INPUT) {
      break;
    }
    tokens.push_back(tok);
  }
  return tokens;
}

// The first character is always consumed, the caller has already decided it
// starts the token.
std::string Lexer::readUntilTerminator() {
  std::string buf(1, static_cast<char>(read()));
  for (int ch = peek(); ch != kEof && !isKeywordTerminator(ch); ch = peek()) {
    buf.push_back(static_cast<char>(read()));
  }
  return buf;
}

Token Lexer::scanComment(std::size_t line, std::size_t column) {
  read();  // '#'
  std::string text;
  for (int ch = peek(); ch != kEof && !isEndOfLine(ch); ch = peek()) {
    text.push_back(static_cast<char>(read()));
  }
  std::string::size_type start = text.find_first_not_of(" \t");
  text.erase(0, start == std::string::npos ? text.size() : start);
  return Token(Token::COMMENT, text, line, column);
}

Token Lexer::scanQuotedString(char delimiter, std::size_t line,
                              std::size_t column) {
  read();  // opening delimiter
  std::string buf;
  for (;;) {
    int ch = read();
    if (ch == kEof) {
      LOG(ERROR) << "Unterminated string starting at line " << line
                 << ", column " << column;
      throw ParseError(ParseError::LEXICAL, "unterminated string", line,
                       column);
    }
    if (ch == '\\' && needsEscape(peek(), delimiter)) {
      int escaped = read();
      switch (escaped) {
        case 'n':
          buf.push_back('\n');
          break;
        case 'r':
          buf.push_back('\r');
          break;
        case 't':
          buf.push_back('\t');
          break;
        default:  // backslash or the delimiter itself
          buf.push_back(static_cast<char>(escaped));
          break;
      }
      continue;
    }
    if (ch == delimiter) {
      break;
    }
    buf.push_back(static_cast<char>(ch));
  }
  return Token(Token::QUOTED_STRING, buf, line, column, delimiter);
}
