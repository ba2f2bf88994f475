#pragma once

#include <cstddef>
#include <istream>
#include <map>
#include <string>

#include "BlockNode.hpp"
#include "Config.hpp"
#include "DirectiveNode.hpp"
#include "Lexer.hpp"
#include "Token.hpp"

// Recursive-descent parser over a two-token window (current + following).
//
//   statement := KEYWORD param* ( ';' | '{' statement* '}' )
//   param     := KEYWORD | VARIABLE | QUOTED_STRING | COMMENT
//
// Every statement is first built as a generic DirectiveNode. A wrapper
// registered for the directive name then checks its shape and tags its
// variant: block wrappers for `name ... { }`, directive wrappers for
// `name ...;`. Names without a wrapper stay generic.
//
// The first error aborts the parse with a ParseError. Blocks nested deeper
// than MAX_NESTING_DEPTH are rejected as a syntax error.
class Parser {
 public:
  // Validates and tags a freshly parsed directive. `context` is the name of
  // the enclosing block directive, empty at the top level.
  typedef void (*Wrapper)(DirectiveNode& directive, const std::string& context);
  // Takes over parsing of a whole statement. Called with current() on the
  // directive name; must return with current() on the statement's last
  // token (its ';' or '}').
  typedef DirectiveNode (*StatementParser)(Parser& parser);

  explicit Parser(const std::string& content);
  // `in` must outlive the parser
  Parser(std::istream& in, const std::string& filePath);
  ~Parser();

  static Config parseString(const std::string& content);
  // Throws std::runtime_error when the file cannot be opened
  static Config parseFile(const std::string& path);

  Config parse();

  // Strict parsing rejects stray tokens between statements (';', '{',
  // quoted strings, variables); lenient parsing skips them. Default: lenient.
  void setStrict(bool strict);
  bool isStrict() const;

  void registerStatementParser(const std::string& name, StatementParser parser);
  void registerBlockWrapper(const std::string& name, Wrapper wrapper);
  void registerDirectiveWrapper(const std::string& name, Wrapper wrapper);

  const Token& current() const;
  const Token& following() const;
  bool currentIs(Token::Kind kind) const;
  bool followingIs(Token::Kind kind) const;
  void nextToken();

 private:
  Parser(const Parser& other);
  Parser& operator=(const Parser& other);

  void registerDefaultWrappers();

  void parseBlock(BlockNode& block, const std::string& context);
  // Fills `directive`, which already sits in its parent block
  void parseStatement(DirectiveNode& directive, const std::string& context);
  void throwUnexpectedToken() const;

  Lexer lexer_;
  std::string filePath_;
  Token current_;
  Token following_;
  bool strict_;
  std::size_t depth_;  // open blocks around the current token

  std::map<std::string, StatementParser> statementParsers_;
  std::map<std::string, Wrapper> blockWrappers_;
  std::map<std::string, Wrapper> directiveWrappers_;
};
