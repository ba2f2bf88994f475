#include "Parser.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "Http.hpp"
#include "Include.hpp"
#include "Location.hpp"
#include "Logger.hpp"
#include "ParseError.hpp"
#include "Server.hpp"
#include "Upstream.hpp"
#include "UpstreamServer.hpp"
#include "constants.hpp"

// ==================== CONSTRUCTION ====================

Parser::Parser(const std::string& content)
    : lexer_(content),
      filePath_(),
      current_(),
      following_(),
      strict_(false),
      depth_(0) {
  registerDefaultWrappers();
  // fill the two-token window
  nextToken();
  nextToken();
}

Parser::Parser(std::istream& in, const std::string& filePath)
    : lexer_(in),
      filePath_(filePath),
      current_(),
      following_(),
      strict_(false),
      depth_(0) {
  registerDefaultWrappers();
  nextToken();
  nextToken();
}

Parser::~Parser() {}

void Parser::registerDefaultWrappers() {
  blockWrappers_["http"] = &Http::wrap;
  blockWrappers_["server"] = &Server::wrap;
  blockWrappers_["location"] = &Location::wrap;
  blockWrappers_["upstream"] = &Upstream::wrap;
  // rejects `include x { }`
  blockWrappers_["include"] = &Include::wrap;

  directiveWrappers_["server"] = &UpstreamServer::wrap;
  directiveWrappers_["include"] = &Include::wrap;
}

Config Parser::parseString(const std::string& content) {
  Parser parser(content);
  return parser.parse();
}

Config Parser::parseFile(const std::string& path) {
  LOG(INFO) << "Starting to parse config file: " << path;

  std::ifstream file(path.c_str());
  if (!file.is_open()) {
    std::string reason = std::strerror(errno);
    LOG(ERROR) << "Unable to open config file: " << path << ": " << reason;
    throw std::runtime_error("Unable to open config file: " + path + ": " +
                             reason);
  }
  Parser parser(file, path);
  return parser.parse();
}

// ==================== SETTINGS ====================

void Parser::setStrict(bool strict) {
  strict_ = strict;
}

bool Parser::isStrict() const {
  return strict_;
}

void Parser::registerStatementParser(const std::string& name,
                                     StatementParser parser) {
  statementParsers_[name] = parser;
}

void Parser::registerBlockWrapper(const std::string& name, Wrapper wrapper) {
  blockWrappers_[name] = wrapper;
}

void Parser::registerDirectiveWrapper(const std::string& name,
                                      Wrapper wrapper) {
  directiveWrappers_[name] = wrapper;
}

// ==================== TOKEN WINDOW ====================

const Token& Parser::current() const {
  return current_;
}

const Token& Parser::following() const {
  return following_;
}

bool Parser::currentIs(Token::Kind kind) const {
  return current_.kind == kind;
}

bool Parser::followingIs(Token::Kind kind) const {
  return following_.kind == kind;
}

void Parser::nextToken() {
  current_ = following_;
  following_ = lexer_.scan();
}

// ==================== GRAMMAR ====================

Config Parser::parse() {
  Config config(filePath_);
  parseBlock(config.root, "");
  // parseBlock stops on '}' as well, which has nothing to close up here
  if (currentIs(Token::BLOCK_END)) {
    throwUnexpectedToken();
  }
  LOG(DEBUG) << "Parsed " << config.root.size() << " top-level node(s) from "
             << (filePath_.empty() ? "<memory>" : filePath_);
  return config;
}

void Parser::parseBlock(BlockNode& block, const std::string& context) {
  for (;;) {
    if (currentIs(Token::END_OF_INPUT) || currentIs(Token::BLOCK_END)) {
      return;
    }
    if (currentIs(Token::KEYWORD)) {
      // filled in place, a finished subtree is never copied into its parent
      parseStatement(block.add(DirectiveNode()), context);
    } else if (currentIs(Token::COMMENT)) {
      DirectiveNode comment = DirectiveNode::makeComment(current_.literal);
      comment.line = current_.line;
      comment.column = current_.column;
      block.add(comment);
    } else if (strict_) {
      throwUnexpectedToken();
    } else {
      LOG(DEBUG) << "Skipping stray " << tokenKindToString(current_.kind)
                 << " '" << current_.literal << "' at line " << current_.line;
    }
    nextToken();
  }
}

void Parser::parseStatement(DirectiveNode& d, const std::string& context) {
  std::map<std::string, StatementParser>::const_iterator sp =
      statementParsers_.find(current_.literal);
  if (sp != statementParsers_.end()) {
    DirectiveNode parsed = sp->second(*this);
    d.swap(parsed);
    return;
  }

  d.name = current_.literal;
  d.line = current_.line;
  d.column = current_.column;

  nextToken();
  while (current_.isParameterEligible()) {
    if (currentIs(Token::COMMENT)) {
      // kept as a "# ..." word; the renderer ends the line after it
      d.args.push_back(Parameter::makeComment(current_.literal));
    } else {
      d.addArg(current_.literal, current_.quote);
    }
    nextToken();
  }

  if (currentIs(Token::SEMICOLON)) {
    std::map<std::string, Wrapper>::const_iterator w =
        directiveWrappers_.find(d.name);
    if (w != directiveWrappers_.end()) {
      w->second(d, context);
    }
    return;
  }

  if (currentIs(Token::BLOCK_START)) {
    if (depth_ >= MAX_NESTING_DEPTH) {
      std::ostringstream oss;
      oss << "blocks nested deeper than " << MAX_NESTING_DEPTH << " levels";
      LOG(ERROR) << oss.str() << " at line " << current_.line;
      throw ParseError(ParseError::SYNTAX, oss.str(), current_.line,
                       current_.column);
    }
    nextToken();
    ++depth_;
    parseBlock(d.ensureBlock(), d.name);
    --depth_;
    if (!currentIs(Token::BLOCK_END)) {
      std::ostringstream oss;
      oss << "unexpected end of input, expected '}' to close '" << d.name
          << "' opened at line " << d.line;
      LOG(ERROR) << oss.str();
      throw ParseError(ParseError::SYNTAX, oss.str(), current_.line,
                       current_.column);
    }
    std::map<std::string, Wrapper>::const_iterator w =
        blockWrappers_.find(d.name);
    if (w != blockWrappers_.end()) {
      w->second(d, context);
    }
    return;
  }

  throwUnexpectedToken();
}

void Parser::throwUnexpectedToken() const {
  std::ostringstream oss;
  oss << "unexpected token `" << tokenKindToString(current_.kind) << "` (`"
      << current_.literal << "`)";
  LOG(ERROR) << oss.str() << " at line " << current_.line << ", column "
             << current_.column;
  throw ParseError(ParseError::SYNTAX, oss.str(), current_.line,
                   current_.column);
}
