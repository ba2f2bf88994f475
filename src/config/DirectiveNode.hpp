#pragma once

#include <cstddef>
#include <string>
#include <vector>

class BlockNode;

// A directive parameter. `quote` is the delimiter the value was written with
// ('"', '\'' or '`'), or 0 for a bare word. `fromComment` marks a "# text"
// word the parser took from a comment token; only those end their line when
// rendered. Quoting is presentation only: parameters compare equal on their
// value.
struct Parameter {
  Parameter();
  Parameter(const std::string& value, char quote = 0);

  static Parameter makeComment(const std::string& text);

  bool isQuoted() const;
  bool operator==(const Parameter& other) const;
  bool operator!=(const Parameter& other) const;

  std::string value;
  char quote;
  bool fromComment;
};

// One statement: a name, ordered parameters and an optional nested block.
// Typed nodes (upstream, location, ...) are DirectiveNodes with a variant
// tag set by the parser; the typed views in Upstream.hpp, Location.hpp, ...
// read their fields from here, so this is the single source of truth.
class DirectiveNode {
 public:
  enum Kind {
    DIRECTIVE,
    COMMENT,
    HTTP,
    SERVER,
    UPSTREAM,
    UPSTREAM_SERVER,
    LOCATION,
    INCLUDE
  };

  DirectiveNode();
  DirectiveNode(const std::string& name, const std::vector<Parameter>& args);
  DirectiveNode(const DirectiveNode& other);
  DirectiveNode& operator=(const DirectiveNode& other);
  ~DirectiveNode();

  // Exchanges contents without copying nested blocks
  void swap(DirectiveNode& other);

  // A "# text" line kept in its source position
  static DirectiveNode makeComment(const std::string& text);

  bool isComment() const;
  bool hasBlock() const;
  // Throws std::logic_error when the directive has no block
  BlockNode& block();
  const BlockNode& block() const;
  // Attaches an empty block unless one is already present
  BlockNode& ensureBlock();
  void setBlock(const BlockNode& block);
  void clearBlock();

  void addArg(const std::string& value, char quote = 0);
  std::vector<std::string> argValues() const;

  // Structural equality: kind, name, parameter values, comment text and
  // nesting. Source positions are ignored.
  bool operator==(const DirectiveNode& other) const;
  bool operator!=(const DirectiveNode& other) const;

  std::string name;
  std::vector<Parameter> args;
  Kind kind;
  std::string comment;  // text of COMMENT nodes, without the '#'
  // Position of the name in the source, 0 for nodes built in code
  std::size_t line;
  std::size_t column;

 private:
  BlockNode* block_;  // owned, NULL for simple directives
};

std::string directiveKindToString(DirectiveNode::Kind kind);
