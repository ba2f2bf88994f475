#include "DirectiveNode.hpp"

#include <algorithm>
#include <stdexcept>

#include "BlockNode.hpp"

Parameter::Parameter() : value(), quote(0), fromComment(false) {}

Parameter::Parameter(const std::string& v, char q)
    : value(v), quote(q), fromComment(false) {}

Parameter Parameter::makeComment(const std::string& text) {
  Parameter p(text.empty() ? std::string("#") : "# " + text);
  p.fromComment = true;
  return p;
}

bool Parameter::isQuoted() const {
  return quote != 0;
}

bool Parameter::operator==(const Parameter& other) const {
  return value == other.value;
}

bool Parameter::operator!=(const Parameter& other) const {
  return !(*this == other);
}

DirectiveNode::DirectiveNode()
    : name(),
      args(),
      kind(DIRECTIVE),
      comment(),
      line(0),
      column(0),
      block_(NULL) {}

DirectiveNode::DirectiveNode(const std::string& n,
                             const std::vector<Parameter>& a)
    : name(n),
      args(a),
      kind(DIRECTIVE),
      comment(),
      line(0),
      column(0),
      block_(NULL) {}

DirectiveNode::DirectiveNode(const DirectiveNode& other)
    : name(other.name),
      args(other.args),
      kind(other.kind),
      comment(other.comment),
      line(other.line),
      column(other.column),
      block_(other.block_ ? new BlockNode(*other.block_) : NULL) {}

DirectiveNode& DirectiveNode::operator=(const DirectiveNode& other) {
  if (this != &other) {
    // copy first, `other` may live inside our own block
    BlockNode* copy = other.block_ ? new BlockNode(*other.block_) : NULL;
    name = other.name;
    args = other.args;
    kind = other.kind;
    comment = other.comment;
    line = other.line;
    column = other.column;
    delete block_;
    block_ = copy;
  }
  return *this;
}

DirectiveNode::~DirectiveNode() {
  delete block_;
}

void DirectiveNode::swap(DirectiveNode& other) {
  name.swap(other.name);
  args.swap(other.args);
  std::swap(kind, other.kind);
  comment.swap(other.comment);
  std::swap(line, other.line);
  std::swap(column, other.column);
  std::swap(block_, other.block_);
}

DirectiveNode DirectiveNode::makeComment(const std::string& text) {
  DirectiveNode d;
  d.kind = COMMENT;
  d.comment = text;
  return d;
}

bool DirectiveNode::isComment() const {
  return kind == COMMENT;
}

bool DirectiveNode::hasBlock() const {
  return block_ != NULL;
}

BlockNode& DirectiveNode::block() {
  if (!block_) {
    throw std::logic_error("directive '" + name + "' has no block");
  }
  return *block_;
}

const BlockNode& DirectiveNode::block() const {
  if (!block_) {
    throw std::logic_error("directive '" + name + "' has no block");
  }
  return *block_;
}

BlockNode& DirectiveNode::ensureBlock() {
  if (!block_) {
    block_ = new BlockNode();
  }
  return *block_;
}

void DirectiveNode::setBlock(const BlockNode& b) {
  BlockNode* copy = new BlockNode(b);
  delete block_;
  block_ = copy;
}

void DirectiveNode::clearBlock() {
  delete block_;
  block_ = NULL;
}

void DirectiveNode::addArg(const std::string& value, char quote) {
  args.push_back(Parameter(value, quote));
}

std::vector<std::string> DirectiveNode::argValues() const {
  std::vector<std::string> values;
  for (size_t i = 0; i < args.size(); ++i) {
    values.push_back(args[i].value);
  }
  return values;
}

bool DirectiveNode::operator==(const DirectiveNode& other) const {
  if (kind != other.kind || name != other.name || args != other.args ||
      comment != other.comment || hasBlock() != other.hasBlock()) {
    return false;
  }
  return !block_ || *block_ == *other.block_;
}

bool DirectiveNode::operator!=(const DirectiveNode& other) const {
  return !(*this == other);
}

std::string directiveKindToString(DirectiveNode::Kind kind) {
  switch (kind) {
    case DirectiveNode::DIRECTIVE:
      return "directive";
    case DirectiveNode::COMMENT:
      return "comment";
    case DirectiveNode::HTTP:
      return "http";
    case DirectiveNode::SERVER:
      return "server";
    case DirectiveNode::UPSTREAM:
      return "upstream";
    case DirectiveNode::UPSTREAM_SERVER:
      return "upstream server";
    case DirectiveNode::LOCATION:
      return "location";
    case DirectiveNode::INCLUDE:
      return "include";
    default:
      return "unknown";
  }
}
