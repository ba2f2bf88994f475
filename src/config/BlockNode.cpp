#include "BlockNode.hpp"

#include <sstream>
#include <stdexcept>

BlockNode::BlockNode() : directives() {}

BlockNode::BlockNode(const BlockNode& other) : directives(other.directives) {}

BlockNode& BlockNode::operator=(const BlockNode& other) {
  if (this != &other) {
    directives = other.directives;
  }
  return *this;
}

BlockNode::~BlockNode() {}

std::size_t BlockNode::size() const {
  return directives.size();
}

bool BlockNode::empty() const {
  return directives.empty();
}

DirectiveNode& BlockNode::add(const DirectiveNode& directive) {
  // `directive` may live in this block, take the copy before growing
  DirectiveNode copy(directive);
  if (directives.size() == directives.capacity()) {
    grow();
  }
  directives.push_back(DirectiveNode());
  directives.back().swap(copy);
  return directives.back();
}

// Reallocates by swapping nodes over; subtrees are never deep-copied
void BlockNode::grow() {
  std::vector<DirectiveNode> bigger;
  bigger.reserve(directives.empty() ? 4 : directives.capacity() * 2);
  bigger.resize(directives.size());
  for (size_t i = 0; i < directives.size(); ++i) {
    bigger[i].swap(directives[i]);
  }
  directives.swap(bigger);
}

void BlockNode::remove(std::size_t index) {
  if (index >= directives.size()) {
    std::ostringstream oss;
    oss << "block index " << index << " out of range (size "
        << directives.size() << ")";
    throw std::out_of_range(oss.str());
  }
  directives.erase(directives.begin() + index);
}

std::vector<DirectiveNode*> BlockNode::findDirectives(const std::string& name) {
  std::vector<DirectiveNode*> found;
  for (size_t i = 0; i < directives.size(); ++i) {
    if (!directives[i].isComment() && directives[i].name == name) {
      found.push_back(&directives[i]);
    }
  }
  return found;
}

void BlockNode::collectByName(const std::string& name,
                              std::vector<DirectiveNode*>& out) {
  for (size_t i = 0; i < directives.size(); ++i) {
    DirectiveNode& d = directives[i];
    if (!d.isComment() && d.name == name) {
      out.push_back(&d);
    }
    if (d.hasBlock()) {
      d.block().collectByName(name, out);
    }
  }
}

void BlockNode::collectByKind(DirectiveNode::Kind kind,
                              std::vector<DirectiveNode*>& out) {
  for (size_t i = 0; i < directives.size(); ++i) {
    DirectiveNode& d = directives[i];
    if (d.kind == kind) {
      out.push_back(&d);
    }
    if (d.hasBlock()) {
      d.block().collectByKind(kind, out);
    }
  }
}

bool BlockNode::operator==(const BlockNode& other) const {
  return directives == other.directives;
}

bool BlockNode::operator!=(const BlockNode& other) const {
  return !(*this == other);
}
