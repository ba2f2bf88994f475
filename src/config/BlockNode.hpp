#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "DirectiveNode.hpp"

// An ordered, brace-delimited sequence of directives. Source order is kept
// and only changes through add() and remove().
class BlockNode {
 public:
  BlockNode();
  BlockNode(const BlockNode& other);
  BlockNode& operator=(const BlockNode& other);
  ~BlockNode();

  std::size_t size() const;
  bool empty() const;

  // Appends a copy of `directive` and returns the stored node. References
  // to earlier nodes are invalidated, as with std::vector::push_back.
  DirectiveNode& add(const DirectiveNode& directive);
  // Throws std::out_of_range for a bad index
  void remove(std::size_t index);

  // Direct children named `name`, in order
  std::vector<DirectiveNode*> findDirectives(const std::string& name);
  // Every node named `name` at any depth, in source order
  void collectByName(const std::string& name,
                     std::vector<DirectiveNode*>& out);
  // Every node of `kind` at any depth, in source order
  void collectByKind(DirectiveNode::Kind kind,
                     std::vector<DirectiveNode*>& out);

  bool operator==(const BlockNode& other) const;
  bool operator!=(const BlockNode& other) const;

  std::vector<DirectiveNode> directives;

 private:
  void grow();
};
