#pragma once

#include <string>

#include "DirectiveNode.hpp"

// View over `include <path>;`. The referenced file is not read.
class Include {
 public:
  explicit Include(DirectiveNode& directive);
  Include(const Include& other);
  Include& operator=(const Include& other);
  ~Include();

  // Requires exactly one parameter and no block, then tags the node
  // INCLUDE. Throws ParseError(SEMANTIC) otherwise.
  static void wrap(DirectiveNode& directive, const std::string& context);

  std::string path() const;

  DirectiveNode& directive() const;

 private:
  DirectiveNode* directive_;
};
