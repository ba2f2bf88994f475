#pragma once

#include <string>
#include <vector>

#include "DirectiveNode.hpp"
#include "Server.hpp"
#include "Upstream.hpp"

class BlockNode;

// View over the `http { ... }` context
class Http {
 public:
  explicit Http(DirectiveNode& directive);
  Http(const Http& other);
  Http& operator=(const Http& other);
  ~Http();

  static void wrap(DirectiveNode& directive, const std::string& context);

  // Direct children only
  std::vector<Server> servers() const;
  std::vector<Upstream> upstreams() const;

  BlockNode& block() const;
  DirectiveNode& directive() const;

 private:
  DirectiveNode* directive_;
};
