#pragma once

#include <string>
#include <vector>

#include "DirectiveNode.hpp"
#include "Location.hpp"

class BlockNode;

// View over a `server { ... }` block (a virtual host, not an upstream
// member).
class Server {
 public:
  explicit Server(DirectiveNode& directive);
  Server(const Server& other);
  Server& operator=(const Server& other);
  ~Server();

  static void wrap(DirectiveNode& directive, const std::string& context);

  // Direct `location` children, in order
  std::vector<Location> locations() const;
  // Parameter values of the first direct child named `name`, empty if none
  std::vector<std::string> directiveArgs(const std::string& name) const;

  BlockNode& block() const;
  DirectiveNode& directive() const;

 private:
  DirectiveNode* directive_;
};
