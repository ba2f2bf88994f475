#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "DirectiveNode.hpp"
#include "UpstreamServer.hpp"

// View over an `upstream <name> { ... }` directive. Nothing is cached: the
// server list is read from the directive's block on every call and
// addServer() writes into that block, so the renderer always sees the same
// servers as servers(). The view stays valid as long as the directive does.
class Upstream {
 public:
  explicit Upstream(DirectiveNode& directive);
  Upstream(const Upstream& other);
  Upstream& operator=(const Upstream& other);
  ~Upstream();

  // Tags an `upstream` block directive UPSTREAM
  static void wrap(DirectiveNode& directive, const std::string& context);

  // First parameter, empty when the upstream is unnamed
  std::string name() const;
  // Every `server ...;` entry of the block, in order
  std::vector<UpstreamServer> servers() const;
  void addServer(const UpstreamServer& server);
  // Removes every server with this address; returns how many were removed
  std::size_t removeServer(const std::string& address);

  DirectiveNode& directive() const;

 private:
  DirectiveNode* directive_;
};
