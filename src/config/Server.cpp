#include "Server.hpp"

#include "BlockNode.hpp"

Server::Server(DirectiveNode& directive) : directive_(&directive) {}

Server::Server(const Server& other) : directive_(other.directive_) {}

Server& Server::operator=(const Server& other) {
  if (this != &other) {
    directive_ = other.directive_;
  }
  return *this;
}

Server::~Server() {}

void Server::wrap(DirectiveNode& d, const std::string& /*context*/) {
  d.kind = DirectiveNode::SERVER;
}

std::vector<Location> Server::locations() const {
  std::vector<Location> result;
  BlockNode& b = block();
  for (size_t i = 0; i < b.directives.size(); ++i) {
    if (b.directives[i].kind == DirectiveNode::LOCATION) {
      result.push_back(Location(b.directives[i]));
    }
  }
  return result;
}

std::vector<std::string> Server::directiveArgs(const std::string& name) const {
  std::vector<DirectiveNode*> found = block().findDirectives(name);
  if (found.empty()) {
    return std::vector<std::string>();
  }
  return found[0]->argValues();
}

BlockNode& Server::block() const {
  return directive_->block();
}

DirectiveNode& Server::directive() const {
  return *directive_;
}
