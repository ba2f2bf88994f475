#include "Http.hpp"

#include "BlockNode.hpp"

Http::Http(DirectiveNode& directive) : directive_(&directive) {}

Http::Http(const Http& other) : directive_(other.directive_) {}

Http& Http::operator=(const Http& other) {
  if (this != &other) {
    directive_ = other.directive_;
  }
  return *this;
}

Http::~Http() {}

void Http::wrap(DirectiveNode& d, const std::string& /*context*/) {
  d.kind = DirectiveNode::HTTP;
}

std::vector<Server> Http::servers() const {
  std::vector<Server> result;
  BlockNode& b = block();
  for (size_t i = 0; i < b.directives.size(); ++i) {
    if (b.directives[i].kind == DirectiveNode::SERVER) {
      result.push_back(Server(b.directives[i]));
    }
  }
  return result;
}

std::vector<Upstream> Http::upstreams() const {
  std::vector<Upstream> result;
  BlockNode& b = block();
  for (size_t i = 0; i < b.directives.size(); ++i) {
    if (b.directives[i].kind == DirectiveNode::UPSTREAM) {
      result.push_back(Upstream(b.directives[i]));
    }
  }
  return result;
}

BlockNode& Http::block() const {
  return directive_->block();
}

DirectiveNode& Http::directive() const {
  return *directive_;
}
