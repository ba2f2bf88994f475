#include "Upstream.hpp"

#include "BlockNode.hpp"
#include "Logger.hpp"

namespace {

bool isServerEntry(const DirectiveNode& d) {
  return !d.isComment() && d.name == "server" && !d.hasBlock();
}

}  // namespace

Upstream::Upstream(DirectiveNode& directive) : directive_(&directive) {}

Upstream::Upstream(const Upstream& other) : directive_(other.directive_) {}

Upstream& Upstream::operator=(const Upstream& other) {
  if (this != &other) {
    directive_ = other.directive_;
  }
  return *this;
}

Upstream::~Upstream() {}

void Upstream::wrap(DirectiveNode& d, const std::string& /*context*/) {
  d.kind = DirectiveNode::UPSTREAM;
}

std::string Upstream::name() const {
  return directive_->args.empty() ? "" : directive_->args[0].value;
}

std::vector<UpstreamServer> Upstream::servers() const {
  std::vector<UpstreamServer> result;
  if (!directive_->hasBlock()) {
    return result;
  }
  const BlockNode& block = directive_->block();
  for (size_t i = 0; i < block.directives.size(); ++i) {
    if (isServerEntry(block.directives[i])) {
      result.push_back(UpstreamServer::fromDirective(block.directives[i]));
    }
  }
  return result;
}

void Upstream::addServer(const UpstreamServer& server) {
  directive_->ensureBlock().add(server.toDirective());
  LOG(DEBUG) << "Added server " << server.address << " to upstream '"
             << name() << "'";
}

std::size_t Upstream::removeServer(const std::string& address) {
  if (!directive_->hasBlock()) {
    return 0;
  }
  BlockNode& block = directive_->block();
  std::size_t removed = 0;
  for (size_t i = block.directives.size(); i > 0; --i) {
    const DirectiveNode& d = block.directives[i - 1];
    if (isServerEntry(d) &&
        UpstreamServer::fromDirective(d).address == address) {
      block.remove(i - 1);
      ++removed;
    }
  }
  LOG(DEBUG) << "Removed " << removed << " server(s) " << address
             << " from upstream '" << name() << "'";
  return removed;
}

DirectiveNode& Upstream::directive() const {
  return *directive_;
}
