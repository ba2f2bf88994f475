#include "Config.hpp"

#include "Logger.hpp"

namespace {

void debugBlock(const BlockNode& block, size_t depth) {
  std::string pad(depth * 2, ' ');
  for (size_t i = 0; i < block.directives.size(); ++i) {
    const DirectiveNode& d = block.directives[i];
    if (d.isComment()) {
      LOG(DEBUG) << pad << "# " << d.comment;
      continue;
    }
    std::string args;
    for (size_t j = 0; j < d.args.size(); ++j) {
      args += " " + d.args[j].value;
    }
    LOG(DEBUG) << pad << "[" << directiveKindToString(d.kind) << "] " << d.name
               << args << (d.hasBlock() ? " {...}" : ";");
    if (d.hasBlock()) {
      debugBlock(d.block(), depth + 1);
    }
  }
}

}  // namespace

// ==================== PUBLIC METHODS ====================

Config::Config() : filePath(), root() {}

Config::Config(const std::string& path) : filePath(path), root() {}

Config::~Config() {}

Config::Config(const Config& other)
    : filePath(other.filePath), root(other.root) {}

Config& Config::operator=(const Config& other) {
  if (this != &other) {
    filePath = other.filePath;
    root = other.root;
  }
  return *this;
}

std::vector<Upstream> Config::findUpstreams() {
  std::vector<DirectiveNode*> nodes;
  root.collectByKind(DirectiveNode::UPSTREAM, nodes);

  std::vector<Upstream> upstreams;
  for (size_t i = 0; i < nodes.size(); ++i) {
    upstreams.push_back(Upstream(*nodes[i]));
  }
  LOG(DEBUG) << "Found " << upstreams.size() << " upstream(s)";
  return upstreams;
}

std::vector<DirectiveNode*> Config::findDirectives(const std::string& name) {
  std::vector<DirectiveNode*> nodes;
  root.collectByName(name, nodes);
  return nodes;
}

// Dumps the tree at DEBUG level
void Config::debug(void) const {
  if (!Logger::isEnabled(Logger::DEBUG)) {
    return;
  }
  LOG(DEBUG) << "Config " << (filePath.empty() ? "<memory>" : filePath)
             << ": " << root.size() << " top-level node(s)";
  debugBlock(root, 1);
}
