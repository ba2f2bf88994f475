#include "UpstreamServer.hpp"

#include <algorithm>

UpstreamServer::UpstreamServer() : address(), parameters(), flags() {}

UpstreamServer::UpstreamServer(const std::string& addr)
    : address(addr), parameters(), flags() {}

UpstreamServer::UpstreamServer(const UpstreamServer& other)
    : address(other.address),
      parameters(other.parameters),
      flags(other.flags) {}

UpstreamServer& UpstreamServer::operator=(const UpstreamServer& other) {
  if (this != &other) {
    address = other.address;
    parameters = other.parameters;
    flags = other.flags;
  }
  return *this;
}

UpstreamServer::~UpstreamServer() {}

void UpstreamServer::wrap(DirectiveNode& d, const std::string& context) {
  if (context == "upstream") {
    d.kind = DirectiveNode::UPSTREAM_SERVER;
  }
}

UpstreamServer UpstreamServer::fromDirective(const DirectiveNode& directive) {
  UpstreamServer server;
  bool addressSeen = false;
  for (size_t i = 0; i < directive.args.size(); ++i) {
    if (directive.args[i].fromComment) {
      continue;
    }
    const std::string& arg = directive.args[i].value;
    if (!addressSeen) {
      server.address = arg;
      addressSeen = true;
      continue;
    }
    std::string::size_type eq = arg.find('=');
    if (eq == std::string::npos) {
      server.flags.push_back(arg);
    } else {
      server.parameters.push_back(
          KeyValue(arg.substr(0, eq), arg.substr(eq + 1)));
    }
  }
  return server;
}

DirectiveNode UpstreamServer::toDirective() const {
  DirectiveNode d;
  d.name = "server";
  d.kind = DirectiveNode::UPSTREAM_SERVER;
  d.addArg(address);
  for (ParameterList::const_iterator it = parameters.begin();
       it != parameters.end(); ++it) {
    d.addArg(it->first + "=" + it->second);
  }
  for (size_t i = 0; i < flags.size(); ++i) {
    d.addArg(flags[i]);
  }
  return d;
}

void UpstreamServer::setParameter(const std::string& key,
                                  const std::string& value) {
  for (ParameterList::iterator it = parameters.begin(); it != parameters.end();
       ++it) {
    if (it->first == key) {
      it->second = value;
      return;
    }
  }
  parameters.push_back(KeyValue(key, value));
}

bool UpstreamServer::hasParameter(const std::string& key) const {
  for (ParameterList::const_iterator it = parameters.begin();
       it != parameters.end(); ++it) {
    if (it->first == key) {
      return true;
    }
  }
  return false;
}

std::string UpstreamServer::parameter(const std::string& key) const {
  for (ParameterList::const_iterator it = parameters.begin();
       it != parameters.end(); ++it) {
    if (it->first == key) {
      return it->second;
    }
  }
  return "";
}

void UpstreamServer::addFlag(const std::string& flag) {
  if (!hasFlag(flag)) {
    flags.push_back(flag);
  }
}

bool UpstreamServer::hasFlag(const std::string& flag) const {
  return std::find(flags.begin(), flags.end(), flag) != flags.end();
}
