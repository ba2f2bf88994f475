#pragma once

#include <string>
#include <utility>
#include <vector>

#include "DirectiveNode.hpp"

// One backend of an upstream pool:
//   server 127.0.0.1:443 weight=5 max_fails=3 backup;
// address "127.0.0.1:443", parameters [weight=5, max_fails=3] in written
// order, flags [backup].
class UpstreamServer {
 public:
  typedef std::pair<std::string, std::string> KeyValue;
  typedef std::vector<KeyValue> ParameterList;

  UpstreamServer();
  explicit UpstreamServer(const std::string& address);
  UpstreamServer(const UpstreamServer& other);
  UpstreamServer& operator=(const UpstreamServer& other);
  ~UpstreamServer();

  // Tags a simple `server ...;` directive UPSTREAM_SERVER when it sits in an
  // `upstream` block; elsewhere the directive stays generic.
  static void wrap(DirectiveNode& directive, const std::string& context);

  // Splits every parameter after the address at its first '='; parameters
  // without one become flags. Comment words are skipped.
  static UpstreamServer fromDirective(const DirectiveNode& directive);
  // "server <address> <key=value>... <flag>...", tagged UPSTREAM_SERVER
  DirectiveNode toDirective() const;

  // Replaces the value of an existing key in place, otherwise appends
  void setParameter(const std::string& key, const std::string& value);
  bool hasParameter(const std::string& key) const;
  // Empty string when the key is absent
  std::string parameter(const std::string& key) const;

  void addFlag(const std::string& flag);
  bool hasFlag(const std::string& flag) const;

  std::string address;
  ParameterList parameters;
  std::vector<std::string> flags;
};
