#pragma once

#include <string>
#include <vector>

#include "BlockNode.hpp"
#include "DirectiveNode.hpp"
#include "Upstream.hpp"

// A parsed configuration document: the root block plus the path it was read
// from (empty when it was parsed from memory).
class Config {
 public:
  Config();
  explicit Config(const std::string& filePath);
  ~Config();
  Config(const Config& other);
  Config& operator=(const Config& other);

  // Every upstream at any depth, in source order
  std::vector<Upstream> findUpstreams();
  // Every directive named `name` at any depth, in source order
  std::vector<DirectiveNode*> findDirectives(const std::string& name);

  void debug(void) const;

 public:
  std::string filePath;
  BlockNode root;
};
