#pragma once

#include <string>

#include "DirectiveNode.hpp"

// View over `location [modifier] match { ... }`.
//   location /admin { }      -> modifier "",  match "/admin"
//   location ~ \.php$ { }    -> modifier "~", match "\.php$"
class Location {
 public:
  explicit Location(DirectiveNode& directive);
  Location(const Location& other);
  Location& operator=(const Location& other);
  ~Location();

  // Checks the parameter count and tags the node LOCATION.
  // Throws ParseError(SEMANTIC) for zero or more than two parameters.
  static void wrap(DirectiveNode& directive, const std::string& context);

  std::string modifier() const;
  std::string match() const;

  DirectiveNode& directive() const;

 private:
  DirectiveNode* directive_;
};
