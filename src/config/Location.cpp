#include "Location.hpp"

#include "Logger.hpp"
#include "ParseError.hpp"

Location::Location(DirectiveNode& directive) : directive_(&directive) {}

Location::Location(const Location& other) : directive_(other.directive_) {}

Location& Location::operator=(const Location& other) {
  if (this != &other) {
    directive_ = other.directive_;
  }
  return *this;
}

Location::~Location() {}

void Location::wrap(DirectiveNode& d, const std::string& /*context*/) {
  if (d.args.empty()) {
    LOG(ERROR) << "location without parameters at line " << d.line;
    throw ParseError(ParseError::SEMANTIC, "not enough parameters for location",
                     d.line, d.column);
  }
  if (d.args.size() > 2) {
    LOG(ERROR) << "location with " << d.args.size()
               << " parameters at line " << d.line;
    throw ParseError(ParseError::SEMANTIC,
                     "too many arguments for location directive", d.line,
                     d.column);
  }
  d.kind = DirectiveNode::LOCATION;
}

std::string Location::modifier() const {
  return directive_->args.size() == 2 ? directive_->args[0].value : "";
}

std::string Location::match() const {
  if (directive_->args.empty()) {
    return "";
  }
  return directive_->args.back().value;
}

DirectiveNode& Location::directive() const {
  return *directive_;
}
