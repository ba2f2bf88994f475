#include "Include.hpp"

#include "Logger.hpp"
#include "ParseError.hpp"

Include::Include(DirectiveNode& directive) : directive_(&directive) {}

Include::Include(const Include& other) : directive_(other.directive_) {}

Include& Include::operator=(const Include& other) {
  if (this != &other) {
    directive_ = other.directive_;
  }
  return *this;
}

Include::~Include() {}

void Include::wrap(DirectiveNode& d, const std::string& /*context*/) {
  std::string problem;
  if (d.hasBlock()) {
    problem =
        "include can not have a block, or missing semicolon at the end of "
        "include statement";
  } else if (d.args.empty()) {
    problem = "include directive requires a path";
  } else if (d.args.size() > 1) {
    problem = "include directive can not have multiple parameters";
  }
  if (!problem.empty()) {
    LOG(ERROR) << problem << " (line " << d.line << ")";
    throw ParseError(ParseError::SEMANTIC, problem, d.line, d.column);
  }
  d.kind = DirectiveNode::INCLUDE;
}

std::string Include::path() const {
  return directive_->args.empty() ? "" : directive_->args[0].value;
}

DirectiveNode& Include::directive() const {
  return *directive_;
}
