#include "Location.hpp"

#include <gtest/gtest.h>

#include <string>

#include "ParseError.hpp"

namespace {

DirectiveNode locationBlock(const std::string& first,
                            const std::string& second = "") {
  DirectiveNode d;
  d.name = "location";
  if (!first.empty()) {
    d.addArg(first);
  }
  if (!second.empty()) {
    d.addArg(second);
  }
  d.ensureBlock();
  return d;
}

}  // namespace

TEST(LocationTests, WrapTagsPrefixLocation) {
  DirectiveNode d = locationBlock("/api");
  Location::wrap(d, "server");
  EXPECT_EQ(d.kind, DirectiveNode::LOCATION);

  Location loc(d);
  EXPECT_EQ(loc.modifier(), "");
  EXPECT_EQ(loc.match(), "/api");
  EXPECT_EQ(&loc.directive(), &d);
}

TEST(LocationTests, WrapTagsModifierLocation) {
  DirectiveNode d = locationBlock("~*", "\\.(gif|jpg)$");
  Location::wrap(d, "server");

  Location loc(d);
  EXPECT_EQ(loc.modifier(), "~*");
  EXPECT_EQ(loc.match(), "\\.(gif|jpg)$");
}

TEST(LocationTests, WrapRejectsMissingMatch) {
  DirectiveNode d = locationBlock("");
  d.line = 7;
  d.column = 5;
  try {
    Location::wrap(d, "server");
    FAIL() << "expected ParseError";
  } catch (const ParseError& e) {
    EXPECT_EQ(e.kind(), ParseError::SEMANTIC);
    EXPECT_EQ(e.message(), "not enough parameters for location");
    EXPECT_EQ(e.line(), 7u);
    EXPECT_EQ(e.column(), 5u);
  }
  EXPECT_EQ(d.kind, DirectiveNode::DIRECTIVE);
}

TEST(LocationTests, WrapRejectsThreeParameters) {
  DirectiveNode d = locationBlock("=", "/a");
  d.addArg("/b");
  EXPECT_THROW(Location::wrap(d, ""), ParseError);
}

TEST(LocationTests, ViewIsLive) {
  DirectiveNode d = locationBlock("/old");
  Location::wrap(d, "server");
  Location loc(d);
  d.args[0].value = "/new";
  EXPECT_EQ(loc.match(), "/new");

  Location copy(loc);
  EXPECT_EQ(&copy.directive(), &d);
}
