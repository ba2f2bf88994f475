#include "BlockNode.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

DirectiveNode named(const std::string& name) {
  DirectiveNode d;
  d.name = name;
  return d;
}

// server { listen 80; # note
//          location / { root html; } }
BlockNode sampleTree() {
  BlockNode root;
  DirectiveNode& server = root.add(named("server"));
  BlockNode& body = server.ensureBlock();
  body.add(named("listen"));
  body.add(DirectiveNode::makeComment("listen"));
  DirectiveNode location = named("location");
  location.kind = DirectiveNode::LOCATION;
  location.ensureBlock().add(named("root"));
  body.add(location);
  root.add(named("listen"));
  return root;
}

}  // namespace

TEST(BlockNodeTests, AddKeepsOrder) {
  BlockNode block;
  EXPECT_TRUE(block.empty());
  block.add(named("a"));
  DirectiveNode& b = block.add(named("b"));
  b.addArg("x");

  ASSERT_EQ(block.size(), 2u);
  EXPECT_EQ(block.directives[0].name, "a");
  EXPECT_EQ(block.directives[1].args[0].value, "x");
}

TEST(BlockNodeTests, RemoveByIndex) {
  BlockNode block;
  block.add(named("a"));
  block.add(named("b"));
  block.add(named("c"));

  block.remove(1);
  ASSERT_EQ(block.size(), 2u);
  EXPECT_EQ(block.directives[1].name, "c");
  EXPECT_THROW(block.remove(2), std::out_of_range);
}

TEST(BlockNodeTests, FindDirectivesIsShallowAndSkipsComments) {
  BlockNode root = sampleTree();
  std::vector<DirectiveNode*> found = root.findDirectives("listen");
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0], &root.directives[1]);
  EXPECT_TRUE(root.findDirectives("root").empty());
}

TEST(BlockNodeTests, CollectByNameIsDeepInSourceOrder) {
  BlockNode root = sampleTree();
  std::vector<DirectiveNode*> found;
  root.collectByName("listen", found);

  ASSERT_EQ(found.size(), 2u);
  EXPECT_EQ(found[0], &root.directives[0].block().directives[0]);
  EXPECT_EQ(found[1], &root.directives[1]);

  found.clear();
  root.collectByName("root", found);
  EXPECT_EQ(found.size(), 1u);
}

TEST(BlockNodeTests, CollectByKind) {
  BlockNode root = sampleTree();
  std::vector<DirectiveNode*> found;
  root.collectByKind(DirectiveNode::LOCATION, found);
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0]->name, "location");

  found.clear();
  root.collectByKind(DirectiveNode::COMMENT, found);
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0]->comment, "listen");
}

TEST(BlockNodeTests, Equality) {
  EXPECT_EQ(sampleTree(), sampleTree());
  BlockNode other = sampleTree();
  other.remove(0);
  EXPECT_NE(sampleTree(), other);
}

TEST(BlockNodeTests, GrowingKeepsNestedBlocks) {
  BlockNode block;
  for (int i = 0; i < 100; ++i) {
    DirectiveNode server = named("server");
    server.ensureBlock().add(named("listen")).addArg("80");
    block.add(server);
  }

  ASSERT_EQ(block.size(), 100u);
  for (size_t i = 0; i < block.size(); ++i) {
    ASSERT_TRUE(block.directives[i].hasBlock());
    EXPECT_EQ(block.directives[i].block().directives[0].args[0].value, "80");
  }
}

TEST(BlockNodeTests, AddCopyOfOwnNode) {
  BlockNode block;
  block.add(named("a")).ensureBlock().add(named("inner"));
  for (int i = 0; i < 20; ++i) {
    block.add(block.directives[0]);
  }

  ASSERT_EQ(block.size(), 21u);
  EXPECT_EQ(block.directives[20], block.directives[0]);
  EXPECT_EQ(block.directives[20].block().directives[0].name, "inner");
}
