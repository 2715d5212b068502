// test_syntax_tree.cpp - Arena tree invariants

#include <gtest/gtest.h>

#include <stdexcept>

#include "tierflow/syntax/syntax_tree.hpp"

using tierflow::k_no_parent;
using tierflow::SyntaxNode;
using tierflow::SyntaxTree;

namespace
{

SyntaxNode make_node(const char * kind, uint32_t start, uint32_t end)
{
  SyntaxNode n;
  n.kind = kind;
  n.start_byte = start;
  n.end_byte = end;
  n.start_point = {0, start};
  n.end_point = {0, end};
  return n;
}

}  // namespace

TEST(SyntaxTree, AddNodeLinksParentAndChildren)
{
  SyntaxTree tree;
  const auto root = tree.add_node(make_node("module", 0, 10));
  const auto a = tree.add_node(make_node("expression_statement", 0, 4), root);
  const auto b = tree.add_node(make_node("expression_statement", 5, 10), root);
  const auto leaf = tree.add_node(make_node("identifier", 0, 1), a);

  ASSERT_EQ(tree.size(), 4u);
  EXPECT_EQ(tree.root().parent, k_no_parent);
  EXPECT_EQ(tree.root().children, (std::vector<tierflow::NodeIndex>{a, b}));
  EXPECT_EQ(tree.node(leaf).parent, a);
  EXPECT_TRUE(tree.root().contains(tree.node(b)));
  EXPECT_EQ(tree.depth(), 2u);
}

TEST(SyntaxTree, RejectsSecondRootAndBadParent)
{
  SyntaxTree tree;
  tree.add_node(make_node("module", 0, 1));

  EXPECT_THROW(tree.add_node(make_node("module", 0, 1)), std::logic_error);
  EXPECT_THROW(tree.add_node(make_node("identifier", 0, 1), 7), std::out_of_range);
}

TEST(SyntaxTree, ErrorNodesInDocumentOrder)
{
  SyntaxTree tree;
  const auto root = tree.add_node(make_node("module", 0, 20));
  const auto first = tree.add_node(make_node("ERROR", 0, 3), root);
  tree.add_node(make_node("identifier", 4, 5), root);
  const auto nested_parent = tree.add_node(make_node("block", 6, 20), root);
  const auto second = tree.add_node(make_node("ERROR", 7, 9), nested_parent);

  const auto errors = tree.error_nodes();
  ASSERT_EQ(errors.size(), 2u);
  EXPECT_EQ(errors[0], first);
  EXPECT_EQ(errors[1], second);

  const auto loc = tierflow::make_error_location(tree.node(second));
  EXPECT_EQ(loc.start_byte, 7u);
  EXPECT_EQ(loc.end_byte, 9u);
}

TEST(SyntaxTree, EmptyTreeHasNoErrors)
{
  SyntaxTree tree;
  EXPECT_TRUE(tree.empty());
  EXPECT_TRUE(tree.error_nodes().empty());
  EXPECT_EQ(tree.depth(), 0u);
}
