// tierflow/syntax/syntax_tree.cpp
//
#include "tierflow/syntax/syntax_tree.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace tierflow
{

NodeIndex SyntaxTree::add_node(SyntaxNode node, NodeIndex parent)
{
  if (parent == k_no_parent && !nodes_.empty()) {
    throw std::logic_error("SyntaxTree already has a root");
  }
  if (parent != k_no_parent && parent >= nodes_.size()) {
    throw std::out_of_range("SyntaxTree parent index out of range");
  }

  const auto index = static_cast<NodeIndex>(nodes_.size());
  node.parent = parent;
  node.children.clear();
  nodes_.push_back(std::move(node));
  if (parent != k_no_parent) {
    nodes_[parent].children.push_back(index);
  }
  return index;
}

std::vector<NodeIndex> SyntaxTree::error_nodes() const
{
  // Pre-order storage is document order.
  std::vector<NodeIndex> out;
  for (NodeIndex i = 0; i < nodes_.size(); ++i) {
    if (nodes_[i].is_error()) out.push_back(i);
  }
  return out;
}

size_t SyntaxTree::depth() const
{
  // Parents always precede their children, so one forward pass suffices.
  std::vector<size_t> depths(nodes_.size(), 0);
  size_t max_depth = 0;
  for (NodeIndex i = 0; i < nodes_.size(); ++i) {
    const NodeIndex parent = nodes_[i].parent;
    if (parent != k_no_parent) {
      depths[i] = depths[parent] + 1;
    }
    max_depth = std::max(max_depth, depths[i]);
  }
  return max_depth;
}

ErrorLocation make_error_location(const SyntaxNode & node)
{
  ErrorLocation loc;
  loc.start_point = node.start_point;
  loc.end_point = node.end_point;
  loc.start_byte = node.start_byte;
  loc.end_byte = node.end_byte;
  return loc;
}

}  // namespace tierflow
