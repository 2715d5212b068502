// tierflow/syntax/syntax_tree.hpp - Serializable, arena-backed syntax tree
//
// A SyntaxTree is a flat array of nodes in pre-order. Node 0 is the root;
// parent/child links are indices into the array, so the tree has no pointers
// to fix up when it is copied or serialized.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tierflow/syntax/ts_ll.hpp"

namespace tierflow
{

/// Node kind tree-sitter uses for unparsable regions.
inline constexpr std::string_view k_error_kind = "ERROR";

using NodeIndex = uint32_t;
inline constexpr NodeIndex k_no_parent = UINT32_MAX;

using Point = ts_ll::Point;

struct SyntaxNode
{
  std::string kind;
  Point start_point;
  Point end_point;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  NodeIndex parent = k_no_parent;
  std::vector<NodeIndex> children;

  [[nodiscard]] bool is_error() const noexcept { return kind == k_error_kind; }

  /// Whether `other`'s byte span lies within this node's span.
  [[nodiscard]] bool contains(const SyntaxNode & other) const noexcept
  {
    return other.start_byte >= start_byte && other.end_byte <= end_byte;
  }
};

/**
 * Location of one ERROR node. Same shape as SyntaxNode without children.
 */
struct ErrorLocation
{
  Point start_point;
  Point end_point;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool operator==(const ErrorLocation & other) const noexcept
  {
    return start_point == other.start_point && end_point == other.end_point &&
           start_byte == other.start_byte && end_byte == other.end_byte;
  }
};

class SyntaxTree
{
public:
  SyntaxTree() = default;

  /// Append a node as the last child of `parent` (or as the root).
  NodeIndex add_node(SyntaxNode node, NodeIndex parent = k_no_parent);

  [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }

  [[nodiscard]] const SyntaxNode & root() const { return nodes_.front(); }
  [[nodiscard]] const SyntaxNode & node(NodeIndex i) const { return nodes_.at(i); }
  [[nodiscard]] const std::vector<SyntaxNode> & nodes() const noexcept { return nodes_; }

  /// Nodes whose kind is ERROR, in document order.
  [[nodiscard]] std::vector<NodeIndex> error_nodes() const;

  /// Maximum depth (root has depth 0).
  [[nodiscard]] size_t depth() const;

private:
  std::vector<SyntaxNode> nodes_;
};

[[nodiscard]] ErrorLocation make_error_location(const SyntaxNode & node);

/**
 * Result of parsing one file in one language.
 */
struct ParseResult
{
  std::filesystem::path file_path;
  std::string language;

  /// Absent iff parsing failed outright (see `error`).
  std::optional<SyntaxTree> tree;

  std::vector<ErrorLocation> error_nodes;

  /// True iff a tree exists and it contains no ERROR nodes.
  bool success = false;

  /// Message describing why no tree was produced.
  std::optional<std::string> error;
};

}  // namespace tierflow
