// tierflow/syntax/ts_ll.hpp - Low-level Tree-sitter wrapper (CST access)
//
// Only what the tree builder needs: reading node positions, walking with a
// cursor, and owning parsers and trees.
//
#pragma once

#include <tree_sitter/api.h>

#include <cstdint>
#include <memory>
#include <string_view>

namespace tierflow::ts_ll
{

/// (row, column) pair; columns count bytes, not characters.
struct Point
{
  uint32_t row = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool operator==(const Point & other) const noexcept
  {
    return row == other.row && column == other.column;
  }
  [[nodiscard]] constexpr bool operator!=(const Point & other) const noexcept
  {
    return !(*this == other);
  }
};

//------------------------------------------------------------------------------
// Node - read-only view of a TSNode
//------------------------------------------------------------------------------
class Node
{
public:
  Node() = default;
  explicit Node(TSNode n) : node_(n) {}

  [[nodiscard]] bool is_null() const noexcept { return ts_node_is_null(node_); }

  /// Grammar symbol name, e.g. "function_definition" or "ERROR".
  [[nodiscard]] std::string_view kind() const noexcept
  {
    const char * name = ts_node_type(node_);
    return name ? std::string_view(name) : std::string_view();
  }

  [[nodiscard]] uint32_t start_byte() const noexcept { return ts_node_start_byte(node_); }
  [[nodiscard]] uint32_t end_byte() const noexcept { return ts_node_end_byte(node_); }
  [[nodiscard]] Point start_point() const noexcept { return to_point(ts_node_start_point(node_)); }
  [[nodiscard]] Point end_point() const noexcept { return to_point(ts_node_end_point(node_)); }

  [[nodiscard]] TSNode raw() const noexcept { return node_; }

private:
  static Point to_point(TSPoint p) noexcept { return {p.row, p.column}; }

  TSNode node_{};
};

//------------------------------------------------------------------------------
// Cursor - depth-first walk over all (named and anonymous) nodes
//------------------------------------------------------------------------------
class Cursor
{
public:
  explicit Cursor(Node root) : cursor_(ts_tree_cursor_new(root.raw())) {}
  Cursor(const Cursor &) = delete;
  Cursor & operator=(const Cursor &) = delete;
  ~Cursor() { ts_tree_cursor_delete(&cursor_); }

  [[nodiscard]] Node node() const noexcept { return Node(ts_tree_cursor_current_node(&cursor_)); }

  [[nodiscard]] bool first_child() noexcept { return ts_tree_cursor_goto_first_child(&cursor_); }
  [[nodiscard]] bool next_sibling() noexcept
  {
    return ts_tree_cursor_goto_next_sibling(&cursor_);
  }
  [[nodiscard]] bool parent() noexcept { return ts_tree_cursor_goto_parent(&cursor_); }

private:
  TSTreeCursor cursor_;
};

//------------------------------------------------------------------------------
// Tree / Parser - owning handles
//------------------------------------------------------------------------------
struct TreeDeleter
{
  void operator()(TSTree * t) const noexcept { ts_tree_delete(t); }
};
using Tree = std::unique_ptr<TSTree, TreeDeleter>;

/// Root of `tree`, or a null node for an empty handle.
[[nodiscard]] Node root_of(const Tree & tree) noexcept;

class Parser
{
public:
  /// @throws std::bad_alloc when tree-sitter cannot allocate a parser
  Parser();

  /// Bind a grammar. Returns false when the ABI version is incompatible.
  [[nodiscard]] bool set_language(const TSLanguage * language) noexcept;

  /// Parse a byte buffer. Empty when tree-sitter gives up.
  [[nodiscard]] Tree parse_bytes(std::string_view source) const;

private:
  struct ParserDeleter
  {
    void operator()(TSParser * p) const noexcept { ts_parser_delete(p); }
  };
  std::unique_ptr<TSParser, ParserDeleter> parser_;
};

/// Whether a grammar's ABI version can be loaded by the linked runtime.
[[nodiscard]] bool is_compatible_language(const TSLanguage * language) noexcept;

}  // namespace tierflow::ts_ll
