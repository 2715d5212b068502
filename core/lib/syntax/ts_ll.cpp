// tierflow/syntax/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "tierflow/syntax/ts_ll.hpp"

#include <new>

namespace tierflow::ts_ll
{

Node root_of(const Tree & tree) noexcept
{
  return tree ? Node(ts_tree_root_node(tree.get())) : Node();
}

Parser::Parser() : parser_(ts_parser_new())
{
  if (!parser_) {
    throw std::bad_alloc();
  }
}

bool Parser::set_language(const TSLanguage * language) noexcept
{
  if (!language) return false;
  return ts_parser_set_language(parser_.get(), language);
}

Tree Parser::parse_bytes(std::string_view source) const
{
  // Offsets in the resulting tree are byte offsets into `source`.
  return Tree(ts_parser_parse_string(
    parser_.get(), /*old_tree*/ nullptr, source.data(), static_cast<uint32_t>(source.size())));
}

bool is_compatible_language(const TSLanguage * language) noexcept
{
  if (!language) return false;
  const uint32_t version = ts_language_version(language);
  return version >= TREE_SITTER_MIN_COMPATIBLE_LANGUAGE_VERSION &&
         version <= TREE_SITTER_LANGUAGE_VERSION;
}

}  // namespace tierflow::ts_ll
