// tierflow/syntax/tree_builder.hpp - File -> ParseResult
//
// Entry point of the syntax-tree layer consumed by analysis tools.
//
#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

#include "tierflow/syntax/grammar_resolver.hpp"
#include "tierflow/syntax/syntax_tree.hpp"

namespace tierflow
{

/**
 * Raised when a parse request cannot be served at all, as opposed to a file
 * that parses with errors (which is reported through ParseResult).
 */
class ParseRequestError : public std::runtime_error
{
public:
  enum class Kind {
    FileNotFound,
    UnsupportedLanguage,
    ReadFailure,
  };

  ParseRequestError(Kind kind, const std::string & message)
  : std::runtime_error(message), kind_(kind)
  {
  }

  [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
  Kind kind_;
};

/**
 * Parse a file.
 *
 * The file is read as raw bytes. ERROR nodes are collected in document
 * order; `success` is true iff none were found. If tree-sitter produces no
 * tree, a failed ParseResult with `error` set is returned.
 *
 * @throws ParseRequestError if the file is missing or unreadable, or the
 *         language has no grammar
 */
[[nodiscard]] ParseResult parse_file(
  GrammarResolver & resolver, const std::filesystem::path & file, std::string_view language);

/**
 * Parse an in-memory buffer with the same rules as parse_file.
 *
 * @throws ParseRequestError (UnsupportedLanguage only)
 */
[[nodiscard]] ParseResult parse_source(
  GrammarResolver & resolver, std::string_view bytes, std::string_view language,
  const std::filesystem::path & virtual_path = "<memory>");

/**
 * Build a SyntaxTree from a tree-sitter root node.
 *
 * Walks the tree with a cursor; stack depth does not grow with tree depth.
 */
[[nodiscard]] SyntaxTree build_syntax_tree(ts_ll::Node root);

}  // namespace tierflow
