// tierflow/syntax/tree_builder.cpp - Parse pipeline for one file
//
#include "tierflow/syntax/tree_builder.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <fstream>
#include <iterator>
#include <utility>
#include <vector>

#include "tierflow/syntax/ts_ll.hpp"

namespace fs = std::filesystem;

namespace tierflow
{

namespace
{

SyntaxNode to_syntax_node(const ts_ll::Node n)
{
  SyntaxNode out;
  out.kind = std::string(n.kind());
  out.start_point = n.start_point();
  out.end_point = n.end_point();
  out.start_byte = n.start_byte();
  out.end_byte = n.end_byte();
  return out;
}

ParseResult failed_result(fs::path path, std::string language, std::string message)
{
  ParseResult r;
  r.file_path = std::move(path);
  r.language = std::move(language);
  r.success = false;
  r.error = std::move(message);
  return r;
}

std::string read_bytes(const fs::path & file)
{
  const auto read_failure = [&](const std::string & why) {
    return ParseRequestError(
      ParseRequestError::Kind::ReadFailure, "error reading " + file.string() + ": " + why);
  };

  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) {
    throw read_failure("cannot open");
  }

  try {
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
      throw read_failure("I/O error");
    }
    return bytes;
  } catch (const std::ios_base::failure & e) {
    throw read_failure(e.what());
  }
}

}  // namespace

SyntaxTree build_syntax_tree(const ts_ll::Node root)
{
  SyntaxTree tree;
  if (root.is_null()) return tree;

  ts_ll::Cursor cursor(root);
  std::vector<NodeIndex> ancestors;
  NodeIndex current = tree.add_node(to_syntax_node(cursor.node()));

  for (;;) {
    if (cursor.first_child()) {
      ancestors.push_back(current);
      current = tree.add_node(to_syntax_node(cursor.node()), ancestors.back());
      continue;
    }

    // Leaf: move to the next sibling, climbing as long as there is none.
    for (;;) {
      if (ancestors.empty()) return tree;
      if (cursor.next_sibling()) {
        current = tree.add_node(to_syntax_node(cursor.node()), ancestors.back());
        break;
      }
      if (!cursor.parent()) return tree;
      ancestors.pop_back();
    }
  }
}

ParseResult parse_source(
  GrammarResolver & resolver, std::string_view bytes, std::string_view language,
  const fs::path & virtual_path)
{
  const std::string lang = normalize_language_name(language);
  const Grammar * grammar = resolver.resolve(lang);
  if (!grammar) {
    throw ParseRequestError(
      ParseRequestError::Kind::UnsupportedLanguage,
      "language '" + lang + "' not supported: no tree-sitter grammar found");
  }

  try {
    ts_ll::Parser parser;
    if (!parser.set_language(grammar->ts_language)) {
      return failed_result(
        virtual_path, lang, "grammar for '" + lang + "' was rejected by the parser");
    }

    const ts_ll::Tree ts_tree = parser.parse_bytes(bytes);
    if (!ts_tree) {
      return failed_result(virtual_path, lang, "tree-sitter returned no tree");
    }

    ParseResult r;
    r.file_path = virtual_path;
    r.language = lang;
    r.tree = build_syntax_tree(ts_ll::root_of(ts_tree));
    for (const NodeIndex i : r.tree->error_nodes()) {
      r.error_nodes.push_back(make_error_location(r.tree->node(i)));
    }
    r.success = r.error_nodes.empty();
    return r;
  } catch (const std::exception & e) {
    // One unparsable file must not abort a batch.
    spdlog::warn("error parsing {}: {}", virtual_path.string(), e.what());
    return failed_result(virtual_path, lang, e.what());
  }
}

ParseResult parse_file(GrammarResolver & resolver, const fs::path & file, std::string_view language)
{
  std::error_code ec;
  if (!fs::exists(file, ec)) {
    throw ParseRequestError(
      ParseRequestError::Kind::FileNotFound, "file not found: " + file.string());
  }
  if (!fs::is_regular_file(file, ec)) {
    throw ParseRequestError(
      ParseRequestError::Kind::ReadFailure,
      "error reading " + file.string() + ": not a regular file");
  }

  const fs::path abs_path = fs::absolute(file, ec);
  const std::string lang = normalize_language_name(language);
  if (!resolver.resolve(lang)) {
    throw ParseRequestError(
      ParseRequestError::Kind::UnsupportedLanguage,
      "language '" + lang + "' not supported: no tree-sitter grammar found");
  }

  const std::string bytes = read_bytes(file);
  return parse_source(resolver, bytes, lang, ec ? file : abs_path);
}

}  // namespace tierflow
