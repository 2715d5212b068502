// tierflow/syntax/tree_json.cpp - ParseResult <-> JSON
//
#include "tierflow/syntax/tree_json.hpp"

#include <string>
#include <utility>
#include <vector>

namespace tierflow
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_point(Point p) { return json::array({p.row, p.column}); }

Point point_from(const json & j)
{
  return {j.at(0).get<uint32_t>(), j.at(1).get<uint32_t>()};
}

json j_span(std::string_view kind, Point start, Point end, uint32_t start_byte, uint32_t end_byte)
{
  return json{
    {"type", std::string(kind)},
    {"start_point", j_point(start)},
    {"end_point", j_point(end)},
    {"start_byte", start_byte},
    {"end_byte", end_byte}};
}

SyntaxNode node_from(const json & j)
{
  SyntaxNode n;
  n.kind = j.at("type").get<std::string>();
  n.start_point = point_from(j.at("start_point"));
  n.end_point = point_from(j.at("end_point"));
  n.start_byte = j.at("start_byte").get<uint32_t>();
  n.end_byte = j.at("end_byte").get<uint32_t>();
  return n;
}

}  // namespace

json to_json(const SyntaxTree & tree)
{
  if (tree.empty()) return nullptr;

  // Children always have larger indices than their parent, so filling the
  // array back to front assembles every subtree before its parent needs it.
  const auto & nodes = tree.nodes();
  std::vector<json> built(nodes.size());
  for (size_t i = nodes.size(); i-- > 0;) {
    const SyntaxNode & n = nodes[i];
    json j = j_span(n.kind, n.start_point, n.end_point, n.start_byte, n.end_byte);
    json children = json::array();
    for (const NodeIndex c : n.children) {
      children.push_back(std::move(built[c]));
    }
    j["children"] = std::move(children);
    built[i] = std::move(j);
  }
  return std::move(built.front());
}

json to_json(const ParseResult & result)
{
  json errors = json::array();
  for (const auto & e : result.error_nodes) {
    errors.push_back(j_span(k_error_kind, e.start_point, e.end_point, e.start_byte, e.end_byte));
  }

  json j{
    {"filepath", result.file_path.string()},
    {"language", result.language},
    {"root_node", result.tree ? to_json(*result.tree) : json(nullptr)},
    {"error_nodes", std::move(errors)},
    {"parse_success", result.success}};
  if (result.error) {
    j["error"] = *result.error;
  }
  return j;
}

SyntaxTree syntax_tree_from_json(const json & j)
{
  SyntaxTree tree;
  if (j.is_null()) return tree;

  // Explicit stack; children are pushed in reverse so they pop in document
  // order and the arena ends up in pre-order.
  std::vector<std::pair<const json *, NodeIndex>> stack;
  stack.emplace_back(&j, k_no_parent);
  while (!stack.empty()) {
    const auto [node_json, parent] = stack.back();
    stack.pop_back();

    const NodeIndex index = tree.add_node(node_from(*node_json), parent);

    const auto it = node_json->find("children");
    if (it == node_json->end() || it->is_null()) continue;
    const json & children = *it;
    for (size_t i = children.size(); i-- > 0;) {
      stack.emplace_back(&children.at(i), index);
    }
  }
  return tree;
}

ParseResult parse_result_from_json(const json & j)
{
  ParseResult r;
  r.file_path = j.at("filepath").get<std::string>();
  r.language = j.at("language").get<std::string>();

  const json & root = j.at("root_node");
  if (!root.is_null()) {
    r.tree = syntax_tree_from_json(root);
  }

  for (const auto & e : j.at("error_nodes")) {
    ErrorLocation loc;
    loc.start_point = point_from(e.at("start_point"));
    loc.end_point = point_from(e.at("end_point"));
    loc.start_byte = e.at("start_byte").get<uint32_t>();
    loc.end_byte = e.at("end_byte").get<uint32_t>();
    r.error_nodes.push_back(loc);
  }

  r.success = j.at("parse_success").get<bool>();
  if (const auto it = j.find("error"); it != j.end() && it->is_string()) {
    r.error = it->get<std::string>();
  }
  return r;
}

}  // namespace tierflow
