// tierflow/syntax/tree_json.hpp - JSON form of ParseResult
//
// Layout:
//   {
//     "filepath": "/abs/path.py",
//     "language": "python",
//     "root_node": {"type", "start_point": [row, col], "end_point",
//                   "start_byte", "end_byte", "children": [...]},
//     "error_nodes": [{"type": "ERROR", "start_point", ...}],
//     "parse_success": true,
//     "error": "..."            // only when root_node is null
//   }
//
#pragma once

#include <nlohmann/json.hpp>

#include "tierflow/syntax/syntax_tree.hpp"

namespace tierflow
{

[[nodiscard]] nlohmann::json to_json(const SyntaxTree & tree);
[[nodiscard]] nlohmann::json to_json(const ParseResult & result);

/**
 * Rebuild a tree from its nested JSON form.
 *
 * @throws nlohmann::json::exception on missing or mistyped keys
 */
[[nodiscard]] SyntaxTree syntax_tree_from_json(const nlohmann::json & j);

/// @throws nlohmann::json::exception on missing or mistyped keys
[[nodiscard]] ParseResult parse_result_from_json(const nlohmann::json & j);

}  // namespace tierflow
