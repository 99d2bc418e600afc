// tova/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Provides a visitor-based JSON serialization for the AST,
// returning nlohmann::json objects for any AST node.
//
#pragma once

#include <nlohmann/json.hpp>

#include "tova/ast/ast.hpp"

namespace tova
{

/**
 * Serialize an AST node to JSON.
 *
 * Every node becomes an object with a "type" member naming its class and
 * a "range" member holding byte offsets; null children serialize as null.
 *
 * @param node The AST node to serialize (can be any node type)
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/**
 * Serialize a Program including every top-level statement.
 */
[[nodiscard]] nlohmann::json to_json(const Program * program);

}  // namespace tova
