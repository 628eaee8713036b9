// stencil/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Used by `stencil dump-ast` and by tests that compare tree shapes.
//
#pragma once

#include <nlohmann/json.hpp>

#include "stencil/ast/ast.hpp"

namespace stencil
{

/**
 * Serialize any AST node to JSON.
 *
 * Every object carries "type" (the node class name) and "range"
 * ({"start": byte, "end": byte}, or nulls when unknown). Output is
 * deterministic for a given tree.
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/// Serialize a whole component: {"type": "Component", "name", "range", "body"}.
[[nodiscard]] nlohmann::json to_json(const Component * component);

}  // namespace stencil
