// stencil/ast/ast_utils.hpp - Structural queries over a component tree
#pragma once

#include <string_view>
#include <vector>

#include "stencil/ast/ast.hpp"

namespace stencil
{

/// Placeholder names declared by `$place`, in document order, without duplicates.
[[nodiscard]] std::vector<std::string_view> collect_placeholders(const Component * component);

/// Tool names called anywhere in the component, in first-use order, without duplicates.
[[nodiscard]] std::vector<std::string_view> collect_tool_calls(const Component * component);

/// Static dependencies: `$include` names and `$render` targets that are string literals.
[[nodiscard]] std::vector<std::string_view> collect_static_dependencies(const Component * component);

}  // namespace stencil
