// stencil/runtime/value.hpp - Runtime value model
//
// Template values are plain nlohmann::json documents, so hosts pass locals,
// globals and tool results in the same format they already serialize.
// The "missing" sentinel (unset locals/globals, out-of-range access) is a
// discarded json value: it never appears in well-formed host data.
//
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "stencil/ast/ast_enums.hpp"

namespace stencil
{

using Value = nlohmann::json;

// ============================================================================
// Missing sentinel
// ============================================================================

[[nodiscard]] inline Value missing() { return Value(Value::value_t::discarded); }

[[nodiscard]] inline bool is_missing(const Value & v) noexcept { return v.is_discarded(); }

// ============================================================================
// Conversions
// ============================================================================

/**
 * Weak truthiness.
 *
 * Falsy: missing, null, false, 0, 0.0, NaN and the empty string.
 * Everything else, including empty arrays and objects, is truthy.
 */
[[nodiscard]] bool is_truthy(const Value & v) noexcept;

/**
 * Text form used by `$print` and `$(...)`.
 *
 * - missing   -> `undefined`
 * - null      -> `null`
 * - booleans  -> `true` / `false`
 * - integers  -> decimal
 * - floats    -> no fraction when integral (`2.0` -> `2`), otherwise the
 *                shortest form that round-trips; `NaN`, `Infinity`
 * - strings   -> verbatim
 * - arrays / objects -> compact JSON with object keys in sorted order
 */
[[nodiscard]] std::string to_text(const Value & v);

/// Numeric view used by relational operators; nullopt when not convertible.
[[nodiscard]] std::optional<double> to_number(const Value & v);

/// Type name for diagnostics ("undefined", "null", "boolean", ...).
[[nodiscard]] std::string_view type_name(const Value & v) noexcept;

// ============================================================================
// Operators
// ============================================================================

/// `==`: null and missing equal each other; numbers and numeric strings compare by value.
[[nodiscard]] bool loose_equals(const Value & a, const Value & b);

/// `===`: same kind and same value (integers and floats are one "number" kind).
[[nodiscard]] bool strict_equals(const Value & a, const Value & b);

/// `<`, `<=`, `>`, `>=`. Operands that cannot be compared yield false.
[[nodiscard]] bool compare_values(BinaryOp op, const Value & a, const Value & b);

// ============================================================================
// Access
// ============================================================================

/// `base.name`: object member, or `length` of an array / string; else missing.
[[nodiscard]] Value member_of(const Value & base, std::string_view name);

/// `base[index]`: array/string position or object key; else missing.
[[nodiscard]] Value index_of(const Value & base, const Value & index);

}  // namespace stencil
