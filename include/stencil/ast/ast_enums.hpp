// stencil/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds and operators used by the template AST.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace stencil
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for range-based classof checks.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "stencil/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "stencil/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "stencil/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "stencil/ast/ast_nodes.def"
};

[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Class;
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Class;
#include "stencil/ast/ast_nodes.def"
  }
  return "";
}

// ============================================================================
// Operators
// ============================================================================

enum class BinaryOp : uint8_t {
  // Equality
  StrictEq,  ///< ===
  LooseEq,   ///< ==
  StrictNe,  ///< !==
  LooseNe,   ///< !=
  // Relational
  Lt,  ///< <
  Le,  ///< <=
  Gt,  ///< >
  Ge,  ///< >=
  // Logical (short-circuit)
  And,  ///< &&
  Or,   ///< ||
};

enum class UnaryOp : uint8_t {
  Not,  ///< !
  Neg,  ///< -
};

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::StrictEq:
      return "===";
    case BinaryOp::LooseEq:
      return "==";
    case BinaryOp::StrictNe:
      return "!==";
    case BinaryOp::LooseNe:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "!";
    case UnaryOp::Neg:
      return "-";
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::NullLiteral;
inline constexpr NodeKind k_last_expr_kind = NodeKind::MissingExpr;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::Text;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::Place;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

}  // namespace stencil
