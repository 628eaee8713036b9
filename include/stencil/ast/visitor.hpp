// stencil/ast/visitor.hpp - CRTP Visitor pattern for AST traversal
//
// Dispatch is generated from ast_nodes.def, so adding a node kind adds a
// visit_<snake> hook to every visitor automatically.
//
#pragma once

#include <type_traits>

#include "stencil/ast/ast.hpp"
#include "stencil/ast/ast_enums.hpp"
#include "stencil/basic/casting.hpp"

namespace stencil
{

// ============================================================================
// Type Traits for Const-Aware Node Pointer
// ============================================================================

namespace detail
{

template <typename NodePtrT, typename DerivedNode>
struct PropagateConst
{
  using type = std::conditional_t<
    std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;
};

template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = typename PropagateConst<NodePtrT, DerivedNode>::type;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP-based visitor for AST traversal.
 *
 * The derived class overrides visit_<snake>() for the nodes it cares
 * about. Unhandled nodes fall back to visit_expr() / visit_stmt() and
 * finally visit_node().
 *
 * @code
 *   class PrintCounter : public ConstAstVisitor<PrintCounter, void> {
 *   public:
 *     int count = 0;
 *     void visit_print_stmt(const PrintStmt*) { ++count; }
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods
 * @tparam NodePtrT AstNode* or const AstNode*
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }
  [[nodiscard]] const Derived & get_derived() const { return static_cast<const Derived &>(*this); }

  // ===========================================================================
  // Main dispatch method
  // ===========================================================================

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "stencil/ast/ast_nodes.def"
    }

    return ReturnType();
  }

  // ===========================================================================
  // Default visit methods (generated from the X-Macro)
  // ===========================================================================

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "stencil/ast/ast_nodes.def"

  // ===========================================================================
  // Category-level visit methods
  // ===========================================================================

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * A visitor that walks into child nodes.
 *
 * Every hook returns bool; returning false stops the whole traversal.
 * Override a hook and skip the base call to prune a subtree.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  // --- Expressions -----------------------------------------------------------

  bool visit_member_expr(NodePtr<MemberExpr> node) { return get_derived().visit(node->base); }

  bool visit_index_expr(NodePtr<IndexExpr> node)
  {
    if (!get_derived().visit(node->base)) return false;
    return get_derived().visit(node->index);
  }

  bool visit_tool_call_expr(NodePtr<ToolCallExpr> node)
  {
    for (auto * arg : node->args) {
      if (!get_derived().visit(arg)) return false;
    }
    return true;
  }

  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    if (!get_derived().visit(node->lhs)) return false;
    return get_derived().visit(node->rhs);
  }

  bool visit_unary_expr(NodePtr<UnaryExpr> node) { return get_derived().visit(node->operand); }

  bool visit_group_expr(NodePtr<GroupExpr> node) { return get_derived().visit(node->inner); }

  // --- Statements ------------------------------------------------------------

  bool visit_print_stmt(NodePtr<PrintStmt> node) { return get_derived().visit(node->value); }

  bool visit_log_stmt(NodePtr<LogStmt> node) { return get_derived().visit(node->value); }

  bool visit_if_stmt(NodePtr<IfStmt> node)
  {
    for (auto * branch : node->branches) {
      if (!get_derived().visit(branch)) return false;
    }
    return visit_body(node->elseBody);
  }

  bool visit_foreach_stmt(NodePtr<ForeachStmt> node)
  {
    if (!get_derived().visit(node->collection)) return false;
    return visit_body(node->body);
  }

  bool visit_render_stmt(NodePtr<RenderStmt> node)
  {
    if (!get_derived().visit(node->target)) return false;
    for (auto * binding : node->bindings) {
      if (!get_derived().visit(binding)) return false;
    }
    for (auto * repl : node->replacements) {
      if (!get_derived().visit(repl)) return false;
    }
    return true;
  }

  // --- Supporting / top-level ------------------------------------------------

  bool visit_if_branch(NodePtr<IfBranch> node)
  {
    if (!get_derived().visit(node->condition)) return false;
    return visit_body(node->body);
  }

  bool visit_render_binding(NodePtr<RenderBinding> node)
  {
    return get_derived().visit(node->value);
  }

  bool visit_replace_block(NodePtr<ReplaceBlock> node) { return visit_body(node->body); }

  bool visit_component(NodePtr<Component> node) { return visit_body(node->body); }

  /// Leaves (literals, references, text, include, place) continue traversal.
  bool visit_node(NodePtrT /*node*/) { return true; }

protected:
  bool visit_body(Body body)
  {
    for (auto * stmt : body) {
      if (!get_derived().visit(stmt)) return false;
    }
    return true;
  }
};

}  // namespace stencil
