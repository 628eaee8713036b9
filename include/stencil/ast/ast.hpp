// stencil/ast/ast.hpp - AST node class definitions for templates
//
// Nodes follow the LLVM/Clang style with classof() for RTTI. Every node is
// allocated in an AstContext arena and must stay trivially destructible:
// text is held as interned std::string_view and child lists as gsl::span.
//
#pragma once

#include <gsl/span>
#include <optional>
#include <string_view>

#include "stencil/ast/ast_enums.hpp"
#include "stencil/basic/casting.hpp"
#include "stencil/basic/source_manager.hpp"

namespace stencil
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every node has a NodeKind for RTTI and a SourceRange into the component
 * text. Nodes are non-copyable and owned by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base class that implements classof() for a concrete node.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Ordered statement list (a block body).
using Body = gsl::span<Stmt *>;

// ============================================================================
// Expression Nodes
// ============================================================================

class NullLiteralExpr : public NodeBase<NullLiteralExpr, Expr, NodeKind::NullLiteral>
{
public:
  explicit NullLiteralExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// `undefined`: evaluates to the missing sentinel.
class UndefinedLiteralExpr
: public NodeBase<UndefinedLiteralExpr, Expr, NodeKind::UndefinedLiteral>
{
public:
  explicit UndefinedLiteralExpr(SourceRange r = {}) : NodeBase(r) {}
};

class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class IntLiteralExpr : public NodeBase<IntLiteralExpr, Expr, NodeKind::IntLiteral>
{
public:
  int64_t value;

  explicit IntLiteralExpr(int64_t v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class FloatLiteralExpr : public NodeBase<FloatLiteralExpr, Expr, NodeKind::FloatLiteral>
{
public:
  double value;

  explicit FloatLiteralExpr(double v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// String literal; value holds the unescaped contents.
class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Reference to a local binding, resolved through the scope chain.
class LocalRefExpr : public NodeBase<LocalRefExpr, Expr, NodeKind::LocalRef>
{
public:
  std::string_view name;

  explicit LocalRefExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Reference to a read-only global: `@name`.
class GlobalRefExpr : public NodeBase<GlobalRefExpr, Expr, NodeKind::GlobalRef>
{
public:
  std::string_view name;

  explicit GlobalRefExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Member access: base.member
class MemberExpr : public NodeBase<MemberExpr, Expr, NodeKind::MemberExpr>
{
public:
  Expr * base;
  std::string_view member;

  MemberExpr(Expr * b, std::string_view m, SourceRange r = {}) : NodeBase(r), base(b), member(m)
  {
  }
};

/// Index access: base[index]
class IndexExpr : public NodeBase<IndexExpr, Expr, NodeKind::IndexExpr>
{
public:
  Expr * base;
  Expr * index;

  IndexExpr(Expr * b, Expr * i, SourceRange r = {}) : NodeBase(r), base(b), index(i) {}
};

/// Call of a registered tool: name(arg, ...)
class ToolCallExpr : public NodeBase<ToolCallExpr, Expr, NodeKind::ToolCall>
{
public:
  std::string_view name;
  gsl::span<Expr *> args;

  ToolCallExpr(std::string_view n, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), name(n), args(a)
  {
  }
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::UnaryExpr>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

/// Parenthesized expression.
class GroupExpr : public NodeBase<GroupExpr, Expr, NodeKind::GroupExpr>
{
public:
  Expr * inner;

  explicit GroupExpr(Expr * e, SourceRange r = {}) : NodeBase(r), inner(e) {}
};

/// Missing expression (parser recovery placeholder).
class MissingExpr : public NodeBase<MissingExpr, Expr, NodeKind::MissingExpr>
{
public:
  explicit MissingExpr(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// One `$if` / `$elseif` arm.
class IfBranch : public NodeBase<IfBranch, AstNode, NodeKind::IfBranch>
{
public:
  Expr * condition;
  Body body;

  IfBranch(Expr * c, Body b, SourceRange r = {}) : NodeBase(r), condition(c), body(b) {}
};

/// `name=expr` argument of `$render`.
class RenderBinding : public NodeBase<RenderBinding, AstNode, NodeKind::RenderBinding>
{
public:
  std::string_view name;
  Expr * value;

  RenderBinding(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v)
  {
  }
};

/// `$replace('name') ... $endreplace` inside a `$render` block.
class ReplaceBlock : public NodeBase<ReplaceBlock, AstNode, NodeKind::ReplaceBlock>
{
public:
  std::string_view name;
  Body body;

  ReplaceBlock(std::string_view n, Body b, SourceRange r = {}) : NodeBase(r), name(n), body(b) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

/// Literal text, emitted verbatim.
class TextStmt : public NodeBase<TextStmt, Stmt, NodeKind::Text>
{
public:
  std::string_view text;

  explicit TextStmt(std::string_view t, SourceRange r = {}) : NodeBase(r), text(t) {}
};

/// `$print(expr)` or the short form `$(expr)`.
class PrintStmt : public NodeBase<PrintStmt, Stmt, NodeKind::Print>
{
public:
  Expr * value;
  bool shortForm;

  PrintStmt(Expr * v, bool short_form, SourceRange r = {})
  : NodeBase(r), value(v), shortForm(short_form)
  {
  }
};

/// `$log(expr)`: writes to the diagnostic channel, never to the output.
class LogStmt : public NodeBase<LogStmt, Stmt, NodeKind::Log>
{
public:
  Expr * value;

  explicit LogStmt(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::If>
{
public:
  gsl::span<IfBranch *> branches;  ///< `$if` first, then every `$elseif`
  Body elseBody;
  bool hasElse;

  IfStmt(gsl::span<IfBranch *> b, Body else_body, bool has_else, SourceRange r = {})
  : NodeBase(r), branches(b), elseBody(else_body), hasElse(has_else)
  {
  }
};

class ForeachStmt : public NodeBase<ForeachStmt, Stmt, NodeKind::Foreach>
{
public:
  std::string_view itemName;
  std::optional<std::string_view> indexName;
  Expr * collection;
  Body body;

  ForeachStmt(
    std::string_view item, std::optional<std::string_view> index, Expr * coll, Body b,
    SourceRange r = {})
  : NodeBase(r), itemName(item), indexName(index), collection(coll), body(b)
  {
  }
};

class RenderStmt : public NodeBase<RenderStmt, Stmt, NodeKind::Render>
{
public:
  Expr * target;  ///< evaluates to the dotted component identifier
  gsl::span<RenderBinding *> bindings;
  gsl::span<ReplaceBlock *> replacements;

  RenderStmt(
    Expr * t, gsl::span<RenderBinding *> b, gsl::span<ReplaceBlock *> repl, SourceRange r = {})
  : NodeBase(r), target(t), bindings(b), replacements(repl)
  {
  }
};

/// `$include('name')`: raw text splice, no statement processing.
class IncludeStmt : public NodeBase<IncludeStmt, Stmt, NodeKind::Include>
{
public:
  std::string_view componentName;

  explicit IncludeStmt(std::string_view n, SourceRange r = {}) : NodeBase(r), componentName(n) {}
};

/// `$place('name')`: insertion point filled by the caller's `$replace`.
class PlaceStmt : public NodeBase<PlaceStmt, Stmt, NodeKind::Place>
{
public:
  std::string_view name;

  explicit PlaceStmt(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

// ============================================================================
// Top-level
// ============================================================================

class Component : public NodeBase<Component, AstNode, NodeKind::Component>
{
public:
  std::string_view name;
  Body body;

  Component(std::string_view n, Body b, SourceRange r = {}) : NodeBase(r), name(n), body(b) {}
};

}  // namespace stencil
