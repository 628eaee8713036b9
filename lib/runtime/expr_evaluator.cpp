// stencil/runtime/expr_evaluator.cpp - Expression evaluation
//
#include "stencil/runtime/expr_evaluator.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <exception>
#include <limits>
#include <string>

#include "stencil/basic/casting.hpp"
#include "stencil/runtime/render_error.hpp"
#include "stencil/syntax/frontend.hpp"

namespace stencil
{

ExprEvaluator::ExprEvaluator(
  const Environment & env, const ParsedComponent & unit, AwaitHandler * awaiter)
: env_(env), unit_(unit), awaiter_(awaiter)
{
}

Value ExprEvaluator::evaluate(const Expr * expr, const Scope & scope)
{
  if (expr == nullptr) {
    return missing();
  }

  switch (expr->get_kind()) {
    case NodeKind::NullLiteral:
      return Value(nullptr);
    case NodeKind::UndefinedLiteral:
      return missing();
    case NodeKind::BoolLiteral:
      return Value(cast<BoolLiteralExpr>(expr)->value);
    case NodeKind::IntLiteral:
      return Value(cast<IntLiteralExpr>(expr)->value);
    case NodeKind::FloatLiteral:
      return Value(cast<FloatLiteralExpr>(expr)->value);
    case NodeKind::StringLiteral:
      return Value(std::string(cast<StringLiteralExpr>(expr)->value));
    case NodeKind::LocalRef:
      return eval_local_ref(cast<LocalRefExpr>(expr), scope);
    case NodeKind::GlobalRef:
      return eval_global_ref(cast<GlobalRefExpr>(expr));
    case NodeKind::MemberExpr:
      return eval_member_expr(cast<MemberExpr>(expr), scope);
    case NodeKind::IndexExpr:
      return eval_index_expr(cast<IndexExpr>(expr), scope);
    case NodeKind::ToolCall:
      return eval_tool_call(cast<ToolCallExpr>(expr), scope);
    case NodeKind::BinaryExpr:
      return eval_binary_expr(cast<BinaryExpr>(expr), scope);
    case NodeKind::UnaryExpr:
      return eval_unary_expr(cast<UnaryExpr>(expr), scope);
    case NodeKind::GroupExpr:
      return evaluate(cast<GroupExpr>(expr)->inner, scope);
    case NodeKind::MissingExpr:
      // Only present in trees with parse errors, which are never rendered.
      return missing();
    default:
      return missing();
  }
}

Value ExprEvaluator::eval_local_ref(const LocalRefExpr * node, const Scope & scope)
{
  const Value * v = scope.lookup(node->name);
  return v != nullptr ? *v : missing();
}

Value ExprEvaluator::eval_global_ref(const GlobalRefExpr * node)
{
  const Value * v = env_.find_global(node->name);
  return v != nullptr ? *v : missing();
}

Value ExprEvaluator::eval_member_expr(const MemberExpr * node, const Scope & scope)
{
  return member_of(evaluate(node->base, scope), node->member);
}

Value ExprEvaluator::eval_index_expr(const IndexExpr * node, const Scope & scope)
{
  const Value base = evaluate(node->base, scope);
  const Value index = evaluate(node->index, scope);
  return index_of(base, index);
}

// ============================================================================
// Tool calls
// ============================================================================

Value ExprEvaluator::eval_tool_call(const ToolCallExpr * node, const Scope & scope)
{
  const Tool * tool = env_.find_tool(node->name);
  if (tool == nullptr) {
    throw RenderError(
      ErrorKind::Reference, fmt::format("unknown tool '{}'", node->name), unit_.name(),
      unit_.line_of(node));
  }

  // Arguments are evaluated left to right before the call.
  ToolArgs args;
  args.reserve(node->args.size());
  for (const Expr * arg : node->args) {
    args.push_back(evaluate(arg, scope));
  }

  try {
    const ToolResult result = (*tool)(args);
    return resolve_result(node, result);
  } catch (const RenderError &) {
    throw;
  } catch (const std::exception & e) {
    fail_tool(node, e.what());
  }
}

Value ExprEvaluator::resolve_result(const ToolCallExpr * node, const ToolResult & result)
{
  if (result.is_ready()) {
    return result.value();
  }

  const auto & future = result.future();
  if (!future.valid()) {
    fail_tool(node, "returned an empty deferred result");
  }
  if (awaiter_ != nullptr) {
    return awaiter_->await(future);
  }
  return future.get();
}

void ExprEvaluator::fail_tool(const ToolCallExpr * node, const char * what) const
{
  throw RenderError(
    ErrorKind::Tool, fmt::format("tool '{}' failed: {}", node->name, what), unit_.name(),
    unit_.line_of(node));
}

// ============================================================================
// Operators
// ============================================================================

Value ExprEvaluator::eval_binary_expr(const BinaryExpr * node, const Scope & scope)
{
  Value lhs = evaluate(node->lhs, scope);

  // Short-circuit operators yield the operand that decided the result.
  switch (node->op) {
    case BinaryOp::And:
      return is_truthy(lhs) ? evaluate(node->rhs, scope) : lhs;
    case BinaryOp::Or:
      return is_truthy(lhs) ? lhs : evaluate(node->rhs, scope);
    default:
      break;
  }

  const Value rhs = evaluate(node->rhs, scope);
  switch (node->op) {
    case BinaryOp::StrictEq:
      return Value(strict_equals(lhs, rhs));
    case BinaryOp::StrictNe:
      return Value(!strict_equals(lhs, rhs));
    case BinaryOp::LooseEq:
      return Value(loose_equals(lhs, rhs));
    case BinaryOp::LooseNe:
      return Value(!loose_equals(lhs, rhs));
    case BinaryOp::Lt:
    case BinaryOp::Le:
    case BinaryOp::Gt:
    case BinaryOp::Ge:
      return Value(compare_values(node->op, lhs, rhs));
    case BinaryOp::And:
    case BinaryOp::Or:
      break;
  }
  return missing();
}

Value ExprEvaluator::eval_unary_expr(const UnaryExpr * node, const Scope & scope)
{
  const Value operand = evaluate(node->operand, scope);

  switch (node->op) {
    case UnaryOp::Not:
      return Value(!is_truthy(operand));
    case UnaryOp::Neg: {
      if (operand.is_number_integer() && !operand.is_number_unsigned()) {
        const auto i = operand.get<int64_t>();
        if (i != std::numeric_limits<int64_t>::min()) {
          return Value(-i);
        }
      }
      const auto n = to_number(operand);
      return Value(n ? -*n : std::numeric_limits<double>::quiet_NaN());
    }
  }
  return missing();
}

}  // namespace stencil
