// stencil/runtime/expr_evaluator.hpp - Expression evaluation
//
// Evaluates template expressions against a Scope chain and the Environment.
//
#pragma once

#include <future>

#include "stencil/ast/ast.hpp"
#include "stencil/runtime/environment.hpp"
#include "stencil/runtime/scope.hpp"
#include "stencil/runtime/value.hpp"

namespace stencil
{

struct ParsedComponent;

/**
 * Receives deferred tool results.
 *
 * The renderer implements this to mark the render as suspended while the
 * value is outstanding. Without a handler the evaluator blocks on the
 * future directly.
 */
class AwaitHandler
{
public:
  virtual ~AwaitHandler() = default;

  /// Block until `future` is ready and return its value (rethrows its error).
  virtual Value await(const std::shared_future<Value> & future) = 0;
};

/**
 * Evaluator for one component's expressions.
 *
 * Missing locals, globals and members evaluate to the missing sentinel.
 * Calling an unregistered tool throws RenderError(Reference); a tool that
 * throws, or whose future fails, raises RenderError(Tool).
 */
class ExprEvaluator
{
public:
  /**
   * @param env     Tool and global tables
   * @param unit    Component the expressions belong to (for error lines)
   * @param awaiter Suspension hook for deferred results (may be nullptr)
   */
  ExprEvaluator(const Environment & env, const ParsedComponent & unit,
                AwaitHandler * awaiter = nullptr);

  [[nodiscard]] Value evaluate(const Expr * expr, const Scope & scope);

private:
  // ===========================================================================
  // Expression Evaluation
  // ===========================================================================

  Value eval_local_ref(const LocalRefExpr * node, const Scope & scope);
  Value eval_global_ref(const GlobalRefExpr * node);
  Value eval_member_expr(const MemberExpr * node, const Scope & scope);
  Value eval_index_expr(const IndexExpr * node, const Scope & scope);
  Value eval_tool_call(const ToolCallExpr * node, const Scope & scope);
  Value eval_binary_expr(const BinaryExpr * node, const Scope & scope);
  Value eval_unary_expr(const UnaryExpr * node, const Scope & scope);

  Value resolve_result(const ToolCallExpr * node, const ToolResult & result);

  [[noreturn]] void fail_tool(const ToolCallExpr * node, const char * what) const;

  const Environment & env_;
  const ParsedComponent & unit_;
  AwaitHandler * awaiter_;
};

}  // namespace stencil
