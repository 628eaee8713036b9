// stencil/runtime/renderer.hpp - Tree evaluator
//
// Walks a parsed component and produces its output text.
//
// State machine of one render:
//
//   Idle -> Evaluating -> [Suspended -> Evaluating]* -> Done | Failed
//
// Every statement finishes (including any suspension inside it) before the
// next sibling starts, so output is always assembled in document order.
//
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "stencil/ast/ast.hpp"
#include "stencil/runtime/component_loader.hpp"
#include "stencil/runtime/environment.hpp"
#include "stencil/runtime/expr_evaluator.hpp"
#include "stencil/runtime/log_sink.hpp"
#include "stencil/runtime/scope.hpp"

namespace stencil
{

enum class RenderState : uint8_t {
  Idle,
  Evaluating,
  Suspended,  ///< waiting for a deferred tool result
  Done,
  Failed,
};

[[nodiscard]] std::string_view to_string(RenderState state) noexcept;

inline constexpr size_t k_default_max_render_depth = 64;

struct RenderOptions
{
  /// Maximum nesting of `$render` below the top-level component.
  size_t max_render_depth = k_default_max_render_depth;
  /// Receives `$log` output; empty means the stderr sink.
  LogSink log_sink;
};

/**
 * Renders one top-level component.
 *
 * A Renderer holds the state of a single render and is not shared between
 * threads. It may be reused for consecutive renders.
 */
class Renderer : private AwaitHandler
{
public:
  Renderer(ComponentLoader & loader, const Environment & env, RenderOptions options = {});

  Renderer(const Renderer &) = delete;
  Renderer & operator=(const Renderer &) = delete;

  /**
   * Render `identifier` with `locals` bound in its root frame.
   *
   * @param locals JSON object of initial bindings (null / missing = none)
   * @return full output text
   * @throws RenderError on the first failure; no partial output is returned
   */
  [[nodiscard]] std::string render(std::string_view identifier, const Value & locals);

  [[nodiscard]] RenderState state() const noexcept { return state_.load(); }

private:
  using Replacements = std::map<std::string, std::string, std::less<>>;

  /// Per-component-invocation context.
  struct Frame
  {
    const ParsedComponent & unit;
    const Replacements * replacements;  ///< fills supplied by the caller (nullptr at top level)
    size_t depth;
    ExprEvaluator eval;
  };

  void render_component(
    const ParsedComponent & unit, const Scope & scope, const Replacements * replacements,
    size_t depth, std::string & out);

  void exec_body(Frame & frame, Body body, const Scope & scope, std::string & out);
  void exec_stmt(Frame & frame, const Stmt * stmt, const Scope & scope, std::string & out);

  void exec_print(Frame & frame, const PrintStmt * node, const Scope & scope, std::string & out);
  void exec_log(Frame & frame, const LogStmt * node, const Scope & scope);
  void exec_if(Frame & frame, const IfStmt * node, const Scope & scope, std::string & out);
  void exec_foreach(Frame & frame, const ForeachStmt * node, const Scope & scope, std::string & out);
  void exec_render(Frame & frame, const RenderStmt * node, const Scope & scope, std::string & out);
  void exec_include(Frame & frame, const IncludeStmt * node, std::string & out);
  void exec_place(Frame & frame, const PlaceStmt * node, std::string & out);

  Value await(const std::shared_future<Value> & future) override;

  ComponentLoader & loader_;
  const Environment & env_;
  RenderOptions options_;
  std::atomic<RenderState> state_{RenderState::Idle};
};

}  // namespace stencil
