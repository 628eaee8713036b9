// stencil/runtime/renderer.cpp - Tree evaluator
//
#include "stencil/runtime/renderer.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <exception>
#include <utility>
#include <vector>

#include "stencil/basic/casting.hpp"
#include "stencil/runtime/render_error.hpp"

namespace stencil
{

std::string_view to_string(RenderState state) noexcept
{
  switch (state) {
    case RenderState::Idle:
      return "idle";
    case RenderState::Evaluating:
      return "evaluating";
    case RenderState::Suspended:
      return "suspended";
    case RenderState::Done:
      return "done";
    case RenderState::Failed:
      return "failed";
  }
  return "";
}

Renderer::Renderer(ComponentLoader & loader, const Environment & env, RenderOptions options)
: loader_(loader), env_(env), options_(std::move(options))
{
  if (!options_.log_sink) {
    options_.log_sink = make_stderr_log_sink();
  }
}

std::string Renderer::render(std::string_view identifier, const Value & locals)
{
  state_ = RenderState::Evaluating;

  try {
    const auto unit = loader_.resolve(identifier);

    Scope root;
    if (locals.is_object()) {
      for (auto it = locals.begin(); it != locals.end(); ++it) {
        root.bind(it.key(), it.value());
      }
    }

    std::string out;
    render_component(*unit, root, nullptr, 0, out);
    state_ = RenderState::Done;
    return out;
  } catch (...) {
    state_ = RenderState::Failed;
    throw;
  }
}

void Renderer::render_component(
  const ParsedComponent & unit, const Scope & scope, const Replacements * replacements,
  size_t depth, std::string & out)
{
  Frame frame{unit, replacements, depth, ExprEvaluator(env_, unit, this)};
  exec_body(frame, unit.root->body, scope, out);
}

// ============================================================================
// Statements
// ============================================================================

void Renderer::exec_body(Frame & frame, Body body, const Scope & scope, std::string & out)
{
  for (const Stmt * stmt : body) {
    exec_stmt(frame, stmt, scope, out);
  }
}

void Renderer::exec_stmt(Frame & frame, const Stmt * stmt, const Scope & scope, std::string & out)
{
  switch (stmt->get_kind()) {
    case NodeKind::Text:
      out += cast<TextStmt>(stmt)->text;
      return;
    case NodeKind::Print:
      exec_print(frame, cast<PrintStmt>(stmt), scope, out);
      return;
    case NodeKind::Log:
      exec_log(frame, cast<LogStmt>(stmt), scope);
      return;
    case NodeKind::If:
      exec_if(frame, cast<IfStmt>(stmt), scope, out);
      return;
    case NodeKind::Foreach:
      exec_foreach(frame, cast<ForeachStmt>(stmt), scope, out);
      return;
    case NodeKind::Render:
      exec_render(frame, cast<RenderStmt>(stmt), scope, out);
      return;
    case NodeKind::Include:
      exec_include(frame, cast<IncludeStmt>(stmt), out);
      return;
    case NodeKind::Place:
      exec_place(frame, cast<PlaceStmt>(stmt), out);
      return;
    default:
      return;
  }
}

void Renderer::exec_print(
  Frame & frame, const PrintStmt * node, const Scope & scope, std::string & out)
{
  out += to_text(frame.eval.evaluate(node->value, scope));
}

void Renderer::exec_log(Frame & frame, const LogStmt * node, const Scope & scope)
{
  LogRecord record;
  record.component = frame.unit.name();
  record.line = frame.unit.line_of(node);
  record.text = to_text(frame.eval.evaluate(node->value, scope));

  try {
    options_.log_sink(record);
  } catch (const std::exception & e) {
    fmt::print(stderr, "{} (log sink failed: {})\n", format_log_record(record), e.what());
  }
}

void Renderer::exec_if(Frame & frame, const IfStmt * node, const Scope & scope, std::string & out)
{
  for (const IfBranch * branch : node->branches) {
    if (is_truthy(frame.eval.evaluate(branch->condition, scope))) {
      exec_body(frame, branch->body, scope, out);
      return;
    }
  }
  if (node->hasElse) {
    exec_body(frame, node->elseBody, scope, out);
  }
}

void Renderer::exec_foreach(
  Frame & frame, const ForeachStmt * node, const Scope & scope, std::string & out)
{
  const Value collection = frame.eval.evaluate(node->collection, scope);

  if (collection.is_array()) {
    int64_t position = 0;
    for (const auto & item : collection) {
      Scope iteration(&scope);
      iteration.bind(std::string(node->itemName), item);
      if (node->indexName) {
        iteration.bind(std::string(*node->indexName), Value(position));
      }
      exec_body(frame, node->body, iteration, out);
      ++position;
    }
    return;
  }

  if (collection.is_object()) {
    // Objects iterate their values in key order; the index is the key.
    for (auto it = collection.begin(); it != collection.end(); ++it) {
      Scope iteration(&scope);
      iteration.bind(std::string(node->itemName), it.value());
      if (node->indexName) {
        iteration.bind(std::string(*node->indexName), Value(it.key()));
      }
      exec_body(frame, node->body, iteration, out);
    }
  }

  // Anything else is not iterable and produces no iterations.
}

void Renderer::exec_render(
  Frame & frame, const RenderStmt * node, const Scope & scope, std::string & out)
{
  const uint32_t line = frame.unit.line_of(node);

  // Target and bindings are evaluated in the caller's scope.
  const Value target = frame.eval.evaluate(node->target, scope);
  if (!target.is_string()) {
    throw RenderError(
      ErrorKind::Source,
      fmt::format("`$render` target must be a component name, got {}", type_name(target)),
      frame.unit.name(), line);
  }
  const auto & identifier = target.get_ref<const std::string &>();

  std::vector<std::pair<std::string, Value>> bindings;
  bindings.reserve(node->bindings.size());
  for (const RenderBinding * binding : node->bindings) {
    bindings.emplace_back(std::string(binding->name), frame.eval.evaluate(binding->value, scope));
  }

  if (frame.depth + 1 > options_.max_render_depth) {
    throw RenderError(
      ErrorKind::Stack,
      fmt::format(
        "render depth limit ({}) exceeded while rendering '{}'", options_.max_render_depth,
        identifier),
      frame.unit.name(), line);
  }

  ComponentLoader::UnitPtr callee;
  try {
    callee = loader_.resolve(identifier);
  } catch (const RenderError & e) {
    if (e.kind() == ErrorKind::Source && e.component().empty()) {
      throw RenderError(ErrorKind::Source, e.detail(), frame.unit.name(), line);
    }
    throw;
  }

  // Replacement bodies run before the callee, against the caller's scope.
  Replacements fills;
  for (const ReplaceBlock * block : node->replacements) {
    std::string text;
    exec_body(frame, block->body, scope, text);
    fills[std::string(block->name)] = std::move(text);
  }

  // The callee sees only the explicit bindings.
  Scope callee_scope;
  for (auto & [name, value] : bindings) {
    callee_scope.bind(std::move(name), std::move(value));
  }

  render_component(*callee, callee_scope, &fills, frame.depth + 1, out);
}

void Renderer::exec_include(Frame & frame, const IncludeStmt * node, std::string & out)
{
  try {
    out += loader_.raw_source(node->componentName);
  } catch (const RenderError & e) {
    if (e.kind() == ErrorKind::Source && e.component().empty()) {
      throw RenderError(ErrorKind::Source, e.detail(), frame.unit.name(), frame.unit.line_of(node));
    }
    throw;
  }
}

void Renderer::exec_place(Frame & frame, const PlaceStmt * node, std::string & out)
{
  if (frame.replacements != nullptr) {
    const auto it = frame.replacements->find(node->name);
    if (it != frame.replacements->end()) {
      out += it->second;
      return;
    }
  }

  throw RenderError(
    ErrorKind::Composition,
    fmt::format(
      "placeholder '{}' of component '{}' has no replacement", node->name, frame.unit.name()),
    frame.unit.name(), frame.unit.line_of(node));
}

// ============================================================================
// Suspension
// ============================================================================

Value Renderer::await(const std::shared_future<Value> & future)
{
  state_ = RenderState::Suspended;
  future.wait();
  state_ = RenderState::Evaluating;
  return future.get();
}

}  // namespace stencil
