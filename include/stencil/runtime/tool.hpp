// stencil/runtime/tool.hpp - Host-provided helper functions ("tools")
#pragma once

#include <functional>
#include <future>
#include <utility>
#include <variant>
#include <vector>

#include "stencil/runtime/value.hpp"

namespace stencil
{

using ToolArgs = std::vector<Value>;

/**
 * Result of a tool invocation: either a value that is ready now, or a
 * deferred value the renderer has to wait for before continuing.
 */
class ToolResult
{
public:
  [[nodiscard]] static ToolResult ready(Value value) { return ToolResult(std::move(value)); }

  [[nodiscard]] static ToolResult pending(std::shared_future<Value> future)
  {
    return ToolResult(std::move(future));
  }

  [[nodiscard]] bool is_ready() const noexcept { return std::holds_alternative<Value>(state_); }
  [[nodiscard]] bool is_pending() const noexcept { return !is_ready(); }

  /// Precondition: is_ready()
  [[nodiscard]] const Value & value() const { return std::get<Value>(state_); }

  /// Precondition: is_pending()
  [[nodiscard]] const std::shared_future<Value> & future() const
  {
    return std::get<std::shared_future<Value>>(state_);
  }

private:
  explicit ToolResult(Value value) : state_(std::move(value)) {}
  explicit ToolResult(std::shared_future<Value> future) : state_(std::move(future)) {}

  std::variant<Value, std::shared_future<Value>> state_;
};

/// General tool signature.
using Tool = std::function<ToolResult(const ToolArgs &)>;

/// Convenience signatures accepted by EnvironmentBuilder.
using SyncTool = std::function<Value(const ToolArgs &)>;
using AsyncTool = std::function<std::shared_future<Value>(const ToolArgs &)>;

}  // namespace stencil
