// stencil/runtime/environment.hpp - Tool and global tables
//
// An Environment is built once at startup and then only read, so one
// instance can be shared by every concurrent render.
//
#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "stencil/runtime/tool.hpp"
#include "stencil/runtime/value.hpp"

namespace stencil
{

class Environment
{
public:
  /// Registered tool by exact name, or nullptr.
  [[nodiscard]] const Tool * find_tool(std::string_view name) const;

  /// Global value by name, or nullptr.
  [[nodiscard]] const Value * find_global(std::string_view name) const;

  [[nodiscard]] size_t tool_count() const noexcept { return tools_.size(); }
  [[nodiscard]] size_t global_count() const noexcept { return globals_.size(); }

private:
  friend class EnvironmentBuilder;

  std::map<std::string, Tool, std::less<>> tools_;
  std::map<std::string, Value, std::less<>> globals_;
};

/**
 * Fluent builder for Environment.
 *
 * Registering a name twice keeps the later entry.
 *
 * @code
 *   auto env = EnvironmentBuilder()
 *                .add_tool("upper", [](const ToolArgs & a) { ... })
 *                .add_global("site_name", "My Site")
 *                .build();
 * @endcode
 */
class EnvironmentBuilder
{
public:
  EnvironmentBuilder & add_tool(std::string name, SyncTool fn);
  EnvironmentBuilder & add_async_tool(std::string name, AsyncTool fn);
  EnvironmentBuilder & add_tool_result(std::string name, Tool fn);

  EnvironmentBuilder & add_global(std::string name, Value value);

  /// Add every member of a JSON object as a global; non-objects are ignored.
  EnvironmentBuilder & add_globals(const Value & object);

  [[nodiscard]] std::shared_ptr<const Environment> build();

private:
  Environment env_;
};

}  // namespace stencil
