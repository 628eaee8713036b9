// stencil/runtime/environment.cpp - Tool and global tables
//
#include "stencil/runtime/environment.hpp"

#include <utility>

namespace stencil
{

const Tool * Environment::find_tool(std::string_view name) const
{
  const auto it = tools_.find(name);
  return it != tools_.end() ? &it->second : nullptr;
}

const Value * Environment::find_global(std::string_view name) const
{
  const auto it = globals_.find(name);
  return it != globals_.end() ? &it->second : nullptr;
}

EnvironmentBuilder & EnvironmentBuilder::add_tool(std::string name, SyncTool fn)
{
  env_.tools_[std::move(name)] = [fn = std::move(fn)](const ToolArgs & args) {
    return ToolResult::ready(fn(args));
  };
  return *this;
}

EnvironmentBuilder & EnvironmentBuilder::add_async_tool(std::string name, AsyncTool fn)
{
  env_.tools_[std::move(name)] = [fn = std::move(fn)](const ToolArgs & args) {
    return ToolResult::pending(fn(args));
  };
  return *this;
}

EnvironmentBuilder & EnvironmentBuilder::add_tool_result(std::string name, Tool fn)
{
  env_.tools_[std::move(name)] = std::move(fn);
  return *this;
}

EnvironmentBuilder & EnvironmentBuilder::add_global(std::string name, Value value)
{
  env_.globals_[std::move(name)] = std::move(value);
  return *this;
}

EnvironmentBuilder & EnvironmentBuilder::add_globals(const Value & object)
{
  if (!object.is_object()) {
    return *this;
  }
  for (auto it = object.begin(); it != object.end(); ++it) {
    env_.globals_[it.key()] = it.value();
  }
  return *this;
}

std::shared_ptr<const Environment> EnvironmentBuilder::build()
{
  return std::make_shared<const Environment>(std::move(env_));
}

}  // namespace stencil
