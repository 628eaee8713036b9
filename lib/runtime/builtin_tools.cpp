// stencil/runtime/builtin_tools.cpp - Standard tool set offered by the CLI host
//
#include "stencil/runtime/builtin_tools.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace stencil
{

namespace
{

const Value & arg_at(const ToolArgs & args, size_t index)
{
  static const Value k_missing = missing();
  return index < args.size() ? args[index] : k_missing;
}

std::string map_chars(std::string text, int (*fn)(int))
{
  std::transform(text.begin(), text.end(), text.begin(), [fn](char c) {
    return static_cast<char>(fn(static_cast<unsigned char>(c)));
  });
  return text;
}

Value tool_upper(const ToolArgs & args)
{
  return map_chars(to_text(arg_at(args, 0)), [](int c) { return std::toupper(c); });
}

Value tool_lower(const ToolArgs & args)
{
  return map_chars(to_text(arg_at(args, 0)), [](int c) { return std::tolower(c); });
}

Value tool_length(const ToolArgs & args)
{
  const Value & v = arg_at(args, 0);
  if (v.is_string()) {
    return v.get_ref<const std::string &>().size();
  }
  if (v.is_array() || v.is_object()) {
    return v.size();
  }
  return 0;
}

Value tool_json(const ToolArgs & args)
{
  const Value & v = arg_at(args, 0);
  if (is_missing(v)) {
    return "undefined";
  }
  return v.dump(-1, ' ', false, Value::error_handler_t::replace);
}

Value tool_join(const ToolArgs & args)
{
  const Value & list = arg_at(args, 0);
  const Value & sep = arg_at(args, 1);
  const std::string separator = is_missing(sep) ? std::string(",") : to_text(sep);

  if (!list.is_array()) {
    return to_text(list);
  }

  std::string out;
  bool first = true;
  for (const auto & item : list) {
    if (!first) {
      out += separator;
    }
    out += to_text(item);
    first = false;
  }
  return out;
}

}  // namespace

void register_builtin_tools(EnvironmentBuilder & builder)
{
  builder.add_tool("upper", tool_upper)
    .add_tool("lower", tool_lower)
    .add_tool("length", tool_length)
    .add_tool("json", tool_json)
    .add_tool("join", tool_join);
}

}  // namespace stencil
