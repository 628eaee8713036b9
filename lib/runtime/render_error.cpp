// stencil/runtime/render_error.cpp - Errors that abort a render
//
#include "stencil/runtime/render_error.hpp"

#include <fmt/format.h>

#include <utility>

namespace stencil
{

namespace
{

std::string format_what(ErrorKind kind, const std::string & message, const std::string & component,
                        uint32_t line)
{
  if (component.empty()) {
    return fmt::format("{}: {}", to_string(kind), message);
  }
  if (line == 0) {
    return fmt::format("{}: {} ({})", to_string(kind), message, component);
  }
  return fmt::format("{}: {} ({}:{})", to_string(kind), message, component, line);
}

}  // namespace

std::string_view to_string(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::Syntax:
      return "SyntaxError";
    case ErrorKind::Composition:
      return "CompositionError";
    case ErrorKind::Reference:
      return "ReferenceError";
    case ErrorKind::Source:
      return "SourceError";
    case ErrorKind::Stack:
      return "StackError";
    case ErrorKind::Tool:
      return "ToolError";
  }
  return "Error";
}

RenderError::RenderError(ErrorKind kind, const std::string & message, std::string component,
                         uint32_t line)
: std::runtime_error(format_what(kind, message, component, line)),
  kind_(kind),
  component_(std::move(component)),
  line_(line),
  detail_(message)
{
}

}  // namespace stencil
