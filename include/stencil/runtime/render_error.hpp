// stencil/runtime/render_error.hpp - Errors that abort a render
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace stencil
{

enum class ErrorKind : uint8_t {
  Syntax,       ///< malformed statement or block nesting
  Composition,  ///< unsupplied `$place`, or `$place` inside `$replace`
  Reference,    ///< call to an unregistered tool
  Source,       ///< component source could not be loaded
  Stack,        ///< nested `$render` depth limit exceeded
  Tool,         ///< a tool threw or its deferred result failed
};

/// Tag printed to users, e.g. "SyntaxError".
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/**
 * The one exception type a render throws.
 *
 * line() is the 1-based line inside component(), or 0 when no position is
 * known (e.g. a missing top-level source).
 */
class RenderError : public std::runtime_error
{
public:
  RenderError(ErrorKind kind, const std::string & message, std::string component = {},
              uint32_t line = 0);

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::string & component() const noexcept { return component_; }
  [[nodiscard]] uint32_t line() const noexcept { return line_; }

  /// Message without the location prefix.
  [[nodiscard]] const std::string & detail() const noexcept { return detail_; }

private:
  ErrorKind kind_;
  std::string component_;
  uint32_t line_;
  std::string detail_;
};

}  // namespace stencil
