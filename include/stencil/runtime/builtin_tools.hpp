// stencil/runtime/builtin_tools.hpp - Standard tool set offered by the CLI host
//
//   upper(s)          upper-cased text of s (ASCII)
//   lower(s)          lower-cased text of s (ASCII)
//   length(x)         element count of arrays/objects, byte length of strings, else 0
//   json(x)           compact JSON text of x
//   join(array, sep)  text of every element joined by sep (default ",")
//
#pragma once

#include "stencil/runtime/environment.hpp"

namespace stencil
{

/// Register the standard tools; later registrations with the same name win.
void register_builtin_tools(EnvironmentBuilder & builder);

}  // namespace stencil
