// stencil/runtime/log_sink.hpp - Destination of `$log` output
#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace stencil
{

struct LogRecord
{
  std::string component;
  uint32_t line = 0;
  std::string text;
};

using LogSink = std::function<void(const LogRecord &)>;

/// Writes `[stencil] <component>:<line>: <text>` to stderr.
[[nodiscard]] LogSink make_stderr_log_sink();

/// Formats a record the way the stderr sink prints it (no trailing newline).
[[nodiscard]] std::string format_log_record(const LogRecord & record);

}  // namespace stencil
