// stencil/runtime/log_sink.cpp - Destination of `$log` output
//
#include "stencil/runtime/log_sink.hpp"

#include <fmt/format.h>

#include <cstdio>

namespace stencil
{

std::string format_log_record(const LogRecord & record)
{
  return fmt::format("[stencil] {}:{}: {}", record.component, record.line, record.text);
}

LogSink make_stderr_log_sink()
{
  return [](const LogRecord & record) {
    fmt::print(stderr, "{}\n", format_log_record(record));
  };
}

}  // namespace stencil
