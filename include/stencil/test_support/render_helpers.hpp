// stencil/test_support/render_helpers.hpp - helpers for unit tests
//
// A small in-memory pipeline: components are registered as strings and
// rendered through the real loader and renderer.
//
#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "stencil/engine.hpp"
#include "stencil/runtime/source_loader.hpp"
#include "stencil/syntax/frontend.hpp"

namespace stencil::test_support
{

/// Parse a single template held in memory.
[[nodiscard]] inline std::shared_ptr<ParsedComponent> parse(
  std::string src, std::string name = "test")
{
  return parse_component(std::move(name), std::move(src));
}

/// Diagnostic codes of a parse, in report order.
[[nodiscard]] inline std::vector<std::string> error_codes(const ParsedComponent & unit)
{
  std::vector<std::string> codes;
  for (const auto & d : unit.diags) {
    codes.push_back(d.code);
  }
  return codes;
}

/**
 * Engine over an in-memory component table.
 */
struct TestEngine
{
  std::shared_ptr<MemorySourceLoader> sources = std::make_shared<MemorySourceLoader>();
  std::unique_ptr<Engine> engine;

  explicit TestEngine(
    std::map<std::string, std::string> components,
    std::shared_ptr<const Environment> env = nullptr, EngineOptions options = {})
  {
    for (auto & [id, text] : components) {
      sources->set(id, std::move(text));
    }
    if (!options.log_sink) {
      options.log_sink = [this](const LogRecord & r) { logs.push_back(r); };
    }
    engine = std::make_unique<Engine>(std::move(options), sources, std::move(env));
  }

  // The log sink captures `this`.
  TestEngine(const TestEngine &) = delete;
  TestEngine & operator=(const TestEngine &) = delete;

  [[nodiscard]] std::string render(const std::string & id, const Value & locals = Value::object())
  {
    return engine->render_sync(id, locals);
  }

  std::vector<LogRecord> logs;
};

/// Render one anonymous template with the given locals.
[[nodiscard]] inline std::string render_template(
  std::string src, const Value & locals = Value::object(),
  std::shared_ptr<const Environment> env = nullptr)
{
  TestEngine t({{"main", std::move(src)}}, std::move(env));
  return t.render("main", locals);
}

}  // namespace stencil::test_support
