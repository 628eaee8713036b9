// stencil/engine.hpp - Template engine entry point
//
// Single entry point for rendering components.
// Used by the CLI and can be embedded into other hosts.
//
#pragma once

#include <future>
#include <memory>
#include <string>
#include <string_view>

#include "stencil/runtime/component_loader.hpp"
#include "stencil/runtime/environment.hpp"
#include "stencil/runtime/log_sink.hpp"
#include "stencil/runtime/renderer.hpp"
#include "stencil/runtime/source_loader.hpp"
#include "stencil/runtime/value.hpp"

namespace stencil
{

// ============================================================================
// Engine Options
// ============================================================================

struct EngineOptions
{
  /// Keep parsed components until clear_cache()
  bool cache = true;

  /// Maximum `$render` nesting depth
  size_t max_render_depth = k_default_max_render_depth;

  /// Receives `$log` output (stderr when empty)
  LogSink log_sink;
};

// ============================================================================
// Engine
// ============================================================================

/**
 * Renders components resolved through a SourceLoader.
 *
 * Independent renders may run concurrently. They share only the immutable
 * Environment and the component cache.
 *
 * Usage:
 * @code
 *   auto env = EnvironmentBuilder().add_global("site", "Demo").build();
 *   Engine engine({}, std::make_shared<FileSourceLoader>("views"), env);
 *   std::string html = engine.render("pages.home", {{"title", "Hi"}}).get();
 * @endcode
 */
class Engine
{
public:
  /// A null environment is treated as an empty one.
  Engine(
    EngineOptions options, std::shared_ptr<SourceLoader> source,
    std::shared_ptr<const Environment> env = nullptr);

  Engine(const Engine &) = delete;
  Engine & operator=(const Engine &) = delete;

  /**
   * Render on a separate task.
   *
   * The future yields the full output, or rethrows the RenderError that
   * aborted the render. The engine must outlive the future.
   */
  [[nodiscard]] std::future<std::string> render(std::string identifier, Value locals = Value::object());

  /// Render on the calling thread; throws RenderError.
  [[nodiscard]] std::string render_sync(std::string_view identifier, const Value & locals = Value::object());

  void clear_cache() { loader_.clear(); }

  [[nodiscard]] ComponentLoader & loader() noexcept { return loader_; }
  [[nodiscard]] const Environment & environment() const noexcept { return *env_; }
  [[nodiscard]] const EngineOptions & options() const noexcept { return options_; }

private:
  EngineOptions options_;
  std::shared_ptr<SourceLoader> source_;
  std::shared_ptr<const Environment> env_;
  ComponentLoader loader_;
};

}  // namespace stencil
