// stencil/engine.cpp - Template engine entry point
//
#include "stencil/engine.hpp"

#include <stdexcept>
#include <utility>

namespace stencil
{

Engine::Engine(
  EngineOptions options, std::shared_ptr<SourceLoader> source,
  std::shared_ptr<const Environment> env)
: options_(std::move(options)),
  source_(std::move(source)),
  env_(env ? std::move(env) : EnvironmentBuilder().build()),
  loader_(
    source_ ? *source_ : throw std::invalid_argument("Engine requires a SourceLoader"),
    options_.cache ? CacheMode::Enabled : CacheMode::Disabled)
{
}

std::future<std::string> Engine::render(std::string identifier, Value locals)
{
  return std::async(
    std::launch::async, [this, identifier = std::move(identifier), locals = std::move(locals)] {
      return render_sync(identifier, locals);
    });
}

std::string Engine::render_sync(std::string_view identifier, const Value & locals)
{
  RenderOptions render_options;
  render_options.max_render_depth = options_.max_render_depth;
  render_options.log_sink = options_.log_sink;

  // One Renderer per render: it carries that render's state only.
  Renderer renderer(loader_, *env_, std::move(render_options));
  return renderer.render(identifier, locals);
}

}  // namespace stencil
