// stencil/runtime/component_loader.cpp - Parsed component cache
//
#include "stencil/runtime/component_loader.hpp"

#include <fmt/format.h>

#include <exception>
#include <utility>

#include "stencil/runtime/render_error.hpp"

namespace stencil
{

namespace
{

/**
 * Per-key single-flight lookup.
 *
 * The first caller for `key` computes the value while holding no lock;
 * later callers wait on the same shared_future. A failed computation is
 * removed from the map so the next request retries.
 */
template <typename T, typename Fn>
T single_flight(
  std::mutex & mutex, std::map<std::string, std::shared_future<T>, std::less<>> & entries,
  std::string_view key, Fn && compute)
{
  std::promise<T> promise;
  std::shared_future<T> shared;
  {
    const std::lock_guard<std::mutex> lock(mutex);
    const auto it = entries.find(key);
    if (it != entries.end()) {
      shared = it->second;
    } else {
      entries.emplace(std::string(key), promise.get_future().share());
    }
  }

  if (shared.valid()) {
    return shared.get();
  }

  try {
    T value = compute();
    promise.set_value(value);
    return value;
  } catch (...) {
    promise.set_exception(std::current_exception());
    {
      const std::lock_guard<std::mutex> lock(mutex);
      const auto it = entries.find(key);
      if (it != entries.end()) {
        entries.erase(it);
      }
    }
    throw;
  }
}

ErrorKind error_kind_for(const Diagnostic & diag)
{
  return diag.code == diag_code::k_place_in_replace ? ErrorKind::Composition : ErrorKind::Syntax;
}

}  // namespace

ComponentLoader::ComponentLoader(SourceLoader & source, CacheMode mode)
: source_(source), mode_(mode)
{
}

ComponentLoader::UnitPtr ComponentLoader::resolve(std::string_view identifier)
{
  if (mode_ == CacheMode::Disabled) {
    return load_and_parse(identifier);
  }
  return single_flight(mutex_, units_, identifier, [&] { return load_and_parse(identifier); });
}

std::string ComponentLoader::raw_source(std::string_view identifier)
{
  if (mode_ == CacheMode::Disabled) {
    return load_text(identifier);
  }
  return single_flight(mutex_, raw_, identifier, [&] { return load_text(identifier); });
}

std::shared_ptr<ParsedComponent> ComponentLoader::parse_uncached(std::string_view identifier)
{
  auto text = source_.load(identifier);
  if (!text) {
    return nullptr;
  }
  return parse_component(std::string(identifier), std::move(*text));
}

void ComponentLoader::clear()
{
  const std::lock_guard<std::mutex> lock(mutex_);
  units_.clear();
  raw_.clear();
}

size_t ComponentLoader::cached_count() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return units_.size();
}

std::string ComponentLoader::load_text(std::string_view identifier)
{
  auto text = source_.load(identifier);
  if (!text) {
    throw RenderError(
      ErrorKind::Source, fmt::format("component '{}' could not be loaded", identifier));
  }
  return std::move(*text);
}

ComponentLoader::UnitPtr ComponentLoader::load_and_parse(std::string_view identifier)
{
  auto unit = parse_component(std::string(identifier), load_text(identifier));

  if (const Diagnostic * err = unit->diags.first_error()) {
    throw RenderError(
      error_kind_for(*err), err->message, unit->name(),
      unit->source.line_of(err->primary_range().get_begin()));
  }
  return unit;
}

}  // namespace stencil
