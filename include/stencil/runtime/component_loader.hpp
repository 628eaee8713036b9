// stencil/runtime/component_loader.hpp - Parsed component cache
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "stencil/runtime/source_loader.hpp"
#include "stencil/syntax/frontend.hpp"

namespace stencil
{

enum class CacheMode : uint8_t {
  Enabled,   ///< parse once per identifier until clear()
  Disabled,  ///< re-read and re-parse on every request
};

/**
 * Resolves component identifiers to parsed trees.
 *
 * With caching enabled, entries are never invalidated automatically; call
 * clear() to pick up source changes. Concurrent first requests for the same
 * identifier share one load/parse. Failed loads are not cached.
 *
 * Errors are reported as RenderError:
 * - Source when the SourceLoader has no text for the identifier
 * - Syntax / Composition when the source has parse diagnostics
 */
class ComponentLoader
{
public:
  using UnitPtr = std::shared_ptr<const ParsedComponent>;

  ComponentLoader(SourceLoader & source, CacheMode mode);

  ComponentLoader(const ComponentLoader &) = delete;
  ComponentLoader & operator=(const ComponentLoader &) = delete;

  /// Parsed component; throws RenderError on failure.
  [[nodiscard]] UnitPtr resolve(std::string_view identifier);

  /// Raw, unparsed source (used by `$include`); throws RenderError(Source).
  [[nodiscard]] std::string raw_source(std::string_view identifier);

  /// Parse without throwing, returning diagnostics to the caller.
  /// Returns nullptr when the source does not exist. Never cached.
  [[nodiscard]] std::shared_ptr<ParsedComponent> parse_uncached(std::string_view identifier);

  /// Drop every cached entry.
  void clear();

  [[nodiscard]] size_t cached_count() const;
  [[nodiscard]] CacheMode mode() const noexcept { return mode_; }

private:
  UnitPtr load_and_parse(std::string_view identifier);
  std::string load_text(std::string_view identifier);

  SourceLoader & source_;
  const CacheMode mode_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_future<UnitPtr>, std::less<>> units_;
  std::map<std::string, std::shared_future<std::string>, std::less<>> raw_;
};

}  // namespace stencil
