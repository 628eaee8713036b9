// stencil/runtime/source_loader.hpp - Component source lookup
//
// Maps a dotted component identifier ("layouts.main") to raw template text.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace stencil
{

class SourceLoader
{
public:
  virtual ~SourceLoader() = default;

  /// Raw text of a component, or nullopt when it does not exist.
  [[nodiscard]] virtual std::optional<std::string> load(std::string_view identifier) = 0;
};

/**
 * Loads `root/a/b/c<extension>` for identifier `a.b.c`.
 *
 * Identifiers with empty segments, `..` segments or path separators never
 * resolve, so a template cannot reach files outside `root`.
 */
class FileSourceLoader : public SourceLoader
{
public:
  explicit FileSourceLoader(std::filesystem::path root, std::string extension = ".stn");

  [[nodiscard]] std::optional<std::string> load(std::string_view identifier) override;

  /// Path an identifier maps to, or nullopt when the identifier is rejected.
  [[nodiscard]] std::optional<std::filesystem::path> path_for(std::string_view identifier) const;

  [[nodiscard]] const std::filesystem::path & root() const noexcept { return root_; }
  [[nodiscard]] const std::string & extension() const noexcept { return extension_; }

private:
  std::filesystem::path root_;
  std::string extension_;
};

/// In-memory component table, for embedding and tests.
class MemorySourceLoader : public SourceLoader
{
public:
  MemorySourceLoader() = default;
  explicit MemorySourceLoader(std::map<std::string, std::string, std::less<>> sources);

  /// Add or replace a component's source.
  void set(std::string identifier, std::string text);
  void erase(std::string_view identifier);

  [[nodiscard]] std::optional<std::string> load(std::string_view identifier) override;

  /// Number of load() calls so far (hits and misses).
  [[nodiscard]] size_t load_count() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string, std::less<>> sources_;
  size_t loads_ = 0;
};

}  // namespace stencil
