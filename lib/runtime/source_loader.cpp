// stencil/runtime/source_loader.cpp - Component source lookup
//
#include "stencil/runtime/source_loader.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace stencil
{

// ============================================================================
// FileSourceLoader
// ============================================================================

FileSourceLoader::FileSourceLoader(std::filesystem::path root, std::string extension)
: root_(std::move(root)), extension_(std::move(extension))
{
}

std::optional<std::filesystem::path> FileSourceLoader::path_for(std::string_view identifier) const
{
  if (identifier.empty()) {
    return std::nullopt;
  }

  std::filesystem::path path = root_;
  size_t start = 0;
  while (true) {
    const size_t dot = identifier.find('.', start);
    const std::string_view segment = identifier.substr(
      start, dot == std::string_view::npos ? std::string_view::npos : dot - start);

    if (segment.empty() || segment == "..") {
      return std::nullopt;
    }
    if (segment.find_first_of("/\\") != std::string_view::npos) {
      return std::nullopt;
    }

    if (dot == std::string_view::npos) {
      path /= std::string(segment) + extension_;
      return path;
    }
    path /= std::string(segment);
    start = dot + 1;
  }
}

std::optional<std::string> FileSourceLoader::load(std::string_view identifier)
{
  const auto path = path_for(identifier);
  if (!path) {
    return std::nullopt;
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(*path, ec)) {
    return std::nullopt;
  }

  std::ifstream file(*path, std::ios::binary);
  if (!file) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

// ============================================================================
// MemorySourceLoader
// ============================================================================

MemorySourceLoader::MemorySourceLoader(std::map<std::string, std::string, std::less<>> sources)
: sources_(std::move(sources))
{
}

void MemorySourceLoader::set(std::string identifier, std::string text)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  sources_[std::move(identifier)] = std::move(text);
}

void MemorySourceLoader::erase(std::string_view identifier)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sources_.find(identifier);
  if (it != sources_.end()) {
    sources_.erase(it);
  }
}

std::optional<std::string> MemorySourceLoader::load(std::string_view identifier)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  ++loads_;
  const auto it = sources_.find(identifier);
  if (it == sources_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t MemorySourceLoader::load_count() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return loads_;
}

}  // namespace stencil
