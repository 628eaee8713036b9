// stencil/basic/source_manager.hpp - Source location and range management
//
// This header provides types for tracking positions inside a component's
// template text. Every parsed component owns exactly one SourceFile.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace stencil
{

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A compact representation of a source location.
 *
 * Internally stores a byte offset into the component text. Line and column
 * information can be computed on demand via SourceFile.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}

  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }

  [[nodiscard]] constexpr bool is_invalid() const noexcept { return offset_ == k_invalid_offset; }

  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return offset_ != other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }
  [[nodiscard]] constexpr bool operator<=(SourceLocation other) const noexcept
  {
    return offset_ <= other.offset_;
  }
  [[nodiscard]] constexpr bool operator>=(SourceLocation other) const noexcept
  {
    return offset_ >= other.offset_;
  }

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange - Start and end locations
// ============================================================================

/**
 * A range of template text defined by start and end locations.
 *
 * The range follows the half-open interval convention [start, end).
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation start, SourceLocation end) noexcept
  : start_(start), end_(end)
  {
  }

  constexpr SourceRange(uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(SourceLocation(start_offset)), end_(SourceLocation(end_offset))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }

  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }

  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  [[nodiscard]] constexpr bool contains(SourceLocation loc) const noexcept
  {
    return loc >= start_ && loc < end_;
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (is_invalid()) return 0;
    return end_.offset() - start_.offset();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

/// Join two ranges into one spanning both (either may be invalid).
[[nodiscard]] constexpr SourceRange join_ranges(SourceRange a, SourceRange b) noexcept
{
  if (a.is_invalid()) return b;
  if (b.is_invalid()) return a;
  return {a.get_begin(), b.get_end()};
}

// ============================================================================
// LineColumn / FullSourceRange - Human-readable positions
// ============================================================================

struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceFile - One component's template text
// ============================================================================

/**
 * Owns the raw text of a component and provides location services.
 *
 * The name is the dotted component identifier (e.g. "layouts.main"), which
 * is what diagnostics print in place of a file path.
 */
class SourceFile
{
public:
  SourceFile() = default;
  SourceFile(std::string name, std::string content);

  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t size() const noexcept { return content_.size(); }
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  /// Convert a byte offset to line/column (1-indexed)
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// 1-indexed line of a location (0 when invalid)
  [[nodiscard]] uint32_t line_of(SourceLocation loc) const noexcept
  {
    return loc.is_valid() ? get_line_column(loc.offset()).line : 0;
  }

  /// Content of a specific line (0-indexed), without the trailing newline
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::string name_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

}  // namespace stencil
