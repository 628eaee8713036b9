// stencil/basic/diagnostic.hpp - Diagnostic types for lexing/parsing
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "stencil/basic/source_manager.hpp"

namespace stencil
{

// ============================================================================
// Diagnostic Codes
// ============================================================================

namespace diag_code
{

inline constexpr std::string_view k_lexical = "E0001";
inline constexpr std::string_view k_unexpected_token = "E0101";
inline constexpr std::string_view k_block_mismatch = "E0102";
inline constexpr std::string_view k_if_chain_order = "E0103";
inline constexpr std::string_view k_argument_count = "E0104";
inline constexpr std::string_view k_place_in_replace = "E0201";
inline constexpr std::string_view k_render_body = "E0202";

}  // namespace diag_code

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

enum class LabelStyle {
  Primary,    // direct cause
  Secondary,  // related location (e.g. the opener of an unclosed block)
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g., "E0102"
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic with a fluent interface and registers it with the bag
 * when destroyed (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string_view code);

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] bool has_errors() const;

  /// First error in report order, or nullptr
  [[nodiscard]] const Diagnostic * first_error() const noexcept;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace stencil
