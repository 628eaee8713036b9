// stencil/basic/diagnostic_printer.hpp
//
// Prints parse diagnostics with the offending template line and a marker
// under the reported span, in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "stencil/basic/diagnostic.hpp"
#include "stencil/basic/source_manager.hpp"

namespace stencil
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0102]: expected $endif to close $if
 *     --> layouts.main:5:1
 *      |
 *    5 | $endforeach
 *      | ^^^^^^^^^^^ found $endforeach
 *      |
 *      = note: $if opened on line 2
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceFile & source);

  /// Print all diagnostics, ordered by primary location.
  void print_all(const DiagnosticBag & diags, const SourceFile & source);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label_context(const Label & label, const SourceFile & source);
  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace stencil
