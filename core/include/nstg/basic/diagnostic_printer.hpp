// nstg/basic/diagnostic_printer.hpp
//
// Prints analysis diagnostics to a terminal in a compact,
// Rust-inspired format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "nstg/basic/diagnostic.hpp"

namespace nstg
{

/**
 * Prints diagnostics.
 *
 * Produces output like:
 *   warning[N001]: parameter has no type, using the unknown universe
 *     --> parameter 'x'
 *      |
 *      = note: coverage for this parameter matches every value
 *      = help: annotate the parameter type
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// Print a single diagnostic
  void print(const Diagnostic & diag);

  /// Print all diagnostics, errors first (stable within a severity)
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace nstg
