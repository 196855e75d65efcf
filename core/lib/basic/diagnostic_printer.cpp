// nstg/basic/diagnostic_printer.cpp - Terminal diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "nstg/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <vector>

namespace nstg
{

namespace
{

rang::fg severity_color(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
    case Severity::Info:
      return rang::fg::cyan;
    case Severity::Hint:
      return rang::fg::green;
  }
  return rang::fg::reset;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  print_severity_header(diag);

  if (!diag.subject.empty()) {
    fmt::print(os_, "{} {}\n", gutter_arrow(), diag.subject);
  }

  if (!diag.notes.empty() || diag.help_message) {
    fmt::print(os_, "{}\n", gutter_pipe());
  }

  for (const auto & note : diag.notes) {
    print_trailer("note", note);
  }

  if (diag.help_message) {
    print_trailer("help", *diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags)
{
  std::vector<Diagnostic> sorted_diags(diags.begin(), diags.end());

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return static_cast<int>(a.severity) < static_cast<int>(b.severity);
    });

  for (const auto & d : sorted_diags) {
    print(d);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string code = diag.code.empty() ? "" : fmt::format("[{}]", diag.code);

  if (use_color_) {
    os_ << rang::style::bold << severity_color(diag.severity) << to_string(diag.severity) << code
        << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}{}: {}\n", to_string(diag.severity), code, diag.message);
  }
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "{}: {}\n", kind, message);
  } else {
    fmt::print(os_, "      = {}: {}\n", kind, message);
  }
}

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}  -->{}", "\033[1;36m", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace nstg
