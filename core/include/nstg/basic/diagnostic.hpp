// nstg/basic/diagnostic.hpp - Diagnostics collected during an analysis run
//
// Every pipeline stage reports into a DiagnosticBag instead of logging.
// The subject names what the diagnostic is about (a parameter, a region
// id, an input file).
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nstg
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     // e.g., "N001"
  std::string message;  // main message

  /// What the diagnostic is about ("parameter 'x'", "number-zero", ...)
  std::string subject;

  std::vector<std::string> notes;
  std::optional<std::string> help_message;
};

/// Lower-case severity name ("error", "warning", ...)
[[nodiscard]] const char * to_string(Severity severity) noexcept;

// ============================================================================
// Diagnostic Codes
// ============================================================================

namespace diag_codes
{
inline constexpr const char * k_missing_parameter_type = "N001";
inline constexpr const char * k_unsupported_type = "N002";
inline constexpr const char * k_solver_failure = "N003";
inline constexpr const char * k_solver_unavailable = "N004";
inline constexpr const char * k_invalid_input = "N005";
inline constexpr const char * k_gap_limit = "N006";
}  // namespace diag_codes

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and registers it with the bag when
 * destroyed (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_note(std::string note);

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

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(std::string subject, std::string message);
  DiagnosticBuilder report_warning(std::string subject, std::string message);
  DiagnosticBuilder report_info(std::string subject, std::string message);
  DiagnosticBuilder report_hint(std::string subject, std::string message);

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  DiagnosticBuilder report(Severity severity, std::string subject, std::string message);

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace nstg
