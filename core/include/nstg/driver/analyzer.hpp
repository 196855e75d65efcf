// nstg/driver/analyzer.hpp - Analysis driver
//
// Single entry point for the analysis pipeline.
// Used by the CLI and can be embedded into other tools.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "nstg/basic/diagnostic.hpp"
#include "nstg/coverage/coverage_tracker.hpp"
#include "nstg/gaps/gap_engine.hpp"
#include "nstg/generation/test_generator.hpp"
#include "nstg/solver/constraint_solver.hpp"
#include "nstg/space/region.hpp"

namespace nstg
{

// ============================================================================
// Analysis Config
// ============================================================================

struct AnalysisConfig
{
  std::size_t max_negative_space_regions = 1000;
  std::size_t max_boundary_tests = 100;

  /// Per-call solver timeout
  uint32_t timeout_ms = 30000;

  /// Include special values (NaN, Infinity, BOM, ...) in boundary walks
  bool include_edge_cases = true;

  bool smt_solver_enabled = true;
  PrioritizationStrategy strategy = PrioritizationStrategy::Balanced;

  int exploration_depth = 2;
  std::size_t max_inputs_per_region = 10;
  std::size_t max_solutions_per_gap = 3;
};

// ============================================================================
// Analysis Result
// ============================================================================

struct AnalysisResult
{
  /// Whether the analysis completed without errors
  bool success = false;

  std::vector<TypeSpaceRegion> universe;
  CoverageStats coverage;
  GapAnalysis gaps;
  std::vector<TestCase> test_cases;
  TestGenerationStats test_stats;

  /// Collected diagnostics (warnings for untyped parameters, solver failures, ...)
  DiagnosticBag diagnostics;
};

// ============================================================================
// Analyzer
// ============================================================================

/**
 * Analysis driver that orchestrates the full pipeline.
 *
 * The pipeline consists of:
 * 1. Signature universe calculation
 * 2. Coverage tracking of the observed executions
 * 3. Gap detection and prioritization
 * 4. Boundary test generation
 * 5. Constraint solving for constrained gaps (when enabled)
 *
 * Solver problems are reported as warnings and never abort the analysis.
 */
class Analyzer
{
public:
  /**
   * @param config Analysis settings
   * @param solver Solver to use; a Z3-backed solver is created on demand when null
   */
  explicit Analyzer(AnalysisConfig config = {}, std::unique_ptr<ConstraintSolver> solver = nullptr);

  [[nodiscard]] AnalysisResult analyze(
    const FunctionSignature & signature,
    std::vector<CoverageTracker::Observed> executions = {});

  /// Stream for pipeline progress lines (nullptr: silent)
  void set_progress_stream(std::ostream * out) noexcept { progress_ = out; }

  [[nodiscard]] const AnalysisConfig & config() const noexcept { return config_; }

private:
  void progress(const std::string & line) const;

  /// Ensure an initialized solver; false (with a warning) when unavailable
  bool prepare_solver(DiagnosticBag & diags);

  void solve_gaps(
    const std::vector<NegativeSpaceRegion> & gaps, TestGenerator & generator,
    AnalysisResult & result);

  void solve_component(
    const NegativeSpaceRegion & gap, const TypeSpaceRegion & component, std::size_t position,
    TestGenerator & generator, AnalysisResult & result);

  AnalysisConfig config_;
  std::unique_ptr<ConstraintSolver> solver_;
  bool solver_unavailable_ = false;
  std::ostream * progress_ = nullptr;
};

}  // namespace nstg
