// nstg/driver/analyzer.cpp - Analysis driver implementation
//
#include "nstg/driver/analyzer.hpp"

#include <fmt/core.h>

#include <exception>
#include <iterator>
#include <ostream>
#include <utility>

#include "nstg/solver/z3_backend.hpp"
#include "nstg/types/type_utils.hpp"

namespace nstg
{

namespace
{

std::string join_constraints(const std::vector<TypeConstraint> & constraints)
{
  std::string out;
  for (std::size_t i = 0; i < constraints.size(); ++i) {
    if (i > 0) out += " and ";
    out += constraint_to_string(constraints[i]);
  }
  return out;
}

/// Solver validation type of a region (primitive regions only)
std::optional<TypeNode> validation_type(const TypeSpaceRegion & region)
{
  if (region.type.kind == TypeKind::Primitive) return region.type;
  return std::nullopt;
}

}  // namespace

Analyzer::Analyzer(AnalysisConfig config, std::unique_ptr<ConstraintSolver> solver)
: config_(std::move(config)), solver_(std::move(solver))
{
}

void Analyzer::progress(const std::string & line) const
{
  if (progress_) *progress_ << line << "\n";
}

AnalysisResult Analyzer::analyze(
  const FunctionSignature & signature, std::vector<CoverageTracker::Observed> executions)
{
  AnalysisResult result;

  // Universe + coverage
  CoverageTracker tracker(signature, &result.diagnostics);
  tracker.record_executions(std::move(executions));

  result.universe = tracker.universe();
  result.coverage = tracker.get_coverage_stats();
  progress(fmt::format(
    "{}: {} regions, {} covered", signature.name, result.coverage.total_regions,
    result.coverage.regions_covered));

  // Gaps
  GapDetectionOptions gap_options;
  gap_options.max_gaps = config_.max_negative_space_regions;
  gap_options.strategy = config_.strategy;
  result.gaps = GapEngine::detect_gaps(result.universe, tracker.covered_region_ids(), gap_options);

  if (result.gaps.gaps.size() > result.gaps.prioritized_gaps.size()) {
    result.diagnostics
      .report_info(
        signature.name, fmt::format(
                          "only the first {} of {} gaps are used for test generation",
                          result.gaps.prioritized_gaps.size(), result.gaps.gaps.size()))
      .with_code(diag_codes::k_gap_limit)
      .with_help("raise analysis.max_negative_space_regions to keep more gaps");
  }
  progress(fmt::format(
    "{} gaps ({} boundary, {} interior)", result.gaps.statistics.total_gaps,
    result.gaps.statistics.boundary_gap_count, result.gaps.statistics.interior_gap_count));

  // Boundary tests
  TestGenerator generator(signature);

  TestGenerationOptions test_options;
  test_options.max_tests = config_.max_boundary_tests;
  test_options.exploration_depth = config_.exploration_depth;
  test_options.max_inputs_per_region = config_.max_inputs_per_region;
  test_options.include_special_values = config_.include_edge_cases;
  result.test_cases = generator.generate_tests(result.gaps.prioritized_gaps, test_options);
  progress(fmt::format("{} boundary tests", result.test_cases.size()));

  // Solver tests
  if (config_.smt_solver_enabled) {
    solve_gaps(result.gaps.prioritized_gaps, generator, result);
  }

  result.test_stats = TestGenerator::calculate_stats(result.test_cases);
  result.success = !result.diagnostics.has_errors();
  return result;
}

// ============================================================================
// Solver Stage
// ============================================================================

bool Analyzer::prepare_solver(DiagnosticBag & diags)
{
  if (solver_unavailable_) return false;
  if (solver_ && solver_->is_initialized()) return true;

  try {
    if (!solver_) solver_ = std::make_unique<ConstraintSolver>(std::make_unique<Z3Backend>());

    BackendOptions options;
    options.timeout_ms = config_.timeout_ms;
    solver_->init(options);
    return true;
  } catch (const std::exception & e) {
    solver_unavailable_ = true;
    diags.report_warning("solver", fmt::format("constraint solver unavailable: {}", e.what()))
      .with_code(diag_codes::k_solver_unavailable)
      .with_note("only boundary tests were generated");
    return false;
  }
}

void Analyzer::solve_gaps(
  const std::vector<NegativeSpaceRegion> & gaps, TestGenerator & generator,
  AnalysisResult & result)
{
  const std::size_t before = result.test_cases.size();

  for (const auto & gap : gaps) {
    if (gap.region.is_compound()) {
      for (std::size_t i = 0; i < gap.region.components.size(); ++i) {
        const auto & component = gap.region.components[i];
        if (!component.constraints.empty()) solve_component(gap, component, i, generator, result);
      }
    } else if (!gap.region.constraints.empty()) {
      solve_component(gap, gap.region, 0, generator, result);
    }
    if (solver_unavailable_) break;
  }

  progress(fmt::format("{} solver tests", result.test_cases.size() - before));
}

void Analyzer::solve_component(
  const NegativeSpaceRegion & gap, const TypeSpaceRegion & component, std::size_t position,
  TestGenerator & generator, AnalysisResult & result)
{
  if (!prepare_solver(result.diagnostics)) return;

  SolverOptions options;
  options.max_solutions = config_.max_solutions_per_gap;
  options.timeout_ms = config_.timeout_ms;

  const SolverResult solved = solver_->solve_for_satisfying_values(
    validation_type(component), component.constraints, options);

  switch (solved.status) {
    case SolveStatus::Success: {
      auto tests = generator.tests_from_solver_values(
        gap, solved.values, position, join_constraints(component.constraints));
      std::move(tests.begin(), tests.end(), std::back_inserter(result.test_cases));
      break;
    }
    case SolveStatus::Unsatisfiable:
      break;
    case SolveStatus::Timeout:
    case SolveStatus::Error:
      result.diagnostics
        .report_warning(
          component.id, fmt::format(
                          "constraint solving failed ({}): {}", to_string(solved.status),
                          solved.error.value_or("no details")))
        .with_code(diag_codes::k_solver_failure)
        .with_note(fmt::format("constraints: {}", join_constraints(component.constraints)));
      break;
  }
}

}  // namespace nstg
