// tests/driver/test_analyzer.cpp - Unit tests for the analysis pipeline
//
#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "nstg/driver/analyzer.hpp"

using namespace nstg;

namespace
{

/// Backend that answers every query with the same status (and value when sat)
class StubBackend : public SmtBackend
{
public:
  explicit StubBackend(SatStatus status, bool fail_init = false)
  : status_(status), fail_init_(fail_init)
  {
  }

  void init(const BackendOptions &) override
  {
    if (fail_init_) throw std::runtime_error("no solver here");
    initialized_ = true;
  }
  [[nodiscard]] bool is_initialized() const override { return initialized_; }

  BackendSolution solve(
    const std::vector<TypeConstraint> &, const std::vector<Value> & exclusions,
    const BackendSolveOptions &) override
  {
    ++solve_calls;
    if (status_ != SatStatus::Sat) return BackendSolution{status_, {}};
    // 5, 6, 7, ... so Backtrack rounds see fresh values
    return BackendSolution{
      SatStatus::Sat,
      {{"x", Value::make_number(5.0 + static_cast<double>(exclusions.size()))}}};
  }

  void dispose() override { initialized_ = false; }

  int solve_calls = 0;

private:
  SatStatus status_;
  bool fail_init_;
  bool initialized_ = false;
};

FunctionSignature number_signature(std::vector<TypeConstraint> constraints = {})
{
  FunctionSignature sig;
  sig.name = "scale";
  FunctionParameter p;
  p.name = "x";
  p.type = TypeNode::primitive("number", std::move(constraints));
  sig.parameters.push_back(std::move(p));
  return sig;
}

std::vector<CoverageTracker::Observed> observed(double x)
{
  CoverageTracker::Observed o;
  o.args = {Value::make_number(x)};
  o.output = TestOutput::returned(Value::make_number(x * 2));
  return {o};
}

AnalysisConfig without_solver()
{
  AnalysisConfig config;
  config.smt_solver_enabled = false;
  return config;
}

std::unique_ptr<ConstraintSolver> stub_solver(SatStatus status, bool fail_init = false)
{
  return std::make_unique<ConstraintSolver>(std::make_unique<StubBackend>(status, fail_init));
}

bool has_code(const DiagnosticBag & diags, const std::string & code)
{
  return std::any_of(diags.begin(), diags.end(), [&code](const Diagnostic & d) {
    return d.code == code;
  });
}

}  // namespace

// ============================================================================
// Boundary pipeline
// ============================================================================

TEST(AnalyzerTest, ObservedExecutionShrinksTheNegativeSpace)
{
  Analyzer analyzer(without_solver());
  const auto result = analyzer.analyze(number_signature(), observed(5));

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.universe.size(), 6U);
  EXPECT_EQ(result.coverage.regions_covered, 1U);
  EXPECT_EQ(result.gaps.statistics.total_gaps, 5U);

  const bool positive_is_gap = std::any_of(
    result.gaps.gaps.begin(), result.gaps.gaps.end(),
    [](const NegativeSpaceRegion & g) { return g.id() == "number-positive"; });
  EXPECT_FALSE(positive_is_gap);

  for (const auto & test : result.test_cases) {
    EXPECT_NE(test.region.id, "number-positive");
    EXPECT_EQ(test.source, TestSource::Boundary);
  }
  EXPECT_EQ(result.test_stats.total_tests, result.test_cases.size());
}

TEST(AnalyzerTest, BoundaryTestLimit)
{
  AnalysisConfig config = without_solver();
  config.max_boundary_tests = 4;
  Analyzer analyzer(config);
  EXPECT_EQ(analyzer.analyze(number_signature()).test_cases.size(), 4U);
}

TEST(AnalyzerTest, GapLimitIsReported)
{
  AnalysisConfig config = without_solver();
  config.max_negative_space_regions = 2;
  Analyzer analyzer(config);
  const auto result = analyzer.analyze(number_signature());

  EXPECT_EQ(result.gaps.prioritized_gaps.size(), 2U);
  EXPECT_TRUE(has_code(result.diagnostics, diag_codes::k_gap_limit));
  EXPECT_TRUE(result.success);
}

TEST(AnalyzerTest, UntypedParameterWarnsButSucceeds)
{
  FunctionSignature sig;
  sig.name = "g";
  FunctionParameter p;
  p.name = "x";
  sig.parameters.push_back(p);

  Analyzer analyzer(without_solver());
  const auto result = analyzer.analyze(sig);
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(has_code(result.diagnostics, diag_codes::k_missing_parameter_type));
  EXPECT_FALSE(result.test_cases.empty());
}

TEST(AnalyzerTest, ProgressStream)
{
  std::ostringstream progress;
  Analyzer analyzer(without_solver());
  analyzer.set_progress_stream(&progress);
  (void)analyzer.analyze(number_signature());
  EXPECT_NE(progress.str().find("scale: 6 regions, 0 covered"), std::string::npos);
}

// ============================================================================
// Solver stage
// ============================================================================

TEST(AnalyzerTest, SolverValuesBecomeTests)
{
  AnalysisConfig config;
  config.max_solutions_per_gap = 2;
  Analyzer analyzer(config, stub_solver(SatStatus::Sat));
  const auto result = analyzer.analyze(number_signature({TypeConstraint::range(0, 10)}));

  ASSERT_TRUE(result.success);
  std::vector<TestCase> solver_tests;
  std::copy_if(
    result.test_cases.begin(), result.test_cases.end(), std::back_inserter(solver_tests),
    [](const TestCase & t) { return t.source == TestSource::Solver; });
  ASSERT_EQ(solver_tests.size(), 2U);
  EXPECT_EQ(solver_tests[0].inputs, std::vector<Value>{Value::make_number(5)});
  EXPECT_EQ(solver_tests[1].inputs, std::vector<Value>{Value::make_number(6)});
  EXPECT_EQ(solver_tests[0].region.id, "number-range-0-10");
}

TEST(AnalyzerTest, SolverTimeoutIsAWarning)
{
  Analyzer analyzer(AnalysisConfig{}, stub_solver(SatStatus::Unknown));
  const auto result = analyzer.analyze(number_signature({TypeConstraint::range(0, 10)}));

  EXPECT_TRUE(result.success);
  EXPECT_TRUE(has_code(result.diagnostics, diag_codes::k_solver_failure));
  EXPECT_TRUE(result.diagnostics.has_warnings());
}

TEST(AnalyzerTest, UnavailableSolverFallsBackToBoundaryTests)
{
  Analyzer analyzer(AnalysisConfig{}, stub_solver(SatStatus::Sat, true));
  const auto result = analyzer.analyze(number_signature({TypeConstraint::range(0, 10)}));

  EXPECT_TRUE(result.success);
  EXPECT_TRUE(has_code(result.diagnostics, diag_codes::k_solver_unavailable));
  EXPECT_FALSE(result.test_cases.empty());
  for (const auto & test : result.test_cases) {
    EXPECT_EQ(test.source, TestSource::Boundary);
  }
}

TEST(AnalyzerTest, UnconstrainedRegionsSkipTheSolver)
{
  // Only the constraint-free regions of a plain boolean: nothing to solve
  FunctionSignature sig;
  sig.name = "toggle";
  FunctionParameter p;
  p.name = "on";
  p.type = TypeNode::primitive("boolean");
  sig.parameters.push_back(p);

  auto solver = stub_solver(SatStatus::Unknown);
  Analyzer analyzer(AnalysisConfig{}, std::move(solver));
  const auto result = analyzer.analyze(sig);
  EXPECT_FALSE(has_code(result.diagnostics, diag_codes::k_solver_failure));
  EXPECT_FALSE(has_code(result.diagnostics, diag_codes::k_solver_unavailable));
}
