// nstg/coverage/coverage_tracker.hpp - Map observed executions onto regions
//
#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "nstg/basic/diagnostic.hpp"
#include "nstg/space/region.hpp"
#include "nstg/types/type_node.hpp"
#include "nstg/types/value.hpp"

namespace nstg
{

// ============================================================================
// Execution Records
// ============================================================================

/**
 * Observed result of one call: a returned value or a thrown error.
 */
struct TestOutput
{
  std::optional<Value> value;
  std::optional<std::string> error;
  std::optional<double> duration_ms;

  [[nodiscard]] bool threw() const noexcept { return error.has_value(); }

  static TestOutput returned(Value v)
  {
    TestOutput o;
    o.value = std::move(v);
    return o;
  }

  static TestOutput thrown(std::string message)
  {
    TestOutput o;
    o.error = std::move(message);
    return o;
  }
};

/**
 * One recorded call. The matching region ids are computed once, when the
 * execution is recorded.
 */
struct TestExecution
{
  std::vector<Value> args;
  TestOutput output;
  std::chrono::system_clock::time_point timestamp;
  std::vector<std::string> regions;
};

// ============================================================================
// Coverage Statistics
// ============================================================================

struct CoverageStats
{
  std::size_t total_inputs = 0;
  std::size_t regions_covered = 0;
  std::size_t total_regions = 0;

  /// covered / total cardinality x 100; unset when either side is infinite
  std::optional<double> coverage_percentage;

  /// Argument lists grouped by the region ids they matched
  std::map<std::string, std::vector<std::vector<Value>>> inputs_by_region;

  std::vector<TypeSpaceRegion> uncovered_regions;
};

// ============================================================================
// Coverage Tracker
// ============================================================================

/**
 * Records test executions for one function and tracks which regions of
 * its signature universe they exercise.
 */
class CoverageTracker
{
public:
  /**
   * @param signature Function under test (universe computed eagerly)
   * @param diags Optional sink for universe warnings (e.g. untyped parameters)
   *              and argument count mismatches; must outlive the tracker
   */
  explicit CoverageTracker(FunctionSignature signature, DiagnosticBag * diags = nullptr);

  void record_execution(std::vector<Value> args, TestOutput output);

  struct Observed
  {
    std::vector<Value> args;
    TestOutput output;
  };
  void record_executions(std::vector<Observed> batch);

  [[nodiscard]] const std::vector<TestExecution> & executions() const noexcept
  {
    return executions_;
  }

  [[nodiscard]] std::vector<TestExecution> executions_for_region(const std::string & id) const;

  [[nodiscard]] std::set<std::string> covered_region_ids() const;
  [[nodiscard]] std::vector<TypeSpaceRegion> covered_regions() const;
  [[nodiscard]] bool is_region_covered(const std::string & id) const;

  [[nodiscard]] CoverageStats get_coverage_stats() const;

  [[nodiscard]] const std::vector<TypeSpaceRegion> & universe() const noexcept
  {
    return universe_;
  }

  [[nodiscard]] const FunctionSignature & signature() const noexcept { return signature_; }

  /// Forget every recorded execution (the universe is kept)
  void clear() noexcept { executions_.clear(); }

private:
  [[nodiscard]] std::vector<std::string> regions_for(const std::vector<Value> & args) const;

  FunctionSignature signature_;
  std::vector<TypeSpaceRegion> universe_;
  std::vector<TestExecution> executions_;
  DiagnosticBag * diags_ = nullptr;
};

}  // namespace nstg
