// nstg/coverage/coverage_tracker.cpp - Coverage tracking implementation
//
#include "nstg/coverage/coverage_tracker.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>

#include "nstg/space/region_predicates.hpp"
#include "nstg/space/type_universe.hpp"

namespace nstg
{

CoverageTracker::CoverageTracker(FunctionSignature signature, DiagnosticBag * diags)
: signature_(std::move(signature)),
  universe_(TypeUniverse{}.calculate_signature_universe(signature_, diags)),
  diags_(diags)
{
}

void CoverageTracker::record_execution(std::vector<Value> args, TestOutput output)
{
  const auto & params = signature_.parameters;
  const auto required = static_cast<std::size_t>(std::count_if(
    params.begin(), params.end(), [](const FunctionParameter & p) { return !p.optional; }));

  if (diags_ != nullptr && (args.size() < required || args.size() > params.size())) {
    diags_->report_warning(
           fmt::format("execution #{} of '{}'", executions_.size() + 1, signature_.name),
           fmt::format(
             "execution passes {} argument(s), signature declares {}", args.size(),
             params.size()))
      .with_code(diag_codes::k_invalid_input)
      .with_note("missing arguments are matched as null, extra arguments are ignored");
  }

  TestExecution exec;
  exec.regions = regions_for(args);
  exec.args = std::move(args);
  exec.output = std::move(output);
  exec.timestamp = std::chrono::system_clock::now();
  executions_.push_back(std::move(exec));
}

void CoverageTracker::record_executions(std::vector<Observed> batch)
{
  for (auto & observed : batch) {
    record_execution(std::move(observed.args), std::move(observed.output));
  }
}

std::vector<TestExecution> CoverageTracker::executions_for_region(const std::string & id) const
{
  std::vector<TestExecution> result;
  for (const auto & exec : executions_) {
    if (std::find(exec.regions.begin(), exec.regions.end(), id) != exec.regions.end()) {
      result.push_back(exec);
    }
  }
  return result;
}

std::set<std::string> CoverageTracker::covered_region_ids() const
{
  std::set<std::string> covered;
  for (const auto & exec : executions_) {
    covered.insert(exec.regions.begin(), exec.regions.end());
  }
  return covered;
}

std::vector<TypeSpaceRegion> CoverageTracker::covered_regions() const
{
  const auto covered = covered_region_ids();
  std::vector<TypeSpaceRegion> result;
  std::copy_if(
    universe_.begin(), universe_.end(), std::back_inserter(result),
    [&covered](const TypeSpaceRegion & r) { return covered.count(r.id) > 0; });
  return result;
}

bool CoverageTracker::is_region_covered(const std::string & id) const
{
  return std::any_of(executions_.begin(), executions_.end(), [&id](const TestExecution & exec) {
    return std::find(exec.regions.begin(), exec.regions.end(), id) != exec.regions.end();
  });
}

CoverageStats CoverageTracker::get_coverage_stats() const
{
  const auto covered = covered_region_ids();

  CoverageStats stats;
  stats.total_inputs = executions_.size();
  stats.regions_covered = covered.size();
  stats.total_regions = universe_.size();

  for (const auto & exec : executions_) {
    for (const auto & id : exec.regions) {
      stats.inputs_by_region[id].push_back(exec.args);
    }
  }

  Cardinality total;
  Cardinality covered_size;
  for (const auto & region : universe_) {
    total += region.cardinality;
    if (covered.count(region.id) > 0) {
      covered_size += region.cardinality;
    } else {
      stats.uncovered_regions.push_back(region);
    }
  }

  if (universe_.empty()) {
    stats.coverage_percentage = 100.0;
  } else if (total.is_finite() && covered_size.is_finite()) {
    stats.coverage_percentage =
      total.count() == 0 ? 100.0
                         : static_cast<double>(covered_size.count()) /
                             static_cast<double>(total.count()) * 100.0;
  }

  return stats;
}

std::vector<std::string> CoverageTracker::regions_for(const std::vector<Value> & args) const
{
  std::vector<std::string> matched;
  for (const auto & region : universe_) {
    if (arguments_match_region(args, region)) {
      matched.push_back(region.id);
    }
  }
  return matched;
}

}  // namespace nstg
