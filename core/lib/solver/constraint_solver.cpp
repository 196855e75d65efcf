// nstg/solver/constraint_solver.cpp - Diverse satisfying values for constraints
//
#include "nstg/solver/constraint_solver.hpp"

#include <z3++.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

namespace nstg
{

const char * to_string(SolveStatus status) noexcept
{
  switch (status) {
    case SolveStatus::Success:
      return "success";
    case SolveStatus::Unsatisfiable:
      return "unsatisfiable";
    case SolveStatus::Timeout:
      return "timeout";
    case SolveStatus::Error:
      return "error";
  }
  return "error";
}

std::optional<Diversification> parse_diversification(std::string_view text)
{
  if (text == "none") return Diversification::None;
  if (text == "backtrack") return Diversification::Backtrack;
  return std::nullopt;
}

namespace
{

double elapsed_ms_since(std::chrono::steady_clock::time_point start)
{
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
    .count();
}

}  // namespace

// ============================================================================
// Lifecycle
// ============================================================================

ConstraintSolver::ConstraintSolver(std::unique_ptr<SmtBackend> backend, std::size_t max_cache_size)
: backend_(std::move(backend)), cache_(max_cache_size)
{
}

void ConstraintSolver::init(BackendOptions options)
{
  if (!options.timeout_ms) options.timeout_ms = k_default_timeout_ms;
  options.produce_models = true;
  backend_->init(options);
}

bool ConstraintSolver::is_initialized() const { return backend_ && backend_->is_initialized(); }

void ConstraintSolver::dispose()
{
  if (backend_) backend_->dispose();
  cache_.clear();
}

// ============================================================================
// Solving
// ============================================================================

bool ConstraintSolver::validate_value(const Value & value, const TypeNode & type)
{
  const std::string name = type.primitive_name();
  if (name == "number") return value.is_number();
  if (name == "string") return value.is_string();
  if (name == "boolean") return value.is_bool();
  if (name == "null" || name == "undefined") return value.is_null();
  return true;
}

SolverResult ConstraintSolver::solve_for_satisfying_values(
  const std::optional<TypeNode> & type, const std::vector<TypeConstraint> & constraints,
  const SolverOptions & options)
{
  if (!is_initialized()) {
    throw SolverNotInitializedError(
      "Constraint solver not initialized. Call init() before solving.");
  }

  const auto start = std::chrono::steady_clock::now();

  std::string key;
  if (options.enable_cache) {
    key = SolverCache::make_key(constraints);
    if (auto cached = cache_.get(key)) {
      ++cache_hits_;
      cached->stats = SolverStats{elapsed_ms_since(start), cache_hits_, cache_misses_};
      return *cached;
    }
    ++cache_misses_;
  }

  std::vector<Value> values;
  const BackendSolveOptions call_options{options.timeout_ms};

  try {
    for (std::size_t i = 0; i < options.max_solutions; ++i) {
      const std::vector<Value> no_exclusions;
      const std::vector<Value> & exclusions =
        options.diversification == Diversification::Backtrack ? values : no_exclusions;

      const BackendSolution solution = backend_->solve(constraints, exclusions, call_options);

      if (solution.status == SatStatus::Unsat) break;

      if (solution.status == SatStatus::Unknown) {
        if (values.empty()) {
          return make_result(
            SolveStatus::Timeout, {}, elapsed_ms_since(start), std::string("Solver timeout"));
        }
        break;
      }

      if (solution.assignments.empty()) break;

      const Value & candidate = solution.assignments.front().second;
      if (type && !validate_value(candidate, *type)) break;

      // A repeated value means the backend has no further distinct solution
      if (std::find(values.begin(), values.end(), candidate) != values.end()) break;

      values.push_back(candidate);
    }
  } catch (const z3::exception & e) {
    return make_result(SolveStatus::Error, {}, elapsed_ms_since(start), std::string(e.msg()));
  } catch (const SolverNotInitializedError &) {
    throw;
  } catch (const std::exception & e) {
    return make_result(SolveStatus::Error, {}, elapsed_ms_since(start), std::string(e.what()));
  }

  const SolveStatus status = values.empty() ? SolveStatus::Unsatisfiable : SolveStatus::Success;
  SolverResult result = make_result(status, std::move(values), elapsed_ms_since(start));

  if (options.enable_cache && result.ok()) cache_.put(key, result);
  return result;
}

SolverResult ConstraintSolver::make_result(
  SolveStatus status, std::vector<Value> values, double elapsed_ms,
  std::optional<std::string> error) const
{
  SolverResult result;
  result.status = status;
  result.solution_count = values.size();
  result.values = std::move(values);
  result.error = std::move(error);
  result.stats = SolverStats{elapsed_ms, cache_hits_, cache_misses_};
  return result;
}

// ============================================================================
// Cache
// ============================================================================

void ConstraintSolver::clear_cache()
{
  cache_.clear();
  cache_hits_ = 0;
  cache_misses_ = 0;
}

CacheStats ConstraintSolver::cache_stats() const
{
  CacheStats stats;
  stats.size = cache_.size();
  stats.hits = cache_hits_;
  stats.misses = cache_misses_;
  const uint64_t total = cache_hits_ + cache_misses_;
  stats.hit_rate = total > 0 ? static_cast<double>(cache_hits_) / static_cast<double>(total) : 0.0;
  return stats;
}

}  // namespace nstg
