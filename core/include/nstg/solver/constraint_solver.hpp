// nstg/solver/constraint_solver.hpp - Diverse satisfying values for constraints
//
// Drives an SmtBackend repeatedly, excluding every accepted value so that
// each call lands in a different part of the solution space, and caches
// successful results per constraint list.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "nstg/solver/smt_backend.hpp"
#include "nstg/solver/solver_cache.hpp"
#include "nstg/solver/solver_result.hpp"
#include "nstg/types/type_node.hpp"

namespace nstg
{

enum class Diversification : uint8_t {
  None,       ///< repeat the same query
  Backtrack,  ///< exclude every previously accepted value
};

[[nodiscard]] std::optional<Diversification> parse_diversification(std::string_view text);

struct SolverOptions
{
  std::size_t max_solutions = 10;
  uint32_t timeout_ms = 5000;
  bool enable_cache = true;
  Diversification diversification = Diversification::Backtrack;
};

struct CacheStats
{
  std::size_t size = 0;
  uint64_t hits = 0;
  uint64_t misses = 0;
  double hit_rate = 0.0;
};

/**
 * High-level constraint solver.
 *
 * Not thread-safe: the cache and hit/miss counters belong to the instance.
 * Every solve is bounded by `max_solutions` backend calls, each bounded by
 * the backend timeout.
 */
class ConstraintSolver
{
public:
  /// Default per-call timeout passed to the backend at init
  static constexpr uint32_t k_default_timeout_ms = 5000;

  explicit ConstraintSolver(std::unique_ptr<SmtBackend> backend, std::size_t max_cache_size = 1000);

  ConstraintSolver(const ConstraintSolver &) = delete;
  ConstraintSolver & operator=(const ConstraintSolver &) = delete;

  void init(BackendOptions options = {});
  [[nodiscard]] bool is_initialized() const;

  /// Release the backend and drop cached results
  void dispose();

  /**
   * Produce up to `max_solutions` distinct values satisfying `constraints`.
   *
   * Never throws for solve outcomes or backend faults; those are reported
   * through `status`. Throws SolverNotInitializedError before init().
   *
   * @param type Optional type used to validate each value's primitive kind
   */
  [[nodiscard]] SolverResult solve_for_satisfying_values(
    const std::optional<TypeNode> & type, const std::vector<TypeConstraint> & constraints,
    const SolverOptions & options = {});

  void clear_cache();
  [[nodiscard]] CacheStats cache_stats() const;

  /// True when `value` is acceptable for the primitive kind of `type`
  [[nodiscard]] static bool validate_value(const Value & value, const TypeNode & type);

private:
  [[nodiscard]] SolverResult make_result(
    SolveStatus status, std::vector<Value> values, double elapsed_ms,
    std::optional<std::string> error = std::nullopt) const;

  std::unique_ptr<SmtBackend> backend_;
  SolverCache cache_;
  uint64_t cache_hits_ = 0;
  uint64_t cache_misses_ = 0;
};

}  // namespace nstg
