// nstg/solver/smt_backend.hpp - Abstract satisfiability backend
//
// The constraint solver talks to the SMT layer only through this
// interface so that tests can substitute a deterministic backend.
//
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "nstg/types/type_node.hpp"
#include "nstg/types/value.hpp"

namespace nstg
{

/**
 * Thrown when a solver or backend is used before init().
 */
class SolverNotInitializedError : public std::logic_error
{
public:
  explicit SolverNotInitializedError(const std::string & what) : std::logic_error(what) {}
};

// ============================================================================
// Options / Results
// ============================================================================

struct BackendOptions
{
  /// Default per-call timeout applied at init
  std::optional<uint32_t> timeout_ms;
  std::optional<uint32_t> max_memory_mb;
  bool produce_models = true;
};

struct BackendSolveOptions
{
  std::optional<uint32_t> timeout_ms;
};

enum class SatStatus : uint8_t {
  Sat,
  Unsat,
  Unknown,
};

[[nodiscard]] const char * to_string(SatStatus status) noexcept;

/**
 * Outcome of one backend call. On Sat, `assignments` holds the model value
 * of every bound variable in binding order.
 */
struct BackendSolution
{
  SatStatus status = SatStatus::Unknown;
  std::vector<std::pair<std::string, Value>> assignments;
};

// ============================================================================
// Backend Interface
// ============================================================================

class SmtBackend
{
public:
  virtual ~SmtBackend() = default;

  /// Idempotent; throws std::runtime_error when the backend cannot start
  virtual void init(const BackendOptions & options) = 0;

  [[nodiscard]] virtual bool is_initialized() const = 0;

  /**
   * Solve the conjunction of `constraints`.
   *
   * Every value in `exclusions` is forbidden for the first bound variable
   * (negated equality). Throws SolverNotInitializedError before init();
   * backend faults propagate as exceptions.
   */
  virtual BackendSolution solve(
    const std::vector<TypeConstraint> & constraints, const std::vector<Value> & exclusions,
    const BackendSolveOptions & options) = 0;

  virtual void dispose() = 0;
};

}  // namespace nstg
