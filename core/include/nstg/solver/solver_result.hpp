// nstg/solver/solver_result.hpp - Constraint solver result records
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nstg/types/value.hpp"

namespace nstg
{

enum class SolveStatus : uint8_t {
  Success,        ///< at least one satisfying value
  Unsatisfiable,  ///< no value satisfies the constraints
  Timeout,        ///< backend gave up before the first value
  Error,          ///< backend fault (see `error`)
};

[[nodiscard]] const char * to_string(SolveStatus status) noexcept;

struct SolverStats
{
  double solve_time_ms = 0.0;
  uint64_t cache_hits = 0;    ///< cumulative for the solver instance
  uint64_t cache_misses = 0;  ///< cumulative for the solver instance
};

struct SolverResult
{
  SolveStatus status = SolveStatus::Unsatisfiable;
  std::vector<Value> values;
  std::size_t solution_count = 0;
  std::optional<std::string> error;
  SolverStats stats;

  [[nodiscard]] bool ok() const noexcept { return status == SolveStatus::Success; }
};

}  // namespace nstg
