// nstg/solver/z3_backend.hpp - Z3-based SMT backend
//
#pragma once

#include <z3++.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "nstg/solver/smt_backend.hpp"

namespace nstg
{

/**
 * A translated constraint together with the variables it binds.
 */
struct Z3Translation
{
  z3::expr expr;
  std::vector<std::pair<std::string, z3::expr>> bindings;
};

/**
 * SMT backend on top of the Z3 C++ API.
 *
 * Translation is best effort: a constraint shape that cannot be expressed
 * becomes an always-true expression instead of an error. Pattern
 * constraints are reduced to anchor checks (exact, prefix, suffix, contains).
 */
class Z3Backend : public SmtBackend
{
public:
  Z3Backend() = default;
  ~Z3Backend() override;

  Z3Backend(const Z3Backend &) = delete;
  Z3Backend & operator=(const Z3Backend &) = delete;

  void init(const BackendOptions & options) override;
  [[nodiscard]] bool is_initialized() const override { return context_ != nullptr; }

  BackendSolution solve(
    const std::vector<TypeConstraint> & constraints, const std::vector<Value> & exclusions,
    const BackendSolveOptions & options) override;

  void dispose() override;

  /// Translate one constraint over the variable `var_name`
  [[nodiscard]] Z3Translation translate_constraint(
    const TypeConstraint & constraint, const std::string & var_name);

  /// Convert a model value to a native value (integer, string, boolean, else raw text)
  [[nodiscard]] static Value parse_model_value(const z3::expr & value);

private:
  void ensure_initialized() const;
  void apply_timeout(uint32_t timeout_ms);

  /// Negated equality against an excluded value, if the sorts are compatible
  [[nodiscard]] std::optional<z3::expr> exclusion_for(const z3::expr & var, const Value & value);

  std::unique_ptr<z3::context> context_;
  std::unique_ptr<z3::solver> solver_;
  std::optional<uint32_t> default_timeout_ms_;
};

}  // namespace nstg
