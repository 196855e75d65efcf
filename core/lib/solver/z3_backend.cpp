// nstg/solver/z3_backend.cpp - Z3-based SMT backend implementation
//
#include "nstg/solver/z3_backend.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <stdexcept>

namespace nstg
{

const char * to_string(SatStatus status) noexcept
{
  switch (status) {
    case SatStatus::Sat:
      return "sat";
    case SatStatus::Unsat:
      return "unsat";
    case SatStatus::Unknown:
      return "unknown";
  }
  return "unknown";
}

namespace
{

std::string integer_text(double value) { return fmt::format("{:.0f}", value); }

/// Decimal digits of 2^exponent
std::string power_of_two_text(int exponent)
{
  std::string digits = "1";  // least significant digit first
  for (int i = 0; i < exponent; ++i) {
    int carry = 0;
    for (char & d : digits) {
      const int doubled = (d - '0') * 2 + carry;
      d = static_cast<char>('0' + doubled % 10);
      carry = doubled / 10;
    }
    if (carry) digits += static_cast<char>('0' + carry);
  }
  return std::string(digits.rbegin(), digits.rend());
}

/// Exact rational text "n/d" for a finite double (Z3 numeral syntax)
std::string rational_text(double value)
{
  if (std::trunc(value) == value) return integer_text(value);

  // value = mantissa * 2^-shift with an odd integral mantissa
  int exponent = 0;
  double mantissa = std::frexp(value, &exponent);
  int shift = 0;
  while (std::trunc(mantissa) != mantissa) {
    mantissa *= 2.0;
    ++shift;
  }
  shift -= exponent;
  return fmt::format("{}/{}", integer_text(mantissa), power_of_two_text(shift));
}

bool all_integral_numbers(const std::vector<Value> & values)
{
  for (const auto & v : values) {
    if (!v.is_number() || !v.is_integral()) return false;
  }
  return true;
}

z3::expr conjunction(z3::context & ctx, const z3::expr_vector & parts)
{
  if (parts.empty()) return ctx.bool_val(true);
  return z3::mk_and(parts);
}

bool same_binding(const z3::expr & a, const z3::expr & b) { return z3::eq(a, b); }

}  // namespace

// ============================================================================
// Lifecycle
// ============================================================================

Z3Backend::~Z3Backend() { dispose(); }

void Z3Backend::init(const BackendOptions & options)
{
  if (is_initialized()) return;

  try {
    z3::config cfg;
    cfg.set("model", options.produce_models);
    auto context = std::make_unique<z3::context>(cfg);
    auto solver = std::make_unique<z3::solver>(*context);

    z3::params params(*context);
    if (options.timeout_ms) params.set("timeout", static_cast<unsigned>(*options.timeout_ms));
    if (options.max_memory_mb) {
      params.set("max_memory", static_cast<unsigned>(*options.max_memory_mb));
    }
    solver->set(params);

    // The solver references the context, so it is released first in dispose()
    context_ = std::move(context);
    solver_ = std::move(solver);
    default_timeout_ms_ = options.timeout_ms;
  } catch (const z3::exception & e) {
    solver_.reset();
    context_.reset();
    throw std::runtime_error(fmt::format("Failed to initialize Z3 solver: {}", e.msg()));
  }
}

void Z3Backend::dispose()
{
  solver_.reset();
  context_.reset();
  default_timeout_ms_.reset();
}

void Z3Backend::ensure_initialized() const
{
  if (!is_initialized()) {
    throw SolverNotInitializedError("Z3 solver not initialized. Call init() before solving.");
  }
}

void Z3Backend::apply_timeout(uint32_t timeout_ms)
{
  z3::params params(*context_);
  params.set("timeout", static_cast<unsigned>(timeout_ms));
  solver_->set(params);
}

// ============================================================================
// Translation
// ============================================================================

Z3Translation Z3Backend::translate_constraint(
  const TypeConstraint & constraint, const std::string & var_name)
{
  ensure_initialized();
  z3::context & ctx = *context_;

  switch (constraint.kind) {
    case ConstraintKind::Range: {
      z3::expr x = ctx.int_const(var_name.c_str());
      z3::expr_vector parts(ctx);
      if (std::isfinite(constraint.min)) {
        parts.push_back(ctx.int_val(integer_text(std::ceil(constraint.min)).c_str()) <= x);
      }
      if (std::isfinite(constraint.max)) {
        parts.push_back(x <= ctx.int_val(integer_text(std::floor(constraint.max)).c_str()));
      }
      if (std::isnan(constraint.min) || std::isnan(constraint.max)) {
        parts.push_back(ctx.bool_val(false));
      }
      return Z3Translation{conjunction(ctx, parts), {{var_name, x}}};
    }

    case ConstraintKind::Length: {
      z3::expr s = ctx.string_const(var_name.c_str());
      z3::expr len = s.length();
      z3::expr_vector parts(ctx);
      if (constraint.min_length > 0) {
        parts.push_back(len >= ctx.int_val(static_cast<uint64_t>(constraint.min_length)));
      }
      if (constraint.max_length) {
        parts.push_back(len <= ctx.int_val(static_cast<uint64_t>(*constraint.max_length)));
      }
      return Z3Translation{conjunction(ctx, parts), {{var_name, s}}};
    }

    case ConstraintKind::Pattern: {
      z3::expr s = ctx.string_const(var_name.c_str());
      const std::string & pattern = constraint.pattern;
      if (pattern.empty()) return Z3Translation{ctx.bool_val(true), {{var_name, s}}};

      const bool starts = pattern.front() == '^';
      const bool ends = pattern.size() > 1 && pattern.back() == '$';

      if (starts && ends) {
        const std::string literal = pattern.substr(1, pattern.size() - 2);
        return Z3Translation{s == ctx.string_val(literal), {{var_name, s}}};
      }
      if (starts) {
        return Z3Translation{
          z3::prefixof(ctx.string_val(pattern.substr(1)), s), {{var_name, s}}};
      }
      if (ends) {
        return Z3Translation{
          z3::suffixof(ctx.string_val(pattern.substr(0, pattern.size() - 1)), s),
          {{var_name, s}}};
      }
      return Z3Translation{s.contains(ctx.string_val(pattern)), {{var_name, s}}};
    }

    case ConstraintKind::Enum: {
      if (constraint.values.empty()) {
        z3::expr x = ctx.int_const(var_name.c_str());
        return Z3Translation{ctx.bool_val(false), {{var_name, x}}};
      }

      const Value & first = constraint.values.front();
      z3::expr_vector disjuncts(ctx);

      if (first.is_number()) {
        const bool integral = all_integral_numbers(constraint.values);
        z3::expr x = integral ? ctx.int_const(var_name.c_str()) : ctx.real_const(var_name.c_str());
        for (const auto & v : constraint.values) {
          if (!v.is_number() || !v.is_finite()) continue;
          disjuncts.push_back(
            integral ? x == ctx.int_val(integer_text(v.as_number()).c_str())
                     : x == ctx.real_val(rational_text(v.as_number()).c_str()));
        }
        if (disjuncts.empty()) return Z3Translation{ctx.bool_val(false), {{var_name, x}}};
        return Z3Translation{z3::mk_or(disjuncts), {{var_name, x}}};
      }

      if (first.is_string()) {
        z3::expr s = ctx.string_const(var_name.c_str());
        for (const auto & v : constraint.values) {
          if (v.is_string()) disjuncts.push_back(s == ctx.string_val(v.as_string()));
        }
        return Z3Translation{z3::mk_or(disjuncts), {{var_name, s}}};
      }

      z3::expr b = ctx.bool_const(var_name.c_str());
      return Z3Translation{ctx.bool_val(true), {{var_name, b}}};
    }
  }

  z3::expr x = ctx.int_const(var_name.c_str());
  return Z3Translation{ctx.bool_val(true), {{var_name, x}}};
}

std::optional<z3::expr> Z3Backend::exclusion_for(const z3::expr & var, const Value & value)
{
  z3::context & ctx = *context_;

  if (var.is_int()) {
    if (!value.is_number() || !value.is_integral()) return std::nullopt;
    return var != ctx.int_val(integer_text(value.as_number()).c_str());
  }
  if (var.is_real()) {
    if (!value.is_number() || !value.is_finite()) return std::nullopt;
    return var != ctx.real_val(rational_text(value.as_number()).c_str());
  }
  if (var.is_seq()) {
    if (!value.is_string()) return std::nullopt;
    return var != ctx.string_val(value.as_string());
  }
  if (var.is_bool()) {
    if (!value.is_bool()) return std::nullopt;
    return var != ctx.bool_val(value.as_bool());
  }
  return std::nullopt;
}

// ============================================================================
// Solving
// ============================================================================

BackendSolution Z3Backend::solve(
  const std::vector<TypeConstraint> & constraints, const std::vector<Value> & exclusions,
  const BackendSolveOptions & options)
{
  ensure_initialized();

  solver_->reset();
  if (options.timeout_ms) {
    apply_timeout(*options.timeout_ms);
  } else if (default_timeout_ms_) {
    apply_timeout(*default_timeout_ms_);
  }

  // All constraints talk about the same value, one variable per sort
  std::vector<std::pair<std::string, z3::expr>> bindings;
  for (const auto & constraint : constraints) {
    Z3Translation translation = translate_constraint(constraint, "x");
    solver_->add(translation.expr);

    for (auto & binding : translation.bindings) {
      const bool known = std::any_of(bindings.begin(), bindings.end(), [&binding](const auto & b) {
        return same_binding(b.second, binding.second);
      });
      if (!known) bindings.push_back(std::move(binding));
    }
  }

  if (!bindings.empty()) {
    for (const auto & excluded : exclusions) {
      if (auto e = exclusion_for(bindings.front().second, excluded)) solver_->add(*e);
    }
  }

  BackendSolution solution;
  switch (solver_->check()) {
    case z3::sat: {
      solution.status = SatStatus::Sat;
      const z3::model model = solver_->get_model();
      for (const auto & [name, var] : bindings) {
        solution.assignments.emplace_back(name, parse_model_value(model.eval(var, true)));
      }
      break;
    }
    case z3::unsat:
      solution.status = SatStatus::Unsat;
      break;
    case z3::unknown:
      solution.status = SatStatus::Unknown;
      break;
  }
  return solution;
}

Value Z3Backend::parse_model_value(const z3::expr & value)
{
  if (value.is_numeral()) {
    int64_t integer = 0;
    if (value.is_int() && value.is_numeral_i64(integer)) {
      return Value::make_number(static_cast<double>(integer));
    }
    double real = 0.0;
    if (value.is_real() && value.is_numeral(real)) return Value::make_number(real);
  }
  if (value.is_string_value()) return Value::make_string(value.get_string());
  if (value.is_true()) return Value::make_bool(true);
  if (value.is_false()) return Value::make_bool(false);
  return Value::make_string(value.to_string());
}

}  // namespace nstg
