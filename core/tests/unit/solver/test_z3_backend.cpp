// tests/solver/test_z3_backend.cpp - Unit tests for the Z3 backend
//
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "nstg/solver/constraint_solver.hpp"
#include "nstg/solver/z3_backend.hpp"

using namespace nstg;

namespace
{

struct Z3Fixture
{
  Z3Backend backend;

  Z3Fixture()
  {
    BackendOptions options;
    options.timeout_ms = 5000;
    backend.init(options);
  }

  BackendSolution solve(
    const std::vector<TypeConstraint> & constraints, const std::vector<Value> & exclusions = {})
  {
    return backend.solve(constraints, exclusions, BackendSolveOptions{});
  }
};

}  // namespace

TEST(Z3BackendTest, UseBeforeInitThrows)
{
  Z3Backend backend;
  EXPECT_FALSE(backend.is_initialized());
  EXPECT_THROW(
    (void)backend.solve({TypeConstraint::range(0, 1)}, {}, BackendSolveOptions{}),
    SolverNotInitializedError);
}

TEST(Z3BackendTest, DisposeIsIdempotent)
{
  Z3Fixture f;
  EXPECT_TRUE(f.backend.is_initialized());
  f.backend.dispose();
  f.backend.dispose();
  EXPECT_FALSE(f.backend.is_initialized());
}

TEST(Z3BackendTest, RangeYieldsIntegerInBounds)
{
  Z3Fixture f;
  const auto solution = f.solve({TypeConstraint::range(3, 5)});
  ASSERT_EQ(solution.status, SatStatus::Sat);
  ASSERT_EQ(solution.assignments.size(), 1U);

  const Value & v = solution.assignments[0].second;
  ASSERT_TRUE(v.is_number());
  EXPECT_TRUE(v.is_integral());
  EXPECT_GE(v.as_number(), 3.0);
  EXPECT_LE(v.as_number(), 5.0);
}

TEST(Z3BackendTest, ExclusionsForceNewValues)
{
  Z3Fixture f;
  const auto solution = f.solve(
    {TypeConstraint::range(0, 2)}, {Value::make_number(0), Value::make_number(1)});
  ASSERT_EQ(solution.status, SatStatus::Sat);
  EXPECT_EQ(solution.assignments[0].second, Value::make_number(2));

  const auto exhausted = f.solve(
    {TypeConstraint::range(0, 2)},
    {Value::make_number(0), Value::make_number(1), Value::make_number(2)});
  EXPECT_EQ(exhausted.status, SatStatus::Unsat);
}

TEST(Z3BackendTest, EmptyRangeIsUnsat)
{
  Z3Fixture f;
  EXPECT_EQ(f.solve({TypeConstraint::range(5, 1)}).status, SatStatus::Unsat);
  EXPECT_EQ(f.solve({TypeConstraint::range(0.2, 0.8)}).status, SatStatus::Unsat);
}

TEST(Z3BackendTest, LengthBounds)
{
  Z3Fixture f;
  const auto solution = f.solve({TypeConstraint::length(2, 4)});
  ASSERT_EQ(solution.status, SatStatus::Sat);
  const Value & v = solution.assignments[0].second;
  ASSERT_TRUE(v.is_string());
  // Non-printable model characters come back escaped, so only the lower bound is exact
  EXPECT_GE(v.string_length(), 2U);
}

TEST(Z3BackendTest, PatternAnchors)
{
  Z3Fixture f;
  const auto exact = f.solve({TypeConstraint::regex("^abc$")});
  ASSERT_EQ(exact.status, SatStatus::Sat);
  EXPECT_EQ(exact.assignments[0].second, Value::make_string("abc"));

  const auto prefixed = f.solve({TypeConstraint::regex("^id-"), TypeConstraint::length(5, 5)});
  ASSERT_EQ(prefixed.status, SatStatus::Sat);
  ASSERT_EQ(prefixed.assignments.size(), 1U);
  const std::string text = prefixed.assignments[0].second.as_string();
  EXPECT_EQ(text.rfind("id-", 0), 0U);
}

TEST(Z3BackendTest, EnumerationsPickListedValues)
{
  Z3Fixture f;
  const auto numbers =
    f.solve({TypeConstraint::one_of({Value::make_number(7), Value::make_number(9)})});
  ASSERT_EQ(numbers.status, SatStatus::Sat);
  const Value & n = numbers.assignments[0].second;
  EXPECT_TRUE(n == Value::make_number(7) || n == Value::make_number(9));

  const auto strings = f.solve(
    {TypeConstraint::one_of({Value::make_string("red"), Value::make_string("blue")})},
    {Value::make_string("red")});
  ASSERT_EQ(strings.status, SatStatus::Sat);
  EXPECT_EQ(strings.assignments[0].second, Value::make_string("blue"));

  EXPECT_EQ(f.solve({TypeConstraint::one_of({})}).status, SatStatus::Unsat);
}

TEST(Z3BackendTest, FractionalEnumUsesReals)
{
  Z3Fixture f;
  const auto solution = f.solve({TypeConstraint::one_of({Value::make_number(0.5)})});
  ASSERT_EQ(solution.status, SatStatus::Sat);
  EXPECT_EQ(solution.assignments[0].second, Value::make_number(0.5));
}

TEST(Z3BackendTest, TinyRealsAreEncodedExactly)
{
  Z3Fixture f;
  const std::vector<TypeConstraint> tiny = {
    TypeConstraint::one_of({Value::make_number(0.5), Value::make_number(1e-20)})};

  const auto solution = f.solve(tiny, {Value::make_number(0.5)});
  ASSERT_EQ(solution.status, SatStatus::Sat);
  ASSERT_EQ(solution.assignments.size(), 1U);
  EXPECT_EQ(solution.assignments[0].second, Value::make_number(1e-20));

  EXPECT_EQ(f.solve(tiny, {Value::make_number(0.5), Value::make_number(1e-20)}).status,
    SatStatus::Unsat);
}

TEST(Z3BackendTest, NegativeFractionsRoundTrip)
{
  Z3Fixture f;
  const auto solution = f.solve({TypeConstraint::one_of({Value::make_number(-0.1)})});
  ASSERT_EQ(solution.status, SatStatus::Sat);
  EXPECT_EQ(solution.assignments[0].second, Value::make_number(-0.1));
}

TEST(Z3BackendTest, SolverFacadeProducesDistinctValues)
{
  ConstraintSolver solver(std::make_unique<Z3Backend>());
  solver.init();

  SolverOptions options;
  options.max_solutions = 3;
  const auto result = solver.solve_for_satisfying_values(
    TypeNode::primitive("number"), {TypeConstraint::range(0, 10)}, options);

  ASSERT_EQ(result.status, SolveStatus::Success);
  ASSERT_EQ(result.values.size(), 3U);
  for (std::size_t i = 0; i < result.values.size(); ++i) {
    EXPECT_GE(result.values[i].as_number(), 0.0);
    EXPECT_LE(result.values[i].as_number(), 10.0);
    for (std::size_t j = i + 1; j < result.values.size(); ++j) {
      EXPECT_NE(result.values[i], result.values[j]);
    }
  }
}

TEST(Z3BackendTest, SolverFacadeReportsUnsatisfiable)
{
  ConstraintSolver solver(std::make_unique<Z3Backend>());
  solver.init();
  const auto result =
    solver.solve_for_satisfying_values(std::nullopt, {TypeConstraint::range(10, 0)});
  EXPECT_EQ(result.status, SolveStatus::Unsatisfiable);
}
