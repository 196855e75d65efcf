// tests/boundary/test_boundary_walker.cpp - Unit tests for boundary value walks
//
#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "nstg/boundary/boundary_walker.hpp"
#include "nstg/gaps/gap_engine.hpp"
#include "nstg/space/type_universe.hpp"

using namespace nstg;

namespace
{

NegativeSpaceRegion gap_for(const TypeNode & type, const std::string & id)
{
  for (const auto & r : TypeUniverse{}.calculate_universe(type)) {
    if (r.id == id) return GapEngine::make_gap(r);
  }
  ADD_FAILURE() << "no region " << id;
  return {};
}

bool contains(const std::vector<Value> & values, const Value & v)
{
  return std::find(values.begin(), values.end(), v) != values.end();
}

std::vector<Value> walked_values(const BoundaryWalkResult & result)
{
  std::vector<Value> values;
  for (const auto & input : result.test_inputs) {
    values.push_back(input.value);
  }
  return values;
}

BoundaryWalkOptions unlimited(int depth)
{
  BoundaryWalkOptions options;
  options.max_inputs = 1000;
  options.depth = depth;
  return options;
}

}  // namespace

// ============================================================================
// Value tables
// ============================================================================

TEST(BoundaryWalkerTest, RangeEdgesAreIncluded)
{
  const auto gap = gap_for(
    TypeNode::primitive("number", {TypeConstraint::range(0, 10)}), "number-range-0-10");
  const auto values = BoundaryWalker::canonical_values(gap.region, false);

  for (double x : {-1.0, 0.0, 1.0, 9.0, 10.0, 11.0}) {
    EXPECT_TRUE(contains(values, Value::make_number(x))) << x;
  }
  EXPECT_FALSE(contains(values, Value::make_number(std::nan(""))));
}

TEST(BoundaryWalkerTest, LengthEdgesAreMaterialized)
{
  const auto gap = gap_for(
    TypeNode::primitive("string", {TypeConstraint::length(2, 4)}), "string-length-2-4");
  const auto values = BoundaryWalker::canonical_values(gap.region, false);

  for (std::size_t n : {1U, 2U, 3U, 4U, 5U}) {
    EXPECT_TRUE(contains(values, Value::make_string(std::string(n, 'a')))) << n;
  }
}

TEST(BoundaryWalkerTest, SpecialValuesAreOptional)
{
  const auto gap = gap_for(TypeNode::primitive("number"), "number-zero");
  const Value nan = Value::make_number(std::nan(""));
  EXPECT_TRUE(contains(BoundaryWalker::canonical_values(gap.region, true), nan));
  EXPECT_FALSE(contains(BoundaryWalker::canonical_values(gap.region, false), nan));
}

TEST(BoundaryWalkerTest, OutsideValuesLeaveTheRegion)
{
  const auto gap = gap_for(TypeNode::primitive("string"), "string-single");
  const auto outside = BoundaryWalker::outside_values(gap.region);
  ASSERT_EQ(outside.size(), 2U);
  EXPECT_EQ(outside[0], Value::make_string(""));
  EXPECT_EQ(outside[1], Value::make_string("aa"));
}

TEST(BoundaryWalkerTest, ExplanationTable)
{
  EXPECT_EQ(
    BoundaryWalker::explain_value(Value::make_number(-0.0), "r"),
    "-0 - negative zero (distinct from +0)");
  EXPECT_EQ(
    BoundaryWalker::explain_value(Value::make_string(""), "r"),
    "empty string - minimal string value");
  EXPECT_EQ(
    BoundaryWalker::explain_value(Value::make_number(42), "number-positive"),
    "boundary value 42 in region number-positive");
}

// ============================================================================
// Walks
// ============================================================================

TEST(BoundaryWalkerTest, MaxInputsIsRespected)
{
  const BoundaryWalker walker;
  const auto gap = gap_for(TypeNode::primitive("string"), "string-short");

  for (std::size_t limit : {0U, 1U, 3U, 7U}) {
    BoundaryWalkOptions options;
    options.max_inputs = limit;
    options.depth = 3;
    const auto result = walker.walk_boundary(gap, options);
    EXPECT_LE(result.test_inputs.size(), limit);
    EXPECT_EQ(result.explanations.size(), result.test_inputs.size());
    EXPECT_EQ(result.boundary_point_count, result.test_inputs.size());
  }
}

TEST(BoundaryWalkerTest, DeeperWalksExtendShallowOnes)
{
  const BoundaryWalker walker;
  for (const auto & gap : {gap_for(TypeNode::primitive("number"), "number-positive"),
                           gap_for(TypeNode::primitive("string"), "string-medium"),
                           gap_for(TypeNode::primitive("boolean"), "boolean-true")}) {
    const auto shallow = walked_values(walker.walk_boundary(gap, unlimited(1)));
    const auto deep = walked_values(walker.walk_boundary(gap, unlimited(3)));

    EXPECT_GE(deep.size(), shallow.size()) << gap.id();
    for (const auto & v : shallow) {
      EXPECT_TRUE(contains(deep, v)) << gap.id() << ": " << v.to_display_string();
    }
  }
}

TEST(BoundaryWalkerTest, OutputIsDeduplicated)
{
  const BoundaryWalker walker;
  const auto gap = gap_for(TypeNode::primitive("number"), "number-zero");
  const auto values = walked_values(walker.walk_boundary(gap, unlimited(3)));

  for (std::size_t i = 0; i < values.size(); ++i) {
    for (std::size_t j = i + 1; j < values.size(); ++j) {
      EXPECT_NE(values[i], values[j]) << values[i].to_display_string();
    }
  }
  // Signed zeros are distinct values
  EXPECT_TRUE(contains(values, Value::make_number(0.0)));
  EXPECT_TRUE(contains(values, Value::make_number(-0.0)));
}

TEST(BoundaryWalkerTest, DepthIsClamped)
{
  const BoundaryWalker walker;
  const auto gap = gap_for(TypeNode::primitive("number"), "number-zero");
  EXPECT_EQ(
    walker.walk_boundary(gap, unlimited(0)).test_inputs.size(),
    walker.walk_boundary(gap, unlimited(1)).test_inputs.size());
  EXPECT_EQ(
    walker.walk_boundary(gap, unlimited(9)).test_inputs.size(),
    walker.walk_boundary(gap, unlimited(3)).test_inputs.size());
}

TEST(BoundaryWalkerTest, InputsCarryParameterNames)
{
  const BoundaryWalker walker;
  const auto gap = gap_for(TypeNode::primitive("boolean"), "boolean-true");

  BoundaryWalkOptions options = unlimited(1);
  options.parameter_names = {"flag"};
  const auto result = walker.walk_boundary(gap, options);
  ASSERT_EQ(result.test_inputs.size(), 2U);
  EXPECT_EQ(result.test_inputs[0].parameter_name, "flag");
  EXPECT_EQ(result.test_inputs[0].region_id, "boolean-true");
  EXPECT_EQ(result.test_inputs[0].args, std::vector<Value>{Value::make_bool(true)});
  EXPECT_EQ(result.explanations[0], "boolean true - discrete value");

  const auto unnamed = walker.walk_boundary(gap, unlimited(1));
  EXPECT_EQ(unnamed.test_inputs[0].parameter_name, "arg0");
}

TEST(BoundaryWalkerTest, VoidInputCallsWithoutArguments)
{
  FunctionSignature sig;
  sig.name = "now";
  const auto universe = TypeUniverse{}.calculate_signature_universe(sig);
  const auto result = BoundaryWalker{}.walk_boundary(GapEngine::make_gap(universe.front()));

  ASSERT_EQ(result.test_inputs.size(), 1U);
  EXPECT_TRUE(result.test_inputs[0].args.empty());
  EXPECT_EQ(result.explanations[0], "call without arguments");
}

TEST(BoundaryWalkerTest, CompoundVariesOnePositionAtATime)
{
  const auto product = TypeUniverse::cartesian_product(
    {"x", "flag"}, {TypeUniverse{}.calculate_universe(TypeNode::primitive("number")),
                    TypeUniverse{}.calculate_universe(TypeNode::primitive("boolean"))});
  const std::string id = std::string("number-zero") + k_compound_separator + "boolean-true";
  const auto it = std::find_if(product.begin(), product.end(), [&id](const auto & r) {
    return r.id == id;
  });
  ASSERT_NE(it, product.end());

  BoundaryWalkOptions options = unlimited(1);
  options.include_special_values = false;
  options.parameter_names = {"x", "flag"};
  const auto result = BoundaryWalker{}.walk_boundary(GapEngine::make_gap(*it), options);

  // nine distinct number edges plus the one new boolean
  ASSERT_EQ(result.test_inputs.size(), 10U);
  for (const auto & input : result.test_inputs) {
    ASSERT_EQ(input.args.size(), 2U);
    EXPECT_EQ(input.region_id, id);
  }
  EXPECT_EQ(result.test_inputs.back().parameter_name, "flag");
  EXPECT_EQ(
    result.test_inputs.back().args,
    (std::vector<Value>{Value::make_number(0), Value::make_bool(false)}));
  EXPECT_EQ(result.explanations.back(), "flag = false (boolean false - discrete value)");
}

TEST(BoundaryWalkerTest, CompoundHonorsDepth)
{
  const auto product = TypeUniverse::cartesian_product(
    {"x", "flag"}, {TypeUniverse{}.calculate_universe(TypeNode::primitive("number")),
                    TypeUniverse{}.calculate_universe(TypeNode::primitive("boolean"))});
  const std::string id = std::string("number-zero") + k_compound_separator + "boolean-true";
  const auto it = std::find_if(product.begin(), product.end(), [&id](const auto & r) {
    return r.id == id;
  });
  ASSERT_NE(it, product.end());
  const NegativeSpaceRegion gap = GapEngine::make_gap(*it);

  const auto walk = [&gap](int depth) {
    BoundaryWalkOptions options = unlimited(depth);
    options.include_special_values = false;
    options.parameter_names = {"x", "flag"};
    return BoundaryWalker{}.walk_boundary(gap, options);
  };
  const auto shallow = walk(1);
  const auto outside = walk(2);
  const auto deep = walk(3);

  // Depth 2 adds -0, the only value just outside number-zero not already walked
  ASSERT_EQ(outside.test_inputs.size(), shallow.test_inputs.size() + 1);
  EXPECT_EQ(
    outside.test_inputs.back().args,
    (std::vector<Value>{Value::make_number(-0.0), Value::make_bool(true)}));
  EXPECT_NE(outside.explanations.back().find("negative zero"), std::string::npos);

  EXPECT_GT(deep.test_inputs.size(), outside.test_inputs.size());

  // Shallower walks are prefixes of deeper ones
  for (std::size_t i = 0; i < shallow.test_inputs.size(); ++i) {
    EXPECT_EQ(shallow.test_inputs[i].args, deep.test_inputs[i].args);
  }
  for (std::size_t i = 0; i < outside.test_inputs.size(); ++i) {
    EXPECT_EQ(outside.test_inputs[i].args, deep.test_inputs[i].args);
  }
}

TEST(BoundaryWalkerTest, UnboundedLengthCeilingDoesNotWrap)
{
  TypeSpaceRegion region;
  region.id = "string-length-3-max";
  region.kind = RegionKind::StringLength;
  region.type = TypeNode::primitive("string");
  region.payload.min_length = 3;
  region.payload.max_length = std::numeric_limits<uint64_t>::max();

  TypeSpaceRegion unbounded = region;
  unbounded.payload.max_length.reset();

  const auto empties = [](const std::vector<Value> & values) {
    return std::count_if(values.begin(), values.end(), [](const Value & v) {
      return v.is_string() && v.as_string().empty();
    });
  };
  // max + 1 must not wrap around to the empty string
  EXPECT_EQ(
    empties(BoundaryWalker::canonical_values(region, false)),
    empties(BoundaryWalker::canonical_values(unbounded, false)));
}

TEST(BoundaryWalkerTest, WalkBetweenRegions)
{
  const auto numbers = gap_for(TypeNode::primitive("number"), "number-zero");
  const auto strings = gap_for(TypeNode::primitive("string"), "string-empty");

  const auto result = BoundaryWalker{}.walk_between_regions(numbers, strings);
  EXPECT_EQ(result.regions_explored, (std::vector<std::string>{"number-zero", "string-empty"}));
  EXPECT_EQ(result.test_inputs.size(), 15U);
  EXPECT_EQ(result.explanations[0], "boundary between number-zero and string-empty: 0");
}

TEST(BoundaryWalkerTest, GenerateAllBoundaries)
{
  const BoundaryWalker walker;
  const auto values = walker.generate_all_boundaries(
    TypeNode::union_of({TypeNode::primitive("boolean"), TypeNode::literal("42")}));
  ASSERT_EQ(values.size(), 3U);
  EXPECT_TRUE(contains(values, Value::make_number(42)));

  const auto numbers = walker.generate_all_boundaries(TypeNode::primitive("number"));
  EXPECT_TRUE(contains(numbers, Value::make_number(-0.0)));
  EXPECT_TRUE(walker.generate_all_boundaries(TypeNode::never()).empty());
}
