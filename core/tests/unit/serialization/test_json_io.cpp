// tests/serialization/test_json_io.cpp - Unit tests for JSON input/output
//
#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "nstg/driver/analyzer.hpp"
#include "nstg/serialization/json_io.hpp"

using json = nlohmann::json;
using namespace nstg;

// ============================================================================
// Values
// ============================================================================

TEST(JsonIoTest, SpecialNumbersAreWrapped)
{
  EXPECT_EQ(to_json(Value::make_number(std::nan(""))), json::parse(R"({"$number": "NaN"})"));
  EXPECT_EQ(
    to_json(Value::make_number(-std::numeric_limits<double>::infinity())),
    json::parse(R"({"$number": "-Infinity"})"));
  EXPECT_EQ(to_json(Value::make_number(-0.0)), json::parse(R"({"$number": "-0"})"));

  EXPECT_TRUE(value_from_json(json::parse(R"({"$number": "NaN"})")).is_nan());
  EXPECT_TRUE(value_from_json(json::parse(R"({"$number": "-0"})")).is_negative_zero());
  EXPECT_THROW((void)value_from_json(json::parse(R"({"$number": "huge"})")), JsonFormatError);
}

TEST(JsonIoTest, PlainValues)
{
  EXPECT_EQ(to_json(Value::make_number(42)), json(42));
  EXPECT_TRUE(to_json(Value::make_number(42)).is_number_integer());
  EXPECT_EQ(to_json(Value::make_number(0.25)), json(0.25));
  EXPECT_EQ(to_json(Value::make_string("hi")), json("hi"));
  EXPECT_TRUE(to_json(Value::make_null()).is_null());

  const Value obj = value_from_json(json::parse(R"({"a": [1, true, null], "b": "x"})"));
  ASSERT_TRUE(obj.is_object());
  const Value * a = obj.find_member("a");
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(
    *a, Value::make_array({Value::make_number(1), Value::make_bool(true), Value::make_null()}));
}

// ============================================================================
// Signatures
// ============================================================================

TEST(JsonIoTest, ParseSignature)
{
  const auto result = parse_signature(R"({
    "name": "clamp",
    "parameters": [
      {"name": "x", "type": {"kind": "primitive", "name": "number",
                             "constraints": [{"type": "range", "min": 0, "max": {"$number": "Infinity"}}]}},
      {"name": "mode", "type": {"kind": "union", "children": [
        {"kind": "literal", "name": "\"fast\""},
        {"kind": "literal", "name": 3}
      ]}, "optional": true},
      {"name": "label", "type": "string"},
      {"name": "extra"}
    ],
    "returnType": "number",
    "sourceFile": "src/clamp.ts",
    "startLine": 3
  })");
  ASSERT_TRUE(result.success) << result.error;

  const FunctionSignature & sig = result.signature;
  EXPECT_EQ(sig.name, "clamp");
  ASSERT_EQ(sig.parameters.size(), 4U);

  const TypeNode & x = *sig.parameters[0].type;
  ASSERT_EQ(x.constraints.size(), 1U);
  EXPECT_DOUBLE_EQ(x.constraints[0].min, 0.0);
  EXPECT_TRUE(std::isinf(x.constraints[0].max));

  const TypeNode & mode = *sig.parameters[1].type;
  EXPECT_TRUE(sig.parameters[1].optional);
  ASSERT_EQ(mode.children.size(), 2U);
  EXPECT_EQ(mode.children[1].name, "3");

  EXPECT_TRUE(sig.parameters[2].type->is_primitive("string"));
  EXPECT_FALSE(sig.parameters[3].type.has_value());
  EXPECT_EQ(sig.source_file, "src/clamp.ts");
  EXPECT_EQ(sig.start_line, 3U);
}

TEST(JsonIoTest, SignatureErrors)
{
  EXPECT_FALSE(parse_signature("{").success);
  EXPECT_FALSE(parse_signature(R"({"parameters": []})").success);

  const auto bad_kind = parse_signature(
    R"({"name": "f", "parameters": [{"name": "x", "type": {"kind": "mystery"}}]})");
  EXPECT_FALSE(bad_kind.success);
  EXPECT_NE(bad_kind.error.find("mystery"), std::string::npos);

  EXPECT_FALSE(load_signature("/nonexistent/signature.json").success);
}

TEST(JsonIoTest, ConstraintShapes)
{
  const auto length = constraint_from_json(json::parse(R"({"type": "length", "min": 1})"));
  EXPECT_EQ(length.kind, ConstraintKind::Length);
  EXPECT_EQ(length.min_length, 1U);
  EXPECT_FALSE(length.max_length.has_value());

  const auto pattern = constraint_from_json(
    json::parse(R"({"type": "pattern", "pattern": "^a", "description": "starts with a"})"));
  EXPECT_EQ(pattern.pattern, "^a");
  EXPECT_EQ(pattern.description, "starts with a");

  const auto enumeration =
    constraint_from_json(json::parse(R"({"type": "enum", "values": ["a", "b"]})"));
  EXPECT_EQ(enumeration.values.size(), 2U);

  EXPECT_THROW(
    (void)constraint_from_json(json::parse(R"({"type": "length", "min": -2})")), JsonFormatError);
  EXPECT_EQ(to_json(TypeConstraint::length(1, std::nullopt))["max"], json(nullptr));
}

TEST(JsonIoTest, SignatureWritesBackReadably)
{
  FunctionSignature sig;
  sig.name = "f";
  FunctionParameter p;
  p.name = "x";
  p.type = TypeNode::primitive("number", {TypeConstraint::range(0, 10)});
  sig.parameters.push_back(p);

  const auto reparsed = parse_signature(to_json(sig).dump());
  ASSERT_TRUE(reparsed.success) << reparsed.error;
  ASSERT_EQ(reparsed.signature.parameters.size(), 1U);
  EXPECT_TRUE(reparsed.signature.parameters[0].type->has_constraint(ConstraintKind::Range));
}

// ============================================================================
// Executions
// ============================================================================

TEST(JsonIoTest, ParseExecutions)
{
  const auto result = parse_executions(R"([
    {"args": [5], "output": 10, "durationMs": 0.5},
    {"args": [{"$number": "NaN"}], "threw": "not a number"},
    {"args": [-1], "threw": true},
    {"args": []}
  ])");
  ASSERT_TRUE(result.success) << result.error;
  ASSERT_EQ(result.executions.size(), 4U);

  EXPECT_EQ(result.executions[0].output.value, Value::make_number(10));
  EXPECT_EQ(result.executions[0].output.duration_ms, 0.5);
  EXPECT_TRUE(result.executions[1].args[0].is_nan());
  EXPECT_EQ(result.executions[1].output.error, "not a number");
  EXPECT_TRUE(result.executions[2].output.threw());
  EXPECT_FALSE(result.executions[3].output.threw());
}

TEST(JsonIoTest, ExecutionErrors)
{
  EXPECT_FALSE(parse_executions(R"({"args": []})").success);
  EXPECT_FALSE(parse_executions(R"([{"output": 1}])").success);
  EXPECT_FALSE(parse_executions(R"([{"args": 5}])").success);
}

// ============================================================================
// Output
// ============================================================================

TEST(JsonIoTest, TestCaseOutput)
{
  TestCase test;
  test.id = "test-1";
  test.description = "should handle f(0)";
  test.function_name = "f";
  test.inputs = {Value::make_number(-0.0)};
  test.expected_behavior = ExpectedBehavior::ShouldThrow;
  test.priority = 0.9;
  test.region = TestCaseRegion{"number-special", "number", "contains special values"};
  test.metadata.explanation = "-0 - negative zero (distinct from +0)";

  const json j = to_json(test);
  EXPECT_EQ(j["id"], "test-1");
  EXPECT_EQ(j["functionName"], "f");
  EXPECT_EQ(j["inputs"][0], json::parse(R"({"$number": "-0"})"));
  EXPECT_EQ(j["expectedBehavior"], "should-throw");
  EXPECT_EQ(j["source"], "boundary");
  EXPECT_EQ(j["region"]["id"], "number-special");
  EXPECT_EQ(j["metadata"]["explanation"], "-0 - negative zero (distinct from +0)");
  EXPECT_TRUE(j["metadata"]["boundaryPoint"].get<bool>());
  EXPECT_TRUE(j["metadata"]["generated"].is_string());
}

TEST(JsonIoTest, AnalysisReport)
{
  FunctionSignature sig;
  sig.name = "toggle";
  FunctionParameter p;
  p.name = "on";
  p.type = TypeNode::primitive("boolean");
  sig.parameters.push_back(p);

  AnalysisConfig config;
  config.smt_solver_enabled = false;
  Analyzer analyzer(config);
  const AnalysisResult result = analyzer.analyze(sig);

  const json report = to_json(result);
  EXPECT_TRUE(report["success"].get<bool>());
  EXPECT_EQ(report["coverage"]["totalRegions"], 2);
  EXPECT_EQ(report["gapStatistics"]["totalGaps"], 2);
  EXPECT_EQ(report["gapStatistics"]["totalGapCardinality"], 2);
  EXPECT_EQ(report["gaps"].size(), 2U);
  EXPECT_EQ(report["testCases"].size(), result.test_cases.size());
  EXPECT_EQ(report["testStatistics"]["totalTests"], result.test_cases.size());
  EXPECT_TRUE(report["diagnostics"].is_array());
}
