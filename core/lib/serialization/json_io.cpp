// nstg/serialization/json_io.cpp - JSON input/output implementation
//
#include "nstg/serialization/json_io.hpp"

#include <fmt/chrono.h>
#include <fmt/core.h>

#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <string_view>

#include "nstg/space/special_values.hpp"
#include "nstg/types/type_utils.hpp"

namespace nstg
{
namespace
{

using nlohmann::json;

constexpr const char * k_number_wrapper = "$number";

// ============================================================================
// Helper functions
// ============================================================================

const json & require(const json & j, const char * key, std::string_view context)
{
  if (!j.is_object() || !j.contains(key)) {
    throw JsonFormatError(fmt::format("{}: missing '{}'", context, key));
  }
  return j.at(key);
}

std::string require_string(const json & j, const char * key, std::string_view context)
{
  const json & v = require(j, key, context);
  if (!v.is_string()) throw JsonFormatError(fmt::format("{}: '{}' must be a string", context, key));
  return v.get<std::string>();
}

/// Number that may be wrapped ({"$number": "Infinity"})
double number_from_json(const json & j, std::string_view context)
{
  const Value v = value_from_json(j);
  if (!v.is_number()) throw JsonFormatError(fmt::format("{}: expected a number", context));
  return v.as_number();
}

std::optional<uint64_t> count_from_json(const json & j, std::string_view context)
{
  if (j.is_null()) return std::nullopt;
  if (j.is_number_unsigned()) return j.get<uint64_t>();
  if (j.is_number_integer() && j.get<int64_t>() >= 0) return static_cast<uint64_t>(j.get<int64_t>());

  const double d = number_from_json(j, context);
  if (std::isinf(d) && d > 0) return std::nullopt;
  if (!std::isfinite(d) || d < 0 || std::floor(d) != d) {
    throw JsonFormatError(fmt::format("{}: expected a non-negative integer", context));
  }
  return static_cast<uint64_t>(d);
}

TypeKind type_kind_from_string(const std::string & text)
{
  static constexpr std::array<TypeKind, 12> k_kinds = {
    TypeKind::Primitive, TypeKind::Literal, TypeKind::Union,   TypeKind::Intersection,
    TypeKind::Array,     TypeKind::Tuple,   TypeKind::Object,  TypeKind::Function,
    TypeKind::Generic,   TypeKind::Unknown, TypeKind::Any,     TypeKind::Never};

  for (const TypeKind kind : k_kinds) {
    if (text == to_string(kind)) return kind;
  }
  throw JsonFormatError(fmt::format("type: unknown kind '{}'", text));
}

json values_to_json(const std::vector<Value> & values)
{
  json arr = json::array();
  for (const auto & v : values) arr.push_back(to_json(v));
  return arr;
}

json cardinality_to_json(const Cardinality & c)
{
  if (c.is_infinite()) return "infinite";
  return c.count();
}

std::string iso_timestamp(std::chrono::system_clock::time_point tp)
{
  const auto millis =
    std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
  return fmt::format(
    "{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", fmt::gmtime(std::chrono::system_clock::to_time_t(tp)),
    static_cast<int>(millis));
}

std::string read_file(const std::filesystem::path & path, std::string & error)
{
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "failed to open file: " + path.string();
    return {};
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

json region_to_json(const TypeSpaceRegion & region)
{
  json j{
    {"id", region.id},
    {"kind", to_string(region.kind)},
    {"type", type_to_string(region.type)},
    {"cardinality", cardinality_to_json(region.cardinality)},
    {"description", region.description}};
  if (!region.constraints.empty()) {
    json constraints = json::array();
    for (const auto & c : region.constraints) constraints.push_back(to_json(c));
    j["constraints"] = constraints;
  }
  return j;
}

}  // namespace

// ============================================================================
// Values
// ============================================================================

json to_json(const Value & value)
{
  switch (value.kind()) {
    case ValueKind::Null:
      return nullptr;
    case ValueKind::Boolean:
      return value.as_bool();
    case ValueKind::String:
      return value.as_string();
    case ValueKind::Number: {
      const double d = value.as_number();
      if (value.is_nan() || std::isinf(d) || value.is_negative_zero()) {
        return json{{k_number_wrapper, format_number(d)}};
      }
      if (value.is_integral() && std::fabs(d) <= k_max_safe_integer) {
        return static_cast<int64_t>(d);
      }
      return d;
    }
    case ValueKind::Array:
      return values_to_json(value.as_array());
    case ValueKind::Object: {
      json obj = json::object();
      for (const auto & [key, member] : value.as_object()) obj[key] = to_json(member);
      return obj;
    }
  }
  return nullptr;
}

Value value_from_json(const json & j)
{
  switch (j.type()) {
    case json::value_t::null:
      return Value::make_null();
    case json::value_t::boolean:
      return Value::make_bool(j.get<bool>());
    case json::value_t::number_integer:
    case json::value_t::number_unsigned:
    case json::value_t::number_float:
      return Value::make_number(j.get<double>());
    case json::value_t::string:
      return Value::make_string(j.get<std::string>());
    case json::value_t::array: {
      std::vector<Value> elements;
      elements.reserve(j.size());
      for (const auto & e : j) elements.push_back(value_from_json(e));
      return Value::make_array(std::move(elements));
    }
    case json::value_t::object: {
      if (j.size() == 1 && j.contains(k_number_wrapper)) {
        const json & wrapped = j.at(k_number_wrapper);
        if (!wrapped.is_string()) throw JsonFormatError("$number must wrap a string");
        const auto text = wrapped.get<std::string>();
        if (text == "NaN") return Value::make_number(std::numeric_limits<double>::quiet_NaN());
        if (text == "Infinity") return Value::make_number(std::numeric_limits<double>::infinity());
        if (text == "-Infinity") {
          return Value::make_number(-std::numeric_limits<double>::infinity());
        }
        if (text == "-0") return Value::make_number(-0.0);
        throw JsonFormatError(fmt::format("$number: unsupported value '{}'", text));
      }
      std::vector<Value::Member> members;
      for (const auto & [key, member] : j.items()) {
        members.emplace_back(key, value_from_json(member));
      }
      return Value::make_object(std::move(members));
    }
    default:
      break;
  }
  throw JsonFormatError("unsupported JSON value");
}

// ============================================================================
// Constraints / Types
// ============================================================================

json to_json(const TypeConstraint & constraint)
{
  json j{{"type", to_string(constraint.kind)}};
  switch (constraint.kind) {
    case ConstraintKind::Range:
      j["min"] = to_json(Value::make_number(constraint.min));
      j["max"] = to_json(Value::make_number(constraint.max));
      break;
    case ConstraintKind::Length:
      j["min"] = constraint.min_length;
      j["max"] = constraint.max_length ? json(*constraint.max_length) : json(nullptr);
      break;
    case ConstraintKind::Pattern:
      j["pattern"] = constraint.pattern;
      break;
    case ConstraintKind::Enum:
      j["values"] = values_to_json(constraint.values);
      break;
  }
  if (!constraint.description.empty()) j["description"] = constraint.description;
  return j;
}

TypeConstraint constraint_from_json(const json & j)
{
  const std::string type = require_string(j, "type", "constraint");
  TypeConstraint c;

  if (type == "range") {
    const double min = j.contains("min") ? number_from_json(j.at("min"), "range.min")
                                         : -std::numeric_limits<double>::infinity();
    const double max = j.contains("max") ? number_from_json(j.at("max"), "range.max")
                                         : std::numeric_limits<double>::infinity();
    c = TypeConstraint::range(min, max);
  } else if (type == "length") {
    const uint64_t min =
      j.contains("min") ? count_from_json(j.at("min"), "length.min").value_or(0) : 0;
    const std::optional<uint64_t> max =
      j.contains("max") ? count_from_json(j.at("max"), "length.max") : std::nullopt;
    c = TypeConstraint::length(min, max);
  } else if (type == "pattern") {
    c = TypeConstraint::regex(require_string(j, "pattern", "pattern constraint"));
  } else if (type == "enum") {
    const json & values = require(j, "values", "enum constraint");
    if (!values.is_array()) throw JsonFormatError("enum constraint: 'values' must be an array");
    std::vector<Value> parsed;
    for (const auto & v : values) parsed.push_back(value_from_json(v));
    c = TypeConstraint::one_of(std::move(parsed));
  } else {
    throw JsonFormatError(fmt::format("constraint: unknown type '{}'", type));
  }

  if (j.contains("description") && j.at("description").is_string()) {
    c.description = j.at("description").get<std::string>();
  }
  return c;
}

json to_json(const TypeNode & type)
{
  json j{{"kind", to_string(type.kind)}};
  if (type.name) j["name"] = *type.name;
  if (type.label) j["label"] = *type.label;
  if (!type.children.empty()) {
    json children = json::array();
    for (const auto & child : type.children) children.push_back(to_json(child));
    j["children"] = children;
  }
  if (!type.constraints.empty()) {
    json constraints = json::array();
    for (const auto & c : type.constraints) constraints.push_back(to_json(c));
    j["constraints"] = constraints;
  }
  return j;
}

TypeNode type_from_json(const json & j)
{
  if (j.is_string()) return TypeNode::primitive(j.get<std::string>());
  if (!j.is_object()) throw JsonFormatError("type: expected an object or a primitive name");

  TypeNode type;
  type.kind = type_kind_from_string(require_string(j, "kind", "type"));

  if (j.contains("name")) {
    const json & name = j.at("name");
    // Literal names may be given as JSON values (42, true) instead of source text
    type.name = name.is_string() ? name.get<std::string>() : name.dump();
  }
  if (j.contains("label") && j.at("label").is_string()) {
    type.label = j.at("label").get<std::string>();
  }

  if (j.contains("children")) {
    const json & children = j.at("children");
    if (!children.is_array()) throw JsonFormatError("type: 'children' must be an array");
    for (const auto & child : children) type.children.push_back(type_from_json(child));
  }
  if (j.contains("constraints")) {
    const json & constraints = j.at("constraints");
    if (!constraints.is_array()) throw JsonFormatError("type: 'constraints' must be an array");
    for (const auto & c : constraints) type.constraints.push_back(constraint_from_json(c));
  }

  if (type.kind == TypeKind::Primitive && !type.name) {
    throw JsonFormatError("type: primitive types need a 'name'");
  }
  return type;
}

json to_json(const FunctionSignature & signature)
{
  json params = json::array();
  for (const auto & p : signature.parameters) {
    json param{{"name", p.name}};
    if (p.type) param["type"] = to_json(*p.type);
    if (p.optional) param["optional"] = true;
    if (p.default_value) param["default"] = to_json(*p.default_value);
    params.push_back(param);
  }

  json j{
    {"name", signature.name},
    {"parameters", params},
    {"returnType", to_json(signature.return_type)}};
  if (signature.source_file) j["sourceFile"] = *signature.source_file;
  if (signature.start_line) j["startLine"] = *signature.start_line;
  if (signature.end_line) j["endLine"] = *signature.end_line;
  return j;
}

FunctionSignature signature_from_json(const json & j)
{
  FunctionSignature sig;
  sig.name = require_string(j, "name", "signature");

  if (j.contains("parameters")) {
    const json & params = j.at("parameters");
    if (!params.is_array()) throw JsonFormatError("signature: 'parameters' must be an array");
    for (const auto & p : params) {
      FunctionParameter param;
      param.name = require_string(p, "name", "parameter");
      if (p.contains("type") && !p.at("type").is_null()) param.type = type_from_json(p.at("type"));
      if (p.contains("optional")) param.optional = p.at("optional").get<bool>();
      if (p.contains("default")) param.default_value = value_from_json(p.at("default"));
      sig.parameters.push_back(std::move(param));
    }
  }

  if (j.contains("returnType")) sig.return_type = type_from_json(j.at("returnType"));
  if (j.contains("sourceFile")) sig.source_file = j.at("sourceFile").get<std::string>();
  if (j.contains("startLine")) sig.start_line = j.at("startLine").get<uint32_t>();
  if (j.contains("endLine")) sig.end_line = j.at("endLine").get<uint32_t>();
  return sig;
}

// ============================================================================
// Documents
// ============================================================================

SignatureLoadResult parse_signature(const std::string & text)
{
  try {
    return SignatureLoadResult::ok(signature_from_json(json::parse(text)));
  } catch (const json::exception & e) {
    return SignatureLoadResult::fail("invalid signature JSON: " + std::string(e.what()));
  } catch (const JsonFormatError & e) {
    return SignatureLoadResult::fail("invalid signature: " + std::string(e.what()));
  }
}

SignatureLoadResult load_signature(const std::filesystem::path & path)
{
  std::string error;
  const std::string text = read_file(path, error);
  if (!error.empty()) return SignatureLoadResult::fail(error);
  return parse_signature(text);
}

ExecutionsLoadResult parse_executions(const std::string & text)
{
  try {
    const json doc = json::parse(text);
    if (!doc.is_array()) return ExecutionsLoadResult::fail("executions must be a JSON array");

    std::vector<CoverageTracker::Observed> observed;
    for (const auto & entry : doc) {
      const json & args = require(entry, "args", "execution");
      if (!args.is_array()) throw JsonFormatError("execution: 'args' must be an array");

      CoverageTracker::Observed item;
      for (const auto & a : args) item.args.push_back(value_from_json(a));

      const json threw = entry.value("threw", json(false));
      if (threw.is_string()) {
        item.output = TestOutput::thrown(threw.get<std::string>());
      } else if (threw.is_boolean() && threw.get<bool>()) {
        const json out = entry.value("output", json("error"));
        item.output = TestOutput::thrown(out.is_string() ? out.get<std::string>() : out.dump());
      } else {
        item.output = TestOutput::returned(
          entry.contains("output") ? value_from_json(entry.at("output")) : Value::make_null());
      }

      if (entry.contains("durationMs")) {
        item.output.duration_ms = entry.at("durationMs").get<double>();
      }
      observed.push_back(std::move(item));
    }
    return ExecutionsLoadResult::ok(std::move(observed));
  } catch (const json::exception & e) {
    return ExecutionsLoadResult::fail("invalid executions JSON: " + std::string(e.what()));
  } catch (const JsonFormatError & e) {
    return ExecutionsLoadResult::fail("invalid executions: " + std::string(e.what()));
  }
}

ExecutionsLoadResult load_executions(const std::filesystem::path & path)
{
  std::string error;
  const std::string text = read_file(path, error);
  if (!error.empty()) return ExecutionsLoadResult::fail(error);
  return parse_executions(text);
}

// ============================================================================
// Output
// ============================================================================

json to_json(const TestCase & test)
{
  json metadata{
    {"generated", iso_timestamp(test.metadata.generated)},
    {"boundaryPoint", test.metadata.boundary_point}};
  if (test.metadata.explanation) metadata["explanation"] = *test.metadata.explanation;

  return json{
    {"id", test.id},
    {"description", test.description},
    {"functionName", test.function_name},
    {"inputs", values_to_json(test.inputs)},
    {"expectedBehavior", to_string(test.expected_behavior)},
    {"expectedValue", to_json(test.expected_value)},
    {"priority", test.priority},
    {"source", to_string(test.source)},
    {"region", {{"id", test.region.id}, {"type", test.region.type}, {"reason", test.region.reason}}},
    {"metadata", metadata}};
}

json to_json(const std::vector<TestCase> & tests)
{
  json arr = json::array();
  for (const auto & t : tests) arr.push_back(to_json(t));
  return arr;
}

json to_json(const TestGenerationStats & stats)
{
  json by_region = json::object();
  for (const auto & [id, count] : stats.tests_by_region) by_region[id] = count;

  return json{
    {"totalTests", stats.total_tests},
    {"testsByPriority",
     {{"high", stats.high_priority}, {"medium", stats.medium_priority}, {"low", stats.low_priority}}},
    {"testsByRegion", by_region},
    {"testsByBehavior",
     {{"shouldReturn", stats.should_return},
      {"shouldThrow", stats.should_throw},
      {"shouldSatisfy", stats.should_satisfy}}},
    {"averagePriority", stats.average_priority}};
}

json to_json(const NegativeSpaceRegion & gap)
{
  json j = region_to_json(gap.region);
  j["priority"] = gap.priority;
  j["reason"] = gap.reason;
  return j;
}

json to_json(const AnalysisResult & result)
{
  json coverage{
    {"totalInputs", result.coverage.total_inputs},
    {"regionsCovered", result.coverage.regions_covered},
    {"totalRegions", result.coverage.total_regions},
    {"coveragePercentage",
     result.coverage.coverage_percentage ? json(*result.coverage.coverage_percentage)
                                         : json(nullptr)}};

  json gaps = json::array();
  for (const auto & gap : result.gaps.prioritized_gaps) gaps.push_back(to_json(gap));

  const auto & gs = result.gaps.statistics;
  json gap_stats{
    {"totalGaps", gs.total_gaps},
    {"boundaryGapCount", gs.boundary_gap_count},
    {"interiorGapCount", gs.interior_gap_count},
    {"totalGapCardinality", cardinality_to_json(gs.total_gap_cardinality)},
    {"averagePriority", gs.average_priority}};
  if (gs.highest_priority_gap) gap_stats["highestPriorityGap"] = gs.highest_priority_gap->id();

  json diagnostics = json::array();
  for (const auto & d : result.diagnostics) {
    diagnostics.push_back(json{
      {"severity", to_string(d.severity)},
      {"code", d.code},
      {"subject", d.subject},
      {"message", d.message}});
  }

  return json{
    {"success", result.success},
    {"coverage", coverage},
    {"gaps", gaps},
    {"gapStatistics", gap_stats},
    {"testStatistics", to_json(result.test_stats)},
    {"testCases", to_json(result.test_cases)},
    {"diagnostics", diagnostics}};
}

}  // namespace nstg
