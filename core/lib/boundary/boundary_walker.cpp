// nstg/boundary/boundary_walker.cpp - Boundary value generation
//
#include "nstg/boundary/boundary_walker.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>

#include "nstg/space/special_values.hpp"
#include "nstg/types/type_utils.hpp"

namespace nstg
{

namespace
{

/// Longest string edge value that is still materialized
constexpr uint64_t k_max_materialized_length = 10001;

/// Cap on depth-3 combination values per region
constexpr std::size_t k_max_combinations = 12;

enum class Stage : uint8_t {
  Boundary,
  Outside,
  Combination,
};

struct Candidate
{
  Value value;
  Stage stage;
};

std::optional<std::string> table_explanation(const Value & value)
{
  if (value.is_number()) {
    const double x = value.as_number();
    if (value.is_nan()) return "NaN - special value that breaks arithmetic operations";
    if (std::isinf(x)) {
      return x > 0 ? "Infinity - upper bound of number space"
                   : "-Infinity - lower bound of number space";
    }
    if (value.is_negative_zero()) return "-0 - negative zero (distinct from +0)";
    if (x == 0.0) return "0 - boundary between positive and negative";
    if (x == k_max_safe_integer) return "MAX_SAFE_INTEGER - largest safe integer";
    if (x == k_min_safe_integer) return "MIN_SAFE_INTEGER - smallest safe integer";
    return std::nullopt;
  }

  if (value.is_string()) {
    const std::string & s = value.as_string();
    if (s.empty()) return "empty string - minimal string value";
    if (value.string_length() == 1 && s != "\n" && s.front() != '\0') {
      return "single character - smallest non-empty string";
    }
    if (s.find('\n') != std::string::npos) return "contains newline - special whitespace";
    if (s.find('\0') != std::string::npos) return "contains null byte - special character";
    return std::nullopt;
  }

  if (value.is_bool()) {
    return fmt::format("boolean {} - discrete value", value.as_bool() ? "true" : "false");
  }
  return std::nullopt;
}

void push_unique(std::vector<Value> & values, Value v)
{
  const bool seen = std::any_of(values.begin(), values.end(), [&v](const Value & existing) {
    return existing.same_value(v);
  });
  if (!seen) values.push_back(std::move(v));
}

void append(std::vector<Value> & values, const std::vector<Value> & more)
{
  values.insert(values.end(), more.begin(), more.end());
}

Value repeat_a(uint64_t n) { return Value::make_string(std::string(n, 'a')); }

Value nulls(std::size_t n) { return Value::make_array(std::vector<Value>(n)); }

void add_range_edges(std::vector<Value> & values, double min, double max)
{
  if (std::isfinite(min)) {
    values.push_back(Value::make_number(min));
    values.push_back(Value::make_number(min - 1));
    values.push_back(Value::make_number(min + 1));
  }
  if (std::isfinite(max)) {
    values.push_back(Value::make_number(max));
    values.push_back(Value::make_number(max - 1));
    values.push_back(Value::make_number(max + 1));
  }
}

void add_length_edges(
  std::vector<Value> & values, uint64_t min, const std::optional<uint64_t> & max)
{
  const auto add = [&values](uint64_t n) {
    if (n <= k_max_materialized_length) values.push_back(repeat_a(n));
  };
  constexpr uint64_t k_top = std::numeric_limits<uint64_t>::max();
  add(min);
  if (min > 0) add(min - 1);
  if (min < k_top) add(min + 1);
  if (max) {
    add(*max);
    if (*max > 0) add(*max - 1);
    if (*max < k_top) add(*max + 1);
  }
}

std::string parameter_name(const BoundaryWalkOptions & options, std::size_t index)
{
  if (index < options.parameter_names.size()) return options.parameter_names[index];
  return fmt::format("arg{}", index);
}

/// Primitive family name of a region's type ("number", "string", or the kind)
std::string type_name_of(const TypeSpaceRegion & region)
{
  if (region.type.kind == TypeKind::Primitive) return region.type.primitive_name();
  return to_string(region.type.kind);
}

}  // namespace

// ============================================================================
// Value Tables
// ============================================================================

std::vector<Value> BoundaryWalker::canonical_values(
  const TypeSpaceRegion & region, bool include_special_values)
{
  std::vector<Value> values;

  switch (family_of(region.kind)) {
    case ValueFamily::Number:
      append(values, canonical_number_boundaries());
      if (region.kind == RegionKind::NumberRange) {
        add_range_edges(values, region.payload.min, region.payload.max);
      }
      if (include_special_values) append(values, special_number_values());
      break;
    case ValueFamily::String:
      append(values, canonical_string_boundaries());
      if (region.kind == RegionKind::StringLength) {
        add_length_edges(values, region.payload.min_length, region.payload.max_length);
      }
      if (include_special_values) append(values, special_string_values());
      break;
    case ValueFamily::Boolean:
      append(values, canonical_boolean_boundaries());
      break;
    case ValueFamily::Literal:
      if (region.payload.literal) values.push_back(*region.payload.literal);
      break;
    case ValueFamily::Null:
      values.push_back(Value::make_null());
      break;
    case ValueFamily::Array:
      values.push_back(nulls(0));
      values.push_back(nulls(1));
      values.push_back(nulls(2));
      break;
    case ValueFamily::Object:
      values.push_back(Value::make_object({}));
      break;
    case ValueFamily::CatchAll:
      values.push_back(Value::make_null());
      values.push_back(Value::make_number(0.0));
      values.push_back(Value::make_string(""));
      values.push_back(Value::make_bool(false));
      values.push_back(nulls(0));
      values.push_back(Value::make_object({}));
      if (include_special_values) {
        values.push_back(Value::make_number(std::numeric_limits<double>::quiet_NaN()));
      }
      break;
    case ValueFamily::Void:
    case ValueFamily::Compound:
      break;
  }
  return values;
}

std::vector<Value> BoundaryWalker::outside_values(const TypeSpaceRegion & region)
{
  std::vector<Value> values;
  const double eps = epsilon();

  switch (region.kind) {
    case RegionKind::NumberPositive:
      values = {Value::make_number(0.0), Value::make_number(-eps), Value::make_number(min_value())};
      break;
    case RegionKind::NumberNegative:
      values = {Value::make_number(0.0), Value::make_number(eps), Value::make_number(-min_value())};
      break;
    case RegionKind::NumberZero:
      values = {Value::make_number(-eps), Value::make_number(eps), Value::make_number(-0.0)};
      break;
    case RegionKind::NumberPositiveInfinity:
      values = {Value::make_number(k_max_safe_integer)};
      break;
    case RegionKind::NumberNegativeInfinity:
      values = {Value::make_number(k_min_safe_integer)};
      break;
    case RegionKind::NumberRange:
      if (std::isfinite(region.payload.min)) {
        values.push_back(Value::make_number(region.payload.min - 1));
      }
      if (std::isfinite(region.payload.max)) {
        values.push_back(Value::make_number(region.payload.max + 1));
      }
      break;
    case RegionKind::StringEmpty:
      values = {repeat_a(1), repeat_a(2)};
      break;
    case RegionKind::StringSingle:
      values = {repeat_a(0), repeat_a(2)};
      break;
    case RegionKind::StringShort:
      values = {repeat_a(1), repeat_a(11)};
      break;
    case RegionKind::StringMedium:
      values = {repeat_a(10), repeat_a(101)};
      break;
    case RegionKind::StringLong:
      values = {repeat_a(100), repeat_a(1001)};
      break;
    case RegionKind::StringVeryLong:
      values = {repeat_a(1000)};
      break;
    case RegionKind::StringLength:
      if (region.payload.min_length > 0) values.push_back(repeat_a(region.payload.min_length - 1));
      if (region.payload.max_length && *region.payload.max_length < k_max_materialized_length) {
        values.push_back(repeat_a(*region.payload.max_length + 1));
      }
      break;
    case RegionKind::BooleanTrue:
      values = {Value::make_bool(false)};
      break;
    case RegionKind::BooleanFalse:
      values = {Value::make_bool(true)};
      break;
    case RegionKind::ArrayEmpty:
      values = {nulls(1)};
      break;
    case RegionKind::ArraySingle:
      values = {nulls(0), nulls(2)};
      break;
    case RegionKind::ArrayMultiple:
      values = {nulls(1)};
      break;
    default:
      break;
  }
  return values;
}

std::vector<Value> BoundaryWalker::combination_values(const TypeSpaceRegion & region)
{
  std::vector<Value> values;

  if (family_of(region.kind) == ValueFamily::Number) {
    const double inf = std::numeric_limits<double>::infinity();
    for (const double b : {0.0, 1.0, -1.0, k_max_safe_integer, k_min_safe_integer}) {
      for (const double direction : {inf, -inf}) {
        if (values.size() >= k_max_combinations) break;
        values.push_back(Value::make_number(std::nextafter(b, direction)));
      }
    }
  } else if (family_of(region.kind) == ValueFamily::String) {
    for (const char * base : {"", "a", "ab", "abc"}) {
      for (const auto & special : special_string_values()) {
        if (values.size() >= k_max_combinations) break;
        if (special.as_string().empty()) continue;
        values.push_back(Value::make_string(base + special.as_string()));
      }
    }
  }
  return values;
}

std::string BoundaryWalker::explain_value(const Value & value, const std::string & region_id)
{
  if (auto table = table_explanation(value)) return *table;
  return fmt::format("boundary value {} in region {}", value.to_display_string(), region_id);
}

// ============================================================================
// Walks
// ============================================================================

BoundaryWalkResult BoundaryWalker::walk_boundary(
  const NegativeSpaceRegion & gap, const BoundaryWalkOptions & options) const
{
  const TypeSpaceRegion & region = gap.region;
  if (region.is_compound()) return walk_compound(gap, options);

  BoundaryWalkResult result;
  result.regions_explored.push_back(region.id);

  if (region.kind == RegionKind::VoidInput) {
    if (options.max_inputs > 0) {
      result.test_inputs.push_back(TestInput{"", Value::make_null(), region.id, {}});
      result.explanations.emplace_back("call without arguments");
    }
    result.boundary_point_count = result.test_inputs.size();
    return result;
  }

  const int depth = std::clamp(options.depth, 1, 3);

  std::vector<Candidate> candidates;
  for (auto & v : canonical_values(region, options.include_special_values)) {
    candidates.push_back({std::move(v), Stage::Boundary});
  }
  if (depth >= 2) {
    for (auto & v : outside_values(region)) {
      candidates.push_back({std::move(v), Stage::Outside});
    }
  }
  if (depth >= 3) {
    for (auto & v : combination_values(region)) {
      candidates.push_back({std::move(v), Stage::Combination});
    }
  }

  std::vector<Value> emitted;
  const std::string name = parameter_name(options, 0);

  for (auto & candidate : candidates) {
    if (result.test_inputs.size() >= options.max_inputs) break;

    const std::size_t before = emitted.size();
    push_unique(emitted, candidate.value);
    if (emitted.size() == before) continue;

    std::string explanation;
    const auto table = table_explanation(candidate.value);
    switch (candidate.stage) {
      case Stage::Boundary:
        explanation = explain_value(candidate.value, region.id);
        break;
      case Stage::Outside:
        explanation = table ? *table
                            : fmt::format(
                                "value {} just outside region {}",
                                candidate.value.to_display_string(), region.id);
        break;
      case Stage::Combination:
        explanation = fmt::format(
          "combination value {} for region {}", candidate.value.to_display_string(), region.id);
        break;
    }

    result.test_inputs.push_back(
      TestInput{name, candidate.value, region.id, std::vector<Value>{candidate.value}});
    result.explanations.push_back(std::move(explanation));
  }

  result.boundary_point_count = result.test_inputs.size();
  return result;
}

BoundaryWalkResult BoundaryWalker::walk_compound(
  const NegativeSpaceRegion & gap, const BoundaryWalkOptions & options) const
{
  const TypeSpaceRegion & region = gap.region;

  BoundaryWalkResult result;
  result.regions_explored.push_back(region.id);

  const int depth = std::clamp(options.depth, 1, 3);

  // Canonical values per component, and the deeper values kept apart so the
  // depth-1 walk stays a prefix of every deeper walk
  std::vector<std::vector<Value>> per_component;
  std::vector<std::vector<Value>> deeper_per_component;
  for (const auto & component : region.components) {
    std::vector<Value> unique;
    for (auto & v : canonical_values(component, options.include_special_values)) {
      push_unique(unique, std::move(v));
    }
    if (unique.empty()) unique.push_back(Value::make_null());

    std::vector<Value> deeper;
    const auto add_deeper = [&unique, &deeper](Value v) {
      if (std::find(unique.begin(), unique.end(), v) != unique.end()) return;
      push_unique(deeper, std::move(v));
    };
    if (depth >= 2) {
      for (auto & v : outside_values(component)) add_deeper(std::move(v));
    }
    if (depth >= 3) {
      for (auto & v : combination_values(component)) add_deeper(std::move(v));
    }

    per_component.push_back(std::move(unique));
    deeper_per_component.push_back(std::move(deeper));
  }

  // Vary one position at a time around the first value of every component
  std::vector<Value> base;
  for (const auto & values : per_component) {
    base.push_back(values.front());
  }

  std::vector<std::vector<Value>> emitted;
  const auto vary = [&](const std::vector<std::vector<Value>> & values_by_position) {
    for (std::size_t position = 0; position < values_by_position.size(); ++position) {
      for (const auto & v : values_by_position[position]) {
        if (result.test_inputs.size() >= options.max_inputs) return;

        std::vector<Value> args = base;
        args[position] = v;
        if (std::find(emitted.begin(), emitted.end(), args) != emitted.end()) continue;
        emitted.push_back(args);

        result.test_inputs.push_back(
          TestInput{parameter_name(options, position), v, region.id, std::move(args)});
        result.explanations.push_back(fmt::format(
          "{} = {} ({})", parameter_name(options, position), v.to_display_string(),
          explain_value(v, region.components[position].id)));
      }
    }
  };
  vary(per_component);
  vary(deeper_per_component);

  result.boundary_point_count = result.test_inputs.size();
  return result;
}

BoundaryWalkResult BoundaryWalker::walk_between_regions(
  const NegativeSpaceRegion & a, const NegativeSpaceRegion & b,
  const BoundaryWalkOptions & options) const
{
  BoundaryWalkResult result;
  result.regions_explored = {a.id(), b.id()};
  if (a.id() == b.id()) result.regions_explored.pop_back();

  const std::string name = parameter_name(options, 0);
  for (const auto & v : boundary_values_between(type_name_of(a.region), type_name_of(b.region))) {
    if (result.test_inputs.size() >= options.max_inputs) break;
    result.test_inputs.push_back(TestInput{name, v, a.id(), std::vector<Value>{v}});
    result.explanations.push_back(
      fmt::format("boundary between {} and {}: {}", a.id(), b.id(), v.to_display_string()));
  }

  result.boundary_point_count = result.test_inputs.size();
  return result;
}

std::vector<Value> BoundaryWalker::generate_all_boundaries(const TypeNode & type) const
{
  std::vector<Value> values;

  switch (type.kind) {
    case TypeKind::Primitive: {
      const std::string name = type.primitive_name();
      if (name == "number") {
        for (const auto & v : canonical_number_boundaries()) push_unique(values, v);
        for (const auto & v : special_number_values()) push_unique(values, v);
      } else if (name == "string") {
        for (const auto & v : canonical_string_boundaries()) push_unique(values, v);
        for (const auto & v : special_string_values()) push_unique(values, v);
      } else if (name == "boolean") {
        values = canonical_boolean_boundaries();
      } else if (name == "null" || name == "undefined") {
        values.push_back(Value::make_null());
      }
      break;
    }
    case TypeKind::Literal:
      if (type.name) {
        if (auto v = parse_literal_value(*type.name)) values.push_back(std::move(*v));
      }
      break;
    case TypeKind::Union:
      for (const auto & member : type.children) {
        for (auto & v : generate_all_boundaries(member)) push_unique(values, std::move(v));
      }
      break;
    default:
      break;
  }
  return values;
}

}  // namespace nstg
