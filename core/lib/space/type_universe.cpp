// nstg/space/type_universe.cpp - Universe calculation
//
#include "nstg/space/type_universe.hpp"

#include <fmt/core.h>

#include <cctype>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <limits>
#include <memory>
#include <utility>

#include "nstg/space/region_predicates.hpp"
#include "nstg/space/special_values.hpp"
#include "nstg/types/type_utils.hpp"

namespace nstg
{

namespace
{

TypeSpaceRegion make_region(
  std::string id, RegionKind kind, const TypeNode & type, Cardinality cardinality,
  std::string description, std::vector<TypeConstraint> constraints = {})
{
  TypeSpaceRegion r;
  r.id = std::move(id);
  r.kind = kind;
  r.type = type;
  r.cardinality = cardinality;
  r.description = std::move(description);
  r.constraints = std::move(constraints);
  return r;
}

std::string format_max_length(const std::optional<uint64_t> & max)
{
  return max ? std::to_string(*max) : std::string("Infinity");
}

/// max - min + 1 for finite integral bounds, otherwise infinite
Cardinality range_cardinality(double min, double max)
{
  if (!std::isfinite(min) || !std::isfinite(max)) return Cardinality::infinite();
  if (std::trunc(min) != min || std::trunc(max) != max) return Cardinality::infinite();
  if (max < min) return Cardinality::finite(0);

  const double span = max - min + 1.0;
  // 2^64 is not representable as uint64_t
  if (span >= 18446744073709551616.0) return Cardinality::infinite();
  return Cardinality::finite(static_cast<uint64_t>(span));
}

}  // namespace

std::string sanitize_pattern_id(std::string_view pattern)
{
  std::string out;
  out.reserve(pattern.size());
  for (const char c : pattern) {
    const auto uc = static_cast<unsigned char>(c);
    out += (std::isalnum(uc) || c == '_') ? c : '-';
  }
  return out;
}

// ============================================================================
// Dispatch
// ============================================================================

std::vector<TypeSpaceRegion> TypeUniverse::calculate_universe(const TypeNode & type) const
{
  switch (type.kind) {
    case TypeKind::Primitive:
      return primitive_universe(type);
    case TypeKind::Literal: {
      TypeSpaceRegion r = make_region(
        "literal-" + type.name.value_or(""), RegionKind::Literal, type, Cardinality::finite(1),
        "literal " + type.name.value_or(""));
      if (type.name) r.payload.literal = parse_literal_value(*type.name);
      return {r};
    }
    case TypeKind::Union: {
      std::vector<TypeSpaceRegion> regions;
      for (const auto & member : type.children) {
        auto member_regions = calculate_universe(member);
        regions.insert(
          regions.end(), std::make_move_iterator(member_regions.begin()),
          std::make_move_iterator(member_regions.end()));
      }
      return regions;
    }
    case TypeKind::Intersection:
      return intersection_universe(type);
    case TypeKind::Array:
      return array_universe(type);
    case TypeKind::Object:
      return object_universe(type);
    case TypeKind::Any:
      return {make_region(
        "any-universe", RegionKind::AnyUniverse, type, Cardinality::infinite(), "any value")};
    case TypeKind::Never:
      return {};
    case TypeKind::Tuple:
    case TypeKind::Function:
    case TypeKind::Generic:
    case TypeKind::Unknown:
      break;
  }
  return {make_region("unknown", RegionKind::Unknown, type, Cardinality::infinite(), "unknown value")};
}

// ============================================================================
// Primitives
// ============================================================================

std::vector<TypeSpaceRegion> TypeUniverse::primitive_universe(const TypeNode & type) const
{
  const std::string name = type.primitive_name();

  if (name == "number") return number_universe(type);
  if (name == "string") return string_universe(type);

  if (name == "boolean") {
    TypeSpaceRegion t =
      make_region("boolean-true", RegionKind::BooleanTrue, type, Cardinality::finite(1), "true");
    TypeSpaceRegion f =
      make_region("boolean-false", RegionKind::BooleanFalse, type, Cardinality::finite(1), "false");
    return {t, f};
  }
  if (name == "null") {
    return {make_region("null", RegionKind::Null, type, Cardinality::finite(1), "null")};
  }
  if (name == "undefined") {
    return {make_region(
      "undefined", RegionKind::Undefined, type, Cardinality::finite(1), "undefined")};
  }

  return {make_region(
    "unknown-primitive", RegionKind::UnknownPrimitive, type, Cardinality::infinite(),
    fmt::format("values of primitive '{}'", type.name.value_or("?")))};
}

std::vector<TypeSpaceRegion> TypeUniverse::number_universe(const TypeNode & type) const
{
  const auto ranges = type.constraints_of(ConstraintKind::Range);

  if (!ranges.empty()) {
    std::vector<TypeSpaceRegion> regions;
    for (const auto & c : ranges) {
      TypeSpaceRegion r = make_region(
        fmt::format("number-range-{}-{}", format_number(c.min), format_number(c.max)),
        RegionKind::NumberRange, type, range_cardinality(c.min, c.max),
        fmt::format("numbers in [{}, {}]", format_number(c.min), format_number(c.max)), {c});
      r.payload.min = c.min;
      r.payload.max = c.max;
      regions.push_back(std::move(r));
    }
    return regions;
  }

  const double inf = std::numeric_limits<double>::infinity();
  return {
    make_region(
      "number-special", RegionKind::NumberSpecial, type,
      Cardinality::finite(special_number_values().size()),
      "special numbers (NaN, +/-Infinity, signed zeros, extreme magnitudes)"),
    make_region(
      "number-negative-infinity", RegionKind::NumberNegativeInfinity, type, Cardinality::infinite(),
      "numbers below the safe integer range", {TypeConstraint::range(-inf, k_min_safe_integer - 1)}),
    make_region(
      "number-negative", RegionKind::NumberNegative, type, Cardinality::infinite(),
      "negative numbers within the safe integer range",
      {TypeConstraint::range(k_min_safe_integer, -1)}),
    make_region(
      "number-zero", RegionKind::NumberZero, type, Cardinality::finite(1), "zero",
      {TypeConstraint::range(0, 0)}),
    make_region(
      "number-positive", RegionKind::NumberPositive, type, Cardinality::infinite(),
      "positive numbers within the safe integer range",
      {TypeConstraint::range(1, k_max_safe_integer)}),
    make_region(
      "number-positive-infinity", RegionKind::NumberPositiveInfinity, type, Cardinality::infinite(),
      "numbers above the safe integer range", {TypeConstraint::range(k_max_safe_integer + 1, inf)}),
  };
}

std::vector<TypeSpaceRegion> TypeUniverse::string_universe(const TypeNode & type) const
{
  std::vector<TypeSpaceRegion> regions;
  regions.push_back(make_region(
    "string-empty", RegionKind::StringEmpty, type, Cardinality::finite(1), "empty string",
    {TypeConstraint::length(0, 0)}));
  regions.push_back(make_region(
    "string-special", RegionKind::StringSpecial, type,
    Cardinality::finite(special_string_values().size()),
    "special strings (NUL, zero width space, byte order mark)"));

  const auto lengths = type.constraints_of(ConstraintKind::Length);
  const auto patterns = type.constraints_of(ConstraintKind::Pattern);

  if (lengths.empty() && patterns.empty()) {
    struct Band
    {
      const char * id;
      RegionKind kind;
      uint64_t min;
      std::optional<uint64_t> max;
      const char * description;
    };
    const Band bands[] = {
      {"string-single", RegionKind::StringSingle, 1, 1, "single character strings"},
      {"string-short", RegionKind::StringShort, 2, 10, "strings of length 2 to 10"},
      {"string-medium", RegionKind::StringMedium, 11, 100, "strings of length 11 to 100"},
      {"string-long", RegionKind::StringLong, 101, 1000, "strings of length 101 to 1000"},
      {"string-very-long", RegionKind::StringVeryLong, 1001, std::nullopt,
       "strings longer than 1000 characters"},
    };
    for (const auto & band : bands) {
      TypeSpaceRegion r = make_region(
        band.id, band.kind, type, Cardinality::infinite(), band.description,
        {TypeConstraint::length(band.min, band.max)});
      r.payload.min_length = band.min;
      r.payload.max_length = band.max;
      regions.push_back(std::move(r));
    }
    return regions;
  }

  for (const auto & c : lengths) {
    TypeSpaceRegion r = make_region(
      fmt::format("string-length-{}-{}", c.min_length, format_max_length(c.max_length)),
      RegionKind::StringLength, type, Cardinality::infinite(),
      fmt::format("strings with length in [{}, {}]", c.min_length, format_max_length(c.max_length)),
      {c});
    r.payload.min_length = c.min_length;
    r.payload.max_length = c.max_length;
    regions.push_back(std::move(r));
  }
  for (const auto & c : patterns) {
    TypeSpaceRegion r = make_region(
      "string-pattern-" + sanitize_pattern_id(c.pattern), RegionKind::StringPattern, type,
      Cardinality::infinite(), fmt::format("strings matching /{}/", c.pattern), {c});
    r.payload.pattern = c.pattern;
    r.payload.matcher = std::make_shared<const PatternMatcher>(c.pattern);
    regions.push_back(std::move(r));
  }
  return regions;
}

// ============================================================================
// Composites
// ============================================================================

std::vector<TypeSpaceRegion> TypeUniverse::array_universe(const TypeNode & type) const
{
  const auto lengths = type.constraints_of(ConstraintKind::Length);

  if (!lengths.empty()) {
    std::vector<TypeSpaceRegion> regions;
    for (const auto & c : lengths) {
      TypeSpaceRegion r = make_region(
        fmt::format("array-length-{}-{}", c.min_length, format_max_length(c.max_length)),
        RegionKind::ArrayLength, type, Cardinality::infinite(),
        fmt::format("arrays with length in [{}, {}]", c.min_length, format_max_length(c.max_length)),
        {c});
      r.payload.min_length = c.min_length;
      r.payload.max_length = c.max_length;
      regions.push_back(std::move(r));
    }
    return regions;
  }

  return {
    make_region("array-empty", RegionKind::ArrayEmpty, type, Cardinality::finite(1), "empty array"),
    make_region(
      "array-single", RegionKind::ArraySingle, type, Cardinality::infinite(),
      "arrays with one element"),
    make_region(
      "array-multiple", RegionKind::ArrayMultiple, type, Cardinality::infinite(),
      "arrays with two or more elements"),
  };
}

std::vector<TypeSpaceRegion> TypeUniverse::object_universe(const TypeNode & type) const
{
  std::vector<std::string> properties;
  for (const auto & child : type.children) {
    if (child.label) properties.push_back(*child.label);
  }

  std::vector<TypeSpaceRegion> regions = {
    make_region(
      "object-empty", RegionKind::ObjectEmpty, type, Cardinality::finite(1), "empty object"),
    make_region(
      "object-partial", RegionKind::ObjectPartial, type, Cardinality::infinite(),
      "objects missing some declared properties"),
    make_region(
      "object-complete", RegionKind::ObjectComplete, type, Cardinality::infinite(),
      "objects with every declared property"),
  };
  for (auto & r : regions) {
    r.payload.properties = properties;
  }
  return regions;
}

std::vector<TypeSpaceRegion> TypeUniverse::intersection_universe(const TypeNode & type) const
{
  // Approximation: the most restrictive member universe stands in for the
  // true intersection
  std::vector<TypeSpaceRegion> smallest;
  bool first = true;
  Cardinality smallest_size;

  for (const auto & member : type.children) {
    auto universe = calculate_universe(member);
    const Cardinality size = total_cardinality(universe);
    if (first || size < smallest_size) {
      smallest = std::move(universe);
      smallest_size = size;
      first = false;
    }
  }
  return smallest;
}

// ============================================================================
// Signature Universe
// ============================================================================

std::vector<TypeSpaceRegion> TypeUniverse::calculate_signature_universe(
  const FunctionSignature & signature, DiagnosticBag * diags) const
{
  if (signature.parameters.empty()) {
    return {make_region(
      "void-input", RegionKind::VoidInput, TypeNode::tuple_of({}), Cardinality::finite(1),
      "no arguments")};
  }

  std::vector<std::string> names;
  std::vector<std::vector<TypeSpaceRegion>> universes;

  for (const auto & param : signature.parameters) {
    names.push_back(param.name);
    if (param.type) {
      const TypeKind kind = param.type->kind;
      if (
        diags != nullptr &&
        (kind == TypeKind::Tuple || kind == TypeKind::Function || kind == TypeKind::Generic)) {
        diags->report_warning(
               fmt::format("parameter '{}' of '{}'", param.name, signature.name),
               fmt::format(
                 "type '{}' is not partitioned, using the unknown universe",
                 type_to_string(*param.type)))
          .with_code(diag_codes::k_unsupported_type);
      }
      universes.push_back(calculate_universe(*param.type));
      continue;
    }

    if (diags != nullptr) {
      diags->report_warning(
             fmt::format("parameter '{}' of '{}'", param.name, signature.name),
             "parameter has no type, using the unknown universe")
        .with_code(diag_codes::k_missing_parameter_type)
        .with_note("every argument value matches the catch-all region");
    }
    universes.push_back(calculate_universe(TypeNode::unknown()));
  }

  if (universes.size() == 1) return std::move(universes.front());
  return cartesian_product(names, universes);
}

std::vector<TypeSpaceRegion> TypeUniverse::cartesian_product(
  const std::vector<std::string> & names,
  const std::vector<std::vector<TypeSpaceRegion>> & universes)
{
  std::vector<std::vector<const TypeSpaceRegion *>> combos = {{}};

  for (const auto & universe : universes) {
    std::vector<std::vector<const TypeSpaceRegion *>> next;
    next.reserve(combos.size() * universe.size());
    for (const auto & prefix : combos) {
      for (const auto & region : universe) {
        auto combo = prefix;
        combo.push_back(&region);
        next.push_back(std::move(combo));
      }
    }
    combos = std::move(next);
  }

  std::vector<TypeSpaceRegion> product;
  product.reserve(combos.size());

  for (const auto & combo : combos) {
    TypeSpaceRegion r;
    r.kind = RegionKind::Compound;
    r.cardinality = Cardinality::finite(1);
    r.type.kind = TypeKind::Tuple;

    for (std::size_t i = 0; i < combo.size(); ++i) {
      const TypeSpaceRegion & component = *combo[i];
      if (i > 0) {
        r.id += k_compound_separator;
        r.description += ", ";
      }
      r.id += component.id;
      r.description += fmt::format(
        "{}: {}", i < names.size() ? names[i] : fmt::format("arg{}", i), component.description);
      r.cardinality = r.cardinality * component.cardinality;
      r.constraints.insert(
        r.constraints.end(), component.constraints.begin(), component.constraints.end());
      r.type.children.push_back(component.type);
      r.components.push_back(component);
    }
    product.push_back(std::move(r));
  }
  return product;
}

Cardinality TypeUniverse::total_cardinality(gsl::span<const TypeSpaceRegion> regions)
{
  Cardinality total;
  for (const auto & region : regions) {
    total += region.cardinality;
  }
  return total;
}

}  // namespace nstg
