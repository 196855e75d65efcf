// nstg/space/region.hpp - Type space regions
//
// A region is a named subset of a type's universe. Its kind is resolved
// once, when the universe is computed, and drives membership predicates,
// adjacency and boundary generation.
//
#pragma once

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nstg/space/cardinality.hpp"
#include "nstg/types/type_node.hpp"
#include "nstg/types/value.hpp"

namespace nstg
{

// ============================================================================
// Region Kind
// ============================================================================

enum class RegionKind : uint8_t {
  // number
  NumberSpecial,
  NumberNegativeInfinity,
  NumberNegative,
  NumberZero,
  NumberPositive,
  NumberPositiveInfinity,
  NumberRange,

  // string
  StringEmpty,
  StringSpecial,
  StringSingle,
  StringShort,
  StringMedium,
  StringLong,
  StringVeryLong,
  StringLength,
  StringPattern,

  // boolean / null / literal
  BooleanTrue,
  BooleanFalse,
  Null,
  Undefined,
  Literal,

  // array
  ArrayEmpty,
  ArraySingle,
  ArrayMultiple,
  ArrayLength,

  // object
  ObjectEmpty,
  ObjectPartial,
  ObjectComplete,

  // catch-all
  UnknownPrimitive,
  AnyUniverse,
  Unknown,

  // signature level
  VoidInput,
  Compound,
};

/**
 * Value family a region kind belongs to.
 */
enum class ValueFamily : uint8_t {
  Number,
  String,
  Boolean,
  Null,
  Literal,
  Array,
  Object,
  CatchAll,
  Void,
  Compound,
};

[[nodiscard]] ValueFamily family_of(RegionKind kind) noexcept;

[[nodiscard]] const char * to_string(RegionKind kind) noexcept;

class PatternMatcher;

// ============================================================================
// Region Payload
// ============================================================================

/**
 * Kind-specific data resolved at construction.
 *
 * - NumberRange: min / max
 * - StringLength, ArrayLength: min_length / max_length
 * - StringPattern: pattern, plus the compiled matcher
 * - Literal: literal
 * - ObjectComplete / ObjectPartial: properties (declared property names)
 */
struct RegionPayload
{
  double min = -std::numeric_limits<double>::infinity();
  double max = std::numeric_limits<double>::infinity();
  uint64_t min_length = 0;
  std::optional<uint64_t> max_length;
  std::string pattern;
  std::shared_ptr<const PatternMatcher> matcher;
  std::optional<Value> literal;
  std::vector<std::string> properties;
};

// ============================================================================
// Type Space Region
// ============================================================================

/**
 * A named subset of a type's universe with a (possibly infinite) size.
 *
 * For compound regions (several parameters), `components` holds the
 * per-parameter regions in parameter order and `id` is their ids joined
 * with "×". The id is the sole equality key for coverage comparison.
 */
struct TypeSpaceRegion
{
  std::string id;
  RegionKind kind = RegionKind::Unknown;
  TypeNode type;
  std::vector<TypeConstraint> constraints;
  Cardinality cardinality;
  std::string description;
  RegionPayload payload;
  std::vector<TypeSpaceRegion> components;

  [[nodiscard]] bool is_compound() const noexcept { return kind == RegionKind::Compound; }
};

/// Separator used in compound region ids (U+00D7, UTF-8 encoded)
inline constexpr const char * k_compound_separator = "\xC3\x97";

/**
 * A region of the negative space, scored for prioritization.
 * Created only by the gap engine.
 */
struct NegativeSpaceRegion
{
  TypeSpaceRegion region;
  double priority = 0.0;
  std::string reason;

  [[nodiscard]] const std::string & id() const noexcept { return region.id; }
};

}  // namespace nstg
