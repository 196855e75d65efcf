// nstg/space/special_values.hpp - Special and canonical boundary values
//
// Fixed value tables shared by the universe calculator, the region
// predicates and the boundary walker.
//
#pragma once

#include <string_view>
#include <vector>

#include "nstg/types/value.hpp"

namespace nstg
{

// ============================================================================
// Numeric Limits
// ============================================================================

/// 2^53 - 1
inline constexpr double k_max_safe_integer = 9007199254740991.0;
inline constexpr double k_min_safe_integer = -9007199254740991.0;

/// Largest finite double
[[nodiscard]] double max_value() noexcept;

/// Smallest positive (denormal) double
[[nodiscard]] double min_value() noexcept;

/// Difference between 1 and the next representable double
[[nodiscard]] double epsilon() noexcept;

// ============================================================================
// Special Values
// ============================================================================

/// NaN, +Infinity, -Infinity, 0, -0, MAX_VALUE, MIN_VALUE
[[nodiscard]] const std::vector<Value> & special_number_values();

/// "", "\0", U+200B, U+FEFF
[[nodiscard]] const std::vector<Value> & special_string_values();

/// Special values of a primitive family ("number", "string"); empty otherwise
[[nodiscard]] std::vector<Value> special_values_for(std::string_view primitive_name);

/// True when `value` same-value-equals an entry of its family's special set
[[nodiscard]] bool is_special_value(const Value & value);

// ============================================================================
// Canonical Boundaries
// ============================================================================

/// 0, -1, 1, MIN/MAX_SAFE_INTEGER, MIN/MAX_VALUE, +/-epsilon
[[nodiscard]] const std::vector<Value> & canonical_number_boundaries();

/// "", "a", "ab", "abc", 10/100/1000/10000 x "a", whitespace, unicode, emoji
[[nodiscard]] const std::vector<Value> & canonical_string_boundaries();

/// true, false
[[nodiscard]] const std::vector<Value> & canonical_boolean_boundaries();

/**
 * Boundary values between two primitive families.
 *
 * The list is the concatenation of the number, string and boolean lists
 * for every family named on either side.
 */
[[nodiscard]] std::vector<Value> boundary_values_between(
  std::string_view type_a, std::string_view type_b);

}  // namespace nstg
