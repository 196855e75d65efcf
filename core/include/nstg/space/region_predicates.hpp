// nstg/space/region_predicates.hpp - Region membership
//
// Predicates are dispatched on RegionKind, never on id prefixes.
//
#pragma once

#include <cstddef>
#include <gsl/span>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

#include "nstg/space/region.hpp"
#include "nstg/types/value.hpp"

namespace nstg
{

/**
 * Check whether a single value belongs to a (non-compound) region.
 *
 * Catch-all regions accept every value. Compound and void regions never
 * match a single value; use `arguments_match_region` for those.
 */
[[nodiscard]] bool value_matches_region(const Value & value, const TypeSpaceRegion & region);

/**
 * Check whether an argument list belongs to a region.
 *
 * - compound region: every component matches the argument at its position
 *   (a missing argument is treated as null)
 * - void-input: the argument list is empty
 * - otherwise: the first argument (or null) matches the region
 */
[[nodiscard]] bool arguments_match_region(
  gsl::span<const Value> args, const TypeSpaceRegion & region);

/**
 * A pattern compiled once and matched many times (ECMAScript search).
 *
 * Anchor matching replaces the regular expression when the expression is
 * invalid or the text is longer than `k_max_regex_input`: `^x$` exact,
 * `^x` prefix, `x$` suffix, otherwise substring. The std::regex matcher
 * recurses per input character, so unbounded input would overflow the
 * stack.
 */
class PatternMatcher
{
public:
  static constexpr std::size_t k_max_regex_input = 4096;

  explicit PatternMatcher(std::string pattern);

  [[nodiscard]] bool matches(std::string_view text) const;

  [[nodiscard]] const std::string & pattern() const noexcept { return pattern_; }
  [[nodiscard]] bool has_regex() const noexcept { return regex_.has_value(); }

private:
  std::string pattern_;
  std::optional<std::regex> regex_;
};

/// One-shot PatternMatcher
[[nodiscard]] bool string_matches_pattern(std::string_view text, std::string_view pattern);

}  // namespace nstg
