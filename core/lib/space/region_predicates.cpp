// nstg/space/region_predicates.cpp - Region membership
//
#include "nstg/space/region_predicates.hpp"

#include <algorithm>
#include <cstddef>
#include <regex>
#include <string>

#include "nstg/space/special_values.hpp"

namespace nstg
{

namespace
{

bool anchor_matches(std::string_view text, std::string_view pattern)
{
  const bool anchored_start = !pattern.empty() && pattern.front() == '^';
  const bool anchored_end = pattern.size() > (anchored_start ? 1U : 0U) && pattern.back() == '$';
  std::string_view core = pattern;
  if (anchored_start) core.remove_prefix(1);
  if (anchored_end) core.remove_suffix(1);

  if (anchored_start && anchored_end) return text == core;
  if (anchored_start) return text.substr(0, core.size()) == core;
  if (anchored_end) {
    return text.size() >= core.size() && text.substr(text.size() - core.size()) == core;
  }
  return text.find(core) != std::string_view::npos;
}

bool length_within(uint64_t length, uint64_t min, const std::optional<uint64_t> & max)
{
  return length >= min && (!max || length <= *max);
}

bool number_matches(const Value & value, const TypeSpaceRegion & region)
{
  if (!value.is_number()) return false;

  const double x = value.as_number();
  switch (region.kind) {
    case RegionKind::NumberSpecial:
      return value.is_nan() || !value.is_finite() || value.is_negative_zero();
    case RegionKind::NumberZero:
      return x == 0.0 && !value.is_negative_zero();
    case RegionKind::NumberPositive:
      return x > 0.0 && x <= k_max_safe_integer;
    case RegionKind::NumberNegative:
      return x < 0.0 && x >= k_min_safe_integer;
    case RegionKind::NumberPositiveInfinity:
      return x > k_max_safe_integer;
    case RegionKind::NumberNegativeInfinity:
      return x < k_min_safe_integer;
    case RegionKind::NumberRange:
      return !value.is_nan() && x >= region.payload.min && x <= region.payload.max;
    default:
      return false;
  }
}

bool string_matches(const Value & value, const TypeSpaceRegion & region)
{
  if (!value.is_string()) return false;

  const std::size_t length = value.string_length();
  switch (region.kind) {
    case RegionKind::StringEmpty:
      return length == 0;
    case RegionKind::StringSpecial: {
      const auto & specials = special_string_values();
      return std::any_of(specials.begin(), specials.end(), [&value](const Value & s) {
        return s.same_value(value);
      });
    }
    case RegionKind::StringSingle:
      return length == 1;
    case RegionKind::StringShort:
      return length >= 2 && length <= 10;
    case RegionKind::StringMedium:
      return length >= 11 && length <= 100;
    case RegionKind::StringLong:
      return length >= 101 && length <= 1000;
    case RegionKind::StringVeryLong:
      return length > 1000;
    case RegionKind::StringLength:
      return length_within(length, region.payload.min_length, region.payload.max_length);
    case RegionKind::StringPattern:
      if (region.payload.matcher) return region.payload.matcher->matches(value.as_string());
      return string_matches_pattern(value.as_string(), region.payload.pattern);
    default:
      return false;
  }
}

bool array_matches(const Value & value, const TypeSpaceRegion & region)
{
  if (!value.is_array()) return false;

  const std::size_t size = value.as_array().size();
  switch (region.kind) {
    case RegionKind::ArrayEmpty:
      return size == 0;
    case RegionKind::ArraySingle:
      return size == 1;
    case RegionKind::ArrayMultiple:
      return size > 1;
    case RegionKind::ArrayLength:
      return length_within(size, region.payload.min_length, region.payload.max_length);
    default:
      return false;
  }
}

bool object_matches(const Value & value, const TypeSpaceRegion & region)
{
  if (!value.is_object()) return false;

  const auto & members = value.as_object();
  const auto & declared = region.payload.properties;
  const bool complete = std::all_of(declared.begin(), declared.end(), [&value](const auto & p) {
    return value.find_member(p) != nullptr;
  });

  switch (region.kind) {
    case RegionKind::ObjectEmpty:
      return members.empty();
    case RegionKind::ObjectComplete:
      return !members.empty() && complete;
    case RegionKind::ObjectPartial:
      return !members.empty() && !complete;
    default:
      return false;
  }
}

}  // namespace

bool value_matches_region(const Value & value, const TypeSpaceRegion & region)
{
  switch (family_of(region.kind)) {
    case ValueFamily::Number:
      return number_matches(value, region);
    case ValueFamily::String:
      return string_matches(value, region);
    case ValueFamily::Boolean:
      return value.is_bool() && value.as_bool() == (region.kind == RegionKind::BooleanTrue);
    case ValueFamily::Null:
      return value.is_null();
    case ValueFamily::Literal:
      return region.payload.literal && region.payload.literal->same_value(value);
    case ValueFamily::Array:
      return array_matches(value, region);
    case ValueFamily::Object:
      return object_matches(value, region);
    case ValueFamily::CatchAll:
      return true;
    case ValueFamily::Void:
    case ValueFamily::Compound:
      return false;
  }
  return false;
}

bool arguments_match_region(gsl::span<const Value> args, const TypeSpaceRegion & region)
{
  if (region.kind == RegionKind::VoidInput) return args.empty();

  if (region.kind == RegionKind::Compound) {
    const Value missing;
    for (std::size_t i = 0; i < region.components.size(); ++i) {
      const Value & arg = i < args.size() ? args[i] : missing;
      if (!arguments_match_region(gsl::span<const Value>(&arg, 1), region.components[i])) {
        return false;
      }
    }
    return true;
  }

  const Value missing;
  return value_matches_region(args.empty() ? missing : args[0], region);
}

// ============================================================================
// PatternMatcher
// ============================================================================

PatternMatcher::PatternMatcher(std::string pattern) : pattern_(std::move(pattern))
{
  try {
    regex_.emplace(pattern_, std::regex::ECMAScript);
  } catch (const std::regex_error &) {
    regex_.reset();
  }
}

bool PatternMatcher::matches(std::string_view text) const
{
  if (regex_ && text.size() <= k_max_regex_input) {
    return std::regex_search(text.begin(), text.end(), *regex_);
  }
  return anchor_matches(text, pattern_);
}

bool string_matches_pattern(std::string_view text, std::string_view pattern)
{
  return PatternMatcher(std::string(pattern)).matches(text);
}

}  // namespace nstg
