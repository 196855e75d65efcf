// nstg/gaps/gap_engine.cpp - Negative space calculation and prioritization
//
#include "nstg/gaps/gap_engine.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <utility>

namespace nstg
{

namespace
{

constexpr std::array<std::string_view, 8> k_boundary_keywords = {
  "boundary", "zero", "empty", "single", "min", "max", "infinity", "special"};

constexpr std::array<std::string_view, 5> k_special_keywords = {
  "special", "nan", "infinity", "null", "undefined"};

std::string to_lower(std::string_view text)
{
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

template <std::size_t N>
bool contains_any(const std::string & haystack, const std::array<std::string_view, N> & keywords)
{
  return std::any_of(keywords.begin(), keywords.end(), [&haystack](std::string_view k) {
    return haystack.find(k) != std::string::npos;
  });
}

bool has_boundary_keyword(const TypeSpaceRegion & region)
{
  return contains_any(to_lower(region.id), k_boundary_keywords) ||
         contains_any(to_lower(region.description), k_boundary_keywords);
}

bool has_special_keyword(const TypeSpaceRegion & region)
{
  return contains_any(to_lower(region.id), k_special_keywords);
}

struct ChainPosition
{
  int chain;
  int index;
};

/// Position of a region kind in one of the fixed adjacency chains
std::optional<ChainPosition> chain_position(RegionKind kind)
{
  switch (kind) {
    // number: -inf band <-> negative <-> zero <-> positive <-> +inf band
    case RegionKind::NumberNegativeInfinity:
      return ChainPosition{0, 0};
    case RegionKind::NumberNegative:
      return ChainPosition{0, 1};
    case RegionKind::NumberZero:
      return ChainPosition{0, 2};
    case RegionKind::NumberPositive:
      return ChainPosition{0, 3};
    case RegionKind::NumberPositiveInfinity:
      return ChainPosition{0, 4};
    // string: empty <-> single <-> short <-> medium <-> long <-> very-long
    case RegionKind::StringEmpty:
      return ChainPosition{1, 0};
    case RegionKind::StringSingle:
      return ChainPosition{1, 1};
    case RegionKind::StringShort:
      return ChainPosition{1, 2};
    case RegionKind::StringMedium:
      return ChainPosition{1, 3};
    case RegionKind::StringLong:
      return ChainPosition{1, 4};
    case RegionKind::StringVeryLong:
      return ChainPosition{1, 5};
    case RegionKind::BooleanTrue:
      return ChainPosition{2, 0};
    case RegionKind::BooleanFalse:
      return ChainPosition{2, 1};
    case RegionKind::ArrayEmpty:
      return ChainPosition{3, 0};
    case RegionKind::ArraySingle:
      return ChainPosition{3, 1};
    case RegionKind::ArrayMultiple:
      return ChainPosition{3, 2};
    case RegionKind::ObjectEmpty:
      return ChainPosition{4, 0};
    case RegionKind::ObjectPartial:
      return ChainPosition{4, 1};
    case RegionKind::ObjectComplete:
      return ChainPosition{4, 2};
    default:
      return std::nullopt;
  }
}

bool kinds_adjacent(RegionKind a, RegionKind b)
{
  const auto pa = chain_position(a);
  const auto pb = chain_position(b);
  if (!pa || !pb || pa->chain != pb->chain) return false;
  return std::abs(pa->index - pb->index) == 1;
}

bool higher_priority(const NegativeSpaceRegion & a, const NegativeSpaceRegion & b)
{
  return a.priority > b.priority;
}

bool is_in(const std::vector<NegativeSpaceRegion> & gaps, const std::string & id)
{
  return std::any_of(gaps.begin(), gaps.end(), [&id](const NegativeSpaceRegion & g) {
    return g.id() == id;
  });
}

}  // namespace

// ============================================================================
// Strategy
// ============================================================================

const char * to_string(PrioritizationStrategy strategy) noexcept
{
  switch (strategy) {
    case PrioritizationStrategy::Balanced:
      return "balanced";
    case PrioritizationStrategy::BoundaryFirst:
      return "boundary-first";
    case PrioritizationStrategy::CardinalityFirst:
      return "cardinality-first";
  }
  return "balanced";
}

std::optional<PrioritizationStrategy> parse_strategy(std::string_view text)
{
  if (text == "balanced") return PrioritizationStrategy::Balanced;
  if (text == "boundary-first") return PrioritizationStrategy::BoundaryFirst;
  if (text == "cardinality-first") return PrioritizationStrategy::CardinalityFirst;
  return std::nullopt;
}

// ============================================================================
// Scoring
// ============================================================================

double GapEngine::calculate_priority(const TypeSpaceRegion & region)
{
  double priority = 0.5;

  if (has_boundary_keyword(region)) {
    priority += 0.3;
  }

  if (region.cardinality.is_infinite()) {
    priority -= 0.2;
  } else if (region.cardinality.at_most(10)) {
    priority += 0.2;
  } else if (region.cardinality.at_most(100)) {
    priority += 0.1;
  }

  if (has_special_keyword(region)) {
    priority += 0.2;
  }

  return std::clamp(priority, 0.0, 1.0);
}

std::string GapEngine::determine_reason(const TypeSpaceRegion & region)
{
  if (has_boundary_keyword(region)) return "boundary region, high bug probability";
  if (has_special_keyword(region)) return "contains special values";
  if (region.cardinality.is_infinite()) return "requires sampling strategy";
  if (region.cardinality.at_most(10)) return "small finite region, should be fully tested";
  return "untested region";
}

NegativeSpaceRegion GapEngine::make_gap(const TypeSpaceRegion & region)
{
  NegativeSpaceRegion gap;
  gap.region = region;
  gap.priority = calculate_priority(region);
  gap.reason = determine_reason(region);
  return gap;
}

bool GapEngine::are_regions_adjacent(const TypeSpaceRegion & a, const TypeSpaceRegion & b)
{
  if (a.is_compound() || b.is_compound()) {
    if (!a.is_compound() || !b.is_compound()) return false;
    if (a.components.size() != b.components.size()) return false;

    std::size_t differing = 0;
    bool adjacent_difference = false;
    for (std::size_t i = 0; i < a.components.size(); ++i) {
      if (a.components[i].id == b.components[i].id) continue;
      ++differing;
      adjacent_difference = kinds_adjacent(a.components[i].kind, b.components[i].kind);
    }
    return differing == 1 && adjacent_difference;
  }

  return kinds_adjacent(a.kind, b.kind);
}

// ============================================================================
// Negative Space
// ============================================================================

NegativeSpacePartition GapEngine::compute_negative_space(
  gsl::span<const TypeSpaceRegion> universe, const std::set<std::string> & covered_ids)
{
  NegativeSpacePartition partition;
  for (const auto & region : universe) {
    if (covered_ids.count(region.id) > 0) {
      partition.covered.push_back(region);
    } else {
      partition.uncovered.push_back(region);
    }
  }
  return partition;
}

GapAnalysis GapEngine::detect_gaps(
  gsl::span<const TypeSpaceRegion> universe, const std::set<std::string> & covered_ids,
  const GapDetectionOptions & options)
{
  const NegativeSpacePartition partition = compute_negative_space(universe, covered_ids);

  GapAnalysis analysis;
  for (const auto & region : partition.uncovered) {
    if (!options.include_infinite && region.cardinality.is_infinite()) continue;

    NegativeSpaceRegion gap = make_gap(region);
    if (gap.priority < options.min_priority) continue;
    analysis.gaps.push_back(std::move(gap));
  }

  for (const auto & gap : analysis.gaps) {
    const bool boundary = std::any_of(
      partition.covered.begin(), partition.covered.end(),
      [&gap](const TypeSpaceRegion & covered) {
        return are_regions_adjacent(gap.region, covered);
      });
    (boundary ? analysis.boundary_gaps : analysis.interior_gaps).push_back(gap);
  }

  analysis.prioritized_gaps = sort_gaps(analysis.gaps, analysis.boundary_gaps, options.strategy);
  if (analysis.prioritized_gaps.size() > options.max_gaps) {
    analysis.prioritized_gaps.resize(options.max_gaps);
  }

  // Statistics
  GapStatistics & stats = analysis.statistics;
  stats.total_gaps = analysis.gaps.size();
  stats.boundary_gap_count = analysis.boundary_gaps.size();
  stats.interior_gap_count = analysis.interior_gaps.size();

  double priority_sum = 0.0;
  for (const auto & gap : analysis.gaps) {
    stats.total_gap_cardinality += gap.region.cardinality;
    priority_sum += gap.priority;
    if (!stats.highest_priority_gap || gap.priority > stats.highest_priority_gap->priority) {
      stats.highest_priority_gap = gap;
    }
  }
  if (!analysis.gaps.empty()) {
    stats.average_priority = priority_sum / static_cast<double>(analysis.gaps.size());
  }

  return analysis;
}

std::vector<NegativeSpaceRegion> GapEngine::find_adjacent_gaps(
  gsl::span<const TypeSpaceRegion> universe, const std::set<std::string> & covered_ids,
  std::string_view region_id)
{
  const auto target = std::find_if(universe.begin(), universe.end(), [region_id](const auto & r) {
    return r.id == region_id;
  });
  if (target == universe.end()) return {};

  std::vector<NegativeSpaceRegion> adjacent;
  for (const auto & region : compute_negative_space(universe, covered_ids).uncovered) {
    if (are_regions_adjacent(region, *target)) {
      adjacent.push_back(make_gap(region));
    }
  }
  return adjacent;
}

std::optional<NegativeSpaceRegion> GapEngine::most_critical_gap(
  gsl::span<const TypeSpaceRegion> universe, const std::set<std::string> & covered_ids)
{
  return detect_gaps(universe, covered_ids).statistics.highest_priority_gap;
}

std::vector<NegativeSpaceRegion> GapEngine::sort_gaps(
  std::vector<NegativeSpaceRegion> gaps, const std::vector<NegativeSpaceRegion> & boundary,
  PrioritizationStrategy strategy)
{
  switch (strategy) {
    case PrioritizationStrategy::Balanced:
      std::stable_sort(gaps.begin(), gaps.end(), higher_priority);
      break;
    case PrioritizationStrategy::BoundaryFirst:
      std::stable_sort(
        gaps.begin(), gaps.end(),
        [&boundary](const NegativeSpaceRegion & a, const NegativeSpaceRegion & b) {
          const bool a_boundary = is_in(boundary, a.id());
          const bool b_boundary = is_in(boundary, b.id());
          if (a_boundary != b_boundary) return a_boundary;
          return higher_priority(a, b);
        });
      break;
    case PrioritizationStrategy::CardinalityFirst:
      std::stable_sort(
        gaps.begin(), gaps.end(), [](const NegativeSpaceRegion & a, const NegativeSpaceRegion & b) {
          if (a.region.cardinality != b.region.cardinality) {
            return a.region.cardinality < b.region.cardinality;
          }
          return higher_priority(a, b);
        });
      break;
  }
  return gaps;
}

}  // namespace nstg
