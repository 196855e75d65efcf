// nstg/gaps/gap_engine.hpp - Negative space calculation and prioritization
//
// The single place where untested regions are computed, scored and
// classified. Pure and synchronous; never mutates its inputs.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <gsl/span>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "nstg/space/cardinality.hpp"
#include "nstg/space/region.hpp"

namespace nstg
{

// ============================================================================
// Options / Results
// ============================================================================

/**
 * Ordering applied to prioritized gaps.
 */
enum class PrioritizationStrategy : uint8_t {
  Balanced,          ///< priority descending
  BoundaryFirst,     ///< boundary gaps first, then priority descending
  CardinalityFirst,  ///< ascending cardinality (infinite last), then priority
};

[[nodiscard]] const char * to_string(PrioritizationStrategy strategy) noexcept;

/// Parse "balanced" / "boundary-first" / "cardinality-first"
[[nodiscard]] std::optional<PrioritizationStrategy> parse_strategy(std::string_view text);

struct GapDetectionOptions
{
  double min_priority = 0.0;
  std::size_t max_gaps = std::numeric_limits<std::size_t>::max();
  bool include_infinite = true;
  PrioritizationStrategy strategy = PrioritizationStrategy::Balanced;
};

struct GapStatistics
{
  std::size_t total_gaps = 0;
  std::size_t boundary_gap_count = 0;
  std::size_t interior_gap_count = 0;
  Cardinality total_gap_cardinality;
  double average_priority = 0.0;
  std::optional<NegativeSpaceRegion> highest_priority_gap;
};

struct GapAnalysis
{
  std::vector<NegativeSpaceRegion> gaps;
  std::vector<NegativeSpaceRegion> prioritized_gaps;
  std::vector<NegativeSpaceRegion> boundary_gaps;
  std::vector<NegativeSpaceRegion> interior_gaps;
  GapStatistics statistics;
};

/**
 * Partition of a universe into covered and uncovered regions (by id).
 */
struct NegativeSpacePartition
{
  std::vector<TypeSpaceRegion> covered;
  std::vector<TypeSpaceRegion> uncovered;
};

// ============================================================================
// Gap Engine
// ============================================================================

class GapEngine
{
public:
  /// Set difference by id; covered and uncovered keep universe order
  [[nodiscard]] static NegativeSpacePartition compute_negative_space(
    gsl::span<const TypeSpaceRegion> universe, const std::set<std::string> & covered_ids);

  /**
   * Detect, score, classify and order the gaps of a universe.
   *
   * Filters (include_infinite, min_priority) run before classification;
   * max_gaps truncates only `prioritized_gaps`.
   */
  [[nodiscard]] static GapAnalysis detect_gaps(
    gsl::span<const TypeSpaceRegion> universe, const std::set<std::string> & covered_ids,
    const GapDetectionOptions & options = {});

  /// Uncovered regions adjacent to `region_id`
  [[nodiscard]] static std::vector<NegativeSpaceRegion> find_adjacent_gaps(
    gsl::span<const TypeSpaceRegion> universe, const std::set<std::string> & covered_ids,
    std::string_view region_id);

  /// Highest-priority gap (first one on ties)
  [[nodiscard]] static std::optional<NegativeSpaceRegion> most_critical_gap(
    gsl::span<const TypeSpaceRegion> universe, const std::set<std::string> & covered_ids);

  // ===========================================================================
  // Scoring
  // ===========================================================================

  /// Heuristic bug probability in [0, 1]
  [[nodiscard]] static double calculate_priority(const TypeSpaceRegion & region);

  /// Human readable reason (first matching rule)
  [[nodiscard]] static std::string determine_reason(const TypeSpaceRegion & region);

  /// Wrap a region with its priority and reason
  [[nodiscard]] static NegativeSpaceRegion make_gap(const TypeSpaceRegion & region);

  /// Adjacency per the fixed region chains (compound: exactly one position differs)
  [[nodiscard]] static bool are_regions_adjacent(
    const TypeSpaceRegion & a, const TypeSpaceRegion & b);

private:
  static std::vector<NegativeSpaceRegion> sort_gaps(
    std::vector<NegativeSpaceRegion> gaps, const std::vector<NegativeSpaceRegion> & boundary,
    PrioritizationStrategy strategy);
};

}  // namespace nstg
