// nstg/boundary/boundary_walker.hpp - Concrete edge values for gaps
//
// Turns a prioritized gap into concrete arguments that sit on, or just
// outside, the edges of its region.
//
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "nstg/space/region.hpp"
#include "nstg/types/type_node.hpp"
#include "nstg/types/value.hpp"

namespace nstg
{

// ============================================================================
// Records / Options
// ============================================================================

/**
 * One generated argument: the value under test, the region it targets and
 * the complete argument list for the call.
 */
struct TestInput
{
  std::string parameter_name;
  Value value;
  std::string region_id;
  std::vector<Value> args;
};

struct BoundaryWalkOptions
{
  std::size_t max_inputs = 50;
  bool include_special_values = true;

  /// 1: canonical edges, 2: + values just outside, 3: + capped combinations
  int depth = 2;

  /// Parameter names in call order (defaults to arg0, arg1, ...)
  std::vector<std::string> parameter_names;

  /// Defaults used when walking between two regions
  static BoundaryWalkOptions between_regions()
  {
    BoundaryWalkOptions o;
    o.max_inputs = 20;
    return o;
  }
};

struct BoundaryWalkResult
{
  std::vector<TestInput> test_inputs;
  std::vector<std::string> explanations;  ///< one per test input
  std::vector<std::string> regions_explored;
  std::size_t boundary_point_count = 0;
};

// ============================================================================
// Boundary Walker
// ============================================================================

class BoundaryWalker
{
public:
  /**
   * Generate boundary inputs for a gap.
   *
   * The output is deduplicated (same-value) in generation order and
   * truncated to `max_inputs`, so a deeper walk always extends a
   * shallower one.
   */
  [[nodiscard]] BoundaryWalkResult walk_boundary(
    const NegativeSpaceRegion & gap, const BoundaryWalkOptions & options = {}) const;

  /// Boundary values keyed on the pair of primitive type names
  [[nodiscard]] BoundaryWalkResult walk_between_regions(
    const NegativeSpaceRegion & a, const NegativeSpaceRegion & b,
    const BoundaryWalkOptions & options = BoundaryWalkOptions::between_regions()) const;

  /// Depth-1 values for a type (primitive, literal, union)
  [[nodiscard]] std::vector<Value> generate_all_boundaries(const TypeNode & type) const;

  /// Canonical edge values of a single (non-compound) region
  [[nodiscard]] static std::vector<Value> canonical_values(
    const TypeSpaceRegion & region, bool include_special_values);

  /// Values just outside the region's own edges
  [[nodiscard]] static std::vector<Value> outside_values(const TypeSpaceRegion & region);

  /// Capped cross-product of canonical edges with special values
  [[nodiscard]] static std::vector<Value> combination_values(const TypeSpaceRegion & region);

  /// Fixed-table explanation of why a value is interesting
  [[nodiscard]] static std::string explain_value(const Value & value, const std::string & region_id);

private:
  BoundaryWalkResult walk_compound(
    const NegativeSpaceRegion & gap, const BoundaryWalkOptions & options) const;
};

}  // namespace nstg
