// nstg/space/type_universe.hpp - Partition types into regions
//
#pragma once

#include <gsl/span>
#include <string>
#include <string_view>
#include <vector>

#include "nstg/basic/diagnostic.hpp"
#include "nstg/space/cardinality.hpp"
#include "nstg/space/region.hpp"
#include "nstg/types/type_node.hpp"

namespace nstg
{

/**
 * Computes the universe of a type: an ordered partition into regions,
 * each with a finite or infinite cardinality.
 *
 * Region ids are deterministic and unique within one universe. For
 * signatures with several parameters the universe is the Cartesian
 * product of the per-parameter universes.
 */
class TypeUniverse
{
public:
  /**
   * Calculate the universe of a single type.
   *
   * @param type Type to partition
   * @return Regions in a deterministic order (empty for `never`)
   */
  [[nodiscard]] std::vector<TypeSpaceRegion> calculate_universe(const TypeNode & type) const;

  /**
   * Calculate the universe of a function's argument list.
   *
   * - no parameters: a single `void-input` region
   * - one parameter: that parameter's universe
   * - several: the Cartesian product (ids joined with "×")
   *
   * A parameter without a type falls back to the unknown universe and
   * reports a warning into `diags` when given.
   */
  [[nodiscard]] std::vector<TypeSpaceRegion> calculate_signature_universe(
    const FunctionSignature & signature, DiagnosticBag * diags = nullptr) const;

  /**
   * Combine per-parameter universes into compound regions.
   *
   * @param names Parameter names (used in descriptions)
   * @param universes One universe per parameter
   */
  [[nodiscard]] static std::vector<TypeSpaceRegion> cartesian_product(
    const std::vector<std::string> & names,
    const std::vector<std::vector<TypeSpaceRegion>> & universes);

  /// Infinite-absorbing sum of region cardinalities
  [[nodiscard]] static Cardinality total_cardinality(gsl::span<const TypeSpaceRegion> regions);

private:
  std::vector<TypeSpaceRegion> primitive_universe(const TypeNode & type) const;
  std::vector<TypeSpaceRegion> number_universe(const TypeNode & type) const;
  std::vector<TypeSpaceRegion> string_universe(const TypeNode & type) const;
  std::vector<TypeSpaceRegion> array_universe(const TypeNode & type) const;
  std::vector<TypeSpaceRegion> object_universe(const TypeNode & type) const;
  std::vector<TypeSpaceRegion> intersection_universe(const TypeNode & type) const;
};

/// Region id fragment for a regex ("^[a-z]+$" -> "--a-z---")
[[nodiscard]] std::string sanitize_pattern_id(std::string_view pattern);

}  // namespace nstg
