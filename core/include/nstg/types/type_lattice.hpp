// nstg/types/type_lattice.hpp - Subtype lattice over TypeNode
//
// All operations are total: unrecognized kind combinations are treated
// as "not a subtype" and produce union / intersection nodes.
//
#pragma once

#include "nstg/types/type_node.hpp"

namespace nstg
{

/**
 * Partial order of types under subtyping.
 *
 * Rules, in priority order:
 * - structural equality implies subtyping
 * - `never` is a subtype of everything
 * - everything is a subtype of `any` and `unknown`
 * - `any` is a subtype only of `any` / `unknown`
 * - a literal is a subtype of the primitive matching its value's kind
 * - a union is a subtype iff every member is
 * - an intersection is a subtype iff some member is
 * - a type is a subtype of a union if it is a subtype of some member
 * - arrays and tuples are covariant
 * - objects are structural (every target property must be present)
 */
class TypeLattice
{
public:
  [[nodiscard]] static bool is_subtype(const TypeNode & a, const TypeNode & b);

  [[nodiscard]] static bool is_supertype(const TypeNode & a, const TypeNode & b)
  {
    return is_subtype(b, a);
  }

  /// Least upper bound (union when unrelated)
  [[nodiscard]] static TypeNode join(const TypeNode & a, const TypeNode & b);

  /// Greatest lower bound (intersection when unrelated)
  [[nodiscard]] static TypeNode meet(const TypeNode & a, const TypeNode & b);

  /// Generalize literals to their base primitive, collapsing unions
  [[nodiscard]] static TypeNode widen(const TypeNode & type);

  /// Copy of `type` with one more constraint
  [[nodiscard]] static TypeNode narrow(const TypeNode & type, const TypeConstraint & constraint);

private:
  static bool is_object_subtype(const TypeNode & source, const TypeNode & target);
};

}  // namespace nstg
