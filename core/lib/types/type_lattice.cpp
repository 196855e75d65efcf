// nstg/types/type_lattice.cpp - Subtype lattice implementation
//
#include "nstg/types/type_lattice.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

#include "nstg/types/type_utils.hpp"

namespace nstg
{

namespace
{

bool is_top(const TypeNode & t) { return t.kind == TypeKind::Any || t.kind == TypeKind::Unknown; }

const TypeNode & element_or_unknown(const TypeNode & array, const TypeNode & fallback)
{
  return array.children.empty() ? fallback : array.children.front();
}

}  // namespace

bool TypeLattice::is_subtype(const TypeNode & a, const TypeNode & b)
{
  if (structurally_equal(a, b)) return true;
  if (a.kind == TypeKind::Never) return true;
  if (is_top(b)) return true;
  if (is_top(a)) return false;

  // Literal <: primitive when the literal's value kind matches
  if (a.kind == TypeKind::Literal && b.kind == TypeKind::Primitive) {
    const std::string classified = classify_literal(a);
    return !classified.empty() && classified == b.primitive_name();
  }

  if (a.kind == TypeKind::Union) {
    return std::all_of(a.children.begin(), a.children.end(), [&b](const TypeNode & member) {
      return is_subtype(member, b);
    });
  }

  if (a.kind == TypeKind::Intersection) {
    return std::any_of(a.children.begin(), a.children.end(), [&b](const TypeNode & member) {
      return is_subtype(member, b);
    });
  }

  if (b.kind == TypeKind::Union) {
    return std::any_of(b.children.begin(), b.children.end(), [&a](const TypeNode & member) {
      return is_subtype(a, member);
    });
  }

  if (a.kind == TypeKind::Array && b.kind == TypeKind::Array) {
    const TypeNode unknown = TypeNode::unknown();
    return is_subtype(element_or_unknown(a, unknown), element_or_unknown(b, unknown));
  }

  if (a.kind == TypeKind::Tuple && b.kind == TypeKind::Tuple) {
    if (a.children.size() != b.children.size()) return false;
    for (std::size_t i = 0; i < a.children.size(); ++i) {
      if (!is_subtype(a.children[i], b.children[i])) return false;
    }
    return true;
  }

  if (a.kind == TypeKind::Object && b.kind == TypeKind::Object) {
    return is_object_subtype(a, b);
  }

  return false;
}

bool TypeLattice::is_object_subtype(const TypeNode & source, const TypeNode & target)
{
  for (const auto & wanted : target.children) {
    const auto found = std::find_if(
      source.children.begin(), source.children.end(),
      [&wanted](const TypeNode & prop) { return prop.label == wanted.label; });
    if (found == source.children.end()) return false;
    if (!is_subtype(*found, wanted)) return false;
  }
  return true;
}

TypeNode TypeLattice::join(const TypeNode & a, const TypeNode & b)
{
  if (structurally_equal(a, b)) return a;
  if (is_subtype(a, b)) return b;
  if (is_subtype(b, a)) return a;
  return TypeNode::union_of({a, b});
}

TypeNode TypeLattice::meet(const TypeNode & a, const TypeNode & b)
{
  if (structurally_equal(a, b)) return a;
  if (is_subtype(a, b)) return a;
  if (is_subtype(b, a)) return b;
  return TypeNode::intersection_of({a, b});
}

TypeNode TypeLattice::widen(const TypeNode & type)
{
  if (type.kind == TypeKind::Literal) {
    return literal_base_type(type);
  }

  if (type.kind == TypeKind::Union) {
    std::vector<TypeNode> members;
    for (const auto & child : type.children) {
      TypeNode widened = widen(child);
      const bool seen = std::any_of(members.begin(), members.end(), [&widened](const TypeNode & m) {
        return structurally_equal(m, widened);
      });
      if (!seen) members.push_back(std::move(widened));
    }
    if (members.size() == 1) return members.front();

    TypeNode result = TypeNode::union_of(std::move(members));
    result.label = type.label;
    result.constraints = type.constraints;
    return result;
  }

  return type;
}

TypeNode TypeLattice::narrow(const TypeNode & type, const TypeConstraint & constraint)
{
  TypeNode narrowed = type;
  narrowed.constraints.push_back(constraint);
  return narrowed;
}

}  // namespace nstg
