// nstg/types/type_node.cpp - Type model factories and queries
//
#include "nstg/types/type_node.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

namespace nstg
{

// ============================================================================
// TypeConstraint
// ============================================================================

TypeConstraint TypeConstraint::range(double min, double max)
{
  TypeConstraint c;
  c.kind = ConstraintKind::Range;
  c.min = min;
  c.max = max;
  return c;
}

TypeConstraint TypeConstraint::length(uint64_t min, std::optional<uint64_t> max)
{
  TypeConstraint c;
  c.kind = ConstraintKind::Length;
  c.min_length = min;
  c.max_length = max;
  return c;
}

TypeConstraint TypeConstraint::regex(std::string pattern)
{
  TypeConstraint c;
  c.kind = ConstraintKind::Pattern;
  c.pattern = std::move(pattern);
  return c;
}

TypeConstraint TypeConstraint::one_of(std::vector<Value> values)
{
  TypeConstraint c;
  c.kind = ConstraintKind::Enum;
  c.values = std::move(values);
  return c;
}

bool TypeConstraint::equivalent(const TypeConstraint & other) const
{
  if (kind != other.kind) return false;

  switch (kind) {
    case ConstraintKind::Range:
      return min == other.min && max == other.max;
    case ConstraintKind::Length:
      return min_length == other.min_length && max_length == other.max_length;
    case ConstraintKind::Pattern:
      return pattern == other.pattern;
    case ConstraintKind::Enum:
      return values == other.values;
  }
  return false;
}

// ============================================================================
// TypeNode Factories
// ============================================================================

TypeNode TypeNode::primitive(std::string name, std::vector<TypeConstraint> constraints)
{
  TypeNode t;
  t.kind = TypeKind::Primitive;
  t.name = std::move(name);
  t.constraints = std::move(constraints);
  return t;
}

TypeNode TypeNode::literal(std::string text)
{
  TypeNode t;
  t.kind = TypeKind::Literal;
  t.name = std::move(text);
  return t;
}

TypeNode TypeNode::union_of(std::vector<TypeNode> members)
{
  TypeNode t;
  t.kind = TypeKind::Union;
  t.children = std::move(members);
  return t;
}

TypeNode TypeNode::intersection_of(std::vector<TypeNode> members)
{
  TypeNode t;
  t.kind = TypeKind::Intersection;
  t.children = std::move(members);
  return t;
}

TypeNode TypeNode::array_of(TypeNode element, std::vector<TypeConstraint> constraints)
{
  TypeNode t;
  t.kind = TypeKind::Array;
  t.children.push_back(std::move(element));
  t.constraints = std::move(constraints);
  return t;
}

TypeNode TypeNode::tuple_of(std::vector<TypeNode> elements)
{
  TypeNode t;
  t.kind = TypeKind::Tuple;
  t.children = std::move(elements);
  return t;
}

TypeNode TypeNode::object_with(std::vector<TypeNode> properties)
{
  TypeNode t;
  t.kind = TypeKind::Object;
  t.children = std::move(properties);
  return t;
}

TypeNode TypeNode::any()
{
  TypeNode t;
  t.kind = TypeKind::Any;
  return t;
}

TypeNode TypeNode::unknown()
{
  TypeNode t;
  t.kind = TypeKind::Unknown;
  return t;
}

TypeNode TypeNode::never()
{
  TypeNode t;
  t.kind = TypeKind::Never;
  return t;
}

TypeNode TypeNode::labelled(std::string property) const
{
  TypeNode t = *this;
  t.label = std::move(property);
  return t;
}

// ============================================================================
// Queries
// ============================================================================

bool TypeNode::is_primitive(std::string_view primitive_name_to_check) const
{
  return kind == TypeKind::Primitive && primitive_name() == primitive_name_to_check;
}

std::string TypeNode::primitive_name() const
{
  if (kind != TypeKind::Primitive || !name) return {};

  std::string lowered = *name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

std::vector<TypeConstraint> TypeNode::constraints_of(ConstraintKind k) const
{
  std::vector<TypeConstraint> result;
  std::copy_if(
    constraints.begin(), constraints.end(), std::back_inserter(result),
    [k](const TypeConstraint & c) { return c.kind == k; });
  return result;
}

bool TypeNode::has_constraint(ConstraintKind k) const
{
  return std::any_of(constraints.begin(), constraints.end(), [k](const TypeConstraint & c) {
    return c.kind == k;
  });
}

}  // namespace nstg
