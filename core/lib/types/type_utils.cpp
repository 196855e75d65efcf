// nstg/types/type_utils.cpp - Shared type helpers implementation
//
#include "nstg/types/type_utils.hpp"

#include <fmt/core.h>

#include <cstddef>

namespace nstg
{

bool structurally_equal(const TypeNode & a, const TypeNode & b)
{
  if (a.kind != b.kind) return false;
  if (a.name != b.name) return false;
  if (a.label != b.label) return false;
  if (a.children.size() != b.children.size()) return false;

  for (std::size_t i = 0; i < a.children.size(); ++i) {
    if (!structurally_equal(a.children[i], b.children[i])) return false;
  }
  return true;
}

std::string classify_literal(const TypeNode & literal)
{
  if (literal.kind != TypeKind::Literal || !literal.name) return {};

  const auto value = parse_literal_value(*literal.name);
  if (!value) return {};

  switch (value->kind()) {
    case ValueKind::Number:
      return "number";
    case ValueKind::String:
      return "string";
    case ValueKind::Boolean:
      return "boolean";
    case ValueKind::Null:
      return "null";
    case ValueKind::Array:
    case ValueKind::Object:
      break;
  }
  return {};
}

TypeNode literal_base_type(const TypeNode & literal)
{
  const std::string base = classify_literal(literal);
  if (base.empty()) return literal;

  TypeNode widened = TypeNode::primitive(base);
  widened.label = literal.label;
  return widened;
}

namespace
{

std::string join_children(const TypeNode & type, const char * separator)
{
  std::string out;
  for (std::size_t i = 0; i < type.children.size(); ++i) {
    if (i > 0) out += separator;
    out += type_to_string(type.children[i]);
  }
  return out;
}

}  // namespace

std::string type_to_string(const TypeNode & type)
{
  switch (type.kind) {
    case TypeKind::Primitive:
    case TypeKind::Literal:
      return type.name.value_or("?");
    case TypeKind::Union:
      return join_children(type, " | ");
    case TypeKind::Intersection:
      return join_children(type, " & ");
    case TypeKind::Array:
      if (type.children.empty()) return "unknown[]";
      return type_to_string(type.children.front()) + "[]";
    case TypeKind::Tuple:
      return "[" + join_children(type, ", ") + "]";
    case TypeKind::Object: {
      if (type.children.empty()) return "{}";
      std::string out = "{ ";
      for (std::size_t i = 0; i < type.children.size(); ++i) {
        if (i > 0) out += "; ";
        const auto & prop = type.children[i];
        out += fmt::format("{}: {}", prop.label.value_or("?"), type_to_string(prop));
      }
      out += " }";
      return out;
    }
    case TypeKind::Function:
      return "(" + join_children(type, ", ") + ") => unknown";
    case TypeKind::Generic:
      return fmt::format("{}<{}>", type.name.value_or("?"), join_children(type, ", "));
    case TypeKind::Unknown:
      return "unknown";
    case TypeKind::Any:
      return "any";
    case TypeKind::Never:
      return "never";
  }
  return "?";
}

const char * to_string(TypeKind kind) noexcept
{
  switch (kind) {
    case TypeKind::Primitive:
      return "primitive";
    case TypeKind::Literal:
      return "literal";
    case TypeKind::Union:
      return "union";
    case TypeKind::Intersection:
      return "intersection";
    case TypeKind::Array:
      return "array";
    case TypeKind::Tuple:
      return "tuple";
    case TypeKind::Object:
      return "object";
    case TypeKind::Function:
      return "function";
    case TypeKind::Generic:
      return "generic";
    case TypeKind::Unknown:
      return "unknown";
    case TypeKind::Any:
      return "any";
    case TypeKind::Never:
      return "never";
  }
  return "unknown";
}

const char * to_string(ConstraintKind kind) noexcept
{
  switch (kind) {
    case ConstraintKind::Range:
      return "range";
    case ConstraintKind::Length:
      return "length";
    case ConstraintKind::Pattern:
      return "pattern";
    case ConstraintKind::Enum:
      return "enum";
  }
  return "unknown";
}

std::string constraint_to_string(const TypeConstraint & constraint)
{
  switch (constraint.kind) {
    case ConstraintKind::Range:
      return fmt::format(
        "range[{}, {}]", format_number(constraint.min), format_number(constraint.max));
    case ConstraintKind::Length:
      return fmt::format(
        "length[{}, {}]", constraint.min_length,
        constraint.max_length ? std::to_string(*constraint.max_length) : "*");
    case ConstraintKind::Pattern:
      return fmt::format("pattern /{}/", constraint.pattern);
    case ConstraintKind::Enum: {
      std::string out = "enum{";
      for (std::size_t i = 0; i < constraint.values.size(); ++i) {
        if (i > 0) out += ", ";
        out += constraint.values[i].to_display_string();
      }
      out += "}";
      return out;
    }
  }
  return "?";
}

}  // namespace nstg
