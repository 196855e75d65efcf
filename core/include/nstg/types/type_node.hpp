// nstg/types/type_node.hpp - Abstract type representation
//
// TypeNode is the shared vocabulary produced by the (external) source
// analysis front end and consumed by every analysis stage.
//
#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nstg/types/value.hpp"

namespace nstg
{

// ============================================================================
// Type Kind
// ============================================================================

/**
 * Kind of type node.
 */
enum class TypeKind : uint8_t {
  Primitive,     ///< number, string, boolean, null, undefined, ...
  Literal,       ///< 42, "hello", true
  Union,         ///< A | B
  Intersection,  ///< A & B
  Array,         ///< T[] (children[0] = element type)
  Tuple,         ///< [A, B]
  Object,        ///< { a: A; b: B } (children are labelled members)
  Function,      ///< (A) => B
  Generic,       ///< Name<A, B>
  Unknown,       ///< unknown
  Any,           ///< any
  Never,         ///< never (no values)
};

// ============================================================================
// Type Constraint
// ============================================================================

/**
 * Kind of type constraint.
 */
enum class ConstraintKind : uint8_t {
  Range,    ///< min <= x <= max
  Length,   ///< min <= len(x) <= max
  Pattern,  ///< x matches regex
  Enum,     ///< x in {values}
};

/**
 * Constraint restricting exactly one dimension of a type.
 *
 * Only the fields belonging to the constraint's kind are meaningful;
 * `description` is informational and never affects semantics.
 */
struct TypeConstraint
{
  ConstraintKind kind = ConstraintKind::Range;

  /// Range: numeric bounds (+/-infinity when unbounded)
  double min = -std::numeric_limits<double>::infinity();
  double max = std::numeric_limits<double>::infinity();

  /// Length: code point bounds (max unset when unbounded)
  uint64_t min_length = 0;
  std::optional<uint64_t> max_length;

  /// Pattern: regular expression source
  std::string pattern;

  /// Enum: allowed values
  std::vector<Value> values;

  /// Free-form origin text (e.g. "between 0 and 100")
  std::string description;

  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static TypeConstraint range(double min, double max);
  static TypeConstraint length(uint64_t min, std::optional<uint64_t> max);
  static TypeConstraint regex(std::string pattern);
  static TypeConstraint one_of(std::vector<Value> values);

  /// Semantic equality (ignores description and fields of other kinds)
  [[nodiscard]] bool equivalent(const TypeConstraint & other) const;
};

// ============================================================================
// Type Node
// ============================================================================

/**
 * Abstract type.
 *
 * Composite kinds keep their operands in `children`:
 * - Union / Intersection / Tuple: members in order
 * - Array: children[0] is the element type
 * - Object: one child per property, `label` holds the property name
 * - Generic / Function: type arguments / parameter and return types
 *
 * For Literal nodes, `name` holds the literal source text.
 */
struct TypeNode
{
  TypeKind kind = TypeKind::Unknown;
  std::optional<std::string> name;
  std::optional<std::string> label;
  std::vector<TypeNode> children;
  std::vector<TypeConstraint> constraints;

  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static TypeNode primitive(std::string name, std::vector<TypeConstraint> constraints = {});
  static TypeNode literal(std::string text);
  static TypeNode union_of(std::vector<TypeNode> members);
  static TypeNode intersection_of(std::vector<TypeNode> members);
  static TypeNode array_of(TypeNode element, std::vector<TypeConstraint> constraints = {});
  static TypeNode tuple_of(std::vector<TypeNode> elements);
  static TypeNode object_with(std::vector<TypeNode> properties);
  static TypeNode any();
  static TypeNode unknown();
  static TypeNode never();

  /// Attach a property name (object member)
  [[nodiscard]] TypeNode labelled(std::string property) const;

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] bool is_primitive(std::string_view primitive_name) const;

  /// Lower-cased primitive name, or empty for non-primitives
  [[nodiscard]] std::string primitive_name() const;

  /// Constraints of a given kind, in declaration order
  [[nodiscard]] std::vector<TypeConstraint> constraints_of(ConstraintKind k) const;

  [[nodiscard]] bool has_constraint(ConstraintKind k) const;
};

// ============================================================================
// Function Signature
// ============================================================================

/**
 * A function parameter. `type` is unset when the front end could not
 * determine it; the analysis then falls back to the unknown universe.
 */
struct FunctionParameter
{
  std::string name;
  std::optional<TypeNode> type;
  bool optional = false;
  std::optional<Value> default_value;
};

/**
 * A function signature as produced by the source analysis front end.
 */
struct FunctionSignature
{
  std::string name;
  std::vector<FunctionParameter> parameters;
  TypeNode return_type = TypeNode::any();

  std::optional<std::string> source_file;
  std::optional<uint32_t> start_line;
  std::optional<uint32_t> end_line;
};

}  // namespace nstg
