// nstg/types/type_utils.hpp - Shared type helpers
//
// Structural equality, printing and literal classification used by the
// lattice, the universe calculator and the serializers.
//
#pragma once

#include <string>

#include "nstg/types/type_node.hpp"

namespace nstg
{

// ============================================================================
// Structural Equality
// ============================================================================

/**
 * Check whether two types are structurally equal.
 *
 * Compares kind, name, label and children recursively. Constraints do not
 * participate: a constrained `number` is structurally a `number`.
 */
[[nodiscard]] bool structurally_equal(const TypeNode & a, const TypeNode & b);

// ============================================================================
// Literal Classification
// ============================================================================

/**
 * Classify the runtime kind of a literal type's value.
 *
 * @return "number", "string", "boolean", "null", or empty if the node is
 *         not a literal or has no text
 */
[[nodiscard]] std::string classify_literal(const TypeNode & literal);

/**
 * Base primitive of a literal ("42" -> number).
 * Non-literals are returned unchanged.
 */
[[nodiscard]] TypeNode literal_base_type(const TypeNode & literal);

// ============================================================================
// Printing
// ============================================================================

/// Short display form ("number", "string | 42", "number[]", "{ a: string }")
[[nodiscard]] std::string type_to_string(const TypeNode & type);

/// Lower-case name of a type kind ("primitive", "union", ...)
[[nodiscard]] const char * to_string(TypeKind kind) noexcept;

/// Lower-case name of a constraint kind ("range", "length", ...)
[[nodiscard]] const char * to_string(ConstraintKind kind) noexcept;

/// Human readable constraint ("range[0, 10]", "length[1, *]")
[[nodiscard]] std::string constraint_to_string(const TypeConstraint & constraint);

}  // namespace nstg
