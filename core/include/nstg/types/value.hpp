// nstg/types/value.hpp - Dynamic runtime value representation
//
// Represents argument values observed in test executions and values
// produced by the boundary walker and the constraint solver.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nstg
{

// ============================================================================
// Value Kind
// ============================================================================

/**
 * Kind of dynamic value.
 */
enum class ValueKind {
  Number,   ///< IEEE-754 double (carries NaN / negative-zero flags)
  String,   ///< UTF-8 string
  Boolean,  ///< Boolean
  Null,     ///< null / absent value
  Array,    ///< Ordered list of values
  Object,   ///< Ordered list of (key, value) members
};

// ============================================================================
// Value
// ============================================================================

/**
 * Dynamic value.
 *
 * Numbers are stored as double. The NaN and negative-zero flags are
 * computed once at construction so that region predicates never need to
 * inspect the bit pattern again.
 *
 * Equality is same-value equality: NaN equals NaN and -0 differs from +0.
 */
class Value
{
public:
  using Member = std::pair<std::string, Value>;

  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  /// Create a number
  static Value make_number(double value);

  /// Create a string (UTF-8)
  static Value make_string(std::string value);

  /// Create a boolean
  static Value make_bool(bool value);

  /// Create null
  static Value make_null();

  /// Create an array
  static Value make_array(std::vector<Value> elements);

  /// Create an object (member order is preserved)
  static Value make_object(std::vector<Member> members);

  /// Default constructor creates null
  Value() = default;

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] ValueKind kind() const noexcept { return kind_; }

  [[nodiscard]] bool is_number() const noexcept { return kind_ == ValueKind::Number; }
  [[nodiscard]] bool is_string() const noexcept { return kind_ == ValueKind::String; }
  [[nodiscard]] bool is_bool() const noexcept { return kind_ == ValueKind::Boolean; }
  [[nodiscard]] bool is_null() const noexcept { return kind_ == ValueKind::Null; }
  [[nodiscard]] bool is_array() const noexcept { return kind_ == ValueKind::Array; }
  [[nodiscard]] bool is_object() const noexcept { return kind_ == ValueKind::Object; }

  // ===========================================================================
  // Number Flags
  // ===========================================================================

  [[nodiscard]] bool is_nan() const noexcept { return is_nan_; }
  [[nodiscard]] bool is_negative_zero() const noexcept { return is_negative_zero_; }

  /// True for numbers that are neither NaN nor infinite
  [[nodiscard]] bool is_finite() const noexcept;

  /// True for finite numbers without a fractional part
  [[nodiscard]] bool is_integral() const noexcept;

  // ===========================================================================
  // Value Accessors
  // ===========================================================================

  /// Get number (only valid if is_number())
  [[nodiscard]] double as_number() const noexcept { return number_; }

  /// Get boolean (only valid if is_bool())
  [[nodiscard]] bool as_bool() const noexcept { return bool_; }

  /// Get string (only valid if is_string())
  [[nodiscard]] const std::string & as_string() const noexcept { return string_; }

  /// Get array elements (only valid if is_array())
  [[nodiscard]] const std::vector<Value> & as_array() const noexcept { return elements_; }

  /// Get object members (only valid if is_object())
  [[nodiscard]] const std::vector<Member> & as_object() const noexcept { return members_; }

  /// Look up an object member by key
  [[nodiscard]] const Value * find_member(std::string_view key) const;

  /// Number of Unicode code points in a string value
  [[nodiscard]] std::size_t string_length() const;

  // ===========================================================================
  // Comparison / Display
  // ===========================================================================

  /// Same-value equality (NaN == NaN, -0 != +0)
  [[nodiscard]] bool same_value(const Value & other) const;

  friend bool operator==(const Value & a, const Value & b) { return a.same_value(b); }
  friend bool operator!=(const Value & a, const Value & b) { return !a.same_value(b); }

  /// Human-readable rendering ("NaN", "-0", "\"abc\"", "[1, 2]")
  [[nodiscard]] std::string to_display_string() const;

private:
  ValueKind kind_ = ValueKind::Null;
  double number_ = 0.0;
  bool is_nan_ = false;
  bool is_negative_zero_ = false;
  bool bool_ = false;
  std::string string_;
  std::vector<Value> elements_;
  std::vector<Member> members_;
};

/// Number of Unicode code points in a UTF-8 string
[[nodiscard]] std::size_t utf8_length(std::string_view text) noexcept;

/// Format a double the way region ids and explanations print numbers
/// ("NaN", "Infinity", "-0", "10", "0.5")
[[nodiscard]] std::string format_number(double value);

/// Parse literal source text ("42", "\"hi\"", "true", "null") into a value
[[nodiscard]] std::optional<Value> parse_literal_value(std::string_view text);

}  // namespace nstg
