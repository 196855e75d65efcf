// nstg/types/value.cpp - Dynamic value implementation
//
#include "nstg/types/value.hpp"

#include <fmt/core.h>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace nstg
{

// ============================================================================
// Factory Methods
// ============================================================================

Value Value::make_number(double value)
{
  Value v;
  v.kind_ = ValueKind::Number;
  v.number_ = value;
  v.is_nan_ = std::isnan(value);
  v.is_negative_zero_ = value == 0.0 && std::signbit(value);
  return v;
}

Value Value::make_string(std::string value)
{
  Value v;
  v.kind_ = ValueKind::String;
  v.string_ = std::move(value);
  return v;
}

Value Value::make_bool(bool value)
{
  Value v;
  v.kind_ = ValueKind::Boolean;
  v.bool_ = value;
  return v;
}

Value Value::make_null() { return Value{}; }

Value Value::make_array(std::vector<Value> elements)
{
  Value v;
  v.kind_ = ValueKind::Array;
  v.elements_ = std::move(elements);
  return v;
}

Value Value::make_object(std::vector<Member> members)
{
  Value v;
  v.kind_ = ValueKind::Object;
  v.members_ = std::move(members);
  return v;
}

// ============================================================================
// Queries
// ============================================================================

bool Value::is_finite() const noexcept { return is_number() && std::isfinite(number_); }

bool Value::is_integral() const noexcept
{
  return is_finite() && std::trunc(number_) == number_;
}

const Value * Value::find_member(std::string_view key) const
{
  for (const auto & [name, value] : members_) {
    if (name == key) return &value;
  }
  return nullptr;
}

std::size_t Value::string_length() const { return utf8_length(string_); }

bool Value::same_value(const Value & other) const
{
  if (kind_ != other.kind_) return false;

  switch (kind_) {
    case ValueKind::Number:
      if (is_nan_ || other.is_nan_) return is_nan_ && other.is_nan_;
      if (is_negative_zero_ != other.is_negative_zero_) return false;
      return number_ == other.number_;
    case ValueKind::String:
      return string_ == other.string_;
    case ValueKind::Boolean:
      return bool_ == other.bool_;
    case ValueKind::Null:
      return true;
    case ValueKind::Array:
      if (elements_.size() != other.elements_.size()) return false;
      for (std::size_t i = 0; i < elements_.size(); ++i) {
        if (!elements_[i].same_value(other.elements_[i])) return false;
      }
      return true;
    case ValueKind::Object:
      if (members_.size() != other.members_.size()) return false;
      for (std::size_t i = 0; i < members_.size(); ++i) {
        if (members_[i].first != other.members_[i].first) return false;
        if (!members_[i].second.same_value(other.members_[i].second)) return false;
      }
      return true;
  }
  return false;
}

std::string Value::to_display_string() const
{
  switch (kind_) {
    case ValueKind::Number:
      return format_number(number_);
    case ValueKind::String: {
      // Long strings are abbreviated so descriptions stay readable
      if (utf8_length(string_) > 20) {
        return fmt::format("\"{}...\" (length {})", string_.substr(0, 17), utf8_length(string_));
      }
      std::string out = "\"";
      for (const char c : string_) {
        switch (c) {
          case '\n':
            out += "\\n";
            break;
          case '\r':
            out += "\\r";
            break;
          case '\t':
            out += "\\t";
            break;
          case '\0':
            out += "\\0";
            break;
          case '"':
            out += "\\\"";
            break;
          default:
            out += c;
        }
      }
      out += '"';
      return out;
    }
    case ValueKind::Boolean:
      return bool_ ? "true" : "false";
    case ValueKind::Null:
      return "null";
    case ValueKind::Array: {
      std::string out = "[";
      for (std::size_t i = 0; i < elements_.size(); ++i) {
        if (i > 0) out += ", ";
        out += elements_[i].to_display_string();
      }
      out += "]";
      return out;
    }
    case ValueKind::Object: {
      std::string out = "{";
      for (std::size_t i = 0; i < members_.size(); ++i) {
        if (i > 0) out += ", ";
        out += fmt::format("{}: {}", members_[i].first, members_[i].second.to_display_string());
      }
      out += "}";
      return out;
    }
  }
  return "?";
}

// ============================================================================
// Free Functions
// ============================================================================

std::size_t utf8_length(std::string_view text) noexcept
{
  std::size_t count = 0;
  for (const char c : text) {
    // Count every byte that is not a continuation byte (10xxxxxx)
    if ((static_cast<unsigned char>(c) & 0xC0U) != 0x80U) {
      ++count;
    }
  }
  return count;
}

std::string format_number(double value)
{
  if (std::isnan(value)) return "NaN";
  if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
  if (value == 0.0) return std::signbit(value) ? "-0" : "0";

  // Integral values within the exactly representable range print without ".0"
  if (std::trunc(value) == value && std::fabs(value) < 1e21) {
    return fmt::format("{:.0f}", value);
  }
  return fmt::format("{}", value);
}

std::optional<Value> parse_literal_value(std::string_view text)
{
  if (text.empty()) return std::nullopt;

  if (text == "true") return Value::make_bool(true);
  if (text == "false") return Value::make_bool(false);
  if (text == "null" || text == "undefined") return Value::make_null();

  // Quoted string literal
  if (text.size() >= 2) {
    const char first = text.front();
    const char last = text.back();
    if ((first == '"' || first == '\'' || first == '`') && last == first) {
      return Value::make_string(std::string(text.substr(1, text.size() - 2)));
    }
  }

  if (text == "NaN") return Value::make_number(std::numeric_limits<double>::quiet_NaN());
  if (text == "Infinity") return Value::make_number(std::numeric_limits<double>::infinity());
  if (text == "-Infinity") return Value::make_number(-std::numeric_limits<double>::infinity());

  // Numeric literal: must start like a number and the whole text must be consumed
  const std::string buffer(text);
  const auto lead = static_cast<unsigned char>(buffer.front());
  if (std::isdigit(lead) || lead == '-' || lead == '+' || lead == '.') {
    char * end = nullptr;
    errno = 0;
    const double number = std::strtod(buffer.c_str(), &end);
    if (end == buffer.c_str() + buffer.size() && errno != ERANGE && std::isfinite(number)) {
      return Value::make_number(number);
    }
  }

  // Anything else is treated as unquoted string text
  return Value::make_string(buffer);
}

}  // namespace nstg
