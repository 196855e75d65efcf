// nstg/space/special_values.cpp - Special and canonical boundary values
//
#include "nstg/space/special_values.hpp"

#include <algorithm>
#include <limits>
#include <string>

namespace nstg
{

double max_value() noexcept { return std::numeric_limits<double>::max(); }

double min_value() noexcept { return std::numeric_limits<double>::denorm_min(); }

double epsilon() noexcept { return std::numeric_limits<double>::epsilon(); }

const std::vector<Value> & special_number_values()
{
  static const std::vector<Value> values = {
    Value::make_number(std::numeric_limits<double>::quiet_NaN()),
    Value::make_number(std::numeric_limits<double>::infinity()),
    Value::make_number(-std::numeric_limits<double>::infinity()),
    Value::make_number(0.0),
    Value::make_number(-0.0),
    Value::make_number(max_value()),
    Value::make_number(min_value()),
  };
  return values;
}

const std::vector<Value> & special_string_values()
{
  static const std::vector<Value> values = {
    Value::make_string(""),
    Value::make_string(std::string(1, '\0')),
    Value::make_string("\xE2\x80\x8B"),  // zero width space
    Value::make_string("\xEF\xBB\xBF"),  // byte order mark
  };
  return values;
}

std::vector<Value> special_values_for(std::string_view primitive_name)
{
  if (primitive_name == "number") return special_number_values();
  if (primitive_name == "string") return special_string_values();
  return {};
}

bool is_special_value(const Value & value)
{
  const auto contains = [&value](const std::vector<Value> & set) {
    return std::any_of(
      set.begin(), set.end(), [&value](const Value & v) { return v.same_value(value); });
  };

  if (value.is_number()) return contains(special_number_values());
  if (value.is_string()) return contains(special_string_values());
  return false;
}

const std::vector<Value> & canonical_number_boundaries()
{
  static const std::vector<Value> values = {
    Value::make_number(0.0),
    Value::make_number(-1.0),
    Value::make_number(1.0),
    Value::make_number(k_min_safe_integer),
    Value::make_number(k_max_safe_integer),
    Value::make_number(min_value()),
    Value::make_number(max_value()),
    Value::make_number(epsilon()),
    Value::make_number(-epsilon()),
  };
  return values;
}

const std::vector<Value> & canonical_string_boundaries()
{
  static const std::vector<Value> values = {
    Value::make_string(""),
    Value::make_string("a"),
    Value::make_string("ab"),
    Value::make_string("abc"),
    Value::make_string(std::string(10, 'a')),
    Value::make_string(std::string(100, 'a')),
    Value::make_string(std::string(1000, 'a')),
    Value::make_string(std::string(10000, 'a')),
    Value::make_string("\n"),
    Value::make_string("\r\n"),
    Value::make_string("\t"),
    Value::make_string("  "),
    Value::make_string("\xE3\x81\x93\xE3\x82\x93\xE3\x81\xAB\xE3\x81\xA1\xE3\x81\xAF"),
    Value::make_string("\xF0\x9F\x91\x8B\xF0\x9F\x8C\x8D"),
  };
  return values;
}

const std::vector<Value> & canonical_boolean_boundaries()
{
  static const std::vector<Value> values = {Value::make_bool(true), Value::make_bool(false)};
  return values;
}

std::vector<Value> boundary_values_between(std::string_view type_a, std::string_view type_b)
{
  const auto either = [&](std::string_view name) { return type_a == name || type_b == name; };

  std::vector<Value> values;
  if (either("number")) {
    values.push_back(Value::make_number(0.0));
    values.push_back(Value::make_number(-1.0));
    values.push_back(Value::make_number(1.0));
    values.push_back(Value::make_number(k_min_safe_integer));
    values.push_back(Value::make_number(k_max_safe_integer));
    values.push_back(Value::make_number(min_value()));
    values.push_back(Value::make_number(max_value()));
    values.push_back(Value::make_number(-std::numeric_limits<double>::infinity()));
    values.push_back(Value::make_number(std::numeric_limits<double>::infinity()));
    values.push_back(Value::make_number(std::numeric_limits<double>::quiet_NaN()));
  }
  if (either("string")) {
    values.push_back(Value::make_string(""));
    values.push_back(Value::make_string("a"));
    values.push_back(Value::make_string(std::string(1, '\0')));
    values.push_back(Value::make_string("\n"));
    values.push_back(Value::make_string(std::string(1000, ' ')));
  }
  if (either("boolean")) {
    values.push_back(Value::make_bool(true));
    values.push_back(Value::make_bool(false));
  }
  return values;
}

}  // namespace nstg
