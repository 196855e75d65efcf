// nstg/space/region.cpp - Region kind helpers
//
#include "nstg/space/region.hpp"

namespace nstg
{

ValueFamily family_of(RegionKind kind) noexcept
{
  switch (kind) {
    case RegionKind::NumberSpecial:
    case RegionKind::NumberNegativeInfinity:
    case RegionKind::NumberNegative:
    case RegionKind::NumberZero:
    case RegionKind::NumberPositive:
    case RegionKind::NumberPositiveInfinity:
    case RegionKind::NumberRange:
      return ValueFamily::Number;
    case RegionKind::StringEmpty:
    case RegionKind::StringSpecial:
    case RegionKind::StringSingle:
    case RegionKind::StringShort:
    case RegionKind::StringMedium:
    case RegionKind::StringLong:
    case RegionKind::StringVeryLong:
    case RegionKind::StringLength:
    case RegionKind::StringPattern:
      return ValueFamily::String;
    case RegionKind::BooleanTrue:
    case RegionKind::BooleanFalse:
      return ValueFamily::Boolean;
    case RegionKind::Null:
    case RegionKind::Undefined:
      return ValueFamily::Null;
    case RegionKind::Literal:
      return ValueFamily::Literal;
    case RegionKind::ArrayEmpty:
    case RegionKind::ArraySingle:
    case RegionKind::ArrayMultiple:
    case RegionKind::ArrayLength:
      return ValueFamily::Array;
    case RegionKind::ObjectEmpty:
    case RegionKind::ObjectPartial:
    case RegionKind::ObjectComplete:
      return ValueFamily::Object;
    case RegionKind::UnknownPrimitive:
    case RegionKind::AnyUniverse:
    case RegionKind::Unknown:
      return ValueFamily::CatchAll;
    case RegionKind::VoidInput:
      return ValueFamily::Void;
    case RegionKind::Compound:
      return ValueFamily::Compound;
  }
  return ValueFamily::CatchAll;
}

const char * to_string(RegionKind kind) noexcept
{
  switch (kind) {
    case RegionKind::NumberSpecial:
      return "number-special";
    case RegionKind::NumberNegativeInfinity:
      return "number-negative-infinity";
    case RegionKind::NumberNegative:
      return "number-negative";
    case RegionKind::NumberZero:
      return "number-zero";
    case RegionKind::NumberPositive:
      return "number-positive";
    case RegionKind::NumberPositiveInfinity:
      return "number-positive-infinity";
    case RegionKind::NumberRange:
      return "number-range";
    case RegionKind::StringEmpty:
      return "string-empty";
    case RegionKind::StringSpecial:
      return "string-special";
    case RegionKind::StringSingle:
      return "string-single";
    case RegionKind::StringShort:
      return "string-short";
    case RegionKind::StringMedium:
      return "string-medium";
    case RegionKind::StringLong:
      return "string-long";
    case RegionKind::StringVeryLong:
      return "string-very-long";
    case RegionKind::StringLength:
      return "string-length";
    case RegionKind::StringPattern:
      return "string-pattern";
    case RegionKind::BooleanTrue:
      return "boolean-true";
    case RegionKind::BooleanFalse:
      return "boolean-false";
    case RegionKind::Null:
      return "null";
    case RegionKind::Undefined:
      return "undefined";
    case RegionKind::Literal:
      return "literal";
    case RegionKind::ArrayEmpty:
      return "array-empty";
    case RegionKind::ArraySingle:
      return "array-single";
    case RegionKind::ArrayMultiple:
      return "array-multiple";
    case RegionKind::ArrayLength:
      return "array-length";
    case RegionKind::ObjectEmpty:
      return "object-empty";
    case RegionKind::ObjectPartial:
      return "object-partial";
    case RegionKind::ObjectComplete:
      return "object-complete";
    case RegionKind::UnknownPrimitive:
      return "unknown-primitive";
    case RegionKind::AnyUniverse:
      return "any-universe";
    case RegionKind::Unknown:
      return "unknown";
    case RegionKind::VoidInput:
      return "void-input";
    case RegionKind::Compound:
      return "compound";
  }
  return "unknown";
}

}  // namespace nstg
