// nstg/solver/solver_cache.cpp - Time-limited cache of solver results
//
#include "nstg/solver/solver_cache.hpp"

#include <fmt/core.h>

#include <iterator>
#include <utility>

namespace nstg
{

namespace
{

/// Exact, kind-tagged serialization; strings are length-prefixed and never escaped
void append_value_key(std::string & key, const Value & value)
{
  switch (value.kind()) {
    case ValueKind::Null:
      key += 'z';
      break;
    case ValueKind::Boolean:
      key += value.as_bool() ? "b1" : "b0";
      break;
    case ValueKind::Number:
      key += 'n';
      key += format_number(value.as_number());
      break;
    case ValueKind::String:
      key += fmt::format("s{}:", value.as_string().size());
      key += value.as_string();
      break;
    case ValueKind::Array:
      key += fmt::format("a{}[", value.as_array().size());
      for (const auto & element : value.as_array()) append_value_key(key, element);
      key += ']';
      break;
    case ValueKind::Object:
      key += fmt::format("o{}{{", value.as_object().size());
      for (const auto & [name, member] : value.as_object()) {
        key += fmt::format("{}:", name.size());
        key += name;
        append_value_key(key, member);
      }
      key += '}';
      break;
  }
  key += ';';
}

}  // namespace

SolverCache::SolverCache(std::size_t max_size, std::chrono::milliseconds ttl, ClockFn clock)
: max_size_(max_size), ttl_(ttl), clock_(std::move(clock))
{
}

std::string SolverCache::make_key(const std::vector<TypeConstraint> & constraints)
{
  std::string key = "[";
  for (const auto & c : constraints) {
    switch (c.kind) {
      case ConstraintKind::Range:
        key += fmt::format("{{range:{},{}}}", format_number(c.min), format_number(c.max));
        break;
      case ConstraintKind::Length:
        key += fmt::format(
          "{{length:{},{}}}", c.min_length,
          c.max_length ? std::to_string(*c.max_length) : std::string("*"));
        break;
      case ConstraintKind::Pattern:
        key += fmt::format("{{pattern:{}:{}}}", c.pattern.size(), c.pattern);
        break;
      case ConstraintKind::Enum: {
        key += "{enum:";
        for (const auto & v : c.values) append_value_key(key, v);
        key += "}";
        break;
      }
    }
  }
  key += "]";
  return key;
}

std::optional<SolverResult> SolverCache::get(const std::string & key)
{
  auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;

  if (clock_() - it->second.inserted_at >= ttl_) {
    erase(key);
    return std::nullopt;
  }
  return it->second.result;
}

void SolverCache::put(const std::string & key, const SolverResult & result)
{
  if (max_size_ == 0) return;

  erase(key);
  while (entries_.size() >= max_size_ && !insertion_order_.empty()) {
    const std::string oldest = insertion_order_.front();
    erase(oldest);
  }

  insertion_order_.push_back(key);
  entries_.emplace(key, Entry{result, clock_(), std::prev(insertion_order_.end())});
}

void SolverCache::clear()
{
  entries_.clear();
  insertion_order_.clear();
}

void SolverCache::erase(const std::string & key)
{
  auto it = entries_.find(key);
  if (it == entries_.end()) return;
  insertion_order_.erase(it->second.order_pos);
  entries_.erase(it);
}

}  // namespace nstg
