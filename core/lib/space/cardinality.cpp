// nstg/space/cardinality.cpp - Region size arithmetic
//
#include "nstg/space/cardinality.hpp"

#include <limits>

namespace nstg
{

Cardinality Cardinality::operator+(const Cardinality & other) const noexcept
{
  if (infinite_ || other.infinite_) return infinite();
  if (count_ > std::numeric_limits<uint64_t>::max() - other.count_) return infinite();
  return finite(count_ + other.count_);
}

Cardinality Cardinality::operator*(const Cardinality & other) const noexcept
{
  if (infinite_ || other.infinite_) return infinite();
  if (count_ == 0 || other.count_ == 0) return finite(0);
  if (count_ > std::numeric_limits<uint64_t>::max() / other.count_) return infinite();
  return finite(count_ * other.count_);
}

Cardinality & Cardinality::operator+=(const Cardinality & other) noexcept
{
  *this = *this + other;
  return *this;
}

bool Cardinality::operator<(const Cardinality & other) const noexcept
{
  if (infinite_) return false;
  if (other.infinite_) return true;
  return count_ < other.count_;
}

std::string Cardinality::to_string() const
{
  if (infinite_) return "infinite";
  return std::to_string(count_);
}

}  // namespace nstg
