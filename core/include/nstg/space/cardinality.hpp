// nstg/space/cardinality.hpp - Region size arithmetic
//
#pragma once

#include <cstdint>
#include <string>

namespace nstg
{

/**
 * Size of a region: a non-negative integer or `infinite`.
 *
 * Sum and product are infinite-absorbing. Finite overflow saturates to
 * infinite, so arithmetic never wraps.
 */
class Cardinality
{
public:
  /// Zero
  constexpr Cardinality() noexcept = default;

  static constexpr Cardinality finite(uint64_t count) noexcept { return Cardinality(count, false); }
  static constexpr Cardinality infinite() noexcept { return Cardinality(0, true); }

  [[nodiscard]] constexpr bool is_infinite() const noexcept { return infinite_; }
  [[nodiscard]] constexpr bool is_finite() const noexcept { return !infinite_; }

  /// Count (only meaningful when finite)
  [[nodiscard]] constexpr uint64_t count() const noexcept { return count_; }

  /// True when finite and <= limit
  [[nodiscard]] constexpr bool at_most(uint64_t limit) const noexcept
  {
    return !infinite_ && count_ <= limit;
  }

  [[nodiscard]] Cardinality operator+(const Cardinality & other) const noexcept;
  [[nodiscard]] Cardinality operator*(const Cardinality & other) const noexcept;

  Cardinality & operator+=(const Cardinality & other) noexcept;

  /// Strict weak order: finite values ascending, infinite last
  [[nodiscard]] bool operator<(const Cardinality & other) const noexcept;

  [[nodiscard]] bool operator==(const Cardinality & other) const noexcept
  {
    return infinite_ == other.infinite_ && count_ == other.count_;
  }
  [[nodiscard]] bool operator!=(const Cardinality & other) const noexcept
  {
    return !(*this == other);
  }

  /// "11" or "infinite"
  [[nodiscard]] std::string to_string() const;

private:
  constexpr Cardinality(uint64_t count, bool infinite) noexcept : count_(count), infinite_(infinite)
  {
  }

  uint64_t count_ = 0;
  bool infinite_ = false;
};

}  // namespace nstg
