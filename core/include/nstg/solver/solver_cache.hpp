// nstg/solver/solver_cache.hpp - Time-limited cache of solver results
//
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "nstg/solver/solver_result.hpp"
#include "nstg/types/type_node.hpp"

namespace nstg
{

/**
 * Cache of successful solver results keyed by constraint list.
 *
 * Entries expire after `ttl`. When full, the oldest-inserted entry is
 * evicted (lookups do not refresh an entry's position).
 */
class SolverCache
{
public:
  using Clock = std::chrono::steady_clock;
  using ClockFn = std::function<Clock::time_point()>;

  static constexpr std::chrono::milliseconds k_default_ttl{3'600'000};

  explicit SolverCache(
    std::size_t max_size = 1000, std::chrono::milliseconds ttl = k_default_ttl,
    ClockFn clock = &Clock::now);

  /**
   * Deterministic key for a constraint list.
   *
   * Only the fields belonging to each constraint's kind are serialized, so
   * descriptions and stale fields of other kinds never fragment the cache.
   */
  [[nodiscard]] static std::string make_key(const std::vector<TypeConstraint> & constraints);

  /// Fresh entry for `key`; expired entries are dropped on lookup
  [[nodiscard]] std::optional<SolverResult> get(const std::string & key);

  void put(const std::string & key, const SolverResult & result);

  void clear();

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] std::size_t max_size() const noexcept { return max_size_; }

private:
  struct Entry
  {
    SolverResult result;
    Clock::time_point inserted_at;
    std::list<std::string>::iterator order_pos;
  };

  void erase(const std::string & key);

  std::size_t max_size_;
  std::chrono::milliseconds ttl_;
  ClockFn clock_;
  std::unordered_map<std::string, Entry> entries_;
  std::list<std::string> insertion_order_;
};

}  // namespace nstg
