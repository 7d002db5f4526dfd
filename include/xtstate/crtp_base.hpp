#ifndef XTSTATE_CRTP_BASE_HPP
#define XTSTATE_CRTP_BASE_HPP

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

#include "concepts.hpp"
#include "errors.hpp"
#include "policies.hpp"

namespace xtstate {

// =============================================================================
// Guarded Base - One lock around the derived state, with poisoning
// =============================================================================
//
// A section run through guarded() that exits by any exception other than
// slot_state_error marks the primitive poisoned; every later acquisition
// throws lock_poisoned_error until clear_poison(). Only user callbacks run
// through guarded(): the engine's own calls give the strong guarantee, and each
// slot_state_error leaves every earlier committed call intact.

template <typename Derived, LockPolicy Lock = mutex_lock_policy>
class guarded_base {
protected:
  using mutex_type = typename Lock::mutex_type;
  using lock_type = typename Lock::lock_type;

  mutable mutex_type mutex_;
  std::atomic<bool> poisoned_{false};

  void throw_if_poisoned() const {
    if (poisoned_.load(std::memory_order_acquire)) {
      throw lock_poisoned_error{};
    }
  }

  // Exclusive lock. std::system_error from the mutex propagates unchanged.
  lock_type acquire() const {
    lock_type lock(mutex_);
    throw_if_poisoned();
    return lock;
  }

  // Exclusive lock without blocking; nullopt when another holder has it
  std::optional<lock_type> try_acquire() const {
    lock_type lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
      return std::nullopt;
    }
    throw_if_poisoned();
    return std::optional<lock_type>(std::move(lock));
  }

  // Shared lock where the policy has one, exclusive otherwise
  auto acquire_shared() const {
    if constexpr (SharedLockPolicy<Lock>) {
      typename Lock::shared_lock_type lock(mutex_);
      throw_if_poisoned();
      return lock;
    } else {
      return acquire();
    }
  }

  void poison() noexcept {
    if (!poisoned_.exchange(true, std::memory_order_acq_rel)) {
      std::fprintf(stderr, "[xtstate] lock poisoned: critical section failed\n");
    }
  }

  // Run a user callback that must be called with the exclusive lock held
  template <typename Func> decltype(auto) guarded(Func &&func) {
    try {
      return std::invoke(std::forward<Func>(func));
    } catch (const slot_state_error &) {
      throw;
    } catch (...) {
      poison();
      throw;
    }
  }

public:
  guarded_base() = default;
  ~guarded_base() = default;

  guarded_base(const guarded_base &) = delete;
  guarded_base &operator=(const guarded_base &) = delete;
  guarded_base(guarded_base &&) = delete;
  guarded_base &operator=(guarded_base &&) = delete;

  bool is_poisoned() const noexcept {
    return poisoned_.load(std::memory_order_acquire);
  }

  void clear_poison() noexcept {
    if (poisoned_.exchange(false, std::memory_order_acq_rel)) {
      std::fprintf(stderr, "[xtstate] lock poison cleared\n");
    }
  }
};

// =============================================================================
// Version Tracking Mixin - For change detection
// =============================================================================

template <typename Derived> class version_tracking_mixin {
protected:
  std::atomic<std::uint64_t> version_{0};

  void increment_version(std::uint64_t by = 1) noexcept {
    version_.fetch_add(by, std::memory_order_release);
  }

public:
  std::uint64_t version() const {
    return version_.load(std::memory_order_acquire);
  }

  bool has_changed_since(std::uint64_t since_version) const {
    return version() != since_version;
  }
};

} // namespace xtstate

#endif // XTSTATE_CRTP_BASE_HPP
