#ifndef XTSTATE_POLICIES_HPP
#define XTSTATE_POLICIES_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <shared_mutex>

namespace xtstate {

// =============================================================================
// Lock Policies
// =============================================================================

struct mutex_lock_policy {
  using mutex_type = std::mutex;
  using lock_type = std::unique_lock<std::mutex>;
};

struct shared_mutex_lock_policy {
  using mutex_type = std::shared_mutex;
  using lock_type = std::unique_lock<std::shared_mutex>;
  using shared_lock_type = std::shared_lock<std::shared_mutex>;
};

struct spinlock {
  void lock() noexcept {
    while (flag_.test_and_set(std::memory_order_acquire)) {
      while (flag_.test(std::memory_order_relaxed)) {
      }
    }
  }

  bool try_lock() noexcept {
    return !flag_.test_and_set(std::memory_order_acquire);
  }

  void unlock() noexcept { flag_.clear(std::memory_order_release); }

private:
  std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
};

struct spinlock_policy {
  using mutex_type = spinlock;
  using lock_type = std::unique_lock<spinlock>;
};

// =============================================================================
// Clock Policies
// =============================================================================

// Milliseconds since the Unix epoch, wall clock. Not monotonic: history
// timestamps must not be used for strict ordering.
struct system_clock_policy {
  static std::int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }
};

} // namespace xtstate

#endif // XTSTATE_POLICIES_HPP
