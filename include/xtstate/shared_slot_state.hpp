#ifndef XTSTATE_SHARED_SLOT_STATE_HPP
#define XTSTATE_SHARED_SLOT_STATE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <memory_resource>
#include <optional>
#include <ranges>
#include <string_view>
#include <type_traits>
#include <utility>

#include "allocator.hpp"
#include "concepts.hpp"
#include "crtp_base.hpp"
#include "policies.hpp"
#include "slot_state.hpp"

namespace xtstate {

// =============================================================================
// Sync Slot State - slot_state behind one lock
// =============================================================================
//
// Setup and update hold the exclusive lock for the whole call, so they are
// fully serialized and history order is lock acquisition order. Reads take the
// shared lock when the policy provides one. Nothing here waits for activation;
// poll activated() or version().

template <LockPolicy Lock = mutex_lock_policy,
          ClockPolicy Clock = system_clock_policy>
class sync_slot_state
    : public guarded_base<sync_slot_state<Lock, Clock>, Lock>,
      public version_tracking_mixin<sync_slot_state<Lock, Clock>> {
  using base_type = guarded_base<sync_slot_state<Lock, Clock>, Lock>;

public:
  using engine_type = slot_state<Clock>;
  using lock_policy = Lock;
  using clock_policy = Clock;

private:
  engine_type state_;

public:
  explicit sync_slot_state(std::pmr::memory_resource *resource = mi_resource())
      : state_(resource) {}

  template <SlotIdentifierRange R>
  void setup_slots(R &&slots, bool force = false) {
    auto lock = this->acquire();
    state_.setup_slots(std::forward<R>(slots), force);
    this->increment_version();
  }

  void setup_slots(std::initializer_list<std::string_view> slots,
                   bool force = false) {
    setup_slots(std::ranges::subrange(slots.begin(), slots.end()), force);
  }

  void update_callback(std::string_view identifier, bool value) {
    auto lock = this->acquire();
    state_.update_callback(identifier, value);
    this->increment_version();
  }

  // Returns false without touching the state if the lock is held elsewhere
  bool try_update(std::string_view identifier, bool value) {
    auto lock = this->try_acquire();
    if (!lock) {
      return false;
    }
    state_.update_callback(identifier, value);
    this->increment_version();
    return true;
  }

  bool activated() const {
    auto lock = this->acquire_shared();
    return state_.activated();
  }

  bool is_setup() const {
    auto lock = this->acquire_shared();
    return state_.is_setup();
  }

  std::size_t slot_count() const {
    auto lock = this->acquire_shared();
    return state_.slot_count();
  }

  bool contains(std::string_view identifier) const {
    auto lock = this->acquire_shared();
    return state_.contains(identifier);
  }

  std::optional<bool> slot_value(std::string_view identifier) const {
    auto lock = this->acquire_shared();
    return state_.slot_value(identifier);
  }

  std::size_t history_size() const {
    auto lock = this->acquire_shared();
    return state_.history().size();
  }

  // Copy of the history taken under the lock
  history_log history() const {
    auto lock = this->acquire_shared();
    return history_log(state_.history(), state_.resource());
  }

  // Run func against the engine while holding the exclusive lock. An exception
  // other than slot_state_error escaping func poisons this instance. The
  // version advances by the number of setups and updates func committed, on
  // every exit path. The lock is not recursive: func must not call back into
  // this wrapper.
  template <typename Func>
    requires std::invocable<Func, engine_type &>
  auto with_lock(Func &&func) -> std::invoke_result_t<Func, engine_type &> {
    struct version_sync {
      sync_slot_state &self;
      std::uint64_t since;

      ~version_sync() {
        self.increment_version(self.state_.generation() - since);
      }
    };

    auto lock = this->acquire();
    version_sync sync{*this, state_.generation()};
    return this->guarded([&]() -> decltype(auto) {
      return std::invoke(std::forward<Func>(func), state_);
    });
  }

  // Read-only counterpart of with_lock, under the shared lock
  template <typename Func>
    requires std::invocable<Func, const engine_type &>
  auto inspect(Func &&func) const
      -> std::invoke_result_t<Func, const engine_type &> {
    auto lock = this->acquire_shared();
    return std::invoke(std::forward<Func>(func), std::as_const(state_));
  }
};

// =============================================================================
// Type Aliases
// =============================================================================

using shared_slot_state = sync_slot_state<mutex_lock_policy>;

using read_mostly_slot_state = sync_slot_state<shared_mutex_lock_policy>;

using fast_slot_state = sync_slot_state<spinlock_policy>;

// Shared handle; every holder sees the same instance
using thread_safe_slot_state = std::shared_ptr<shared_slot_state>;

inline thread_safe_slot_state
make_thread_safe_slot_state(std::pmr::memory_resource *resource = mi_resource()) {
  return std::make_shared<shared_slot_state>(resource);
}

} // namespace xtstate

#endif // XTSTATE_SHARED_SLOT_STATE_HPP
