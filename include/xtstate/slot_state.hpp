#ifndef XTSTATE_SLOT_STATE_HPP
#define XTSTATE_SLOT_STATE_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory_resource>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "allocator.hpp"
#include "concepts.hpp"
#include "errors.hpp"
#include "history.hpp"
#include "policies.hpp"

namespace xtstate {

// =============================================================================
// Slot Table
// =============================================================================

// Transparent hash so lookups by std::string_view do not allocate
struct identifier_hash {
  using is_transparent = void;

  std::size_t operator()(std::string_view identifier) const noexcept {
    return std::hash<std::string_view>{}(identifier);
  }
};

using slot_table =
    std::pmr::unordered_map<std::pmr::string, bool, identifier_hash, std::equal_to<>>;

// =============================================================================
// Slot State - Named boolean slots with activation and history
// =============================================================================
//
// Lifecycle:
//   uninitialized --setup_slots--> idle <--update_callback--> activated
//   idle/activated --setup_slots(force)--> idle (history cleared)
//
// Not synchronized. Share between threads through sync_slot_state.
//
// Every operation either completes or throws slot_state_error leaving the
// instance unchanged.

template <ClockPolicy Clock = system_clock_policy> class slot_state {
  slot_table slots_;
  history_log history_;
  bool is_setup_{false};
  bool activated_{false};
  std::uint64_t generation_{0};

  bool all_slots_set() const {
    return std::ranges::all_of(slots_,
                               [](const auto &slot) { return slot.second; });
  }

public:
  using clock_policy = Clock;

  explicit slot_state(std::pmr::memory_resource *resource = mi_resource())
      : slots_(resource), history_(resource) {}

  // Register the full slot set, every slot starting false. A second call
  // throws already_setup unless force is set, in which case slots, history
  // and activation are discarded first.
  template <SlotIdentifierRange R>
  void setup_slots(R &&slots, bool force = false) {
    if (is_setup_ && !force) {
      throw slot_state_error(slot_state_errc::already_setup);
    }

    slot_table fresh(slots_.get_allocator());
    for (auto &&identifier : slots) {
      fresh.emplace(std::string_view(identifier), false);
    }

    // Commit; nothing below throws
    slots_.swap(fresh);
    history_.clear();
    activated_ = false;
    is_setup_ = true;
    ++generation_;
  }

  void setup_slots(std::initializer_list<std::string_view> slots,
                   bool force = false) {
    setup_slots(std::ranges::subrange(slots.begin(), slots.end()), force);
  }

  // Set one slot, append a history entry stamped with Clock::now_ms() and
  // recompute activation. Repeating a value still appends.
  void update_callback(std::string_view identifier, bool value) {
    if (!is_setup_) {
      throw slot_state_error(slot_state_errc::not_setup);
    }
    // Checked ahead of the lookup: with an empty table every identifier is
    // unknown, and the empty table is the error callers need to see.
    if (slots_.empty()) {
      throw slot_state_error(slot_state_errc::no_slots_defined);
    }

    auto slot = slots_.find(identifier);
    if (slot == slots_.end()) {
      throw slot_state_error(slot_state_errc::unknown_identifier, identifier);
    }

    history_.emplace_back(std::pmr::string(identifier, resource()), value,
                          Clock::now_ms());
    slot->second = value;
    activated_ = all_slots_set();
    ++generation_;
  }

  // Cached result of the last update; O(1)
  bool activated() const noexcept { return activated_; }

  bool is_setup() const noexcept { return is_setup_; }

  // Count of committed setups and updates; failed calls leave it alone
  std::uint64_t generation() const noexcept { return generation_; }

  const history_log &history() const noexcept { return history_; }

  std::size_t slot_count() const noexcept { return slots_.size(); }

  bool contains(std::string_view identifier) const {
    return slots_.find(identifier) != slots_.end();
  }

  // Current value of a slot, nullopt if it was never registered
  std::optional<bool> slot_value(std::string_view identifier) const {
    auto slot = slots_.find(identifier);
    if (slot == slots_.end()) {
      return std::nullopt;
    }
    return slot->second;
  }

  std::pmr::memory_resource *resource() const noexcept {
    return slots_.get_allocator().resource();
  }
};

// =============================================================================
// Type Aliases
// =============================================================================

using xt_state = slot_state<system_clock_policy>;

} // namespace xtstate

#endif // XTSTATE_SLOT_STATE_HPP
