#ifndef XTSTATE_CONCEPTS_HPP
#define XTSTATE_CONCEPTS_HPP

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string_view>
#include <type_traits>

namespace xtstate {

// =============================================================================
// Lockable Concepts (std::mutex-like)
// =============================================================================

template <typename T>
concept BasicLockable = requires(T m) {
  { m.lock() } -> std::same_as<void>;
  { m.unlock() } -> std::same_as<void>;
};

template <typename T>
concept Lockable = BasicLockable<T> && requires(T m) {
  { m.try_lock() } -> std::convertible_to<bool>;
};

template <typename T>
concept SharedLockable = Lockable<T> && requires(T m) {
  { m.lock_shared() } -> std::same_as<void>;
  { m.unlock_shared() } -> std::same_as<void>;
  { m.try_lock_shared() } -> std::convertible_to<bool>;
};

// =============================================================================
// Policy Concepts
// =============================================================================

template <typename P>
concept LockPolicy = Lockable<typename P::mutex_type> && requires {
  typename P::lock_type;
};

template <typename P>
concept SharedLockPolicy = LockPolicy<P> && requires {
  typename P::shared_lock_type;
};

template <typename P>
concept ClockPolicy = requires {
  { P::now_ms() } -> std::convertible_to<std::int64_t>;
};

// =============================================================================
// Slot Concepts
// =============================================================================

template <typename T>
concept SlotIdentifier = std::convertible_to<T, std::string_view>;

// Any input range whose elements name slots (std::set<std::string>,
// std::vector<std::string_view>, std::unordered_set<std::string>, ...).
template <typename R>
concept SlotIdentifierRange =
    std::ranges::input_range<R> &&
    SlotIdentifier<std::ranges::range_reference_t<R>>;

template <typename S>
concept SlotStateReader = requires(const S s, std::string_view id) {
  { s.activated() } -> std::convertible_to<bool>;
  { s.is_setup() } -> std::convertible_to<bool>;
  { s.slot_count() } -> std::convertible_to<std::size_t>;
  { s.contains(id) } -> std::convertible_to<bool>;
  { s.slot_value(id) } -> std::convertible_to<std::optional<bool>>;
};

template <typename S>
concept SlotStateWriter = requires(S s, std::string_view id, bool value) {
  { s.update_callback(id, value) } -> std::same_as<void>;
};

template <typename S>
concept SlotState = SlotStateReader<S> && SlotStateWriter<S>;

// =============================================================================
// Type Traits for Detection
// =============================================================================

template <typename T>
struct is_lockable : std::bool_constant<Lockable<T>> {};

template <typename T>
inline constexpr bool is_lockable_v = is_lockable<T>::value;

} // namespace xtstate

#endif // XTSTATE_CONCEPTS_HPP
