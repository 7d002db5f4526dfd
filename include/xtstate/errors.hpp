#ifndef XTSTATE_ERRORS_HPP
#define XTSTATE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace xtstate {

// =============================================================================
// Lifecycle Errors
// =============================================================================

enum class slot_state_errc {
  already_setup,
  not_setup,
  unknown_identifier,
  no_slots_defined,
};

inline const char *to_string(slot_state_errc kind) noexcept {
  switch (kind) {
  case slot_state_errc::already_setup:
    return "already_setup";
  case slot_state_errc::not_setup:
    return "not_setup";
  case slot_state_errc::unknown_identifier:
    return "unknown_identifier";
  case slot_state_errc::no_slots_defined:
    return "no_slots_defined";
  }
  return "unknown";
}

// Thrown when an operation is called outside its lifecycle. The instance is
// left exactly as it was before the call.
class slot_state_error : public std::logic_error {
  slot_state_errc kind_;
  std::string identifier_;

  static std::string describe(slot_state_errc kind, std::string_view identifier) {
    switch (kind) {
    case slot_state_errc::already_setup:
      return "xtstate is already set up. use force to override.";
    case slot_state_errc::not_setup:
      return "xtstate is not set up. call setup_slots first.";
    case slot_state_errc::unknown_identifier:
      return "identifier '" + std::string(identifier) +
             "' is not defined in the slots.";
    case slot_state_errc::no_slots_defined:
      return "no slots are defined. call setup_slots with valid slots.";
    }
    return "xtstate error";
  }

public:
  explicit slot_state_error(slot_state_errc kind, std::string_view identifier = {})
      : std::logic_error(describe(kind, identifier)), kind_(kind),
        identifier_(identifier) {}

  slot_state_errc kind() const noexcept { return kind_; }

  // Offending identifier for unknown_identifier, empty otherwise
  const std::string &identifier() const noexcept { return identifier_; }
};

// =============================================================================
// Lock Errors
// =============================================================================

// Thrown by the thread-safe wrapper after an exception escaped a with_lock
// callback. Distinct from slot_state_error: the engine may hold a half-applied
// mutation made by user code.
struct lock_poisoned_error : std::runtime_error {
  lock_poisoned_error()
      : std::runtime_error(
            "xtstate lock is poisoned: a previous holder failed while locked") {}
};

} // namespace xtstate

#endif // XTSTATE_ERRORS_HPP
