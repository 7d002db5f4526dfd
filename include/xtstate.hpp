#ifndef XTSTATE_HPP
#define XTSTATE_HPP

// =============================================================================
// xtstate
// =============================================================================
//
// Named boolean slots with an activation flag and a timestamped change
// history. Workers check in by setting their slot; the state is activated
// while every registered slot is true.
//
// - slot_state: the unsynchronized engine
// - sync_slot_state: the engine behind one lock (policy-selected), with
//   poisoning and change versions
// - thread_safe_slot_state: std::shared_ptr handle to a shared_slot_state
//
// =============================================================================

// Foundation headers
#include "xtstate/allocator.hpp"
#include "xtstate/concepts.hpp"
#include "xtstate/errors.hpp"
#include "xtstate/policies.hpp"
#include "xtstate/crtp_base.hpp"

// Engine headers
#include "xtstate/history.hpp"
#include "xtstate/slot_state.hpp"
#include "xtstate/shared_slot_state.hpp"

#endif // XTSTATE_HPP
