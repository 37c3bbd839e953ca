#pragma once

#include "event.hpp"
#include <atomic>

namespace devlink {
    namespace util {

        // ─── State machine with an atomically readable state ─────────────────────────
        // Transitions are driven from one context; any thread may read state().
        template <typename StateEnum> class StateMachine {
            std::atomic<StateEnum> state_;

          public:
            explicit StateMachine(StateEnum initial) : state_(initial) {}

            StateEnum state() const noexcept { return state_.load(std::memory_order_acquire); }

            // Returns the previous state
            StateEnum transition(StateEnum new_state) {
                StateEnum old = state_.exchange(new_state, std::memory_order_acq_rel);
                if (old != new_state) {
                    on_transition.emit(old, new_state);
                }
                return old;
            }

            bool is(StateEnum s) const noexcept { return state() == s; }

            Event<StateEnum, StateEnum> on_transition; // (from, to)
        };

    } // namespace util
    using namespace util;
} // namespace devlink
