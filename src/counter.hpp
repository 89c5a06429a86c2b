#pragma once

#include "common.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace crdtsim
{
    enum class CounterOp : std::uint8_t
    {
        Increment = 1,
        Decrement = 2,
    };

    // Operation-based PN counter. Addition commutes, so every delivery order converges.
    struct CounterVariant
    {
        using State = std::int64_t;
        using Operation = CounterOp;

        static constexpr std::string_view name = "counter";

        static State initial_state() { return 0; }

        static State apply(const Operation &op, State state)
        {
            switch (op)
            {
            case CounterOp::Increment:
                return state + 1;
            case CounterOp::Decrement:
                return state - 1;
            }
            return state;
        }

        static State apply_local(const Operation &op, State state) { return apply(op, state); }

        // Local precondition for emitting `op`. The plain counter has none.
        static bool admit(const Operation &, const State &) { return true; }

        static void validate(const Operation &, const State &) {}
        static void validate_local(const Operation &, const State &) {}
        static void check_invariants(const State &) {}

        static std::size_t deferred(const State &) { return 0; }

        static bool equivalent(const State &a, const State &b) { return a == b; }

        static std::string describe(const Operation &op)
        {
            return (op == CounterOp::Increment) ? "increment" : "decrement";
        }

        static std::string render(const State &state) { return std::to_string(state); }
    };

    // Counter whose author refuses to decrement below zero, while receivers apply every
    // decrement they get. Replicas that each pass the guard locally can end on different
    // totals; receivers must not clamp.
    struct GuardedCounterVariant : CounterVariant
    {
        static constexpr std::string_view name = "guarded";

        static bool admit(const Operation &op, const State &state)
        {
            return !(op == CounterOp::Decrement && state == 0);
        }
    };
}
