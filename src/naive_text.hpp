#pragma once

#include "common.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace crdtsim
{
    struct NaiveTextOp
    {
        enum class Kind : std::uint8_t
        {
            Insert = 1,
            Delete = 2,
        };

        Kind kind = Kind::Insert;
        std::size_t position = 0;
        char character = 0;     // Insert
        std::size_t length = 0; // Delete
    };

    // Plain string edited by absolute index. A received operation is interpreted against
    // whatever the local text currently is, so concurrent edits shift or corrupt each other.
    struct NaiveTextVariant
    {
        using State = std::string;
        using Operation = NaiveTextOp;

        static constexpr std::string_view name = "naive";

        static State initial_state() { return {}; }

        static State apply(const Operation &op, State state)
        {
            // Slice semantics: positions past the end clamp to the end.
            const std::size_t pos = std::min(op.position, state.size());
            switch (op.kind)
            {
            case NaiveTextOp::Kind::Insert:
                state.insert(pos, 1, op.character);
                break;
            case NaiveTextOp::Kind::Delete:
                state.erase(pos, op.length);
                break;
            }
            return state;
        }

        static State apply_local(const Operation &op, State state) { return apply(op, std::move(state)); }

        static bool admit(const Operation &, const State &) { return true; }

        static void validate(const Operation &, const State &) {}

        static void validate_local(const Operation &op, const State &state)
        {
            if (op.position > state.size())
            {
                throw InvalidOperationError("naive: local edit at " + std::to_string(op.position) +
                                            " past end of text (size " + std::to_string(state.size()) + ")");
            }
        }

        static void check_invariants(const State &) {}

        static std::size_t deferred(const State &) { return 0; }

        static bool equivalent(const State &a, const State &b) { return a == b; }

        static std::string describe(const Operation &op)
        {
            if (op.kind == NaiveTextOp::Kind::Insert)
            {
                return "insert(" + std::to_string(op.position) + ",'" + std::string(1, op.character) + "')";
            }
            return "delete(" + std::to_string(op.position) + "," + std::to_string(op.length) + ")";
        }

        static std::string render(const State &state) { return "\"" + state + "\""; }
    };

    // Turns a local edit (before -> after) into operations. After the longest common prefix,
    // the remaining old suffix is deleted in one operation and each remaining new character
    // is inserted in order; applying the result to `before` yields `after`.
    inline std::vector<NaiveTextOp> diff_strings(std::string_view before, std::string_view after)
    {
        std::vector<NaiveTextOp> ops;

        std::size_t i = 0;
        while (i < before.size() && i < after.size() && before[i] == after[i])
        {
            ++i;
        }

        if (i < before.size())
        {
            NaiveTextOp del;
            del.kind = NaiveTextOp::Kind::Delete;
            del.position = i;
            del.length = before.size() - i;
            ops.push_back(del);
        }

        for (std::size_t j = i; j < after.size(); ++j)
        {
            NaiveTextOp ins;
            ins.kind = NaiveTextOp::Kind::Insert;
            ins.position = j;
            ins.character = after[j];
            ops.push_back(ins);
        }
        return ops;
    }
}
