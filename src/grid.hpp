#pragma once

#include "common.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace crdtsim
{
    struct GridPaint
    {
        std::uint32_t x = 0;
        std::uint32_t y = 0;
        std::string color;
    };

    struct GridState
    {
        std::uint32_t width = 0;
        std::uint32_t height = 0;
        std::vector<std::string> cells; // row-major, width * height

        const std::string &at(std::uint32_t x, std::uint32_t y) const
        {
            return cells.at(static_cast<std::size_t>(y) * width + x);
        }

        bool operator==(const GridState &o) const
        {
            return width == o.width && height == o.height && cells == o.cells;
        }
    };

    // Last-applied-wins paint grid. "Last" is local delivery order; there is no logical
    // clock, so concurrent writes to one cell may settle differently per replica.
    struct GridVariant
    {
        using State = GridState;
        using Operation = GridPaint;

        static constexpr std::string_view name = "grid";
        static constexpr std::uint32_t DefaultSize = 50;
        static constexpr std::string_view Blank = "white";

        static State initial_state(std::uint32_t width = DefaultSize, std::uint32_t height = DefaultSize)
        {
            State s;
            s.width = width;
            s.height = height;
            s.cells.assign(static_cast<std::size_t>(width) * height, std::string(Blank));
            return s;
        }

        static State apply(const Operation &op, State state)
        {
            state.cells[static_cast<std::size_t>(op.y) * state.width + op.x] = op.color;
            return state;
        }

        static State apply_local(const Operation &op, State state) { return apply(op, std::move(state)); }

        static bool admit(const Operation &, const State &) { return true; }

        static void validate(const Operation &op, const State &state)
        {
            if (op.x >= state.width || op.y >= state.height)
            {
                throw InvalidOperationError("grid: paint at (" + std::to_string(op.x) + "," + std::to_string(op.y) +
                                            ") outside " + std::to_string(state.width) + "x" + std::to_string(state.height));
            }
            if (op.color.empty())
            {
                throw InvalidOperationError("grid: empty color");
            }
        }

        static void validate_local(const Operation &op, const State &state) { validate(op, state); }

        static void check_invariants(const State &state)
        {
            if (state.cells.size() != static_cast<std::size_t>(state.width) * state.height)
            {
                throw std::logic_error("grid: cell count does not match bounds");
            }
        }

        static std::size_t deferred(const State &) { return 0; }

        static bool equivalent(const State &a, const State &b) { return a == b; }

        static std::string describe(const Operation &op)
        {
            return "paint(" + std::to_string(op.x) + "," + std::to_string(op.y) + "," + op.color + ")";
        }

        // Non-blank colour histogram, e.g. "black=3 red=1".
        static std::string render(const State &state)
        {
            std::map<std::string, std::size_t> counts;
            for (const auto &c : state.cells)
            {
                if (c != Blank)
                {
                    ++counts[c];
                }
            }
            if (counts.empty())
            {
                return "blank";
            }
            std::string out;
            for (const auto &[color, n] : counts)
            {
                if (!out.empty())
                {
                    out += ' ';
                }
                out += color + "=" + std::to_string(n);
            }
            return out;
        }
    };
}
