#pragma once

#include "common.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace crdtsim
{
    // Globally unique character id: per-replica counter plus the authoring replica.
    // The default-constructed id is the "start" sentinel every sequence begins with.
    struct CharId
    {
        std::uint64_t counter = 0;
        ReplicaId replica;

        static CharId start() { return CharId{}; }

        bool is_start() const noexcept { return counter == 0 && replica.empty(); }

        std::string to_string() const
        {
            if (is_start())
            {
                return "start";
            }
            return std::to_string(counter) + "@" + replica;
        }

        friend bool operator==(const CharId &a, const CharId &b)
        {
            return a.counter == b.counter && a.replica == b.replica;
        }

        // Order among siblings sharing an anchor.
        friend bool operator<(const CharId &a, const CharId &b)
        {
            if (a.counter != b.counter)
            {
                return a.counter < b.counter;
            }
            return a.replica < b.replica;
        }
    };

    struct Char
    {
        CharId id;
        CharId after; // anchor this character was inserted after
        std::string character;
        bool deleted = false;

        bool operator==(const Char &o) const
        {
            return id == o.id && after == o.after && character == o.character && deleted == o.deleted;
        }
    };

    struct SequenceTextOp
    {
        enum class Kind : std::uint8_t
        {
            Insert = 1,
            Delete = 2,
        };

        Kind kind = Kind::Insert;
        CharId id;  // id of this operation; for Insert also the new character's id
        CharId ref; // Insert: anchor (afterId). Delete: target (removeId).
        std::string character;

        static SequenceTextOp insert(CharId id, CharId after, std::string character)
        {
            SequenceTextOp op;
            op.kind = Kind::Insert;
            op.id = std::move(id);
            op.ref = std::move(after);
            op.character = std::move(character);
            return op;
        }

        static SequenceTextOp erase(CharId id, CharId target)
        {
            SequenceTextOp op;
            op.kind = Kind::Delete;
            op.id = std::move(id);
            op.ref = std::move(target);
            return op;
        }
    };

    struct SequenceTextState
    {
        std::vector<Char> text; // includes tombstones; text[0] is the start sentinel
        CharId cursor;          // replica-local, never replicated

        // Highest counter this replica has authored.
        std::uint64_t localCounter = 0;

        // Received operations whose anchor/target has not arrived yet.
        std::vector<SequenceTextOp> deferred;
    };

    namespace detail
    {
        inline std::optional<std::size_t> index_of(const std::vector<Char> &text, const CharId &id)
        {
            for (std::size_t i = 0; i < text.size(); ++i)
            {
                if (text[i].id == id)
                {
                    return i;
                }
            }
            return std::nullopt;
        }

        // Position for a new character `id` anchored at text[anchorIdx].
        //
        // The anchor's descendants form one contiguous block right after it, with the
        // anchor's direct children in ascending id order, each followed by its own block.
        // Skip every child ordered before `id` together with its block.
        inline std::size_t insert_position(const std::vector<Char> &text, std::size_t anchorIdx, const CharId &id)
        {
            const CharId &anchor = text[anchorIdx].id;
            std::set<CharId> block{anchor};

            std::size_t pos = anchorIdx + 1;
            while (pos < text.size())
            {
                const Char &c = text[pos];
                if (block.count(c.after) == 0)
                {
                    break;
                }
                if (c.after == anchor && id < c.id)
                {
                    break;
                }
                block.insert(c.id);
                ++pos;
            }
            return pos;
        }

        // Applies `op` if its dependency is present. Returns false if it must wait.
        inline bool try_apply(const SequenceTextOp &op, SequenceTextState &s)
        {
            const auto ref = index_of(s.text, op.ref);
            if (!ref)
            {
                return false;
            }

            if (op.kind == SequenceTextOp::Kind::Delete)
            {
                s.text[*ref].deleted = true;
                return true;
            }

            if (index_of(s.text, op.id))
            {
                throw std::logic_error("sequence: duplicate char id " + op.id.to_string());
            }

            const std::size_t pos = insert_position(s.text, *ref, op.id);
            Char c;
            c.id = op.id;
            c.after = op.ref;
            c.character = op.character;
            s.text.insert(s.text.begin() + static_cast<std::ptrdiff_t>(pos), std::move(c));
            return true;
        }

        inline void retry_deferred(SequenceTextState &s)
        {
            bool progressed = true;
            while (progressed && !s.deferred.empty())
            {
                progressed = false;
                for (std::size_t i = 0; i < s.deferred.size();)
                {
                    if (try_apply(s.deferred[i], s))
                    {
                        s.deferred.erase(s.deferred.begin() + static_cast<std::ptrdiff_t>(i));
                        progressed = true;
                    }
                    else
                    {
                        ++i;
                    }
                }
            }
        }

        inline CharId previous_visible(const std::vector<Char> &text, std::size_t idx)
        {
            while (idx > 0)
            {
                --idx;
                if (!text[idx].deleted)
                {
                    return text[idx].id;
                }
            }
            return CharId::start();
        }
    }

    // RGA-style text: inserts are placed by anchor, deletes leave tombstones. The id
    // order depends only on the set of inserts applied, never on arrival order.
    //
    // Operations arriving before the character they reference are deferred inside the
    // state and retried after every later application.
    struct SequenceTextVariant
    {
        using State = SequenceTextState;
        using Operation = SequenceTextOp;

        static constexpr std::string_view name = "sequence";

        static State initial_state()
        {
            State s;
            Char sentinel;
            sentinel.character = " ";
            sentinel.deleted = true;
            s.text.push_back(std::move(sentinel));
            return s;
        }

        static State apply(const Operation &op, State state)
        {
            if (!detail::try_apply(op, state))
            {
                state.deferred.push_back(op);
                return state;
            }
            detail::retry_deferred(state);
            return state;
        }

        // The author's own edit: moves the author's cursor, and records the counter.
        static State apply_local(const Operation &op, State state)
        {
            if (!detail::try_apply(op, state))
            {
                throw std::logic_error("sequence: local edit applied without its dependency " + op.ref.to_string());
            }

            state.localCounter = std::max(state.localCounter, op.id.counter);
            if (op.kind == SequenceTextOp::Kind::Insert)
            {
                state.cursor = op.id;
            }
            else
            {
                const auto idx = detail::index_of(state.text, op.ref);
                state.cursor = detail::previous_visible(state.text, *idx);
            }
            return state;
        }

        static bool admit(const Operation &, const State &) { return true; }

        static void validate(const Operation &op, const State &)
        {
            if (op.id.counter == 0 || op.id.replica.empty())
            {
                throw InvalidOperationError("sequence: operation id " + op.id.to_string() + " is not an authored id");
            }
        }

        static void validate_local(const Operation &op, const State &state)
        {
            validate(op, state);
            if (!detail::index_of(state.text, op.ref))
            {
                throw InvalidOperationError("sequence: unknown " +
                                            std::string(op.kind == SequenceTextOp::Kind::Insert ? "anchor " : "target ") +
                                            op.ref.to_string());
            }
            if (op.kind == SequenceTextOp::Kind::Insert && detail::index_of(state.text, op.id))
            {
                throw InvalidOperationError("sequence: char id " + op.id.to_string() + " already used");
            }
        }

        static void check_invariants(const State &state)
        {
            if (state.text.empty() || !state.text.front().id.is_start())
            {
                throw std::logic_error("sequence: text does not begin with the start sentinel");
            }
            std::set<CharId> seen;
            for (const auto &c : state.text)
            {
                if (!seen.insert(c.id).second)
                {
                    throw std::logic_error("sequence: duplicate char id " + c.id.to_string());
                }
            }
        }

        static std::size_t deferred(const State &state) { return state.deferred.size(); }

        // Replicas agree when their character sequences (tombstones included) agree.
        // Cursors are local and not compared.
        static bool equivalent(const State &a, const State &b) { return a.text == b.text; }

        static std::string describe(const Operation &op)
        {
            if (op.kind == SequenceTextOp::Kind::Insert)
            {
                return "insert(" + op.id.to_string() + " after " + op.ref.to_string() + ",'" + op.character + "')";
            }
            return "delete(" + op.id.to_string() + " of " + op.ref.to_string() + ")";
        }

        static std::string render(const State &state);
    };

    // Editing helpers for an input adapter. They only build operations or move the
    // local cursor; content changes go through Simulator::submit.
    namespace sequence_text
    {
        inline std::string visible_text(const SequenceTextState &s)
        {
            std::string out;
            for (const auto &c : s.text)
            {
                if (!c.deleted)
                {
                    out += c.character;
                }
            }
            return out;
        }

        inline std::size_t line_count(const SequenceTextState &s)
        {
            std::size_t n = 1;
            for (const auto &c : s.text)
            {
                if (!c.deleted && c.character == "\n")
                {
                    ++n;
                }
            }
            return n;
        }

        // Insert `character` after the cursor.
        inline SequenceTextOp make_insert(const SequenceTextState &s, const ReplicaId &author, std::string character)
        {
            return SequenceTextOp::insert(CharId{s.localCounter + 1, author}, s.cursor, std::move(character));
        }

        // Backspace: delete the character under the cursor. Nothing to delete when the
        // cursor sits on a tombstone (including start).
        inline std::optional<SequenceTextOp> make_backspace(const SequenceTextState &s, const ReplicaId &author)
        {
            const auto idx = detail::index_of(s.text, s.cursor);
            if (!idx || s.text[*idx].deleted)
            {
                return std::nullopt;
            }
            return SequenceTextOp::erase(CharId{s.localCounter + 1, author}, s.cursor);
        }

        inline void cursor_left(SequenceTextState &s)
        {
            const auto idx = detail::index_of(s.text, s.cursor);
            if (!idx)
            {
                return;
            }
            s.cursor = detail::previous_visible(s.text, *idx);
        }

        inline void cursor_right(SequenceTextState &s)
        {
            const auto idx = detail::index_of(s.text, s.cursor);
            if (!idx)
            {
                return;
            }
            for (std::size_t i = *idx + 1; i < s.text.size(); ++i)
            {
                if (!s.text[i].deleted)
                {
                    s.cursor = s.text[i].id;
                    return;
                }
            }
        }
    }

    inline std::string SequenceTextVariant::render(const State &state)
    {
        std::string out = "\"";
        for (const char c : sequence_text::visible_text(state))
        {
            if (c == '\n')
            {
                out += "\\n";
            }
            else
            {
                out += c;
            }
        }
        out += "\"";
        if (!state.deferred.empty())
        {
            out += " (deferred=" + std::to_string(state.deferred.size()) + ")";
        }
        return out;
    }
}
