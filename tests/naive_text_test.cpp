/*
Purpose: Position-indexed text and its local diff.

What this tests: the prefix diff reproduces the author's edit when applied in order, handles
long inputs without recursion, and concurrent edits interpreted against shifted local text
leave replicas with different content.
*/

#include "naive_text.hpp"
#include "scheduler.hpp"

#include <cassert>
#include <string>
#include <utility>
#include <vector>

namespace
{
    using crdtsim::NaiveTextOp;
    using crdtsim::NaiveTextVariant;

    std::string replay(std::string text, const std::vector<NaiveTextOp> &ops)
    {
        for (const auto &op : ops)
        {
            text = NaiveTextVariant::apply(op, std::move(text));
        }
        return text;
    }
}

int main()
{
    // Diff shapes.
    {
        assert(crdtsim::diff_strings("abc", "abc").empty());

        auto ops = crdtsim::diff_strings("ab", "abc");
        assert(ops.size() == 1);
        assert(ops[0].kind == NaiveTextOp::Kind::Insert);
        assert(ops[0].position == 2 && ops[0].character == 'c');

        ops = crdtsim::diff_strings("abc", "ab");
        assert(ops.size() == 1);
        assert(ops[0].kind == NaiveTextOp::Kind::Delete);
        assert(ops[0].position == 2 && ops[0].length == 1);

        ops = crdtsim::diff_strings("ac", "abc");
        assert(ops.size() == 3);
        assert(ops[0].kind == NaiveTextOp::Kind::Delete && ops[0].position == 1 && ops[0].length == 1);
        assert(ops[1].kind == NaiveTextOp::Kind::Insert && ops[1].position == 1 && ops[1].character == 'b');
        assert(ops[2].kind == NaiveTextOp::Kind::Insert && ops[2].position == 2 && ops[2].character == 'c');
    }

    // Applying the diff to the old text gives the new text.
    {
        const std::pair<const char *, const char *> edits[] = {
            {"", "hello"},
            {"hello", ""},
            {"hello", "help"},
            {"hello world", "hello, world"},
            {"abc", "xyz"},
        };
        for (const auto &[before, after] : edits)
        {
            assert(replay(before, crdtsim::diff_strings(before, after)) == after);
        }
    }

    // Long edit: explicit loop, no recursion depth.
    {
        const std::string before(4000, 'a');
        std::string after = before;
        after[0] = 'b';
        assert(replay(before, crdtsim::diff_strings(before, after)) == after);
    }

    // Positions past the end clamp like a slice.
    {
        NaiveTextOp ins;
        ins.kind = NaiveTextOp::Kind::Insert;
        ins.position = 10;
        ins.character = '!';
        assert(NaiveTextVariant::apply(ins, "hi") == "hi!");

        NaiveTextOp del;
        del.kind = NaiveTextOp::Kind::Delete;
        del.position = 1;
        del.length = 10;
        assert(NaiveTextVariant::apply(del, "hello") == "h");
    }

    // Concurrent edits on shared text diverge.
    {
        crdtsim::SimulationConfig cfg;
        cfg.replicas = {{"A", 0, true}, {"B", 0, true}};

        crdtsim::Simulator<NaiveTextVariant> sim(cfg, "abc");
        crdtsim::Scheduler<NaiveTextVariant> sched(sim, crdtsim::SchedulerConfig{});

        // A types 'X' at the front, B deletes the trailing 'c'.
        for (const auto &op : crdtsim::diff_strings("abc", "Xabc"))
        {
            assert(sim.submit("A", op));
        }
        for (const auto &op : crdtsim::diff_strings("abc", "ab"))
        {
            assert(sim.submit("B", op));
        }
        assert(sim.state("A") == "Xabc");
        assert(sim.state("B") == "ab");

        assert(sched.run_until_quiescent(1000));

        // B's delete-at-2 removed A's 'b' on A; A's rewrite rebuilt the whole text on B.
        assert(sim.state("A") == "Xac");
        assert(sim.state("B") == "Xabc");
        assert(!sim.converged());
    }

    return 0;
}
