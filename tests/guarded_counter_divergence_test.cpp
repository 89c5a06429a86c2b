/*
Purpose: A locally guarded decrement is not a CRDT operation.

What this tests: the author-side guard suppresses a decrement at zero, but a received
decrement is applied unconditionally, so replicas end on different totals (and below zero).
*/

#include "counter.hpp"
#include "scheduler.hpp"

#include <cassert>

int main()
{
    using crdtsim::CounterOp;
    using crdtsim::GuardedCounterVariant;

    // A is at 1 while B is at 0.
    {
        crdtsim::SimulationConfig cfg;
        cfg.replicas.clear();

        crdtsim::Simulator<GuardedCounterVariant> sim(cfg);
        sim.add_replica("A", 1, 0);
        sim.add_replica("B", 0, 0);

        // The guard passes on A and blocks on B.
        assert(sim.submit("A", CounterOp::Decrement));
        assert(!sim.submit("B", CounterOp::Decrement));
        assert(sim.state("A") == 0);
        assert(sim.state("B") == 0);
        assert(sim.replica("B").pending.empty());

        crdtsim::Scheduler<GuardedCounterVariant> sched(sim, crdtsim::SchedulerConfig{});
        assert(sched.run_until_quiescent(1000));

        // B applied A's decrement to its 0: no clamping, no convergence.
        assert(sim.state("A") == 0);
        assert(sim.state("B") == -1);
        assert(!sim.converged());

        const auto st = sim.stats();
        assert(st.suppressed == 1);
        assert(st.submitted == 1);
        assert(st.rejected == 0);
    }

    // Both replicas at 1 decrement concurrently: each guard passes, and both end at -1,
    // a value the guard was meant to rule out.
    {
        crdtsim::SimulationConfig cfg;
        cfg.replicas = {{"A", 0, true}, {"B", 0, true}};

        crdtsim::Simulator<GuardedCounterVariant> sim(cfg);
        crdtsim::Scheduler<GuardedCounterVariant> sched(sim, crdtsim::SchedulerConfig{});

        assert(sim.submit("A", CounterOp::Increment));
        assert(sched.run_until_quiescent(1000));
        assert(sim.state("A") == 1 && sim.state("B") == 1);

        assert(sim.submit("A", CounterOp::Decrement));
        assert(sim.submit("B", CounterOp::Decrement));
        assert(sched.run_until_quiescent(1000));

        assert(sim.state("A") == -1);
        assert(sim.state("B") == -1);
    }

    // Receiving side never re-checks the guard.
    assert(GuardedCounterVariant::apply(CounterOp::Decrement, 0) == -1);
    assert(!GuardedCounterVariant::admit(CounterOp::Decrement, 0));
    assert(GuardedCounterVariant::admit(CounterOp::Increment, 0));
    assert(GuardedCounterVariant::admit(CounterOp::Decrement, 3));

    return 0;
}
