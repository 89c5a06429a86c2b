/*
Purpose: Simulation lifecycle through the host.

What this tests: only one simulation is live at a time, a stopped run stays readable but
refuses ticks, an input hook can end a run between ticks, and the tick interval changes
timing granularity without changing outcomes.
*/

#include "counter.hpp"
#include "host.hpp"
#include "sequence_text.hpp"

#include <cassert>
#include <cstdint>
#include <stdexcept>

namespace
{
    using crdtsim::CounterOp;
    using crdtsim::CounterVariant;
    using crdtsim::SequenceTextVariant;

    std::int64_t settle_with_interval(crdtsim::SimTime intervalMs)
    {
        crdtsim::SimulationConfig cfg;
        cfg.replicas = {{"A", 35, true}, {"B", 0, true}, {"C", 7, true}};
        cfg.enableInvariantChecks = true;

        crdtsim::SchedulerConfig scfg;
        scfg.tickIntervalMs = intervalMs;

        crdtsim::SimulationHost host;
        auto run = host.start<CounterVariant>(cfg, scfg);
        auto &sim = run.simulator();

        assert(sim.submit("A", CounterOp::Increment));
        assert(sim.submit("A", CounterOp::Increment));
        assert(sim.submit("A", CounterOp::Increment));
        assert(sim.submit("B", CounterOp::Decrement));
        assert(sim.submit("C", CounterOp::Decrement));

        assert(run.scheduler().run_until_quiescent(10000));
        assert(sim.converged());
        assert(sim.now() % intervalMs == 0);
        return sim.state("A");
    }
}

int main()
{
    crdtsim::SimulationConfig cfg;
    crdtsim::SimulationHost host;
    assert(!host.has_active());
    assert(host.active_variant().empty());

    auto first = host.start<CounterVariant>(cfg);
    assert(host.has_active());
    assert(host.active_variant() == "counter");
    assert(first.active());

    first.scheduler().run_for(50);
    assert(first.simulator().now() == 50);
    assert(first.simulator().stats().ticks == 5);

    // Starting another variant tears the first one down.
    auto second = host.start<SequenceTextVariant>(cfg);
    assert(host.active_variant() == "sequence");
    assert(!first.active());
    assert(second.active());

    bool threw = false;
    try
    {
        first.scheduler().tick();
    }
    catch (const std::logic_error &)
    {
        threw = true;
    }
    assert(threw);
    assert(first.simulator().now() == 50);

    // The input hook ends the run before the tick at t=30 is stepped.
    second.scheduler().set_input_hook([&second](crdtsim::Simulator<SequenceTextVariant> &, crdtsim::SimTime now)
                                      {
                                          if (now >= 30)
                                          {
                                              second.stop();
                                          } });
    second.scheduler().run_for(1000);
    assert(second.scheduler().stopped());
    assert(second.simulator().now() == 20);
    assert(second.simulator().stats().ticks == 2);
    assert(!host.has_active());

    host.stop_active();
    assert(host.active_variant().empty());

    // An empty handle owns nothing.
    crdtsim::SimulationHandle<CounterVariant> empty;
    assert(!empty.active());
    threw = false;
    try
    {
        (void)empty.simulator();
    }
    catch (const std::logic_error &)
    {
        threw = true;
    }
    assert(threw);

    // Zero interval is refused.
    threw = false;
    try
    {
        crdtsim::SchedulerConfig bad;
        bad.tickIntervalMs = 0;
        (void)host.start<CounterVariant>(cfg, bad);
    }
    catch (const std::runtime_error &)
    {
        threw = true;
    }
    assert(threw);

    // Cadence only changes granularity.
    assert(settle_with_interval(1) == 1);
    assert(settle_with_interval(10) == 1);
    assert(settle_with_interval(25) == 1);

    return 0;
}
