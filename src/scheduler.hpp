#pragma once

#include "simulation.hpp"

#include <chrono>
#include <functional>
#include <stdexcept>
#include <thread>

namespace crdtsim
{
    struct SchedulerConfig
    {
        // Simulated time between ticks. Only changes timing granularity.
        SimTime tickIntervalMs = 10;
    };

    class IRunControl
    {
    public:
        virtual ~IRunControl() = default;
        virtual void stop() = 0;
        virtual bool stopped() const = 0;
    };

    // Tick driver. Advances simulated time by a fixed interval and steps the simulator,
    // giving the input adapter a turn before every step. The accelerated runners never
    // sleep; run_realtime paces ticks against the wall clock.
    template <class V>
    class Scheduler final : public IRunControl
    {
    public:
        using InputHook = std::function<void(Simulator<V> &, SimTime now)>;

        Scheduler(Simulator<V> &sim, SchedulerConfig cfg) : m_sim(&sim), m_cfg(cfg)
        {
            if (m_cfg.tickIntervalMs == 0)
            {
                throw std::runtime_error("Scheduler: tick interval must be positive");
            }
        }

        void set_input_hook(InputHook hook) { m_input = std::move(hook); }

        // Returns the simulation time after the tick.
        SimTime tick()
        {
            if (m_stopped)
            {
                throw std::logic_error("tick: simulation has been stopped");
            }

            const SimTime now = m_sim->now() + m_cfg.tickIntervalMs;
            if (m_input)
            {
                m_input(*m_sim, now);
                if (m_stopped)
                {
                    return m_sim->now();
                }
            }
            m_sim->step(now);
            return now;
        }

        void run_for(SimTime durationMs)
        {
            const SimTime end = m_sim->now() + durationMs;
            while (!m_stopped && m_sim->now() < end)
            {
                tick();
            }
        }

        // Ticks until nothing is left in flight or queued, or `maxDurationMs` passes.
        bool run_until_quiescent(SimTime maxDurationMs)
        {
            const SimTime end = m_sim->now() + maxDurationMs;
            while (!m_stopped && !m_sim->quiescent() && m_sim->now() < end)
            {
                tick();
            }
            return m_sim->quiescent();
        }

        void run_realtime(SimTime durationMs)
        {
            const SimTime end = m_sim->now() + durationMs;
            const auto interval = std::chrono::milliseconds(m_cfg.tickIntervalMs);
            auto next = std::chrono::steady_clock::now();
            while (!m_stopped && m_sim->now() < end)
            {
                tick();
                next += interval;
                std::this_thread::sleep_until(next);
            }
        }

        void stop() override { m_stopped = true; }

        bool stopped() const override { return m_stopped; }

        const SchedulerConfig &config() const noexcept { return m_cfg; }

    private:
        Simulator<V> *m_sim = nullptr;
        SchedulerConfig m_cfg;
        InputHook m_input;
        bool m_stopped = false;
    };
}
