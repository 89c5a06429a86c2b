#pragma once

#include "scheduler.hpp"

#include <memory>
#include <stdexcept>
#include <string_view>

namespace crdtsim
{
    class SimulationHost;

    // Handle to one started simulation. stop() tears the run down; the simulator stays
    // readable afterwards, but no further tick is accepted.
    template <class V>
    class SimulationHandle
    {
    public:
        SimulationHandle() = default;

        Simulator<V> &simulator()
        {
            return run_().simulator;
        }

        const Simulator<V> &simulator() const
        {
            return run_().simulator;
        }

        Scheduler<V> &scheduler()
        {
            return run_().scheduler;
        }

        bool active() const { return m_run && !m_run->scheduler.stopped(); }

        void stop()
        {
            if (m_run)
            {
                m_run->scheduler.stop();
            }
        }

    private:
        friend class SimulationHost;

        struct Run
        {
            Run(SimulationConfig cfg, SchedulerConfig scfg, typename V::State initial, typename Simulator<V>::Hooks hooks)
                : simulator(std::move(cfg), std::move(initial), std::move(hooks)), scheduler(simulator, scfg)
            {
            }

            Simulator<V> simulator;
            Scheduler<V> scheduler;
        };

        explicit SimulationHandle(std::shared_ptr<Run> run) : m_run(std::move(run)) {}

        Run &run_() const
        {
            if (!m_run)
            {
                throw std::logic_error("SimulationHandle: no simulation");
            }
            return *m_run;
        }

        std::shared_ptr<Run> m_run;
    };

    // Keeps at most one simulation live. Starting a variant stops whatever was running.
    class SimulationHost
    {
    public:
        SimulationHost() = default;
        SimulationHost(const SimulationHost &) = delete;
        SimulationHost &operator=(const SimulationHost &) = delete;

        ~SimulationHost() { stop_active(); }

        template <class V>
        SimulationHandle<V> start(SimulationConfig cfg,
                                  SchedulerConfig scfg = {},
                                  typename V::State initial = V::initial_state(),
                                  typename Simulator<V>::Hooks hooks = {})
        {
            stop_active();

            using Run = typename SimulationHandle<V>::Run;
            auto run = std::make_shared<Run>(std::move(cfg), scfg, std::move(initial), std::move(hooks));
            m_active = std::shared_ptr<IRunControl>(run, &run->scheduler);
            m_activeVariant = V::name;
            Logger::instance().logf(LogLevel::Info, ReplicaId{}, 0, "started %.*s simulation",
                                    static_cast<int>(m_activeVariant.size()), m_activeVariant.data());
            return SimulationHandle<V>(std::move(run));
        }

        void stop_active()
        {
            if (!m_active)
            {
                return;
            }
            m_active->stop();
            m_active.reset();
            m_activeVariant = {};
        }

        bool has_active() const { return m_active && !m_active->stopped(); }

        std::string_view active_variant() const noexcept { return m_activeVariant; }

    private:
        std::shared_ptr<IRunControl> m_active;
        std::string_view m_activeVariant;
    };
}
