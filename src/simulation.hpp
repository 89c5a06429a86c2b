#pragma once

#include "delivery_queue.hpp"
#include "log.hpp"
#include "replica.hpp"

#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace crdtsim
{
    struct ReplicaSpec
    {
        ReplicaId id;
        SimTime delayMs = 0;
        bool connected = true;
    };

    // One slow replica and two fast ones.
    inline std::vector<ReplicaSpec> default_replica_layout()
    {
        return {
            ReplicaSpec{"1", 3000, true},
            ReplicaSpec{"2", 0, true},
            ReplicaSpec{"3", 0, true},
        };
    }

    struct SimulationConfig
    {
        std::vector<ReplicaSpec> replicas = default_replica_layout();

        // Logging (disabled by default).
        LogLevel logLevel = LogLevel::Off;

        // Enable extra runtime invariant checks after every step (throws on violation).
#if defined(CRDTSIM_ENABLE_INVARIANT_CHECKS_DEFAULT)
        bool enableInvariantChecks = (CRDTSIM_ENABLE_INVARIANT_CHECKS_DEFAULT != 0);
#else
        bool enableInvariantChecks = false;
#endif
    };

    // Read-only per-replica view handed to the renderer.
    template <class State>
    struct ReplicaView
    {
        ReplicaId id;
        State state;
        bool connected = true;
        SimTime delayMs = 0;
        std::size_t inbound = 0;
        std::size_t pending = 0;
        std::size_t deferred = 0;
    };

    // Replicas plus the simulated wire, parametric over one variant V. Time only moves
    // through step(now); nothing here reads a clock.
    template <class V>
    class Simulator
    {
    public:
        using State = typename V::State;
        using Operation = typename V::Operation;
        using View = ReplicaView<State>;

        struct Hooks
        {
            // Called once per step, after the flush.
            std::function<void(SimTime, const std::vector<View> &)> render;

            // Called for every operation a replica releases onto the wire.
            std::function<void(const ReplicaId &, SimTime, const Operation &)> emitted;
        };

        struct Stats
        {
            SimTime clock = 0;
            std::size_t inflight = 0;

            std::uint64_t ticks = 0;
            std::uint64_t submitted = 0;
            std::uint64_t suppressed = 0;
            std::uint64_t emitted = 0;
            std::uint64_t delivered = 0; // one per (message, recipient)
            std::uint64_t applied = 0;
            std::uint64_t rejected = 0;
        };

        explicit Simulator(SimulationConfig cfg, State initial = V::initial_state(), Hooks hooks = {})
            : m_cfg(std::move(cfg)), m_hooks(std::move(hooks))
        {
            Logger::instance().set_level(m_cfg.logLevel);

            for (const auto &spec : m_cfg.replicas)
            {
                add_replica(spec.id, initial, spec.delayMs, spec.connected);
            }
        }

        void add_replica(const ReplicaId &id, State initial, SimTime delayMs, bool connected = true)
        {
            if (id.empty())
            {
                throw std::runtime_error("add_replica: empty id");
            }
            if (m_replicas.count(id) != 0)
            {
                throw std::runtime_error("add_replica: duplicate id=" + id);
            }

            Replica<V> r;
            r.id = id;
            r.state = std::move(initial);
            r.connected = connected;
            r.outboundDelayMs = delayMs;
            m_replicas.emplace(id, std::move(r));
        }

        // Adapter input: apply an authored operation to its author and queue it for
        // broadcast. Returns false if the variant's local guard suppresses it.
        bool submit(const ReplicaId &id, Operation op)
        {
            auto &r = replica_(id);
            if (!V::admit(op, r.state))
            {
                ++m_suppressed;
                Logger::instance().logf(LogLevel::Info, id, m_clock, "suppressed %s (local guard)", V::describe(op).c_str());
                return false;
            }

            V::validate_local(op, r.state);
            r.state = V::apply_local(op, std::move(r.state));
            r.pending.push_back(std::move(op));
            ++m_submitted;
            return true;
        }

        void set_connected(const ReplicaId &id, bool connected)
        {
            auto &r = replica_(id);
            if (r.connected != connected)
            {
                Logger::instance().logf(LogLevel::Info, id, m_clock, "%s", connected ? "reconnected" : "disconnected");
            }
            r.connected = connected;
        }

        void set_delay(const ReplicaId &id, SimTime delayMs)
        {
            auto &r = replica_(id);
            r.outboundDelayMs = delayMs;
            Logger::instance().logf(LogLevel::Info, id, m_clock, "outbound delay set to %llu ms",
                                    static_cast<unsigned long long>(delayMs));
        }

        // Mutable access to replica-local view fields that are never replicated (such as
        // a text cursor). Shared content must change through submit().
        template <class Fn>
        void update_local_view(const ReplicaId &id, Fn &&fn)
        {
            std::forward<Fn>(fn)(replica_(id).state);
        }

        // One tick at time `now`: poll every replica, enqueue what they release, then
        // broadcast every message that has come due.
        void step(SimTime now)
        {
            if (now < m_clock)
            {
                throw std::logic_error("step: time went backwards (now=" + std::to_string(now) +
                                       " clock=" + std::to_string(m_clock) + ")");
            }

            PollCounters counters;
            for (auto &[id, r] : m_replicas)
            {
                auto op = poll(r, now, counters);
                if (!op)
                {
                    continue;
                }

                const SimTime due = now + r.outboundDelayMs;
                Logger::instance().logf(LogLevel::Debug, id, now, "pushed %s, will be sent at %llu",
                                        V::describe(*op).c_str(), static_cast<unsigned long long>(due));
                if (m_hooks.emitted)
                {
                    m_hooks.emitted(id, now, *op);
                }
                m_queue.push(typename DeliveryQueue<Operation>::Message{id, std::move(*op), due});
                ++m_emitted;
            }
            m_applied += counters.applied;
            m_rejected += counters.rejected;

            for (auto &msg : m_queue.take_due(now))
            {
                if (m_replicas.count(msg.origin) == 0)
                {
                    throw std::logic_error("step: in-flight message from unknown replica " + msg.origin);
                }
                for (auto &[id, r] : m_replicas)
                {
                    if (id == msg.origin)
                    {
                        continue;
                    }
                    r.inbound.push_back(msg.operation);
                    ++m_delivered;
                    Logger::instance().logf(LogLevel::Trace, id, now, "buffered %s from %s",
                                            V::describe(msg.operation).c_str(), msg.origin.c_str());
                }
            }

            m_clock = now;
            ++m_ticks;

            if (m_cfg.enableInvariantChecks)
            {
                validate_invariants_();
            }

            if (m_hooks.render)
            {
                m_hooks.render(now, snapshot());
            }
        }

        std::vector<View> snapshot() const
        {
            std::vector<View> out;
            out.reserve(m_replicas.size());
            for (const auto &[id, r] : m_replicas)
            {
                View v;
                v.id = id;
                v.state = r.state;
                v.connected = r.connected;
                v.delayMs = r.outboundDelayMs;
                v.inbound = r.inbound.size();
                v.pending = r.pending.size();
                v.deferred = V::deferred(r.state);
                out.push_back(std::move(v));
            }
            return out;
        }

        const Replica<V> &replica(const ReplicaId &id) const
        {
            auto it = m_replicas.find(id);
            if (it == m_replicas.end())
            {
                throw UnknownReplicaError(id);
            }
            return it->second;
        }

        const State &state(const ReplicaId &id) const { return replica(id).state; }

        std::vector<ReplicaId> replica_ids() const
        {
            std::vector<ReplicaId> out;
            out.reserve(m_replicas.size());
            for (const auto &[id, r] : m_replicas)
            {
                (void)r;
                out.push_back(id);
            }
            return out;
        }

        const DeliveryQueue<Operation> &in_flight() const noexcept { return m_queue; }

        SimTime now() const noexcept { return m_clock; }

        // Nothing left to move: no message on the wire, no replica holding queued or
        // deferred operations. A disconnected replica with queued work is not quiescent.
        bool quiescent() const
        {
            if (m_queue.has_pending())
            {
                return false;
            }
            for (const auto &[id, r] : m_replicas)
            {
                (void)id;
                if (!r.inbound.empty() || !r.pending.empty() || V::deferred(r.state) != 0)
                {
                    return false;
                }
            }
            return true;
        }

        // Every replica holds an equivalent state.
        bool converged() const
        {
            const State *first = nullptr;
            for (const auto &[id, r] : m_replicas)
            {
                (void)id;
                if (!first)
                {
                    first = &r.state;
                    continue;
                }
                if (!V::equivalent(*first, r.state))
                {
                    return false;
                }
            }
            return true;
        }

        Stats stats() const
        {
            Stats out;
            out.clock = m_clock;
            out.inflight = m_queue.size();
            out.ticks = m_ticks;
            out.submitted = m_submitted;
            out.suppressed = m_suppressed;
            out.emitted = m_emitted;
            out.delivered = m_delivered;
            out.applied = m_applied;
            out.rejected = m_rejected;
            return out;
        }

    private:
        Replica<V> &replica_(const ReplicaId &id)
        {
            auto it = m_replicas.find(id);
            if (it == m_replicas.end())
            {
                throw UnknownReplicaError(id);
            }
            return it->second;
        }

        void validate_invariants_() const
        {
            for (const auto &[id, r] : m_replicas)
            {
                V::check_invariants(r.state);
                SimTime last = 0;
                for (const auto &h : r.history)
                {
                    if (h.at < last || h.at > m_clock)
                    {
                        throw std::logic_error("invariant: history of " + id + " is not ordered by emission time");
                    }
                    last = h.at;
                }
            }
            for (const auto &msg : m_queue.messages())
            {
                if (msg.dueAtMs <= m_clock)
                {
                    throw std::logic_error("invariant: due message from " + msg.origin + " left in flight");
                }
            }
        }

        SimulationConfig m_cfg;
        Hooks m_hooks;

        SimTime m_clock = 0;
        std::map<ReplicaId, Replica<V>> m_replicas;
        DeliveryQueue<Operation> m_queue;

        std::uint64_t m_ticks = 0;
        std::uint64_t m_submitted = 0;
        std::uint64_t m_suppressed = 0;
        std::uint64_t m_emitted = 0;
        std::uint64_t m_delivered = 0;
        std::uint64_t m_applied = 0;
        std::uint64_t m_rejected = 0;
    };
}
