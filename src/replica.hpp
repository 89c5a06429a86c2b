#pragma once

#include "common.hpp"
#include "log.hpp"

#include <deque>
#include <optional>
#include <vector>

namespace crdtsim
{
    template <class V>
    struct Replica
    {
        using State = typename V::State;
        using Operation = typename V::Operation;

        struct HistoryEntry
        {
            Operation op;
            SimTime at = 0;
        };

        ReplicaId id;
        State state;

        std::deque<Operation> inbound; // received, awaiting apply
        std::deque<Operation> pending; // authored, awaiting broadcast
        std::vector<HistoryEntry> history;

        bool connected = true;
        SimTime outboundDelayMs = 0;
    };

    struct PollCounters
    {
        std::uint64_t applied = 0;
        std::uint64_t rejected = 0;
    };

    // One tick of a replica: drain every received operation, then release at most one
    // authored operation for broadcast. A disconnected replica does nothing; its queues
    // keep accumulating until it reconnects.
    //
    // A received operation the variant rejects is logged and skipped; the rest of the
    // buffer still drains.
    template <class V>
    std::optional<typename V::Operation> poll(Replica<V> &r, SimTime now, PollCounters &counters)
    {
        if (!r.connected)
        {
            return std::nullopt;
        }

        while (!r.inbound.empty())
        {
            auto op = std::move(r.inbound.front());
            r.inbound.pop_front();

            try
            {
                V::validate(op, r.state);
            }
            catch (const InvalidOperationError &e)
            {
                ++counters.rejected;
                Logger::instance().logf(LogLevel::Warn, r.id, now, "rejected %s: %s", V::describe(op).c_str(), e.what());
                continue;
            }

            const std::size_t deferredBefore = V::deferred(r.state);
            r.state = V::apply(op, std::move(r.state));
            ++counters.applied;

            if (V::deferred(r.state) > deferredBefore)
            {
                Logger::instance().logf(LogLevel::Debug, r.id, now, "deferred %s until its dependency arrives", V::describe(op).c_str());
            }
        }

        if (r.pending.empty())
        {
            return std::nullopt;
        }

        auto op = std::move(r.pending.front());
        r.pending.pop_front();
        r.history.push_back({op, now});
        return op;
    }
}
