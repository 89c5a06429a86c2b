#pragma once

#include "common.hpp"

#include <deque>
#include <optional>
#include <vector>

namespace crdtsim
{
    template <class Operation>
    struct InFlightMessage
    {
        ReplicaId origin;
        Operation operation;
        SimTime dueAtMs = 0;
    };

    // Messages on the simulated wire, in emission order. Single-threaded: owned and
    // mutated by the Simulator inside one step.
    template <class Operation>
    class DeliveryQueue
    {
    public:
        using Message = InFlightMessage<Operation>;

        void push(Message msg)
        {
            m_queue.push_back(std::move(msg));
        }

        // Removes every message with dueAtMs <= now. Returned messages keep their
        // emission order; the rest keep theirs.
        std::vector<Message> take_due(SimTime now)
        {
            std::vector<Message> due;
            std::deque<Message> rest;
            for (auto &msg : m_queue)
            {
                if (msg.dueAtMs <= now)
                {
                    due.push_back(std::move(msg));
                }
                else
                {
                    rest.push_back(std::move(msg));
                }
            }
            m_queue = std::move(rest);
            return due;
        }

        std::optional<SimTime> next_due() const
        {
            std::optional<SimTime> out;
            for (const auto &msg : m_queue)
            {
                if (!out || msg.dueAtMs < *out)
                {
                    out = msg.dueAtMs;
                }
            }
            return out;
        }

        bool has_pending() const { return !m_queue.empty(); }

        std::size_t size() const { return m_queue.size(); }

        const std::deque<Message> &messages() const { return m_queue; }

    private:
        std::deque<Message> m_queue;
    };
}
