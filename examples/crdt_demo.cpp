// Headless stand-in for the presentation layer: generates seeded random user input for
// every replica, optionally takes replicas offline for a window, lets the network settle
// and prints what each replica ended up with.

#include "digest.hpp"
#include "host.hpp"
#include "random.hpp"
#include "variants.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace
{
    constexpr std::uint32_t StreamAct = 1;
    constexpr std::uint32_t StreamChoice = 2;
    constexpr std::uint32_t StreamArg = 3;

    struct OfflineWindow
    {
        crdtsim::ReplicaId id;
        crdtsim::SimTime from = 0;
        crdtsim::SimTime to = 0;
    };

    struct Params
    {
        crdtsim::VariantKind variant = crdtsim::VariantKind::SequenceText;
        std::uint64_t inputTicks = 1000;
        crdtsim::SimTime tickMs = 10;
        crdtsim::SimTime settleMs = 60000;
        std::uint64_t seed = 1;
        double editRate = 0.05;
        std::uint64_t renderEvery = 0;
        bool realtime = false;
        bool hasLogLevel = false;
        crdtsim::LogLevel logLevel = crdtsim::LogLevel::Off;
        std::vector<crdtsim::ReplicaSpec> replicas = crdtsim::default_replica_layout();
        std::vector<OfflineWindow> offline;
    };

    bool parse_u64(std::string_view s, std::uint64_t &out)
    {
        unsigned long long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size())
        {
            return false;
        }
        out = static_cast<std::uint64_t>(v);
        return true;
    }

    bool parse_double(std::string_view s, double &out)
    {
        auto r = std::from_chars(s.data(), s.data() + s.size(), out);
        return r.ec == std::errc() && r.ptr == s.data() + s.size();
    }

    [[noreturn]] void usage_and_exit()
    {
        std::cerr << "Replica convergence simulator\n"
                  << "  --variant V           counter|guarded|grid|naive|sequence (default sequence)\n"
                  << "  --ticks N             ticks of user input (default 1000)\n"
                  << "  --tick-ms N           simulated milliseconds per tick (default 10)\n"
                  << "  --settle-ms N         max time to let the network settle (default 60000)\n"
                  << "  --seed S              input seed (default 1)\n"
                  << "  --edit-rate P         per-replica chance of an edit per tick (default 0.05)\n"
                  << "  --delay ID=MS         outbound delay for replica ID (repeatable)\n"
                  << "  --offline ID=FROM:TO  disconnect ID between FROM and TO ms (repeatable)\n"
                  << "  --render-every N      print replica states every N ticks (default 0, off)\n"
                  << "  --log-level L         error|warn|info|debug|trace|off (or CRDTSIM_LOG_LEVEL)\n"
                  << "  --realtime            pace ticks against the wall clock\n";
        std::exit(2);
    }

    crdtsim::ReplicaSpec *find_replica(Params &p, std::string_view id)
    {
        for (auto &r : p.replicas)
        {
            if (r.id == id)
            {
                return &r;
            }
        }
        return nullptr;
    }

    Params parse_args(int argc, char **argv)
    {
        Params p;

        if (const char *env = std::getenv("CRDTSIM_LOG_LEVEL"))
        {
            if (auto lvl = crdtsim::parse_log_level(env))
            {
                p.logLevel = *lvl;
                p.hasLogLevel = true;
            }
        }

        for (int i = 1; i < argc; ++i)
        {
            std::string_view a(argv[i]);
            auto need = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                {
                    usage_and_exit();
                }
                return std::string_view(argv[++i]);
            };

            if (a == "--variant")
            {
                auto kind = crdtsim::parse_variant_kind(need());
                if (!kind)
                    usage_and_exit();
                p.variant = *kind;
            }
            else if (a == "--ticks")
            {
                if (!parse_u64(need(), p.inputTicks))
                    usage_and_exit();
            }
            else if (a == "--tick-ms")
            {
                if (!parse_u64(need(), p.tickMs) || p.tickMs == 0)
                    usage_and_exit();
            }
            else if (a == "--settle-ms")
            {
                if (!parse_u64(need(), p.settleMs))
                    usage_and_exit();
            }
            else if (a == "--seed")
            {
                if (!parse_u64(need(), p.seed))
                    usage_and_exit();
            }
            else if (a == "--edit-rate")
            {
                if (!parse_double(need(), p.editRate) || p.editRate < 0.0 || p.editRate > 1.0)
                    usage_and_exit();
            }
            else if (a == "--delay")
            {
                const std::string_view v = need();
                const auto eq = v.find('=');
                if (eq == std::string_view::npos)
                    usage_and_exit();
                auto *r = find_replica(p, v.substr(0, eq));
                if (!r || !parse_u64(v.substr(eq + 1), r->delayMs))
                    usage_and_exit();
            }
            else if (a == "--offline")
            {
                const std::string_view v = need();
                const auto eq = v.find('=');
                const auto colon = v.find(':', eq == std::string_view::npos ? 0 : eq);
                if (eq == std::string_view::npos || colon == std::string_view::npos)
                    usage_and_exit();
                OfflineWindow w;
                w.id = std::string(v.substr(0, eq));
                if (!find_replica(p, w.id) ||
                    !parse_u64(v.substr(eq + 1, colon - eq - 1), w.from) ||
                    !parse_u64(v.substr(colon + 1), w.to) ||
                    w.to < w.from)
                    usage_and_exit();
                p.offline.push_back(std::move(w));
            }
            else if (a == "--render-every")
            {
                if (!parse_u64(need(), p.renderEvery))
                    usage_and_exit();
            }
            else if (a == "--log-level")
            {
                auto lvl = crdtsim::parse_log_level(need());
                if (!lvl)
                    usage_and_exit();
                p.logLevel = *lvl;
                p.hasLogLevel = true;
            }
            else if (a == "--realtime")
            {
                p.realtime = true;
            }
            else
            {
                usage_and_exit();
            }
        }
        return p;
    }

    std::string random_letter(std::uint64_t seed, const crdtsim::ReplicaId &id, std::uint64_t tick)
    {
        return std::string(1, static_cast<char>('a' + crdtsim::rng_u64_range(seed, id, StreamArg, tick, 0, 25, 1)));
    }

    // One simulated user action on replica `id`. Input only ever builds operations and
    // submits them; the only direct state access is the sequence editor's cursor.
    template <class V>
    void user_input(crdtsim::Simulator<V> &sim, const crdtsim::ReplicaId &id, std::uint64_t seed, std::uint64_t tick)
    {
        const std::uint64_t choice = crdtsim::rng_u64_range(seed, id, StreamChoice, tick, 0, 99);

        if constexpr (std::is_same_v<V, crdtsim::CounterVariant> || std::is_same_v<V, crdtsim::GuardedCounterVariant>)
        {
            sim.submit(id, (choice < 50) ? crdtsim::CounterOp::Increment : crdtsim::CounterOp::Decrement);
        }
        else if constexpr (std::is_same_v<V, crdtsim::GridVariant>)
        {
            // Keep strokes inside a small corner so replicas collide on cells.
            static const char *const colors[] = {"black", "red", "blue"};
            crdtsim::GridPaint paint;
            paint.x = static_cast<std::uint32_t>(crdtsim::rng_u64_range(seed, id, StreamArg, tick, 0, 7, 0));
            paint.y = static_cast<std::uint32_t>(crdtsim::rng_u64_range(seed, id, StreamArg, tick, 0, 7, 1));
            paint.color = colors[choice % 3];
            sim.submit(id, std::move(paint));
        }
        else if constexpr (std::is_same_v<V, crdtsim::NaiveTextVariant>)
        {
            const std::string before = sim.state(id);
            std::string after = before;
            const std::uint64_t pos = crdtsim::rng_u64_range(seed, id, StreamArg, tick, 0, after.size(), 0);
            if (choice < 70 || after.empty())
            {
                after.insert(static_cast<std::size_t>(pos), random_letter(seed, id, tick));
            }
            else
            {
                after.erase(static_cast<std::size_t>(pos == after.size() ? pos - 1 : pos), 1);
            }
            for (auto &op : crdtsim::diff_strings(before, after))
            {
                sim.submit(id, op);
            }
        }
        else if constexpr (std::is_same_v<V, crdtsim::SequenceTextVariant>)
        {
            namespace st = crdtsim::sequence_text;
            if (choice < 65)
            {
                sim.submit(id, st::make_insert(sim.state(id), id, random_letter(seed, id, tick)));
            }
            else if (choice < 80)
            {
                if (auto op = st::make_backspace(sim.state(id), id))
                {
                    sim.submit(id, std::move(*op));
                }
            }
            else if (choice < 90)
            {
                sim.update_local_view(id, [](crdtsim::SequenceTextState &s)
                                      { st::cursor_left(s); });
            }
            else
            {
                sim.update_local_view(id, [](crdtsim::SequenceTextState &s)
                                      { st::cursor_right(s); });
            }
        }
    }

    template <class V>
    void print_views(crdtsim::SimTime now, const std::vector<crdtsim::ReplicaView<typename V::State>> &views)
    {
        std::cout << "t=" << now << "\n";
        for (const auto &v : views)
        {
            std::cout << "  " << v.id
                      << (v.connected ? " [online " : " [offline ")
                      << "delay=" << v.delayMs << "ms"
                      << " inbound=" << v.inbound
                      << " pending=" << v.pending << "] "
                      << V::render(v.state) << "\n";
        }
    }

    template <class V>
    int run_demo(const Params &p)
    {
        crdtsim::SimulationConfig cfg;
        cfg.replicas = p.replicas;
        cfg.logLevel = p.hasLogLevel ? p.logLevel : crdtsim::LogLevel::Off;

        crdtsim::SchedulerConfig scfg;
        scfg.tickIntervalMs = p.tickMs;

        crdtsim::TraceAccumulator trace;
        typename crdtsim::Simulator<V>::Hooks hooks;
        hooks.emitted = [&](const crdtsim::ReplicaId &id, crdtsim::SimTime at, const typename V::Operation &op)
        {
            trace.on_emitted(id, at, V::describe(op));
        };
        if (p.renderEvery != 0)
        {
            const crdtsim::SimTime every = p.renderEvery * p.tickMs;
            hooks.render = [every](crdtsim::SimTime now, const std::vector<crdtsim::ReplicaView<typename V::State>> &views)
            {
                if (now % every == 0)
                {
                    print_views<V>(now, views);
                }
            };
        }

        crdtsim::SimulationHost host;
        auto handle = host.start<V>(cfg, scfg, V::initial_state(), std::move(hooks));
        auto &sim = handle.simulator();
        auto &sched = handle.scheduler();

        const std::vector<crdtsim::ReplicaId> ids = sim.replica_ids();
        const crdtsim::SimTime inputEnd = p.inputTicks * p.tickMs;

        sched.set_input_hook([&](crdtsim::Simulator<V> &s, crdtsim::SimTime now)
                             {
            for (const auto &w : p.offline)
            {
                const bool offline = (now >= w.from && now < w.to);
                if (s.replica(w.id).connected == offline)
                {
                    s.set_connected(w.id, !offline);
                }
            }
            if (now > inputEnd)
            {
                return;
            }
            const std::uint64_t tick = now / p.tickMs;
            for (const auto &id : ids)
            {
                if (crdtsim::rng_unit_double(p.seed, id, StreamAct, tick) >= p.editRate)
                {
                    continue;
                }
                try
                {
                    user_input<V>(s, id, p.seed, tick);
                }
                catch (const crdtsim::InvalidOperationError &e)
                {
                    std::cerr << "input on replica " << id << " rejected: " << e.what() << "\n";
                }
            } });

        if (p.realtime)
        {
            sched.run_realtime(inputEnd);
        }
        else
        {
            sched.run_for(inputEnd);
        }

        // Bring every replica back online and let the wire drain.
        sched.set_input_hook({});
        for (const auto &id : ids)
        {
            sim.set_connected(id, true);
        }
        const bool quiescent = sched.run_until_quiescent(p.settleMs);

        print_views<V>(sim.now(), sim.snapshot());

        const auto st = sim.stats();
        std::cout << "variant=" << V::name
                  << " ticks=" << st.ticks
                  << " submitted=" << st.submitted
                  << " suppressed=" << st.suppressed
                  << " emitted=" << st.emitted
                  << " delivered=" << st.delivered
                  << " rejected=" << st.rejected << "\n";
        std::cout << "trace digest=" << std::hex << trace.digest().sum << ":" << trace.digest().xorAll << std::dec
                  << " ops=" << trace.digest().count << "\n";
        std::cout << (quiescent ? "settled" : "NOT settled") << ", "
                  << (sim.converged() ? "converged" : "diverged") << "\n";

        handle.stop();
        return 0;
    }
}

int main(int argc, char **argv)
{
    const Params p = parse_args(argc, argv);

    try
    {
        return crdtsim::with_variant(p.variant, [&](auto tag)
                                     { return run_demo<typename decltype(tag)::type>(p); });
    }
    catch (const std::exception &e)
    {
        std::cerr << "crdt_demo: " << e.what() << "\n";
        return 1;
    }
}
