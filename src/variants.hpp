#pragma once

#include "counter.hpp"
#include "grid.hpp"
#include "naive_text.hpp"
#include "sequence_text.hpp"

#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace crdtsim
{
    enum class VariantKind : std::uint8_t
    {
        Counter = 0,
        GuardedCounter = 1,
        Grid = 2,
        NaiveText = 3,
        SequenceText = 4,
    };

    inline std::string_view variant_name(VariantKind kind) noexcept
    {
        switch (kind)
        {
        case VariantKind::Counter:
            return CounterVariant::name;
        case VariantKind::GuardedCounter:
            return GuardedCounterVariant::name;
        case VariantKind::Grid:
            return GridVariant::name;
        case VariantKind::NaiveText:
            return NaiveTextVariant::name;
        case VariantKind::SequenceText:
            return SequenceTextVariant::name;
        }
        return "unknown";
    }

    inline std::optional<VariantKind> parse_variant_kind(std::string_view s) noexcept
    {
        for (VariantKind k : {VariantKind::Counter, VariantKind::GuardedCounter, VariantKind::Grid, VariantKind::NaiveText, VariantKind::SequenceText})
        {
            if (variant_name(k) == s)
            {
                return k;
            }
        }
        return std::nullopt;
    }

    template <class V>
    struct VariantTag
    {
        using type = V;
    };

    // Calls fn(VariantTag<V>{}) for the variant type selected by `kind`.
    template <class Fn>
    decltype(auto) with_variant(VariantKind kind, Fn &&fn)
    {
        switch (kind)
        {
        case VariantKind::Counter:
            return std::forward<Fn>(fn)(VariantTag<CounterVariant>{});
        case VariantKind::GuardedCounter:
            return std::forward<Fn>(fn)(VariantTag<GuardedCounterVariant>{});
        case VariantKind::Grid:
            return std::forward<Fn>(fn)(VariantTag<GridVariant>{});
        case VariantKind::NaiveText:
            return std::forward<Fn>(fn)(VariantTag<NaiveTextVariant>{});
        case VariantKind::SequenceText:
            return std::forward<Fn>(fn)(VariantTag<SequenceTextVariant>{});
        }
        throw std::runtime_error("with_variant: unknown variant kind");
    }
}
