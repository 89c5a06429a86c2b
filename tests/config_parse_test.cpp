/*
Purpose: Name parsing for the configuration surface.

What this tests: log level names parse in either case, variant names parse exactly, unknown names
are refused, and with_variant dispatches to the matching variant type.
*/

#include "log.hpp"
#include "variants.hpp"

#include <cassert>
#include <string>
#include <string_view>

int main()
{
    using crdtsim::LogLevel;
    using crdtsim::VariantKind;

    assert(crdtsim::parse_log_level("debug") == LogLevel::Debug);
    assert(crdtsim::parse_log_level("WARN") == LogLevel::Warn);
    assert(crdtsim::parse_log_level("Trace") == LogLevel::Trace);
    assert(crdtsim::parse_log_level("off") == LogLevel::Off);
    assert(!crdtsim::parse_log_level("verbose").has_value());
    assert(!crdtsim::parse_log_level("").has_value());

    assert(crdtsim::log_enabled(LogLevel::Info, LogLevel::Warn));
    assert(!crdtsim::log_enabled(LogLevel::Info, LogLevel::Debug));
    assert(!crdtsim::log_enabled(LogLevel::Off, LogLevel::Error));

    for (VariantKind k : {VariantKind::Counter, VariantKind::GuardedCounter, VariantKind::Grid, VariantKind::NaiveText, VariantKind::SequenceText})
    {
        const auto parsed = crdtsim::parse_variant_kind(crdtsim::variant_name(k));
        assert(parsed.has_value() && *parsed == k);

        const std::string_view viaDispatch = crdtsim::with_variant(k, [](auto tag)
                                                                   { return decltype(tag)::type::name; });
        assert(viaDispatch == crdtsim::variant_name(k));
    }
    assert(!crdtsim::parse_variant_kind("Counter").has_value());
    assert(!crdtsim::parse_variant_kind("rga").has_value());

    // Dispatch can carry state through the generic lambda.
    const std::string initial = crdtsim::with_variant(VariantKind::Grid, [](auto tag)
                                                      {
                                                          using V = typename decltype(tag)::type;
                                                          return V::render(V::initial_state()); });
    assert(initial == "blank");

    return 0;
}
