#pragma once

#include "common.hpp"

#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string_view>

namespace crdtsim
{
    enum class LogLevel : std::uint8_t
    {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3,
        Trace = 4,
        Off = 255,
    };

    inline const char *log_level_name(LogLevel lvl) noexcept
    {
        switch (lvl)
        {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Off:
            return "OFF";
        }
        return "UNKNOWN";
    }

    // Accepts lower-case or upper-case level names ("debug", "WARN", "off").
    inline std::optional<LogLevel> parse_log_level(std::string_view s) noexcept
    {
        const auto eq = [s](std::string_view name)
        {
            if (s.size() != name.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < s.size(); ++i)
            {
                char c = s[i];
                if (c >= 'a' && c <= 'z')
                {
                    c = static_cast<char>(c - 'a' + 'A');
                }
                if (c != name[i])
                {
                    return false;
                }
            }
            return true;
        };

        for (LogLevel lvl : {LogLevel::Error, LogLevel::Warn, LogLevel::Info, LogLevel::Debug, LogLevel::Trace, LogLevel::Off})
        {
            if (eq(log_level_name(lvl)))
            {
                return lvl;
            }
        }
        return std::nullopt;
    }

    inline bool log_enabled(LogLevel configured, LogLevel msg) noexcept
    {
        if (configured == LogLevel::Off)
        {
            return false;
        }
        return static_cast<std::uint8_t>(msg) <= static_cast<std::uint8_t>(configured);
    }

    class Logger
    {
    public:
        static Logger &instance()
        {
            static Logger g;
            return g;
        }

        void set_level(LogLevel lvl)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_level = lvl;
        }

        LogLevel level() const noexcept { return m_level; }

        bool enabled(LogLevel lvl) const noexcept { return log_enabled(m_level, lvl); }

        void set_sink(FILE *f)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_sink = f;
        }

        void logf(LogLevel lvl, const ReplicaId &replica, SimTime now, const char *fmt, ...)
        {
            if (!log_enabled(m_level, lvl))
            {
                return;
            }

            char buf[1024];
            va_list args;
            va_start(args, fmt);
            std::vsnprintf(buf, sizeof(buf), fmt, args);
            va_end(args);

            std::lock_guard<std::mutex> lk(m_mu);
            if (!m_sink)
            {
                return;
            }
            std::fprintf(m_sink, "[%s][replica=%s][t=%llu] %s\n",
                         log_level_name(lvl),
                         replica.empty() ? "-" : replica.c_str(),
                         static_cast<unsigned long long>(now),
                         buf);
            std::fflush(m_sink);
        }

    private:
        Logger() = default;

        mutable std::mutex m_mu;
        LogLevel m_level = LogLevel::Off;
        FILE *m_sink = stderr;
    };
}
