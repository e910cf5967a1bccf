#pragma once

#include "common.hpp"

#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <stdexcept>

namespace quboroute
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

    // Accepts the names printed by log_level_name, in any case.
    inline LogLevel parse_log_level(std::string_view s)
    {
        std::string upper(s);
        for (char &c : upper)
        {
            if (c >= 'a' && c <= 'z')
            {
                c = static_cast<char>(c - 'a' + 'A');
            }
        }
        for (const LogLevel lvl : {LogLevel::Error, LogLevel::Warn, LogLevel::Info, LogLevel::Debug, LogLevel::Trace, LogLevel::Off})
        {
            if (upper == log_level_name(lvl))
            {
                return lvl;
            }
        }
        throw std::runtime_error("unknown log level '" + std::string(s) + "'");
    }

    inline bool log_enabled(LogLevel configured, LogLevel msg) noexcept
    {
        return configured != LogLevel::Off && msg != LogLevel::Off &&
               static_cast<std::uint8_t>(msg) <= static_cast<std::uint8_t>(configured);
    }

    // Process-wide logger. Lines look like
    //
    //   [WARN][router][req=req-00ab12cd34ef5678] backend anneal failed: timeout
    //
    // and are written whole under a mutex, so concurrent requests never interleave mid-line.
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

        LogLevel level() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_level;
        }

        bool enabled(LogLevel lvl) const { return log_enabled(level(), lvl); }

        // nullptr silences output without changing the level.
        void set_sink(FILE *f)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_sink = f;
        }

        // `component` names the subsystem ("router", "ledger", ...). `request` may be empty.
        void logf(LogLevel lvl, const char *component, std::string_view request, const char *fmt, ...)
        {
            if (!enabled(lvl))
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
            std::fprintf(m_sink, "[%s][%s][req=%.*s] %s\n", log_level_name(lvl), component, static_cast<int>(request.size()),
                         request.data(), buf);
            std::fflush(m_sink);
        }

    private:
        Logger() = default;

        mutable std::mutex m_mu;
        LogLevel m_level = LogLevel::Off;
        FILE *m_sink = stderr;
    };
}
