#pragma once

#include "problem.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace quboroute
{
    enum class ErrorKind : std::uint8_t
    {
        Timeout = 1,
        ConnectionError = 2,
        QuotaExceeded = 3,
        MalformedResponse = 4,
        Cancelled = 5,
        Internal = 6,
    };

    inline const char *error_kind_name(ErrorKind k) noexcept
    {
        switch (k)
        {
        case ErrorKind::Timeout:
            return "timeout";
        case ErrorKind::ConnectionError:
            return "connection-error";
        case ErrorKind::QuotaExceeded:
            return "quota-exceeded";
        case ErrorKind::MalformedResponse:
            return "malformed-response";
        case ErrorKind::Cancelled:
            return "cancelled";
        case ErrorKind::Internal:
            return "internal";
        }
        return "unknown";
    }

    struct SolveOutcome
    {
        BackendId backendId;
        bool success = false;
        // Present only on success; length == variableCount.
        std::vector<double> solution;
        double objectiveValue = 0.0;
        double elapsedMs = 0.0;
        // Present only on failure.
        std::optional<ErrorKind> errorKind;
        std::string detail;

        static SolveOutcome failure(BackendId id, ErrorKind kind, double elapsed, std::string detail = {})
        {
            SolveOutcome o;
            o.backendId = std::move(id);
            o.success = false;
            o.elapsedMs = elapsed;
            o.errorKind = kind;
            o.detail = std::move(detail);
            return o;
        }
    };

    // Shared cancellation flag. Copies observe the same flag.
    class CancelToken
    {
    public:
        CancelToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

        void cancel() noexcept { m_flag->store(true, std::memory_order_release); }
        bool cancelled() const noexcept { return m_flag->load(std::memory_order_acquire); }

    private:
        std::shared_ptr<std::atomic<bool>> m_flag;
    };

    // Hard deadline for one attempt, optionally tied to the caller's cancellation.
    class Deadline
    {
    public:
        explicit Deadline(Millis budget, std::optional<CancelToken> cancel = std::nullopt)
            : m_start(SteadyClock::now()), m_end(m_start + budget), m_cancel(std::move(cancel)) {}

        SteadyClock::time_point start() const noexcept { return m_start; }
        SteadyClock::time_point end() const noexcept { return m_end; }

        bool expired() const noexcept { return SteadyClock::now() >= m_end; }
        bool cancelled() const noexcept { return m_cancel && m_cancel->cancelled(); }
        bool should_stop() const noexcept { return cancelled() || expired(); }

        Millis remaining() const noexcept
        {
            const auto now = SteadyClock::now();
            if (now >= m_end)
            {
                return Millis{0};
            }
            return std::chrono::duration_cast<Millis>(m_end - now);
        }

    private:
        SteadyClock::time_point m_start;
        SteadyClock::time_point m_end;
        std::optional<CancelToken> m_cancel;
    };

    // Uniform "submit problem / get result" contract with a compute backend.
    //
    // solve() never throws: every backend failure is reported as a failed SolveOutcome.
    class ISolverAdapter
    {
    public:
        virtual ~ISolverAdapter() = default;

        virtual const BackendId &id() const noexcept = 0;

        SolveOutcome solve(const ProblemInstance &instance, const Deadline &deadline) noexcept
        {
            try
            {
                SolveOutcome out = solve_(instance, deadline);
                out.backendId = id();
                if (out.success && out.solution.size() != instance.variable_count())
                {
                    return SolveOutcome::failure(id(), ErrorKind::MalformedResponse, out.elapsedMs,
                                                 "solution length " + std::to_string(out.solution.size()) + " != " +
                                                     std::to_string(instance.variable_count()));
                }
                return out;
            }
            catch (const std::exception &e)
            {
                return SolveOutcome::failure(id(), ErrorKind::Internal, elapsed_ms(deadline.start()), e.what());
            }
            catch (...)
            {
                return SolveOutcome::failure(id(), ErrorKind::Internal, elapsed_ms(deadline.start()), "non-standard exception");
            }
        }

        SolveOutcome solve(const ProblemInstance &instance, Millis budget) noexcept
        {
            return solve(instance, Deadline(budget));
        }

        // Liveness probe used by HealthMonitor.
        virtual bool health_check() noexcept { return true; }

    protected:
        virtual SolveOutcome solve_(const ProblemInstance &instance, const Deadline &deadline) = 0;
    };
}
