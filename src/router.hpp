#pragma once

#include "backend_registry.hpp"
#include "errors.hpp"
#include "ledger.hpp"
#include "log.hpp"
#include "normalizer.hpp"

#include <thread>

namespace quboroute
{
    struct RouterConfig
    {
        // Per-attempt budgets by size class.
        Millis smallBudget{2000};
        Millis mediumBudget{10000};
        Millis largeBudget{30000};

        // Cap on the whole request, summed over attempts.
        Millis requestCap{60000};

        // Part of the cap held back for the guaranteed classical attempt. A non-classical
        // attempt only starts if more than this is left.
        Millis classicalReserve{2000};

        // Retries on the same backend after a ConnectionError. 0 disables.
        std::uint32_t maxRetriesPerBackend = 0;
        Millis retryBaseDelay{50};
        Millis retryMaxDelay{1000};

        // Consecutive failures before a specialized backend is marked unhealthy. 0 disables.
        std::uint32_t circuitBreakerThreshold = 5;

        // Re-run the classical candidate after a specialized success to measure the
        // advantage ratio.
        bool runBaseline = false;

        // Optional: one flat key-value event per state transition, after the ledger append.
        std::function<void(const Fields &)> transitionSink;

        // Logging (disabled by default).
        LogLevel logLevel = LogLevel::Off;

        Millis budget_for(SizeClass c) const noexcept
        {
            switch (c)
            {
            case SizeClass::Small:
                return smallBudget;
            case SizeClass::Medium:
                return mediumBudget;
            case SizeClass::Large:
                return largeBudget;
            }
            return largeBudget;
        }
    };

    struct RouteRequest
    {
        ProblemPtr instance;
        // Declared preference; moved to the front if it is a capable candidate.
        std::optional<BackendId> preferredBackend;
        std::optional<CancelToken> cancel;
    };

    struct RoutedResult
    {
        NormalizedResult result;
        // The `completed` ledger record.
        LedgerRecord completed;
    };

    // Per-request state machine: Submitted -> Attempting(b_i) -> {Succeeded | Attempting(b_i+1) | Exhausted}.
    //
    // Thread-safe: execute() keeps all request state on its own stack; the registry and ledger
    // serialize their own mutations.
    class Router
    {
    public:
        Router(RouterConfig cfg,
               std::shared_ptr<BackendRegistry> registry,
               std::shared_ptr<AuditLedger> ledger,
               std::shared_ptr<BaselineCache> baselines = std::make_shared<BaselineCache>())
            : m_cfg(std::move(cfg)), m_registry(std::move(registry)), m_ledger(std::move(ledger)), m_baselines(std::move(baselines))
        {
            if (!m_registry || !m_ledger || !m_baselines)
            {
                throw std::runtime_error("Router requires a registry, a ledger and a baseline cache");
            }
            if (m_cfg.classicalReserve > m_cfg.requestCap)
            {
                throw std::runtime_error("RouterConfig: classicalReserve exceeds requestCap");
            }
            Logger::instance().set_level(m_cfg.logLevel);
        }

        const RouterConfig &config() const noexcept { return m_cfg; }
        BaselineCache &baselines() noexcept { return *m_baselines; }

        // Candidate order for an instance of `variableCount` variables: registry order, the
        // preferred backend first, classical backends last. Throws NoCapableBackendError.
        std::vector<BackendDescriptor> candidates(std::size_t variableCount, const std::optional<BackendId> &preferred) const
        {
            auto cands = m_registry->list_capable(variableCount);
            if (preferred)
            {
                auto it = std::find_if(cands.begin(), cands.end(), [&](const BackendDescriptor &d)
                                       { return d.id == *preferred; });
                if (it != cands.end())
                {
                    std::rotate(cands.begin(), it, it + 1);
                }
            }
            std::stable_partition(cands.begin(), cands.end(), [](const BackendDescriptor &d)
                                  { return d.kind != BackendKind::ClassicalFallback; });
            return cands;
        }

        RoutedResult execute(const RouteRequest &req)
        {
            if (!req.instance)
            {
                throw std::runtime_error("Router::execute: null instance");
            }
            const ProblemInstance &inst = *req.instance;
            const RequestId &rid = inst.id();
            const auto started = SteadyClock::now();
            const auto cancelled = [&]()
            { return req.cancel && req.cancel->cancelled(); };

            std::vector<BackendDescriptor> cands;
            try
            {
                cands = candidates(inst.variable_count(), req.preferredBackend);
            }
            catch (NoCapableBackendError &e)
            {
                fail_(rid, e);
            }

            std::vector<BackendId> candidateIds;
            for (const auto &d : cands)
            {
                candidateIds.push_back(d.id);
            }
            Logger::instance().logf(LogLevel::Debug, "router", rid, "%zu candidates for %zu variables (%s), first %s", cands.size(),
                                    inst.variable_count(), size_class_name(inst.size_class()), cands.front().id.c_str());

            const Millis classBudget = m_cfg.budget_for(inst.size_class());
            std::vector<BackendId> attempted;
            std::optional<SolveOutcome> lastFailure;

            std::size_t i = 0;
            while (i < cands.size())
            {
                if (cancelled())
                {
                    RequestCancelledError err;
                    fail_(rid, err);
                }

                const BackendDescriptor &d = cands[i];
                const bool classical = d.kind == BackendKind::ClassicalFallback;
                const Millis left = remaining_(started);
                const Millis usable = classical ? left : left - m_cfg.classicalReserve;

                if (usable <= Millis{0})
                {
                    const auto j = first_classical_(cands, i);
                    if (classical || !j)
                    {
                        RequestTimeoutError err(elapsed_ms(started));
                        fail_(rid, err);
                    }
                    record_(rid, EventType::FallbackTriggered,
                            {{"from", d.id}, {"to", cands[*j].id}, {"reason", "request-budget"}});
                    i = *j;
                    continue;
                }

                attempted.push_back(d.id);
                SolveOutcome outcome = attempt_(inst, d, std::min(classBudget, usable), req.cancel, started);

                if (outcome.success)
                {
                    return succeed_(inst, d, std::move(outcome), std::move(candidateIds), std::move(attempted), cands, started);
                }

                if (outcome.errorKind == ErrorKind::Cancelled && cancelled())
                {
                    RequestCancelledError err;
                    fail_(rid, err);
                }
                lastFailure = std::move(outcome);

                if (i + 1 == cands.size())
                {
                    break;
                }
                record_(rid, EventType::FallbackTriggered,
                        {{"from", d.id},
                         {"to", cands[i + 1].id},
                         {"reason", error_kind_name(lastFailure->errorKind.value_or(ErrorKind::Internal))}});
                ++i;
            }

            if (lastFailure && lastFailure->errorKind == ErrorKind::Timeout && remaining_(started) <= Millis{0})
            {
                RequestTimeoutError err(elapsed_ms(started));
                fail_(rid, err);
            }
            AllBackendsExhaustedError err(attempted);
            fail_(rid, err);
        }

    private:
        Millis remaining_(SteadyClock::time_point started) const
        {
            return m_cfg.requestCap - std::chrono::duration_cast<Millis>(SteadyClock::now() - started);
        }

        static std::optional<std::size_t> first_classical_(const std::vector<BackendDescriptor> &cands, std::size_t from)
        {
            for (std::size_t j = from; j < cands.size(); ++j)
            {
                if (cands[j].kind == BackendKind::ClassicalFallback)
                {
                    return j;
                }
            }
            return std::nullopt;
        }

        LedgerRecord record_(const RequestId &rid, EventType type, Fields fields)
        {
            LedgerRecord rec = m_ledger->append(LedgerEvent{rid, type, fields});
            Logger::instance().logf(LogLevel::Debug, "router", rid, "seq %llu %s", static_cast<unsigned long long>(rec.sequenceNumber),
                                    event_type_name(type));
            if (m_cfg.transitionSink)
            {
                fields.insert(fields.begin(), {{"request", rid}, {"event", event_type_name(type)}, {"seq", std::to_string(rec.sequenceNumber)}});
                m_cfg.transitionSink(fields);
            }
            return rec;
        }

        // Appends the `failed` record and throws `err`. A ledger outage here surfaces as
        // LedgerUnavailableError instead.
        [[noreturn]] void fail_(const RequestId &rid, OrchestrationError &err)
        {
            err.set_request_id(rid);
            Logger::instance().logf(LogLevel::Error, "router", rid, "%s: %s", error_code_name(err.code()), err.what());
            record_(rid, EventType::Failed, {{"error", error_code_name(err.code())}, {"message", err.what()}});
            throw_(err);
        }

        [[noreturn]] static void throw_(const OrchestrationError &err)
        {
            switch (err.code())
            {
            case ErrorCode::NoCapableBackend:
                throw static_cast<const NoCapableBackendError &>(err);
            case ErrorCode::AllBackendsExhausted:
                throw static_cast<const AllBackendsExhaustedError &>(err);
            case ErrorCode::RequestTimeout:
                throw static_cast<const RequestTimeoutError &>(err);
            case ErrorCode::RequestCancelled:
                throw static_cast<const RequestCancelledError &>(err);
            default:
                throw err;
            }
        }

        // One backend, including ConnectionError retries. Returns the last outcome.
        SolveOutcome attempt_(const ProblemInstance &inst,
                              const BackendDescriptor &d,
                              Millis budget,
                              const std::optional<CancelToken> &cancel,
                              SteadyClock::time_point started)
        {
            const RequestId &rid = inst.id();
            SolveOutcome outcome;
            for (std::uint32_t retry = 0;; ++retry)
            {
                record_(rid, EventType::BackendAttempt,
                        {{"backend", d.id},
                         {"kind", backend_kind_name(d.kind)},
                         {"attempt", std::to_string(retry + 1)},
                         {"budget_ms", std::to_string(budget.count())}});

                std::shared_ptr<ISolverAdapter> adapter;
                try
                {
                    adapter = m_registry->adapter(d.id);
                }
                catch (const std::out_of_range &)
                {
                    adapter.reset();
                }
                if (adapter)
                {
                    outcome = adapter->solve(inst, Deadline(budget, cancel));
                }
                else
                {
                    outcome = SolveOutcome::failure(d.id, ErrorKind::Internal, 0.0, "backend is no longer registered");
                }
                // A stop the caller asked for says nothing about the backend's health.
                const bool callerCancelled = !outcome.success && outcome.errorKind == ErrorKind::Cancelled && cancel &&
                                             cancel->cancelled();
                if (!callerCancelled)
                {
                    m_registry->record_outcome(d.id, outcome.success, m_cfg.circuitBreakerThreshold);
                }

                if (outcome.success)
                {
                    record_(rid, EventType::BackendSuccess,
                            {{"backend", d.id},
                             {"objective", format_double(outcome.objectiveValue)},
                             {"elapsed_ms", format_double(outcome.elapsedMs)}});
                    return outcome;
                }

                const ErrorKind kind = outcome.errorKind.value_or(ErrorKind::Internal);
                Logger::instance().logf(LogLevel::Warn, "router", rid, "backend %s failed: %s %s", d.id.c_str(), error_kind_name(kind),
                                        outcome.detail.c_str());
                record_(rid, EventType::BackendFailure,
                        {{"backend", d.id},
                         {"error", error_kind_name(kind)},
                         {"detail", outcome.detail},
                         {"elapsed_ms", format_double(outcome.elapsedMs)}});

                if (kind != ErrorKind::ConnectionError || retry >= m_cfg.maxRetriesPerBackend)
                {
                    return outcome;
                }

                Millis delay = m_cfg.retryBaseDelay * (1LL << std::min<std::uint32_t>(retry, 20));
                delay = std::min(delay, m_cfg.retryMaxDelay);
                const bool classical = d.kind == BackendKind::ClassicalFallback;
                const Millis spare = remaining_(started) - (classical ? Millis{0} : m_cfg.classicalReserve);
                if (spare <= delay)
                {
                    return outcome;
                }
                std::this_thread::sleep_for(delay);
                if (cancel && cancel->cancelled())
                {
                    return outcome;
                }
                budget = std::min(budget, spare - delay);
            }
        }

        RoutedResult succeed_(const ProblemInstance &inst,
                              const BackendDescriptor &chosen,
                              SolveOutcome outcome,
                              std::vector<BackendId> candidateIds,
                              std::vector<BackendId> attempted,
                              const std::vector<BackendDescriptor> &cands,
                              SteadyClock::time_point started)
        {
            const RequestId &rid = inst.id();
            const ShapeKey shape = shape_key(inst);

            RouteOutcome route;
            route.chosenKind = chosen.kind;
            route.candidates = std::move(candidateIds);
            route.attempted = std::move(attempted);

            if (chosen.kind == BackendKind::ClassicalFallback)
            {
                m_baselines->put(shape, BaselineRun{chosen.id, outcome.elapsedMs, outcome.objectiveValue});
            }
            else
            {
                if (m_cfg.runBaseline)
                {
                    route.baseline = measure_baseline_(inst, cands, shape, started);
                }
                if (!route.baseline)
                {
                    route.baseline = m_baselines->get(shape);
                }
            }

            route.outcome = std::move(outcome);
            route.totalElapsedMs = elapsed_ms(started);
            NormalizedResult result = normalize(inst, route);

            LedgerRecord completed = record_(rid, EventType::Completed,
                                             {{"backend", result.chosenBackendId},
                                              {"chain", join_(result.fallbackChainUsed)},
                                              {"objective", format_double(result.objectiveValue)},
                                              {"degraded", result.degraded ? "true" : "false"},
                                              {"advantage_ratio", format_double(result.advantageRatio)},
                                              {"advantage_computed", result.advantageComputed ? "true" : "false"},
                                              {"total_ms", format_double(result.totalElapsedMs)}});
            return RoutedResult{std::move(result), std::move(completed)};
        }

        std::optional<BaselineRun> measure_baseline_(const ProblemInstance &inst,
                                                     const std::vector<BackendDescriptor> &cands,
                                                     const ShapeKey &shape,
                                                     SteadyClock::time_point started)
        {
            const auto j = first_classical_(cands, 0);
            const Millis left = remaining_(started);
            if (!j || left <= Millis{0})
            {
                return std::nullopt;
            }
            const BackendDescriptor &d = cands[*j];
            std::shared_ptr<ISolverAdapter> adapter;
            try
            {
                adapter = m_registry->adapter(d.id);
            }
            catch (const std::out_of_range &)
            {
                return std::nullopt;
            }

            const SolveOutcome o = adapter->solve(inst, Deadline(std::min(m_cfg.budget_for(inst.size_class()), left)));
            record_(inst.id(), EventType::BaselineMeasured,
                    {{"backend", d.id},
                     {"success", o.success ? "true" : "false"},
                     {"objective", format_double(o.objectiveValue)},
                     {"elapsed_ms", format_double(o.elapsedMs)}});
            if (!o.success)
            {
                return std::nullopt;
            }
            BaselineRun run{d.id, o.elapsedMs, o.objectiveValue};
            m_baselines->put(shape, run);
            return run;
        }

        static std::string join_(const std::vector<BackendId> &ids)
        {
            std::string out;
            for (std::size_t i = 0; i < ids.size(); ++i)
            {
                if (i)
                {
                    out += ",";
                }
                out += ids[i];
            }
            return out;
        }

        RouterConfig m_cfg;
        std::shared_ptr<BackendRegistry> m_registry;
        std::shared_ptr<AuditLedger> m_ledger;
        std::shared_ptr<BaselineCache> m_baselines;
    };
}
