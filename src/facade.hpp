#pragma once

#include "problem_builder.hpp"
#include "random.hpp"
#include "router.hpp"

#include <atomic>
#include <future>

namespace quboroute
{
    struct FacadeConfig
    {
        RouterConfig router{};

        // `capacity` is bound to the registry when left empty.
        ProblemBuilderConfig builder{};

        // Request ids are "<prefix>-<16 hex digits>". A zero seed is replaced by the wall clock.
        std::string requestIdPrefix = "req";
        std::uint64_t requestIdSeed = 0;
    };

    struct SubmitOptions
    {
        std::optional<BackendId> preferredBackend;
        std::optional<CancelToken> cancel;
    };

    // Where a request's audit trail lives. Records of concurrent requests interleave, so
    // [firstSequence, lastSequence] bounds the trail rather than enumerating it.
    struct AuditReference
    {
        RequestId requestId;
        std::uint64_t firstSequence = 0;
        std::uint64_t lastSequence = 0;
        // Hex SHA-256 of the `completed` record.
        std::string completedHash;
    };

    struct SubmitReceipt
    {
        NormalizedResult result;
        AuditReference audit;
        // The solution in business terms (selected leads, asset weights, ...).
        Fields interpretation;
    };

    // Entry point for business units: builds, routes and audits one request per call.
    class BusinessPodFacade
    {
    public:
        BusinessPodFacade(FacadeConfig cfg, std::shared_ptr<BackendRegistry> registry, std::shared_ptr<AuditLedger> ledger)
            : m_registry(std::move(registry)),
              m_ledger(std::move(ledger)),
              m_builder(bind_capacity_(std::move(cfg.builder), m_registry)),
              m_router(std::move(cfg.router), m_registry, m_ledger),
              m_prefix(std::move(cfg.requestIdPrefix)),
              m_seed(cfg.requestIdSeed != 0 ? cfg.requestIdSeed : wall_clock_us())
        {
        }

        void register_pod(const PodId &pod, PayloadKind kind) { m_builder.register_pod(pod, kind); }

        SubmitReceipt submit(const PodId &sourcePod, const DomainPayload &payload, const SubmitOptions &opts = {})
        {
            const RequestId rid = next_request_id_();
            const LedgerRecord submitted = m_ledger->append(
                LedgerEvent{rid, EventType::Submitted, {{"pod", sourcePod}, {"payload", payload_kind_name(payload_kind(payload))}}});
            Logger::instance().logf(LogLevel::Debug, "facade", rid, "submitted by %s", sourcePod.c_str());

            ProblemPtr instance;
            try
            {
                instance = m_builder.build(rid, sourcePod, payload);
            }
            catch (OrchestrationError &e)
            {
                e.set_request_id(rid);
                Logger::instance().logf(LogLevel::Info, "facade", rid, "rejected: %s", e.what());
                m_ledger->append(LedgerEvent{rid, EventType::Failed, {{"error", error_code_name(e.code())}, {"message", e.what()}}});
                throw;
            }

            RoutedResult routed = m_router.execute(RouteRequest{instance, opts.preferredBackend, opts.cancel});

            SubmitReceipt receipt;
            receipt.interpretation = interpret_solution(payload, routed.result.solutionVector);
            receipt.audit = AuditReference{rid, submitted.sequenceNumber, routed.completed.sequenceNumber, to_hex(routed.completed.recordHash)};
            receipt.result = std::move(routed.result);
            return receipt;
        }

        // Runs submit() on its own thread.
        std::future<SubmitReceipt> submit_async(PodId sourcePod, DomainPayload payload, SubmitOptions opts = {})
        {
            return std::async(std::launch::async, [this, pod = std::move(sourcePod), p = std::move(payload), o = std::move(opts)]()
                              { return submit(pod, p, o); });
        }

        std::vector<LedgerRecord> audit_trail(const RequestId &rid) const { return m_ledger->query(rid); }

        // Admin surface.
        void register_backend(BackendDescriptor desc, std::shared_ptr<ISolverAdapter> adapter)
        {
            m_registry->register_backend(std::move(desc), std::move(adapter));
        }
        void deregister_backend(const BackendId &id) { m_registry->deregister_backend(id); }
        void set_health(const BackendId &id, bool healthy) { m_registry->set_health(id, healthy); }

        BackendRegistry &registry() noexcept { return *m_registry; }
        AuditLedger &ledger() noexcept { return *m_ledger; }
        Router &router() noexcept { return m_router; }

    private:
        static ProblemBuilderConfig bind_capacity_(ProblemBuilderConfig cfg, const std::shared_ptr<BackendRegistry> &registry)
        {
            if (!registry)
            {
                throw std::runtime_error("BusinessPodFacade requires a registry");
            }
            if (!cfg.capacity)
            {
                std::weak_ptr<BackendRegistry> weak = registry;
                cfg.capacity = [weak]() -> std::size_t
                {
                    auto r = weak.lock();
                    return r ? r->max_variables() : 0;
                };
            }
            return cfg;
        }

        RequestId next_request_id_()
        {
            const std::uint64_t n = m_counter.fetch_add(1, std::memory_order_relaxed);
            char buf[17];
            std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(mix_u64(m_seed, n)));
            return m_prefix + "-" + buf;
        }

        std::shared_ptr<BackendRegistry> m_registry;
        std::shared_ptr<AuditLedger> m_ledger;
        ProblemBuilder m_builder;
        Router m_router;
        std::string m_prefix;
        std::uint64_t m_seed;
        std::atomic<std::uint64_t> m_counter{0};
    };
}
