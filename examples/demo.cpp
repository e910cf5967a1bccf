#include "backend_config.hpp"
#include "classical_adapter.hpp"
#include "facade.hpp"
#include "file_ledger_store.hpp"
#include "health_monitor.hpp"
#include "remote_adapter.hpp"
#include "solver_service.hpp"

#include <iostream>
#include <sstream>
#include <thread>

namespace
{
    // Three pods, one specialized service, one classical fallback.
    const char *kBackends = R"(# demo registry
backend id=anneal kind=specialized max_variables=512 latency_ms=200 cost=1
backend id=classical kind=classical max_variables=4096 latency_ms=50 cost=5
)";

    void print_receipt(const char *label, const quboroute::SubmitReceipt &r)
    {
        std::cout << label << ": request=" << r.audit.requestId << " backend=" << r.result.chosenBackendId
                  << " objective=" << r.result.objectiveValue << " degraded=" << (r.result.degraded ? "yes" : "no")
                  << " elapsed_ms=" << r.result.totalElapsedMs << "\n";
        for (const auto &[k, v] : r.interpretation)
        {
            std::cout << "  " << k << ": " << v << "\n";
        }
        std::cout << "  audit: seq " << r.audit.firstSequence << ".." << r.audit.lastSequence << " completed=" << r.audit.completedHash.substr(0, 16)
                  << "...\n";
    }

    quboroute::LeadScoringRequest sample_leads()
    {
        quboroute::LeadScoringRequest r;
        r.leads = {
            {"acme", 0.9, 0.8, 0.9, 0.7, 40000.0},
            {"globex", 0.3, 0.2, 0.4, 0.1, 8000.0},
            {"initech", 0.7, 0.6, 0.5, 0.9, 15000.0},
            {"umbrella", 0.5, 0.9, 0.8, 0.4, 22000.0},
        };
        r.contactBudget = 600.0;
        r.maxLeads = 2;
        return r;
    }

    quboroute::PortfolioRequest sample_portfolio()
    {
        quboroute::PortfolioRequest r;
        r.assets = {"bonds", "equities", "gold"};
        r.expectedReturns = {0.03, 0.08, 0.05};
        r.covariance = {0.01, 0.002, 0.001,
                        0.002, 0.09, 0.01,
                        0.001, 0.01, 0.04};
        r.bitsPerAsset = 2;
        return r;
    }

    quboroute::EnergyScheduleRequest sample_energy()
    {
        quboroute::EnergyScheduleRequest r;
        r.loads = {{"furnace", 120.0}, {"chiller", 60.0}, {"press", 80.0}};
        r.slotPrices = {0.31, 0.12, 0.18};
        r.peakPenalty = 0.05;
        return r;
    }
}

int main(int argc, char **argv)
{
    using namespace quboroute;

    const std::string ledgerPath = argc > 1 ? argv[1] : "";

    Logger::instance().set_level(LogLevel::Info);

    auto hub = std::make_shared<InProcHub>();
    SolverServiceConfig scfg;
    scfg.annealer.sweeps = 400;
    auto service = std::make_shared<SolverService>(scfg, std::make_shared<InProcTransport>(hub, 1));
    std::thread serviceThread([service]()
                              { service->run(); });

    std::shared_ptr<RemoteSolverAdapter> remote;
    const AdapterFactory factory = [&](const BackendDescriptor &d) -> std::shared_ptr<ISolverAdapter>
    {
        if (d.kind == BackendKind::ClassicalFallback)
        {
            ClassicalAdapterConfig c;
            c.id = d.id;
            return std::make_shared<ClassicalAdapter>(c);
        }
        RemoteAdapterConfig rc;
        rc.id = d.id;
        rc.serviceRank = 1;
        remote = std::make_shared<RemoteSolverAdapter>(rc, std::make_shared<InProcTransport>(hub, 0));
        return remote;
    };

    auto registry = std::make_shared<BackendRegistry>();
    std::istringstream config(kBackends);
    registry->reload(parse_backend_config(config), factory);

    std::shared_ptr<ILedgerStore> store;
    if (ledgerPath.empty())
    {
        store = std::make_shared<MemoryLedgerStore>();
    }
    else
    {
        store = std::make_shared<FileLedgerStore>(ledgerPath);
    }
    auto ledger = std::make_shared<AuditLedger>(store);

    FacadeConfig cfg;
    cfg.router.smallBudget = Millis{1000};
    cfg.router.classicalReserve = Millis{500};
    cfg.router.runBaseline = true;
    cfg.router.logLevel = LogLevel::Info;
    BusinessPodFacade facade(cfg, registry, ledger);
    facade.register_pod("sales", PayloadKind::LeadScoring);
    facade.register_pod("treasury", PayloadKind::Portfolio);
    facade.register_pod("facilities", PayloadKind::EnergySchedule);

    HealthMonitor monitor(registry);
    monitor.start(Millis{500});

    int rc = 0;
    try
    {
        print_receipt("sales", facade.submit("sales", DomainPayload{sample_leads()}));
        print_receipt("treasury", facade.submit("treasury", DomainPayload{sample_portfolio()}));

        // The specialized service stalls; the request degrades to the classical backend.
        service->set_faults(ServiceFaults{Millis{5000}, false, std::nullopt});
        const SubmitReceipt degraded = facade.submit("facilities", DomainPayload{sample_energy()});
        service->set_faults(ServiceFaults{});
        print_receipt("facilities", degraded);

        std::cout << "audit trail for " << degraded.audit.requestId << ":\n";
        for (const auto &rec : facade.audit_trail(degraded.audit.requestId))
        {
            std::cout << "  #" << rec.sequenceNumber << " " << event_type_name(rec.eventType) << "\n";
        }

        try
        {
            (void)facade.submit("marketing", DomainPayload{sample_leads()});
        }
        catch (const MalformedRequestError &e)
        {
            std::cout << "rejected " << e.request_id() << ": " << e.what() << "\n";
        }

        std::cout << "ledger records=" << ledger->size() << " chain=" << (ledger->verify_chain() ? "intact" : "BROKEN") << "\n";
    }
    catch (const OrchestrationError &e)
    {
        std::cerr << "demo failed (" << error_code_name(e.code()) << "): " << e.what() << "\n";
        rc = 1;
    }

    monitor.stop();
    if (remote)
    {
        remote->shutdown_service();
    }
    else
    {
        service->stop();
    }
    serviceThread.join();
    return rc;
}
