/*
Purpose: The orchestrator and a solver service on separate MPI ranks.

What this tests: rank 1 runs SolverService over MpiTransport while rank 0 submits business
requests through BusinessPodFacade; the specialized backend serves them over MPI, the
audit chain verifies, and a Shutdown from rank 0 ends the service loop.
*/

#include "classical_adapter.hpp"
#include "facade.hpp"
#include "mpi_transport.hpp"
#include "remote_adapter.hpp"
#include "solver_service.hpp"

#include <mpi.h>

#include <cstdio>

namespace
{
    [[noreturn]] void fail(const char *msg)
    {
        std::fprintf(stderr, "%s\n", msg);
        MPI_Abort(MPI_COMM_WORLD, 1);
        std::abort();
    }

    void check(bool ok, const char *msg)
    {
        if (!ok)
        {
            fail(msg);
        }
    }

    quboroute::BackendDescriptor desc(const std::string &id, quboroute::BackendKind kind, double cost)
    {
        quboroute::BackendDescriptor d;
        d.id = id;
        d.kind = kind;
        d.maxVariables = 256;
        d.costWeight = cost;
        return d;
    }
}

int main(int argc, char **argv)
{
    using namespace quboroute;

    int rc = MPI_Init(&argc, &argv);
    if (rc != MPI_SUCCESS)
    {
        return 2;
    }

    int rank = -1;
    int size = 0;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    check(size >= 2, "MPI remote solver test requires at least 2 ranks");

    auto tx = std::make_shared<MpiTransport>(MPI_COMM_WORLD, /*tag=*/7);

    if (rank == 1)
    {
        SolverServiceConfig scfg;
        scfg.annealer.sweeps = 300;
        SolverService service(scfg, tx);
        service.run();
        const SolverService::Stats st = service.stats();
        check(st.solved == 3, "service solved an unexpected number of requests");
        check(st.rejected == 0, "service rejected a request");
        tx->flush();
    }

    if (rank == 0)
    {
        RemoteAdapterConfig rcfg;
        rcfg.id = "anneal-mpi";
        rcfg.serviceRank = 1;
        auto remote = std::make_shared<RemoteSolverAdapter>(rcfg, tx);

        auto registry = std::make_shared<BackendRegistry>();
        registry->register_backend(desc("anneal-mpi", BackendKind::SpecializedSolver, 1.0), remote);
        registry->register_backend(desc("classical", BackendKind::ClassicalFallback, 0.5), std::make_shared<ClassicalAdapter>());
        auto ledger = std::make_shared<AuditLedger>(std::make_shared<MemoryLedgerStore>());

        FacadeConfig cfg;
        cfg.router.smallBudget = Millis{10000};
        cfg.router.classicalReserve = Millis{1000};
        BusinessPodFacade facade(cfg, registry, ledger);
        facade.register_pod("lab", PayloadKind::RawQubo);
        facade.register_pod("fleet", PayloadKind::Routing);

        RawQuboRequest raw;
        raw.variableCount = 12;
        raw.weights.assign(144, 0.0);
        for (std::size_t i = 0; i < 12; ++i)
        {
            raw.weights[i * 12 + i] = -1.0;
        }
        const SubmitReceipt a = facade.submit("lab", DomainPayload{raw});
        check(a.result.chosenBackendId == "anneal-mpi", "raw request not served over MPI");
        check(!a.result.degraded, "raw request degraded");
        check(a.result.objectiveValue == -12.0, "wrong raw objective");
        check(field_value(a.interpretation, "active_variables") == "12", "wrong interpretation");

        RoutingRequest route;
        route.stops = {"depot", "north", "east", "south"};
        route.distances = {0, 2, 4, 3,
                           2, 0, 2, 5,
                           4, 2, 0, 2,
                           3, 5, 2, 0};
        const SubmitReceipt b = facade.submit("fleet", DomainPayload{route});
        check(b.result.chosenBackendId == "anneal-mpi", "routing request not served over MPI");
        check(b.result.solutionVector.size() == 16, "wrong routing variable count");
        check(b.interpretation.front().first == "route", "routing interpretation missing");

        // Direct adapter call, bypassing the router.
        auto instance = ProblemInstance::create("direct-1", 2, {-1.0, 0.0, 0.0, -1.0}, "lab");
        const SolveOutcome direct = remote->solve(*instance, Millis{10000});
        check(direct.success, "direct solve failed");
        check(direct.objectiveValue == -2.0, "wrong direct objective");

        check(ledger->verify_chain(), "ledger chain broken");
        check(ledger->size() == 8, "unexpected ledger size");

        remote->shutdown_service();
        tx->flush();
    }

    MPI_Barrier(MPI_COMM_WORLD);
    MPI_Finalize();
    return 0;
}
