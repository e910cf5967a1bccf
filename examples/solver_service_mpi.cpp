#include "backend_config.hpp"
#include "classical_adapter.hpp"
#include "facade.hpp"
#include "file_ledger_store.hpp"
#include "mpi_transport.hpp"
#include "remote_adapter.hpp"
#include "solver_service.hpp"

#include <mpi.h>

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>

// Rank 0 hosts the orchestrator; every other rank runs one solver service.
//
//   mpiexec -n 3 ./quboroute_solver_service_mpi --requests 8 --vars 24 --config backends.conf
//
// Without --config, one specialized backend per service rank is registered as "anneal-<rank>"
// plus a classical fallback. With --config, specialized entries are bound to service ranks in
// file order.

namespace
{
    struct Params
    {
        std::uint32_t requests = 8;
        std::uint32_t vars = 24;
        std::uint32_t sweeps = 500;
        std::uint64_t seed = 1;
        std::string config;
        std::string ledger;
        quboroute::LogLevel logLevel = quboroute::LogLevel::Warn;
    };

    bool parse_u32(std::string_view s, std::uint32_t &out)
    {
        unsigned long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size() || v > std::numeric_limits<std::uint32_t>::max())
        {
            return false;
        }
        out = static_cast<std::uint32_t>(v);
        return true;
    }

    bool parse_u64(std::string_view s, std::uint64_t &out)
    {
        auto r = std::from_chars(s.data(), s.data() + s.size(), out);
        return r.ec == std::errc() && r.ptr == s.data() + s.size();
    }

    [[noreturn]] void usage(int rank, const char *why)
    {
        if (rank == 0)
        {
            std::cerr << "solver_service_mpi: " << why << "\n"
                      << "usage: solver_service_mpi [--requests N] [--vars N] [--sweeps N] [--seed N]"
                         " [--config FILE] [--ledger FILE] [--log-level LEVEL]\n";
        }
        MPI_Abort(MPI_COMM_WORLD, 2);
        std::exit(2);
    }

    Params parse_args(int argc, char **argv, int rank)
    {
        Params p;
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view a = argv[i];
            const auto next = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                {
                    usage(rank, "missing value");
                }
                return argv[++i];
            };
            if (a == "--requests")
            {
                if (!parse_u32(next(), p.requests))
                {
                    usage(rank, "bad --requests");
                }
            }
            else if (a == "--vars")
            {
                if (!parse_u32(next(), p.vars) || p.vars == 0)
                {
                    usage(rank, "bad --vars");
                }
            }
            else if (a == "--sweeps")
            {
                if (!parse_u32(next(), p.sweeps))
                {
                    usage(rank, "bad --sweeps");
                }
            }
            else if (a == "--seed")
            {
                if (!parse_u64(next(), p.seed))
                {
                    usage(rank, "bad --seed");
                }
            }
            else if (a == "--config")
            {
                p.config = std::string(next());
            }
            else if (a == "--ledger")
            {
                p.ledger = std::string(next());
            }
            else if (a == "--log-level")
            {
                try
                {
                    p.logLevel = quboroute::parse_log_level(next());
                }
                catch (const std::runtime_error &)
                {
                    usage(rank, "bad --log-level");
                }
            }
            else
            {
                usage(rank, "unknown argument");
            }
        }
        return p;
    }

    // Random symmetric instance with a negative-leaning diagonal.
    quboroute::RawQuboRequest random_instance(std::uint32_t n, std::uint64_t seed)
    {
        quboroute::RawQuboRequest r;
        r.variableCount = n;
        r.weights.assign(static_cast<std::size_t>(n) * n, 0.0);
        for (std::uint32_t i = 0; i < n; ++i)
        {
            r.weights[i * n + i] = -1.0 - quboroute::rng_unit_double(seed, /*stream=*/0, i);
            for (std::uint32_t j = i + 1; j < n; ++j)
            {
                const double w = quboroute::rng_unit_double(seed, /*stream=*/1, static_cast<std::uint64_t>(i) * n + j) - 0.5;
                r.weights[i * n + j] = w;
                r.weights[j * n + i] = w;
            }
        }
        return r;
    }

    int run_orchestrator(const Params &p, int size, const std::shared_ptr<quboroute::MpiTransport> &tx)
    {
        using namespace quboroute;

        std::vector<std::shared_ptr<RemoteSolverAdapter>> remotes;
        RankId nextService = 1;
        const AdapterFactory factory = [&](const BackendDescriptor &d) -> std::shared_ptr<ISolverAdapter>
        {
            if (d.kind == BackendKind::ClassicalFallback)
            {
                ClassicalAdapterConfig c;
                c.id = d.id;
                return std::make_shared<ClassicalAdapter>(c);
            }
            if (nextService >= static_cast<RankId>(size))
            {
                throw std::runtime_error("more specialized backends than service ranks");
            }
            RemoteAdapterConfig rc;
            rc.id = d.id;
            rc.serviceRank = nextService++;
            remotes.push_back(std::make_shared<RemoteSolverAdapter>(rc, tx));
            return remotes.back();
        };

        std::vector<BackendConfigEntry> entries;
        if (!p.config.empty())
        {
            entries = load_backend_config(p.config);
        }
        else
        {
            for (int r = 1; r < size; ++r)
            {
                BackendConfigEntry e;
                e.descriptor.id = "anneal-" + std::to_string(r);
                e.descriptor.kind = BackendKind::SpecializedSolver;
                e.descriptor.maxVariables = 4096;
                e.descriptor.costWeight = static_cast<double>(r);
                entries.push_back(std::move(e));
            }
            BackendConfigEntry classical;
            classical.descriptor.id = "classical";
            classical.descriptor.kind = BackendKind::ClassicalFallback;
            classical.descriptor.maxVariables = 100000;
            entries.push_back(std::move(classical));
        }

        auto registry = std::make_shared<BackendRegistry>();
        registry->reload(entries, factory);

        std::shared_ptr<ILedgerStore> store;
        if (p.ledger.empty())
        {
            store = std::make_shared<MemoryLedgerStore>();
        }
        else
        {
            store = std::make_shared<FileLedgerStore>(p.ledger);
        }
        auto ledger = std::make_shared<AuditLedger>(store);

        FacadeConfig cfg;
        cfg.router.logLevel = p.logLevel;
        cfg.requestIdSeed = p.seed;
        BusinessPodFacade facade(cfg, registry, ledger);
        facade.register_pod("lab", PayloadKind::RawQubo);

        std::uint32_t ok = 0;
        std::uint32_t degraded = 0;
        for (std::uint32_t i = 0; i < p.requests; ++i)
        {
            try
            {
                const SubmitReceipt r = facade.submit("lab", DomainPayload{random_instance(p.vars, mix_u64(p.seed, i))});
                ++ok;
                degraded += r.result.degraded ? 1 : 0;
                std::cout << r.audit.requestId << " backend=" << r.result.chosenBackendId << " objective=" << r.result.objectiveValue
                          << " ms=" << r.result.totalElapsedMs << (r.result.degraded ? " (degraded)" : "") << "\n";
            }
            catch (const OrchestrationError &e)
            {
                std::cerr << e.request_id() << " failed: " << error_code_name(e.code()) << ": " << e.what() << "\n";
                if (e.code() == ErrorCode::LedgerUnavailable)
                {
                    break;
                }
            }
        }

        for (const auto &remote : remotes)
        {
            remote->shutdown_service();
        }
        // Ranks without a configured backend still wait for a Shutdown.
        for (RankId r = nextService; r < static_cast<RankId>(size); ++r)
        {
            WireMessage msg;
            msg.kind = MessageKind::Shutdown;
            msg.dstRank = r;
            tx->send(std::move(msg));
        }
        tx->flush();

        const bool intact = ledger->verify_chain();
        std::cout << "completed " << ok << "/" << p.requests << " (" << degraded << " degraded), ledger records=" << ledger->size()
                  << " chain=" << (intact ? "intact" : "BROKEN") << "\n";
        return (ok == p.requests && intact) ? 0 : 1;
    }
}

int main(int argc, char **argv)
{
    int provided = 0;
    MPI_Init_thread(&argc, &argv, MPI_THREAD_SINGLE, &provided);
    int rank = 0;
    int size = 1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    const Params p = parse_args(argc, argv, rank);
    if (size < 2)
    {
        usage(rank, "needs at least 2 ranks");
    }

    quboroute::Logger::instance().set_level(p.logLevel);
    auto tx = std::make_shared<quboroute::MpiTransport>(MPI_COMM_WORLD, /*tag=*/3);

    int rc = 0;
    try
    {
        if (rank == 0)
        {
            rc = run_orchestrator(p, size, tx);
        }
        else
        {
            quboroute::SolverServiceConfig scfg;
            scfg.name = "anneal-" + std::to_string(rank);
            scfg.annealer.sweeps = p.sweeps;
            quboroute::SolverService service(scfg, tx);
            service.run();
            tx->flush();
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "rank " << rank << ": " << e.what() << "\n";
        MPI_Abort(MPI_COMM_WORLD, 1);
    }

    MPI_Barrier(MPI_COMM_WORLD);
    MPI_Finalize();
    return rc;
}
