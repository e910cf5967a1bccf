/*
Purpose: Remote adapter <-> solver service over the in-process transport.

What this tests: a served request returns a full assignment with the objective recomputed
locally, service-side faults map onto adapter error kinds (timeout, quota, internal,
malformed response, connection error), cancellation reaches the service, concurrent
callers sharing one adapter each get their own response, adapters for two services on one
endpoint never receive each other's answers, requests cancelled while queued are answered
with Cancelled, malformed cancels are dropped, cancel bookkeeping drains on both sides, and
Shutdown stops the service.
*/

#include "remote_adapter.hpp"
#include "solver_service.hpp"

#include <atomic>
#include <cassert>
#include <thread>

namespace
{
    quboroute::ProblemPtr diagonal(std::size_t n, double d, const std::string &id = "req")
    {
        std::vector<double> w(n * n, 0.0);
        for (std::size_t i = 0; i < n; ++i)
        {
            w[i * n + i] = d;
        }
        return quboroute::ProblemInstance::create(id, n, std::move(w), "lab");
    }

    quboroute::ByteBuffer request_bytes(quboroute::Ticket ticket, std::size_t n, double d)
    {
        quboroute::SolveRequestMsg req;
        req.ticket = ticket;
        req.seed = 17;
        req.variableCount = n;
        req.weights.assign(n * n, 0.0);
        for (std::size_t i = 0; i < n; ++i)
        {
            req.weights[i * n + i] = d;
        }
        return quboroute::encode_solve_request(req);
    }

    quboroute::WireMessage message(quboroute::MessageKind kind, quboroute::RankId dst, quboroute::ByteBuffer bytes)
    {
        quboroute::WireMessage m;
        m.kind = kind;
        m.dstRank = dst;
        m.bytes = std::move(bytes);
        return m;
    }

    quboroute::SolveResponseMsg next_response(quboroute::InProcTransport &end)
    {
        auto m = end.poll();
        assert(m && m->kind == quboroute::MessageKind::SolveResponse);
        return quboroute::decode_solve_response(std::span<const std::byte>(m->bytes.data(), m->bytes.size()));
    }

    class BrokenTransport final : public quboroute::ITransport
    {
    public:
        void send(quboroute::WireMessage) override { throw std::runtime_error("link down"); }
        std::optional<quboroute::WireMessage> poll() override { return std::nullopt; }
        bool has_pending() const override { return false; }
    };

    // Runs a SolverService on its own thread for the lifetime of the object.
    struct ServiceThread
    {
        std::shared_ptr<quboroute::SolverService> service;
        std::thread thread;

        ServiceThread(quboroute::SolverServiceConfig cfg, std::shared_ptr<quboroute::ITransport> t)
            : service(std::make_shared<quboroute::SolverService>(std::move(cfg), std::move(t)))
        {
            thread = std::thread([s = service]()
                                 { s->run(); });
        }

        ~ServiceThread()
        {
            service->stop();
            if (thread.joinable())
            {
                thread.join();
            }
        }
    };
}

int main()
{
    using namespace quboroute;

    auto hub = std::make_shared<InProcHub>();
    auto clientEnd = std::make_shared<InProcTransport>(hub, 0);

    SolverServiceConfig scfg;
    scfg.maxVariables = 16;
    scfg.annealer.sweeps = 200;
    ServiceThread svc(scfg, std::make_shared<InProcTransport>(hub, 1));

    RemoteAdapterConfig rcfg;
    rcfg.id = "anneal";
    rcfg.serviceRank = 1;
    RemoteSolverAdapter adapter(rcfg, clientEnd);
    assert(adapter.health_check());

    // Plain success.
    {
        auto p = diagonal(8, -1.0);
        const SolveOutcome o = adapter.solve(*p, Millis{5000});
        assert(o.success);
        assert(o.backendId == "anneal");
        assert(o.solution == std::vector<double>(8, 1.0));
        assert(o.objectiveValue == -8.0);
        assert(o.detail.find("service") != std::string::npos);
    }

    // The service stalls past the budget; the next request is fine again.
    {
        svc.service->set_faults(ServiceFaults{Millis{2000}, false, std::nullopt});
        auto p = diagonal(4, -1.0);
        const SolveOutcome late = adapter.solve(*p, Millis{50});
        assert(!late.success);
        assert(late.errorKind == ErrorKind::Timeout);

        svc.service->set_faults(ServiceFaults{});
        const SolveOutcome ok = adapter.solve(*p, Millis{5000});
        assert(ok.success);
        assert(ok.objectiveValue == -4.0);
    }

    // Silent service.
    {
        svc.service->set_faults(ServiceFaults{Millis{0}, true, std::nullopt});
        const SolveOutcome o = adapter.solve(*diagonal(3, -1.0), Millis{30});
        assert(o.errorKind == ErrorKind::Timeout);
        assert(adapter.channel()->in_flight() == 0);
        svc.service->set_faults(ServiceFaults{});
    }

    // Injected statuses.
    {
        auto p = diagonal(3, -1.0);
        svc.service->set_faults(ServiceFaults{Millis{0}, false, ServiceStatus::Internal});
        SolveOutcome o = adapter.solve(*p, Millis{5000});
        assert(!o.success);
        assert(o.errorKind == ErrorKind::Internal);
        assert(o.detail == "injected");

        svc.service->set_faults(ServiceFaults{Millis{0}, false, ServiceStatus::QuotaExceeded});
        o = adapter.solve(*p, Millis{5000});
        assert(o.errorKind == ErrorKind::QuotaExceeded);
        svc.service->set_faults(ServiceFaults{});
    }

    // Larger than the service accepts.
    {
        const SolveOutcome o = adapter.solve(*diagonal(17, -1.0), Millis{5000});
        assert(o.errorKind == ErrorKind::Internal);
    }

    // Caller cancels while the service is busy.
    {
        svc.service->set_faults(ServiceFaults{Millis{2000}, false, std::nullopt});
        CancelToken token;
        std::thread canceller([token]() mutable
                              {
                                  std::this_thread::sleep_for(Millis{30});
                                  token.cancel(); });
        const auto t0 = SteadyClock::now();
        const SolveOutcome o = adapter.solve(*diagonal(3, -1.0), Deadline(Millis{5000}, token));
        canceller.join();
        assert(o.errorKind == ErrorKind::Cancelled);
        assert(elapsed_ms(t0) < 1500.0);
        svc.service->set_faults(ServiceFaults{});
    }

    // Concurrent callers share one adapter.
    {
        std::vector<std::thread> callers;
        std::vector<SolveOutcome> results(4);
        for (std::size_t k = 0; k < results.size(); ++k)
        {
            callers.emplace_back([&, k]()
                                 { results[k] = adapter.solve(*diagonal(k + 2, -2.0), Millis{10000}); });
        }
        for (auto &c : callers)
        {
            c.join();
        }
        for (std::size_t k = 0; k < results.size(); ++k)
        {
            assert(results[k].success);
            assert(results[k].solution.size() == k + 2);
            assert(results[k].objectiveValue == -2.0 * static_cast<double>(k + 2));
        }
    }

    // Two services behind one client endpoint, called concurrently.
    {
        ServiceThread left(scfg, std::make_shared<InProcTransport>(hub, 6));
        ServiceThread right(scfg, std::make_shared<InProcTransport>(hub, 7));
        auto sharedEnd = std::make_shared<InProcTransport>(hub, 8);

        RemoteAdapterConfig lcfg;
        lcfg.id = "left";
        lcfg.serviceRank = 6;
        RemoteAdapterConfig rcfg2;
        rcfg2.id = "right";
        rcfg2.serviceRank = 7;
        RemoteSolverAdapter toLeft(lcfg, sharedEnd);
        RemoteSolverAdapter toRight(rcfg2, sharedEnd);
        assert(toLeft.channel() == toRight.channel());

        constexpr int rounds = 30;
        std::atomic<int> leftWrong{0};
        std::atomic<int> rightWrong{0};
        std::thread l([&]()
                      {
                          for (int k = 0; k < rounds; ++k)
                          {
                              const SolveOutcome o = toLeft.solve(*diagonal(3, -1.0), Millis{10000});
                              if (!o.success || o.solution != std::vector<double>(3, 1.0) || o.objectiveValue != -3.0)
                              {
                                  ++leftWrong;
                              }
                          } });
        std::thread r([&]()
                      {
                          for (int k = 0; k < rounds; ++k)
                          {
                              const SolveOutcome o = toRight.solve(*diagonal(3, 1.0), Millis{10000});
                              if (!o.success || o.solution != std::vector<double>(3, 0.0) || o.objectiveValue != 0.0)
                              {
                                  ++rightWrong;
                              }
                          } });
        l.join();
        r.join();
        assert(leftWrong.load() == 0);
        assert(rightWrong.load() == 0);
        assert(left.service->stats().solved == static_cast<std::uint64_t>(rounds));
        assert(right.service->stats().solved == static_cast<std::uint64_t>(rounds));
        assert(toLeft.channel()->in_flight() == 0);
    }

    // A request cancelled while it waits behind another one is answered with Cancelled.
    // Cancels for finished or malformed tickets are dropped without being remembered.
    {
        SolverServiceConfig dcfg;
        dcfg.name = "stepped";
        dcfg.faults.delay = Millis{20};
        auto serviceEnd = std::make_shared<InProcTransport>(hub, 9);
        InProcTransport peer(hub, 10);
        SolverService stepped(dcfg, serviceEnd);

        peer.send(message(MessageKind::SolveRequest, 9, request_bytes(1, 2, -1.0)));
        peer.send(message(MessageKind::SolveRequest, 9, request_bytes(2, 2, -1.0)));
        peer.send(message(MessageKind::Cancel, 9, encode_ticket(2)));

        assert(stepped.poll_once());
        const SolveResponseMsg first = next_response(peer);
        assert(first.ticket == 1);
        assert(first.status == ServiceStatus::Ok);
        assert(stepped.pending_cancels() == 1);

        assert(stepped.poll_once());
        const SolveResponseMsg second = next_response(peer);
        assert(second.ticket == 2);
        assert(second.status == ServiceStatus::Cancelled);
        assert(stepped.pending_cancels() == 0);

        peer.send(message(MessageKind::Cancel, 9, encode_ticket(1)));
        peer.send(message(MessageKind::Cancel, 9, ByteBuffer(3, std::byte{0x7f})));
        assert(stepped.poll_once());
        assert(stepped.poll_once());
        assert(!stepped.poll_once());
        assert(stepped.pending_cancels() == 0);
        assert(!peer.poll());

        const SolverService::Stats st = stepped.stats();
        assert(st.solved == 1);
        assert(st.cancelled == 1);
    }

    // Replies that do not decode, or do not fit the instance.
    {
        auto fakeEnd = std::make_shared<InProcTransport>(hub, 2);
        std::thread fake([fakeEnd]()
                         {
                             int answered = 0;
                             while (answered < 2)
                             {
                                 auto m = fakeEnd->poll();
                                 if (!m)
                                 {
                                     std::this_thread::sleep_for(Millis{1});
                                     continue;
                                 }
                                 if (m->kind != MessageKind::SolveRequest)
                                 {
                                     continue;
                                 }
                                 const SolveRequestMsg req = decode_solve_request(std::span<const std::byte>(m->bytes.data(), m->bytes.size()));
                                 WireMessage out;
                                 out.kind = MessageKind::SolveResponse;
                                 out.dstRank = m->srcRank;
                                 if (answered == 0)
                                 {
                                     WireWriter w;
                                     w.write_u64(req.ticket);
                                     w.write_u8(99);
                                     out.bytes = w.take();
                                 }
                                 else
                                 {
                                     SolveResponseMsg resp;
                                     resp.ticket = req.ticket;
                                     resp.solution = {1.0};
                                     out.bytes = encode_solve_response(resp);
                                 }
                                 fakeEnd->send(std::move(out));
                                 ++answered;
                             } });

        RemoteAdapterConfig fcfg;
        fcfg.id = "imposter";
        fcfg.serviceRank = 2;
        RemoteSolverAdapter imposter(fcfg, std::make_shared<InProcTransport>(hub, 3));
        const SolveOutcome garbled = imposter.solve(*diagonal(3, -1.0), Millis{5000});
        const SolveOutcome shortAnswer = imposter.solve(*diagonal(3, -1.0), Millis{5000});
        fake.join();
        assert(garbled.errorKind == ErrorKind::MalformedResponse);
        assert(shortAnswer.errorKind == ErrorKind::MalformedResponse);
    }

    // Transport failures are connection errors and eventually fail the health probe.
    {
        RemoteAdapterConfig bcfg;
        bcfg.id = "offline";
        bcfg.unhealthyAfter = 2;
        RemoteSolverAdapter offline(bcfg, std::make_shared<BrokenTransport>());
        assert(offline.health_check());
        SolveOutcome o = offline.solve(*diagonal(2, -1.0), Millis{100});
        assert(o.errorKind == ErrorKind::ConnectionError);
        assert(o.detail == "link down");
        assert(offline.health_check());
        o = offline.solve(*diagonal(2, -1.0), Millis{100});
        assert(o.errorKind == ErrorKind::ConnectionError);
        assert(!offline.health_check());
    }

    // A service with a lifetime quota.
    {
        SolverServiceConfig qcfg;
        qcfg.name = "metered";
        qcfg.quota = 1;
        ServiceThread metered(qcfg, std::make_shared<InProcTransport>(hub, 4));
        RemoteAdapterConfig mcfg;
        mcfg.id = "metered";
        mcfg.serviceRank = 4;
        RemoteSolverAdapter client(mcfg, std::make_shared<InProcTransport>(hub, 5));
        assert(client.solve(*diagonal(2, -1.0), Millis{5000}).success);
        const SolveOutcome o = client.solve(*diagonal(2, -1.0), Millis{5000});
        assert(o.errorKind == ErrorKind::QuotaExceeded);
        assert(metered.service->stats().solved == 1);
    }

    assert(adapter.channel()->in_flight() == 0);
    adapter.shutdown_service();
    svc.thread.join();
    assert(svc.service->pending_cancels() == 0);
    const SolverService::Stats st = svc.service->stats();
    assert(st.solved == 6);
    assert(st.cancelled >= 1);
    assert(st.rejected == 1);

    return 0;
}
