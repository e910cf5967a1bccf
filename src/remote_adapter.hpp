#pragma once

#include "log.hpp"
#include "random.hpp"
#include "solve_wire.hpp"
#include "solver_adapter.hpp"
#include "transport.hpp"

#include <atomic>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <utility>

namespace quboroute
{
    struct RemoteAdapterConfig
    {
        BackendId id = "anneal";
        RankId serviceRank = 1;

        // Sweep hint forwarded to the service; 0 lets the service choose.
        std::uint32_t sweeps = 0;

        // Mixed with the instance weights to seed the service's annealer.
        std::uint64_t seed = 0xA11EA1ULL;

        std::chrono::microseconds pollInterval{200};

        // Consecutive transport failures after which health_check() reports unhealthy.
        std::uint32_t unhealthyAfter = 3;
    };

    // Client side of the solve protocol for one transport endpoint.
    //
    // Every RemoteSolverAdapter on an endpoint shares its channel: tickets are unique per
    // endpoint, responses are matched on (service rank, ticket), and a caller that polls a
    // response for another ticket parks it in the mailbox for its owner. Responses nobody
    // waits for any more are discarded on arrival.
    class SolveChannel
    {
    public:
        using Key = std::pair<RankId, Ticket>;

        explicit SolveChannel(std::shared_ptr<ITransport> transport) : m_transport(std::move(transport))
        {
            if (!m_transport)
            {
                throw std::runtime_error("SolveChannel requires a transport");
            }
        }

        SolveChannel(const SolveChannel &) = delete;
        SolveChannel &operator=(const SolveChannel &) = delete;

        // The channel bound to `transport`, created on first use.
        static std::shared_ptr<SolveChannel> attach(const std::shared_ptr<ITransport> &transport)
        {
            static std::mutex mu;
            static std::map<const ITransport *, std::weak_ptr<SolveChannel>> bound;

            std::lock_guard<std::mutex> lk(mu);
            for (auto it = bound.begin(); it != bound.end();)
            {
                it = it->second.expired() ? bound.erase(it) : std::next(it);
            }
            auto it = bound.find(transport.get());
            if (it != bound.end())
            {
                if (auto live = it->second.lock())
                {
                    return live;
                }
            }
            auto ch = std::make_shared<SolveChannel>(transport);
            bound[transport.get()] = ch;
            return ch;
        }

        Ticket next_ticket() noexcept { return m_nextTicket.fetch_add(1, std::memory_order_relaxed); }

        void send(WireMessage msg)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_transport->send(std::move(msg));
        }

        // Sends a SolveRequest and waits on (dst, ticket) from now on.
        void send_request(RankId dst, Ticket ticket, ByteBuffer bytes)
        {
            WireMessage msg;
            msg.kind = MessageKind::SolveRequest;
            msg.dstRank = dst;
            msg.bytes = std::move(bytes);

            std::lock_guard<std::mutex> lk(m_mu);
            const Key key{dst, ticket};
            m_outstanding.insert(key);
            try
            {
                m_transport->send(std::move(msg));
            }
            catch (const std::exception &)
            {
                m_outstanding.erase(key);
                throw;
            }
        }

        // Drains the transport and returns the response from `src` for `ticket`, if any.
        std::optional<WireMessage> take(RankId src, Ticket ticket)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            while (auto m = m_transport->poll())
            {
                if (m->kind != MessageKind::SolveResponse || m->bytes.size() < sizeof(Ticket))
                {
                    Logger::instance().logf(LogLevel::Warn, "remote", {}, "dropping unexpected message kind %u from rank %u",
                                            static_cast<unsigned>(m->kind), m->srcRank);
                    continue;
                }
                const Key key{m->srcRank, decode_ticket(std::span<const std::byte>(m->bytes.data(), sizeof(Ticket)))};
                if (m_outstanding.count(key) == 0)
                {
                    Logger::instance().logf(LogLevel::Debug, "remote", {}, "discarding late response for ticket %llu from rank %u",
                                            static_cast<unsigned long long>(key.second), key.first);
                    continue;
                }
                m_mailbox.insert_or_assign(key, std::move(*m));
            }

            const Key key{src, ticket};
            auto it = m_mailbox.find(key);
            if (it == m_mailbox.end())
            {
                return std::nullopt;
            }
            WireMessage out = std::move(it->second);
            m_mailbox.erase(it);
            m_outstanding.erase(key);
            return out;
        }

        // Stops waiting on (dst, ticket) and asks the service to drop it.
        void abandon(RankId dst, Ticket ticket) noexcept
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_outstanding.erase(Key{dst, ticket});
            m_mailbox.erase(Key{dst, ticket});
            try
            {
                WireMessage cancel;
                cancel.kind = MessageKind::Cancel;
                cancel.dstRank = dst;
                cancel.bytes = encode_ticket(ticket);
                m_transport->send(std::move(cancel));
            }
            catch (const std::exception &e)
            {
                Logger::instance().logf(LogLevel::Warn, "remote", {}, "could not cancel ticket %llu on rank %u: %s",
                                        static_cast<unsigned long long>(ticket), dst, e.what());
            }
        }

        // Requests still waiting for a response, parked ones included.
        std::size_t in_flight() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_outstanding.size();
        }

    private:
        std::shared_ptr<ITransport> m_transport;
        std::atomic<Ticket> m_nextTicket{1};

        mutable std::mutex m_mu;
        std::set<Key> m_outstanding;
        std::map<Key, WireMessage> m_mailbox;
    };

    // Adapter for the specialized solving service reached through an ITransport.
    //
    // Thread-safe. Adapters built on the same transport object share one SolveChannel, so
    // several services can be reached through one endpoint.
    class RemoteSolverAdapter final : public ISolverAdapter
    {
    public:
        RemoteSolverAdapter(RemoteAdapterConfig cfg, const std::shared_ptr<ITransport> &transport)
            : RemoteSolverAdapter(std::move(cfg), transport ? SolveChannel::attach(transport) : nullptr)
        {
        }

        RemoteSolverAdapter(RemoteAdapterConfig cfg, std::shared_ptr<SolveChannel> channel)
            : m_cfg(std::move(cfg)), m_channel(std::move(channel))
        {
            if (!m_channel)
            {
                throw std::runtime_error("RemoteSolverAdapter requires a transport");
            }
        }

        const BackendId &id() const noexcept override { return m_cfg.id; }

        bool health_check() noexcept override
        {
            return m_transportFailures.load(std::memory_order_relaxed) < m_cfg.unhealthyAfter;
        }

        const std::shared_ptr<SolveChannel> &channel() const noexcept { return m_channel; }

        // Asks the service to stop serving. Best effort.
        void shutdown_service()
        {
            WireMessage msg;
            msg.kind = MessageKind::Shutdown;
            msg.dstRank = m_cfg.serviceRank;
            m_channel->send(std::move(msg));
        }

    protected:
        SolveOutcome solve_(const ProblemInstance &instance, const Deadline &deadline) override
        {
            const Ticket ticket = m_channel->next_ticket();

            SolveRequestMsg req;
            req.ticket = ticket;
            req.sweeps = m_cfg.sweeps;
            req.seed = instance_seed(m_cfg.seed, instance.weights());
            req.variableCount = instance.variable_count();
            req.weights = instance.weights();

            try
            {
                m_channel->send_request(m_cfg.serviceRank, ticket, encode_solve_request(req));
            }
            catch (const std::exception &e)
            {
                m_transportFailures.fetch_add(1, std::memory_order_relaxed);
                return SolveOutcome::failure(m_cfg.id, ErrorKind::ConnectionError, elapsed_ms(deadline.start()), e.what());
            }

            Logger::instance().logf(LogLevel::Trace, "remote", instance.id(), "%s sent ticket %llu to rank %u",
                                    m_cfg.id.c_str(), static_cast<unsigned long long>(ticket), m_cfg.serviceRank);

            while (true)
            {
                std::optional<WireMessage> reply;
                try
                {
                    reply = m_channel->take(m_cfg.serviceRank, ticket);
                }
                catch (const std::exception &e)
                {
                    m_transportFailures.fetch_add(1, std::memory_order_relaxed);
                    m_channel->abandon(m_cfg.serviceRank, ticket);
                    return SolveOutcome::failure(m_cfg.id, ErrorKind::ConnectionError, elapsed_ms(deadline.start()), e.what());
                }
                m_transportFailures.store(0, std::memory_order_relaxed);
                if (reply)
                {
                    return finish_(instance, deadline, *reply);
                }
                if (deadline.cancelled())
                {
                    m_channel->abandon(m_cfg.serviceRank, ticket);
                    return SolveOutcome::failure(m_cfg.id, ErrorKind::Cancelled, elapsed_ms(deadline.start()));
                }
                if (deadline.expired())
                {
                    m_channel->abandon(m_cfg.serviceRank, ticket);
                    return SolveOutcome::failure(m_cfg.id, ErrorKind::Timeout, elapsed_ms(deadline.start()),
                                                 "no response within budget");
                }
                std::this_thread::sleep_for(m_cfg.pollInterval);
            }
        }

    private:
        SolveOutcome finish_(const ProblemInstance &instance, const Deadline &deadline, const WireMessage &reply)
        {
            const double elapsed = elapsed_ms(deadline.start());
            SolveResponseMsg resp;
            try
            {
                resp = decode_solve_response(std::span<const std::byte>(reply.bytes.data(), reply.bytes.size()));
            }
            catch (const std::exception &e)
            {
                return SolveOutcome::failure(m_cfg.id, ErrorKind::MalformedResponse, elapsed, e.what());
            }

            switch (resp.status)
            {
            case ServiceStatus::Ok:
                break;
            case ServiceStatus::QuotaExceeded:
                return SolveOutcome::failure(m_cfg.id, ErrorKind::QuotaExceeded, elapsed, resp.detail);
            case ServiceStatus::Cancelled:
                return SolveOutcome::failure(m_cfg.id, ErrorKind::Cancelled, elapsed, resp.detail);
            case ServiceStatus::Rejected:
            case ServiceStatus::Internal:
                return SolveOutcome::failure(m_cfg.id, ErrorKind::Internal, elapsed, resp.detail);
            }

            if (resp.solution.size() != instance.variable_count())
            {
                return SolveOutcome::failure(m_cfg.id, ErrorKind::MalformedResponse, elapsed,
                                             "service returned " + std::to_string(resp.solution.size()) + " values");
            }

            SolveOutcome out;
            out.backendId = m_cfg.id;
            out.success = true;
            out.objectiveValue = instance.evaluate(resp.solution);
            out.solution = std::move(resp.solution);
            out.elapsedMs = elapsed;
            out.detail = "service " + format_double(resp.serviceMs) + " ms";
            return out;
        }

        RemoteAdapterConfig m_cfg;
        std::shared_ptr<SolveChannel> m_channel;
        std::atomic<std::uint32_t> m_transportFailures{0};
    };
}
