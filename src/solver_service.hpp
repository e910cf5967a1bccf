#pragma once

#include "annealer.hpp"
#include "log.hpp"
#include "solve_wire.hpp"
#include "transport.hpp"

#include <atomic>
#include <deque>
#include <mutex>
#include <set>
#include <thread>
#include <utility>

namespace quboroute
{
    // Fault injection knobs, adjustable while the service runs.
    struct ServiceFaults
    {
        // Sleep before solving (interruptible by Cancel/Shutdown).
        Millis delay{0};
        // Never answer; the client observes a timeout.
        bool dropResponses = false;
        // Answer every request with this status instead of solving.
        std::optional<ServiceStatus> forcedStatus;
    };

    struct SolverServiceConfig
    {
        std::string name = "anneal-service";
        AnnealerConfig annealer{};
        // Largest instance accepted; larger requests are answered with Rejected.
        std::uint64_t maxVariables = 4096;
        // Total solves accepted over the service lifetime; 0 means unlimited.
        std::uint64_t quota = 0;
        // Idle sleep between empty polls in run().
        std::chrono::microseconds idleSleep{200};
        ServiceFaults faults{};
    };

    // The specialized solving backend: answers SolveRequest messages with annealed assignments.
    class SolverService
    {
    public:
        struct Stats
        {
            std::uint64_t received = 0;
            std::uint64_t solved = 0;
            std::uint64_t rejected = 0;
            std::uint64_t cancelled = 0;
        };

        SolverService(SolverServiceConfig cfg, std::shared_ptr<ITransport> transport)
            : m_cfg(std::move(cfg)), m_transport(std::move(transport)), m_faults(m_cfg.faults)
        {
            if (!m_transport)
            {
                throw std::runtime_error("SolverService requires a transport");
            }
        }

        void set_faults(ServiceFaults f)
        {
            std::lock_guard<std::mutex> lk(m_faultMu);
            m_faults = std::move(f);
        }

        // Serves until a Shutdown message arrives or stop() is called.
        void run()
        {
            Logger::instance().logf(LogLevel::Info, "service", {}, "%s serving", m_cfg.name.c_str());
            while (!m_stop.load(std::memory_order_acquire))
            {
                if (!poll_once())
                {
                    std::this_thread::sleep_for(m_cfg.idleSleep);
                }
            }
            Logger::instance().logf(LogLevel::Info, "service", {}, "%s stopped after %llu solves", m_cfg.name.c_str(),
                                    static_cast<unsigned long long>(stats().solved));
        }

        void stop() noexcept { m_stop.store(true, std::memory_order_release); }

        // Handles at most one message. Returns false when nothing was pending.
        bool poll_once()
        {
            std::optional<WireMessage> msg;
            if (!m_backlog.empty())
            {
                msg = std::move(m_backlog.front());
                m_backlog.pop_front();
            }
            else
            {
                msg = m_transport->poll();
            }
            if (!msg)
            {
                return false;
            }
            handle_(std::move(*msg));
            return true;
        }

        // Cancels recorded for requests not yet answered. Read it only while run() is not active.
        std::size_t pending_cancels() const noexcept { return m_cancelled.size(); }

        Stats stats() const
        {
            std::lock_guard<std::mutex> lk(m_statsMu);
            return m_stats;
        }

    private:
        using CancelKey = std::pair<RankId, Ticket>;

        // Clears the in-progress marker when serve_ returns.
        struct Busy
        {
            std::optional<CancelKey> &slot;
            explicit Busy(std::optional<CancelKey> &s) : slot(s) {}
            ~Busy() { slot.reset(); }
        };

        void handle_(WireMessage msg)
        {
            switch (msg.kind)
            {
            case MessageKind::SolveRequest:
                serve_(msg);
                return;
            case MessageKind::Cancel:
                note_cancel_(msg);
                return;
            case MessageKind::Shutdown:
                stop();
                return;
            case MessageKind::SolveResponse:
                break;
            }
            Logger::instance().logf(LogLevel::Warn, "service", {}, "%s ignoring unexpected message kind %u", m_cfg.name.c_str(),
                                    static_cast<unsigned>(msg.kind));
        }

        // Remembers a Cancel only while its request is still in progress or queued. Requests
        // reach the service before their Cancel, so a Cancel for anything else arrived after the
        // answer and is dropped.
        void note_cancel_(const WireMessage &msg)
        {
            Ticket ticket = 0;
            try
            {
                ticket = decode_ticket(std::span<const std::byte>(msg.bytes.data(), msg.bytes.size()));
            }
            catch (const std::exception &e)
            {
                Logger::instance().logf(LogLevel::Warn, "service", {}, "%s dropping undecodable cancel from rank %u: %s",
                                        m_cfg.name.c_str(), msg.srcRank, e.what());
                return;
            }

            const CancelKey key{msg.srcRank, ticket};
            if (m_current == key || queued_(key))
            {
                m_cancelled.insert(key);
                return;
            }
            Logger::instance().logf(LogLevel::Debug, "service", {}, "%s ignoring cancel for finished ticket %llu from rank %u",
                                    m_cfg.name.c_str(), static_cast<unsigned long long>(ticket), msg.srcRank);
        }

        bool queued_(const CancelKey &key) const
        {
            for (const WireMessage &m : m_backlog)
            {
                if (m.kind == MessageKind::SolveRequest && m.srcRank == key.first && m.bytes.size() >= sizeof(Ticket) &&
                    decode_ticket(std::span<const std::byte>(m.bytes.data(), sizeof(Ticket))) == key.second)
                {
                    return true;
                }
            }
            return false;
        }

        // Drains the transport while a request is in progress; returns true if `key`
        // was cancelled or the service was told to stop.
        bool interrupted_(const CancelKey &key)
        {
            while (auto m = m_transport->poll())
            {
                if (m->kind == MessageKind::Cancel)
                {
                    note_cancel_(*m);
                }
                else if (m->kind == MessageKind::Shutdown)
                {
                    stop();
                }
                else
                {
                    m_backlog.push_back(std::move(*m));
                }
            }
            return m_stop.load(std::memory_order_acquire) || m_cancelled.count(key) != 0;
        }

        void reply_(RankId dst, SolveResponseMsg resp)
        {
            WireMessage out;
            out.kind = MessageKind::SolveResponse;
            out.dstRank = dst;
            out.bytes = encode_solve_response(resp);
            m_transport->send(std::move(out));
        }

        void serve_(const WireMessage &msg)
        {
            const auto started = SteadyClock::now();
            ServiceFaults faults;
            {
                std::lock_guard<std::mutex> lk(m_faultMu);
                faults = m_faults;
            }

            SolveRequestMsg req;
            try
            {
                req = decode_solve_request(std::span<const std::byte>(msg.bytes.data(), msg.bytes.size()));
            }
            catch (const std::exception &e)
            {
                Logger::instance().logf(LogLevel::Warn, "service", {}, "%s dropping undecodable request: %s", m_cfg.name.c_str(), e.what());
                bump_([](Stats &s)
                      { ++s.rejected; });
                return;
            }
            bump_([](Stats &s)
                  { ++s.received; });

            SolveResponseMsg resp;
            resp.ticket = req.ticket;

            const CancelKey key{msg.srcRank, req.ticket};
            if (m_cancelled.erase(key) != 0)
            {
                bump_([](Stats &s)
                      { ++s.cancelled; });
                resp.status = ServiceStatus::Cancelled;
                resp.detail = "cancelled before start";
                reply_(msg.srcRank, std::move(resp));
                return;
            }
            if (faults.dropResponses)
            {
                return;
            }
            if (faults.forcedStatus)
            {
                resp.status = *faults.forcedStatus;
                resp.detail = "injected";
                reply_(msg.srcRank, std::move(resp));
                return;
            }
            if (req.variableCount > m_cfg.maxVariables)
            {
                resp.status = ServiceStatus::Rejected;
                resp.detail = "instance exceeds service capacity";
                bump_([](Stats &s)
                      { ++s.rejected; });
                reply_(msg.srcRank, std::move(resp));
                return;
            }
            if (m_cfg.quota != 0 && stats().solved >= m_cfg.quota)
            {
                resp.status = ServiceStatus::QuotaExceeded;
                resp.detail = "quota of " + std::to_string(m_cfg.quota) + " solves used";
                reply_(msg.srcRank, std::move(resp));
                return;
            }

            m_current = key;
            const Busy busy(m_current);
            while (SteadyClock::now() - started < faults.delay)
            {
                if (interrupted_(key))
                {
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }

            AnnealerConfig ac = m_cfg.annealer;
            if (req.sweeps != 0)
            {
                ac.sweeps = req.sweeps;
            }
            std::uint32_t checks = 0;
            AnnealResult res;
            if (!interrupted_(key))
            {
                res = anneal(static_cast<std::size_t>(req.variableCount), req.weights, req.seed, ac,
                             [&]()
                             { return (++checks % 16u) == 0 && interrupted_(key); });
            }
            else
            {
                res.stopped = true;
            }

            m_cancelled.erase(key);
            if (res.stopped)
            {
                bump_([](Stats &s)
                      { ++s.cancelled; });
                resp.status = ServiceStatus::Cancelled;
                reply_(msg.srcRank, std::move(resp));
                return;
            }

            resp.status = ServiceStatus::Ok;
            resp.objective = res.energy;
            resp.solution = std::move(res.solution);
            resp.serviceMs = elapsed_ms(started);
            bump_([](Stats &s)
                  { ++s.solved; });
            reply_(msg.srcRank, std::move(resp));
        }

        template <class Fn>
        void bump_(Fn &&fn)
        {
            std::lock_guard<std::mutex> lk(m_statsMu);
            fn(m_stats);
        }

        SolverServiceConfig m_cfg;
        std::shared_ptr<ITransport> m_transport;

        std::mutex m_faultMu;
        ServiceFaults m_faults;

        std::atomic<bool> m_stop{false};
        std::deque<WireMessage> m_backlog;
        std::set<CancelKey> m_cancelled;
        std::optional<CancelKey> m_current;

        mutable std::mutex m_statsMu;
        Stats m_stats{};
    };
}
