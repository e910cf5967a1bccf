#pragma once

#include "common.hpp"

#include <deque>
#include <map>
#include <memory>
#include <mutex>

namespace quboroute
{
    using RankId = std::uint32_t;

    enum class MessageKind : std::uint8_t
    {
        SolveRequest = 1,
        SolveResponse = 2,
        Cancel = 3,
        Shutdown = 4,
    };

    struct WireMessage
    {
        MessageKind kind = MessageKind::SolveRequest;
        RankId srcRank = 0;
        RankId dstRank = 0;
        ByteBuffer bytes;
    };

    class ITransport
    {
    public:
        virtual ~ITransport() = default;
        virtual void send(WireMessage msg) = 0;
        virtual std::optional<WireMessage> poll() = 0;
        virtual bool has_pending() const = 0;
    };

    // Per-rank mailboxes shared by in-process endpoints (single node). Thread-safe for MPMC use.
    class InProcHub
    {
    public:
        void deliver(WireMessage msg)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_queues[msg.dstRank].push_back(std::move(msg));
        }

        std::optional<WireMessage> take(RankId rank)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            auto it = m_queues.find(rank);
            if (it == m_queues.end() || it->second.empty())
            {
                return std::nullopt;
            }
            WireMessage out = std::move(it->second.front());
            it->second.pop_front();
            return out;
        }

        bool has_pending(RankId rank) const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            auto it = m_queues.find(rank);
            return it != m_queues.end() && !it->second.empty();
        }

    private:
        mutable std::mutex m_mu;
        std::map<RankId, std::deque<WireMessage>> m_queues;
    };

    // Endpoint for one rank on an InProcHub.
    class InProcTransport final : public ITransport
    {
    public:
        InProcTransport(std::shared_ptr<InProcHub> hub, RankId rank) : m_hub(std::move(hub)), m_rank(rank)
        {
            if (!m_hub)
            {
                throw std::runtime_error("InProcTransport: null hub");
            }
        }

        RankId rank() const noexcept { return m_rank; }

        void send(WireMessage msg) override
        {
            msg.srcRank = m_rank;
            m_hub->deliver(std::move(msg));
        }

        std::optional<WireMessage> poll() override { return m_hub->take(m_rank); }

        bool has_pending() const override { return m_hub->has_pending(m_rank); }

    private:
        std::shared_ptr<InProcHub> m_hub;
        RankId m_rank = 0;
    };
}
