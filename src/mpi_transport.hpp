#pragma once

#include "transport.hpp"

#include <mpi.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace quboroute
{
    // WireMessage delivery between the orchestrator rank and solver service ranks.
    //
    // On the wire a message is one kind byte followed by the payload; the source and
    // destination come from the MPI envelope. Receives use matched probes, so a message
    // seen by poll() is the one received.
    //
    // Not thread-safe: SolveChannel serializes calls under its own mutex. When other
    // threads make MPI calls too, initialize MPI with MPI_THREAD_SERIALIZED or better.
    class MpiTransport final : public ITransport
    {
    public:
        explicit MpiTransport(MPI_Comm comm = MPI_COMM_WORLD, int tag = 0)
            : m_comm(comm), m_tag(tag)
        {
            if (m_comm == MPI_COMM_NULL)
            {
                throw std::runtime_error("MpiTransport: null communicator");
            }
            int rank = 0;
            int size = 0;
            check_(MPI_Comm_rank(m_comm, &rank), "MPI_Comm_rank");
            check_(MPI_Comm_size(m_comm, &size), "MPI_Comm_size");
            m_rank = static_cast<RankId>(rank);
            m_size = static_cast<RankId>(size);
        }

        MpiTransport(const MpiTransport &) = delete;
        MpiTransport &operator=(const MpiTransport &) = delete;

        RankId rank() const noexcept { return m_rank; }
        RankId size() const noexcept { return m_size; }

        // Blocks until every in-flight send has completed. Call before MPI_Finalize.
        void flush()
        {
            if (m_pending.empty())
            {
                return;
            }
            std::vector<MPI_Request> reqs;
            reqs.reserve(m_pending.size());
            for (auto &p : m_pending)
            {
                reqs.push_back(p.req);
            }
            check_(MPI_Waitall(static_cast<int>(reqs.size()), reqs.data(), MPI_STATUSES_IGNORE), "MPI_Waitall");
            m_pending.clear();
        }

        void send(WireMessage msg) override
        {
            if (msg.dstRank >= m_size)
            {
                throw std::runtime_error("MpiTransport: no rank " + std::to_string(msg.dstRank) + " in a communicator of " +
                                         std::to_string(m_size));
            }
            reap_sends_();

            PendingSend p;
            p.buf.reserve(msg.bytes.size() + 1);
            p.buf.push_back(static_cast<std::byte>(msg.kind));
            p.buf.insert(p.buf.end(), msg.bytes.begin(), msg.bytes.end());
            m_pending.push_back(std::move(p));

            PendingSend &out = m_pending.back();
            const int rc = MPI_Isend(out.buf.data(), static_cast<int>(out.buf.size()), MPI_BYTE, static_cast<int>(msg.dstRank), m_tag,
                                     m_comm, &out.req);
            if (rc != MPI_SUCCESS)
            {
                m_pending.pop_back();
                throw std::runtime_error("MpiTransport: MPI_Isend failed");
            }
        }

        std::optional<WireMessage> poll() override
        {
            reap_sends_();

            int flag = 0;
            MPI_Message handle = MPI_MESSAGE_NULL;
            MPI_Status status;
            check_(MPI_Improbe(MPI_ANY_SOURCE, m_tag, m_comm, &flag, &handle, &status), "MPI_Improbe");
            if (!flag)
            {
                return std::nullopt;
            }

            int count = 0;
            check_(MPI_Get_count(&status, MPI_BYTE, &count), "MPI_Get_count");
            ByteBuffer buf(static_cast<std::size_t>(count));
            check_(MPI_Mrecv(buf.data(), count, MPI_BYTE, &handle, MPI_STATUS_IGNORE), "MPI_Mrecv");

            if (buf.empty())
            {
                throw std::runtime_error("MpiTransport: empty message from rank " + std::to_string(status.MPI_SOURCE));
            }
            const auto kind = static_cast<std::uint8_t>(buf.front());
            if (kind < static_cast<std::uint8_t>(MessageKind::SolveRequest) || kind > static_cast<std::uint8_t>(MessageKind::Shutdown))
            {
                throw std::runtime_error("MpiTransport: unknown message kind " + std::to_string(kind));
            }

            WireMessage out;
            out.kind = static_cast<MessageKind>(kind);
            out.srcRank = static_cast<RankId>(status.MPI_SOURCE);
            out.dstRank = m_rank;
            out.bytes.assign(buf.begin() + 1, buf.end());
            return out;
        }

        // True while a message waits to be received or one of ours is still in flight.
        bool has_pending() const override
        {
            int flag = 0;
            if (MPI_Iprobe(MPI_ANY_SOURCE, m_tag, m_comm, &flag, MPI_STATUS_IGNORE) != MPI_SUCCESS)
            {
                return false;
            }
            return flag != 0 || !m_pending.empty();
        }

    private:
        struct PendingSend
        {
            ByteBuffer buf;
            MPI_Request req = MPI_REQUEST_NULL;
        };

        static void check_(int rc, const char *call)
        {
            if (rc != MPI_SUCCESS)
            {
                throw std::runtime_error(std::string("MpiTransport: ") + call + " failed");
            }
        }

        // Drops completed sends. Moving a PendingSend leaves its heap buffer in place, so
        // in-flight requests stay valid.
        void reap_sends_()
        {
            for (std::size_t i = 0; i < m_pending.size();)
            {
                int done = 0;
                check_(MPI_Test(&m_pending[i].req, &done, MPI_STATUS_IGNORE), "MPI_Test");
                if (done)
                {
                    m_pending[i] = std::move(m_pending.back());
                    m_pending.pop_back();
                    continue;
                }
                ++i;
            }
        }

        MPI_Comm m_comm;
        int m_tag = 0;
        RankId m_rank = 0;
        RankId m_size = 0;
        std::vector<PendingSend> m_pending;
    };
}
