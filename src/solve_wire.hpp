#pragma once

#include "problem.hpp"
#include "wire.hpp"

namespace quboroute
{
    using Ticket = std::uint64_t;

    enum class ServiceStatus : std::uint8_t
    {
        Ok = 0,
        QuotaExceeded = 1,
        Rejected = 2,
        Internal = 3,
        Cancelled = 4,
    };

    struct SolveRequestMsg
    {
        Ticket ticket = 0;
        std::uint32_t sweeps = 0; // 0 = service default
        std::uint64_t seed = 0;
        std::uint64_t variableCount = 0;
        std::vector<double> weights;
    };

    struct SolveResponseMsg
    {
        Ticket ticket = 0;
        ServiceStatus status = ServiceStatus::Ok;
        double objective = 0.0;
        double serviceMs = 0.0;
        std::vector<double> solution;
        std::string detail;
    };

    inline ByteBuffer encode_solve_request(const SolveRequestMsg &m)
    {
        WireWriter w;
        w.write_u64(m.ticket);
        w.write_u32(m.sweeps);
        w.write_u64(m.seed);
        w.write_u64(m.variableCount);
        w.write_f64_array(m.weights);
        return w.take();
    }

    inline SolveRequestMsg decode_solve_request(std::span<const std::byte> bytes)
    {
        WireReader r(bytes);
        SolveRequestMsg m;
        m.ticket = r.read_u64();
        m.sweeps = r.read_u32();
        m.seed = r.read_u64();
        m.variableCount = r.read_u64();
        if (m.variableCount == 0 || m.variableCount > (1ULL << 24))
        {
            throw std::runtime_error("decode_solve_request: bad variable count");
        }
        m.weights = r.read_f64_array("decode_solve_request");
        if (m.weights.size() != m.variableCount * m.variableCount)
        {
            throw std::runtime_error("decode_solve_request: weight count mismatch");
        }
        return m;
    }

    inline ByteBuffer encode_solve_response(const SolveResponseMsg &m)
    {
        WireWriter w;
        w.write_u64(m.ticket);
        w.write_u8(static_cast<std::uint8_t>(m.status));
        w.write_f64(m.objective);
        w.write_f64(m.serviceMs);
        w.write_u64(m.solution.size());
        for (const double v : m.solution)
        {
            w.write_u8(v != 0.0 ? 1 : 0);
        }
        w.write_string(m.detail);
        return w.take();
    }

    inline SolveResponseMsg decode_solve_response(std::span<const std::byte> bytes)
    {
        WireReader r(bytes);
        SolveResponseMsg m;
        m.ticket = r.read_u64();
        const std::uint8_t status = r.read_u8();
        if (status > static_cast<std::uint8_t>(ServiceStatus::Cancelled))
        {
            throw std::runtime_error("decode_solve_response: unknown status");
        }
        m.status = static_cast<ServiceStatus>(status);
        m.objective = r.read_f64();
        m.serviceMs = r.read_f64();
        // One byte per variable.
        m.solution.resize(static_cast<std::size_t>(r.read_count(1, "decode_solve_response")));
        for (auto &v : m.solution)
        {
            const std::uint8_t bit = r.read_u8();
            if (bit > 1)
            {
                throw std::runtime_error("decode_solve_response: non-binary solution entry");
            }
            v = bit;
        }
        m.detail = r.read_string();
        return m;
    }

    inline ByteBuffer encode_ticket(Ticket t)
    {
        WireWriter w;
        w.write_u64(t);
        return w.take();
    }

    inline Ticket decode_ticket(std::span<const std::byte> bytes)
    {
        WireReader r(bytes);
        return r.read_u64();
    }
}
