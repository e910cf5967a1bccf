/*
Purpose: MpiTransport point-to-point delivery.

What this tests: an encoded solve request sent from rank 0 arrives intact on rank 1 with
its kind and ranks stamped, the reply travels back the same way, and a payload-free
Cancel message survives the trip.
*/

#include "mpi_transport.hpp"
#include "solve_wire.hpp"

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

    quboroute::WireMessage wait_for(quboroute::MpiTransport &tx)
    {
        for (int i = 0; i < 2000000; ++i)
        {
            if (auto m = tx.poll())
            {
                return std::move(*m);
            }
        }
        fail("timed out waiting for message");
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

    check(size >= 2, "MPI transport test requires at least 2 ranks");

    MpiTransport tx(MPI_COMM_WORLD, /*tag=*/0);
    check(tx.rank() == static_cast<RankId>(rank), "transport rank mismatch");

    if (rank == 0)
    {
        SolveRequestMsg req;
        req.ticket = 11;
        req.seed = 5;
        req.variableCount = 2;
        req.weights = {-1.0, 0.25, 0.25, -2.0};

        WireMessage msg;
        msg.kind = MessageKind::SolveRequest;
        msg.dstRank = 1;
        msg.bytes = encode_solve_request(req);
        tx.send(std::move(msg));

        const WireMessage reply = wait_for(tx);
        check(reply.kind == MessageKind::SolveResponse, "wrong reply kind");
        check(reply.srcRank == 1 && reply.dstRank == 0, "wrong reply ranks");
        const SolveResponseMsg resp = decode_solve_response(std::span<const std::byte>(reply.bytes.data(), reply.bytes.size()));
        check(resp.ticket == 11, "wrong ticket");
        check(resp.solution == std::vector<double>({1.0, 1.0}), "wrong solution");
        check(resp.detail == "echo", "wrong detail");

        WireMessage cancel;
        cancel.kind = MessageKind::Cancel;
        cancel.dstRank = 1;
        tx.send(std::move(cancel));
        tx.flush();
    }

    if (rank == 1)
    {
        const WireMessage m = wait_for(tx);
        check(m.kind == MessageKind::SolveRequest, "wrong message kind");
        check(m.srcRank == 0, "wrong srcRank");
        check(m.dstRank == 1, "wrong dstRank");
        const SolveRequestMsg req = decode_solve_request(std::span<const std::byte>(m.bytes.data(), m.bytes.size()));
        check(req.ticket == 11 && req.seed == 5, "wrong request header");
        check(req.weights == std::vector<double>({-1.0, 0.25, 0.25, -2.0}), "wrong weights");

        SolveResponseMsg resp;
        resp.ticket = req.ticket;
        resp.solution = {1.0, 1.0};
        resp.detail = "echo";
        WireMessage out;
        out.kind = MessageKind::SolveResponse;
        out.dstRank = m.srcRank;
        out.bytes = encode_solve_response(resp);
        tx.send(std::move(out));

        const WireMessage cancel = wait_for(tx);
        check(cancel.kind == MessageKind::Cancel, "wrong kind for cancel");
        check(cancel.bytes.empty(), "cancel carried bytes");
        tx.flush();
    }

    MPI_Barrier(MPI_COMM_WORLD);
    MPI_Finalize();
    return 0;
}
