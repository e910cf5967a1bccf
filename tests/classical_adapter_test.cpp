/*
Purpose: The guaranteed-available classical backend.

What this tests: exact enumeration matches brute force, local search is deterministic and
ends in a 1-flip local minimum, only an already-expired budget yields Timeout, a cancelled
token yields Cancelled, and the adapter contract turns exceptions and wrong-length
solutions into failed outcomes instead of throwing.
*/

#include "classical_adapter.hpp"

#include <cassert>
#include <limits>

namespace
{
    quboroute::ProblemPtr random_instance(std::size_t n, std::uint64_t seed)
    {
        std::vector<double> w(n * n, 0.0);
        for (std::size_t i = 0; i < n; ++i)
        {
            for (std::size_t j = i; j < n; ++j)
            {
                const double v = quboroute::rng_unit_double(seed, 7, i * n + j) * 2.0 - 1.0;
                w[i * n + j] = v;
                w[j * n + i] = v;
            }
        }
        return quboroute::ProblemInstance::create("rand", n, std::move(w), "lab");
    }

    double brute_force_min(const quboroute::ProblemInstance &p)
    {
        const std::size_t n = p.variable_count();
        double best = std::numeric_limits<double>::infinity();
        std::vector<double> x(n);
        for (std::uint64_t code = 0; code < (1ULL << n); ++code)
        {
            for (std::size_t i = 0; i < n; ++i)
            {
                x[i] = ((code >> i) & 1ULL) ? 1.0 : 0.0;
            }
            best = std::min(best, p.evaluate(x));
        }
        return best;
    }

    class ThrowingAdapter final : public quboroute::ISolverAdapter
    {
    public:
        const quboroute::BackendId &id() const noexcept override { return m_id; }

    protected:
        quboroute::SolveOutcome solve_(const quboroute::ProblemInstance &, const quboroute::Deadline &) override
        {
            throw std::runtime_error("backend exploded");
        }

    private:
        quboroute::BackendId m_id = "throws";
    };

    class ShortAnswerAdapter final : public quboroute::ISolverAdapter
    {
    public:
        const quboroute::BackendId &id() const noexcept override { return m_id; }

    protected:
        quboroute::SolveOutcome solve_(const quboroute::ProblemInstance &, const quboroute::Deadline &) override
        {
            quboroute::SolveOutcome o;
            o.success = true;
            o.solution = {1.0};
            return o;
        }

    private:
        quboroute::BackendId m_id = "short";
    };
}

int main()
{
    using namespace quboroute;

    ClassicalAdapter classical;
    assert(classical.id() == "classical");
    assert(classical.health_check());

    // Two variables that repel each other: the best is exactly one of them.
    {
        auto p = ProblemInstance::create("pair", 2, {-1.0, 2.0, 2.0, -1.0}, "lab");
        const SolveOutcome o = classical.solve(*p, Millis{1000});
        assert(o.success);
        assert(o.backendId == "classical");
        assert(!o.errorKind);
        assert(o.objectiveValue == -1.0);
        assert(o.solution == (std::vector<double>{1.0, 0.0}));
        assert(o.detail == "exact");
    }

    // Exact enumeration equals brute force.
    for (std::uint64_t seed = 1; seed <= 3; ++seed)
    {
        auto p = random_instance(10, seed);
        const SolveOutcome o = classical.solve(*p, Millis{5000});
        assert(o.success);
        assert(o.solution.size() == 10);
        const double expect = brute_force_min(*p);
        assert(std::fabs(o.objectiveValue - expect) < 1e-9);
        assert(std::fabs(p->evaluate(o.solution) - o.objectiveValue) < 1e-12);
    }

    // Above the exact limit: deterministic local search ending in a local minimum.
    {
        auto p = random_instance(40, 42);
        const SolveOutcome a = classical.solve(*p, Millis{5000});
        const SolveOutcome b = classical.solve(*p, Millis{5000});
        assert(a.success && b.success);
        assert(a.detail == "local-search");
        assert(a.solution == b.solution);
        assert(a.objectiveValue == b.objectiveValue);

        std::vector<double> x = a.solution;
        for (std::size_t i = 0; i < x.size(); ++i)
        {
            x[i] = 1.0 - x[i];
            assert(p->evaluate(x) >= a.objectiveValue - 1e-9);
            x[i] = 1.0 - x[i];
        }
    }

    // A small exact limit forces local search even on tiny instances.
    {
        ClassicalAdapter noExact(ClassicalAdapterConfig{.id = "ls", .exactLimit = 0});
        auto p = ProblemInstance::create("diag", 3, {-1.0, 0.0, 0.0, 0.0, -2.0, 0.0, 0.0, 0.0, 3.0}, "lab");
        const SolveOutcome o = noExact.solve(*p, Millis{1000});
        assert(o.success);
        assert(o.backendId == "ls");
        assert(o.solution == (std::vector<double>{1.0, 1.0, 0.0}));
        assert(o.objectiveValue == -3.0);
    }

    // Budget already gone before starting.
    {
        auto p = random_instance(5, 9);
        const SolveOutcome o = classical.solve(*p, Millis{0});
        assert(!o.success);
        assert(o.errorKind == ErrorKind::Timeout);
        assert(o.solution.empty());
    }

    // Caller cancelled.
    {
        auto p = random_instance(5, 9);
        CancelToken token;
        token.cancel();
        const SolveOutcome o = classical.solve(*p, Deadline(Millis{1000}, token));
        assert(!o.success);
        assert(o.errorKind == ErrorKind::Cancelled);
    }

    // The contract never lets a backend failure escape.
    {
        auto p = random_instance(3, 1);
        ThrowingAdapter throwing;
        const SolveOutcome o = throwing.solve(*p, Millis{100});
        assert(!o.success);
        assert(o.errorKind == ErrorKind::Internal);
        assert(o.backendId == "throws");
        assert(o.detail == "backend exploded");

        ShortAnswerAdapter shortAnswer;
        const SolveOutcome s = shortAnswer.solve(*p, Millis{100});
        assert(!s.success);
        assert(s.errorKind == ErrorKind::MalformedResponse);
        assert(s.backendId == "short");
    }

    return 0;
}
