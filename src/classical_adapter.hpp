#pragma once

#include "log.hpp"
#include "random.hpp"
#include "solver_adapter.hpp"

#include <bit>
#include <cmath>

namespace quboroute
{
    struct ClassicalAdapterConfig
    {
        BackendId id = "classical";

        // Exhaustive enumeration up to this many variables (2^n states).
        std::size_t exactLimit = 20;

        // Extra deterministic local-search restarts after the all-zero descent.
        std::uint32_t restarts = 8;
        std::uint64_t seed = 0x5eed;
    };

    // Local deterministic heuristic. Always produces an assignment for an admitted instance:
    // enumeration falls back to local search on deadline, and local search returns its
    // current assignment when the deadline expires.
    class ClassicalAdapter final : public ISolverAdapter
    {
    public:
        explicit ClassicalAdapter(ClassicalAdapterConfig cfg = {}) : m_cfg(std::move(cfg)) {}

        const BackendId &id() const noexcept override { return m_cfg.id; }

    protected:
        SolveOutcome solve_(const ProblemInstance &instance, const Deadline &deadline) override
        {
            if (deadline.cancelled())
            {
                return SolveOutcome::failure(m_cfg.id, ErrorKind::Cancelled, 0.0);
            }
            if (deadline.expired())
            {
                return SolveOutcome::failure(m_cfg.id, ErrorKind::Timeout, 0.0, "budget expired before start");
            }

            const std::size_t n = instance.variable_count();
            std::optional<std::vector<double>> best;
            const char *method = "local-search";
            if (n <= m_cfg.exactLimit)
            {
                best = enumerate_(instance, deadline);
                if (best)
                {
                    method = "exact";
                }
                else
                {
                    Logger::instance().logf(LogLevel::Debug, "classical", instance.id(),
                                            "enumeration of %zu variables hit the deadline, using local search", n);
                }
            }
            if (!best)
            {
                best = local_search_(instance, deadline);
            }

            SolveOutcome out;
            out.backendId = m_cfg.id;
            out.success = true;
            out.objectiveValue = instance.evaluate(*best);
            out.solution = std::move(*best);
            out.elapsedMs = elapsed_ms(deadline.start());
            out.detail = method;
            return out;
        }

    private:
        // Gray-code walk over all 2^n assignments; nullopt if the deadline expires first.
        static std::optional<std::vector<double>> enumerate_(const ProblemInstance &p, const Deadline &deadline)
        {
            const std::size_t n = p.variable_count();
            std::vector<double> x(n, 0.0);
            std::vector<double> field(n);
            for (std::size_t i = 0; i < n; ++i)
            {
                field[i] = p.weight(i, i);
            }

            double energy = 0.0;
            double bestEnergy = 0.0;
            std::uint64_t bestCode = 0;
            std::uint64_t code = 0;
            const std::uint64_t total = 1ULL << n;
            for (std::uint64_t k = 1; k < total; ++k)
            {
                if ((k & 0xFFFu) == 0 && deadline.should_stop())
                {
                    return std::nullopt;
                }
                const std::size_t bit = static_cast<std::size_t>(std::countr_zero(k));
                const double dir = (x[bit] == 0.0) ? 1.0 : -1.0;
                energy += dir * field[bit];
                x[bit] = (dir > 0.0) ? 1.0 : 0.0;
                code ^= (1ULL << bit);
                for (std::size_t i = 0; i < n; ++i)
                {
                    if (i != bit)
                    {
                        field[i] += 2.0 * dir * p.weight(i, bit);
                    }
                }
                if (energy < bestEnergy)
                {
                    bestEnergy = energy;
                    bestCode = code;
                }
            }

            std::vector<double> out(n, 0.0);
            for (std::size_t i = 0; i < n; ++i)
            {
                out[i] = ((bestCode >> i) & 1ULL) ? 1.0 : 0.0;
            }
            return out;
        }

        // Steepest-descent single flips with incremental field updates.
        // Returns the final energy; stops early (keeping x valid) when the deadline expires.
        static double descend_(const ProblemInstance &p, std::vector<double> &x, const Deadline &deadline)
        {
            const std::size_t n = p.variable_count();
            std::vector<double> field(n);
            for (std::size_t i = 0; i < n; ++i)
            {
                double h = p.weight(i, i);
                for (std::size_t j = 0; j < n; ++j)
                {
                    if (j != i && x[j] != 0.0)
                    {
                        h += 2.0 * p.weight(i, j);
                    }
                }
                field[i] = h;
            }

            double energy = p.evaluate(x);
            while (!deadline.should_stop())
            {
                std::size_t bestVar = n;
                double bestDelta = -1e-12;
                for (std::size_t i = 0; i < n; ++i)
                {
                    const double delta = (x[i] == 0.0 ? 1.0 : -1.0) * field[i];
                    if (delta < bestDelta)
                    {
                        bestDelta = delta;
                        bestVar = i;
                    }
                }
                if (bestVar == n)
                {
                    break;
                }
                const double dir = (x[bestVar] == 0.0) ? 1.0 : -1.0;
                x[bestVar] = (dir > 0.0) ? 1.0 : 0.0;
                energy += bestDelta;
                for (std::size_t i = 0; i < n; ++i)
                {
                    if (i != bestVar)
                    {
                        field[i] += 2.0 * dir * p.weight(i, bestVar);
                    }
                }
            }
            return energy;
        }

        std::vector<double> local_search_(const ProblemInstance &p, const Deadline &deadline) const
        {
            const std::size_t n = p.variable_count();
            std::vector<double> best(n, 0.0);
            double bestEnergy = descend_(p, best, deadline);

            for (std::uint32_t r = 0; r < m_cfg.restarts && !deadline.should_stop(); ++r)
            {
                std::vector<double> x(n);
                for (std::size_t i = 0; i < n; ++i)
                {
                    x[i] = rng_bit(m_cfg.seed, /*stream=*/r, i);
                }
                const double e = descend_(p, x, deadline);
                if (e < bestEnergy)
                {
                    bestEnergy = e;
                    best = std::move(x);
                }
            }
            return best;
        }

        ClassicalAdapterConfig m_cfg;
    };
}
