#pragma once

#include "random.hpp"

#include <cmath>
#include <functional>
#include <span>
#include <vector>

namespace quboroute
{
    struct AnnealerConfig
    {
        std::uint32_t sweeps = 1000;
        // Inverse temperatures, relative to the largest local field of the instance.
        double betaStart = 0.1;
        double betaEnd = 10.0;
    };

    struct AnnealResult
    {
        std::vector<double> solution;
        double energy = 0.0;
        std::uint32_t sweepsDone = 0;
        bool stopped = false;
    };

    // Single-spin-flip simulated annealing over a dense symmetric QUBO (x^T W x).
    //
    // Deterministic: the acceptance draws are a pure function of (seed, sweep, variable),
    // so the same request on any rank returns the same assignment.
    inline AnnealResult anneal(std::size_t n,
                               std::span<const double> w,
                               std::uint64_t seed,
                               const AnnealerConfig &cfg,
                               const std::function<bool()> &shouldStop = {})
    {
        AnnealResult out;
        std::vector<double> x(n, 0.0);
        std::vector<double> field(n);
        double scale = 0.0;
        for (std::size_t i = 0; i < n; ++i)
        {
            field[i] = w[i * n + i];
            double s = std::fabs(w[i * n + i]);
            for (std::size_t j = 0; j < n; ++j)
            {
                if (j != i)
                {
                    s += 2.0 * std::fabs(w[i * n + j]);
                }
            }
            scale = std::max(scale, s);
        }
        if (scale <= 0.0)
        {
            scale = 1.0;
        }

        double energy = 0.0;
        out.solution = x;
        out.energy = 0.0;

        const std::uint32_t sweeps = std::max<std::uint32_t>(cfg.sweeps, 1);
        const double ratio = (sweeps > 1) ? std::pow(cfg.betaEnd / cfg.betaStart, 1.0 / static_cast<double>(sweeps - 1)) : 1.0;
        double beta = cfg.betaStart / scale;

        for (std::uint32_t s = 0; s < sweeps; ++s)
        {
            if (shouldStop && shouldStop())
            {
                out.stopped = true;
                break;
            }
            for (std::size_t i = 0; i < n; ++i)
            {
                const double dir = (x[i] == 0.0) ? 1.0 : -1.0;
                const double delta = dir * field[i];
                bool accept = delta <= 0.0;
                if (!accept)
                {
                    const double u = rng_unit_double(seed, /*stream=*/1, static_cast<std::uint64_t>(s) * n + i);
                    accept = u < std::exp(-beta * delta);
                }
                if (!accept)
                {
                    continue;
                }
                x[i] = (dir > 0.0) ? 1.0 : 0.0;
                energy += delta;
                for (std::size_t j = 0; j < n; ++j)
                {
                    if (j != i)
                    {
                        field[j] += 2.0 * dir * w[j * n + i];
                    }
                }
                if (energy < out.energy)
                {
                    out.energy = energy;
                    out.solution = x;
                }
            }
            beta *= ratio;
            ++out.sweepsDone;
        }
        return out;
    }
}
