#pragma once

#include "backend_registry.hpp"
#include "digest.hpp"

#include <deque>
#include <map>
#include <mutex>

namespace quboroute
{
    struct NormalizedResult
    {
        RequestId requestId;
        BackendId chosenBackendId;
        // Backends attempted, in order; the last one succeeded.
        std::vector<BackendId> fallbackChainUsed;
        std::vector<double> solutionVector;
        double objectiveValue = 0.0;
        // Baseline elapsed / chosen elapsed. 1.0 when uncomputed.
        double advantageRatio = 1.0;
        bool advantageComputed = false;
        BackendId baselineBackendId;
        bool degraded = false;
        double totalElapsedMs = 0.0;
    };

    // A classical run used as the reference for the advantage ratio.
    struct BaselineRun
    {
        BackendId backendId;
        double elapsedMs = 0.0;
        double objectiveValue = 0.0;
    };

    // What the router hands to normalization.
    struct RouteOutcome
    {
        SolveOutcome outcome;
        BackendKind chosenKind = BackendKind::SpecializedSolver;
        // Candidate order the router settled on; front() is the first preference.
        std::vector<BackendId> candidates;
        std::vector<BackendId> attempted;
        std::optional<BaselineRun> baseline;
        double totalElapsedMs = 0.0;
    };

    // Pure function of its inputs.
    inline NormalizedResult normalize(const ProblemInstance &instance, const RouteOutcome &route)
    {
        const SolveOutcome &o = route.outcome;
        if (!o.success)
        {
            throw std::runtime_error("normalize: outcome of '" + o.backendId + "' is not a success");
        }
        if (o.solution.size() != instance.variable_count())
        {
            throw std::runtime_error("normalize: solution length does not match the instance");
        }
        if (route.candidates.empty())
        {
            throw std::runtime_error("normalize: empty candidate list");
        }

        NormalizedResult r;
        r.requestId = instance.id();
        r.chosenBackendId = o.backendId;
        r.fallbackChainUsed = route.attempted;
        r.solutionVector = o.solution;
        r.objectiveValue = o.objectiveValue;
        r.degraded = (o.backendId != route.candidates.front());
        r.totalElapsedMs = route.totalElapsedMs;

        if (route.chosenKind == BackendKind::ClassicalFallback)
        {
            // A classical result is its own baseline.
            r.advantageRatio = 1.0;
            r.advantageComputed = true;
            r.baselineBackendId = o.backendId;
        }
        else if (route.baseline && o.elapsedMs > 0.0)
        {
            r.advantageRatio = route.baseline->elapsedMs / o.elapsedMs;
            r.advantageComputed = true;
            r.baselineBackendId = route.baseline->backendId;
        }
        return r;
    }

    // Shape of an instance for baseline reuse: variable count plus a digest of which
    // upper-triangle entries are non-zero.
    struct ShapeKey
    {
        std::size_t variableCount = 0;
        std::uint64_t sparsity = 0;

        friend bool operator<(const ShapeKey &a, const ShapeKey &b)
        {
            if (a.variableCount != b.variableCount)
            {
                return a.variableCount < b.variableCount;
            }
            return a.sparsity < b.sparsity;
        }
    };

    inline ShapeKey shape_key(const ProblemInstance &p)
    {
        const std::size_t n = p.variable_count();
        ByteBuffer mask((n * (n + 1) / 2 + 7) / 8, std::byte{0});
        std::size_t bit = 0;
        for (std::size_t i = 0; i < n; ++i)
        {
            for (std::size_t j = i; j < n; ++j, ++bit)
            {
                if (p.weight(i, j) != 0.0)
                {
                    mask[bit / 8] |= static_cast<std::byte>(1u << (bit % 8));
                }
            }
        }
        return ShapeKey{n, detail::fnv1a64(std::span<const std::byte>(mask.data(), mask.size()))};
    }

    // Most recent classical run per instance shape. Oldest shapes are evicted first.
    class BaselineCache
    {
    public:
        explicit BaselineCache(std::size_t capacity = 1024) : m_capacity(capacity) {}

        void put(const ShapeKey &key, BaselineRun run)
        {
            if (m_capacity == 0)
            {
                return;
            }
            std::lock_guard<std::mutex> lk(m_mu);
            auto [it, inserted] = m_runs.insert_or_assign(key, std::move(run));
            (void)it;
            if (!inserted)
            {
                return;
            }
            m_order.push_back(key);
            while (m_order.size() > m_capacity)
            {
                m_runs.erase(m_order.front());
                m_order.pop_front();
            }
        }

        std::optional<BaselineRun> get(const ShapeKey &key) const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            auto it = m_runs.find(key);
            if (it == m_runs.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::size_t size() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_runs.size();
        }

    private:
        std::size_t m_capacity;
        mutable std::mutex m_mu;
        std::map<ShapeKey, BaselineRun> m_runs;
        std::deque<ShapeKey> m_order;
    };
}
