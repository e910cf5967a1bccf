#pragma once

#include "common.hpp"
#include "errors.hpp"

#include <cmath>
#include <memory>
#include <string>

namespace quboroute
{
    enum class SizeClass : std::uint8_t
    {
        Small = 0,
        Medium = 1,
        Large = 2,
    };

    inline const char *size_class_name(SizeClass c) noexcept
    {
        switch (c)
        {
        case SizeClass::Small:
            return "small";
        case SizeClass::Medium:
            return "medium";
        case SizeClass::Large:
            return "large";
        }
        return "unknown";
    }

    struct SizeThresholds
    {
        std::size_t smallMax = 64;
        std::size_t mediumMax = 512;

        SizeClass classify(std::size_t variableCount) const noexcept
        {
            if (variableCount <= smallMax)
            {
                return SizeClass::Small;
            }
            if (variableCount <= mediumMax)
            {
                return SizeClass::Medium;
            }
            return SizeClass::Large;
        }
    };

    // Accumulates an upper-triangular QUBO and emits the symmetric form:
    // diagonal = linear terms, off-diagonal pair terms split evenly across (i,j) and (j,i).
    class QuboAccumulator
    {
    public:
        explicit QuboAccumulator(std::size_t n) : m_n(n), m_upper(n * n, 0.0) {}

        std::size_t size() const noexcept { return m_n; }

        void add_linear(std::size_t i, double v) { m_upper.at(i * m_n + i) += v; }

        void add_quadratic(std::size_t i, std::size_t j, double v)
        {
            if (i == j)
            {
                // x_i * x_i == x_i for binary variables.
                add_linear(i, v);
                return;
            }
            if (i > j)
            {
                std::swap(i, j);
            }
            m_upper.at(i * m_n + j) += v;
        }

        std::vector<double> symmetric() const
        {
            std::vector<double> out(m_n * m_n, 0.0);
            for (std::size_t i = 0; i < m_n; ++i)
            {
                out[i * m_n + i] = m_upper[i * m_n + i];
                for (std::size_t j = i + 1; j < m_n; ++j)
                {
                    const double half = 0.5 * m_upper[i * m_n + j];
                    out[i * m_n + j] = half;
                    out[j * m_n + i] = half;
                }
            }
            return out;
        }

    private:
        std::size_t m_n = 0;
        std::vector<double> m_upper;
    };

    // Immutable quadratic optimization instance over binary decision variables.
    // Objective (minimized): x^T W x.
    class ProblemInstance
    {
    public:
        // Validates the invariants; throws MalformedRequestError.
        static std::shared_ptr<const ProblemInstance> create(RequestId id,
                                                             std::size_t variableCount,
                                                             std::vector<double> weights,
                                                             PodId sourcePod,
                                                             SizeThresholds thresholds = {})
        {
            if (variableCount == 0)
            {
                throw MalformedRequestError("problem has no decision variables");
            }
            if (weights.size() != variableCount * variableCount)
            {
                throw MalformedRequestError("weight matrix is not " + std::to_string(variableCount) + "x" +
                                            std::to_string(variableCount));
            }
            validate_weights(variableCount, weights);

            auto inst = std::shared_ptr<ProblemInstance>(new ProblemInstance());
            inst->m_id = std::move(id);
            inst->m_n = variableCount;
            inst->m_weights = std::move(weights);
            inst->m_sourcePod = std::move(sourcePod);
            inst->m_submittedAtUs = wall_clock_us();
            inst->m_sizeClass = thresholds.classify(variableCount);
            return inst;
        }

        // Rejects non-finite entries and asymmetric pairs.
        static void validate_weights(std::size_t n, const std::vector<double> &w)
        {
            for (std::size_t i = 0; i < n; ++i)
            {
                for (std::size_t j = 0; j < n; ++j)
                {
                    const double a = w[i * n + j];
                    if (!std::isfinite(a))
                    {
                        throw MalformedRequestError("non-finite weight at (" + std::to_string(i) + "," + std::to_string(j) + ")");
                    }
                    if (j > i)
                    {
                        const double b = w[j * n + i];
                        const double scale = std::max({1.0, std::fabs(a), std::fabs(b)});
                        if (std::fabs(a - b) > 1e-9 * scale)
                        {
                            throw MalformedRequestError("weight matrix is not symmetric at (" + std::to_string(i) + "," +
                                                        std::to_string(j) + ")");
                        }
                    }
                }
            }
        }

        const RequestId &id() const noexcept { return m_id; }
        std::size_t variable_count() const noexcept { return m_n; }
        const std::vector<double> &weights() const noexcept { return m_weights; }
        double weight(std::size_t i, std::size_t j) const { return m_weights[i * m_n + j]; }
        const PodId &source_pod() const noexcept { return m_sourcePod; }
        std::uint64_t submitted_at_us() const noexcept { return m_submittedAtUs; }
        SizeClass size_class() const noexcept { return m_sizeClass; }

        // x^T W x for a 0/1 assignment. Entries other than 0 are treated as 1.
        double evaluate(std::span<const double> x) const
        {
            double e = 0.0;
            for (std::size_t i = 0; i < m_n; ++i)
            {
                if (x[i] == 0.0)
                {
                    continue;
                }
                e += m_weights[i * m_n + i];
                for (std::size_t j = i + 1; j < m_n; ++j)
                {
                    if (x[j] != 0.0)
                    {
                        e += 2.0 * m_weights[i * m_n + j];
                    }
                }
            }
            return e;
        }

    private:
        ProblemInstance() = default;

        RequestId m_id;
        std::size_t m_n = 0;
        std::vector<double> m_weights;
        PodId m_sourcePod;
        std::uint64_t m_submittedAtUs = 0;
        SizeClass m_sizeClass = SizeClass::Small;
    };

    using ProblemPtr = std::shared_ptr<const ProblemInstance>;
}
