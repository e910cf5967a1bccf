#pragma once

#include "domain.hpp"
#include "errors.hpp"
#include "problem.hpp"

#include <cmath>
#include <functional>
#include <map>
#include <shared_mutex>
#include <string>

namespace quboroute
{
    struct ProblemBuilderConfig
    {
        SizeThresholds thresholds{};

        // Largest variable count any registered backend accepts (admission control).
        // Required; usually bound to BackendRegistry::max_variables.
        std::function<std::size_t()> capacity;

        // Lead scoring penalties (revenue is expressed in thousands).
        double leadCouplingPenalty = 60.0;
        double leadCoveragePenalty = 60.0;
        // Must exceed leadCoveragePenalty or a second channel for the same lead pays off.
        double leadExclusivityPenalty = 150.0;
        double leadMaxLeadsPenalty = 25.0;
        double leadBudgetPenalty = 5.0;

        // One-hot penalty for energy schedules and routes, as a multiple of the largest cost term.
        double oneHotPenaltyScale = 4.0;
    };

    inline double channel_cost(std::string_view channel)
    {
        if (channel == "email")
        {
            return 1.0;
        }
        if (channel == "phone")
        {
            return 5.0;
        }
        if (channel == "linkedin")
        {
            return 2.0;
        }
        if (channel == "meeting")
        {
            return 20.0;
        }
        if (channel == "demo")
        {
            return 50.0;
        }
        return -1.0;
    }

    // Converts a business request into a validated ProblemInstance.
    class ProblemBuilder
    {
    public:
        explicit ProblemBuilder(ProblemBuilderConfig cfg) : m_cfg(std::move(cfg))
        {
            if (!m_cfg.capacity)
            {
                throw std::runtime_error("ProblemBuilder requires a capacity hook");
            }
        }

        // Schema registration: `pod` may only submit payloads of `kind`.
        void register_pod(const PodId &pod, PayloadKind kind)
        {
            if (pod.empty())
            {
                throw std::runtime_error("register_pod: empty pod id");
            }
            std::unique_lock lk(m_mu);
            auto [it, inserted] = m_pods.emplace(pod, kind);
            if (!inserted && it->second != kind)
            {
                throw std::runtime_error("register_pod: pod '" + pod + "' already registered with another payload kind");
            }
        }

        std::optional<PayloadKind> pod_kind(const PodId &pod) const
        {
            std::shared_lock lk(m_mu);
            auto it = m_pods.find(pod);
            if (it == m_pods.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        const ProblemBuilderConfig &config() const noexcept { return m_cfg; }

        ProblemPtr build(const RequestId &id, const PodId &sourcePod, const DomainPayload &payload) const
        {
            const auto kind = pod_kind(sourcePod);
            if (!kind)
            {
                throw MalformedRequestError("unknown source pod '" + sourcePod + "'");
            }
            if (*kind != payload_kind(payload))
            {
                throw MalformedRequestError("pod '" + sourcePod + "' submits " + payload_kind_name(*kind) + " payloads, got " +
                                            payload_kind_name(payload_kind(payload)));
            }

            // Size is known before the matrix is materialized; reject early.
            const std::size_t n = variable_count(payload);
            const std::size_t cap = m_cfg.capacity();
            if (n > cap || cap == 0)
            {
                throw SizeExceededError(n, cap);
            }

            std::vector<double> weights = std::visit([this](const auto &req)
                                                     { return this->map_(req); },
                                                     payload);
            return ProblemInstance::create(id, n, std::move(weights), sourcePod, m_cfg.thresholds);
        }

        // Number of decision variables the payload maps to. Throws MalformedRequestError on absent fields.
        static std::size_t variable_count(const DomainPayload &payload)
        {
            return std::visit([](const auto &req)
                              { return ProblemBuilder::count_(req); },
                              payload);
        }

    private:
        static std::size_t count_(const LeadScoringRequest &r)
        {
            if (r.leads.empty())
            {
                throw MalformedRequestError("lead scoring request has no leads");
            }
            if (r.channels.empty())
            {
                throw MalformedRequestError("lead scoring request has no channels");
            }
            return r.leads.size() * (1 + r.channels.size());
        }

        static std::size_t count_(const PortfolioRequest &r)
        {
            if (r.expectedReturns.empty())
            {
                throw MalformedRequestError("portfolio request has no assets");
            }
            if (r.bitsPerAsset == 0 || r.bitsPerAsset > 16)
            {
                throw MalformedRequestError("bitsPerAsset must be in [1,16]");
            }
            return r.expectedReturns.size() * r.bitsPerAsset;
        }

        static std::size_t count_(const EnergyScheduleRequest &r)
        {
            if (r.loads.empty() || r.slotPrices.empty())
            {
                throw MalformedRequestError("energy schedule needs loads and slots");
            }
            return r.loads.size() * r.slotPrices.size();
        }

        static std::size_t count_(const RoutingRequest &r)
        {
            if (r.stops.size() < 2)
            {
                throw MalformedRequestError("routing request needs at least two stops");
            }
            return r.stops.size() * r.stops.size();
        }

        static std::size_t count_(const RawQuboRequest &r)
        {
            if (r.variableCount == 0)
            {
                throw MalformedRequestError("raw qubo has no variables");
            }
            return r.variableCount;
        }

        static void require_unit_(double v, const char *what, const std::string &lead)
        {
            if (!(v >= 0.0 && v <= 1.0))
            {
                throw MalformedRequestError(std::string(what) + " score of lead '" + lead + "' is outside [0,1]");
            }
        }

        // Variables: x_i (contact lead i) followed by y_ij (use channel j for lead i).
        std::vector<double> map_(const LeadScoringRequest &r) const
        {
            if (!(r.contactBudget > 0.0))
            {
                throw MalformedRequestError("contact budget must be positive");
            }
            std::vector<double> costs;
            for (const auto &ch : r.channels)
            {
                const double c = channel_cost(ch);
                if (c < 0.0)
                {
                    throw MalformedRequestError("unknown contact channel '" + ch + "'");
                }
                costs.push_back(c);
            }

            const std::size_t nl = r.leads.size();
            const std::size_t nc = r.channels.size();
            QuboAccumulator q(nl * (1 + nc));
            const auto y = [&](std::size_t i, std::size_t j)
            { return nl + i * nc + j; };

            for (std::size_t i = 0; i < nl; ++i)
            {
                const Lead &lead = r.leads[i];
                require_unit_(lead.engagement, "engagement", lead.id);
                require_unit_(lead.budget, "budget", lead.id);
                require_unit_(lead.authority, "authority", lead.id);
                require_unit_(lead.timeline, "timeline", lead.id);

                const double score = 0.3 * lead.engagement + 0.25 * lead.budget + 0.25 * lead.authority + 0.2 * lead.timeline;
                // Selecting a lead needs a channel: Q*(x_i - sum_j x_i*y_ij).
                q.add_linear(i, -score * lead.baseRevenue / 1000.0 + m_cfg.leadCoveragePenalty);

                for (std::size_t j = 0; j < nc; ++j)
                {
                    // Channel cost, plus y_ij <= x_i as P*(y_ij - x_i*y_ij).
                    q.add_linear(y(i, j), costs[j] + m_cfg.leadCouplingPenalty);
                    q.add_quadratic(i, y(i, j), -m_cfg.leadCouplingPenalty - m_cfg.leadCoveragePenalty);
                    for (std::size_t j2 = j + 1; j2 < nc; ++j2)
                    {
                        q.add_quadratic(y(i, j), y(i, j2), m_cfg.leadExclusivityPenalty);
                    }
                }
            }

            // Soft spend pressure: P * (sum cost*y / budget)^2.
            const double inv = 1.0 / r.contactBudget;
            for (std::size_t a = 0; a < nl * nc; ++a)
            {
                const double ca = costs[a % nc] * inv;
                q.add_linear(nl + a, m_cfg.leadBudgetPenalty * ca * ca);
                for (std::size_t b = a + 1; b < nl * nc; ++b)
                {
                    const double cb = costs[b % nc] * inv;
                    q.add_quadratic(nl + a, nl + b, 2.0 * m_cfg.leadBudgetPenalty * ca * cb);
                }
            }

            if (r.maxLeads > 0 && r.maxLeads < nl)
            {
                // M * (sum x - K)^2 without the constant.
                const double m = m_cfg.leadMaxLeadsPenalty;
                const double k = static_cast<double>(r.maxLeads);
                for (std::size_t i = 0; i < nl; ++i)
                {
                    q.add_linear(i, m * (1.0 - 2.0 * k));
                    for (std::size_t i2 = i + 1; i2 < nl; ++i2)
                    {
                        q.add_quadratic(i, i2, 2.0 * m);
                    }
                }
            }
            return q.symmetric();
        }

        // Each asset weight is a b-bit fraction in [0,1]; minimizes
        // riskAversion * w'Cw - mu'w + budgetPenalty * (sum w - 1)^2.
        std::vector<double> map_(const PortfolioRequest &r) const
        {
            const std::size_t na = r.expectedReturns.size();
            if (r.covariance.size() != na * na)
            {
                throw MalformedRequestError("covariance must be " + std::to_string(na) + "x" + std::to_string(na));
            }
            if (!r.assets.empty() && r.assets.size() != na)
            {
                throw MalformedRequestError("asset names do not match expected returns");
            }

            const std::size_t bits = r.bitsPerAsset;
            const double unit = 1.0 / static_cast<double>((1u << bits) - 1u);
            const std::size_t n = na * bits;
            QuboAccumulator q(n);
            const auto coef = [&](std::size_t v)
            { return unit * static_cast<double>(1u << (v % bits)); };

            for (std::size_t a = 0; a < n; ++a)
            {
                const std::size_t ia = a / bits;
                const double ca = coef(a);
                q.add_linear(a, r.riskAversion * r.covariance[ia * na + ia] * ca * ca - r.expectedReturns[ia] * ca +
                                    r.budgetPenalty * (ca * ca - 2.0 * ca));
                for (std::size_t b = a + 1; b < n; ++b)
                {
                    const std::size_t ib = b / bits;
                    const double cb = coef(b);
                    q.add_quadratic(a, b, 2.0 * r.riskAversion * r.covariance[ia * na + ib] * ca * cb + 2.0 * r.budgetPenalty * ca * cb);
                }
            }
            return q.symmetric();
        }

        // x_{l,t}: load l runs in slot t. One slot per load; loads sharing a slot pay the peak penalty.
        std::vector<double> map_(const EnergyScheduleRequest &r) const
        {
            const std::size_t nl = r.loads.size();
            const std::size_t ns = r.slotPrices.size();
            double maxCost = 0.0;
            for (const auto &l : r.loads)
            {
                if (!(l.powerKw >= 0.0))
                {
                    throw MalformedRequestError("load '" + l.id + "' has negative power");
                }
                for (const double p : r.slotPrices)
                {
                    maxCost = std::max(maxCost, std::fabs(l.powerKw * p));
                }
            }
            const double a = m_cfg.oneHotPenaltyScale * std::max(1.0, maxCost);

            QuboAccumulator q(nl * ns);
            const auto x = [&](std::size_t l, std::size_t t)
            { return l * ns + t; };
            for (std::size_t l = 0; l < nl; ++l)
            {
                for (std::size_t t = 0; t < ns; ++t)
                {
                    q.add_linear(x(l, t), r.loads[l].powerKw * r.slotPrices[t] - a);
                    for (std::size_t t2 = t + 1; t2 < ns; ++t2)
                    {
                        q.add_quadratic(x(l, t), x(l, t2), 2.0 * a);
                    }
                    for (std::size_t l2 = l + 1; l2 < nl; ++l2)
                    {
                        q.add_quadratic(x(l, t), x(l2, t), r.peakPenalty * r.loads[l].powerKw * r.loads[l2].powerKw);
                    }
                }
            }
            return q.symmetric();
        }

        // x_{c,p}: stop c is visited at position p of a closed tour.
        std::vector<double> map_(const RoutingRequest &r) const
        {
            const std::size_t ns = r.stops.size();
            if (r.distances.size() != ns * ns)
            {
                throw MalformedRequestError("distance matrix must be " + std::to_string(ns) + "x" + std::to_string(ns));
            }
            double maxD = 0.0;
            for (const double d : r.distances)
            {
                if (!(d >= 0.0))
                {
                    throw MalformedRequestError("distances must be non-negative");
                }
                maxD = std::max(maxD, d);
            }
            const double a = m_cfg.oneHotPenaltyScale * std::max(1.0, maxD);

            QuboAccumulator q(ns * ns);
            const auto x = [&](std::size_t c, std::size_t p)
            { return c * ns + p; };
            for (std::size_t c = 0; c < ns; ++c)
            {
                for (std::size_t p = 0; p < ns; ++p)
                {
                    // Row and column one-hot constraints each contribute -A on the diagonal.
                    q.add_linear(x(c, p), -2.0 * a);
                    for (std::size_t p2 = p + 1; p2 < ns; ++p2)
                    {
                        q.add_quadratic(x(c, p), x(c, p2), 2.0 * a);
                    }
                    for (std::size_t c2 = c + 1; c2 < ns; ++c2)
                    {
                        q.add_quadratic(x(c, p), x(c2, p), 2.0 * a);
                    }
                    const std::size_t next = (p + 1) % ns;
                    for (std::size_t c2 = 0; c2 < ns; ++c2)
                    {
                        if (c2 != c)
                        {
                            q.add_quadratic(x(c, p), x(c2, next), r.distances[c * ns + c2]);
                        }
                    }
                }
            }
            return q.symmetric();
        }

        std::vector<double> map_(const RawQuboRequest &r) const
        {
            if (r.weights.size() != r.variableCount * r.variableCount)
            {
                throw MalformedRequestError("raw qubo weights must be " + std::to_string(r.variableCount) + "x" +
                                            std::to_string(r.variableCount));
            }
            return r.weights;
        }

        ProblemBuilderConfig m_cfg;
        mutable std::shared_mutex m_mu;
        std::map<PodId, PayloadKind> m_pods;
    };

    // Renders a decision vector back into business terms.
    inline Fields interpret_solution(const DomainPayload &payload, std::span<const double> x)
    {
        Fields out;
        const auto on = [&](std::size_t i)
        { return i < x.size() && x[i] != 0.0; };
        const auto join = [](const std::vector<std::string> &v)
        {
            std::string s;
            for (std::size_t i = 0; i < v.size(); ++i)
            {
                if (i)
                {
                    s += ',';
                }
                s += v[i];
            }
            return s;
        };

        if (const auto *r = std::get_if<LeadScoringRequest>(&payload))
        {
            std::vector<std::string> selected;
            std::vector<std::string> contacts;
            const std::size_t nl = r->leads.size();
            const std::size_t nc = r->channels.size();
            for (std::size_t i = 0; i < nl; ++i)
            {
                if (!on(i))
                {
                    continue;
                }
                selected.push_back(r->leads[i].id);
                for (std::size_t j = 0; j < nc; ++j)
                {
                    if (on(nl + i * nc + j))
                    {
                        contacts.push_back(r->leads[i].id + ":" + r->channels[j]);
                    }
                }
            }
            out.emplace_back("selected_leads", join(selected));
            out.emplace_back("contacts", join(contacts));
        }
        else if (const auto *r = std::get_if<PortfolioRequest>(&payload))
        {
            const std::size_t na = r->expectedReturns.size();
            const std::size_t bits = r->bitsPerAsset;
            const double unit = 1.0 / static_cast<double>((1u << bits) - 1u);
            std::vector<std::string> weights;
            for (std::size_t i = 0; i < na; ++i)
            {
                double w = 0.0;
                for (std::size_t b = 0; b < bits; ++b)
                {
                    if (on(i * bits + b))
                    {
                        w += unit * static_cast<double>(1u << b);
                    }
                }
                const std::string name = r->assets.empty() ? ("asset" + std::to_string(i)) : r->assets[i];
                weights.push_back(name + "=" + format_double(w));
            }
            out.emplace_back("weights", join(weights));
        }
        else if (const auto *r = std::get_if<EnergyScheduleRequest>(&payload))
        {
            const std::size_t ns = r->slotPrices.size();
            std::vector<std::string> plan;
            for (std::size_t l = 0; l < r->loads.size(); ++l)
            {
                std::string slot = "none";
                for (std::size_t t = 0; t < ns; ++t)
                {
                    if (on(l * ns + t))
                    {
                        slot = std::to_string(t);
                        break;
                    }
                }
                plan.push_back(r->loads[l].id + "@" + slot);
            }
            out.emplace_back("schedule", join(plan));
        }
        else if (const auto *r = std::get_if<RoutingRequest>(&payload))
        {
            const std::size_t ns = r->stops.size();
            std::vector<std::string> order;
            for (std::size_t p = 0; p < ns; ++p)
            {
                for (std::size_t c = 0; c < ns; ++c)
                {
                    if (on(c * ns + p))
                    {
                        order.push_back(r->stops[c]);
                        break;
                    }
                }
            }
            out.emplace_back("route", join(order));
        }
        else
        {
            std::size_t ones = 0;
            for (std::size_t i = 0; i < x.size(); ++i)
            {
                ones += on(i) ? 1 : 0;
            }
            out.emplace_back("active_variables", std::to_string(ones));
        }
        return out;
    }
}
