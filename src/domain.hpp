#pragma once

#include "common.hpp"

#include <string>
#include <variant>

namespace quboroute
{
    // Typed business-domain requests. A pod registers which alternative it submits.

    struct Lead
    {
        std::string id;
        double engagement = 0.0; // [0,1]
        double budget = 0.0;     // [0,1]
        double authority = 0.0;  // [0,1]
        double timeline = 0.5;   // [0,1]
        double baseRevenue = 10000.0;
    };

    struct LeadScoringRequest
    {
        std::vector<Lead> leads;
        std::vector<std::string> channels{"email", "phone", "linkedin"};
        double contactBudget = 1000.0;
        // 0 means "no cap".
        std::uint32_t maxLeads = 0;
    };

    struct PortfolioRequest
    {
        std::vector<std::string> assets;
        std::vector<double> expectedReturns;
        // Row-major assets x assets.
        std::vector<double> covariance;
        std::uint32_t bitsPerAsset = 3;
        double riskAversion = 0.5;
        double budgetPenalty = 10.0;
    };

    struct EnergyLoad
    {
        std::string id;
        double powerKw = 0.0;
    };

    struct EnergyScheduleRequest
    {
        std::vector<EnergyLoad> loads;
        // Price per kWh for each schedulable slot.
        std::vector<double> slotPrices;
        double peakPenalty = 1.0;
    };

    struct RoutingRequest
    {
        std::vector<std::string> stops;
        // Row-major stops x stops, zero diagonal.
        std::vector<double> distances;
    };

    struct RawQuboRequest
    {
        std::size_t variableCount = 0;
        // Row-major variableCount x variableCount; must be symmetric.
        std::vector<double> weights;
    };

    using DomainPayload = std::variant<LeadScoringRequest, PortfolioRequest, EnergyScheduleRequest, RoutingRequest, RawQuboRequest>;

    // Index-aligned with DomainPayload alternatives.
    enum class PayloadKind : std::uint8_t
    {
        LeadScoring = 0,
        Portfolio = 1,
        EnergySchedule = 2,
        Routing = 3,
        RawQubo = 4,
    };

    inline PayloadKind payload_kind(const DomainPayload &p) noexcept
    {
        return static_cast<PayloadKind>(p.index());
    }

    inline const char *payload_kind_name(PayloadKind k) noexcept
    {
        switch (k)
        {
        case PayloadKind::LeadScoring:
            return "lead-scoring";
        case PayloadKind::Portfolio:
            return "portfolio";
        case PayloadKind::EnergySchedule:
            return "energy-schedule";
        case PayloadKind::Routing:
            return "routing";
        case PayloadKind::RawQubo:
            return "raw-qubo";
        }
        return "unknown";
    }
}
