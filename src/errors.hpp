#pragma once

#include "common.hpp"

#include <stdexcept>

namespace quboroute
{
    enum class ErrorCode : std::uint8_t
    {
        MalformedRequest = 1,
        SizeExceeded = 2,
        NoCapableBackend = 3,
        AllBackendsExhausted = 4,
        RequestTimeout = 5,
        RequestCancelled = 6,
        LedgerUnavailable = 7,
    };

    inline const char *error_code_name(ErrorCode c) noexcept
    {
        switch (c)
        {
        case ErrorCode::MalformedRequest:
            return "malformed-request";
        case ErrorCode::SizeExceeded:
            return "size-exceeded";
        case ErrorCode::NoCapableBackend:
            return "no-capable-backend";
        case ErrorCode::AllBackendsExhausted:
            return "all-backends-exhausted";
        case ErrorCode::RequestTimeout:
            return "request-timeout";
        case ErrorCode::RequestCancelled:
            return "request-cancelled";
        case ErrorCode::LedgerUnavailable:
            return "ledger-unavailable";
        }
        return "unknown";
    }

    // Base of every error surfaced to a submitting caller.
    class OrchestrationError : public std::runtime_error
    {
    public:
        OrchestrationError(ErrorCode code, const std::string &what) : std::runtime_error(what), m_code(code) {}

        ErrorCode code() const noexcept { return m_code; }

        const RequestId &request_id() const noexcept { return m_requestId; }
        void set_request_id(RequestId id) { m_requestId = std::move(id); }

        // Client errors are never retried and never reach a backend.
        bool is_client_error() const noexcept
        {
            return m_code == ErrorCode::MalformedRequest || m_code == ErrorCode::SizeExceeded;
        }

    private:
        ErrorCode m_code;
        RequestId m_requestId;
    };

    class MalformedRequestError final : public OrchestrationError
    {
    public:
        explicit MalformedRequestError(const std::string &what)
            : OrchestrationError(ErrorCode::MalformedRequest, "malformed request: " + what) {}
    };

    class SizeExceededError final : public OrchestrationError
    {
    public:
        SizeExceededError(std::size_t requested, std::size_t supported)
            : OrchestrationError(ErrorCode::SizeExceeded,
                                 "problem needs " + std::to_string(requested) + " variables, largest backend supports " +
                                     std::to_string(supported)),
              m_requested(requested), m_supported(supported) {}

        std::size_t requested() const noexcept { return m_requested; }
        std::size_t supported() const noexcept { return m_supported; }

    private:
        std::size_t m_requested = 0;
        std::size_t m_supported = 0;
    };

    class NoCapableBackendError final : public OrchestrationError
    {
    public:
        explicit NoCapableBackendError(std::size_t variableCount)
            : OrchestrationError(ErrorCode::NoCapableBackend,
                                 "no healthy backend can serve " + std::to_string(variableCount) + " variables") {}
    };

    class AllBackendsExhaustedError final : public OrchestrationError
    {
    public:
        explicit AllBackendsExhaustedError(std::vector<BackendId> attempted)
            : OrchestrationError(ErrorCode::AllBackendsExhausted,
                                 "all " + std::to_string(attempted.size()) + " candidate backends failed"),
              m_attempted(std::move(attempted)) {}

        const std::vector<BackendId> &attempted() const noexcept { return m_attempted; }

    private:
        std::vector<BackendId> m_attempted;
    };

    class RequestTimeoutError final : public OrchestrationError
    {
    public:
        explicit RequestTimeoutError(double elapsedMs)
            : OrchestrationError(ErrorCode::RequestTimeout,
                                 "request budget exhausted after " + std::to_string(elapsedMs) + " ms") {}
    };

    class RequestCancelledError final : public OrchestrationError
    {
    public:
        RequestCancelledError() : OrchestrationError(ErrorCode::RequestCancelled, "request cancelled by caller") {}
    };

    // Fatal: a request whose audit trail cannot be written is aborted.
    class LedgerUnavailableError final : public OrchestrationError
    {
    public:
        explicit LedgerUnavailableError(const std::string &what)
            : OrchestrationError(ErrorCode::LedgerUnavailable, "ledger unavailable: " + what) {}
    };

    // Raised by ledger stores; AuditLedger translates it to LedgerUnavailableError.
    class LedgerStoreError final : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };
}
