#pragma once

#include "digest.hpp"
#include "wire.hpp"

#include <stdexcept>

namespace quboroute
{
    enum class EventType : std::uint8_t
    {
        Submitted = 1,
        BackendAttempt = 2,
        BackendFailure = 3,
        BackendSuccess = 4,
        FallbackTriggered = 5,
        Completed = 6,
        Failed = 7,
        BaselineMeasured = 8,
    };

    inline const char *event_type_name(EventType t) noexcept
    {
        switch (t)
        {
        case EventType::Submitted:
            return "submitted";
        case EventType::BackendAttempt:
            return "backend-attempt";
        case EventType::BackendFailure:
            return "backend-failure";
        case EventType::BackendSuccess:
            return "backend-success";
        case EventType::FallbackTriggered:
            return "fallback-triggered";
        case EventType::Completed:
            return "completed";
        case EventType::Failed:
            return "failed";
        case EventType::BaselineMeasured:
            return "baseline-measured";
        }
        return "unknown";
    }

    struct LedgerRecord
    {
        std::uint64_t sequenceNumber = 0;
        RequestId requestId;
        EventType eventType = EventType::Submitted;
        // Canonical payload text; payloadHash = SHA-256(payload).
        std::string payload;
        Sha256Digest payloadHash{};
        Sha256Digest previousRecordHash{};
        std::uint64_t timestampUs = 0;
        // Hash of this record as written; the next record chains to it.
        Sha256Digest recordHash{};
    };

    // "key=value" lines. Backslash, newline and '=' in keys/values are escaped so the
    // text parses back unambiguously.
    inline std::string canonical_payload(const Fields &fields)
    {
        const auto put = [](std::string &out, const std::string &s)
        {
            for (const char c : s)
            {
                switch (c)
                {
                case '\\':
                    out += "\\\\";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                case '=':
                    out += "\\=";
                    break;
                default:
                    out.push_back(c);
                }
            }
        };

        std::string out;
        for (const auto &[k, v] : fields)
        {
            put(out, k);
            out.push_back('=');
            put(out, v);
            out.push_back('\n');
        }
        return out;
    }

    namespace detail
    {
        // Fields covered by the record hash, in chain order.
        inline void write_record_body(WireWriter &w, const LedgerRecord &rec)
        {
            w.write_u64(rec.sequenceNumber);
            w.write_string(rec.requestId);
            w.write_u8(static_cast<std::uint8_t>(rec.eventType));
            w.write_fixed(rec.payloadHash);
            w.write_fixed(rec.previousRecordHash);
            w.write_u64(rec.timestampUs);
        }
    }

    // SHA-256 over (sequenceNumber, requestId, eventType, payloadHash, previousRecordHash, timestamp).
    inline Sha256Digest compute_record_hash(const LedgerRecord &rec)
    {
        WireWriter w;
        detail::write_record_body(w, rec);
        const ByteBuffer body = w.take();
        return sha256(std::span<const std::byte>(body.data(), body.size()));
    }

    inline ByteBuffer encode_record(const LedgerRecord &rec)
    {
        WireWriter w;
        detail::write_record_body(w, rec);
        w.write_string(rec.payload);
        w.write_fixed(rec.recordHash);
        return w.take();
    }

    inline LedgerRecord decode_record(std::span<const std::byte> bytes)
    {
        WireReader r(bytes);
        LedgerRecord rec;
        rec.sequenceNumber = r.read_u64();
        rec.requestId = r.read_string();
        const std::uint8_t type = r.read_u8();
        if (type < static_cast<std::uint8_t>(EventType::Submitted) || type > static_cast<std::uint8_t>(EventType::BaselineMeasured))
        {
            throw std::runtime_error("decode_record: unknown event type " + std::to_string(type));
        }
        rec.eventType = static_cast<EventType>(type);
        rec.payloadHash = r.read_fixed<32>();
        rec.previousRecordHash = r.read_fixed<32>();
        rec.timestampUs = r.read_u64();
        rec.payload = r.read_string();
        rec.recordHash = r.read_fixed<32>();
        r.expect_end("decode_record");
        return rec;
    }
}
