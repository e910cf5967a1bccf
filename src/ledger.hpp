#pragma once

#include "errors.hpp"
#include "ledger_wire.hpp"
#include "log.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>

namespace quboroute
{
    struct LedgerEvent
    {
        RequestId requestId;
        EventType type = EventType::Submitted;
        Fields fields;
    };

    // Durable append-only storage behind the audit ledger.
    //
    // append() returns only once the record will survive a crash. Every method reports
    // storage failure with LedgerStoreError.
    class ILedgerStore
    {
    public:
        virtual ~ILedgerStore() = default;

        // `rec.sequenceNumber` equals size() at the time of the call.
        virtual void append(const LedgerRecord &rec) = 0;
        virtual std::uint64_t size() const = 0;
        virtual std::optional<LedgerRecord> read(std::uint64_t seq) const = 0;
        // Inclusive range, clipped to the stored records.
        virtual std::vector<LedgerRecord> read_range(std::uint64_t from, std::uint64_t to) const = 0;
        // All records for one request, in sequence order.
        virtual std::vector<LedgerRecord> find(const RequestId &requestId) const = 0;
    };

    class MemoryLedgerStore final : public ILedgerStore
    {
    public:
        void append(const LedgerRecord &rec) override
        {
            std::unique_lock lk(m_mu);
            if (rec.sequenceNumber != m_records.size())
            {
                throw LedgerStoreError("MemoryLedgerStore: out-of-order append of seq " + std::to_string(rec.sequenceNumber));
            }
            m_byRequest[rec.requestId].push_back(rec.sequenceNumber);
            m_records.push_back(rec);
        }

        std::uint64_t size() const override
        {
            std::shared_lock lk(m_mu);
            return m_records.size();
        }

        std::optional<LedgerRecord> read(std::uint64_t seq) const override
        {
            std::shared_lock lk(m_mu);
            if (seq >= m_records.size())
            {
                return std::nullopt;
            }
            return m_records[static_cast<std::size_t>(seq)];
        }

        std::vector<LedgerRecord> read_range(std::uint64_t from, std::uint64_t to) const override
        {
            std::shared_lock lk(m_mu);
            std::vector<LedgerRecord> out;
            for (std::uint64_t s = from; s <= to && s < m_records.size(); ++s)
            {
                out.push_back(m_records[static_cast<std::size_t>(s)]);
            }
            return out;
        }

        std::vector<LedgerRecord> find(const RequestId &requestId) const override
        {
            std::shared_lock lk(m_mu);
            std::vector<LedgerRecord> out;
            auto it = m_byRequest.find(requestId);
            if (it != m_byRequest.end())
            {
                for (const std::uint64_t s : it->second)
                {
                    out.push_back(m_records[static_cast<std::size_t>(s)]);
                }
            }
            return out;
        }

    private:
        mutable std::shared_mutex m_mu;
        std::vector<LedgerRecord> m_records;
        std::map<RequestId, std::vector<std::uint64_t>> m_byRequest;
    };

    struct LedgerHead
    {
        std::uint64_t sequenceNumber = 0;
        Sha256Digest hash{};
    };

    // Append-only, hash-chained audit log.
    //
    // Appends are linearizable: one mutex covers sequence assignment, hashing and the store
    // write, so sequence numbers are gap-free and the chain follows sequence order.
    class AuditLedger
    {
    public:
        // Resumes numbering and chaining from whatever `store` already holds.
        explicit AuditLedger(std::shared_ptr<ILedgerStore> store) : m_store(std::move(store))
        {
            if (!m_store)
            {
                throw std::runtime_error("AuditLedger requires a store");
            }
            try
            {
                m_next = m_store->size();
                if (m_next > 0)
                {
                    const auto last = m_store->read(m_next - 1);
                    if (!last)
                    {
                        throw LedgerStoreError("store reports " + std::to_string(m_next) + " records but the last is unreadable");
                    }
                    m_lastHash = compute_record_hash(*last);
                }
            }
            catch (const LedgerStoreError &e)
            {
                throw LedgerUnavailableError(e.what());
            }
            Logger::instance().logf(LogLevel::Debug, "ledger", {}, "opened at seq %llu", static_cast<unsigned long long>(m_next));
        }

        LedgerRecord append(const LedgerEvent &ev)
        {
            std::lock_guard<std::mutex> lk(m_mu);

            LedgerRecord rec;
            rec.sequenceNumber = m_next;
            rec.requestId = ev.requestId;
            rec.eventType = ev.type;
            rec.payload = canonical_payload(ev.fields);
            rec.payloadHash = sha256(rec.payload);
            rec.previousRecordHash = m_lastHash;
            rec.timestampUs = wall_clock_us();
            rec.recordHash = compute_record_hash(rec);

            try
            {
                m_store->append(rec);
            }
            catch (const LedgerStoreError &e)
            {
                Logger::instance().logf(LogLevel::Error, "ledger", ev.requestId, "append of %s at seq %llu failed: %s",
                                        event_type_name(ev.type), static_cast<unsigned long long>(rec.sequenceNumber), e.what());
                LedgerUnavailableError err(e.what());
                err.set_request_id(ev.requestId);
                throw err;
            }

            ++m_next;
            m_lastHash = rec.recordHash;
            Logger::instance().logf(LogLevel::Trace, "ledger", ev.requestId, "seq %llu %s",
                                    static_cast<unsigned long long>(rec.sequenceNumber), event_type_name(ev.type));
            return rec;
        }

        std::vector<LedgerRecord> query(const RequestId &requestId) const
        {
            try
            {
                return m_store->find(requestId);
            }
            catch (const LedgerStoreError &e)
            {
                throw LedgerUnavailableError(e.what());
            }
        }

        std::uint64_t size() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_next;
        }

        std::optional<LedgerHead> head() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (m_next == 0)
            {
                return std::nullopt;
            }
            return LedgerHead{m_next - 1, m_lastHash};
        }

        // Recomputes payload and record hashes over [fromSeq, toSeq] and checks every link,
        // including the link from record fromSeq-1. False for an empty or out-of-range span.
        bool verify_chain(std::uint64_t fromSeq, std::uint64_t toSeq) const
        {
            if (fromSeq > toSeq)
            {
                return false;
            }
            try
            {
                if (toSeq >= m_store->size())
                {
                    return false;
                }

                Sha256Digest expectedPrev = zero_digest();
                if (fromSeq > 0)
                {
                    const auto prev = m_store->read(fromSeq - 1);
                    if (!prev)
                    {
                        return false;
                    }
                    expectedPrev = compute_record_hash(*prev);
                }

                const auto records = m_store->read_range(fromSeq, toSeq);
                if (records.size() != toSeq - fromSeq + 1)
                {
                    return false;
                }
                std::uint64_t seq = fromSeq;
                for (const auto &rec : records)
                {
                    if (rec.sequenceNumber != seq || rec.previousRecordHash != expectedPrev)
                    {
                        return report_break_(seq, "broken link");
                    }
                    if (sha256(rec.payload) != rec.payloadHash)
                    {
                        return report_break_(seq, "payload hash mismatch");
                    }
                    const Sha256Digest h = compute_record_hash(rec);
                    if (h != rec.recordHash)
                    {
                        return report_break_(seq, "record hash mismatch");
                    }
                    expectedPrev = h;
                    ++seq;
                }
                return true;
            }
            catch (const LedgerStoreError &e)
            {
                throw LedgerUnavailableError(e.what());
            }
        }

        // Whole ledger; trivially true when empty.
        bool verify_chain() const
        {
            const std::uint64_t n = size();
            return n == 0 || verify_chain(0, n - 1);
        }

    private:
        static bool report_break_(std::uint64_t seq, const char *what)
        {
            Logger::instance().logf(LogLevel::Warn, "ledger", {}, "chain verification failed at seq %llu: %s",
                                    static_cast<unsigned long long>(seq), what);
            return false;
        }

        std::shared_ptr<ILedgerStore> m_store;

        mutable std::mutex m_mu;
        std::uint64_t m_next = 0;
        Sha256Digest m_lastHash = zero_digest();
    };
}
