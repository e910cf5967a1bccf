/*
Purpose: Tamper evidence and linearizable appends of the audit ledger.

What this tests: a fresh chain verifies, corrupting one record's payloadHash makes
verification fail for every range that contains or follows it, concurrent appends
produce gap-free sequence numbers and a valid chain, a ledger resumes from an existing
store, and a failing store surfaces LedgerUnavailableError without consuming a sequence
number.
*/

#include "ledger.hpp"

#include <cassert>
#include <functional>
#include <set>
#include <thread>

namespace
{
    // Memory store whose records can be rewritten behind the ledger's back.
    class TamperableStore final : public quboroute::ILedgerStore
    {
    public:
        void append(const quboroute::LedgerRecord &rec) override
        {
            m_inner.append(rec);
            m_shadow.push_back(rec);
        }

        std::uint64_t size() const override { return m_shadow.size(); }

        std::optional<quboroute::LedgerRecord> read(std::uint64_t seq) const override
        {
            if (seq >= m_shadow.size())
            {
                return std::nullopt;
            }
            return m_shadow[seq];
        }

        std::vector<quboroute::LedgerRecord> read_range(std::uint64_t from, std::uint64_t to) const override
        {
            std::vector<quboroute::LedgerRecord> out;
            for (std::uint64_t s = from; s <= to && s < m_shadow.size(); ++s)
            {
                out.push_back(m_shadow[s]);
            }
            return out;
        }

        std::vector<quboroute::LedgerRecord> find(const quboroute::RequestId &rid) const override { return m_inner.find(rid); }

        void tamper(std::uint64_t seq, const std::function<void(quboroute::LedgerRecord &)> &fn) { fn(m_shadow.at(seq)); }

    private:
        quboroute::MemoryLedgerStore m_inner;
        std::vector<quboroute::LedgerRecord> m_shadow;
    };

    // Accepts `budget` appends, then reports the store as down.
    class FailingStore final : public quboroute::ILedgerStore
    {
    public:
        explicit FailingStore(std::uint64_t budget) : m_budget(budget) {}

        void append(const quboroute::LedgerRecord &rec) override
        {
            if (m_inner.size() >= m_budget)
            {
                throw quboroute::LedgerStoreError("disk unplugged");
            }
            m_inner.append(rec);
        }
        std::uint64_t size() const override { return m_inner.size(); }
        std::optional<quboroute::LedgerRecord> read(std::uint64_t seq) const override { return m_inner.read(seq); }
        std::vector<quboroute::LedgerRecord> read_range(std::uint64_t from, std::uint64_t to) const override
        {
            return m_inner.read_range(from, to);
        }
        std::vector<quboroute::LedgerRecord> find(const quboroute::RequestId &rid) const override { return m_inner.find(rid); }

        void set_budget(std::uint64_t b) { m_budget = b; }

    private:
        quboroute::MemoryLedgerStore m_inner;
        std::uint64_t m_budget;
    };

    quboroute::LedgerEvent event(const std::string &rid, quboroute::EventType t, const std::string &note)
    {
        return quboroute::LedgerEvent{rid, t, {{"note", note}}};
    }
}

int main()
{
    using namespace quboroute;

    // Empty ledger.
    {
        AuditLedger ledger(std::make_shared<MemoryLedgerStore>());
        assert(ledger.size() == 0);
        assert(!ledger.head());
        assert(ledger.verify_chain());
        assert(!ledger.verify_chain(0, 0));
    }

    // Chain shape and tamper evidence.
    {
        auto store = std::make_shared<TamperableStore>();
        AuditLedger ledger(store);
        std::vector<LedgerRecord> recs;
        for (int i = 0; i < 6; ++i)
        {
            recs.push_back(ledger.append(event(i % 2 ? "r-b" : "r-a", EventType::BackendAttempt, "n=" + std::to_string(i))));
        }
        assert(recs[0].sequenceNumber == 0);
        assert(recs[0].previousRecordHash == zero_digest());
        for (std::size_t i = 1; i < recs.size(); ++i)
        {
            assert(recs[i].sequenceNumber == i);
            assert(recs[i].previousRecordHash == recs[i - 1].recordHash);
        }
        assert(recs[2].payload == "note=n\\=2\n");
        assert(recs[2].payloadHash == sha256(recs[2].payload));
        assert(ledger.head()->sequenceNumber == 5);
        assert(ledger.head()->hash == recs[5].recordHash);

        const auto a = ledger.query("r-a");
        assert(a.size() == 3);
        assert(a[0].sequenceNumber == 0 && a[1].sequenceNumber == 2 && a[2].sequenceNumber == 4);
        assert(ledger.query("r-none").empty());

        assert(ledger.verify_chain());
        assert(ledger.verify_chain(2, 4));
        assert(!ledger.verify_chain(4, 2));
        assert(!ledger.verify_chain(0, 6));

        store->tamper(3, [](LedgerRecord &r)
                      { r.payloadHash[0] ^= 0x01; });
        assert(!ledger.verify_chain());
        assert(!ledger.verify_chain(3, 3));
        assert(!ledger.verify_chain(1, 4));
        assert(!ledger.verify_chain(4, 5)); // the successor no longer links
        assert(ledger.verify_chain(0, 2));

        store->tamper(3, [](LedgerRecord &r)
                      { r.payloadHash[0] ^= 0x01; });
        assert(ledger.verify_chain());

        // Rewriting the payload text without touching the hash is caught as well.
        store->tamper(1, [](LedgerRecord &r)
                      { r.payload = "note=forged\n"; });
        assert(!ledger.verify_chain(1, 1));
        assert(ledger.verify_chain(2, 5));
    }

    // Concurrent appends are serialized.
    {
        auto store = std::make_shared<MemoryLedgerStore>();
        AuditLedger ledger(store);
        constexpr int kThreads = 8;
        constexpr int kPerThread = 50;
        std::vector<std::vector<std::uint64_t>> seen(kThreads);
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t)
        {
            threads.emplace_back([&, t]()
                                 {
                                     for (int i = 0; i < kPerThread; ++i)
                                     {
                                         seen[t].push_back(ledger.append(event("r-" + std::to_string(t), EventType::Submitted, std::to_string(i))).sequenceNumber);
                                     } });
        }
        for (auto &th : threads)
        {
            th.join();
        }

        std::set<std::uint64_t> all;
        for (const auto &v : seen)
        {
            for (std::size_t i = 1; i < v.size(); ++i)
            {
                assert(v[i] > v[i - 1]);
            }
            all.insert(v.begin(), v.end());
        }
        assert(all.size() == static_cast<std::size_t>(kThreads * kPerThread));
        assert(*all.begin() == 0);
        assert(*all.rbegin() == static_cast<std::uint64_t>(kThreads * kPerThread - 1));
        assert(ledger.verify_chain());
        assert(ledger.query("r-3").size() == static_cast<std::size_t>(kPerThread));

        // A second ledger over the same store continues the chain.
        AuditLedger resumed(store);
        assert(resumed.size() == static_cast<std::uint64_t>(kThreads * kPerThread));
        const LedgerRecord next = resumed.append(event("r-late", EventType::Completed, "x"));
        assert(next.sequenceNumber == static_cast<std::uint64_t>(kThreads * kPerThread));
        assert(next.previousRecordHash == ledger.head()->hash);
        assert(resumed.verify_chain());
    }

    // Store outage.
    {
        auto store = std::make_shared<FailingStore>(2);
        AuditLedger ledger(store);
        (void)ledger.append(event("r-1", EventType::Submitted, "a"));
        (void)ledger.append(event("r-1", EventType::BackendAttempt, "b"));

        bool threw = false;
        try
        {
            (void)ledger.append(event("r-1", EventType::BackendSuccess, "c"));
        }
        catch (const LedgerUnavailableError &e)
        {
            threw = true;
            assert(e.code() == ErrorCode::LedgerUnavailable);
            assert(e.request_id() == "r-1");
            assert(std::string(e.what()).find("disk unplugged") != std::string::npos);
        }
        assert(threw);
        assert(ledger.size() == 2);

        store->set_budget(10);
        const LedgerRecord rec = ledger.append(event("r-1", EventType::BackendSuccess, "c"));
        assert(rec.sequenceNumber == 2);
        assert(ledger.verify_chain());
    }

    return 0;
}
