#pragma once

#include "ledger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <sys/types.h>
#include <unistd.h>

namespace quboroute
{
    // Ledger store backed by one append-only file of length-prefixed frames:
    //
    //   u32 length | u32 checksum (low 32 bits of FNV-1a over the body) | body (encode_record)
    //
    // Each append is fflush'ed and fsync'ed before returning. Opening rebuilds the
    // sequence and request indexes; a torn final frame (crash mid-append) is truncated.
    class FileLedgerStore final : public ILedgerStore
    {
    public:
        explicit FileLedgerStore(std::string path) : m_path(std::move(path))
        {
            m_file = std::fopen(m_path.c_str(), "a+b");
            if (!m_file)
            {
                throw LedgerStoreError("cannot open ledger file '" + m_path + "': " + std::strerror(errno));
            }
            try
            {
                rebuild_index_();
            }
            catch (...)
            {
                std::fclose(m_file);
                throw;
            }
        }

        ~FileLedgerStore() override
        {
            if (m_file)
            {
                std::fclose(m_file);
            }
        }

        FileLedgerStore(const FileLedgerStore &) = delete;
        FileLedgerStore &operator=(const FileLedgerStore &) = delete;

        const std::string &path() const noexcept { return m_path; }

        void append(const LedgerRecord &rec) override
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (rec.sequenceNumber != m_offsets.size())
            {
                throw LedgerStoreError("FileLedgerStore: out-of-order append of seq " + std::to_string(rec.sequenceNumber));
            }

            const ByteBuffer body = encode_record(rec);
            WireWriter frame;
            frame.write_u32(static_cast<std::uint32_t>(body.size()));
            frame.write_u32(checksum_(body));
            const ByteBuffer header = frame.take();

            if (std::fseek(m_file, 0, SEEK_END) != 0 ||
                std::fwrite(header.data(), 1, header.size(), m_file) != header.size() ||
                std::fwrite(body.data(), 1, body.size(), m_file) != body.size() ||
                std::fflush(m_file) != 0 ||
                ::fsync(::fileno(m_file)) != 0)
            {
                const std::string why = std::strerror(errno);
                rollback_();
                throw LedgerStoreError("append to '" + m_path + "' failed: " + why);
            }

            m_offsets.push_back(m_end);
            m_byRequest[rec.requestId].push_back(rec.sequenceNumber);
            m_end += static_cast<long>(header.size() + body.size());
        }

        std::uint64_t size() const override
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_offsets.size();
        }

        std::optional<LedgerRecord> read(std::uint64_t seq) const override
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (seq >= m_offsets.size())
            {
                return std::nullopt;
            }
            return read_at_(m_offsets[static_cast<std::size_t>(seq)]);
        }

        std::vector<LedgerRecord> read_range(std::uint64_t from, std::uint64_t to) const override
        {
            std::lock_guard<std::mutex> lk(m_mu);
            std::vector<LedgerRecord> out;
            for (std::uint64_t s = from; s <= to && s < m_offsets.size(); ++s)
            {
                out.push_back(read_at_(m_offsets[static_cast<std::size_t>(s)]));
            }
            return out;
        }

        std::vector<LedgerRecord> find(const RequestId &requestId) const override
        {
            std::lock_guard<std::mutex> lk(m_mu);
            std::vector<LedgerRecord> out;
            auto it = m_byRequest.find(requestId);
            if (it != m_byRequest.end())
            {
                for (const std::uint64_t s : it->second)
                {
                    out.push_back(read_at_(m_offsets[static_cast<std::size_t>(s)]));
                }
            }
            return out;
        }

    private:
        static constexpr std::size_t kFrameHeader = 8;

        static std::uint32_t checksum_(const ByteBuffer &body)
        {
            return static_cast<std::uint32_t>(detail::fnv1a64(std::span<const std::byte>(body.data(), body.size())));
        }

        // Reads one frame at `offset`. Returns false at a clean end of file and throws on a
        // torn or corrupt frame (torn frames carry `torn == true`).
        bool read_frame_(long offset, ByteBuffer &body, bool &torn) const
        {
            torn = false;
            if (std::fseek(m_file, offset, SEEK_SET) != 0)
            {
                throw LedgerStoreError("seek in '" + m_path + "' failed: " + std::strerror(errno));
            }
            ByteBuffer header(kFrameHeader);
            const std::size_t got = std::fread(header.data(), 1, header.size(), m_file);
            if (got == 0 && std::feof(m_file))
            {
                return false;
            }
            if (got != header.size())
            {
                torn = true;
                return false;
            }
            WireReader r(std::span<const std::byte>(header.data(), header.size()));
            const std::uint32_t len = r.read_u32();
            const std::uint32_t sum = r.read_u32();
            body.assign(len, std::byte{0});
            if (std::fread(body.data(), 1, body.size(), m_file) != body.size())
            {
                torn = true;
                return false;
            }
            if (checksum_(body) != sum)
            {
                throw LedgerStoreError("corrupt ledger frame at offset " + std::to_string(offset) + " in '" + m_path + "'");
            }
            return true;
        }

        LedgerRecord read_at_(long offset) const
        {
            ByteBuffer body;
            bool torn = false;
            if (!read_frame_(offset, body, torn))
            {
                throw LedgerStoreError("ledger frame at offset " + std::to_string(offset) + " is missing");
            }
            try
            {
                return decode_record(std::span<const std::byte>(body.data(), body.size()));
            }
            catch (const std::runtime_error &e)
            {
                throw LedgerStoreError(std::string("undecodable ledger frame: ") + e.what());
            }
        }

        void rebuild_index_()
        {
            long offset = 0;
            while (true)
            {
                ByteBuffer body;
                bool torn = false;
                if (!read_frame_(offset, body, torn))
                {
                    if (torn)
                    {
                        Logger::instance().logf(LogLevel::Warn, "ledger", {}, "truncating torn frame at offset %ld in %s", offset,
                                                m_path.c_str());
                        if (::ftruncate(::fileno(m_file), static_cast<off_t>(offset)) != 0)
                        {
                            throw LedgerStoreError("cannot truncate '" + m_path + "': " + std::strerror(errno));
                        }
                    }
                    break;
                }
                LedgerRecord rec;
                try
                {
                    rec = decode_record(std::span<const std::byte>(body.data(), body.size()));
                }
                catch (const std::runtime_error &e)
                {
                    throw LedgerStoreError("undecodable ledger frame at offset " + std::to_string(offset) + ": " + e.what());
                }
                if (rec.sequenceNumber != m_offsets.size())
                {
                    throw LedgerStoreError("ledger file '" + m_path + "' has seq " + std::to_string(rec.sequenceNumber) +
                                           " where " + std::to_string(m_offsets.size()) + " was expected");
                }
                m_offsets.push_back(offset);
                m_byRequest[rec.requestId].push_back(rec.sequenceNumber);
                offset += static_cast<long>(kFrameHeader + body.size());
            }
            m_end = offset;
            std::clearerr(m_file);
        }

        // Drops a partially written frame so the file still ends on a frame boundary.
        void rollback_() noexcept
        {
            std::clearerr(m_file);
            if (::ftruncate(::fileno(m_file), static_cast<off_t>(m_end)) != 0)
            {
                Logger::instance().logf(LogLevel::Error, "ledger", {}, "cannot roll back partial frame in %s: %s", m_path.c_str(),
                                        std::strerror(errno));
            }
        }

        std::string m_path;
        std::FILE *m_file = nullptr;

        mutable std::mutex m_mu;
        std::vector<long> m_offsets;
        std::map<RequestId, std::vector<std::uint64_t>> m_byRequest;
        long m_end = 0;
    };
}
