#pragma once

#include "common.hpp"

#include <array>
#include <bit>
#include <stdexcept>

namespace quboroute
{
    // Little-endian encoder shared by the solve protocol, the MPI envelope and ledger frames.
    class WireWriter
    {
    public:
        void write_u8(std::uint8_t v) { m_buf.push_back(static_cast<std::byte>(v)); }
        void write_u32(std::uint32_t v) { put_le_(v, 4); }
        void write_u64(std::uint64_t v) { put_le_(v, 8); }
        void write_f64(double v) { write_u64(std::bit_cast<std::uint64_t>(v)); }

        // u64 count, then the values.
        void write_f64_array(std::span<const double> values)
        {
            write_u64(values.size());
            for (const double v : values)
            {
                write_f64(v);
            }
        }

        void write_bytes(std::span<const std::byte> bytes)
        {
            write_u32(checked_len_(bytes.size()));
            m_buf.insert(m_buf.end(), bytes.begin(), bytes.end());
        }

        void write_string(std::string_view s)
        {
            write_bytes(std::span<const std::byte>(reinterpret_cast<const std::byte *>(s.data()), s.size()));
        }

        // No length prefix; the reader knows N.
        template <std::size_t N>
        void write_fixed(const std::array<std::uint8_t, N> &a)
        {
            for (const std::uint8_t b : a)
            {
                write_u8(b);
            }
        }

        std::size_t size() const noexcept { return m_buf.size(); }

        ByteBuffer take() { return std::move(m_buf); }

    private:
        void put_le_(std::uint64_t v, int width)
        {
            for (int i = 0; i < width; ++i)
            {
                m_buf.push_back(static_cast<std::byte>((v >> (8 * i)) & 0xFFu));
            }
        }

        static std::uint32_t checked_len_(std::size_t n)
        {
            if (n > std::numeric_limits<std::uint32_t>::max())
            {
                throw std::runtime_error("WireWriter: field longer than 4 GiB");
            }
            return static_cast<std::uint32_t>(n);
        }

        ByteBuffer m_buf;
    };

    // Decoder over a borrowed buffer. Every read that would run past the end throws, so a
    // truncated message never yields a partially filled value.
    class WireReader
    {
    public:
        explicit WireReader(std::span<const std::byte> bytes) : m_bytes(bytes) {}

        bool eof() const { return m_pos >= m_bytes.size(); }
        std::size_t position() const noexcept { return m_pos; }
        std::size_t remaining() const noexcept { return m_bytes.size() - m_pos; }

        std::uint8_t read_u8()
        {
            require_(1);
            return static_cast<std::uint8_t>(m_bytes[m_pos++]);
        }

        std::uint32_t read_u32() { return static_cast<std::uint32_t>(get_le_(4)); }
        std::uint64_t read_u64() { return get_le_(8); }
        double read_f64() { return std::bit_cast<double>(read_u64()); }

        // Reads a u64 element count and rejects it if `elemSize`-byte elements of that count
        // cannot fit in what is left. Guards allocations sized from the wire.
        std::uint64_t read_count(std::size_t elemSize, const char *what)
        {
            const std::uint64_t n = read_u64();
            if (elemSize != 0 && n > remaining() / elemSize)
            {
                throw std::runtime_error(std::string(what) + ": length exceeds buffer");
            }
            return n;
        }

        std::vector<double> read_f64_array(const char *what)
        {
            std::vector<double> out(static_cast<std::size_t>(read_count(8, what)));
            for (auto &v : out)
            {
                v = read_f64();
            }
            return out;
        }

        ByteBuffer read_bytes()
        {
            const std::span<const std::byte> s = take_(read_u32());
            return ByteBuffer(s.begin(), s.end());
        }

        std::string read_string()
        {
            const std::span<const std::byte> s = take_(read_u32());
            return std::string(reinterpret_cast<const char *>(s.data()), s.size());
        }

        template <std::size_t N>
        std::array<std::uint8_t, N> read_fixed()
        {
            const std::span<const std::byte> s = take_(N);
            std::array<std::uint8_t, N> out{};
            for (std::size_t i = 0; i < N; ++i)
            {
                out[i] = static_cast<std::uint8_t>(s[i]);
            }
            return out;
        }

        void expect_end(const char *what) const
        {
            if (!eof())
            {
                throw std::runtime_error(std::string(what) + ": trailing bytes");
            }
        }

    private:
        void require_(std::size_t n) const
        {
            if (n > remaining())
            {
                throw std::runtime_error("WireReader: truncated buffer");
            }
        }

        std::uint64_t get_le_(int width)
        {
            require_(static_cast<std::size_t>(width));
            std::uint64_t out = 0;
            for (int i = 0; i < width; ++i)
            {
                out |= static_cast<std::uint64_t>(static_cast<std::uint8_t>(m_bytes[m_pos++])) << (8 * i);
            }
            return out;
        }

        std::span<const std::byte> take_(std::size_t n)
        {
            require_(n);
            const std::span<const std::byte> s = m_bytes.subspan(m_pos, n);
            m_pos += n;
            return s;
        }

        std::span<const std::byte> m_bytes;
        std::size_t m_pos = 0;
    };
}
