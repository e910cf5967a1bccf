#pragma once

#include "common.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>

namespace quboroute
{
    using Sha256Digest = std::array<std::uint8_t, 32>;

    inline constexpr Sha256Digest zero_digest() noexcept { return Sha256Digest{}; }

    // SHA-256 through OpenSSL's EVP interface.
    inline Sha256Digest sha256(std::span<const std::byte> bytes)
    {
        Sha256Digest out{};
        unsigned int len = 0;
        if (EVP_Digest(bytes.data(), bytes.size(), out.data(), &len, EVP_sha256(), nullptr) != 1 || len != out.size())
        {
            throw std::runtime_error("sha256: EVP_Digest failed");
        }
        return out;
    }

    inline Sha256Digest sha256(std::string_view text)
    {
        return sha256(std::span<const std::byte>(reinterpret_cast<const std::byte *>(text.data()), text.size()));
    }

    inline std::string to_hex(const Sha256Digest &d)
    {
        static constexpr char kHex[] = "0123456789abcdef";
        std::string out;
        out.reserve(d.size() * 2);
        for (const std::uint8_t b : d)
        {
            out.push_back(kHex[b >> 4]);
            out.push_back(kHex[b & 0x0Fu]);
        }
        return out;
    }

    namespace detail
    {
        // Non-cryptographic 64-bit hash for cache keys (instance shapes, tickets).
        inline std::uint64_t fnv1a64(std::span<const std::byte> bytes) noexcept
        {
            std::uint64_t h = 1469598103934665603ULL;
            for (const std::byte b : bytes)
            {
                h ^= static_cast<std::uint64_t>(static_cast<unsigned char>(b));
                h *= 1099511628211ULL;
            }
            return h;
        }

        inline std::uint64_t fnv1a64(std::string_view s) noexcept
        {
            return fnv1a64(std::span<const std::byte>(reinterpret_cast<const std::byte *>(s.data()), s.size()));
        }
    }
}
