#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace quboroute
{
    using ByteBuffer = std::vector<std::byte>;

    using BackendId = std::string;
    using RequestId = std::string;
    using PodId = std::string;

    using SteadyClock = std::chrono::steady_clock;
    using Millis = std::chrono::milliseconds;

    // Flat key-value record. Used for ledger payloads and structured transition events.
    using Fields = std::vector<std::pair<std::string, std::string>>;

    inline std::string field_value(const Fields &fields, std::string_view key)
    {
        for (const auto &[k, v] : fields)
        {
            if (k == key)
            {
                return v;
            }
        }
        return {};
    }

    // Wall clock in microseconds since the Unix epoch.
    inline std::uint64_t wall_clock_us()
    {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(now).count());
    }

    inline double elapsed_ms(SteadyClock::time_point since, SteadyClock::time_point until = SteadyClock::now())
    {
        return std::chrono::duration<double, std::milli>(until - since).count();
    }

    inline std::string format_double(double v)
    {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.17g", v);
        return buf;
    }
}
