#pragma once

#include "errors.hpp"
#include "log.hpp"
#include "solver_adapter.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <stdexcept>

namespace quboroute
{
    enum class BackendKind : std::uint8_t
    {
        SpecializedSolver = 1,
        ClassicalFallback = 2,
    };

    inline const char *backend_kind_name(BackendKind k) noexcept
    {
        switch (k)
        {
        case BackendKind::SpecializedSolver:
            return "specialized";
        case BackendKind::ClassicalFallback:
            return "classical";
        }
        return "unknown";
    }

    struct BackendDescriptor
    {
        BackendId id;
        BackendKind kind = BackendKind::SpecializedSolver;
        std::size_t maxVariables = 0;
        double expectedLatencyMs = 0.0;
        // Lower is preferred.
        double costWeight = 0.0;
        bool healthy = true;
    };

    struct BackendStats
    {
        std::uint64_t attempts = 0;
        std::uint64_t failures = 0;
        std::uint32_t consecutiveFailures = 0;
    };

    struct BackendStatus
    {
        BackendDescriptor descriptor;
        BackendStats stats;
        std::uint64_t registrationIndex = 0;
        bool removed = false;
    };

    // One backend line of a configuration file.
    struct BackendConfigEntry
    {
        BackendDescriptor descriptor;
        // Permanently removed: excluded from the registry on reload.
        bool removed = false;
    };

    using AdapterFactory = std::function<std::shared_ptr<ISolverAdapter>(const BackendDescriptor &)>;

    // Process-wide table of solver backends and their health.
    //
    // Readers take a shared lock and receive copies, so a listing is a consistent snapshot.
    // Mutations take effect for listings issued after they return.
    class BackendRegistry
    {
    public:
        void register_backend(BackendDescriptor desc, std::shared_ptr<ISolverAdapter> adapter)
        {
            if (!adapter)
            {
                throw std::runtime_error("register_backend: null adapter for '" + desc.id + "'");
            }
            if (desc.id.empty())
            {
                throw std::runtime_error("register_backend: empty backend id");
            }
            if (adapter->id() != desc.id)
            {
                throw std::runtime_error("register_backend: adapter id '" + adapter->id() + "' does not match descriptor '" + desc.id + "'");
            }

            std::unique_lock lk(m_mu);
            auto it = find_(desc.id);
            if (it != m_entries.end())
            {
                if (!it->removed)
                {
                    throw std::runtime_error("register_backend: duplicate backend id '" + desc.id + "'");
                }
                m_entries.erase(it);
            }
            Logger::instance().logf(LogLevel::Info, "registry", {}, "registered %s backend %s (max %zu variables)",
                                    backend_kind_name(desc.kind), desc.id.c_str(), desc.maxVariables);
            m_entries.push_back(Entry{std::move(desc), std::move(adapter), m_nextIndex++, {}, false});
        }

        // The backend stops being listed immediately; its entry is dropped on the next reload.
        void deregister_backend(const BackendId &id)
        {
            std::unique_lock lk(m_mu);
            at_(id).removed = true;
            Logger::instance().logf(LogLevel::Info, "registry", {}, "deregistered backend %s", id.c_str());
        }

        void set_health(const BackendId &id, bool healthy)
        {
            std::unique_lock lk(m_mu);
            Entry &e = at_(id);
            if (e.descriptor.healthy != healthy)
            {
                Logger::instance().logf(LogLevel::Info, "registry", {}, "backend %s is now %s", id.c_str(),
                                        healthy ? "healthy" : "unhealthy");
            }
            e.descriptor.healthy = healthy;
            if (healthy)
            {
                e.stats.consecutiveFailures = 0;
            }
        }

        void mark_healthy(const BackendId &id) { set_health(id, true); }
        void mark_unhealthy(const BackendId &id) { set_health(id, false); }

        // Healthy backends able to take `variableCount` variables, ordered by
        // (costWeight, expectedLatencyMs); ties keep registration order.
        std::vector<BackendDescriptor> list_capable(std::size_t variableCount) const
        {
            std::vector<BackendDescriptor> out;
            {
                std::shared_lock lk(m_mu);
                for (const auto &e : m_entries)
                {
                    if (!e.removed && e.descriptor.healthy && e.descriptor.maxVariables >= variableCount)
                    {
                        out.push_back(e.descriptor);
                    }
                }
            }
            if (out.empty())
            {
                throw NoCapableBackendError(variableCount);
            }
            std::stable_sort(out.begin(), out.end(), [](const BackendDescriptor &a, const BackendDescriptor &b)
                             {
                                 if (a.costWeight != b.costWeight)
                                 {
                                     return a.costWeight < b.costWeight;
                                 }
                                 return a.expectedLatencyMs < b.expectedLatencyMs; });
            return out;
        }

        // Largest maxVariables over registered backends, healthy or not. 0 when none.
        std::size_t max_variables() const
        {
            std::shared_lock lk(m_mu);
            std::size_t m = 0;
            for (const auto &e : m_entries)
            {
                if (!e.removed)
                {
                    m = std::max(m, e.descriptor.maxVariables);
                }
            }
            return m;
        }

        BackendDescriptor descriptor(const BackendId &id) const
        {
            std::shared_lock lk(m_mu);
            return at_(id).descriptor;
        }

        std::shared_ptr<ISolverAdapter> adapter(const BackendId &id) const
        {
            std::shared_lock lk(m_mu);
            return at_(id).adapter;
        }

        std::vector<BackendStatus> snapshot() const
        {
            std::shared_lock lk(m_mu);
            std::vector<BackendStatus> out;
            out.reserve(m_entries.size());
            for (const auto &e : m_entries)
            {
                out.push_back(BackendStatus{e.descriptor, e.stats, e.index, e.removed});
            }
            return out;
        }

        // Circuit breaker bookkeeping. Returns true if this outcome tripped the backend to unhealthy.
        // `threshold` consecutive failures trip a specialized backend; 0 disables tripping.
        // Classical backends are never tripped. Unknown ids are ignored (the backend may have
        // been dropped by a reload while the attempt was running).
        bool record_outcome(const BackendId &id, bool success, std::uint32_t threshold)
        {
            std::unique_lock lk(m_mu);
            auto it = find_(id);
            if (it == m_entries.end())
            {
                return false;
            }
            ++it->stats.attempts;
            if (success)
            {
                it->stats.consecutiveFailures = 0;
                return false;
            }
            ++it->stats.failures;
            ++it->stats.consecutiveFailures;
            if (threshold == 0 || it->descriptor.kind == BackendKind::ClassicalFallback || !it->descriptor.healthy ||
                it->stats.consecutiveFailures < threshold)
            {
                return false;
            }
            it->descriptor.healthy = false;
            Logger::instance().logf(LogLevel::Warn, "registry", {}, "backend %s tripped after %u consecutive failures",
                                    id.c_str(), it->stats.consecutiveFailures);
            return true;
        }

        // Applies a configuration: removed entries are dropped, known ids get the new descriptor
        // (keeping adapter, statistics and registration order), unknown ids are created through
        // `factory`. Backends the configuration does not mention are left as they are.
        void reload(const std::vector<BackendConfigEntry> &entries, const AdapterFactory &factory)
        {
            // Build adapters before taking the lock; the factory may be slow.
            std::vector<std::pair<BackendDescriptor, std::shared_ptr<ISolverAdapter>>> fresh;
            for (const auto &ce : entries)
            {
                if (ce.removed)
                {
                    continue;
                }
                bool known = false;
                {
                    std::shared_lock lk(m_mu);
                    auto it = find_(ce.descriptor.id);
                    known = it != m_entries.end() && !it->removed;
                }
                if (known)
                {
                    continue;
                }
                if (!factory)
                {
                    throw std::runtime_error("reload: no adapter factory for new backend '" + ce.descriptor.id + "'");
                }
                auto adapter = factory(ce.descriptor);
                if (!adapter || adapter->id() != ce.descriptor.id)
                {
                    throw std::runtime_error("reload: factory returned no adapter for '" + ce.descriptor.id + "'");
                }
                fresh.emplace_back(ce.descriptor, std::move(adapter));
            }

            std::unique_lock lk(m_mu);
            for (const auto &ce : entries)
            {
                if (ce.removed)
                {
                    auto it = find_(ce.descriptor.id);
                    if (it != m_entries.end())
                    {
                        it->removed = true;
                    }
                }
            }
            m_entries.erase(std::remove_if(m_entries.begin(), m_entries.end(), [](const Entry &e)
                                           { return e.removed; }),
                            m_entries.end());

            for (const auto &ce : entries)
            {
                if (ce.removed)
                {
                    continue;
                }
                auto it = find_(ce.descriptor.id);
                if (it != m_entries.end())
                {
                    it->descriptor = ce.descriptor;
                    continue;
                }
                auto f = std::find_if(fresh.begin(), fresh.end(), [&](const auto &p)
                                      { return p.first.id == ce.descriptor.id; });
                if (f == fresh.end())
                {
                    // Listed twice with a removal in between; nothing was prepared.
                    continue;
                }
                m_entries.push_back(Entry{f->first, std::move(f->second), m_nextIndex++, {}, false});
            }
            Logger::instance().logf(LogLevel::Info, "registry", {}, "reloaded %zu configuration entries, %zu backends registered",
                                    entries.size(), m_entries.size());
        }

    private:
        struct Entry
        {
            BackendDescriptor descriptor;
            std::shared_ptr<ISolverAdapter> adapter;
            std::uint64_t index = 0;
            BackendStats stats;
            bool removed = false;
        };

        std::vector<Entry>::iterator find_(const BackendId &id)
        {
            return std::find_if(m_entries.begin(), m_entries.end(), [&](const Entry &e)
                                { return e.descriptor.id == id; });
        }

        std::vector<Entry>::const_iterator find_(const BackendId &id) const
        {
            return std::find_if(m_entries.begin(), m_entries.end(), [&](const Entry &e)
                                { return e.descriptor.id == id; });
        }

        Entry &at_(const BackendId &id)
        {
            auto it = find_(id);
            if (it == m_entries.end())
            {
                throw std::out_of_range("unknown backend id '" + id + "'");
            }
            return *it;
        }

        const Entry &at_(const BackendId &id) const
        {
            auto it = find_(id);
            if (it == m_entries.end())
            {
                throw std::out_of_range("unknown backend id '" + id + "'");
            }
            return *it;
        }

        mutable std::shared_mutex m_mu;
        std::vector<Entry> m_entries;
        std::uint64_t m_nextIndex = 0;
    };
}
