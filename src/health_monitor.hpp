#pragma once

#include "backend_registry.hpp"

#include <condition_variable>
#include <thread>

namespace quboroute
{
    // The health-check routine: the only writer of BackendDescriptor::healthy besides
    // the router's circuit breaker and the admin surface.
    class HealthMonitor
    {
    public:
        explicit HealthMonitor(std::shared_ptr<BackendRegistry> registry) : m_registry(std::move(registry))
        {
            if (!m_registry)
            {
                throw std::runtime_error("HealthMonitor requires a registry");
            }
        }

        ~HealthMonitor() { stop(); }

        HealthMonitor(const HealthMonitor &) = delete;
        HealthMonitor &operator=(const HealthMonitor &) = delete;

        // Probes every registered backend once. Returns the number of health flags changed.
        std::size_t probe_all()
        {
            std::size_t changed = 0;
            for (const auto &st : m_registry->snapshot())
            {
                if (st.removed)
                {
                    continue;
                }
                std::shared_ptr<ISolverAdapter> adapter;
                try
                {
                    adapter = m_registry->adapter(st.descriptor.id);
                }
                catch (const std::out_of_range &)
                {
                    continue; // dropped by a concurrent reload
                }
                const bool ok = adapter->health_check();
                if (ok == st.descriptor.healthy)
                {
                    continue;
                }
                try
                {
                    m_registry->set_health(st.descriptor.id, ok);
                    ++changed;
                }
                catch (const std::out_of_range &)
                {
                    continue;
                }
            }
            return changed;
        }

        // Runs probe_all() every `interval` on a background thread until stop().
        void start(Millis interval)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (m_thread.joinable())
            {
                throw std::runtime_error("HealthMonitor already running");
            }
            m_stop = false;
            m_thread = std::thread([this, interval]()
                                   {
                                       std::unique_lock<std::mutex> lk(m_mu);
                                       while (!m_stop)
                                       {
                                           lk.unlock();
                                           probe_all();
                                           lk.lock();
                                           m_cv.wait_for(lk, interval, [this]()
                                                         { return m_stop; });
                                       } });
        }

        void stop()
        {
            {
                std::lock_guard<std::mutex> lk(m_mu);
                m_stop = true;
            }
            m_cv.notify_all();
            if (m_thread.joinable())
            {
                m_thread.join();
            }
        }

    private:
        std::shared_ptr<BackendRegistry> m_registry;

        std::mutex m_mu;
        std::condition_variable m_cv;
        bool m_stop = false;
        std::thread m_thread;
    };
}
