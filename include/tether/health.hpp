#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace tether {

    /*
     * Periodic liveness probe.
     *
     * Every interval the probe runs once; a returned reason marks the tick
     * unhealthy and is handed to the failure callback. Both callbacks run on
     * the monitor's thread.
     */
    class health_monitor {
      public:
        // nullopt when healthy, otherwise a short reason
        using probe_fn = std::function<std::optional<std::string>()>;
        using failure_fn = std::function<void(const std::string&)>;

        health_monitor(std::chrono::milliseconds interval, probe_fn probe, failure_fn on_failure);
        ~health_monitor();

        health_monitor(const health_monitor&) = delete;
        health_monitor& operator=(const health_monitor&) = delete;

        void start();
        void stop();
        bool running() const;

        // Runs the probe on the calling thread without invoking the failure callback
        std::optional<std::string> check_now() const;

        uint64_t ticks() const { return ticks_.load(); }
        uint64_t failures() const { return failures_.load(); }

      private:
        void run(std::stop_token stop);

        std::chrono::milliseconds interval_;
        probe_fn probe_;
        failure_fn on_failure_;

        mutable std::mutex mutex_{};
        std::condition_variable_any cv_{};
        std::atomic<uint64_t> ticks_{0};
        std::atomic<uint64_t> failures_{0};
        std::jthread worker_{};
    };

}  // namespace tether
