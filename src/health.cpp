#include "tether/health.hpp"

#include "tether/utils.hpp"

#include <exception>

namespace tether {

    health_monitor::health_monitor(std::chrono::milliseconds interval, probe_fn probe, failure_fn on_failure)
            : interval_{interval}, probe_{std::move(probe)}, on_failure_{std::move(on_failure)} {}

    health_monitor::~health_monitor() {
        stop();
    }

    void health_monitor::start() {
        std::lock_guard lock{mutex_};
        if (worker_.joinable()) {
            return;
        }
        worker_ = std::jthread{[this](std::stop_token stop) { run(stop); }};
    }

    void health_monitor::stop() {
        std::jthread worker{};
        {
            std::lock_guard lock{mutex_};
            worker = std::move(worker_);
        }
        if (worker.joinable()) {
            worker.request_stop();
            cv_.notify_all();
            worker.join();
        }
    }

    bool health_monitor::running() const {
        std::lock_guard lock{mutex_};
        return worker_.joinable();
    }

    std::optional<std::string> health_monitor::check_now() const {
        return probe_();
    }

    void health_monitor::run(std::stop_token stop) {
        for (;;) {
            {
                std::unique_lock lock{mutex_};
                cv_.wait_for(lock, stop, interval_, [] { return false; });
            }
            if (stop.stop_requested()) {
                return;
            }

            ++ticks_;
            std::optional<std::string> reason{};
            try {
                reason = probe_();
            } catch (const std::exception& e) {
                reason = std::string{"health probe threw: "} + e.what();
            }
            if (!reason) {
                continue;
            }

            ++failures_;
            log_warn("health check failed: ", *reason);
            if (on_failure_) {
                try {
                    on_failure_(*reason);
                } catch (const std::exception& e) {
                    log_error("health failure handler threw: ", e.what());
                }
            }
        }
    }

}  // namespace tether
