#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tether {

    using subscription_id = uint64_t;

    // Explicit subscriber list; handlers run synchronously on the emitting thread
    template <typename Event>
    class event_hub {
      public:
        using handler = std::function<void(const Event&)>;

        subscription_id subscribe(handler fn) {
            std::lock_guard lock{mutex_};
            auto id = ++next_id_;
            handlers_.emplace_back(id, std::move(fn));
            return id;
        }

        bool unsubscribe(subscription_id id) {
            std::lock_guard lock{mutex_};
            auto it = std::ranges::find(handlers_, id, &std::pair<subscription_id, handler>::first);
            if (it == handlers_.end()) {
                return false;
            }
            handlers_.erase(it);
            return true;
        }

        void emit(const Event& event) const {
            std::vector<handler> snapshot{};
            {
                std::lock_guard lock{mutex_};
                snapshot.reserve(handlers_.size());
                for (const auto& [id, fn] : handlers_) {
                    snapshot.push_back(fn);
                }
            }
            for (const auto& fn : snapshot) {
                fn(event);
            }
        }

        size_t size() const {
            std::lock_guard lock{mutex_};
            return handlers_.size();
        }

      private:
        mutable std::mutex mutex_{};
        std::vector<std::pair<subscription_id, handler>> handlers_{};
        subscription_id next_id_{0};
    };

    // ── Connection lifecycle ────────────────────────────────────────

    struct connected_event {
        std::optional<int> pid{};
    };

    struct disconnected_event {
        std::optional<int> exit_code{};
        std::optional<int> signal{};
    };

    struct reconnecting_event {
        int attempt{};
        std::chrono::milliseconds delay{};
    };

    struct reconnect_failed_event {
        int attempts{};
    };

    struct unhealthy_event {
        std::string reason{};
    };

    struct notification_event {
        std::string method{};
        std::string params{};
        // set when the server sent a request (method + id) rather than a notification
        std::optional<int64_t> id{};
    };

    struct shutdown_event {};

    using connection_event = std::variant<
            connected_event,
            disconnected_event,
            reconnecting_event,
            reconnect_failed_event,
            unhealthy_event,
            notification_event,
            shutdown_event>;

    // ── Command execution progress ──────────────────────────────────

    struct progress_event {
        std::string session_id{};
        std::string command{};
        int attempt{};
        int max_attempts{};
    };

    struct retry_event {
        std::string session_id{};
        std::string command{};
        int attempt{};
        int max_attempts{};
        std::chrono::milliseconds delay{};
    };

    struct timeout_event {
        std::string session_id{};
        std::string command{};
        int attempt{};
    };

    struct loop_detected_event {
        std::string session_id{};
        std::string command{};
        size_t count{};
    };

    using execution_event = std::variant<progress_event, retry_event, timeout_event, loop_detected_event>;

}  // namespace tether
