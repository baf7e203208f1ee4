#pragma once

#include "errors.hpp"
#include "events.hpp"
#include "protocol.hpp"
#include "timer.hpp"

#include <glaze/glaze.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tether {

    /*
     * Frame reader and request correlator.
     *
     * Assigns monotonically increasing ids starting at 1, keeps one pending
     * entry per in-flight request and settles each entry exactly once: by
     * its response, by its deadline, or by a bulk rejection. Whichever path
     * removes the entry from the table first wins; the others find nothing.
     *
     * The write callback must deliver a complete frame or throw.
     */
    class rpc_correlator {
      public:
        using write_fn = std::function<void(std::string_view)>;

        rpc_correlator(write_fn write, timer_queue& timers, size_t max_line_bytes = 16U << 20U);
        ~rpc_correlator();

        rpc_correlator(const rpc_correlator&) = delete;
        rpc_correlator& operator=(const rpc_correlator&) = delete;

        // Result payload of the response; failures surface as rpc_error from future::get()
        std::future<glz::raw_json> send_request(
                std::string_view method, std::string_view params_json, std::chrono::milliseconds timeout);

        void send_notification(std::string_view method, std::string_view params_json);

        // Raw bytes read from the server's stdout
        void feed(std::string_view chunk);

        void reject_all(rpc_errc code, const std::string& message);

        // New connection: rejects leftovers as connection_lost, restarts ids at 1 and drops partial input
        void reset();

        // Rejects everything as shutting_down and refuses further requests until reopen()
        void close();
        void reopen();

        size_t pending_count() const;
        int64_t next_id() const;

        event_hub<notification_event>& notifications() { return notifications_; }

      private:
        struct pending_request {
            std::string method{};
            std::promise<glz::raw_json> promise{};
            timer_id timer{};
        };

        void dispatch(const std::string& line);
        void resolve(int64_t id, const mcp::inbound_message& msg);
        void expire(int64_t id, std::chrono::milliseconds timeout);
        void answer_server_request(int64_t id, std::string_view method);

        write_fn write_;
        timer_queue& timers_;

        mutable std::mutex mutex_{};
        std::unordered_map<int64_t, pending_request> pending_{};
        int64_t next_id_{1};
        bool closed_{false};

        std::mutex framer_mutex_{};
        mcp::line_framer framer_;

        event_hub<notification_event> notifications_{};
    };

}  // namespace tether
