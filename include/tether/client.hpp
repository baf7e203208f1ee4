#pragma once

#include "channel.hpp"
#include "config.hpp"
#include "correlator.hpp"
#include "events.hpp"
#include "health.hpp"
#include "protocol.hpp"
#include "timer.hpp"
#include "transport.hpp"

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace tether {

    struct connection_status {
        bool connected{false};
        bool running{false};
        std::optional<int> pid{};
        int reconnect_count{0};
        bool reconnecting{false};
        bool reconnect_failed{false};
        size_t pending_requests{0};
        std::optional<mcp::server_info> server{};
    };

    struct health_report {
        bool healthy{false};
        std::optional<std::string> error{};
    };

    // base * 2^(attempt-1), clamped to cap; attempt is 1-based
    std::chrono::milliseconds compute_reconnect_delay(
            std::chrono::milliseconds base, int attempt, std::chrono::milliseconds cap);

    /*
     * MCP client over a supervised stdio child.
     *
     * start() spawns the server and runs the initialize handshake. From then
     * on an unexpected exit, or a failed health tick, triggers a reconnect
     * chain on the supervisor thread: each attempt waits the backoff delay,
     * restarts the process and repeats the handshake. The reconnect counter
     * resets on the first fully successful handshake. Once the budget is
     * spent the client parks in the reconnect-failed state and every call
     * fails fast until reinitialize().
     *
     * Requests may be issued from any number of threads.
     */
    class mcp_client final : public rpc_channel {
      public:
        explicit mcp_client(transport_config cfg);
        ~mcp_client() override;

        mcp_client(const mcp_client&) = delete;
        mcp_client& operator=(const mcp_client&) = delete;

        // Throws rpc_error when the first spawn or handshake fails
        void start();

        // Rejects outstanding requests as shutting_down, then terminates the server
        void shutdown();

        // Leaves the reconnect-failed state and connects from scratch
        void reinitialize();

        std::future<glz::raw_json> send_request(
                std::string_view method, std::string_view params_json, std::chrono::milliseconds timeout) override;
        std::future<glz::raw_json> send_request(std::string_view method, std::string_view params_json);

        void send_notification(std::string_view method, std::string_view params_json);

        // Blocking helpers; throw rpc_error
        mcp::tool_result call_tool(std::string_view name, std::string_view arguments_json);
        std::vector<mcp::tool_descriptor> list_tools();

        // Runs the health probe once on the calling thread
        health_report health_check();

        bool is_connected() const;
        connection_status status() const;
        const transport_config& config() const { return cfg_; }

        event_hub<connection_event>& events() { return events_; }

      private:
        void connect_once();
        void handshake();
        void on_process_exit(const exit_status& status);
        void request_reconnect(const std::string& reason);
        void supervise(std::stop_token stop);
        void run_reconnect_chain(std::unique_lock<std::mutex>& lock, std::stop_token stop);
        std::optional<std::string> probe();
        void start_supervision();

        transport_config cfg_;

        // timers outlive the correlator that schedules on them
        timer_queue timers_{};
        process_transport transport_;
        rpc_correlator correlator_;
        event_hub<connection_event> events_{};

        // one spawn + handshake at a time
        std::mutex connect_mutex_{};

        mutable std::mutex mutex_{};
        std::condition_variable_any cv_{};
        bool connected_{false};
        bool supervising_{false};
        bool reconnect_requested_{false};
        bool reconnecting_{false};
        bool reconnect_failed_{false};
        bool stopping_{false};
        int reconnect_count_{0};
        std::optional<mcp::server_info> server_{};

        std::unique_ptr<health_monitor> health_{};
        std::jthread supervisor_{};
    };

}  // namespace tether
