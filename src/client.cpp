#include "tether/client.hpp"

#include "tether/errors.hpp"
#include "tether/format.hpp"

#include <algorithm>

using namespace tether::literals;

namespace tether {

    namespace detail {

        static constexpr auto probe_timeout = std::chrono::milliseconds{5'000};

        static std::future<glz::raw_json> failed_future(rpc_errc code, const std::string& message) {
            std::promise<glz::raw_json> promise{};
            promise.set_exception(std::make_exception_ptr(rpc_error(code, message)));
            return promise.get_future();
        }

    }  // namespace detail

    std::chrono::milliseconds compute_reconnect_delay(
            std::chrono::milliseconds base, int attempt, std::chrono::milliseconds cap) {
        if (attempt < 1) {
            attempt = 1;
        }
        auto delay = base;
        for (int i = 1; i < attempt; ++i) {
            if (delay >= cap) {
                break;
            }
            delay *= 2;
        }
        return std::min(delay, cap);
    }

    mcp_client::mcp_client(transport_config cfg)
            : cfg_{std::move(cfg)},
              transport_{cfg_},
              correlator_{[this](std::string_view frame) { transport_.write(frame); }, timers_, cfg_.max_line_bytes} {
        transport_.on_data([this](std::string_view chunk) { correlator_.feed(chunk); });
        transport_.on_exit([this](const exit_status& status) { on_process_exit(status); });
        transport_.on_error([this](const std::string& message) {
            {
                std::lock_guard lock{mutex_};
                connected_ = false;
            }
            correlator_.reject_all(rpc_errc::connection_lost, message);
            request_reconnect(message);
        });
        correlator_.notifications().subscribe([this](const notification_event& ev) { events_.emit(ev); });
    }

    mcp_client::~mcp_client() {
        shutdown();
        timers_.shutdown();
    }

    void mcp_client::start() {
        {
            std::lock_guard lock{mutex_};
            if (connected_) {
                return;
            }
            stopping_ = false;
            reconnect_failed_ = false;
            reconnect_count_ = 0;
        }
        correlator_.reopen();
        connect_once();
        start_supervision();
    }

    void mcp_client::reinitialize() {
        {
            std::lock_guard lock{mutex_};
            if (reconnecting_) {
                throw rpc_error(rpc_errc::not_connected, "a reconnect is already in progress");
            }
            connected_ = false;
            stopping_ = false;
            reconnect_failed_ = false;
            reconnect_count_ = 0;
        }
        log_info("reinitializing MCP client");
        correlator_.reopen();
        connect_once();
        start_supervision();
    }

    void mcp_client::shutdown() {
        bool active{false};
        {
            std::lock_guard lock{mutex_};
            active = supervising_ || connected_ || transport_.is_running();
            stopping_ = true;
            supervising_ = false;
            connected_ = false;
            reconnect_requested_ = false;
        }
        cv_.notify_all();

        correlator_.close();
        if (health_) {
            health_->stop();
            health_.reset();
        }
        if (supervisor_.joinable()) {
            supervisor_.request_stop();
            cv_.notify_all();
            supervisor_.join();
        }
        transport_.stop();

        {
            std::lock_guard lock{mutex_};
            reconnecting_ = false;
        }
        if (active) {
            log_info("MCP client shut down");
            events_.emit(shutdown_event{});
        }
    }

    void mcp_client::connect_once() {
        std::lock_guard connect{connect_mutex_};

        transport_.stop();
        correlator_.reset();
        transport_.start();

        try {
            handshake();
        } catch (const std::exception& e) {
            log_warn("MCP handshake failed: ", e.what());
            transport_.stop();
            throw;
        }

        auto pid = transport_.pid();
        std::string server_name{};
        bool stopping{false};
        {
            std::lock_guard lock{mutex_};
            // shutdown() may have begun while the handshake was in flight
            stopping = stopping_;
            connected_ = !stopping;
            if (server_) {
                server_name = server_->name;
            }
        }
        if (stopping) {
            transport_.stop();
            throw rpc_error(rpc_errc::shutting_down, "client shut down during the MCP handshake");
        }
        log_info("connected to MCP server ", server_name.empty() ? "(unnamed)"sv : std::string_view{server_name});
        events_.emit(connected_event{.pid = pid});
    }

    void mcp_client::handshake() {
        auto params = mcp::make_initialize_params(cfg_.protocol_version, cfg_.client_name, cfg_.client_version);
        auto raw = correlator_.send_request(mcp::method::initialize, params, cfg_.request_timeout).get();
        auto result = mcp::parse_initialize_result(raw.str);
        if (result.protocolVersion != cfg_.protocol_version) {
            log_info(
                    "server negotiated protocol ",
                    result.protocolVersion,
                    " (requested ",
                    cfg_.protocol_version,
                    ")");
        }
        correlator_.send_notification(mcp::method::initialized, "{}"sv);

        std::lock_guard lock{mutex_};
        server_ = std::move(result.serverInfo);
    }

    void mcp_client::start_supervision() {
        {
            std::lock_guard lock{mutex_};
            supervising_ = true;
        }
        if (!supervisor_.joinable()) {
            supervisor_ = std::jthread{[this](std::stop_token stop) { supervise(stop); }};
        }
        if (cfg_.health_check_enabled && !health_) {
            health_ = std::make_unique<health_monitor>(
                    cfg_.health_interval,
                    [this]() -> std::optional<std::string> {
                        {
                            std::lock_guard lock{mutex_};
                            if (!supervising_ || stopping_ || reconnecting_ || reconnect_failed_) {
                                return std::nullopt;
                            }
                        }
                        return probe();
                    },
                    [this](const std::string& reason) {
                        events_.emit(unhealthy_event{.reason = reason});
                        request_reconnect(reason);
                    });
            health_->start();
        }
    }

    std::optional<std::string> mcp_client::probe() {
        if (!transport_.is_running()) {
            return "MCP server process is not running";
        }
        if (!is_connected()) {
            return "MCP client is not connected";
        }
        if (cfg_.health_probe_rpc) {
            try {
                auto timeout = std::min(cfg_.request_timeout, detail::probe_timeout);
                (void)send_request(mcp::method::tools_list, "{}"sv, timeout).get();
            } catch (const std::exception& e) {
                return "tools/list probe failed: {}"_format(e.what());
            }
        }
        return std::nullopt;
    }

    health_report mcp_client::health_check() {
        auto reason = probe();
        if (reason) {
            log_info("health check: ", *reason);
        }
        return {.healthy = !reason, .error = std::move(reason)};
    }

    void mcp_client::on_process_exit(const exit_status& status) {
        {
            std::lock_guard lock{mutex_};
            connected_ = false;
        }
        correlator_.reject_all(rpc_errc::connection_lost, "MCP server exited ({})"_format(describe(status)));
        events_.emit(disconnected_event{.exit_code = status.exit_code, .signal = status.signal});
        request_reconnect("process exited ({})"_format(describe(status)));
    }

    void mcp_client::request_reconnect(const std::string& reason) {
        {
            std::lock_guard lock{mutex_};
            if (!supervising_ || stopping_ || reconnecting_ || reconnect_failed_) {
                return;
            }
            connected_ = false;
            reconnecting_ = true;
            reconnect_requested_ = true;
        }
        log_warn("reconnect requested: ", reason);
        cv_.notify_all();
    }

    void mcp_client::supervise(std::stop_token stop) {
        std::unique_lock lock{mutex_};
        while (!stop.stop_requested()) {
            cv_.wait(lock, stop, [this] { return reconnect_requested_ || stopping_; });
            if (stop.stop_requested() || stopping_) {
                return;
            }
            reconnect_requested_ = false;
            run_reconnect_chain(lock, stop);
        }
    }

    void mcp_client::run_reconnect_chain(std::unique_lock<std::mutex>& lock, std::stop_token stop) {
        for (;;) {
            if (stopping_ || stop.stop_requested()) {
                reconnecting_ = false;
                return;
            }

            if (reconnect_count_ >= cfg_.reconnect_attempts) {
                reconnect_failed_ = true;
                reconnecting_ = false;
                auto attempts = reconnect_count_;
                lock.unlock();
                log_error("giving up on MCP server after ", attempts, " reconnect attempt(s)");
                events_.emit(reconnect_failed_event{.attempts = attempts});
                lock.lock();
                return;
            }

            auto attempt = ++reconnect_count_;
            auto delay = compute_reconnect_delay(cfg_.reconnect_delay, attempt, cfg_.reconnect_delay_cap);

            lock.unlock();
            log_warn("reconnect attempt ", attempt, "/", cfg_.reconnect_attempts, " in ", format_ms(delay));
            events_.emit(reconnecting_event{.attempt = attempt, .delay = delay});
            lock.lock();

            if (cv_.wait_for(lock, stop, delay, [this] { return stopping_; }) || stop.stop_requested()) {
                reconnecting_ = false;
                return;
            }

            lock.unlock();
            bool ok{false};
            try {
                connect_once();
                ok = true;
            } catch (const std::exception& e) {
                log_warn("reconnect attempt ", attempt, " failed: ", e.what());
            }
            lock.lock();

            if (ok) {
                reconnect_count_ = 0;
                reconnecting_ = false;
                return;
            }
        }
    }

    std::future<glz::raw_json> mcp_client::send_request(
            std::string_view method, std::string_view params_json, std::chrono::milliseconds timeout) {
        {
            std::lock_guard lock{mutex_};
            if (stopping_) {
                return detail::failed_future(rpc_errc::shutting_down, "client is shutting down");
            }
            if (reconnect_failed_) {
                return detail::failed_future(
                        rpc_errc::reconnect_failed,
                        "MCP server is unavailable: reconnect attempts exhausted; reinitialize the client");
            }
            if (!connected_) {
                return detail::failed_future(rpc_errc::not_connected, "MCP client is not connected");
            }
        }
        return correlator_.send_request(method, params_json, timeout);
    }

    std::future<glz::raw_json> mcp_client::send_request(std::string_view method, std::string_view params_json) {
        return send_request(method, params_json, cfg_.request_timeout);
    }

    void mcp_client::send_notification(std::string_view method, std::string_view params_json) {
        if (!is_connected()) {
            throw rpc_error(rpc_errc::not_connected, "MCP client is not connected");
        }
        correlator_.send_notification(method, params_json);
    }

    mcp::tool_result mcp_client::call_tool(std::string_view name, std::string_view arguments_json) {
        auto raw = send_request(mcp::method::tools_call, mcp::make_tool_call_params(name, arguments_json)).get();
        return mcp::parse_tool_result(raw.str);
    }

    std::vector<mcp::tool_descriptor> mcp_client::list_tools() {
        auto raw = send_request(mcp::method::tools_list, "{}"sv).get();
        return mcp::parse_tools_list_result(raw.str).tools;
    }

    bool mcp_client::is_connected() const {
        std::lock_guard lock{mutex_};
        return connected_;
    }

    connection_status mcp_client::status() const {
        connection_status st{};
        {
            std::lock_guard lock{mutex_};
            st.connected = connected_;
            st.reconnect_count = reconnect_count_;
            st.reconnecting = reconnecting_;
            st.reconnect_failed = reconnect_failed_;
            st.server = server_;
        }
        st.running = transport_.is_running();
        st.pid = transport_.pid();
        st.pending_requests = correlator_.pending_count();
        return st;
    }

}  // namespace tether
