#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tether {

    using namespace std::string_view_literals;

    /*
     * Low-level failure codes raised by the transport and correlator.
     *
     * - not_running: write attempted while no child process is alive.
     * - not_connected: call attempted before the handshake completed.
     * - spawn_failed: child did not stay alive through the startup grace window.
     * - executable_not_found: exec of the configured executable failed with ENOENT.
     * - request_timeout: a request's deadline fired before its response arrived.
     * - shutting_down: the client was shut down while the request was pending.
     * - connection_lost: the child exited while the request was pending.
     * - reconnect_failed: the reconnect budget is exhausted; reinitialize to retry.
     * - remote_error: the server answered with a JSON-RPC error object.
     * - protocol_error: an unexpected or malformed exchange.
     * - write_failed: the child's stdin rejected the frame (EPIPE and friends).
     */
    enum class rpc_errc : uint8_t {
        not_running,
        not_connected,
        spawn_failed,
        executable_not_found,
        request_timeout,
        shutting_down,
        connection_lost,
        reconnect_failed,
        remote_error,
        protocol_error,
        write_failed,
    };

    inline constexpr std::string_view to_string(rpc_errc code) {
        switch (code) {
            case rpc_errc::not_running:
                return "not_running"sv;
            case rpc_errc::not_connected:
                return "not_connected"sv;
            case rpc_errc::spawn_failed:
                return "spawn_failed"sv;
            case rpc_errc::executable_not_found:
                return "executable_not_found"sv;
            case rpc_errc::request_timeout:
                return "request_timeout"sv;
            case rpc_errc::shutting_down:
                return "shutting_down"sv;
            case rpc_errc::connection_lost:
                return "connection_lost"sv;
            case rpc_errc::reconnect_failed:
                return "reconnect_failed"sv;
            case rpc_errc::remote_error:
                return "remote_error"sv;
            case rpc_errc::protocol_error:
                return "protocol_error"sv;
            case rpc_errc::write_failed:
                return "write_failed"sv;
        }
        return "protocol_error"sv;
    }

    class rpc_error : public std::runtime_error {
      public:
        rpc_error(rpc_errc code, const std::string& message, std::optional<int> remote_code = std::nullopt)
                : std::runtime_error{message}, code_{code}, remote_code_{remote_code} {}

        rpc_errc code() const noexcept { return code_; }

        // JSON-RPC error code when code() == remote_error
        std::optional<int> remote_code() const noexcept { return remote_code_; }

      private:
        rpc_errc code_;
        std::optional<int> remote_code_;
    };

    enum class error_kind : uint8_t {
        connection,
        tool_call,
        timeout,
        protocol,
        loop_detected,
        session_busy,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::connection:
                return "connection"sv;
            case error_kind::tool_call:
                return "tool_call"sv;
            case error_kind::timeout:
                return "timeout"sv;
            case error_kind::protocol:
                return "protocol"sv;
            case error_kind::loop_detected:
                return "loop_detected"sv;
            case error_kind::session_busy:
                return "session_busy"sv;
        }
        return "tool_call"sv;
    }

    // Immutable description of a terminal failure, ready to show to a user
    struct error_info {
        error_kind kind{error_kind::tool_call};
        std::string message{};
        std::string detail{};
        bool retryable{true};
        std::string suggestion{};
        std::chrono::system_clock::time_point timestamp{};
    };

    error_info classify(rpc_errc code, std::string_view message);
    error_info classify(std::string_view message);
    error_info classify(const std::exception& e);
    error_info classify(std::exception_ptr eptr);

    error_info make_loop_detected_error(std::string_view command, std::size_t count);
    error_info make_session_busy_error(std::string_view session_id, std::string_view pending_command);

    std::string user_friendly_message(std::optional<rpc_errc> code, std::string_view message);

    // {"success":false,"error":...,"errorType":...,"retryable":...,"suggestion":...,"detail":...,"timestamp":...}
    std::string to_error_report_json(const error_info& info);

}  // namespace tether
