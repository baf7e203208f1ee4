#include "tether/errors.hpp"

#include "tether/format.hpp"

#include <glaze/glaze.hpp>

#include <array>

using namespace tether::literals;

namespace tether {

    namespace detail {

        static constexpr std::array connection_markers{
                "connection refused"sv,
                "econnrefused"sv,
                "connection reset"sv,
                "econnreset"sv,
                "broken pipe"sv,
        };

        static constexpr std::array timeout_markers{"timeout"sv, "timed out"sv};

        static constexpr std::array missing_markers{"not found"sv, "unknown tool"sv, "invalid"sv};

        template <size_t N>
        static bool contains_any(std::string_view text, const std::array<std::string_view, N>& markers) {
            for (auto marker : markers) {
                if (utils::contains_icase(text, marker)) {
                    return true;
                }
            }
            return false;
        }

        static bool is_connection_code(rpc_errc code) {
            switch (code) {
                case rpc_errc::not_running:
                case rpc_errc::not_connected:
                case rpc_errc::connection_lost:
                case rpc_errc::reconnect_failed:
                case rpc_errc::write_failed:
                    return true;
                default:
                    return false;
            }
        }

        static error_info make_info(
                error_kind kind, bool retryable, std::string message, std::string_view detail, std::string suggestion) {
            return error_info{
                    .kind = kind,
                    .message = std::move(message),
                    .detail = std::string{detail},
                    .retryable = retryable,
                    .suggestion = std::move(suggestion),
                    .timestamp = std::chrono::system_clock::now()};
        }

        static error_info classify_impl(std::optional<rpc_errc> code, std::string_view message) {
            auto friendly = user_friendly_message(code, message);

            if (code == rpc_errc::executable_not_found) {
                return make_info(
                        error_kind::connection,
                        true,
                        std::move(friendly),
                        message,
                        "Check that the MCP server executable exists and the transport configuration points at it.");
            }
            if (code == rpc_errc::spawn_failed) {
                return make_info(
                        error_kind::connection,
                        true,
                        std::move(friendly),
                        message,
                        "Check the server executable, its arguments, the container name and file permissions.");
            }
            if (code == rpc_errc::shutting_down) {
                return make_info(
                        error_kind::connection,
                        false,
                        std::move(friendly),
                        message,
                        "The client is shutting down. Start it again before issuing new calls.");
            }
            if (code == rpc_errc::reconnect_failed) {
                return make_info(
                        error_kind::connection,
                        true,
                        std::move(friendly),
                        message,
                        "Reconnection attempts are exhausted. Reinitialize the client once the server is reachable.");
            }
            if ((code && is_connection_code(*code)) || contains_any(message, connection_markers)) {
                return make_info(
                        error_kind::connection,
                        true,
                        std::move(friendly),
                        message,
                        "Ensure the MCP server process or its container is running. The client reconnects "
                        "automatically.");
            }
            if (code == rpc_errc::request_timeout || contains_any(message, timeout_markers)) {
                return make_info(
                        error_kind::timeout,
                        true,
                        std::move(friendly),
                        message,
                        "The operation took too long. Try again, use a simpler command, or increase the timeout.");
            }
            if (code == rpc_errc::protocol_error || utils::contains_icase(message, "protocol"sv)) {
                return make_info(
                        error_kind::protocol,
                        false,
                        std::move(friendly),
                        message,
                        "There was an error in the MCP protocol communication. This may indicate a bug.");
            }
            if (contains_any(message, missing_markers)) {
                auto suggestion = utils::contains_icase(message, "invalid"sv)
                                        ? std::string{"Check the arguments passed to the tool."}
                                        : std::string{"The requested tool is not available. Check the MCP server "
                                                      "configuration."};
                return make_info(error_kind::tool_call, false, std::move(friendly), message, std::move(suggestion));
            }
            return make_info(
                    error_kind::tool_call,
                    true,
                    std::move(friendly),
                    message,
                    "The tool execution failed. Check the command and try again.");
        }

        static std::string format_timestamp(std::chrono::system_clock::time_point tp) {
            return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::milliseconds>(tp));
        }

        struct error_report {
            bool success{false};
            std::string error{};
            std::string errorType{};
            bool retryable{};
            std::string suggestion{};
            std::string detail{};
            std::string timestamp{};
            struct glaze {
                using T = error_report;
                static constexpr auto value = glz::object(
                        &T::success,
                        &T::error,
                        "errorType",
                        &T::errorType,
                        &T::retryable,
                        &T::suggestion,
                        &T::detail,
                        &T::timestamp);
            };
        };

    }  // namespace detail

    std::string user_friendly_message(std::optional<rpc_errc> code, std::string_view message) {
        if (code == rpc_errc::executable_not_found) {
            return "MCP server not found. Please check the installation.";
        }
        if (code == rpc_errc::spawn_failed) {
            return "MCP server failed to start.";
        }
        if (code == rpc_errc::shutting_down) {
            return "The command execution system is shutting down.";
        }
        if (code == rpc_errc::reconnect_failed) {
            return "The command execution system is unavailable. Please try again later.";
        }
        if ((code && detail::is_connection_code(*code)) || detail::contains_any(message, detail::connection_markers)) {
            return "Cannot connect to the MCP server. Please ensure it is running.";
        }
        if (code == rpc_errc::request_timeout || detail::contains_any(message, detail::timeout_markers)) {
            return "Operation timed out. Please try again.";
        }
        if (code == rpc_errc::protocol_error || utils::contains_icase(message, "protocol"sv)) {
            return "Protocol communication error.";
        }
        if (utils::contains_icase(message, "not found"sv) || utils::contains_icase(message, "unknown tool"sv)) {
            return "The requested tool or command was not found.";
        }
        if (utils::contains_icase(message, "invalid"sv)) {
            return "Invalid request. Please check your input.";
        }
        return "An error occurred while executing the command. Please try again.";
    }

    error_info classify(rpc_errc code, std::string_view message) {
        return detail::classify_impl(code, message);
    }

    error_info classify(std::string_view message) {
        return detail::classify_impl(std::nullopt, message);
    }

    error_info classify(const std::exception& e) {
        if (auto* rpc = dynamic_cast<const rpc_error*>(&e)) {
            return classify(rpc->code(), rpc->what());
        }
        return classify(std::string_view{e.what()});
    }

    error_info classify(std::exception_ptr eptr) {
        if (!eptr) {
            return classify("unknown error"sv);
        }
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            return classify(e);
        } catch (...) {
            return classify("unknown error"sv);
        }
    }

    error_info make_loop_detected_error(std::string_view command, std::size_t count) {
        return detail::make_info(
                error_kind::loop_detected,
                false,
                "Command loop detected: \"{}\" has been executed {} times. Please try a different approach."_format(
                        command, count),
                "loop detected after {} identical commands"_format(count),
                "Stop repeating the same command; inspect its output and change the approach.");
    }

    error_info make_session_busy_error(std::string_view session_id, std::string_view pending_command) {
        return detail::make_info(
                error_kind::session_busy,
                true,
                "Session '{}' is already executing a command."_format(session_id),
                "pending command: {}"_format(pending_command),
                "Wait for the current command to finish before issuing another one for this session.");
    }

    std::string to_error_report_json(const error_info& info) {
        detail::error_report report{
                .error = info.message,
                .errorType = "{}"_format(info.kind),
                .retryable = info.retryable,
                .suggestion = info.suggestion,
                .detail = info.detail,
                .timestamp = detail::format_timestamp(info.timestamp)};
        std::string json{};
        if (auto ec = glz::write_json(report, json)) {
            throw std::runtime_error("failed to serialize error report");
        }
        return json;
    }

}  // namespace tether
