#pragma once

#include "utils.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether {

    using namespace std::string_view_literals;

    /*
     * Tether Configuration
     *
     * Transport (process supervision)
     * - executable: MCP server executable (or interpreter, e.g. "node") to launch.
     * - arguments: Arguments passed to the executable.
     * - container: When set, launch through `<container_tool> exec -i -u <exec_user> ... <container>`.
     * - container_tool: Host tool used for container launches.
     * - exec_user: User the server runs as inside the container.
     * - environment: Environment overrides; exported to the child or passed as `-e K=V`.
     * - request_timeout: Default deadline for a single JSON-RPC request; also bounds a
     *   write to a server that has stopped reading its stdin.
     * - spawn_grace: Window the child must survive before it is considered started.
     * - reconnect_attempts: Consecutive reconnect attempts before giving up.
     * - reconnect_delay: Base reconnect delay; attempt n waits base * 2^(n-1).
     * - reconnect_delay_cap: Upper bound applied to the exponential reconnect delay.
     * - health_interval: Liveness polling period.
     * - health_check_enabled: Run the periodic health monitor.
     * - health_probe_rpc: Also probe with `tools/list` on each health tick.
     * - max_line_bytes: Longest unterminated line buffered from the child.
     * - client_name / client_version: Identity sent in the `initialize` request.
     * - protocol_version: MCP protocol revision requested during the handshake.
     *
     * Execution (per-session command management)
     * - max_retries: Attempts per execute() call.
     * - attempt_timeout: Deadline raced against each attempt.
     * - retry_delay: Fixed wait between attempts.
     * - max_same_command_repeats: Identical commands allowed in a session's history before loop detection.
     * - history_limit: Commands retained per session.
     * - tool_name: Tool invoked through `tools/call` to run a command.
     */

    enum class output_mode { text, json };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::text:
                return "text"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "text"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "text"sv)) {
            out = output_mode::text;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(log_level level) {
        switch (level) {
            case log_level::quiet:
                return "quiet"sv;
            case log_level::normal:
                return "normal"sv;
            case log_level::verbose:
                return "verbose"sv;
        }
        return "normal"sv;
    }

    inline constexpr bool try_parse_log_level(std::string_view text, log_level& out) {
        if (utils::str_case_eq(text, "quiet"sv) || utils::str_case_eq(text, "error"sv)) {
            out = log_level::quiet;
            return true;
        }
        if (utils::str_case_eq(text, "normal"sv) || utils::str_case_eq(text, "info"sv)) {
            out = log_level::normal;
            return true;
        }
        if (utils::str_case_eq(text, "verbose"sv) || utils::str_case_eq(text, "debug"sv)) {
            out = log_level::verbose;
            return true;
        }
        return false;
    }

    struct transport_config {
        std::string executable{};
        std::vector<std::string> arguments{};
        std::optional<std::string> container{};
        std::string container_tool{"docker"};
        std::string exec_user{"pentester"};
        std::map<std::string, std::string> environment{};

        std::chrono::milliseconds request_timeout{30'000};
        std::chrono::milliseconds spawn_grace{1'000};
        int reconnect_attempts{5};
        std::chrono::milliseconds reconnect_delay{1'000};
        std::chrono::milliseconds reconnect_delay_cap{30'000};
        std::chrono::milliseconds health_interval{10'000};
        bool health_check_enabled{true};
        bool health_probe_rpc{false};
        std::size_t max_line_bytes{16U << 20U};

        std::string client_name{"tether"};
        std::string client_version{"0.1.0"};
        std::string protocol_version{"2024-11-05"};
    };

    struct execution_config {
        int max_retries{3};
        std::chrono::milliseconds attempt_timeout{30'000};
        std::chrono::milliseconds retry_delay{2'000};
        std::size_t max_same_command_repeats{5U};
        std::size_t history_limit{50U};
        std::string tool_name{"write_command"};
    };

    // Resolved command-line state for the `tether` binary
    struct startup_config {
        transport_config transport{};
        execution_config execution{};

        output_mode output{output_mode::text};
        bool print_config{false};
        bool quiet{false};
        bool verbose{false};

        bool list_tools{false};
        std::optional<std::string> call_tool{};
        std::string call_arguments{"{}"};
        std::optional<std::string> exec_command{};
        std::string session_id{"default"};
    };

    // Returns the value of an environment variable, or nullopt when unset
    using env_lookup = std::function<std::optional<std::string>(std::string_view)>;

    env_lookup process_environment();

    // Applies TETHER_* overrides; unparsable values are skipped with a warning
    void apply_environment(transport_config& transport, execution_config& execution, const env_lookup& lookup);

    // Throws std::invalid_argument listing every violated constraint
    void validate(const transport_config& cfg);
    void validate(const execution_config& cfg);

    // Parses "KEY=VALUE"; nullopt when there is no '=' or the key is empty
    std::optional<std::pair<std::string, std::string>> parse_env_assignment(std::string_view assignment);

}  // namespace tether
