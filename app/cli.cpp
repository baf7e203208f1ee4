#include "cli.hpp"

#include <CLI/CLI.hpp>

#include <glaze/glaze.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace tether::literals;

namespace tether::cli {

    namespace detail {

        using namespace std::string_view_literals;

        static void print_config(const startup_config& cfg, std::ostream& os) {
            const auto& t = cfg.transport;
            const auto& e = cfg.execution;
            os << "executable=" << (t.executable.empty() ? "<unset>" : t.executable) << '\n';
            os << "arguments=" << utils::join_with_separator(t.arguments, " "sv) << '\n';
            os << "container=" << (t.container ? *t.container : "<none>") << '\n';
            os << "container_tool=" << t.container_tool << '\n';
            os << "exec_user=" << t.exec_user << '\n';
            for (const auto& [key, value] : t.environment) {
                os << "env." << key << '=' << value << '\n';
            }
            os << "request_timeout=" << format_ms(t.request_timeout) << '\n';
            os << "spawn_grace=" << format_ms(t.spawn_grace) << '\n';
            os << "reconnect_attempts=" << t.reconnect_attempts << '\n';
            os << "reconnect_delay=" << format_ms(t.reconnect_delay) << '\n';
            os << "reconnect_delay_cap=" << format_ms(t.reconnect_delay_cap) << '\n';
            os << "health_interval=" << format_ms(t.health_interval) << '\n';
            os << "health_check=" << (t.health_check_enabled ? "on" : "off") << '\n';
            os << "health_probe_rpc=" << (t.health_probe_rpc ? "on" : "off") << '\n';
            os << "max_retries=" << e.max_retries << '\n';
            os << "attempt_timeout=" << format_ms(e.attempt_timeout) << '\n';
            os << "retry_delay=" << format_ms(e.retry_delay) << '\n';
            os << "tool=" << e.tool_name << '\n';
            os << "session=" << cfg.session_id << '\n';
            os << "output={}\n"_format(cfg.output);
        }

        static void print_error(const startup_config& cfg, const error_info& info) {
            if (cfg.output == output_mode::json) {
                std::cout << to_error_report_json(info) << '\n';
                return;
            }
            std::cerr << "error: " << info.message << '\n';
            if (!info.detail.empty() && info.detail != info.message) {
                std::cerr << "  detail: " << info.detail << '\n';
            }
            std::cerr << "  suggestion: " << info.suggestion << '\n';
        }

        static int print_result(const startup_config& cfg, const exec::execution_result& result) {
            if (cfg.output == output_mode::json) {
                std::cout << exec::to_json(result) << '\n';
            }
            else if (result.success) {
                std::cout << result.output;
                if (!result.output.empty() && !result.output.ends_with('\n')) {
                    std::cout << '\n';
                }
            }
            else if (result.error) {
                print_error(cfg, *result.error);
            }
            return result.success && result.exit_code == 0 ? 0 : 1;
        }

        static int print_tools(const startup_config& cfg, mcp_client& client) {
            auto tools = client.list_tools();
            if (cfg.output == output_mode::json) {
                std::string json{};
                if (auto ec = glz::write_json(tools, json)) {
                    throw std::runtime_error("failed to serialize tool list");
                }
                std::cout << json << '\n';
                return 0;
            }
            for (const auto& tool : tools) {
                std::cout << tool.name;
                if (!tool.description.empty()) {
                    std::cout << " - " << tool.description;
                }
                std::cout << '\n';
            }
            return 0;
        }

        static int call_tool(const startup_config& cfg, mcp_client& client) {
            auto result = client.call_tool(*cfg.call_tool, cfg.call_arguments);
            if (cfg.output == output_mode::json) {
                std::string json{};
                if (auto ec = glz::write_json(result, json)) {
                    throw std::runtime_error("failed to serialize tool result");
                }
                std::cout << json << '\n';
            }
            else {
                std::cout << result.text() << '\n';
            }
            return result.isError ? 1 : 0;
        }

        static void print_status(const mcp_client& client, std::ostream& os) {
            auto st = client.status();
            os << "connected=" << (st.connected ? "yes" : "no") << '\n';
            os << "server_running=" << (st.running ? "yes" : "no") << '\n';
            os << "pid=" << (st.pid ? std::to_string(*st.pid) : std::string{"-"}) << '\n';
            os << "reconnect_count=" << st.reconnect_count << '\n';
            os << "reconnect_failed=" << (st.reconnect_failed ? "yes" : "no") << '\n';
            os << "pending_requests=" << st.pending_requests << '\n';
            if (st.server) {
                os << "server=" << st.server->name << ' ' << st.server->version << '\n';
            }
        }

        static void print_help(std::ostream& os) {
            os << "commands:\n";
            os << "  <command>      run through the session's execution manager\n";
            os << "  :history\n";
            os << "  :clear\n";
            os << "  :status\n";
            os << "  :tools\n";
            os << "  :help\n";
            os << "  :quit\n";
        }

        static bool process_command(
                std::string_view line,
                const startup_config& cfg,
                mcp_client& client,
                exec::execution_manager& manager,
                bool& should_quit) {
            auto cmd = utils::trim_view(line);
            if (cmd == ":quit"sv || cmd == ":q"sv) {
                should_quit = true;
                return true;
            }
            if (cmd == ":help"sv) {
                print_help(std::cout);
                return true;
            }
            if (cmd == ":history"sv) {
                auto entries = manager.history(cfg.session_id);
                for (size_t i = 0; i < entries.size(); ++i) {
                    std::cout << (i + 1U) << "  " << entries[i] << '\n';
                }
                return true;
            }
            if (cmd == ":clear"sv) {
                manager.clear_session(cfg.session_id);
                std::cout << "session " << cfg.session_id << " cleared\n";
                return true;
            }
            if (cmd == ":status"sv) {
                print_status(client, std::cout);
                return true;
            }
            if (cmd == ":tools"sv) {
                try {
                    print_tools(cfg, client);
                } catch (const std::exception& e) {
                    print_error(cfg, classify(e));
                }
                return true;
            }
            if (cmd.starts_with(":"sv)) {
                std::cerr << "unknown command: " << cmd << '\n';
                return true;
            }
            return false;
        }

        static std::optional<std::string> normalize_optional(std::string value) {
            auto trimmed = utils::trim_view(value);
            if (trimmed.empty()) {
                return std::nullopt;
            }
            return std::string(trimmed);
        }

        static void log_connection_event(const connection_event& ev) {
            std::visit(
                    [](const auto& e) {
                        using E = std::decay_t<decltype(e)>;
                        if constexpr (std::is_same_v<E, notification_event>) {
                            log_info("notification ", e.method, ' ', e.params);
                        }
                        else if constexpr (std::is_same_v<E, unhealthy_event>) {
                            log_warn("server unhealthy: ", e.reason);
                        }
                    },
                    ev);
        }

    }  // namespace detail

    void run_repl(startup_config& cfg, mcp_client& client, exec::execution_manager& manager) {
        std::string line{};
        bool should_quit = false;

        std::cout << "tether: session " << cfg.session_id << '\n';
        std::cout << "type :help for commands\n";

        while (!should_quit) {
            std::cout << "tether> " << std::flush;
            if (!std::getline(std::cin, line)) {
                std::cout << '\n';
                break;
            }

            if (utils::trim_view(line).empty()) {
                continue;
            }

            if (detail::process_command(line, cfg, client, manager, should_quit)) {
                continue;
            }

            auto result = manager.execute(cfg.session_id, utils::trim_view(line));
            detail::print_result(cfg, result);
        }
    }

    int run(startup_config& cfg) {
        mcp_client client{cfg.transport};
        client.events().subscribe(detail::log_connection_event);

        try {
            client.start();
        } catch (const std::exception& e) {
            detail::print_error(cfg, classify(e));
            return 1;
        }

        exec::in_memory_session_store store{};
        exec::execution_manager manager{client, store, cfg.execution};

        int rc = 0;
        try {
            if (cfg.list_tools) {
                rc = detail::print_tools(cfg, client);
            }
            else if (cfg.call_tool) {
                rc = detail::call_tool(cfg, client);
            }
            else if (cfg.exec_command) {
                rc = detail::print_result(cfg, manager.execute(cfg.session_id, *cfg.exec_command));
            }
            else {
                run_repl(cfg, client, manager);
            }
        } catch (const std::exception& e) {
            detail::print_error(cfg, classify(e));
            rc = 1;
        }

        client.shutdown();
        return rc;
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"tether - resilient MCP stdio client"};

        apply_environment(cfg.transport, cfg.execution, process_environment());

        bool show_version = false;
        bool json_output = false;
        bool no_health_check = false;
        std::string output_arg{std::string{to_string(cfg.output)}};
        std::string server_arg{cfg.transport.executable};
        std::string container_arg{cfg.transport.container.value_or("")};
        std::string call_arg{};
        std::string exec_arg{};
        std::vector<std::string> env_args{};
        std::vector<std::string> command_args{};

        int64_t timeout_ms = cfg.transport.request_timeout.count();
        int64_t spawn_grace_ms = cfg.transport.spawn_grace.count();
        int64_t reconnect_delay_ms = cfg.transport.reconnect_delay.count();
        int64_t reconnect_cap_ms = cfg.transport.reconnect_delay_cap.count();
        int64_t health_interval_ms = cfg.transport.health_interval.count();
        int64_t attempt_timeout_ms = cfg.execution.attempt_timeout.count();
        int64_t retry_delay_ms = cfg.execution.retry_delay.count();

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--server", server_arg, "MCP server executable");
        app.add_option("command", command_args, "Server executable and arguments (after --)");
        app.add_option("--container", container_arg, "Launch the server inside this container");
        app.add_option("--container-tool", cfg.transport.container_tool, "Container host tool");
        app.add_option("--user", cfg.transport.exec_user, "User the server runs as inside the container");
        app.add_option("--env", env_args, "Environment override KEY=VALUE (repeatable)");
        app.add_option("--timeout", timeout_ms, "Request timeout in milliseconds");
        app.add_option("--spawn-grace", spawn_grace_ms, "Startup grace window in milliseconds");
        app.add_option("--reconnect-attempts", cfg.transport.reconnect_attempts, "Reconnect attempts before giving up");
        app.add_option("--reconnect-delay", reconnect_delay_ms, "Base reconnect delay in milliseconds");
        app.add_option("--reconnect-cap", reconnect_cap_ms, "Upper bound on the reconnect delay in milliseconds");
        app.add_option("--health-interval", health_interval_ms, "Health check interval in milliseconds");
        app.add_flag("--no-health-check", no_health_check, "Disable the periodic health monitor");
        app.add_flag("--health-probe", cfg.transport.health_probe_rpc, "Probe with tools/list on each health tick");
        app.add_option("--max-retries", cfg.execution.max_retries, "Attempts per executed command");
        app.add_option("--attempt-timeout", attempt_timeout_ms, "Per-attempt timeout in milliseconds");
        app.add_option("--retry-delay", retry_delay_ms, "Delay between attempts in milliseconds");
        app.add_option("--tool", cfg.execution.tool_name, "Tool used to execute commands");
        app.add_flag("--list-tools", cfg.list_tools, "List the server's tools and exit");
        app.add_option("--call", call_arg, "Call one tool and exit");
        app.add_option("--args", cfg.call_arguments, "JSON arguments for --call");
        app.add_option("--exec", exec_arg, "Execute one command through the execution manager and exit");
        app.add_option("--session", cfg.session_id, "Session id for executed commands");
        app.add_option("--output", output_arg, "Output mode: text|json");
        app.add_flag("--json", json_output, "Shorthand for --output json");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress warnings");
        app.add_flag("--verbose", cfg.verbose, "Enable informational logging");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }
        set_log_level(cfg.quiet ? log_level::quiet : (cfg.verbose ? log_level::verbose : log_level::normal));

        if (!try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected text|json)\n";
            return std::optional<int>{2};
        }
        if (json_output) {
            cfg.output = output_mode::json;
        }

        for (const auto& assignment : env_args) {
            auto kv = parse_env_assignment(assignment);
            if (!kv) {
                std::cerr << "invalid --env value: " << assignment << " (expected KEY=VALUE)\n";
                return std::optional<int>{2};
            }
            cfg.transport.environment[kv->first] = kv->second;
        }

        if (auto server = detail::normalize_optional(server_arg)) {
            cfg.transport.executable = *server;
            cfg.transport.arguments = command_args;
        }
        else if (!command_args.empty()) {
            cfg.transport.executable = command_args.front();
            cfg.transport.arguments.assign(command_args.begin() + 1, command_args.end());
        }
        cfg.transport.container = detail::normalize_optional(container_arg);
        cfg.transport.health_check_enabled = cfg.transport.health_check_enabled && !no_health_check;

        cfg.transport.request_timeout = std::chrono::milliseconds{timeout_ms};
        cfg.transport.spawn_grace = std::chrono::milliseconds{spawn_grace_ms};
        cfg.transport.reconnect_delay = std::chrono::milliseconds{reconnect_delay_ms};
        cfg.transport.reconnect_delay_cap = std::chrono::milliseconds{reconnect_cap_ms};
        cfg.transport.health_interval = std::chrono::milliseconds{health_interval_ms};
        cfg.execution.attempt_timeout = std::chrono::milliseconds{attempt_timeout_ms};
        cfg.execution.retry_delay = std::chrono::milliseconds{retry_delay_ms};

        cfg.call_tool = detail::normalize_optional(call_arg);
        cfg.exec_command = detail::normalize_optional(exec_arg);

        if (show_version) {
            std::cout << "tether 0.1.0\n";
            return std::optional<int>{0};
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        int modes = (cfg.list_tools ? 1 : 0) + (cfg.call_tool ? 1 : 0) + (cfg.exec_command ? 1 : 0);
        if (modes > 1) {
            std::cerr << "--list-tools, --call and --exec are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (cfg.call_tool) {
            if (auto ec = glz::validate_json(cfg.call_arguments)) {
                std::cerr << "invalid --args JSON: " << glz::format_error(ec, cfg.call_arguments) << '\n';
                return std::optional<int>{2};
            }
        }

        try {
            validate(cfg.transport);
            validate(cfg.execution);
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << '\n';
            return std::optional<int>{2};
        }

        return std::nullopt;
    }

}  // namespace tether::cli
