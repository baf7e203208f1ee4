#include "tether/config.hpp"

#include "tether/format.hpp"

#include <cstdlib>
#include <stdexcept>

using namespace tether::literals;

namespace tether {

    namespace detail {

        static std::optional<std::chrono::milliseconds> parse_ms(std::string_view text) {
            if (auto value = utils::parse_arithmetic<long long>(utils::trim_view(text))) {
                if (*value >= 0) {
                    return std::chrono::milliseconds{*value};
                }
            }
            return std::nullopt;
        }

        static std::optional<bool> parse_flag(std::string_view text) {
            auto trimmed = utils::trim_view(text);
            if (utils::str_case_eq(trimmed, "true"sv) || trimmed == "1"sv || utils::str_case_eq(trimmed, "yes"sv)) {
                return true;
            }
            if (utils::str_case_eq(trimmed, "false"sv) || trimmed == "0"sv || utils::str_case_eq(trimmed, "no"sv)) {
                return false;
            }
            return std::nullopt;
        }

        static void warn_ignored(std::string_view name, std::string_view value) {
            log_warn("ignoring ", name, "=", value, " (not a valid value)");
        }

        template <typename T, typename Parser, typename Apply>
        static void apply_var(const env_lookup& lookup, std::string_view name, Parser&& parse, Apply&& apply) {
            auto raw = lookup(name);
            if (!raw) {
                return;
            }
            if (auto parsed = parse(*raw)) {
                apply(static_cast<T>(*parsed));
                return;
            }
            warn_ignored(name, *raw);
        }

    }  // namespace detail

    env_lookup process_environment() {
        return [](std::string_view name) -> std::optional<std::string> {
            std::string key{name};
            if (const char* value = std::getenv(key.c_str())) {
                return std::string{value};
            }
            return std::nullopt;
        };
    }

    void apply_environment(transport_config& transport, execution_config& execution, const env_lookup& lookup) {
        if (auto path = lookup("TETHER_SERVER_PATH"sv); path && !utils::trim_view(*path).empty()) {
            transport.executable = std::string{utils::trim_view(*path)};
        }
        if (auto container = lookup("TETHER_CONTAINER_NAME"sv); container && !utils::trim_view(*container).empty()) {
            transport.container = std::string{utils::trim_view(*container)};
        }

        detail::apply_var<std::chrono::milliseconds>(
                lookup, "TETHER_SERVER_TIMEOUT"sv, detail::parse_ms, [&](auto v) { transport.request_timeout = v; });
        detail::apply_var<int>(
                lookup,
                "TETHER_RECONNECT_ATTEMPTS"sv,
                [](std::string_view s) { return utils::parse_arithmetic<int>(utils::trim_view(s)); },
                [&](int v) { transport.reconnect_attempts = v; });
        detail::apply_var<std::chrono::milliseconds>(
                lookup, "TETHER_RECONNECT_DELAY"sv, detail::parse_ms, [&](auto v) { transport.reconnect_delay = v; });
        detail::apply_var<std::chrono::milliseconds>(
                lookup, "TETHER_HEALTH_CHECK_INTERVAL"sv, detail::parse_ms, [&](auto v) {
                    transport.health_interval = v;
                });
        detail::apply_var<bool>(lookup, "TETHER_HEALTH_CHECK_ENABLED"sv, detail::parse_flag, [&](bool v) {
            transport.health_check_enabled = v;
        });
        detail::apply_var<int>(
                lookup,
                "TETHER_MAX_RETRIES"sv,
                [](std::string_view s) { return utils::parse_arithmetic<int>(utils::trim_view(s)); },
                [&](int v) { execution.max_retries = v; });
        detail::apply_var<std::chrono::milliseconds>(
                lookup, "TETHER_RETRY_DELAY"sv, detail::parse_ms, [&](auto v) { execution.retry_delay = v; });
    }

    void validate(const transport_config& cfg) {
        std::vector<std::string> errors{};

        if (utils::trim_view(cfg.executable).empty()) {
            errors.emplace_back("MCP server executable is required");
        }
        if (cfg.request_timeout < std::chrono::milliseconds{1'000}) {
            errors.emplace_back("request timeout must be at least 1000ms (got {})"_format(cfg.request_timeout.count()));
        }
        if (cfg.reconnect_attempts < 0) {
            errors.emplace_back("reconnect attempts must be non-negative (got {})"_format(cfg.reconnect_attempts));
        }
        if (cfg.health_interval.count() <= 0) {
            errors.emplace_back("health interval must be positive");
        }
        if (cfg.spawn_grace.count() < 0) {
            errors.emplace_back("spawn grace window must be non-negative");
        }
        if (cfg.reconnect_delay_cap < cfg.reconnect_delay) {
            errors.emplace_back("reconnect delay cap must not be below the base reconnect delay");
        }
        if (cfg.container && utils::trim_view(cfg.container_tool).empty()) {
            errors.emplace_back("container launches require a container tool");
        }

        if (!errors.empty()) {
            throw std::invalid_argument(
                    "configuration validation failed:\n{}"_format(utils::join_with_separator(errors, "\n"sv)));
        }
    }

    void validate(const execution_config& cfg) {
        std::vector<std::string> errors{};

        if (cfg.max_retries <= 0) {
            errors.emplace_back("max retries must be positive (got {})"_format(cfg.max_retries));
        }
        if (cfg.attempt_timeout.count() <= 0) {
            errors.emplace_back("attempt timeout must be positive");
        }
        if (cfg.retry_delay.count() < 0) {
            errors.emplace_back("retry delay must be non-negative");
        }
        if (cfg.history_limit == 0U) {
            errors.emplace_back("history limit must be positive");
        }
        if (cfg.tool_name.empty()) {
            errors.emplace_back("execution tool name is required");
        }

        if (!errors.empty()) {
            throw std::invalid_argument(
                    "configuration validation failed:\n{}"_format(utils::join_with_separator(errors, "\n"sv)));
        }
    }

    std::optional<std::pair<std::string, std::string>> parse_env_assignment(std::string_view assignment) {
        auto eq = assignment.find('=');
        if (eq == std::string_view::npos) {
            return std::nullopt;
        }
        auto key = utils::trim_view(assignment.substr(0, eq));
        if (key.empty()) {
            return std::nullopt;
        }
        return std::pair{std::string{key}, std::string{assignment.substr(eq + 1U)}};
    }

}  // namespace tether
