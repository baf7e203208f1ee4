#include "utils.hpp"

namespace tether::test {

    TEST_CASE("010: two timeouts then success waits the default retry delay", "[010][execution][retry]") {
        auto saved = get_log_level();
        set_log_level(log_level::quiet);

        detail::scripted_channel channel{[](size_t index, auto&) {
            if (index < 2U) {
                return detail::failed_result(rpc_errc::request_timeout, "request timed out after 30000ms");
            }
            return detail::ready_result(detail::text_result("PORT   STATE SERVICE\n22/tcp open  ssh"));
        }};
        exec::in_memory_session_store store{};
        exec::execution_manager manager{channel, store};
        REQUIRE(manager.config().retry_delay == 2s);

        detail::recorder<execution_event> events{};
        manager.events().subscribe([&](const execution_event& ev) { events(ev); });

        auto result = manager.execute("engagement-1", "nmap -p22 10.0.0.5");
        set_log_level(saved);

        CHECK(result.success);
        CHECK(result.exit_code == 0);
        CHECK(result.attempts == 3);
        CHECK(result.output == "PORT   STATE SERVICE\n22/tcp open  ssh");
        CHECK(result.duration >= 4000ms);

        auto calls = channel.calls();
        REQUIRE(calls.size() == 3U);
        CHECK(calls[1].at - calls[0].at >= 2000ms);
        CHECK(calls[2].at - calls[1].at >= 2000ms);

        CHECK(events.count<timeout_event>() == 2U);
        CHECK(events.count<retry_event>() == 2U);
        CHECK(events.count<progress_event>() == 3U);
        for (const auto& retry : events.all<retry_event>()) {
            CHECK(retry.delay == 2s);
            CHECK(retry.max_attempts == 3);
        }
    }

    TEST_CASE("010: loop detection counts commands across completed executions", "[010][execution][loop]") {
        auto saved = get_log_level();
        set_log_level(log_level::quiet);

        detail::scripted_channel channel{[](size_t index, auto&) {
            // every other command fails at the tool level; it still counts
            return detail::ready_result(detail::text_result("out", index % 2U == 1U));
        }};
        exec::in_memory_session_store store{};
        execution_config cfg{};
        cfg.max_same_command_repeats = 3U;
        exec::execution_manager manager{channel, store, cfg};

        std::vector<exec::execution_result> results{};
        for (int i = 0; i < 4; ++i) {
            results.push_back(manager.execute("s1", "ls -la"));
        }
        set_log_level(saved);

        CHECK(results[0].exit_code == 0);
        CHECK(results[1].exit_code == 1);
        CHECK(results[2].exit_code == 0);
        REQUIRE(results[3].error);
        CHECK(results[3].error->kind == error_kind::loop_detected);
        CHECK(results[3].loop_count == std::optional<size_t>{3U});
        CHECK(channel.call_count() == 3U);
    }

    TEST_CASE(
            "010: sixty distinct executions leave the fifty most recent in history", "[010][execution][session]") {
        detail::scripted_channel channel{[](size_t index, auto&) {
            return detail::ready_result(detail::text_result("done " + std::to_string(index)));
        }};
        exec::in_memory_session_store store{};
        exec::execution_manager manager{channel, store};

        for (int i = 0; i < 60; ++i) {
            auto result = manager.execute("s1", "echo " + std::to_string(i));
            REQUIRE(result.success);
            REQUIRE(result.exit_code == 0);
        }
        CHECK(channel.call_count() == 60U);

        auto history = manager.history("s1");
        REQUIRE(history.size() == 50U);
        for (size_t i = 0; i < history.size(); ++i) {
            CHECK(history[i] == "echo " + std::to_string(i + 10U));
        }
        CHECK_FALSE(manager.is_pending("s1"));
    }

}  // namespace tether::test
