#include "utils.hpp"

namespace tether::test {

    namespace detail {
        struct correlator_fixture {
            captured_writes writes{};
            timer_queue timers{};
            rpc_correlator correlator{[this](std::string_view frame) { writes(frame); }, timers};
        };

        // (id, method) of every request frame written so far
        inline std::vector<std::pair<int64_t, std::string>> written_requests(captured_writes& writes) {
            std::vector<std::pair<int64_t, std::string>> out{};
            for (const auto& frame : writes.snapshot()) {
                auto msg = mcp::decode_message(frame);
                if (msg && msg->id && msg->method) {
                    out.emplace_back(*msg->id, *msg->method);
                }
            }
            return out;
        }
    }  // namespace detail

    TEST_CASE("004: responses resolve their own request regardless of order", "[004][correlator]") {
        detail::correlator_fixture fx{};

        auto first = fx.correlator.send_request("tools/list", "{}", 5s);
        auto second = fx.correlator.send_request("tools/call", R"({"name":"a"})", 5s);
        auto third = fx.correlator.send_request("tools/call", R"({"name":"b"})", 5s);
        CHECK(fx.correlator.pending_count() == 3U);

        auto requests = detail::written_requests(fx.writes);
        REQUIRE(requests.size() == 3U);
        CHECK(requests[0].first == 1);
        CHECK(requests[1].first == 2);
        CHECK(requests[2].first == 3);

        fx.correlator.feed(detail::response_line(3, R"("three")"));
        fx.correlator.feed(detail::response_line(1, R"("one")"));
        fx.correlator.feed(detail::response_line(2, R"("two")"));

        CHECK(first.get().str == R"("one")");
        CHECK(second.get().str == R"("two")");
        CHECK(third.get().str == R"("three")");
        CHECK(fx.correlator.pending_count() == 0U);
        CHECK(fx.timers.pending() == 0U);
    }

    TEST_CASE("004: concurrent callers each receive their own response", "[004][correlator][concurrency]") {
        detail::correlator_fixture fx{};
        constexpr int callers = 16;

        std::vector<std::future<glz::raw_json>> futures(callers);
        {
            std::vector<std::jthread> threads{};
            for (int i = 0; i < callers; ++i) {
                threads.emplace_back([&, i] {
                    futures[i] = fx.correlator.send_request("m" + std::to_string(i), "{}", 10s);
                });
            }
        }

        auto requests = detail::written_requests(fx.writes);
        REQUIRE(requests.size() == static_cast<size_t>(callers));

        // answer in reverse order, echoing the method name as the result
        std::ranges::reverse(requests);
        for (const auto& [id, method] : requests) {
            fx.correlator.feed(detail::response_line(id, "\"" + method + "\""));
        }

        for (int i = 0; i < callers; ++i) {
            CHECK(futures[i].get().str == "\"m" + std::to_string(i) + "\"");
        }
    }

    TEST_CASE("004: remote errors carry the JSON-RPC code", "[004][correlator]") {
        detail::correlator_fixture fx{};
        auto fut = fx.correlator.send_request("tools/call", "{}", 5s);
        fx.correlator.feed(detail::error_line(1, -32602, "Invalid arguments for write_command"));

        try {
            (void)fut.get();
            FAIL("expected a remote error");
        } catch (const rpc_error& e) {
            CHECK(e.code() == rpc_errc::remote_error);
            REQUIRE(e.remote_code());
            CHECK(*e.remote_code() == -32602);
            CHECK(std::string_view{e.what()} == "Invalid arguments for write_command");
        }
    }

    TEST_CASE("004: responses without a pending request are dropped", "[004][correlator]") {
        detail::correlator_fixture fx{};
        auto fut = fx.correlator.send_request("tools/list", "{}", 5s);

        fx.correlator.feed(detail::response_line(42, R"({"stale":true})"));
        CHECK(fx.correlator.pending_count() == 1U);
        CHECK(fut.wait_for(0ms) == std::future_status::timeout);

        fx.correlator.feed(detail::response_line(1, R"({"tools":[]})"));
        CHECK(fut.get().str == R"({"tools":[]})");
    }

    TEST_CASE("004: a response without a result resolves to null", "[004][correlator]") {
        detail::correlator_fixture fx{};
        auto fut = fx.correlator.send_request("ping", "{}", 5s);
        fx.correlator.feed(R"({"jsonrpc":"2.0","id":1})"
                           "\n");
        CHECK(fut.get().str == "null");
    }

    TEST_CASE("004: noise and malformed lines never disturb correlation", "[004][correlator][framing]") {
        detail::correlator_fixture fx{};
        auto fut = fx.correlator.send_request("tools/list", "{}", 5s);

        std::string stream = "Desktop Commander MCP server starting...\n\n{not json at all\n[1,2,3]\n" +
                             detail::response_line(1, R"({"tools":[]})");
        // byte at a time, like a slow pipe
        for (char c : stream) {
            fx.correlator.feed(std::string_view{&c, 1U});
        }
        CHECK(fut.get().str == R"({"tools":[]})");
    }

    TEST_CASE("004: notifications are forwarded to subscribers", "[004][correlator][notifications]") {
        detail::correlator_fixture fx{};
        std::vector<notification_event> seen{};
        fx.correlator.notifications().subscribe([&](const notification_event& ev) { seen.push_back(ev); });

        fx.correlator.feed(
                R"({"jsonrpc":"2.0","method":"notifications/message","params":{"level":"info","data":"ready"}})"
                "\n");
        fx.correlator.feed(R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})"
                           "\n");

        REQUIRE(seen.size() == 2U);
        CHECK(seen[0].method == "notifications/message");
        CHECK(seen[0].params == R"({"level":"info","data":"ready"})");
        CHECK_FALSE(seen[0].id);
        CHECK(seen[1].method == "notifications/tools/list_changed");
        CHECK(seen[1].params.empty());
        CHECK(fx.writes.snapshot().empty());
    }

    TEST_CASE("004: server-initiated requests get a method-not-found reply", "[004][correlator][notifications]") {
        detail::correlator_fixture fx{};
        std::vector<notification_event> seen{};
        fx.correlator.notifications().subscribe([&](const notification_event& ev) { seen.push_back(ev); });

        fx.correlator.feed(R"({"jsonrpc":"2.0","id":900,"method":"roots/list","params":{}})"
                           "\n");

        auto frames = fx.writes.snapshot();
        REQUIRE(frames.size() == 1U);
        auto reply = mcp::decode_message(frames[0]);
        REQUIRE(reply);
        REQUIRE(reply->id);
        CHECK(*reply->id == 900);
        REQUIRE(reply->error);
        CHECK(reply->error->code == -32601);

        REQUIRE(seen.size() == 1U);
        CHECK(seen[0].method == "roots/list");
        REQUIRE(seen[0].id);
        CHECK(*seen[0].id == 900);
    }

    TEST_CASE("004: a failed write rejects the request immediately", "[004][correlator]") {
        timer_queue timers{};
        rpc_correlator correlator{
                [](std::string_view) { throw rpc_error(rpc_errc::write_failed, "write to MCP server failed: EPIPE"); },
                timers};

        auto fut = correlator.send_request("tools/list", "{}", 5s);
        CHECK(detail::error_code_of([&] { (void)fut.get(); }) == rpc_errc::write_failed);
        CHECK(correlator.pending_count() == 0U);
        CHECK(timers.pending() == 0U);
        CHECK(detail::error_code_of([&] { correlator.send_notification("x", "{}"); }) == rpc_errc::write_failed);
    }

    TEST_CASE("004: a timed out request settles once and ignores the late response", "[004][correlator][timeout]") {
        detail::correlator_fixture fx{};
        auto started = std::chrono::steady_clock::now();
        auto fut = fx.correlator.send_request("tools/call", "{}", 50ms);

        try {
            (void)fut.get();
            FAIL("expected a timeout");
        } catch (const rpc_error& e) {
            CHECK(e.code() == rpc_errc::request_timeout);
            CHECK(std::string_view{e.what()}.find("timed out") != std::string_view::npos);
        }
        CHECK(std::chrono::steady_clock::now() - started >= 50ms);
        CHECK(fx.correlator.pending_count() == 0U);

        CHECK_NOTHROW(fx.correlator.feed(detail::response_line(1, R"("late")")));
        CHECK(fx.correlator.pending_count() == 0U);
    }

    TEST_CASE("004: responses racing their deadline settle exactly once", "[004][correlator][timeout]") {
        detail::correlator_fixture fx{};
        constexpr int requests = 200;

        std::vector<std::future<glz::raw_json>> futures{};
        futures.reserve(requests);
        for (int i = 0; i < requests; ++i) {
            futures.push_back(fx.correlator.send_request("race", "{}", 2ms));
        }
        std::this_thread::sleep_for(1ms);
        for (int id = 1; id <= requests; ++id) {
            fx.correlator.feed(detail::response_line(id, "true"));
        }

        int resolved = 0;
        int timed_out = 0;
        for (auto& fut : futures) {
            try {
                CHECK(fut.get().str == "true");
                ++resolved;
            } catch (const rpc_error& e) {
                CHECK(e.code() == rpc_errc::request_timeout);
                ++timed_out;
            }
        }
        CHECK(resolved + timed_out == requests);
        CHECK(fx.correlator.pending_count() == 0U);
    }

    TEST_CASE("004: reset rejects leftovers and restarts ids", "[004][correlator]") {
        detail::correlator_fixture fx{};
        auto a = fx.correlator.send_request("a", "{}", 5s);
        auto b = fx.correlator.send_request("b", "{}", 5s);
        fx.correlator.feed(R"({"jsonrpc":"2.0","id":1,"res)");
        CHECK(fx.correlator.next_id() == 3);

        fx.correlator.reset();

        CHECK(detail::error_code_of([&] { (void)a.get(); }) == rpc_errc::connection_lost);
        CHECK(detail::error_code_of([&] { (void)b.get(); }) == rpc_errc::connection_lost);
        CHECK(fx.correlator.next_id() == 1);
        CHECK(fx.timers.pending() == 0U);

        // the partial line from the old connection must not glue onto new input
        auto c = fx.correlator.send_request("c", "{}", 5s);
        fx.correlator.feed(detail::response_line(1, R"("fresh")"));
        CHECK(c.get().str == R"("fresh")");
    }

}  // namespace tether::test
