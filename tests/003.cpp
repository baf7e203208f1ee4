#include "utils.hpp"

namespace tether::test {

    TEST_CASE("003: outbound frames are single newline-terminated lines", "[003][protocol]") {
        auto request = mcp::encode_request(7, mcp::method::tools_call, R"({"name":"echo","arguments":{}})");
        CHECK(request.back() == '\n');
        CHECK(std::ranges::count(request, '\n') == 1);
        CHECK(request == "{\"jsonrpc\":\"2.0\",\"id\":7,\"method\":\"tools/call\","
                         "\"params\":{\"name\":\"echo\",\"arguments\":{}}}\n");

        auto note = mcp::encode_notification(mcp::method::initialized, "");
        CHECK(note == "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\",\"params\":{}}\n");

        auto reply = mcp::encode_error_response(900, -32601, "nope");
        CHECK(reply == "{\"jsonrpc\":\"2.0\",\"id\":900,\"error\":{\"code\":-32601,\"message\":\"nope\"}}\n");
    }

    TEST_CASE("003: inbound lines are classified by shape", "[003][protocol]") {
        auto response = mcp::decode_message(R"({"jsonrpc":"2.0","id":3,"result":{"ok":true}})");
        REQUIRE(response);
        CHECK(response->is_response());
        REQUIRE(response->result);
        CHECK(response->result->str == R"({"ok":true})");

        auto failure = mcp::decode_message(R"({"jsonrpc":"2.0","id":4,"error":{"code":-32602,"message":"bad"}})");
        REQUIRE(failure);
        CHECK(failure->is_response());
        REQUIRE(failure->error);
        CHECK(failure->error->code == -32602);
        CHECK(failure->error->message == "bad");

        auto note = mcp::decode_message(R"({"jsonrpc":"2.0","method":"notifications/message","params":{"a":1}})");
        REQUIRE(note);
        CHECK(note->is_notification());

        auto server_request = mcp::decode_message(R"({"jsonrpc":"2.0","id":900,"method":"roots/list"})");
        REQUIRE(server_request);
        CHECK(server_request->is_server_request());

        auto unattributed = mcp::decode_message(R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"x"}})");
        REQUIRE(unattributed);
        CHECK_FALSE(unattributed->id);
        CHECK(unattributed->error);

        CHECK_FALSE(mcp::decode_message("Server listening on stdio"));
        CHECK_FALSE(mcp::decode_message("{not json"));
        CHECK_FALSE(mcp::decode_message(R"({"hello":"world"})"));
        CHECK_FALSE(mcp::decode_message(""));
    }

    TEST_CASE("003: line framer output does not depend on chunk boundaries", "[003][protocol][framing]") {
        std::string stream = "{\"id\":1}\r\n\nnoise line\n{\"id\":2,\"result\":\"a\\nb\"}\n{\"id\":3}\n";
        std::vector<std::string> expected{"{\"id\":1}", "noise line", "{\"id\":2,\"result\":\"a\\nb\"}", "{\"id\":3}"};

        for (size_t chunk_size : {1U, 2U, 3U, 5U, 8U, 13U, 64U}) {
            mcp::line_framer framer{};
            std::vector<std::string> lines{};
            for (size_t off = 0; off < stream.size(); off += chunk_size) {
                for (auto& line : framer.push(std::string_view{stream}.substr(off, chunk_size))) {
                    lines.push_back(std::move(line));
                }
            }
            INFO("chunk size " << chunk_size);
            CHECK(lines == expected);
            CHECK(framer.buffered() == 0U);
        }
    }

    TEST_CASE("003: line framer keeps partial lines and drops oversized ones", "[003][protocol][framing]") {
        mcp::line_framer framer{16U};

        CHECK(framer.push("{\"id\":").empty());
        CHECK(framer.buffered() == 6U);
        auto lines = framer.push("9}\n{\"id\"");
        REQUIRE(lines.size() == 1U);
        CHECK(lines[0] == "{\"id\":9}");
        CHECK(framer.buffered() == 5U);

        framer.reset();
        CHECK(framer.buffered() == 0U);

        CHECK(framer.push(std::string(40U, 'x')).empty());
        CHECK(framer.buffered() == 0U);
        CHECK(framer.discarded_bytes() == 40U);

        lines = framer.push("ok\n");
        REQUIRE(lines.size() == 1U);
        CHECK(lines[0] == "ok");
    }

    TEST_CASE("003: MCP payload helpers", "[003][protocol][mcp]") {
        auto init = mcp::make_initialize_params("2024-11-05", "tether", "0.1.0");
        CHECK(init.find("\"protocolVersion\":\"2024-11-05\"") != std::string::npos);
        CHECK(init.find("\"clientInfo\":{\"name\":\"tether\",\"version\":\"0.1.0\"}") != std::string::npos);

        CHECK(mcp::make_tool_call_params("write_command", R"({"command":"id"})") ==
              R"({"name":"write_command","arguments":{"command":"id"}})");
        CHECK(mcp::make_tool_call_params("noop", "") == R"({"name":"noop","arguments":{}})");

        auto result = mcp::parse_initialize_result(
                R"({"protocolVersion":"2024-11-05","capabilities":{"tools":{}},"serverInfo":{"name":"desktop-commander","version":"1.2"},"instructions":"x"})");
        CHECK(result.serverInfo.name == "desktop-commander");
        CHECK(result.serverInfo.version == "1.2");

        auto tools = mcp::parse_tools_list_result(
                R"({"tools":[{"name":"write_command","description":"run","inputSchema":{"type":"object"}},{"name":"read_output"}]})");
        REQUIRE(tools.tools.size() == 2U);
        CHECK(tools.tools[0].name == "write_command");
        CHECK(tools.tools[1].name == "read_output");

        CHECK(detail::error_code_of([] { (void)mcp::parse_tools_list_result(R"({"tools":"nope"})"); }) ==
              rpc_errc::protocol_error);
    }

    TEST_CASE("003: tool result text joins text parts", "[003][protocol][mcp]") {
        auto result = mcp::parse_tool_result(
                R"({"content":[{"type":"text","text":"line one"},{"type":"image","data":"..."},{"type":"text","text":"line two"}],"isError":true})");
        CHECK(result.isError);
        CHECK(result.text() == "line one\nline two");

        auto empty = mcp::parse_tool_result(R"({"content":[]})");
        CHECK_FALSE(empty.isError);
        CHECK(empty.text().empty());
    }

}  // namespace tether::test
