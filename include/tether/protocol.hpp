#pragma once

#include <glaze/glaze.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether::mcp {

    using namespace std::string_view_literals;

    inline constexpr auto jsonrpc_version = "2.0"sv;

    namespace method {
        inline constexpr auto initialize = "initialize"sv;
        inline constexpr auto initialized = "notifications/initialized"sv;
        inline constexpr auto tools_list = "tools/list"sv;
        inline constexpr auto tools_call = "tools/call"sv;
    }  // namespace method

    // ── MCP payloads ────────────────────────────────────────────────

    struct client_info {
        std::string name{};
        std::string version{};
        struct glaze {
            using T = client_info;
            static constexpr auto value = glz::object(&T::name, &T::version);
        };
    };

    struct initialize_params {
        std::string protocolVersion{};
        glz::raw_json capabilities{"{}"};
        client_info clientInfo{};
        struct glaze {
            using T = initialize_params;
            static constexpr auto value = glz::object(
                    "protocolVersion", &T::protocolVersion, "capabilities", &T::capabilities, "clientInfo", &T::clientInfo);
        };
    };

    struct server_info {
        std::string name{};
        std::string version{};
        struct glaze {
            using T = server_info;
            static constexpr auto value = glz::object(&T::name, &T::version);
        };
    };

    struct initialize_result {
        std::string protocolVersion{};
        glz::raw_json capabilities{"{}"};
        server_info serverInfo{};
        struct glaze {
            using T = initialize_result;
            static constexpr auto value = glz::object(
                    "protocolVersion",
                    &T::protocolVersion,
                    "capabilities",
                    &T::capabilities,
                    "serverInfo",
                    &T::serverInfo);
        };
    };

    struct tool_descriptor {
        std::string name{};
        std::string description{};
        glz::raw_json inputSchema{"{}"};
        struct glaze {
            using T = tool_descriptor;
            static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
        };
    };

    struct tools_list_result {
        std::vector<tool_descriptor> tools{};
        struct glaze {
            using T = tools_list_result;
            static constexpr auto value = glz::object(&T::tools);
        };
    };

    struct tool_call_params {
        std::string name{};
        glz::raw_json arguments{"{}"};
        struct glaze {
            using T = tool_call_params;
            static constexpr auto value = glz::object(&T::name, &T::arguments);
        };
    };

    struct content_part {
        std::string type{"text"};
        std::optional<std::string> text{};
        struct glaze {
            using T = content_part;
            static constexpr auto value = glz::object(&T::type, &T::text);
        };
    };

    struct tool_result {
        std::vector<content_part> content{};
        bool isError{false};

        // text parts joined by '\n', other part types skipped
        std::string text() const;

        struct glaze {
            using T = tool_result;
            static constexpr auto value = glz::object(&T::content, "isError", &T::isError);
        };
    };

    // ── JSON-RPC envelopes ──────────────────────────────────────────

    struct error_object {
        int code{};
        std::string message{};
        std::optional<glz::raw_json> data{};
        struct glaze {
            using T = error_object;
            static constexpr auto value = glz::object(&T::code, &T::message, &T::data);
        };
    };

    // Any inbound line: response, notification, or server-initiated request
    struct inbound_message {
        std::optional<int64_t> id{};
        std::optional<std::string> method{};
        std::optional<glz::raw_json> params{};
        std::optional<glz::raw_json> result{};
        std::optional<error_object> error{};

        bool is_response() const { return id.has_value() && !method.has_value(); }
        bool is_notification() const { return method.has_value() && !id.has_value(); }
        bool is_server_request() const { return method.has_value() && id.has_value(); }

        struct glaze {
            using T = inbound_message;
            static constexpr auto value =
                    glz::object(&T::id, &T::method, &T::params, &T::result, &T::error);
        };
    };

    std::string encode_request(int64_t id, std::string_view method, std::string_view params_json);
    std::string encode_notification(std::string_view method, std::string_view params_json);
    std::string encode_error_response(int64_t id, int code, std::string_view message);

    // nullopt when the line is not a JSON-RPC shaped object (carries neither id nor method)
    std::optional<inbound_message> decode_message(std::string_view line);

    std::string make_initialize_params(
            std::string_view protocol_version, std::string_view client_name, std::string_view client_version);
    std::string make_tool_call_params(std::string_view name, std::string_view arguments_json);

    // Throws rpc_error(protocol_error) when the payload does not have the expected shape
    initialize_result parse_initialize_result(std::string_view result_json);
    tools_list_result parse_tools_list_result(std::string_view result_json);
    tool_result parse_tool_result(std::string_view result_json);

    /*
     * Splits a byte stream into newline-terminated lines.
     *
     * The trailing partial segment stays buffered until a later chunk
     * completes it. Carriage returns before '\n' are stripped and blank
     * lines are skipped. An unterminated segment longer than max_line_bytes
     * is discarded.
     */
    class line_framer {
      public:
        explicit line_framer(size_t max_line_bytes = 16U << 20U) : max_line_bytes_{max_line_bytes} {}

        std::vector<std::string> push(std::string_view chunk);

        void reset() { buffer_.clear(); }
        size_t buffered() const { return buffer_.size(); }
        size_t discarded_bytes() const { return discarded_bytes_; }

      private:
        std::string buffer_{};
        size_t max_line_bytes_;
        size_t discarded_bytes_{0};
    };

}  // namespace tether::mcp
