#include "tether/protocol.hpp"

#include "tether/errors.hpp"
#include "tether/format.hpp"

#include "tether/utils.hpp"

using namespace tether::literals;

namespace tether::mcp {

    namespace detail {

        static constexpr auto lenient = glz::opts{.error_on_unknown_keys = false};

        struct outbound_request {
            std::string jsonrpc{jsonrpc_version};
            int64_t id{};
            std::string method{};
            glz::raw_json params{"{}"};
            struct glaze {
                using T = outbound_request;
                static constexpr auto value = glz::object(&T::jsonrpc, &T::id, &T::method, &T::params);
            };
        };

        struct outbound_notification {
            std::string jsonrpc{jsonrpc_version};
            std::string method{};
            glz::raw_json params{"{}"};
            struct glaze {
                using T = outbound_notification;
                static constexpr auto value = glz::object(&T::jsonrpc, &T::method, &T::params);
            };
        };

        struct outbound_error_response {
            std::string jsonrpc{jsonrpc_version};
            int64_t id{};
            error_object error{};
            struct glaze {
                using T = outbound_error_response;
                static constexpr auto value = glz::object(&T::jsonrpc, &T::id, &T::error);
            };
        };

        static std::string params_or_empty(std::string_view params_json) {
            auto trimmed = utils::trim_view(params_json);
            if (trimmed.empty()) {
                return "{}";
            }
            return std::string{trimmed};
        }

        template <typename T>
        static std::string serialize_frame(const T& payload) {
            std::string json{};
            auto ec = glz::write_json(payload, json);
            if (ec) {
                throw rpc_error(rpc_errc::protocol_error, "failed to serialize json-rpc frame");
            }
            json.push_back('\n');
            return json;
        }

        template <typename T>
        static T parse_payload(std::string_view json, std::string_view what) {
            T value{};
            auto ec = glz::read<lenient>(value, json);
            if (ec) {
                throw rpc_error(
                        rpc_errc::protocol_error,
                        "protocol error: malformed {} payload: {}"_format(what, glz::format_error(ec, json)));
            }
            return value;
        }

    }  // namespace detail

    std::string tool_result::text() const {
        std::vector<std::string> parts{};
        for (const auto& part : content) {
            if (part.type == "text"sv && part.text) {
                parts.push_back(*part.text);
            }
        }
        return utils::join_with_separator(parts, "\n"sv);
    }

    std::string encode_request(int64_t id, std::string_view method, std::string_view params_json) {
        detail::outbound_request req{};
        req.id = id;
        req.method = std::string{method};
        req.params = glz::raw_json{detail::params_or_empty(params_json)};
        return detail::serialize_frame(req);
    }

    std::string encode_notification(std::string_view method, std::string_view params_json) {
        detail::outbound_notification note{};
        note.method = std::string{method};
        note.params = glz::raw_json{detail::params_or_empty(params_json)};
        return detail::serialize_frame(note);
    }

    std::string encode_error_response(int64_t id, int code, std::string_view message) {
        detail::outbound_error_response resp{};
        resp.id = id;
        resp.error = error_object{.code = code, .message = std::string{message}};
        return detail::serialize_frame(resp);
    }

    std::optional<inbound_message> decode_message(std::string_view line) {
        auto trimmed = utils::trim_view(line);
        if (trimmed.empty() || trimmed.front() != '{') {
            return std::nullopt;
        }

        inbound_message msg{};
        auto ec = glz::read<detail::lenient>(msg, trimmed);
        if (ec) {
            return std::nullopt;
        }
        if (!msg.id && !msg.method && !msg.error) {
            return std::nullopt;
        }
        return msg;
    }

    std::string make_initialize_params(
            std::string_view protocol_version, std::string_view client_name, std::string_view client_version) {
        initialize_params params{};
        params.protocolVersion = std::string{protocol_version};
        params.clientInfo = client_info{.name = std::string{client_name}, .version = std::string{client_version}};
        std::string json{};
        if (glz::write_json(params, json)) {
            throw rpc_error(rpc_errc::protocol_error, "failed to serialize initialize params");
        }
        return json;
    }

    std::string make_tool_call_params(std::string_view name, std::string_view arguments_json) {
        tool_call_params params{};
        params.name = std::string{name};
        params.arguments = glz::raw_json{detail::params_or_empty(arguments_json)};
        std::string json{};
        if (glz::write_json(params, json)) {
            throw rpc_error(rpc_errc::protocol_error, "failed to serialize tools/call params");
        }
        return json;
    }

    initialize_result parse_initialize_result(std::string_view result_json) {
        return detail::parse_payload<initialize_result>(result_json, "initialize result"sv);
    }

    tools_list_result parse_tools_list_result(std::string_view result_json) {
        return detail::parse_payload<tools_list_result>(result_json, "tools/list result"sv);
    }

    tool_result parse_tool_result(std::string_view result_json) {
        return detail::parse_payload<tool_result>(result_json, "tools/call result"sv);
    }

    std::vector<std::string> line_framer::push(std::string_view chunk) {
        std::vector<std::string> lines{};
        buffer_.append(chunk);

        size_t start = 0;
        for (;;) {
            auto nl = buffer_.find('\n', start);
            if (nl == std::string::npos) {
                break;
            }
            std::string_view line{buffer_.data() + start, nl - start};
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            if (!utils::trim_view(line).empty()) {
                lines.emplace_back(line);
            }
            start = nl + 1;
        }
        buffer_.erase(0, start);

        if (buffer_.size() > max_line_bytes_) {
            discarded_bytes_ += buffer_.size();
            buffer_.clear();
        }
        return lines;
    }

}  // namespace tether::mcp
