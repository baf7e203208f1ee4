#include "tether/correlator.hpp"

#include "tether/format.hpp"
#include "tether/utils.hpp"

#include <glaze/ext/jsonrpc.hpp>

#include <vector>

using namespace tether::literals;

namespace tether {

    rpc_correlator::rpc_correlator(write_fn write, timer_queue& timers, size_t max_line_bytes)
            : write_{std::move(write)}, timers_{timers}, framer_{max_line_bytes} {}

    rpc_correlator::~rpc_correlator() {
        close();
    }

    std::future<glz::raw_json> rpc_correlator::send_request(
            std::string_view method, std::string_view params_json, std::chrono::milliseconds timeout) {
        std::promise<glz::raw_json> promise{};
        auto future = promise.get_future();

        int64_t id{};
        {
            std::lock_guard lock{mutex_};
            if (closed_) {
                promise.set_exception(std::make_exception_ptr(
                        rpc_error(rpc_errc::shutting_down, "client is shutting down; request was not sent")));
                return future;
            }
            id = next_id_++;
            auto& entry = pending_[id];
            entry.method = std::string{method};
            entry.promise = std::move(promise);
            // registered before the write so a fast response always finds its entry
            entry.timer = timers_.schedule_after(timeout, [this, id, timeout] { expire(id, timeout); });
        }

        debug_log("-> request ", id, " ", method);

        try {
            write_(mcp::encode_request(id, method, params_json));
        } catch (...) {
            std::unique_lock lock{mutex_};
            auto node = pending_.extract(id);
            lock.unlock();
            if (!node.empty()) {
                timers_.cancel(node.mapped().timer);
                node.mapped().promise.set_exception(std::current_exception());
            }
        }
        return future;
    }

    void rpc_correlator::send_notification(std::string_view method, std::string_view params_json) {
        {
            std::lock_guard lock{mutex_};
            if (closed_) {
                throw rpc_error(rpc_errc::shutting_down, "client is shutting down; notification was not sent");
            }
        }
        debug_log("-> notification ", method);
        write_(mcp::encode_notification(method, params_json));
    }

    void rpc_correlator::feed(std::string_view chunk) {
        std::vector<std::string> lines{};
        {
            std::lock_guard lock{framer_mutex_};
            auto discarded_before = framer_.discarded_bytes();
            lines = framer_.push(chunk);
            if (auto discarded = framer_.discarded_bytes() - discarded_before; discarded > 0) {
                log_warn("discarded ", discarded, " bytes of oversized unterminated server output");
            }
        }
        for (const auto& line : lines) {
            dispatch(line);
        }
    }

    void rpc_correlator::dispatch(const std::string& line) {
        auto msg = mcp::decode_message(line);
        if (!msg) {
            log_info("server output: ", line);
            return;
        }

        if (msg->is_response()) {
            resolve(*msg->id, *msg);
            return;
        }

        if (msg->is_server_request()) {
            debug_log("<- server request ", *msg->id, " ", *msg->method);
            answer_server_request(*msg->id, *msg->method);
            notifications_.emit(
                    notification_event{
                            .method = *msg->method,
                            .params = msg->params ? msg->params->str : std::string{},
                            .id = msg->id});
            return;
        }

        if (msg->is_notification()) {
            debug_log("<- notification ", *msg->method);
            notifications_.emit(
                    notification_event{
                            .method = *msg->method, .params = msg->params ? msg->params->str : std::string{}});
            return;
        }

        // error object with a null id: the server could not attribute it to a request
        log_warn("server reported an unattributed error: ", msg->error->message);
    }

    void rpc_correlator::resolve(int64_t id, const mcp::inbound_message& msg) {
        std::unique_lock lock{mutex_};
        auto node = pending_.extract(id);
        lock.unlock();

        if (node.empty()) {
            debug_log("<- response ", id, " has no pending request; dropped");
            return;
        }

        auto& entry = node.mapped();
        timers_.cancel(entry.timer);
        debug_log("<- response ", id, " ", entry.method);

        if (msg.error) {
            entry.promise.set_exception(std::make_exception_ptr(
                    rpc_error(rpc_errc::remote_error, msg.error->message, msg.error->code)));
            return;
        }
        entry.promise.set_value(msg.result ? *msg.result : glz::raw_json{"null"});
    }

    void rpc_correlator::expire(int64_t id, std::chrono::milliseconds timeout) {
        std::unique_lock lock{mutex_};
        auto node = pending_.extract(id);
        lock.unlock();

        if (node.empty()) {
            return;
        }
        auto& entry = node.mapped();
        log_info("request ", id, " (", entry.method, ") timed out");
        entry.promise.set_exception(std::make_exception_ptr(rpc_error(
                rpc_errc::request_timeout,
                "request {} ({}) timed out after {}"_format(id, entry.method, format_ms(timeout)))));
    }

    void rpc_correlator::answer_server_request(int64_t id, std::string_view method) {
        try {
            write_(mcp::encode_error_response(
                    id,
                    static_cast<int>(glz::rpc::error_e::method_not_found),
                    "Method not supported by client: {}"_format(method)));
        } catch (const std::exception& e) {
            log_warn("failed to answer server request ", id, ": ", e.what());
        }
    }

    void rpc_correlator::reject_all(rpc_errc code, const std::string& message) {
        std::unordered_map<int64_t, pending_request> drained{};
        {
            std::lock_guard lock{mutex_};
            drained.swap(pending_);
        }
        if (!drained.empty()) {
            log_info("rejecting ", drained.size(), " pending request(s): ", message);
        }
        for (auto& [id, entry] : drained) {
            timers_.cancel(entry.timer);
            entry.promise.set_exception(std::make_exception_ptr(rpc_error(code, message)));
        }
    }

    void rpc_correlator::reset() {
        reject_all(rpc_errc::connection_lost, "connection to MCP server was lost");
        {
            std::lock_guard lock{mutex_};
            next_id_ = 1;
        }
        std::lock_guard lock{framer_mutex_};
        framer_.reset();
    }

    void rpc_correlator::close() {
        {
            std::lock_guard lock{mutex_};
            closed_ = true;
        }
        reject_all(rpc_errc::shutting_down, "client is shutting down");
    }

    void rpc_correlator::reopen() {
        std::lock_guard lock{mutex_};
        closed_ = false;
    }

    size_t rpc_correlator::pending_count() const {
        std::lock_guard lock{mutex_};
        return pending_.size();
    }

    int64_t rpc_correlator::next_id() const {
        std::lock_guard lock{mutex_};
        return next_id_;
    }

}  // namespace tether
