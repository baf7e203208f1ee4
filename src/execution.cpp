#include "tether/execution.hpp"

#include "tether/format.hpp"
#include "tether/protocol.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <future>
#include <thread>

using namespace tether::literals;

namespace tether::exec {

    namespace detail {

        struct command_arguments {
            std::string command{};
            struct glaze {
                using T = command_arguments;
                static constexpr auto value = glz::object(&T::command);
            };
        };

        static std::string command_arguments_json(const std::string& command) {
            std::string json{};
            if (auto ec = glz::write_json(command_arguments{.command = command}, json)) {
                throw rpc_error(rpc_errc::protocol_error, "failed to serialize command arguments");
            }
            return json;
        }

        struct error_view {
            std::string message{};
            std::string errorType{};
            bool retryable{};
            std::string suggestion{};
            std::string detail{};
            struct glaze {
                using T = error_view;
                static constexpr auto value = glz::object(
                        &T::message, "errorType", &T::errorType, &T::retryable, &T::suggestion, &T::detail);
            };
        };

        struct result_view {
            bool success{};
            std::string output{};
            int exitCode{};
            int attempts{};
            int64_t durationMs{};
            std::optional<error_view> error{};
            std::optional<size_t> loopCount{};
            struct glaze {
                using T = result_view;
                static constexpr auto value = glz::object(
                        &T::success,
                        &T::output,
                        "exitCode",
                        &T::exitCode,
                        &T::attempts,
                        "durationMs",
                        &T::durationMs,
                        &T::error,
                        "loopCount",
                        &T::loopCount);
            };
        };

    }  // namespace detail

    // ── in_memory_session_store ─────────────────────────────────────

    std::vector<std::string> in_memory_session_store::history(std::string_view session_id) const {
        std::lock_guard lock{mutex_};
        auto it = history_.find(session_id);
        if (it == history_.end()) {
            return {};
        }
        return {it->second.begin(), it->second.end()};
    }

    void in_memory_session_store::append_command(std::string_view session_id, std::string command, size_t limit) {
        std::lock_guard lock{mutex_};
        auto it = history_.find(session_id);
        if (it == history_.end()) {
            it = history_.emplace(std::string{session_id}, std::deque<std::string>{}).first;
        }
        auto& entries = it->second;
        entries.push_back(std::move(command));
        while (entries.size() > limit) {
            entries.pop_front();
        }
    }

    void in_memory_session_store::clear(std::string_view session_id) {
        std::lock_guard lock{mutex_};
        if (auto it = history_.find(session_id); it != history_.end()) {
            history_.erase(it);
        }
        if (auto it = pending_.find(session_id); it != pending_.end()) {
            pending_.erase(it);
        }
    }

    bool in_memory_session_store::try_begin_pending(std::string_view session_id, pending_command command) {
        std::lock_guard lock{mutex_};
        if (pending_.contains(session_id)) {
            return false;
        }
        pending_.emplace(std::string{session_id}, std::move(command));
        return true;
    }

    void in_memory_session_store::update_retry(std::string_view session_id, int retry_count) {
        std::lock_guard lock{mutex_};
        if (auto it = pending_.find(session_id); it != pending_.end()) {
            it->second.retry_count = retry_count;
        }
    }

    void in_memory_session_store::end_pending(std::string_view session_id) {
        std::lock_guard lock{mutex_};
        if (auto it = pending_.find(session_id); it != pending_.end()) {
            pending_.erase(it);
        }
    }

    std::optional<pending_command> in_memory_session_store::pending(std::string_view session_id) const {
        std::lock_guard lock{mutex_};
        if (auto it = pending_.find(session_id); it != pending_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    size_t in_memory_session_store::session_count() const {
        std::lock_guard lock{mutex_};
        return history_.size();
    }

    // ── execution_manager ───────────────────────────────────────────

    execution_manager::execution_manager(rpc_channel& channel, session_store& store, execution_config cfg)
            : channel_{channel}, store_{store}, cfg_{std::move(cfg)} {}

    size_t execution_manager::command_count(std::string_view session_id, std::string_view command) const {
        auto entries = store_.history(session_id);
        return static_cast<size_t>(std::ranges::count(entries, command));
    }

    void execution_manager::notify(const execute_options& options, const execution_event& event) {
        try {
            if (options.observer) {
                options.observer(event);
            }
            events_.emit(event);
        } catch (const std::exception& e) {
            log_warn("execution observer threw: ", e.what());
        }
    }

    execution_result execution_manager::execute(
            std::string_view session_id, std::string_view command, const execute_options& options) {
        using std::chrono::duration_cast;
        using std::chrono::milliseconds;
        using std::chrono::steady_clock;

        auto started = steady_clock::now();
        auto elapsed = [started] { return duration_cast<milliseconds>(steady_clock::now() - started); };

        auto max_attempts = std::max(1, options.max_retries.value_or(cfg_.max_retries));
        auto attempt_timeout = options.attempt_timeout.value_or(cfg_.attempt_timeout);
        auto retry_delay = options.retry_delay.value_or(cfg_.retry_delay);

        std::string session{session_id};
        std::string cmd{command};
        execution_result result{};
        result.exit_code = 1;

        if (!store_.try_begin_pending(session, pending_command{.command = cmd, .started = started})) {
            auto current = store_.pending(session);
            log_warn("session ", session, " is busy; refusing \"", cmd, "\"");
            result.error = make_session_busy_error(session, current ? std::string_view{current->command} : ""sv);
            result.duration = elapsed();
            return result;
        }

        if (auto count = command_count(session, cmd); count >= cfg_.max_same_command_repeats) {
            store_.end_pending(session);
            log_warn("loop detected in session ", session, ": \"", cmd, "\" already issued ", count, " times");
            notify(options, loop_detected_event{.session_id = session, .command = cmd, .count = count});
            result.error = make_loop_detected_error(cmd, count);
            result.loop_count = count;
            result.duration = elapsed();
            return result;
        }

        store_.append_command(session, cmd, cfg_.history_limit);

        std::optional<error_info> last_error{};
        for (int attempt = 1; attempt <= max_attempts; ++attempt) {
            log_info("executing (attempt ", attempt, "/", max_attempts, "): ", cmd);
            notify(options,
                   progress_event{
                           .session_id = session, .command = cmd, .attempt = attempt, .max_attempts = max_attempts});

            std::optional<error_info> failure{};
            try {
                auto params = mcp::make_tool_call_params(cfg_.tool_name, detail::command_arguments_json(cmd));
                auto future = channel_.send_request(mcp::method::tools_call, params, attempt_timeout);
                if (future.wait_for(attempt_timeout) != std::future_status::ready) {
                    failure = classify(
                            rpc_errc::request_timeout,
                            "Command execution timeout after {}"_format(format_ms(attempt_timeout)));
                }
                else {
                    auto tool = mcp::parse_tool_result(future.get().str);
                    store_.end_pending(session);

                    result.success = true;
                    result.output = tool.text();
                    result.exit_code = tool.isError ? 1 : 0;
                    result.attempts = attempt;
                    result.duration = elapsed();
                    log_info("command succeeded on attempt ", attempt, " in ", format_ms(result.duration));
                    return result;
                }
            } catch (const std::exception& e) {
                failure = classify(e);
            }

            log_warn("command failed (attempt {}/{}, {}): {}"_format(
                    attempt, max_attempts, failure->kind, failure->detail));
            if (failure->kind == error_kind::timeout) {
                notify(options, timeout_event{.session_id = session, .command = cmd, .attempt = attempt});
            }
            last_error = std::move(failure);

            if (attempt < max_attempts) {
                notify(options,
                       retry_event{
                               .session_id = session,
                               .command = cmd,
                               .attempt = attempt,
                               .max_attempts = max_attempts,
                               .delay = retry_delay});
                store_.update_retry(session, attempt);
                std::this_thread::sleep_for(retry_delay);
            }
        }

        store_.end_pending(session);
        log_error("command failed after ", max_attempts, " attempt(s): ", cmd);
        result.attempts = max_attempts;
        result.error = std::move(last_error);
        result.duration = elapsed();
        return result;
    }

    std::string to_json(const execution_result& result) {
        detail::result_view view{
                .success = result.success,
                .output = result.output,
                .exitCode = result.exit_code,
                .attempts = result.attempts,
                .durationMs = static_cast<int64_t>(result.duration.count()),
                .loopCount = result.loop_count};
        if (result.error) {
            view.error = detail::error_view{
                    .message = result.error->message,
                    .errorType = "{}"_format(result.error->kind),
                    .retryable = result.error->retryable,
                    .suggestion = result.error->suggestion,
                    .detail = result.error->detail};
        }
        std::string json{};
        if (auto ec = glz::write_json(view, json)) {
            throw std::runtime_error("failed to serialize execution result");
        }
        return json;
    }

}  // namespace tether::exec
