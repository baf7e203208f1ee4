#pragma once

#include "channel.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "events.hpp"

#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether::exec {

    // The command a session is currently attempting
    struct pending_command {
        std::string command{};
        std::chrono::steady_clock::time_point started{};
        int retry_count{0};
    };

    /*
     * Per-session command history and in-flight command.
     *
     * Injected into the execution manager so that independent managers (or a
     * persistent backing store) never share hidden process-wide state.
     * Implementations must be safe for concurrent use.
     */
    class session_store {
      public:
        virtual ~session_store() = default;

        // Oldest first
        virtual std::vector<std::string> history(std::string_view session_id) const = 0;

        // Appends and evicts from the front until at most `limit` entries remain
        virtual void append_command(std::string_view session_id, std::string command, size_t limit) = 0;

        // Forgets both the history and any pending command
        virtual void clear(std::string_view session_id) = 0;

        // False, leaving the store untouched, when the session already has a pending command
        virtual bool try_begin_pending(std::string_view session_id, pending_command command) = 0;
        virtual void update_retry(std::string_view session_id, int retry_count) = 0;
        virtual void end_pending(std::string_view session_id) = 0;
        virtual std::optional<pending_command> pending(std::string_view session_id) const = 0;
    };

    class in_memory_session_store final : public session_store {
      public:
        std::vector<std::string> history(std::string_view session_id) const override;
        void append_command(std::string_view session_id, std::string command, size_t limit) override;
        void clear(std::string_view session_id) override;

        bool try_begin_pending(std::string_view session_id, pending_command command) override;
        void update_retry(std::string_view session_id, int retry_count) override;
        void end_pending(std::string_view session_id) override;
        std::optional<pending_command> pending(std::string_view session_id) const override;

        size_t session_count() const;

      private:
        mutable std::mutex mutex_{};
        std::map<std::string, std::deque<std::string>, std::less<>> history_{};
        std::map<std::string, pending_command, std::less<>> pending_{};
    };

    // Per-call overrides; unset fields fall back to the manager's execution_config
    struct execute_options {
        std::optional<int> max_retries{};
        std::optional<std::chrono::milliseconds> attempt_timeout{};
        std::optional<std::chrono::milliseconds> retry_delay{};
        // Notification hook only; has no effect on control flow
        std::function<void(const execution_event&)> observer{};
    };

    struct execution_result {
        bool success{false};
        std::string output{};
        int exit_code{0};
        int attempts{0};
        std::chrono::milliseconds duration{};
        std::optional<error_info> error{};
        // set when the call was refused by loop detection
        std::optional<size_t> loop_count{};
    };

    // {"success":...,"output":...,"exitCode":...,"attempts":...,"durationMs":...,"error":{...}}
    std::string to_json(const execution_result& result);

    /*
     * Runs one logical command for a session on top of an rpc_channel.
     *
     * execute() walks Idle -> LoopChecked -> Attempting(n) and ends in either
     * Succeeded or Exhausted. Each attempt is a `tools/call` of the configured
     * tool with {"command": ...}, raced against the attempt timeout; failed
     * attempts wait a fixed retry delay before the next one. A session has at
     * most one execute() in flight: a second concurrent call is refused with
     * error_kind::session_busy.
     *
     * Never throws for per-call failures; the outcome is always an execution_result.
     */
    class execution_manager {
      public:
        execution_manager(rpc_channel& channel, session_store& store, execution_config cfg = {});

        execution_result execute(
                std::string_view session_id, std::string_view command, const execute_options& options = {});

        std::vector<std::string> history(std::string_view session_id) const { return store_.history(session_id); }
        void clear_session(std::string_view session_id) { store_.clear(session_id); }
        bool is_pending(std::string_view session_id) const { return store_.pending(session_id).has_value(); }
        std::optional<pending_command> pending(std::string_view session_id) const {
            return store_.pending(session_id);
        }

        // Times `command` appears in the session's retained history
        size_t command_count(std::string_view session_id, std::string_view command) const;

        const execution_config& config() const { return cfg_; }
        event_hub<execution_event>& events() { return events_; }

      private:
        void notify(const execute_options& options, const execution_event& event);

        rpc_channel& channel_;
        session_store& store_;
        execution_config cfg_;
        event_hub<execution_event> events_{};
    };

}  // namespace tether::exec
