#pragma once

#include "config.hpp"

#include <sys/types.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace tether {

    struct exit_status {
        std::optional<int> exit_code{};
        std::optional<int> signal{};
    };

    std::string describe(const exit_status& status);

    /*
     * Owns one child process speaking over stdio.
     *
     * start() forks the configured executable (directly, or through the
     * container tool), waits out the grace window and then hands stdout
     * bytes to the data handler from a dedicated reader thread. stderr is
     * forwarded to the info log line by line. The exit handler fires only
     * for exits that stop() did not cause.
     */
    class process_transport {
      public:
        using data_handler = std::function<void(std::string_view)>;
        using exit_handler = std::function<void(const exit_status&)>;
        using error_handler = std::function<void(const std::string&)>;

        explicit process_transport(transport_config cfg);
        ~process_transport();

        process_transport(const process_transport&) = delete;
        process_transport& operator=(const process_transport&) = delete;

        // Handlers are installed before start() and run on the reader thread
        void on_data(data_handler fn) { on_data_ = std::move(fn); }
        void on_exit(exit_handler fn) { on_exit_ = std::move(fn); }
        void on_error(error_handler fn) { on_error_ = std::move(fn); }

        // Throws rpc_error(executable_not_found | spawn_failed); no-op when already running
        void start();

        // Throws rpc_error(not_running | write_failed). Gives up with write_failed when the
        // server leaves its stdin full for longer than the request timeout.
        void write(std::string_view frame);

        // Idempotent: closes stdin, then escalates SIGTERM -> SIGKILL until the child is reaped
        void stop();

        bool is_running() const { return running_.load(); }
        std::optional<int> pid() const;

        const transport_config& config() const { return cfg_; }

        // Full argv for a launch, honoring container indirection
        static std::vector<std::string> build_argv(const transport_config& cfg);

      private:
        void reader_loop(std::stop_token stop);
        void forward_stderr(std::string_view chunk);
        void close_fds();

        transport_config cfg_;

        data_handler on_data_{};
        exit_handler on_exit_{};
        error_handler on_error_{};

        // serializes start() and stop()
        std::mutex control_mutex_{};

        mutable std::mutex mutex_{};
        pid_t pid_{-1};
        bool reaped_{false};
        int stdin_fd_{-1};
        int stdout_fd_{-1};
        int stderr_fd_{-1};
        int wake_fds_[2]{-1, -1};

        std::mutex write_mutex_{};
        std::atomic<bool> running_{false};
        std::atomic<bool> stopping_{false};
        std::string stderr_buffer_{};

        std::jthread reader_{};
    };

}  // namespace tether
