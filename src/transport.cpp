#include "tether/transport.hpp"

#include "tether/errors.hpp"
#include "tether/format.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>

extern char** environ;

using namespace tether::literals;

namespace tether {

    namespace detail {

        static constexpr auto stop_grace = std::chrono::milliseconds{2'000};
        static constexpr auto reap_poll = std::chrono::milliseconds{10};

        static void close_fd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        static void close_pair(int (&fds)[2]) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }

        static exit_status decode_wait_status(int status) {
            exit_status result{};
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            }
            else if (WIFSIGNALED(status)) {
                result.signal = WTERMSIG(status);
            }
            return result;
        }

        // Non-blocking reap; nullopt while the child is still alive
        static std::optional<exit_status> try_reap(pid_t pid) {
            int status{};
            auto ret = ::waitpid(pid, &status, WNOHANG);
            if (ret == pid) {
                return decode_wait_status(status);
            }
            if (ret < 0 && errno == ECHILD) {
                return exit_status{};
            }
            return std::nullopt;
        }

        static bool wait_for_exit(pid_t pid, std::chrono::milliseconds budget) {
            auto deadline = std::chrono::steady_clock::now() + budget;
            for (;;) {
                if (try_reap(pid)) {
                    return true;
                }
                if (std::chrono::steady_clock::now() >= deadline) {
                    return false;
                }
                std::this_thread::sleep_for(reap_poll);
            }
        }

        static std::string drain_fd_nonblocking(int fd) {
            std::string buf{};
            if (fd < 0) {
                return buf;
            }
            char chunk[4096]{};
            for (;;) {
                pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
                if (::poll(&pfd, 1, 0) <= 0) {
                    break;
                }
                auto n = ::read(fd, chunk, sizeof(chunk));
                if (n <= 0) {
                    break;
                }
                buf.append(chunk, static_cast<size_t>(n));
            }
            return buf;
        }

        // Inherited environment with the overrides applied on top
        static std::vector<std::string> merged_environment(const std::map<std::string, std::string>& overrides) {
            std::vector<std::string> entries{};
            for (char** env = environ; env && *env; ++env) {
                std::string_view entry{*env};
                auto key = entry.substr(0, entry.find('='));
                if (!overrides.contains(std::string{key})) {
                    entries.emplace_back(entry);
                }
            }
            for (const auto& [key, value] : overrides) {
                entries.push_back("{}={}"_format(key, value));
            }
            return entries;
        }

        static std::vector<char*> to_c_array(std::vector<std::string>& values) {
            std::vector<char*> out{};
            out.reserve(values.size() + 1);
            for (auto& v : values) {
                out.push_back(v.data());
            }
            out.push_back(nullptr);
            return out;
        }

    }  // namespace detail

    std::string describe(const exit_status& status) {
        if (status.signal) {
            const char* name = ::strsignal(*status.signal);
            return "signal {} ({})"_format(*status.signal, name ? name : "unknown");
        }
        if (status.exit_code) {
            return "exit code {}"_format(*status.exit_code);
        }
        return "unknown status";
    }

    process_transport::process_transport(transport_config cfg) : cfg_{std::move(cfg)} {}

    process_transport::~process_transport() {
        stop();
    }

    std::vector<std::string> process_transport::build_argv(const transport_config& cfg) {
        std::vector<std::string> argv{};
        if (!cfg.container) {
            argv.push_back(cfg.executable);
            argv.insert(argv.end(), cfg.arguments.begin(), cfg.arguments.end());
            return argv;
        }

        argv = {cfg.container_tool, "exec", "-i", "-u", cfg.exec_user};
        for (const auto& [key, value] : cfg.environment) {
            // the container supplies its own
            if (key == "PATH"sv || key == "HOME"sv) {
                continue;
            }
            argv.emplace_back("-e");
            argv.push_back("{}={}"_format(key, value));
        }
        argv.push_back(*cfg.container);
        argv.push_back(cfg.executable);
        argv.insert(argv.end(), cfg.arguments.begin(), cfg.arguments.end());
        return argv;
    }

    std::optional<int> process_transport::pid() const {
        std::lock_guard lock{mutex_};
        if (pid_ > 0 && !reaped_) {
            return static_cast<int>(pid_);
        }
        return std::nullopt;
    }

    void process_transport::start() {
        std::lock_guard control{control_mutex_};
        if (running_.load()) {
            return;
        }

        // reader thread from a previous child that exited on its own
        if (reader_.joinable()) {
            reader_.request_stop();
            reader_.join();
        }
        close_fds();

        ::signal(SIGPIPE, SIG_IGN);

        auto args = build_argv(cfg_);
        auto argv = detail::to_c_array(args);

        std::vector<std::string> env_entries{};
        std::vector<char*> envp{};
        if (!cfg_.container && !cfg_.environment.empty()) {
            env_entries = detail::merged_environment(cfg_.environment);
            envp = detail::to_c_array(env_entries);
        }

        log_info("launching MCP server: ", utils::join_with_separator(args, " "sv));

        int in_pipe[2]{-1, -1};
        int out_pipe[2]{-1, -1};
        int err_pipe[2]{-1, -1};
        int exec_pipe[2]{-1, -1};
        int wake_pipe[2]{-1, -1};
        if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
            ::pipe2(err_pipe, O_CLOEXEC) != 0 || ::pipe2(exec_pipe, O_CLOEXEC) != 0 ||
            ::pipe2(wake_pipe, O_CLOEXEC) != 0) {
            auto err = errno;
            detail::close_pair(in_pipe);
            detail::close_pair(out_pipe);
            detail::close_pair(err_pipe);
            detail::close_pair(exec_pipe);
            detail::close_pair(wake_pipe);
            throw rpc_error(rpc_errc::spawn_failed, "pipe() failed: {}"_format(std::strerror(err)));
        }

        auto pid = ::fork();
        if (pid < 0) {
            auto err = errno;
            detail::close_pair(in_pipe);
            detail::close_pair(out_pipe);
            detail::close_pair(err_pipe);
            detail::close_pair(exec_pipe);
            detail::close_pair(wake_pipe);
            throw rpc_error(rpc_errc::spawn_failed, "fork() failed: {}"_format(std::strerror(err)));
        }

        if (pid == 0) {
            ::dup2(in_pipe[0], STDIN_FILENO);
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::dup2(err_pipe[1], STDERR_FILENO);
            ::signal(SIGPIPE, SIG_DFL);

            if (envp.empty()) {
                ::execvp(argv[0], argv.data());
            }
            else {
                ::execvpe(argv[0], argv.data(), envp.data());
            }
            // exec_pipe is close-on-exec: the parent reads EOF on success, errno on failure
            int err = errno;
            auto n = ::write(exec_pipe[1], &err, sizeof(err));
            (void)n;
            _exit(127);
        }

        ::close(in_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[1]);
        ::close(exec_pipe[1]);

        if (auto flags = ::fcntl(in_pipe[1], F_GETFL);
            flags < 0 || ::fcntl(in_pipe[1], F_SETFL, flags | O_NONBLOCK) < 0) {
            log_warn("could not make MCP server stdin non-blocking: ", std::strerror(errno));
        }

        int exec_errno{0};
        for (;;) {
            auto n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n != static_cast<ssize_t>(sizeof(exec_errno))) {
                exec_errno = 0;
            }
            break;
        }
        ::close(exec_pipe[0]);

        auto abandon = [&] {
            ::close(in_pipe[1]);
            ::close(out_pipe[0]);
            ::close(err_pipe[0]);
            detail::close_pair(wake_pipe);
        };

        if (exec_errno != 0) {
            ::waitpid(pid, nullptr, 0);
            abandon();
            if (exec_errno == ENOENT) {
                throw rpc_error(
                        rpc_errc::executable_not_found,
                        "MCP server executable not found: {} ({})"_format(args.front(), std::strerror(exec_errno)));
            }
            throw rpc_error(
                    rpc_errc::spawn_failed,
                    "failed to launch MCP server {}: {}"_format(args.front(), std::strerror(exec_errno)));
        }

        // grace window: the child must stay up before it counts as started
        auto deadline = std::chrono::steady_clock::now() + cfg_.spawn_grace;
        for (;;) {
            if (auto status = detail::try_reap(pid)) {
                auto diagnostics = utils::trim_view(detail::drain_fd_nonblocking(err_pipe[0]));
                abandon();
                std::string message = "MCP server exited during startup ({})"_format(describe(*status));
                if (!diagnostics.empty()) {
                    message += ": {}"_format(diagnostics);
                }
                throw rpc_error(rpc_errc::spawn_failed, message);
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                break;
            }
            std::this_thread::sleep_for(detail::reap_poll);
        }

        {
            std::lock_guard lock{mutex_};
            pid_ = pid;
            reaped_ = false;
            stdin_fd_ = in_pipe[1];
            stdout_fd_ = out_pipe[0];
            stderr_fd_ = err_pipe[0];
            wake_fds_[0] = wake_pipe[0];
            wake_fds_[1] = wake_pipe[1];
        }
        stderr_buffer_.clear();
        stopping_ = false;
        running_ = true;

        log_info("MCP server started (pid ", static_cast<int>(pid), ")");
        reader_ = std::jthread{[this](std::stop_token stop) { reader_loop(stop); }};
    }

    void process_transport::write(std::string_view frame) {
        std::lock_guard wlock{write_mutex_};
        int fd{-1};
        int wake_fd{-1};
        {
            std::lock_guard lock{mutex_};
            fd = stdin_fd_;
            wake_fd = wake_fds_[0];
        }
        if (fd < 0 || !running_.load() || stopping_.load()) {
            throw rpc_error(rpc_errc::not_running, "MCP server process is not running");
        }

        // stdin is non-blocking; a server that stops reading must not wedge the writer or stop()
        auto deadline = std::chrono::steady_clock::now() + cfg_.request_timeout;
        size_t offset = 0;
        while (offset < frame.size()) {
            auto n = ::write(fd, frame.data() + offset, frame.size() - offset);
            if (n >= 0) {
                offset += static_cast<size_t>(n);
                continue;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                throw rpc_error(
                        rpc_errc::write_failed, "write to MCP server failed: {}"_format(std::strerror(errno)));
            }

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                throw rpc_error(
                        rpc_errc::write_failed,
                        "write to MCP server timed out after {}: server is not reading its input"_format(
                                format_ms(cfg_.request_timeout)));
            }

            pollfd fds[2]{};
            fds[0] = {.fd = fd, .events = POLLOUT, .revents = 0};
            fds[1] = {.fd = wake_fd, .events = POLLIN, .revents = 0};
            if (::poll(fds, 2, static_cast<int>(remaining.count())) < 0 && errno != EINTR) {
                throw rpc_error(
                        rpc_errc::write_failed, "poll() on MCP server stdin failed: {}"_format(std::strerror(errno)));
            }
            if (fds[1].revents != 0 || stopping_.load()) {
                throw rpc_error(rpc_errc::not_running, "MCP server is stopping; frame was not fully written");
            }
        }
    }

    void process_transport::stop() {
        std::lock_guard control{control_mutex_};
        stopping_ = true;

        // wakes the reader and any writer parked on a full stdin pipe
        {
            std::lock_guard lock{mutex_};
            if (wake_fds_[1] >= 0) {
                char byte = 1;
                auto n = ::write(wake_fds_[1], &byte, 1);
                (void)n;
            }
        }

        {
            std::lock_guard wlock{write_mutex_};
            std::lock_guard lock{mutex_};
            detail::close_fd(stdin_fd_);
        }

        if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
            reader_.request_stop();
            reader_.join();
        }

        pid_t pid{-1};
        bool reaped{true};
        {
            std::lock_guard lock{mutex_};
            pid = pid_;
            reaped = reaped_;
        }

        if (pid > 0 && !reaped) {
            ::kill(pid, SIGTERM);
            if (!detail::wait_for_exit(pid, detail::stop_grace)) {
                log_warn("MCP server (pid ", static_cast<int>(pid), ") ignored SIGTERM; sending SIGKILL");
                ::kill(pid, SIGKILL);
                ::waitpid(pid, nullptr, 0);
            }
            log_info("MCP server stopped (pid ", static_cast<int>(pid), ")");
        }

        close_fds();
        running_ = false;
    }

    void process_transport::close_fds() {
        std::lock_guard lock{mutex_};
        detail::close_fd(stdin_fd_);
        detail::close_fd(stdout_fd_);
        detail::close_fd(stderr_fd_);
        detail::close_pair(wake_fds_);
        pid_ = -1;
        reaped_ = false;
    }

    void process_transport::forward_stderr(std::string_view chunk) {
        stderr_buffer_.append(chunk);
        size_t start = 0;
        for (auto nl = stderr_buffer_.find('\n'); nl != std::string::npos; nl = stderr_buffer_.find('\n', start)) {
            auto line = utils::trim_view(std::string_view{stderr_buffer_}.substr(start, nl - start));
            if (!line.empty()) {
                log_info("server stderr: ", line);
            }
            start = nl + 1;
        }
        stderr_buffer_.erase(0, start);
    }

    void process_transport::reader_loop(std::stop_token stop) {
        pid_t pid{};
        int out_fd{};
        int err_fd{};
        int wake_fd{};
        {
            std::lock_guard lock{mutex_};
            pid = pid_;
            out_fd = stdout_fd_;
            err_fd = stderr_fd_;
            wake_fd = wake_fds_[0];
        }

        bool out_open = true;
        bool err_open = true;
        std::optional<exit_status> exited{};
        char chunk[4096]{};

        while (!stop.stop_requested()) {
            pollfd fds[3]{};
            fds[0] = {.fd = out_open ? out_fd : -1, .events = POLLIN, .revents = 0};
            fds[1] = {.fd = err_open ? err_fd : -1, .events = POLLIN, .revents = 0};
            fds[2] = {.fd = wake_fd, .events = POLLIN, .revents = 0};

            // once stdout is gone, poll the child's status between waits
            int ret = ::poll(fds, 3, out_open ? -1 : static_cast<int>(detail::reap_poll.count() * 5));
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                auto message = "poll() on MCP server pipes failed: {}"_format(std::strerror(errno));
                log_error(message);
                if (on_error_) {
                    on_error_(message);
                }
                break;
            }
            if (fds[2].revents != 0) {
                break;
            }

            if (out_open && (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                auto n = ::read(out_fd, chunk, sizeof(chunk));
                if (n > 0) {
                    if (on_data_) {
                        try {
                            on_data_(std::string_view{chunk, static_cast<size_t>(n)});
                        } catch (const std::exception& e) {
                            log_error("stdout handler threw: ", e.what());
                        }
                    }
                }
                else if (n == 0 || errno != EINTR) {
                    out_open = false;
                }
            }

            if (err_open && (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                auto n = ::read(err_fd, chunk, sizeof(chunk));
                if (n > 0) {
                    forward_stderr(std::string_view{chunk, static_cast<size_t>(n)});
                }
                else if (n == 0 || errno != EINTR) {
                    err_open = false;
                }
            }

            if (!out_open) {
                if (auto status = detail::try_reap(pid)) {
                    exited = status;
                    break;
                }
            }
        }

        if (!exited) {
            return;
        }

        {
            std::lock_guard lock{mutex_};
            reaped_ = true;
        }
        running_ = false;
        forward_stderr("\n"sv);

        if (stopping_.load()) {
            return;
        }
        log_warn("MCP server exited unexpectedly (", describe(*exited), ")");
        if (on_exit_) {
            try {
                on_exit_(*exited);
            } catch (const std::exception& e) {
                log_error("exit handler threw: ", e.what());
            }
        }
    }

}  // namespace tether
