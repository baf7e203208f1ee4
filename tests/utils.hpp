#pragma once

#include "tether/tether.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace tether::test {

    using namespace std::chrono_literals;
    using namespace std::string_view_literals;

    namespace detail {
        namespace fs = std::filesystem;

        struct temp_dir {
            fs::path path{};

            explicit temp_dir(std::string_view prefix) {
                auto now = std::chrono::system_clock::now().time_since_epoch().count();
                std::ostringstream dir_name{};
                dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
                path = fs::temp_directory_path() / dir_name.str();
                fs::create_directories(path);
            }

            ~temp_dir() {
                std::error_code ec{};
                fs::remove_all(path, ec);
            }

            temp_dir(const temp_dir&) = delete;
            temp_dir& operator=(const temp_dir&) = delete;
        };

        inline void write_file(const fs::path& p, std::string_view content) {
            std::ofstream out{p};
            REQUIRE(out.good());
            out << content;
        }

        inline std::vector<char*> to_argv(std::vector<std::string>& args) {
            std::vector<char*> argv{};
            argv.reserve(args.size());
            for (auto& arg : args) {
                argv.push_back(arg.data());
            }
            return argv;
        }

        // Collects events from any thread and lets the test block until a predicate holds
        template <typename Event>
        class recorder {
          public:
            void operator()(const Event& ev) {
                {
                    std::lock_guard lock{mutex_};
                    events_.push_back(ev);
                }
                cv_.notify_all();
            }

            template <typename Pred>
            bool wait_for(Pred&& pred, std::chrono::milliseconds timeout = 10s) {
                std::unique_lock lock{mutex_};
                return cv_.wait_for(lock, timeout, [&] { return pred(events_); });
            }

            template <typename T>
            size_t count() const {
                std::lock_guard lock{mutex_};
                return static_cast<size_t>(std::ranges::count_if(
                        events_, [](const Event& ev) { return std::holds_alternative<T>(ev); }));
            }

            template <typename T>
            std::vector<T> all() const {
                std::lock_guard lock{mutex_};
                std::vector<T> out{};
                for (const auto& ev : events_) {
                    if (auto* e = std::get_if<T>(&ev)) {
                        out.push_back(*e);
                    }
                }
                return out;
            }

            std::vector<Event> snapshot() const {
                std::lock_guard lock{mutex_};
                return events_;
            }

          private:
            mutable std::mutex mutex_{};
            std::condition_variable cv_{};
            std::vector<Event> events_{};
        };

        template <typename T>
        inline auto has = [](size_t n = 1U) {
            return [n](const auto& events) {
                return static_cast<size_t>(std::ranges::count_if(
                               events, [](const auto& ev) { return std::holds_alternative<T>(ev); })) >= n;
            };
        };

        // Records every frame written by a correlator under test
        struct captured_writes {
            std::mutex mutex{};
            std::vector<std::string> frames{};

            void operator()(std::string_view frame) {
                std::lock_guard lock{mutex};
                frames.emplace_back(frame);
            }

            std::vector<std::string> snapshot() {
                std::lock_guard lock{mutex};
                return frames;
            }
        };

        inline std::string response_line(int64_t id, std::string_view result_json) {
            return R"({"jsonrpc":"2.0","id":)" + std::to_string(id) + R"(,"result":)" + std::string{result_json} +
                   "}\n";
        }

        inline std::string error_line(int64_t id, int code, std::string_view message) {
            return R"({"jsonrpc":"2.0","id":)" + std::to_string(id) + R"(,"error":{"code":)" + std::to_string(code) +
                   R"(,"message":")" + std::string{message} + "\"}}\n";
        }

        template <typename Pred>
        bool eventually(Pred&& pred, std::chrono::milliseconds timeout = 10s) {
            auto deadline = std::chrono::steady_clock::now() + timeout;
            while (!pred()) {
                if (std::chrono::steady_clock::now() >= deadline) {
                    return false;
                }
                std::this_thread::sleep_for(5ms);
            }
            return true;
        }

        template <typename F>
        std::optional<rpc_errc> error_code_of(F&& fn) {
            try {
                fn();
            } catch (const rpc_error& e) {
                return e.code();
            }
            return std::nullopt;
        }

        inline std::future<glz::raw_json> ready_result(std::string json) {
            std::promise<glz::raw_json> promise{};
            promise.set_value(glz::raw_json{std::move(json)});
            return promise.get_future();
        }

        inline std::future<glz::raw_json> failed_result(rpc_errc code, const std::string& message) {
            std::promise<glz::raw_json> promise{};
            promise.set_exception(std::make_exception_ptr(rpc_error(code, message)));
            return promise.get_future();
        }

        inline std::string text_result(std::string_view text, bool is_error = false) {
            mcp::tool_result result{};
            result.content.push_back(mcp::content_part{.type = "text", .text = std::string{text}});
            result.isError = is_error;
            std::string json{};
            REQUIRE_FALSE(glz::write_json(result, json));
            return json;
        }

        // rpc_channel whose answers come from a test-supplied script
        class scripted_channel final : public rpc_channel {
          public:
            struct call {
                std::string method{};
                std::string params{};
                std::chrono::milliseconds timeout{};
                std::chrono::steady_clock::time_point at{};
            };

            // index is the 0-based call number
            using script = std::function<std::future<glz::raw_json>(size_t index, scripted_channel& self)>;

            explicit scripted_channel(script fn) : script_{std::move(fn)} {}

            std::future<glz::raw_json> send_request(
                    std::string_view method, std::string_view params_json, std::chrono::milliseconds timeout) override {
                size_t index{};
                {
                    std::lock_guard lock{mutex_};
                    index = calls_.size();
                    calls_.push_back(
                            call{.method = std::string{method},
                                 .params = std::string{params_json},
                                 .timeout = timeout,
                                 .at = std::chrono::steady_clock::now()});
                }
                cv_.notify_all();
                return script_(index, *this);
            }

            // A future that stays unresolved until release()
            std::future<glz::raw_json> park() {
                std::lock_guard lock{mutex_};
                return parked_.emplace_back().get_future();
            }

            void release(const std::string& json) {
                std::lock_guard lock{mutex_};
                for (auto& promise : parked_) {
                    promise.set_value(glz::raw_json{json});
                }
                parked_.clear();
            }

            bool wait_for_calls(size_t n, std::chrono::milliseconds timeout = 10s) {
                std::unique_lock lock{mutex_};
                return cv_.wait_for(lock, timeout, [&] { return calls_.size() >= n; });
            }

            std::vector<call> calls() const {
                std::lock_guard lock{mutex_};
                return calls_;
            }

            size_t call_count() const {
                std::lock_guard lock{mutex_};
                return calls_.size();
            }

          private:
            script script_;
            mutable std::mutex mutex_{};
            std::condition_variable cv_{};
            std::vector<call> calls_{};
            std::deque<std::promise<glz::raw_json>> parked_{};
        };

#ifdef TETHER_FAKE_SERVER_PATH
        inline transport_config fake_server_config(std::vector<std::string> args = {}) {
            transport_config cfg{};
            cfg.executable = TETHER_FAKE_SERVER_PATH;
            cfg.arguments = std::move(args);
            cfg.request_timeout = 5s;
            cfg.spawn_grace = 200ms;
            cfg.reconnect_attempts = 3;
            cfg.reconnect_delay = 10ms;
            cfg.reconnect_delay_cap = 1s;
            cfg.health_check_enabled = false;
            return cfg;
        }
#endif

    }  // namespace detail

}  // namespace tether::test
