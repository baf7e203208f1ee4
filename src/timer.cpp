#include "tether/timer.hpp"

#include "tether/utils.hpp"

#include <exception>

namespace tether {

    timer_queue::timer_queue() : worker_{[this](std::stop_token stop) { run(stop); }} {}

    timer_queue::~timer_queue() {
        shutdown();
    }

    timer_id timer_queue::schedule_after(std::chrono::milliseconds delay, callback fn) {
        auto deadline = clock::now() + delay;
        timer_id id{};
        {
            std::lock_guard lock{mutex_};
            id = ++next_id_;
            timers_.emplace(std::pair{deadline, id}, std::move(fn));
            deadlines_.emplace(id, deadline);
        }
        cv_.notify_all();
        return id;
    }

    bool timer_queue::cancel(timer_id id) {
        std::lock_guard lock{mutex_};
        auto it = deadlines_.find(id);
        if (it == deadlines_.end()) {
            return false;
        }
        timers_.erase(std::pair{it->second, id});
        deadlines_.erase(it);
        return true;
    }

    void timer_queue::shutdown() {
        if (!worker_.joinable()) {
            return;
        }
        worker_.request_stop();
        cv_.notify_all();
        worker_.join();

        std::lock_guard lock{mutex_};
        timers_.clear();
        deadlines_.clear();
    }

    size_t timer_queue::pending() const {
        std::lock_guard lock{mutex_};
        return timers_.size();
    }

    void timer_queue::run(std::stop_token stop) {
        std::unique_lock lock{mutex_};
        while (!stop.stop_requested()) {
            if (timers_.empty()) {
                cv_.wait(lock, stop, [this] { return !timers_.empty(); });
                continue;
            }

            auto next = timers_.begin();
            auto deadline = next->first.first;
            if (clock::now() < deadline) {
                // woken early by a new, earlier timer or by cancel(); re-evaluate either way
                cv_.wait_until(lock, stop, deadline, [this, deadline] {
                    return timers_.empty() || timers_.begin()->first.first < deadline;
                });
                continue;
            }

            auto fn = std::move(next->second);
            deadlines_.erase(next->first.second);
            timers_.erase(next);

            lock.unlock();
            try {
                fn();
            } catch (const std::exception& e) {
                log_error("timer callback threw: ", e.what());
            }
            lock.lock();
        }
    }

}  // namespace tether
