#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace tether {

    using timer_id = uint64_t;

    /*
     * Single-threaded deadline scheduler.
     *
     * Callbacks run on the queue's own thread with no lock held, so a
     * callback may schedule or cancel other timers. cancel() returns true
     * only when the timer had not yet been dequeued; after that point the
     * callback is either running or done.
     */
    class timer_queue {
      public:
        using clock = std::chrono::steady_clock;
        using callback = std::function<void()>;

        timer_queue();
        ~timer_queue();

        timer_queue(const timer_queue&) = delete;
        timer_queue& operator=(const timer_queue&) = delete;

        timer_id schedule_after(std::chrono::milliseconds delay, callback fn);
        bool cancel(timer_id id);

        // Drops every pending timer without running it and joins the thread
        void shutdown();

        size_t pending() const;

      private:
        void run(std::stop_token stop);

        mutable std::mutex mutex_{};
        std::condition_variable_any cv_{};
        // ordered by (deadline, id) so equal deadlines fire in scheduling order
        std::map<std::pair<clock::time_point, timer_id>, callback> timers_{};
        std::map<timer_id, clock::time_point> deadlines_{};
        timer_id next_id_{0};
        std::jthread worker_{};
    };

}  // namespace tether
