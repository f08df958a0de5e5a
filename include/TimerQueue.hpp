#pragma once

/**
 * @file TimerQueue.hpp
 * @brief Single-threaded scheduler for one-shot and periodic background tasks.
 *
 * Each component that needs background work (pool maintenance, batch flush
 * windows, cache auto-refresh) owns one TimerQueue. Tasks run one at a time on
 * the queue's worker thread, in due-time order.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace mcpperf {

/**
 * @class TimerQueue
 * @brief Time-ordered task queue served by a dedicated worker thread.
 *
 * Thread Safety:
 * - schedule/cancel/stop may be called from any thread, including from a task
 *   running on the worker itself.
 * - Tasks never run concurrently with each other.
 *
 * A task that throws is logged and does not affect other tasks; a periodic task
 * keeps its schedule after a failure.
 */
class TimerQueue {
public:
    using TimerId = uint64_t;
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Start the worker thread.
     * @param name Label used in log messages.
     */
    explicit TimerQueue(std::string name);

    /**
     * @brief Destructor - stops the worker and discards pending tasks.
     */
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    /**
     * @brief Run a task once after a delay.
     * @return Timer id usable with cancel(), or 0 if the queue is stopped.
     */
    TimerId scheduleAfter(std::chrono::milliseconds delay, Task task);

    /**
     * @brief Run a task repeatedly; the first run happens one interval from now.
     * @return Timer id usable with cancel(), or 0 if the queue is stopped.
     */
    TimerId scheduleEvery(std::chrono::milliseconds interval, Task task);

    /**
     * @brief Remove a pending task.
     * @return true if the timer was still registered.
     *
     * Cancelling a task that is currently running only prevents later runs.
     */
    bool cancel(TimerId id);

    /**
     * @brief Stop the worker thread and drop every pending task.
     *
     * Blocks until a running task finishes. Called from a task on the worker,
     * it only marks the queue stopped; the worker is joined by the destructor.
     * Idempotent.
     */
    void stop();

    bool isRunning() const;

    // Number of registered timers (one-shot and periodic)
    size_t pendingCount() const;

private:
    struct Timer {
        Task task;
        std::chrono::milliseconds interval{0};  // zero for one-shot timers
        std::multimap<Clock::time_point, TimerId>::iterator slot;
        bool scheduled = false;
    };

    // Owned jointly with the worker, which may outlive the queue when the
    // queue is destroyed from one of its own tasks
    struct State {
        explicit State(std::string queueName) : name(std::move(queueName)) {}

        std::string name;
        std::multimap<Clock::time_point, TimerId> schedule;
        std::unordered_map<TimerId, Timer> timers;
        TimerId nextId = 1;
        bool stopping = false;
        std::thread::id workerId;

        std::mutex mutex;
        std::condition_variable cv;
    };

    TimerId add(Clock::time_point due, std::chrono::milliseconds interval, Task task);
    static void run(std::shared_ptr<State> state);

    std::shared_ptr<State> m_state;
    std::mutex m_joinMutex;
    std::thread m_thread;
};

}  // namespace mcpperf
