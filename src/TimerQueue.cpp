#include "TimerQueue.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <exception>

namespace mcpperf {

TimerQueue::TimerQueue(std::string name)
    : m_state(std::make_shared<State>(std::move(name))) {
    m_thread = std::thread(&TimerQueue::run, m_state);
}

TimerQueue::~TimerQueue() {
    stop();

    std::lock_guard<std::mutex> join(m_joinMutex);
    if (m_thread.joinable()) {
        // Destroyed from one of our own tasks; the worker exits once that task returns
        m_thread.detach();
    }
}

TimerQueue::TimerId TimerQueue::scheduleAfter(std::chrono::milliseconds delay, Task task) {
    if (delay.count() < 0) {
        delay = std::chrono::milliseconds(0);
    }
    return add(Clock::now() + delay, std::chrono::milliseconds(0), std::move(task));
}

TimerQueue::TimerId TimerQueue::scheduleEvery(std::chrono::milliseconds interval, Task task) {
    if (interval.count() <= 0) {
        throw ConfigurationError("Timer interval must be positive");
    }
    return add(Clock::now() + interval, interval, std::move(task));
}

TimerQueue::TimerId TimerQueue::add(Clock::time_point due,
                                    std::chrono::milliseconds interval,
                                    Task task) {
    std::lock_guard<std::mutex> lock(m_state->mutex);

    if (m_state->stopping) {
        spdlog::debug("[{}] Ignoring timer scheduled after stop", m_state->name);
        return 0;
    }

    TimerId id = m_state->nextId++;
    Timer& timer = m_state->timers[id];
    timer.task = std::move(task);
    timer.interval = interval;
    timer.slot = m_state->schedule.emplace(due, id);
    timer.scheduled = true;

    m_state->cv.notify_one();
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(m_state->mutex);

    auto it = m_state->timers.find(id);
    if (it == m_state->timers.end()) {
        return false;
    }

    if (it->second.scheduled) {
        m_state->schedule.erase(it->second.slot);
    }
    m_state->timers.erase(it);
    m_state->cv.notify_one();
    return true;
}

void TimerQueue::stop() {
    bool onWorker = false;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->stopping = true;
        m_state->schedule.clear();
        m_state->timers.clear();
        onWorker = m_state->workerId == std::this_thread::get_id();
    }
    m_state->cv.notify_all();

    // A task cannot wait for itself; the destructor joins from the owner's thread
    if (onWorker) {
        return;
    }

    std::lock_guard<std::mutex> join(m_joinMutex);
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

bool TimerQueue::isRunning() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return !m_state->stopping;
}

size_t TimerQueue::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->timers.size();
}

void TimerQueue::run(std::shared_ptr<State> state) {
    std::unique_lock<std::mutex> lock(state->mutex);
    state->workerId = std::this_thread::get_id();

    while (!state->stopping) {
        if (state->schedule.empty()) {
            state->cv.wait(lock);
            continue;
        }

        auto next = state->schedule.begin();
        if (Clock::now() < next->first) {
            state->cv.wait_until(lock, next->first);
            continue;
        }

        TimerId id = next->second;
        state->schedule.erase(next);

        auto it = state->timers.find(id);
        if (it == state->timers.end()) {
            continue;
        }

        it->second.scheduled = false;
        bool periodic = it->second.interval.count() > 0;
        Task task;
        if (periodic) {
            task = it->second.task;
        } else {
            task = std::move(it->second.task);
            state->timers.erase(it);
        }

        lock.unlock();
        try {
            task();
        } catch (...) {
            spdlog::error("[{}] Timer task {} failed: {}", state->name, id,
                          ErrorHandler::describe(std::current_exception()));
        }
        // Release captures outside the lock
        task = nullptr;
        lock.lock();

        if (periodic && !state->stopping) {
            auto again = state->timers.find(id);
            if (again != state->timers.end() && !again->second.scheduled) {
                again->second.slot = state->schedule.emplace(Clock::now() + again->second.interval, id);
                again->second.scheduled = true;
            }
        }
    }
}

}  // namespace mcpperf
