#include "CallBatcher.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

namespace mcpperf {

CallBatcher::CallBatcher(Executor executor, const BatcherConfig& config)
    : m_executor(std::move(executor))
    , m_config(config)
    , m_timers("call-batcher") {

    if (!m_executor) {
        throw ConfigurationError("CallBatcher requires an executor");
    }
    if (m_config.max_batch_size == 0) {
        throw ConfigurationError("max_batch_size must be greater than zero");
    }

    spdlog::debug("Call batcher initialized (batch size {}, window {}ms)",
                  m_config.max_batch_size, m_config.max_wait.count());
}

CallBatcher::~CallBatcher() {
    // Waits for a batch running on the timer thread
    m_timers.stop();
    cancelAll("Batcher destroyed");
}

std::future<ToolCallResult> CallBatcher::call(const std::string& name, Json args, int priority) {
    QueuedCall queued;
    queued.name = name;
    queued.args = std::move(args);
    queued.priority = priority;
    queued.enqueuedAt = Clock::now();
    auto future = queued.promise.get_future();

    std::lock_guard<std::mutex> lock(m_mutex);
    queued.sequence = m_nextSequence++;
    insertLocked(std::move(queued));
    ++m_stats.totalCalls;

    scheduleFlushLocked();
    return future;
}

ToolCallResult CallBatcher::callImmediate(const std::string& name, const Json& args) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_stats.totalCalls;
        ++m_stats.totalBatches;
    }

    auto results = m_executor({ToolCall{name, args}});
    if (results.empty() || !results[0]) {
        throw TransportError("No result returned for call 0");
    }
    return std::move(*results[0]);
}

void CallBatcher::flush() {
    std::vector<QueuedCall> batch;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        cancelWindowLocked();
        m_flushPosted = false;

        if (m_queue.empty() || m_executing) {
            return;
        }

        size_t count = std::min(m_queue.size(), m_config.max_batch_size);
        batch.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            batch.push_back(std::move(m_queue.front()));
            m_queue.pop_front();
        }

        m_executing = true;

        ++m_stats.totalBatches;
        m_stats.callsSaved += count - 1;
        m_stats.averageBatchSize =
            (m_stats.averageBatchSize * static_cast<double>(m_stats.totalBatches - 1) +
             static_cast<double>(count)) / static_cast<double>(m_stats.totalBatches);
    }

    std::vector<ToolCall> calls;
    calls.reserve(batch.size());
    for (const auto& queued : batch) {
        calls.push_back(ToolCall{queued.name, queued.args});
    }

    auto start = Clock::now();
    std::vector<std::optional<ToolCallResult>> results;
    std::exception_ptr error;

    try {
        results = m_executor(calls);
    } catch (...) {
        error = std::current_exception();
    }

    if (error) {
        spdlog::warn("Batch of {} call(s) failed: {}", batch.size(),
                     ErrorHandler::describe(error));
        for (auto& queued : batch) {
            queued.promise.set_exception(error);
        }
    } else {
        for (size_t i = 0; i < batch.size(); ++i) {
            if (i < results.size() && results[i]) {
                batch[i].promise.set_value(std::move(*results[i]));
            } else {
                batch[i].promise.set_exception(std::make_exception_ptr(
                    TransportError("No result returned for call " + std::to_string(i))));
            }
        }
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);

    BatchCallback onBatch;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_executing = false;
        onBatch = m_onBatch;

        if (!m_queue.empty()) {
            scheduleFlushLocked();
        }
    }

    if (!error) {
        spdlog::debug("Executed batch of {} call(s) in {}ms", batch.size(), duration.count());
        if (onBatch) {
            try {
                onBatch(batch.size(), duration);
            } catch (...) {
                spdlog::warn("onBatch callback failed: {}",
                             ErrorHandler::describe(std::current_exception()));
            }
        }
    }
}

void CallBatcher::cancelAll(const std::string& reason) {
    std::list<QueuedCall> cancelled;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        cancelWindowLocked();
        cancelled.swap(m_queue);
    }

    if (cancelled.empty()) {
        return;
    }

    auto error = std::make_exception_ptr(BatchCancelledError(reason));
    for (auto& queued : cancelled) {
        queued.promise.set_exception(error);
    }
    spdlog::debug("Cancelled {} queued call(s): {}", cancelled.size(), reason);
}

BatcherStats CallBatcher::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

void CallBatcher::resetStats() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats = BatcherStats{};
}

size_t CallBatcher::pendingCalls() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

void CallBatcher::onBatch(BatchCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_onBatch = std::move(callback);
}

void CallBatcher::insertLocked(QueuedCall queued) {
    // Sequence numbers only grow, so the new call goes after every equal priority
    auto pos = std::find_if(m_queue.begin(), m_queue.end(), [&queued](const QueuedCall& other) {
        return other.priority < queued.priority;
    });
    m_queue.insert(pos, std::move(queued));
}

void CallBatcher::scheduleFlushLocked() {
    if (m_config.execute_on_full && m_queue.size() >= m_config.max_batch_size) {
        cancelWindowLocked();
        if (!m_flushPosted) {
            m_flushPosted = m_timers.scheduleAfter(std::chrono::milliseconds(0),
                                                   [this] { flush(); }) != 0;
        }
        return;
    }

    // The window opens with the first queued call and is never restarted
    if (m_windowTimer == 0 && !m_executing) {
        m_windowTimer = m_timers.scheduleAfter(m_config.max_wait, [this] { flush(); });
    }
}

void CallBatcher::cancelWindowLocked() {
    if (m_windowTimer != 0) {
        m_timers.cancel(m_windowTimer);
        m_windowTimer = 0;
    }
}

CallBatcher::Executor makeParallelExecutor(std::function<ToolCallResult(const ToolCall&)> callFn,
                                           size_t concurrency) {
    if (!callFn) {
        throw ConfigurationError("Parallel executor requires a call function");
    }

    return [callFn = std::move(callFn), concurrency](const std::vector<ToolCall>& calls) {
        std::vector<std::optional<ToolCallResult>> results(calls.size());
        size_t window = concurrency == 0 ? calls.size() : concurrency;

        for (size_t begin = 0; begin < calls.size(); begin += window) {
            size_t end = std::min(calls.size(), begin + window);

            std::vector<std::future<ToolCallResult>> inflight;
            inflight.reserve(end - begin);
            for (size_t i = begin; i < end; ++i) {
                inflight.push_back(std::async(std::launch::async, callFn, std::cref(calls[i])));
            }

            for (size_t i = begin; i < end; ++i) {
                try {
                    results[i] = inflight[i - begin].get();
                } catch (...) {
                    spdlog::debug("Call {} ({}) failed: {}", i, calls[i].name,
                                  ErrorHandler::describe(std::current_exception()));
                }
            }
        }

        return results;
    };
}

}  // namespace mcpperf
