#pragma once

/**
 * @file CallBatcher.hpp
 * @brief Collects tool calls over a short window and executes them as one batch.
 */

#include "Config.hpp"
#include "TimerQueue.hpp"
#include "Types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpperf {

/**
 * @class CallBatcher
 * @brief Time-windowed, priority-ordered batching of tool calls.
 *
 * Calls are queued and handed to the executor in groups of at most
 * max_batch_size, either when the max_wait window closes or, with
 * execute_on_full, as soon as a full batch is queued. Higher priority calls
 * leave the queue first; equal priorities keep their arrival order.
 *
 * Thread Safety:
 * - All public methods are thread-safe.
 * - At most one batch executes at a time. The executor is always called
 *   without the batcher's mutex held.
 *
 * Usage:
 * @code
 *   CallBatcher batcher(executor, {.max_batch_size = 5});
 *   auto first = batcher.call("search", {{"q", "a"}});
 *   auto second = batcher.call("search", {{"q", "b"}}, 10);
 *   auto result = first.get();
 * @endcode
 */
class CallBatcher {
public:
    /**
     * @brief Executes a batch; result i answers call i.
     *
     * A std::nullopt (or a missing trailing entry) fails only that call.
     * Throwing fails every call in the batch.
     */
    using Executor = std::function<std::vector<std::optional<ToolCallResult>>(
        const std::vector<ToolCall>&)>;

    using BatchCallback = std::function<void(size_t batchSize, std::chrono::milliseconds duration)>;

    /**
     * @throws ConfigurationError if executor is empty or max_batch_size is zero.
     */
    explicit CallBatcher(Executor executor, const BatcherConfig& config = {});

    /**
     * @brief Stops the flush timer and cancels queued calls with "Batcher destroyed".
     */
    ~CallBatcher();

    CallBatcher(const CallBatcher&) = delete;
    CallBatcher& operator=(const CallBatcher&) = delete;

    /**
     * @brief Queue a call for the next batch.
     * @param priority Higher values are executed first.
     * @return Future resolved with the call's result, or holding its failure.
     */
    std::future<ToolCallResult> call(const std::string& name,
                                     Json args = Json::object(),
                                     int priority = 0);

    /**
     * @brief Execute a single call now, bypassing the queue.
     */
    ToolCallResult callImmediate(const std::string& name, const Json& args = Json::object());

    /**
     * @brief Execute up to max_batch_size queued calls in the calling thread.
     *
     * Returns immediately if the queue is empty or another batch is executing.
     */
    void flush();

    /**
     * @brief Fail every queued call with BatchCancelledError(reason).
     *
     * Calls already handed to the executor are not affected.
     */
    void cancelAll(const std::string& reason = "Cancelled");

    BatcherStats getStats() const;
    void resetStats();

    size_t pendingCalls() const;

    // Called after each successful batch, outside the batcher's lock
    void onBatch(BatchCallback callback);

    const BatcherConfig& config() const { return m_config; }

private:
    using Clock = std::chrono::steady_clock;

    struct QueuedCall {
        std::string name;
        Json args;
        int priority = 0;
        uint64_t sequence = 0;
        Clock::time_point enqueuedAt;
        std::promise<ToolCallResult> promise;
    };

    void insertLocked(QueuedCall queued);
    void scheduleFlushLocked();
    void cancelWindowLocked();

    Executor m_executor;
    BatcherConfig m_config;
    BatchCallback m_onBatch;

    std::list<QueuedCall> m_queue;  ///< Sorted by (priority desc, sequence asc)
    uint64_t m_nextSequence = 0;
    TimerQueue::TimerId m_windowTimer = 0;
    bool m_flushPosted = false;
    bool m_executing = false;

    BatcherStats m_stats;

    mutable std::mutex m_mutex;
    TimerQueue m_timers;
};

/**
 * @brief Build an executor that runs each call of a batch on its own worker.
 * @param callFn Executes one call; usually a pooled Connection::callTool.
 * @param concurrency Maximum calls in flight at once, 0 for unlimited.
 *
 * A call that throws yields std::nullopt, so only that call fails.
 */
CallBatcher::Executor makeParallelExecutor(std::function<ToolCallResult(const ToolCall&)> callFn,
                                           size_t concurrency = 0);

}  // namespace mcpperf
