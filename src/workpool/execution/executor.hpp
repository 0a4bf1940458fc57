/**
 * @file executor.hpp
 * @brief IExecutor interface and the Executor base class.
 */
#pragma once
#include "workpool/common/common.hpp"
#include "workpool/execution/task.hpp"

namespace workpool
{

/**
 * @brief Callback fired once per task as its result becomes available.
 * @param index Position of the task in the batch passed to process().
 * @param result The task's result.
 */
using ResultCallback = std::function<void(size_t index, const TaskResult& result)>;

/**
 * @brief Interface for task executors.
 *
 * @details
 * IExecutor defines the contract shared by the pooled and the inline
 * executor, so callers never depend on which one is active.
 *
 * - Task-level failures never throw; they come back as failed TaskResults.
 * - process() returns results index-aligned with its input regardless of
 *   completion order.
 * - After shutdown(), submissions resolve immediately as TaskFailure::Rejected.
 *
 * @par Thread Safety
 * - submit(), process() and stats() may be called from any thread,
 *   concurrently.
 * - shutdown() may be called from any thread; it blocks until done.
 */
class IExecutor
{
public:
    virtual ~IExecutor() = default;

    /**
     * @brief Run one task and wait for its result.
     */
    virtual TaskResult submit(Task task) = 0;

    /**
     * @brief Run a batch of tasks and wait for all of them.
     * @param tasks The batch. Ids should be unique within it.
     * @param on_result Optional; called as each result resolves, possibly
     *        from another thread and concurrently for different tasks.
     * @return One result per task, results[i] belonging to tasks[i].
     */
    virtual std::vector<TaskResult> process(
        const std::vector<Task>& tasks,
        ResultCallback on_result) = 0;

    /**
     * @brief Run a batch of tasks without per-result notification.
     */
    std::vector<TaskResult> process(const std::vector<Task>& tasks)
    {
        return process(tasks, ResultCallback{});
    }

    /**
     * @brief Get a point-in-time utilization snapshot.
     */
    virtual PoolStats stats() const = 0;

    /**
     * @brief Stop accepting work, finish or terminate in-flight tasks and
     *        release resources. Idempotent.
     */
    virtual void shutdown() = 0;

    /**
     * @brief Check whether shutdown() has been called.
     */
    virtual bool is_shut_down() const noexcept = 0;
};

using ExecutorPtr = std::shared_ptr<IExecutor>;

/**
 * @brief Base class for executor implementations.
 *
 * @details
 * Provides common functionality for executors:
 * - Shutdown flag handling
 * - Batch sanity checks
 * - Rejected-result construction
 */
class Executor : public IExecutor
{
public:
    Executor() = default;
    virtual ~Executor() = default;

    using IExecutor::process;

    bool is_shut_down() const noexcept override;

protected:
    /**
     * @brief Set the shutdown flag.
     * @return True if this call set it, false if it was already set.
     */
    bool begin_shutdown() noexcept;

    /**
     * @brief Log a warning for every id that occurs more than once in a batch.
     * @param owner Executor name used in the log message.
     */
    static void check_batch(const std::vector<Task>& tasks, const char* owner);

    /**
     * @brief Result for a task submitted after shutdown.
     */
    static TaskResult rejected(const Task& task);

    std::atomic<bool> m_shutting_down{false};
};

} // namespace workpool
