/**
 * @file inline_concurrent_executor.hpp
 * @brief InlineConcurrentExecutor: pool-less concurrent execution.
 */
#pragma once
#include "workpool/execution/executor.hpp"
#include "workpool/execution/pool_config.hpp"
#include "workpool/execution/task_handler_registry.hpp"
#include <condition_variable>

namespace workpool
{

/**
 * @brief Configuration for InlineConcurrentExecutor.
 */
struct InlineExecutorConfig
{
    /**
     * @brief Maximum number of tasks running at once. Must be positive.
     */
    int max_concurrency{default_worker_count()};

    bool verbose{false};
};

/**
 * @brief Check an InlineExecutorConfig.
 * @throws ConfigurationError if max_concurrency is not positive.
 */
void validate(const InlineExecutorConfig& config);

/**
 * @brief Executor that runs tasks concurrently inside the calling process.
 *
 * @details
 * Same contract as WorkerPool, without isolation. process() runs the batch on
 * up to max_concurrency asynchronous lanes, starting tasks in priority order
 * (input order among equal priorities); submit() runs the task on the calling
 * thread. Every task goes through run_task(), so a throwing handler yields a
 * failed TaskResult instead of an exception.
 *
 * Differences from WorkerPool:
 * - A handler that crashes the process takes the caller down with it.
 * - There is no task timeout: a handler that blocks stalls its lane, and
 *   the batch waits for it.
 * - TaskResult::worker_id is the lane index.
 *
 * @par Thread Safety
 * - All public methods may be called from any thread.
 * - shutdown() waits for every in-flight submit()/process() call to return.
 */
class InlineConcurrentExecutor : public Executor
{
public:
    /**
     * @brief Construct an inline executor.
     * @throws ConfigurationError if @p config is invalid or @p registry is null.
     */
    InlineConcurrentExecutor(InlineExecutorConfig config, TaskHandlerRegistryPtr registry);
    ~InlineConcurrentExecutor() override;

    InlineConcurrentExecutor(const InlineConcurrentExecutor&) = delete;
    InlineConcurrentExecutor& operator=(const InlineConcurrentExecutor&) = delete;

    using Executor::process;

    TaskResult submit(Task task) override;

    std::vector<TaskResult> process(
        const std::vector<Task>& tasks,
        ResultCallback on_result) override;

    PoolStats stats() const override;

    void shutdown() override;

private:
    /**
     * @brief RAII registration of an in-flight public call.
     */
    class CallGuard
    {
    public:
        explicit CallGuard(InlineConcurrentExecutor& owner);
        ~CallGuard();

        CallGuard(const CallGuard&) = delete;
        CallGuard& operator=(const CallGuard&) = delete;

    private:
        InlineConcurrentExecutor& m_owner;
    };

    TaskResult run_counted(const Task& task, int lane);

    InlineExecutorConfig m_config;
    TaskHandlerRegistryPtr m_registry;

    std::atomic<size_t> m_busy{0};
    std::atomic<std::uint64_t> m_processed{0};

    mutable std::mutex m_calls_mutex;
    std::condition_variable m_calls_cv;
    size_t m_calls_in_flight{0};
};

/**
 * @brief Factory function to create an InlineConcurrentExecutor.
 */
inline std::shared_ptr<InlineConcurrentExecutor> make_inline_executor(
    InlineExecutorConfig config,
    TaskHandlerRegistryPtr registry)
{
    return std::make_shared<InlineConcurrentExecutor>(std::move(config), std::move(registry));
}

} // namespace workpool
