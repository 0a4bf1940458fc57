/**
 * @file worker_pool.hpp
 * @brief WorkerPool: crash-tolerant pool of isolated worker processes.
 */
#pragma once
#include "workpool/execution/executor.hpp"
#include "workpool/execution/inline_concurrent_executor.hpp"
#include "workpool/execution/pool_config.hpp"
#include "workpool/execution/task_handler_registry.hpp"
#include "workpool/execution/task_queue.hpp"
#include "workpool/execution/worker.hpp"
#include <future>
#include <thread>

namespace workpool
{

/**
 * @brief Fixed-size pool of worker processes with a serialized dispatcher.
 *
 * @details
 * The pool owns `max_workers` worker slots. A single dispatcher thread owns
 * the TaskQueue and the slot table; callers hand submissions to it through a
 * locked inbox and a wake-up pipe, then block on a future. Whenever a slot is
 * idle and the queue is not empty, the dispatcher pops the highest-priority
 * submission and sends it to the idle worker with the fewest completed tasks.
 *
 * Failure handling, all of it inside the dispatcher:
 * - Timeout: a task still running `task_timeout` after dispatch resolves as
 *   TaskFailure::Timeout; its worker is killed and a new one is spawned into
 *   the same slot.
 * - Crash: EOF on a worker channel means the process died. Its task (if any)
 *   resolves as TaskFailure::WorkerCrash and the slot is respawned.
 * - Respawn failure: the slot stays Restarting and is retried after
 *   `restart_backoff`. The slot count never shrinks.
 *
 * If initialize() cannot bring all workers up, the pool logs a warning,
 * marks itself disabled and serves every later call through an
 * InlineConcurrentExecutor with the same contract.
 *
 * @par Thread Safety
 * - submit(), process(), stats() and worker_states() may be called from any
 *   thread, concurrently.
 * - initialize() and shutdown() are serialized internally.
 * - The TaskHandlerRegistry must not change after construction.
 */
class WorkerPool : public Executor
{
public:
    /**
     * @brief Construct a pool. No worker is spawned until initialize().
     * @throws ConfigurationError if @p config is invalid or @p registry is null.
     */
    WorkerPool(PoolConfig config, TaskHandlerRegistryPtr registry);

    /**
     * @brief Shuts the pool down (see shutdown()).
     */
    ~WorkerPool() override;

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    /**
     * @brief Spawn all workers and wait until each reports ready.
     *
     * @details
     * Emits PoolEventType::Ready on success. On failure, falls back to inline
     * execution instead of throwing. Subsequent calls are no-ops; submit()
     * and process() call it implicitly.
     */
    void initialize();

    using Executor::process;

    TaskResult submit(Task task) override;

    std::vector<TaskResult> process(
        const std::vector<Task>& tasks,
        ResultCallback on_result) override;

    PoolStats stats() const override;

    /**
     * @brief Snapshot of every worker slot, ordered by slot id.
     */
    std::vector<WorkerState> worker_states() const;

    /**
     * @brief Stop accepting work and release all workers.
     *
     * @details
     * Queued tasks and later submissions resolve as TaskFailure::Rejected.
     * In-flight tasks get up to `shutdown_grace` to finish; workers still busy
     * after that are killed and their tasks resolve as
     * TaskFailure::Terminated. Returns as soon as no task is in flight.
     * Emits PoolEventType::Shutdown. Idempotent.
     */
    void shutdown() override;

    bool is_initialized() const noexcept
    {
        return m_initialized.load(std::memory_order_acquire);
    }

    /**
     * @brief True if the pool runs on its inline fallback.
     */
    bool is_disabled() const noexcept
    {
        return m_disabled.load(std::memory_order_acquire);
    }

    const PoolConfig& config() const noexcept
    {
        return m_config;
    }

private:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief A submitted task awaiting its result.
     */
    struct Submission
    {
        Task task;
        std::promise<TaskResult> promise;
        ResultCallback callback;
        size_t index{0};

        friend int priority_of(const std::unique_ptr<Submission>& submission) noexcept
        {
            return submission->task.priority;
        }
    };

    using SubmissionPtr = std::unique_ptr<Submission>;

    /**
     * @brief One worker slot. Owned by the dispatcher.
     *
     * @details
     * Restarting with a non-null worker means a replacement was forked and
     * has not reported ready yet; with a null worker it means the next spawn
     * attempt is due at retry_at.
     */
    struct Slot
    {
        int id{0};
        WorkerPtr worker;
        WorkerStatus status{WorkerStatus::Restarting};
        SubmissionPtr current;
        Clock::time_point started{};
        Clock::time_point deadline{};
        Clock::time_point ready_deadline{};
        Clock::time_point retry_at{};
        std::uint64_t tasks_completed{0};
        std::int64_t rss_kb{0};
    };

    // Caller side
    void enqueue_submissions(std::vector<SubmissionPtr> submissions);
    void wake_dispatcher() noexcept;
    void enable_fallback(const std::string& reason);

    // Dispatcher side
    void dispatcher_main();
    void dispatcher_loop();
    bool drain_inbox();
    void assign_work();
    Slot* find_idle_slot();
    void assign(Slot& slot, SubmissionPtr submission);
    void handle_readable(Slot& slot);
    void handle_ready_message(Slot& slot);
    void handle_worker_lost(Slot& slot, const std::string& reason);
    void check_timeouts(Clock::time_point now);
    void retry_restarts(Clock::time_point now);
    void start_restart(Slot& slot);
    void reject_queued();
    void finish_shutdown();
    void abort_all(const std::string& reason);
    int poll_timeout_ms(Clock::time_point now,
                        const std::optional<Clock::time_point>& shutdown_deadline) const;
    std::vector<int> fds_to_close_in_child(const Slot* except) const;
    void resolve(SubmissionPtr submission, TaskResult result);
    void publish_stats();
    void emit(PoolEventType type, int worker_id, std::string task_id, std::string message);

    PoolConfig m_config;
    TaskHandlerRegistryPtr m_registry;
    WorkerOptions m_worker_options;

    // Lifecycle
    std::mutex m_lifecycle_mutex;
    std::atomic<bool> m_initialized{false};
    std::atomic<bool> m_disabled{false};
    std::unique_ptr<InlineConcurrentExecutor> m_fallback;
    std::thread m_dispatcher;
    int m_wake_fds[2]{-1, -1};

    // Inbox (callers → dispatcher)
    std::mutex m_inbox_mutex;
    std::vector<SubmissionPtr> m_inbox;
    bool m_inbox_closed{false};

    // Dispatcher-owned state
    std::vector<Slot> m_slots;
    TaskQueue<SubmissionPtr> m_queue;
    std::uint64_t m_total_processed{0};
    std::uint64_t m_restarts{0};

    // Published snapshot
    mutable std::mutex m_stats_mutex;
    PoolStats m_stats;
    std::vector<WorkerState> m_worker_states;
};

/**
 * @brief Create the executor for a run: a WorkerPool (initialized, with its
 *        inline fallback) or, if @p use_worker_pool is false, an
 *        InlineConcurrentExecutor sized to `config.max_workers`.
 * @throws ConfigurationError if @p config is invalid.
 */
ExecutorPtr make_executor(
    PoolConfig config,
    TaskHandlerRegistryPtr registry,
    bool use_worker_pool = true);

} // namespace workpool
