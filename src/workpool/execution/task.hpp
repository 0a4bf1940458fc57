/**
 * @file task.hpp
 * @brief Task, TaskResult and the pool state snapshot types.
 */
#pragma once
#include "workpool/common/common.hpp"

namespace workpool
{

/**
 * @brief A unit of work submitted to an executor.
 *
 * @details
 * `type` selects the handler in the TaskHandlerRegistry; `data` is passed to
 * that handler unchanged. Tasks are immutable once enqueued.
 */
struct Task
{
    /**
     * @brief Caller-chosen identifier, unique within a batch.
     */
    std::string id;

    /**
     * @brief Handler selector.
     */
    std::string type;

    /**
     * @brief Opaque payload for the handler. Must be JSON-serializable since
     * it crosses the process boundary to reach a worker.
     */
    Json data;

    /**
     * @brief Higher values are dispatched first.
     */
    int priority{0};
};

/**
 * @brief Priority accessor used by TaskQueue.
 */
inline int priority_of(const Task& task) noexcept
{
    return task.priority;
}

/**
 * @brief Classification of a failed TaskResult.
 */
enum class TaskFailure
{
    None,         ///< The task succeeded.
    HandlerError, ///< The handler threw.
    UnknownType,  ///< No handler registered for the task type.
    Timeout,      ///< The task exceeded the task timeout; its worker was replaced.
    WorkerCrash,  ///< The worker process died while holding the task.
    Rejected,     ///< The executor was shutting down; the task never ran.
    Terminated    ///< Force-terminated at the end of the shutdown grace period.
};

/**
 * @brief Get a short name for a failure kind.
 */
const char* to_string(TaskFailure failure) noexcept;

/**
 * @brief Outcome of one task.
 *
 * @details
 * Exactly one TaskResult is produced for every submitted Task. Failures are
 * values, not exceptions: `success` is false, `error` describes the cause and
 * `failure` classifies it.
 */
struct TaskResult
{
    std::string task_id;
    bool success{false};

    /**
     * @brief Handler return value. Null when the task failed.
     */
    Json data;

    /**
     * @brief Error description. Empty on success.
     */
    std::string error;

    /**
     * @brief Slot of the worker that ran the task, or -1 if it never reached
     * a worker.
     */
    int worker_id{-1};

    /**
     * @brief Wall-clock time from dispatch to result, in milliseconds.
     */
    std::int64_t duration_ms{0};

    TaskFailure failure{TaskFailure::None};

    /**
     * @brief Build a failed result.
     */
    static TaskResult failed(
        std::string task_id,
        TaskFailure failure,
        std::string error,
        int worker_id = -1,
        std::int64_t duration_ms = 0);

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const;
};

/**
 * @brief Lifecycle state of a worker slot.
 */
enum class WorkerStatus
{
    Idle,
    Busy,
    Restarting
};

const char* to_string(WorkerStatus status) noexcept;

/**
 * @brief Point-in-time view of one worker slot.
 */
struct WorkerState
{
    int id{0};
    WorkerStatus status{WorkerStatus::Restarting};
    std::optional<std::string> current_task_id;

    /**
     * @brief Process id of the current worker process, 0 while restarting.
     */
    int pid{0};

    std::uint64_t tasks_completed{0};

    /**
     * @brief Resident set size last reported by the worker.
     */
    std::int64_t memory_usage_kb{0};
};

/**
 * @brief Derived snapshot of executor utilization.
 *
 * @details Never authoritative; the dispatcher republishes it after every
 * state change.
 */
struct PoolStats
{
    std::size_t total_workers{0};
    std::size_t idle_workers{0};
    std::size_t busy_workers{0};
    std::size_t restarting_workers{0};

    /**
     * @brief Tasks currently assigned to a worker. Queued tasks excluded.
     */
    std::size_t active_tasks{0};

    std::size_t queue_length{0};
    std::uint64_t total_tasks_processed{0};
    std::uint64_t restarts{0};

    /**
     * @brief busy_workers / total_workers, or 0 when there are no workers.
     */
    double utilization_rate{0.0};

    std::int64_t memory_usage_mb{0};

    /**
     * @brief True when the pool runs on its inline fallback.
     */
    bool disabled{false};
};

void to_json(Json& j, const Task& task);
void from_json(const Json& j, Task& task);
void to_json(Json& j, const TaskResult& result);
void from_json(const Json& j, TaskResult& result);

} // namespace workpool
