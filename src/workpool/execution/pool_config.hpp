/**
 * @file pool_config.hpp
 * @brief PoolConfig, pool events and configuration validation.
 */
#pragma once
#include "workpool/common/common.hpp"

namespace workpool
{

/**
 * @brief Kinds of notifications a WorkerPool emits.
 */
enum class PoolEventType
{
    Ready,           ///< All workers reported ready after initialize().
    TaskAssigned,    ///< A task was sent to a worker.
    TaskCompleted,   ///< A worker returned a result (success or handler failure).
    TaskTimeout,     ///< A task hit the task timeout; its worker is replaced.
    WorkerCrashed,   ///< A worker process died unexpectedly.
    WorkerRestarted, ///< A replacement worker reported ready.
    BatchComplete,   ///< A process() call resolved all of its tasks.
    Shutdown         ///< shutdown() finished; no workers remain.
};

const char* to_string(PoolEventType type) noexcept;

/**
 * @brief A pool notification.
 */
struct PoolEvent
{
    PoolEventType type;

    /**
     * @brief Worker slot involved, or -1.
     */
    int worker_id{-1};

    /**
     * @brief Task involved, if any.
     */
    std::string task_id;

    /**
     * @brief Free-form detail (error text, counts).
     */
    std::string message;
};

/**
 * @brief Callback for pool notifications.
 * @details Called from the dispatcher thread (or the caller's thread for
 * Ready and BatchComplete). Must be quick and must not call back into the
 * pool.
 */
using PoolEventListener = std::function<void(const PoolEvent&)>;

/**
 * @brief Default worker count: the number of logical cores, at least 1.
 */
int default_worker_count() noexcept;

/**
 * @brief Configuration for WorkerPool.
 */
struct PoolConfig
{
    /**
     * @brief Number of worker processes. Must be positive.
     */
    int max_workers{default_worker_count()};

    /**
     * @brief Address-space limit per worker in MiB. 0 means unlimited.
     */
    std::int64_t memory_limit_mb{0};

    /**
     * @brief Per-task timeout, measured from dispatch.
     */
    std::chrono::milliseconds task_timeout{30000};

    /**
     * @brief How long shutdown() waits for in-flight tasks before killing
     *        their workers.
     */
    std::chrono::milliseconds shutdown_grace{30000};

    /**
     * @brief How long initialize() waits for each worker's ready message.
     */
    std::chrono::milliseconds ready_timeout{10000};

    /**
     * @brief Delay before retrying a failed worker respawn.
     */
    std::chrono::milliseconds restart_backoff{200};

    /**
     * @brief Log pool activity at debug level.
     */
    bool verbose{false};

    PoolEventListener event_listener;

    /**
     * @brief Optional hook run inside every worker process after fork and
     *        before it reports ready.
     * @details Throwing makes that worker exit without reporting ready, which
     * initialize() treats as a worker initialization failure.
     */
    std::function<void(int worker_id)> worker_init;
};

/**
 * @brief Check a PoolConfig.
 * @throws ConfigurationError naming the first invalid field.
 */
void validate(const PoolConfig& config);

} // namespace workpool
