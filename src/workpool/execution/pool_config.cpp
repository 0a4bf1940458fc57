#include "workpool/execution/pool_config.hpp"
#include "workpool/common/pool_errors.hpp"
#include <thread>

namespace workpool
{

const char* to_string(PoolEventType type) noexcept
{
    switch (type)
    {
        case PoolEventType::Ready: return "ready";
        case PoolEventType::TaskAssigned: return "taskAssigned";
        case PoolEventType::TaskCompleted: return "taskComplete";
        case PoolEventType::TaskTimeout: return "taskTimeout";
        case PoolEventType::WorkerCrashed: return "workerError";
        case PoolEventType::WorkerRestarted: return "workerRestarted";
        case PoolEventType::BatchComplete: return "batchComplete";
        case PoolEventType::Shutdown: return "shutdown";
    }
    return "unknown";
}

int default_worker_count() noexcept
{
    unsigned int cores = std::thread::hardware_concurrency();
    return cores == 0 ? 1 : static_cast<int>(cores);
}

void validate(const PoolConfig& config)
{
    if (config.max_workers <= 0)
    {
        throw ConfigurationError(
            "max_workers must be positive, got " + std::to_string(config.max_workers));
    }
    if (config.memory_limit_mb < 0)
    {
        throw ConfigurationError(
            "memory_limit_mb must not be negative, got " +
            std::to_string(config.memory_limit_mb));
    }
    if (config.task_timeout.count() <= 0)
    {
        throw ConfigurationError(
            "task_timeout must be positive, got " +
            std::to_string(config.task_timeout.count()) + "ms");
    }
    if (config.shutdown_grace.count() < 0)
    {
        throw ConfigurationError(
            "shutdown_grace must not be negative, got " +
            std::to_string(config.shutdown_grace.count()) + "ms");
    }
    if (config.ready_timeout.count() <= 0)
    {
        throw ConfigurationError(
            "ready_timeout must be positive, got " +
            std::to_string(config.ready_timeout.count()) + "ms");
    }
    if (config.restart_backoff.count() < 0)
    {
        throw ConfigurationError(
            "restart_backoff must not be negative, got " +
            std::to_string(config.restart_backoff.count()) + "ms");
    }
}

} // namespace workpool
