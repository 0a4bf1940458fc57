#include "workpool/execution/executor.hpp"
#include "workpool/common/logging.hpp"
#include <unordered_set>

namespace workpool
{

bool Executor::is_shut_down() const noexcept
{
    return m_shutting_down.load(std::memory_order_acquire);
}

bool Executor::begin_shutdown() noexcept
{
    bool expected = false;
    return m_shutting_down.compare_exchange_strong(expected, true,
                                                   std::memory_order_acq_rel);
}

void Executor::check_batch(const std::vector<Task>& tasks, const char* owner)
{
    std::unordered_set<std::string> seen;
    seen.reserve(tasks.size());
    for (const auto& task : tasks)
    {
        if (!seen.insert(task.id).second)
        {
            logger()->warn("[{}] Duplicate task id '{}' in batch", owner, task.id);
        }
    }
}

TaskResult Executor::rejected(const Task& task)
{
    return TaskResult::failed(task.id, TaskFailure::Rejected, "Executor is shut down");
}

} // namespace workpool
