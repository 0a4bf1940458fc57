#include "workpool/execution/task_runner.hpp"

namespace workpool
{

TaskResult run_task(const TaskHandlerRegistry& registry, const Task& task, int worker_id)
{
    const TaskHandler* handler = registry.find(task.type);
    if (!handler)
    {
        return TaskResult::failed(
            task.id, TaskFailure::UnknownType,
            "No handler registered for task type '" + task.type + "'", worker_id);
    }

    TaskResult result;
    result.task_id = task.id;
    result.worker_id = worker_id;

    auto start_time = std::chrono::steady_clock::now();

    try
    {
        result.data = (*handler)(task.data);
        result.success = true;
    }
    catch (const std::exception& e)
    {
        result.success = false;
        result.failure = TaskFailure::HandlerError;
        result.error = e.what();
        result.data = nullptr;
    }
    catch (...)
    {
        result.success = false;
        result.failure = TaskFailure::HandlerError;
        result.error = "Unknown exception";
        result.data = nullptr;
    }

    auto end_time = std::chrono::steady_clock::now();
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - start_time).count();

    return result;
}

} // namespace workpool
