#include "workpool/execution/task.hpp"

namespace workpool
{

NLOHMANN_JSON_SERIALIZE_ENUM(TaskFailure, {
    {TaskFailure::None, "none"},
    {TaskFailure::HandlerError, "handler-error"},
    {TaskFailure::UnknownType, "unknown-type"},
    {TaskFailure::Timeout, "timeout"},
    {TaskFailure::WorkerCrash, "worker-crash"},
    {TaskFailure::Rejected, "rejected"},
    {TaskFailure::Terminated, "terminated"},
})

const char* to_string(TaskFailure failure) noexcept
{
    switch (failure)
    {
        case TaskFailure::None: return "none";
        case TaskFailure::HandlerError: return "handler-error";
        case TaskFailure::UnknownType: return "unknown-type";
        case TaskFailure::Timeout: return "timeout";
        case TaskFailure::WorkerCrash: return "worker-crash";
        case TaskFailure::Rejected: return "rejected";
        case TaskFailure::Terminated: return "terminated";
    }
    return "unknown";
}

const char* to_string(WorkerStatus status) noexcept
{
    switch (status)
    {
        case WorkerStatus::Idle: return "idle";
        case WorkerStatus::Busy: return "busy";
        case WorkerStatus::Restarting: return "restarting";
    }
    return "unknown";
}

TaskResult TaskResult::failed(
    std::string task_id,
    TaskFailure failure,
    std::string error,
    int worker_id,
    std::int64_t duration_ms)
{
    TaskResult result;
    result.task_id = std::move(task_id);
    result.success = false;
    result.error = std::move(error);
    result.worker_id = worker_id;
    result.duration_ms = duration_ms;
    result.failure = failure;
    return result;
}

std::string TaskResult::summary() const
{
    std::string text = "Task " + task_id;
    if (success)
    {
        text += " succeeded";
    }
    else
    {
        text += " failed (";
        text += to_string(failure);
        text += "): " + error;
    }
    text += " [worker=" + std::to_string(worker_id);
    text += ", " + std::to_string(duration_ms) + "ms]";
    return text;
}

void to_json(Json& j, const Task& task)
{
    j = Json{
        {"id", task.id},
        {"type", task.type},
        {"data", task.data},
        {"priority", task.priority},
    };
}

void from_json(const Json& j, Task& task)
{
    j.at("id").get_to(task.id);
    j.at("type").get_to(task.type);
    task.data = j.value("data", Json{});
    task.priority = j.value("priority", 0);
}

void to_json(Json& j, const TaskResult& result)
{
    j = Json{
        {"taskId", result.task_id},
        {"success", result.success},
        {"workerId", result.worker_id},
        {"durationMs", result.duration_ms},
        {"failure", result.failure},
    };
    if (!result.data.is_null())
    {
        j["data"] = result.data;
    }
    if (!result.error.empty())
    {
        j["error"] = result.error;
    }
}

void from_json(const Json& j, TaskResult& result)
{
    j.at("taskId").get_to(result.task_id);
    j.at("success").get_to(result.success);
    result.data = j.value("data", Json{});
    result.error = j.value("error", std::string{});
    result.worker_id = j.value("workerId", -1);
    result.duration_ms = j.value("durationMs", std::int64_t{0});
    result.failure = j.value("failure", TaskFailure::None);
}

} // namespace workpool
