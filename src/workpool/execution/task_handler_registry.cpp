#include "workpool/execution/task_handler_registry.hpp"
#include "workpool/common/pool_errors.hpp"

namespace workpool
{

void TaskHandlerRegistry::register_handler(const std::string& type, TaskHandler handler)
{
    if (type.empty())
    {
        throw RegistryError("Task handler type must not be empty");
    }
    if (!handler)
    {
        throw RegistryError("Task handler for '" + type + "' is empty");
    }
    auto inserted = m_handlers.emplace(type, std::move(handler));
    if (!inserted.second)
    {
        throw RegistryError("Task handler already registered: " + type);
    }
}

const TaskHandler* TaskHandlerRegistry::find(const std::string& type) const
{
    auto it = m_handlers.find(type);
    if (it == m_handlers.end())
    {
        return nullptr;
    }
    return &it->second;
}

bool TaskHandlerRegistry::contains(const std::string& type) const
{
    return m_handlers.find(type) != m_handlers.end();
}

std::vector<std::string> TaskHandlerRegistry::types() const
{
    std::vector<std::string> result;
    result.reserve(m_handlers.size());
    for (const auto& kv : m_handlers)
    {
        result.push_back(kv.first);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace workpool
