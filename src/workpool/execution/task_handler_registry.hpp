/**
 * @file task_handler_registry.hpp
 * @brief Mapping from task type strings to handler callables.
 */
#pragma once
#include "workpool/common/common.hpp"

namespace workpool
{

/**
 * @brief A task handler: receives Task::data, returns TaskResult::data.
 * @details Throwing marks the task failed; the exception never leaves the
 * worker.
 */
using TaskHandler = std::function<Json(const Json& data)>;

/**
 * @brief Startup-time table of task handlers keyed by Task::type.
 *
 * @details
 * Resolution is a table lookup. The registry must be fully populated before a
 * WorkerPool is initialized: each worker process receives a copy of it when
 * it is forked and never sees later registrations.
 *
 * @par Thread Safety
 * - Concurrent find() calls are safe once registration is finished.
 * - register_handler() is not thread-safe.
 */
class TaskHandlerRegistry
{
public:
    /**
     * @brief Register a handler.
     * @throws RegistryError if @p type is empty or already registered, or if
     *         @p handler is empty.
     */
    void register_handler(const std::string& type, TaskHandler handler);

    /**
     * @brief Look up a handler.
     * @return Pointer to the handler, or nullptr if @p type is unknown.
     */
    const TaskHandler* find(const std::string& type) const;

    bool contains(const std::string& type) const;

    /**
     * @brief Registered types in sorted order.
     */
    std::vector<std::string> types() const;

    size_t size() const noexcept
    {
        return m_handlers.size();
    }

private:
    std::unordered_map<std::string, TaskHandler> m_handlers;
};

using TaskHandlerRegistryPtr = std::shared_ptr<const TaskHandlerRegistry>;

} // namespace workpool
