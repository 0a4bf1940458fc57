/**
 * @file task_runner.hpp
 * @brief Runs one task through its handler and captures the outcome.
 */
#pragma once
#include "workpool/common/common.hpp"
#include "workpool/execution/task.hpp"
#include "workpool/execution/task_handler_registry.hpp"

namespace workpool
{

/**
 * @brief Execute a task with its registered handler.
 *
 * @details
 * Performs the full execution lifecycle for one task:
 * 1. Resolve Task::type in @p registry
 * 2. Record start time
 * 3. Call the handler with Task::data
 * 4. Catch exceptions, converting them to a failed result
 * 5. Record duration
 *
 * An unknown type yields TaskFailure::UnknownType; a throwing handler yields
 * TaskFailure::HandlerError. Nothing thrown by the handler escapes.
 *
 * @param registry Handler table.
 * @param task The task to run.
 * @param worker_id Reported in TaskResult::worker_id.
 * @return The task's result.
 *
 * @par Thread Safety
 * - Safe to call concurrently as long as the handlers are.
 */
TaskResult run_task(const TaskHandlerRegistry& registry, const Task& task, int worker_id);

} // namespace workpool
