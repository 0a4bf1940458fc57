/**
 * @file task_generator.hpp
 * @brief TaskGenerator: runs a set of routines over a workspace as a task batch.
 */
#pragma once
#include "workpool/analysis/file_collector.hpp"
#include "workpool/analysis/finding.hpp"
#include "workpool/analysis/progress.hpp"
#include "workpool/analysis/routine_registry.hpp"
#include "workpool/execution/executor.hpp"
#include "workpool/execution/pool_config.hpp"
#include "workpool/execution/task_handler_registry.hpp"

namespace workpool
{

/**
 * @brief Configuration for TaskGenerator.
 */
struct GeneratorConfig
{
    /**
     * @brief Pool settings. `pool.max_workers` also sizes the inline executor.
     */
    PoolConfig pool;

    /**
     * @brief False runs every task on an InlineConcurrentExecutor.
     */
    bool use_worker_pool{true};

    CollectOptions collect;

    ProgressCallback on_progress;
};

/**
 * @brief Check a GeneratorConfig.
 * @throws ConfigurationError naming the first invalid field.
 */
void validate(const GeneratorConfig& config);

/**
 * @brief One (file, routine) pair that produced no findings because its task
 *        failed.
 */
struct RunFailure
{
    std::string routine;
    std::string file;
    std::string error;
    TaskFailure failure{TaskFailure::HandlerError};
};

/**
 * @brief Outcome of TaskGenerator::run().
 */
struct RunReport
{
    std::vector<Finding> findings;
    std::vector<RunFailure> failures;
    std::size_t files_scanned{0};
    std::vector<std::string> routines_run;
    std::vector<std::string> routines_skipped;
    std::size_t tasks_total{0};
    std::size_t tasks_failed{0};
};

void to_json(Json& j, const RunFailure& failure);
void to_json(Json& j, const RunReport& report);

/**
 * @brief Task type of a (file, routine) task.
 */
inline constexpr const char* k_run_routine_task = "run-routine";

/**
 * @brief Build the handler for k_run_routine_task.
 *
 * @details
 * The handler reads `{workspaceRoot, filePath, routineName}` from the task
 * data, instantiates the routine and returns its findings as a JSON array.
 * A file outside the routine's extension scope yields an empty array. An
 * unknown routine name throws RegistryError, which fails the task.
 */
TaskHandler make_routine_handler(RoutineRegistryPtr routines);

/**
 * @brief Pick the routines to run.
 *
 * @param routines Registry to select from.
 * @param requested Routine names; empty selects every registered routine.
 * @param candidate_files Files the batch will cover.
 * @param changed_files Optional hint. When present and non-empty, pruning is
 *        enabled: a routine whose extension scope matches none of the changed
 *        files and none of @p candidate_files is skipped. Such a routine would
 *        return no findings, so pruning never changes the result set.
 * @param skipped Receives the names of skipped routines.
 * @return Selected names, sorted.
 * @throws RegistryError if a requested name is unknown.
 */
std::vector<std::string> select_routines(
    const RoutineRegistry& routines,
    const std::vector<std::string>& requested,
    const std::vector<std::string>& candidate_files,
    const std::optional<std::vector<std::string>>& changed_files,
    std::vector<std::string>& skipped);

/**
 * @brief Translate "run these routines over this workspace" into tasks and
 *        execute them.
 *
 * @details
 * Each run() collects files, builds one task per (file, routine) pair,
 * executes the batch on a fresh executor (a WorkerPool with its inline
 * fallback, or an InlineConcurrentExecutor) and shuts that executor down
 * before returning. A failed task is logged, recorded in
 * RunReport::failures and otherwise dropped.
 *
 * @par Thread Safety
 * - Not thread-safe. Use one generator per concurrent run.
 */
class TaskGenerator
{
public:
    /**
     * @throws ConfigurationError if @p config is invalid or @p routines is null.
     */
    TaskGenerator(GeneratorConfig config, RoutineRegistryPtr routines);

    /**
     * @brief Run routines over a workspace.
     *
     * @param workspace_root Directory to scan.
     * @param routine_names Routines to run; empty runs all registered ones.
     * @param changed_files Optional changed-files hint (see select_routines()).
     * @throws RegistryError if a routine name is unknown.
     * @throws std::filesystem::filesystem_error if @p workspace_root is missing.
     */
    RunReport run(
        const std::string& workspace_root,
        const std::vector<std::string>& routine_names = {},
        const std::optional<std::vector<std::string>>& changed_files = std::nullopt);

    /**
     * @brief The Cartesian task set for @p files × @p routine_names, files
     *        outer, routines inner.
     */
    static std::vector<Task> build_tasks(
        const std::string& workspace_root,
        const std::vector<std::string>& files,
        const std::vector<std::string>& routine_names);

    const TaskHandlerRegistryPtr& handlers() const noexcept
    {
        return m_handlers;
    }

private:
    void notify(const ProgressEvent& event);

    GeneratorConfig m_config;
    RoutineRegistryPtr m_routines;
    TaskHandlerRegistryPtr m_handlers;
    std::mutex m_progress_mutex;
};

} // namespace workpool
