#include "workpool/analysis/task_generator.hpp"
#include "workpool/common/logging.hpp"
#include "workpool/common/pool_errors.hpp"
#include "workpool/execution/worker_pool.hpp"

#include <algorithm>
#include <set>

namespace workpool
{

void validate(const GeneratorConfig& config)
{
    validate(config.pool);
    validate(config.collect);
}

void to_json(Json& j, const RunFailure& failure)
{
    j = Json{
        {"routine", failure.routine},
        {"file", failure.file},
        {"error", failure.error},
        {"failure", to_string(failure.failure)},
    };
}

void to_json(Json& j, const RunReport& report)
{
    j = Json{
        {"findings", report.findings},
        {"failures", report.failures},
        {"filesScanned", report.files_scanned},
        {"routinesRun", report.routines_run},
        {"routinesSkipped", report.routines_skipped},
        {"tasksTotal", report.tasks_total},
        {"tasksFailed", report.tasks_failed},
    };
}

TaskHandler make_routine_handler(RoutineRegistryPtr routines)
{
    return [routines = std::move(routines)](const Json& data) -> Json
    {
        const auto routine_name = data.at("routineName").get<std::string>();
        const auto file_path = data.at("filePath").get<std::string>();

        Json findings = Json::array();
        if (!routines->applies_to(routine_name, file_path))
        {
            return findings;
        }

        RoutinePtr routine = routines->create(routine_name);
        for (auto& finding : routine->run(file_path))
        {
            if (finding.file.empty())
            {
                finding.file = file_path;
            }
            findings.push_back(finding);
        }
        return findings;
    };
}

std::vector<std::string> select_routines(
    const RoutineRegistry& routines,
    const std::vector<std::string>& requested,
    const std::vector<std::string>& candidate_files,
    const std::optional<std::vector<std::string>>& changed_files,
    std::vector<std::string>& skipped)
{
    std::set<std::string> names;
    if (requested.empty())
    {
        for (const auto& name : routines.names())
        {
            names.insert(name);
        }
    }
    else
    {
        for (const auto& name : requested)
        {
            if (!routines.contains(name))
            {
                throw RegistryError("Unknown routine: " + name);
            }
            names.insert(name);
        }
    }

    const bool prune = changed_files && !changed_files->empty();
    auto in_scope = [&](const std::string& name, const std::vector<std::string>& files)
    {
        return std::any_of(files.begin(), files.end(),
            [&](const std::string& file) { return routines.applies_to(name, file); });
    };

    std::vector<std::string> selected;
    for (const auto& name : names)
    {
        // A routine that matches no candidate file contributes no findings,
        // so dropping it leaves the result set unchanged.
        if (!prune || in_scope(name, *changed_files) || in_scope(name, candidate_files))
        {
            selected.push_back(name);
        }
        else
        {
            skipped.push_back(name);
        }
    }
    return selected;
}

TaskGenerator::TaskGenerator(GeneratorConfig config, RoutineRegistryPtr routines)
    : m_config{std::move(config)}
    , m_routines{std::move(routines)}
{
    validate(m_config);
    if (!m_routines)
    {
        throw ConfigurationError("TaskGenerator requires a routine registry");
    }

    auto handlers = std::make_shared<TaskHandlerRegistry>();
    handlers->register_handler(k_run_routine_task, make_routine_handler(m_routines));
    m_handlers = std::move(handlers);
}

std::vector<Task> TaskGenerator::build_tasks(
    const std::string& workspace_root,
    const std::vector<std::string>& files,
    const std::vector<std::string>& routine_names)
{
    std::vector<Task> tasks;
    tasks.reserve(files.size() * routine_names.size());
    for (const auto& file : files)
    {
        for (const auto& routine : routine_names)
        {
            Task task;
            task.id = routine + ":" + file;
            task.type = k_run_routine_task;
            task.data = Json{
                {"workspaceRoot", workspace_root},
                {"filePath", file},
                {"routineName", routine},
            };
            tasks.push_back(std::move(task));
        }
    }
    return tasks;
}

RunReport TaskGenerator::run(
    const std::string& workspace_root,
    const std::vector<std::string>& routine_names,
    const std::optional<std::vector<std::string>>& changed_files)
{
    RunReport report;
    auto start_time = std::chrono::steady_clock::now();

    ProgressEvent collecting;
    collecting.phase = ProgressPhase::CollectFiles;
    collecting.message = "collecting files";
    notify(collecting);

    const std::vector<std::string> files = collect_files(workspace_root, m_config.collect);
    report.files_scanned = files.size();

    report.routines_run = select_routines(
        *m_routines, routine_names, files, changed_files, report.routines_skipped);
    if (!report.routines_skipped.empty())
    {
        logger()->info("[TaskGenerator] Skipping {} routines with no file in scope",
                       report.routines_skipped.size());
    }

    if (files.empty())
    {
        ProgressEvent none;
        none.phase = ProgressPhase::CollectFiles;
        none.total = 0;
        none.message = "no files found";
        notify(none);
        logger()->info("[TaskGenerator] No files found under {}", workspace_root);
        return report;
    }

    ProgressEvent collected;
    collected.phase = ProgressPhase::CollectFiles;
    collected.total = files.size();
    notify(collected);

    std::vector<Task> tasks = build_tasks(workspace_root, files, report.routines_run);
    report.tasks_total = tasks.size();

    ProgressEvent starting;
    starting.phase = ProgressPhase::RunDetectors;
    starting.total = tasks.size();
    starting.completed = 0;
    starting.detectors_skipped = report.routines_skipped;
    notify(starting);

    logger()->info("[TaskGenerator] Running {} routines on {} files ({} tasks)",
                   report.routines_run.size(), files.size(), tasks.size());

    ExecutorPtr executor = make_executor(m_config.pool, m_handlers, m_config.use_worker_pool);

    std::size_t completed = 0;
    std::vector<TaskResult> results = executor->process(tasks,
        [&](std::size_t index, const TaskResult& result)
        {
            std::lock_guard<std::mutex> lock(m_progress_mutex);
            ProgressEvent event;
            event.phase = ProgressPhase::RunDetectors;
            event.total = tasks.size();
            event.completed = ++completed;
            event.routine = tasks[index].data.at("routineName").get<std::string>();
            event.file = tasks[index].data.at("filePath").get<std::string>();
            event.duration_ms = result.duration_ms;
            event.success = result.success;
            if (m_config.on_progress)
            {
                m_config.on_progress(event);
            }
        });

    executor->shutdown();

    for (std::size_t i = 0; i < results.size(); ++i)
    {
        const TaskResult& result = results[i];
        const std::string routine = tasks[i].data.at("routineName").get<std::string>();
        const std::string file = tasks[i].data.at("filePath").get<std::string>();

        RunFailure failure{routine, file, result.error, result.failure};
        if (result.success)
        {
            try
            {
                std::vector<Finding> findings = result.data.get<std::vector<Finding>>();
                for (auto& finding : findings)
                {
                    finding.routine = routine;
                    report.findings.push_back(std::move(finding));
                }
                continue;
            }
            catch (const Json::exception& e)
            {
                failure.error = std::string("malformed findings: ") + e.what();
                failure.failure = TaskFailure::HandlerError;
            }
        }

        logger()->warn("[TaskGenerator] Routine {} failed on {}: {}",
                       routine, file, failure.error);
        report.failures.push_back(std::move(failure));
        report.tasks_failed++;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();

    ProgressEvent done;
    done.phase = ProgressPhase::Complete;
    done.total = tasks.size();
    done.completed = tasks.size();
    done.message = std::to_string(report.findings.size()) + " findings, " +
                   std::to_string(report.tasks_failed) + " failed tasks in " +
                   std::to_string(duration) + "ms";
    notify(done);

    logger()->info("[TaskGenerator] {}", done.message);
    return report;
}

void TaskGenerator::notify(const ProgressEvent& event)
{
    std::lock_guard<std::mutex> lock(m_progress_mutex);
    if (m_config.on_progress)
    {
        m_config.on_progress(event);
    }
}

} // namespace workpool
