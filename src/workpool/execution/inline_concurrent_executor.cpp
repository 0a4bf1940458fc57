#include "workpool/execution/inline_concurrent_executor.hpp"
#include "workpool/common/logging.hpp"
#include "workpool/common/pool_errors.hpp"
#include "workpool/execution/task_runner.hpp"

#include <future>
#include <numeric>
#include <sys/resource.h>

namespace workpool
{

void validate(const InlineExecutorConfig& config)
{
    if (config.max_concurrency <= 0)
    {
        throw ConfigurationError(
            "max_concurrency must be positive, got " +
            std::to_string(config.max_concurrency));
    }
}

namespace
{

void notify(const ResultCallback& on_result, size_t index, const TaskResult& result)
{
    if (!on_result)
    {
        return;
    }
    try
    {
        on_result(index, result);
    }
    catch (const std::exception& e)
    {
        logger()->error("[InlineExecutor] Result callback for task {} threw: {}",
                        result.task_id, e.what());
    }
}

} // namespace

InlineConcurrentExecutor::CallGuard::CallGuard(InlineConcurrentExecutor& owner)
    : m_owner{owner}
{
    std::lock_guard<std::mutex> lock(m_owner.m_calls_mutex);
    ++m_owner.m_calls_in_flight;
}

InlineConcurrentExecutor::CallGuard::~CallGuard()
{
    std::lock_guard<std::mutex> lock(m_owner.m_calls_mutex);
    if (--m_owner.m_calls_in_flight == 0)
    {
        m_owner.m_calls_cv.notify_all();
    }
}

InlineConcurrentExecutor::InlineConcurrentExecutor(
    InlineExecutorConfig config,
    TaskHandlerRegistryPtr registry)
    : m_config{std::move(config)}
    , m_registry{std::move(registry)}
{
    validate(m_config);
    if (!m_registry)
    {
        throw ConfigurationError("InlineConcurrentExecutor requires a handler registry");
    }
    enable_verbose_logging(m_config.verbose);
    logger()->debug("[InlineExecutor] Created with max_concurrency={}", m_config.max_concurrency);
}

InlineConcurrentExecutor::~InlineConcurrentExecutor()
{
    shutdown();
}

TaskResult InlineConcurrentExecutor::run_counted(const Task& task, int lane)
{
    m_busy.fetch_add(1, std::memory_order_acq_rel);
    TaskResult result = run_task(*m_registry, task, lane);
    m_busy.fetch_sub(1, std::memory_order_acq_rel);
    m_processed.fetch_add(1, std::memory_order_relaxed);

    if (!result.success)
    {
        logger()->debug("[InlineExecutor] {}", result.summary());
    }
    return result;
}

TaskResult InlineConcurrentExecutor::submit(Task task)
{
    CallGuard guard(*this);
    if (is_shut_down())
    {
        return rejected(task);
    }
    return run_counted(task, 0);
}

std::vector<TaskResult> InlineConcurrentExecutor::process(
    const std::vector<Task>& tasks,
    ResultCallback on_result)
{
    std::vector<TaskResult> results(tasks.size());
    CallGuard guard(*this);

    if (is_shut_down())
    {
        for (size_t i = 0; i < tasks.size(); ++i)
        {
            results[i] = rejected(tasks[i]);
            notify(on_result, i, results[i]);
        }
        return results;
    }

    if (tasks.empty())
    {
        return results;
    }

    check_batch(tasks, "InlineExecutor");

    // Start order: priority descending, input order among equals.
    std::vector<size_t> order(tasks.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&tasks](size_t a, size_t b)
    {
        return tasks[a].priority > tasks[b].priority;
    });

    const size_t lane_count = std::min(
        tasks.size(), static_cast<size_t>(m_config.max_concurrency));
    std::atomic<size_t> next{0};
    auto start_time = std::chrono::steady_clock::now();

    logger()->debug("[InlineExecutor] Processing {} tasks on {} lanes", tasks.size(), lane_count);

    std::vector<std::future<void>> lanes;
    lanes.reserve(lane_count);
    for (size_t lane = 0; lane < lane_count; ++lane)
    {
        lanes.push_back(std::async(std::launch::async, [&, lane]()
        {
            for (;;)
            {
                size_t position = next.fetch_add(1, std::memory_order_acq_rel);
                if (position >= order.size())
                {
                    return;
                }
                size_t index = order[position];
                results[index] = run_counted(tasks[index], static_cast<int>(lane));
                notify(on_result, index, results[index]);
            }
        }));
    }

    for (auto& lane : lanes)
    {
        lane.get();
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    logger()->debug("[InlineExecutor] Completed {} tasks in {}ms", tasks.size(), duration.count());

    return results;
}

PoolStats InlineConcurrentExecutor::stats() const
{
    PoolStats stats;
    if (!is_shut_down())
    {
        stats.total_workers = static_cast<size_t>(m_config.max_concurrency);
    }
    stats.busy_workers = std::min(m_busy.load(std::memory_order_acquire), stats.total_workers);
    stats.idle_workers = stats.total_workers - stats.busy_workers;
    stats.active_tasks = m_busy.load(std::memory_order_acquire);
    stats.total_tasks_processed = m_processed.load(std::memory_order_relaxed);
    stats.utilization_rate = stats.total_workers == 0
        ? 0.0
        : static_cast<double>(stats.busy_workers) / static_cast<double>(stats.total_workers);

    struct rusage usage{};
    if (::getrusage(RUSAGE_SELF, &usage) == 0)
    {
        stats.memory_usage_mb = static_cast<std::int64_t>(usage.ru_maxrss) / 1024;
    }
    return stats;
}

void InlineConcurrentExecutor::shutdown()
{
    if (!begin_shutdown())
    {
        return;
    }

    std::unique_lock<std::mutex> lock(m_calls_mutex);
    if (m_calls_in_flight > 0)
    {
        logger()->debug("[InlineExecutor] Waiting for {} in-flight calls", m_calls_in_flight);
    }
    m_calls_cv.wait(lock, [this] { return m_calls_in_flight == 0; });
    logger()->debug("[InlineExecutor] Shut down");
}

} // namespace workpool
