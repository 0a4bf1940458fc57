#include "workpool/execution/worker_pool.hpp"
#include "workpool/common/logging.hpp"
#include "workpool/common/pool_errors.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <limits>
#include <poll.h>
#include <unistd.h>

namespace workpool
{

namespace
{

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point since)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count();
}

constexpr std::chrono::milliseconds k_exit_wait{200};

} // namespace

WorkerPool::WorkerPool(PoolConfig config, TaskHandlerRegistryPtr registry)
    : m_config{std::move(config)}
    , m_registry{std::move(registry)}
{
    validate(m_config);
    if (!m_registry)
    {
        throw ConfigurationError("WorkerPool requires a handler registry");
    }

    m_worker_options.memory_limit_mb = m_config.memory_limit_mb;
    m_worker_options.init = m_config.worker_init;

    enable_verbose_logging(m_config.verbose);
    logger()->debug("[WorkerPool] Configured with {} workers (timeout={}ms, grace={}ms)",
                    m_config.max_workers, m_config.task_timeout.count(),
                    m_config.shutdown_grace.count());
}

WorkerPool::~WorkerPool()
{
    shutdown();
    for (int& fd : m_wake_fds)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

void WorkerPool::initialize()
{
    // shutdown() holds the lifecycle mutex for the whole grace period;
    // callers arriving meanwhile must not wait for it.
    if (m_initialized.load(std::memory_order_acquire) || is_shut_down())
    {
        return;
    }

    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (m_initialized.load(std::memory_order_acquire) || is_shut_down())
    {
        return;
    }

    logger()->info("[WorkerPool] Creating {} workers...", m_config.max_workers);

    try
    {
        if (::pipe2(m_wake_fds, O_NONBLOCK | O_CLOEXEC) == -1)
        {
            throw WorkerInitError(std::string("pipe2: ") + std::strerror(errno));
        }

        m_slots.resize(static_cast<size_t>(m_config.max_workers));
        for (size_t i = 0; i < m_slots.size(); ++i)
        {
            Slot& slot = m_slots[i];
            slot.id = static_cast<int>(i);
            slot.worker = Worker::spawn(
                slot.id, *m_registry, m_worker_options, fds_to_close_in_child(&slot));
            logger()->debug("[WorkerPool] Worker {} created (pid {})", slot.id, slot.worker->pid());
        }

        for (auto& slot : m_slots)
        {
            slot.worker->wait_ready(m_config.ready_timeout);
            slot.status = WorkerStatus::Idle;
        }

        publish_stats();
        m_dispatcher = std::thread(&WorkerPool::dispatcher_main, this);
    }
    catch (const WorkerInitError& e)
    {
        m_slots.clear();
        enable_fallback(e.what());
    }
    catch (const std::system_error& e)
    {
        m_slots.clear();
        enable_fallback(std::string("Cannot start dispatcher: ") + e.what());
    }

    m_initialized.store(true, std::memory_order_release);

    if (!is_disabled())
    {
        logger()->info("[WorkerPool] Worker pool ready with {} workers", m_config.max_workers);
        emit(PoolEventType::Ready, -1, {},
             "workerCount=" + std::to_string(m_config.max_workers));
    }
}

void WorkerPool::enable_fallback(const std::string& reason)
{
    logger()->warn("[WorkerPool] Worker initialization failed, falling back to inline execution: {}",
                   reason);

    InlineExecutorConfig inline_config;
    inline_config.max_concurrency = m_config.max_workers;
    inline_config.verbose = m_config.verbose;
    m_fallback = std::make_unique<InlineConcurrentExecutor>(inline_config, m_registry);
    m_disabled.store(true, std::memory_order_release);

    std::lock_guard<std::mutex> lock(m_stats_mutex);
    m_stats = PoolStats{};
    m_stats.disabled = true;
    m_worker_states.clear();
}

void WorkerPool::shutdown()
{
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (!begin_shutdown())
    {
        return;
    }

    logger()->info("[WorkerPool] Shutting down worker pool...");
    auto start_time = Clock::now();

    if (m_fallback)
    {
        m_fallback->shutdown();
    }

    if (m_dispatcher.joinable())
    {
        wake_dispatcher();
        m_dispatcher.join();
    }
    else
    {
        // Never initialized or running on the fallback: no dispatcher owns
        // the inbox, so close it here.
        std::vector<SubmissionPtr> leftover;
        {
            std::lock_guard<std::mutex> inbox_lock(m_inbox_mutex);
            m_inbox_closed = true;
            leftover.swap(m_inbox);
        }
        for (auto& submission : leftover)
        {
            TaskResult result = rejected(submission->task);
            resolve(std::move(submission), std::move(result));
        }

        {
            std::lock_guard<std::mutex> stats_lock(m_stats_mutex);
            m_stats.total_workers = 0;
            m_stats.idle_workers = 0;
            m_stats.busy_workers = 0;
            m_stats.restarting_workers = 0;
            m_stats.utilization_rate = 0.0;
            m_worker_states.clear();
        }
        emit(PoolEventType::Shutdown, -1, {}, {});
    }

    logger()->info("[WorkerPool] Worker pool shut down in {}ms", elapsed_ms(start_time));
}

// ============================================================================
// Caller side
// ============================================================================

TaskResult WorkerPool::submit(Task task)
{
    initialize();
    if (is_disabled())
    {
        return m_fallback->submit(std::move(task));
    }

    auto submission = std::make_unique<Submission>();
    submission->task = std::move(task);
    auto future = submission->promise.get_future();

    std::vector<SubmissionPtr> batch;
    batch.push_back(std::move(submission));
    enqueue_submissions(std::move(batch));

    return future.get();
}

std::vector<TaskResult> WorkerPool::process(
    const std::vector<Task>& tasks,
    ResultCallback on_result)
{
    initialize();
    if (is_disabled())
    {
        return m_fallback->process(tasks, std::move(on_result));
    }
    if (tasks.empty())
    {
        return {};
    }

    check_batch(tasks, "WorkerPool");
    logger()->debug("[WorkerPool] Processing {} tasks...", tasks.size());
    auto start_time = Clock::now();

    std::vector<std::future<TaskResult>> futures;
    std::vector<SubmissionPtr> batch;
    futures.reserve(tasks.size());
    batch.reserve(tasks.size());

    for (size_t i = 0; i < tasks.size(); ++i)
    {
        auto submission = std::make_unique<Submission>();
        submission->task = tasks[i];
        submission->callback = on_result;
        submission->index = i;
        futures.push_back(submission->promise.get_future());
        batch.push_back(std::move(submission));
    }
    enqueue_submissions(std::move(batch));

    std::vector<TaskResult> results;
    results.reserve(tasks.size());
    for (auto& future : futures)
    {
        results.push_back(future.get());
    }

    auto duration = elapsed_ms(start_time);
    logger()->debug("[WorkerPool] Completed {} tasks in {}ms", results.size(), duration);
    emit(PoolEventType::BatchComplete, -1, {},
         "taskCount=" + std::to_string(results.size()) +
         " durationMs=" + std::to_string(duration));

    return results;
}

void WorkerPool::enqueue_submissions(std::vector<SubmissionPtr> submissions)
{
    {
        std::lock_guard<std::mutex> lock(m_inbox_mutex);
        if (!m_inbox_closed)
        {
            for (auto& submission : submissions)
            {
                m_inbox.push_back(std::move(submission));
            }
            submissions.clear();
        }
    }

    if (submissions.empty())
    {
        wake_dispatcher();
        return;
    }

    // The dispatcher has already exited.
    for (auto& submission : submissions)
    {
        TaskResult result = rejected(submission->task);
        resolve(std::move(submission), std::move(result));
    }
}

void WorkerPool::wake_dispatcher() noexcept
{
    if (m_wake_fds[1] < 0)
    {
        return;
    }
    const char byte = 1;
    // A full pipe already guarantees a wake-up.
    while (::write(m_wake_fds[1], &byte, 1) == -1 && errno == EINTR)
    {
    }
}

PoolStats WorkerPool::stats() const
{
    if (is_disabled())
    {
        PoolStats stats = m_fallback->stats();
        stats.disabled = true;
        return stats;
    }
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    return m_stats;
}

std::vector<WorkerState> WorkerPool::worker_states() const
{
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    return m_worker_states;
}

// ============================================================================
// Dispatcher
// ============================================================================

void WorkerPool::dispatcher_main()
{
    try
    {
        dispatcher_loop();
        finish_shutdown();
    }
    catch (const std::exception& e)
    {
        logger()->critical("[WorkerPool] Dispatcher failed: {}", e.what());
        abort_all(std::string("Worker pool dispatcher failed: ") + e.what());
    }
}

void WorkerPool::dispatcher_loop()
{
    std::optional<Clock::time_point> shutdown_deadline;
    std::vector<struct pollfd> pollfds;
    std::vector<Slot*> polled_slots;

    for (;;)
    {
        drain_inbox();
        auto now = Clock::now();

        if (is_shut_down() && !shutdown_deadline)
        {
            shutdown_deadline = now + m_config.shutdown_grace;
            reject_queued();
        }

        check_timeouts(now);

        if (!shutdown_deadline)
        {
            retry_restarts(now);
            assign_work();
        }

        publish_stats();

        if (shutdown_deadline)
        {
            bool any_busy = std::any_of(m_slots.begin(), m_slots.end(),
                [](const Slot& slot) { return slot.status == WorkerStatus::Busy; });
            if (!any_busy || now >= *shutdown_deadline)
            {
                return;
            }
        }

        pollfds.clear();
        polled_slots.clear();
        pollfds.push_back({m_wake_fds[0], POLLIN, 0});
        for (auto& slot : m_slots)
        {
            if (slot.worker && slot.worker->channel().is_open())
            {
                pollfds.push_back({slot.worker->channel().fd(), POLLIN, 0});
                polled_slots.push_back(&slot);
            }
        }

        int rc = ::poll(pollfds.data(), pollfds.size(),
                        poll_timeout_ms(now, shutdown_deadline));
        if (rc == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw PoolError(PoolErrorCode::InvalidState,
                            std::string("poll: ") + std::strerror(errno));
        }

        if (pollfds[0].revents & POLLIN)
        {
            char buffer[64];
            while (::read(m_wake_fds[0], buffer, sizeof(buffer)) > 0)
            {
            }
        }

        for (size_t i = 1; i < pollfds.size(); ++i)
        {
            if (pollfds[i].revents & (POLLIN | POLLHUP | POLLERR))
            {
                handle_readable(*polled_slots[i - 1]);
            }
        }
    }
}

bool WorkerPool::drain_inbox()
{
    std::vector<SubmissionPtr> incoming;
    {
        std::lock_guard<std::mutex> lock(m_inbox_mutex);
        incoming.swap(m_inbox);
    }

    for (auto& submission : incoming)
    {
        if (is_shut_down())
        {
            TaskResult result = rejected(submission->task);
            resolve(std::move(submission), std::move(result));
        }
        else
        {
            m_queue.enqueue(std::move(submission));
        }
    }
    return !incoming.empty();
}

void WorkerPool::assign_work()
{
    while (!m_queue.empty())
    {
        Slot* slot = find_idle_slot();
        if (!slot)
        {
            break;
        }
        auto submission = m_queue.dequeue();
        assign(*slot, std::move(*submission));
    }
}

WorkerPool::Slot* WorkerPool::find_idle_slot()
{
    Slot* best = nullptr;
    for (auto& slot : m_slots)
    {
        if (slot.status != WorkerStatus::Idle)
        {
            continue;
        }
        if (!best || slot.tasks_completed < best->tasks_completed)
        {
            best = &slot;
        }
    }
    return best;
}

void WorkerPool::assign(Slot& slot, SubmissionPtr submission)
{
    bool sent = false;
    try
    {
        sent = slot.worker->send_task(submission->task);
    }
    catch (const ProtocolError& e)
    {
        const std::string task_id = submission->task.id;
        logger()->warn("[WorkerPool] Cannot send task {}: {}", task_id, e.what());
        m_total_processed++;
        resolve(std::move(submission), TaskResult::failed(
            task_id, TaskFailure::HandlerError, std::string("cannot send task: ") + e.what()));
        return;
    }

    if (!sent)
    {
        // The task never reached the worker; it goes back to the queue.
        m_queue.enqueue(std::move(submission));
        handle_worker_lost(slot, "worker " + slot.worker->reap() + " before accepting a task");
        return;
    }

    auto now = Clock::now();
    slot.status = WorkerStatus::Busy;
    slot.started = now;
    slot.deadline = now + m_config.task_timeout;

    logger()->debug("[WorkerPool] Assigning task {} to worker {}", submission->task.id, slot.id);
    emit(PoolEventType::TaskAssigned, slot.id, submission->task.id, {});

    slot.current = std::move(submission);
}

void WorkerPool::handle_readable(Slot& slot)
{
    if (!slot.worker)
    {
        return;
    }

    if (slot.status == WorkerStatus::Restarting)
    {
        handle_ready_message(slot);
        return;
    }

    std::optional<WorkerReply> reply;
    try
    {
        reply = slot.worker->receive();
    }
    catch (const ProtocolError& e)
    {
        logger()->warn("[WorkerPool] Worker {} protocol error: {}", slot.id, e.what());
        slot.worker->terminate();
        handle_worker_lost(slot, std::string("worker protocol error: ") + e.what());
        return;
    }

    if (!reply)
    {
        handle_worker_lost(slot, "worker crashed: " + slot.worker->reap());
        return;
    }

    if (slot.status != WorkerStatus::Busy || !slot.current ||
        reply->result.task_id != slot.current->task.id)
    {
        logger()->warn("[WorkerPool] Worker {} sent a result for unexpected task '{}'",
                       slot.id, reply->result.task_id);
        slot.worker->terminate();
        handle_worker_lost(slot, "worker sent a result for the wrong task");
        return;
    }

    TaskResult result = std::move(reply->result);
    result.worker_id = slot.id;
    result.duration_ms = elapsed_ms(slot.started);

    slot.rss_kb = reply->rss_kb;
    slot.tasks_completed++;
    slot.status = WorkerStatus::Idle;
    m_total_processed++;

    logger()->debug("[WorkerPool] Task {} completed by worker {} ({})",
                    result.task_id, slot.id, result.success ? "success" : "failed");
    emit(PoolEventType::TaskCompleted, slot.id, result.task_id, result.error);

    SubmissionPtr done = std::move(slot.current);
    publish_stats();
    resolve(std::move(done), std::move(result));
}

void WorkerPool::handle_ready_message(Slot& slot)
{
    try
    {
        slot.worker->wait_ready(std::chrono::milliseconds{0});
    }
    catch (const WorkerInitError& e)
    {
        logger()->warn("[WorkerPool] Replacement for worker {} failed: {}", slot.id, e.what());
        slot.worker.reset();
        slot.retry_at = Clock::now() + m_config.restart_backoff;
        return;
    }

    slot.status = WorkerStatus::Idle;
    m_restarts++;
    logger()->info("[WorkerPool] Worker {} restarted (pid {})", slot.id, slot.worker->pid());
    emit(PoolEventType::WorkerRestarted, slot.id, {}, {});
}

void WorkerPool::handle_worker_lost(Slot& slot, const std::string& reason)
{
    logger()->warn("[WorkerPool] Worker {} lost: {}", slot.id, reason);
    emit(PoolEventType::WorkerCrashed, slot.id,
         slot.current ? slot.current->task.id : std::string{}, reason);

    SubmissionPtr lost = std::move(slot.current);
    slot.worker.reset();
    slot.status = WorkerStatus::Restarting;

    if (lost)
    {
        TaskResult result = TaskResult::failed(
            lost->task.id, TaskFailure::WorkerCrash, reason,
            slot.id, elapsed_ms(slot.started));
        m_total_processed++;
        publish_stats();
        resolve(std::move(lost), std::move(result));
    }

    if (!is_shut_down())
    {
        start_restart(slot);
    }
}

void WorkerPool::check_timeouts(Clock::time_point now)
{
    for (auto& slot : m_slots)
    {
        if (slot.status != WorkerStatus::Busy || now < slot.deadline)
        {
            continue;
        }

        const std::string task_id = slot.current->task.id;
        const auto timeout_ms = m_config.task_timeout.count();
        logger()->warn("[WorkerPool] Task {} timed out on worker {} after {}ms",
                       task_id, slot.id, timeout_ms);

        slot.worker->terminate();
        slot.worker.reset();
        slot.status = WorkerStatus::Restarting;
        SubmissionPtr expired = std::move(slot.current);
        m_total_processed++;

        emit(PoolEventType::TaskTimeout, slot.id, task_id, {});
        publish_stats();
        resolve(std::move(expired), TaskResult::failed(
            task_id, TaskFailure::Timeout,
            "task timeout after " + std::to_string(timeout_ms) + "ms",
            slot.id, timeout_ms));

        if (!is_shut_down())
        {
            start_restart(slot);
        }
    }
}

void WorkerPool::retry_restarts(Clock::time_point now)
{
    for (auto& slot : m_slots)
    {
        if (slot.status != WorkerStatus::Restarting)
        {
            continue;
        }
        if (!slot.worker && now >= slot.retry_at)
        {
            start_restart(slot);
        }
        else if (slot.worker && now >= slot.ready_deadline)
        {
            logger()->warn("[WorkerPool] Replacement for worker {} did not report ready within {}ms",
                           slot.id, m_config.ready_timeout.count());
            slot.worker.reset();
            slot.retry_at = now + m_config.restart_backoff;
        }
    }
}

void WorkerPool::start_restart(Slot& slot)
{
    logger()->info("[WorkerPool] Restarting worker {}", slot.id);
    slot.status = WorkerStatus::Restarting;
    try
    {
        slot.worker = Worker::spawn(
            slot.id, *m_registry, m_worker_options, fds_to_close_in_child(&slot));
        slot.ready_deadline = Clock::now() + m_config.ready_timeout;
    }
    catch (const WorkerInitError& e)
    {
        logger()->warn("[WorkerPool] Cannot respawn worker {}: {}", slot.id, e.what());
        slot.worker.reset();
        slot.retry_at = Clock::now() + m_config.restart_backoff;
    }
}

void WorkerPool::reject_queued()
{
    auto queued = m_queue.drain();
    if (!queued.empty())
    {
        logger()->info("[WorkerPool] Rejecting {} queued tasks", queued.size());
    }
    for (auto& submission : queued)
    {
        TaskResult result = rejected(submission->task);
        resolve(std::move(submission), std::move(result));
    }
}

void WorkerPool::finish_shutdown()
{
    std::vector<SubmissionPtr> leftover;
    {
        std::lock_guard<std::mutex> lock(m_inbox_mutex);
        m_inbox_closed = true;
        leftover.swap(m_inbox);
    }
    for (auto& submission : leftover)
    {
        TaskResult result = rejected(submission->task);
        resolve(std::move(submission), std::move(result));
    }
    reject_queued();

    for (auto& slot : m_slots)
    {
        if (slot.status == WorkerStatus::Busy && slot.current)
        {
            logger()->warn("[WorkerPool] Shutdown timeout - terminating worker {} running task {}",
                           slot.id, slot.current->task.id);
            slot.worker->terminate();
            m_total_processed++;
            const std::string task_id = slot.current->task.id;
            resolve(std::move(slot.current), TaskResult::failed(
                task_id, TaskFailure::Terminated,
                "terminated after shutdown grace period of " +
                    std::to_string(m_config.shutdown_grace.count()) + "ms",
                slot.id, elapsed_ms(slot.started)));
        }
        else if (slot.worker && slot.status == WorkerStatus::Idle && !slot.worker->request_exit())
        {
            slot.worker->terminate();
        }
    }

    for (auto& slot : m_slots)
    {
        if (slot.worker && !slot.worker->wait_exit(k_exit_wait))
        {
            slot.worker->terminate();
        }
        slot.worker.reset();
    }
    m_slots.clear();

    publish_stats();
    emit(PoolEventType::Shutdown, -1, {}, {});
}

void WorkerPool::abort_all(const std::string& reason)
{
    std::vector<SubmissionPtr> leftover;
    {
        std::lock_guard<std::mutex> lock(m_inbox_mutex);
        m_inbox_closed = true;
        leftover.swap(m_inbox);
    }
    for (auto& submission : m_queue.drain())
    {
        leftover.push_back(std::move(submission));
    }
    for (auto& slot : m_slots)
    {
        if (slot.current)
        {
            leftover.push_back(std::move(slot.current));
        }
        slot.worker.reset();
    }
    m_slots.clear();

    for (auto& submission : leftover)
    {
        TaskResult result = TaskResult::failed(
            submission->task.id, TaskFailure::Terminated, reason);
        resolve(std::move(submission), std::move(result));
    }

    publish_stats();
}

int WorkerPool::poll_timeout_ms(
    Clock::time_point now,
    const std::optional<Clock::time_point>& shutdown_deadline) const
{
    std::optional<Clock::time_point> next;
    auto consider = [&next](Clock::time_point t)
    {
        if (!next || t < *next)
        {
            next = t;
        }
    };

    for (const auto& slot : m_slots)
    {
        if (slot.status == WorkerStatus::Busy)
        {
            consider(slot.deadline);
        }
        else if (slot.status == WorkerStatus::Restarting && !shutdown_deadline)
        {
            consider(slot.worker ? slot.ready_deadline : slot.retry_at);
        }
    }
    if (shutdown_deadline)
    {
        consider(*shutdown_deadline);
    }

    if (!next)
    {
        return -1;
    }
    if (*next <= now)
    {
        return 0;
    }
    auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(*next - now);
    // Round up so the deadline has passed when poll returns.
    return static_cast<int>(std::min<std::int64_t>(
        wait.count() + 1, std::numeric_limits<int>::max()));
}

std::vector<int> WorkerPool::fds_to_close_in_child(const Slot* except) const
{
    std::vector<int> fds;
    for (int fd : m_wake_fds)
    {
        if (fd >= 0)
        {
            fds.push_back(fd);
        }
    }
    for (const auto& slot : m_slots)
    {
        if (&slot != except && slot.worker && slot.worker->channel().is_open())
        {
            fds.push_back(slot.worker->channel().fd());
        }
    }
    return fds;
}

void WorkerPool::resolve(SubmissionPtr submission, TaskResult result)
{
    if (!result.success)
    {
        logger()->debug("[WorkerPool] {}", result.summary());
    }

    if (submission->callback)
    {
        try
        {
            submission->callback(submission->index, result);
        }
        catch (const std::exception& e)
        {
            logger()->error("[WorkerPool] Result callback for task {} threw: {}",
                            submission->task.id, e.what());
        }
    }
    submission->promise.set_value(std::move(result));
}

void WorkerPool::publish_stats()
{
    PoolStats stats;
    std::vector<WorkerState> states;
    states.reserve(m_slots.size());

    std::int64_t rss_kb = 0;
    for (const auto& slot : m_slots)
    {
        WorkerState state;
        state.id = slot.id;
        state.status = slot.status;
        state.pid = slot.worker ? static_cast<int>(slot.worker->pid()) : 0;
        state.tasks_completed = slot.tasks_completed;
        state.memory_usage_kb = slot.rss_kb;
        if (slot.current)
        {
            state.current_task_id = slot.current->task.id;
        }
        states.push_back(std::move(state));

        switch (slot.status)
        {
            case WorkerStatus::Idle: stats.idle_workers++; break;
            case WorkerStatus::Busy: stats.busy_workers++; break;
            case WorkerStatus::Restarting: stats.restarting_workers++; break;
        }
        rss_kb += slot.rss_kb;
    }

    stats.total_workers = m_slots.size();
    stats.active_tasks = stats.busy_workers;
    stats.queue_length = m_queue.size();
    stats.total_tasks_processed = m_total_processed;
    stats.restarts = m_restarts;
    stats.utilization_rate = stats.total_workers == 0
        ? 0.0
        : static_cast<double>(stats.busy_workers) / static_cast<double>(stats.total_workers);
    stats.memory_usage_mb = rss_kb / 1024;

    std::lock_guard<std::mutex> lock(m_stats_mutex);
    m_stats = stats;
    m_worker_states = std::move(states);
}

void WorkerPool::emit(PoolEventType type, int worker_id, std::string task_id, std::string message)
{
    if (!m_config.event_listener)
    {
        return;
    }
    PoolEvent event{type, worker_id, std::move(task_id), std::move(message)};
    try
    {
        m_config.event_listener(event);
    }
    catch (const std::exception& e)
    {
        logger()->error("[WorkerPool] Event listener threw on {}: {}", to_string(type), e.what());
    }
}

// ============================================================================
// Factory
// ============================================================================

ExecutorPtr make_executor(
    PoolConfig config,
    TaskHandlerRegistryPtr registry,
    bool use_worker_pool)
{
    if (!use_worker_pool)
    {
        validate(config);
        InlineExecutorConfig inline_config;
        inline_config.max_concurrency = config.max_workers;
        inline_config.verbose = config.verbose;
        return make_inline_executor(inline_config, std::move(registry));
    }

    auto pool = std::make_shared<WorkerPool>(std::move(config), std::move(registry));
    pool->initialize();
    return pool;
}

} // namespace workpool
