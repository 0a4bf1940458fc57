/**
 * @file worker.hpp
 * @brief Worker: an isolated child process that runs one task at a time.
 */
#pragma once
#include "workpool/common/common.hpp"
#include "workpool/execution/message_channel.hpp"
#include "workpool/execution/task.hpp"
#include "workpool/execution/task_handler_registry.hpp"
#include <sys/types.h>

namespace workpool
{

/**
 * @brief Per-process settings applied inside a worker after fork.
 */
struct WorkerOptions
{
    /**
     * @brief Address-space limit in MiB. 0 means unlimited.
     */
    std::int64_t memory_limit_mb{0};

    /**
     * @brief Run in the child before it reports ready. Throwing aborts the
     *        start.
     */
    std::function<void(int worker_id)> init;
};

/**
 * @brief A result message read from a worker.
 */
struct WorkerReply
{
    TaskResult result;

    /**
     * @brief Peak resident set size reported by the worker process.
     */
    std::int64_t rss_kb{0};
};

/**
 * @brief Parent-side handle of a worker process.
 *
 * @details
 * A Worker is a forked child process connected to the pool by a
 * MessageChannel. The child resolves each task's type in its copy of the
 * TaskHandlerRegistry, runs it with run_task() and replies with the result.
 * Because it shares no memory with the pool or other workers, a handler that
 * crashes, aborts or hangs only takes down its own process; detecting that is
 * the pool's job, never the worker's.
 *
 * @par Protocol
 * - child → parent: `{"type":"ready","pid":n}` once after start.
 * - parent → child: `{"type":"task","task":{...}}`.
 * - child → parent: `{"type":"result","result":{...},"rssKB":n}`.
 * - parent → child: `{"type":"shutdown"}`; EOF has the same effect.
 *
 * @par Ownership
 * - The handle owns the process: destroying it kills and reaps the child if
 *   it is still running.
 *
 * @par Thread Safety
 * - Not thread-safe. WorkerPool only touches workers from its dispatcher.
 */
class Worker
{
public:
    /**
     * @brief Fork a new worker process.
     * @param id Slot id reported in every TaskResult of this worker.
     * @param registry Handlers available to the child (copied by fork).
     * @param options Limits applied in the child.
     * @param fds_to_close Descriptors the child must close right after fork,
     *        e.g. other workers' channels, so that their EOF stays observable.
     * @return The handle. The worker has not necessarily reported ready yet.
     * @throws WorkerInitError if the channel cannot be created or fork fails.
     */
    static std::unique_ptr<Worker> spawn(
        int id,
        const TaskHandlerRegistry& registry,
        const WorkerOptions& options,
        const std::vector<int>& fds_to_close);

    ~Worker();

    Worker(const Worker&) = delete;
    Worker(Worker&&) = delete;
    Worker& operator=(const Worker&) = delete;
    Worker& operator=(Worker&&) = delete;

    /**
     * @brief Block until the worker sends its ready message.
     * @throws WorkerInitError if the worker exits, misbehaves or stays silent
     *         for longer than @p timeout.
     */
    void wait_ready(std::chrono::milliseconds timeout);

    /**
     * @brief Send a task to the worker.
     * @return False if the worker is gone.
     * @throws ProtocolError if the task cannot be encoded.
     */
    bool send_task(const Task& task);

    /**
     * @brief Read the next reply. Call when channel() is readable.
     * @return The reply, or std::nullopt if the worker closed its channel.
     * @throws ProtocolError if the message is malformed or not a result.
     */
    std::optional<WorkerReply> receive();

    /**
     * @brief Ask the worker to exit after its current task.
     * @return False if the worker is already gone.
     */
    bool request_exit();

    /**
     * @brief Wait for the process to exit on its own.
     * @return True if it exited (and was reaped) within @p timeout.
     */
    bool wait_exit(std::chrono::milliseconds timeout);

    /**
     * @brief Kill the process and reap it.
     * @return Description of how the process ended.
     */
    std::string terminate() noexcept;

    /**
     * @brief Reap the process after its channel reached EOF, killing it if it
     *        is somehow still running.
     * @return Description of how the process ended.
     */
    std::string reap() noexcept;

    int id() const noexcept
    {
        return m_id;
    }

    pid_t pid() const noexcept
    {
        return m_pid;
    }

    bool running() const noexcept
    {
        return m_pid > 0;
    }

    MessageChannel& channel() noexcept
    {
        return m_channel;
    }

    const MessageChannel& channel() const noexcept
    {
        return m_channel;
    }

private:
    Worker(int id, pid_t pid, MessageChannel channel);

    [[noreturn]] static void child_main(
        int id,
        MessageChannel channel,
        const TaskHandlerRegistry& registry,
        const WorkerOptions& options);

    int m_id;
    pid_t m_pid;
    MessageChannel m_channel;
    std::string m_exit_description;
};

using WorkerPtr = std::unique_ptr<Worker>;

/**
 * @brief Describe a wait status, e.g. "killed by signal 11 (Segmentation fault)".
 */
std::string describe_exit_status(int status);

} // namespace workpool
