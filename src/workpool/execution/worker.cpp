#include "workpool/execution/worker.hpp"
#include "workpool/common/pool_errors.hpp"
#include "workpool/execution/task_runner.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace workpool
{

namespace
{

constexpr int k_exit_protocol_error = 2;
constexpr int k_exit_internal_error = 3;
constexpr int k_exit_init_failed = 4;

std::int64_t peak_rss_kb() noexcept
{
    struct rusage usage{};
    if (::getrusage(RUSAGE_SELF, &usage) != 0)
    {
        return 0;
    }
    return static_cast<std::int64_t>(usage.ru_maxrss);
}

Json result_message(const TaskResult& result)
{
    return Json{
        {"type", "result"},
        {"result", result},
        {"rssKB", peak_rss_kb()},
    };
}

} // namespace

std::string describe_exit_status(int status)
{
    if (WIFEXITED(status))
    {
        return "exited with code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status))
    {
        int sig = WTERMSIG(status);
        const char* name = ::strsignal(sig);
        std::string text = "killed by signal " + std::to_string(sig);
        if (name)
        {
            text += " (" + std::string(name) + ")";
        }
        return text;
    }
    return "ended with status " + std::to_string(status);
}

std::unique_ptr<Worker> Worker::spawn(
    int id,
    const TaskHandlerRegistry& registry,
    const WorkerOptions& options,
    const std::vector<int>& fds_to_close)
{
    auto channels = MessageChannel::create_pair();

    pid_t pid = ::fork();
    if (pid == -1)
    {
        throw WorkerInitError(std::string("fork: ") + std::strerror(errno));
    }

    if (pid == 0)
    {
        for (int fd : fds_to_close)
        {
            ::close(fd);
        }
        channels.first.close();
        child_main(id, std::move(channels.second), registry, options);
    }

    channels.second.close();
    return std::unique_ptr<Worker>(new Worker(id, pid, std::move(channels.first)));
}

Worker::Worker(int id, pid_t pid, MessageChannel channel)
    : m_id{id}
    , m_pid{pid}
    , m_channel{std::move(channel)}
{}

Worker::~Worker()
{
    terminate();
}

void Worker::child_main(
    int id,
    MessageChannel channel,
    const TaskHandlerRegistry& registry,
    const WorkerOptions& options)
{
    // Nothing may unwind past this frame: the stack below belongs to the
    // parent's copy of the pool.
    try
    {
        if (options.memory_limit_mb > 0)
        {
            // A worker that cannot enforce its limit must not report ready.
            const rlim_t requested = static_cast<rlim_t>(options.memory_limit_mb) * 1024 * 1024;
            struct rlimit limit{};
            if (::getrlimit(RLIMIT_AS, &limit) != 0 ||
                (limit.rlim_max != RLIM_INFINITY && requested > limit.rlim_max))
            {
                ::_exit(k_exit_init_failed);
            }
            limit.rlim_cur = requested;
            limit.rlim_max = requested;
            if (::setrlimit(RLIMIT_AS, &limit) != 0)
            {
                ::_exit(k_exit_init_failed);
            }
        }

        if (options.init)
        {
            try
            {
                options.init(id);
            }
            catch (...)
            {
                ::_exit(k_exit_init_failed);
            }
        }

        if (!channel.send(Json{{"type", "ready"}, {"pid", ::getpid()}, {"workerId", id}}))
        {
            ::_exit(0);
        }

        for (;;)
        {
            std::optional<Json> message = channel.receive();
            if (!message)
            {
                ::_exit(0);
            }

            const std::string type = message->value("type", std::string{});
            if (type == "shutdown")
            {
                ::_exit(0);
            }
            if (type != "task")
            {
                ::_exit(k_exit_protocol_error);
            }

            Task task = message->at("task").get<Task>();
            TaskResult result = run_task(registry, task, id);

            Json reply;
            try
            {
                reply = result_message(result);
                static_cast<void>(reply.dump());
            }
            catch (const Json::exception& e)
            {
                reply = result_message(TaskResult::failed(
                    task.id, TaskFailure::HandlerError,
                    std::string("Handler result is not serializable: ") + e.what(),
                    id, result.duration_ms));
            }

            if (!channel.send(reply))
            {
                ::_exit(0);
            }
        }
    }
    catch (const ProtocolError&)
    {
        ::_exit(k_exit_protocol_error);
    }
    catch (const Json::exception&)
    {
        ::_exit(k_exit_protocol_error);
    }
    catch (...)
    {
        ::_exit(k_exit_internal_error);
    }
}

void Worker::wait_ready(std::chrono::milliseconds timeout)
{
    if (!m_channel.wait_readable(timeout))
    {
        throw WorkerInitError(
            "Worker " + std::to_string(m_id) + " did not report ready within " +
            std::to_string(timeout.count()) + "ms");
    }

    std::optional<Json> message;
    try
    {
        message = m_channel.receive();
    }
    catch (const ProtocolError& e)
    {
        throw WorkerInitError(
            "Worker " + std::to_string(m_id) + " sent a bad ready message: " + e.what());
    }

    if (!message)
    {
        throw WorkerInitError(
            "Worker " + std::to_string(m_id) + " " + reap() + " before reporting ready");
    }
    if (message->value("type", std::string{}) != "ready")
    {
        throw WorkerInitError(
            "Worker " + std::to_string(m_id) + " sent '" +
            message->value("type", std::string{}) + "' instead of ready");
    }
}

bool Worker::send_task(const Task& task)
{
    return m_channel.send(Json{{"type", "task"}, {"task", task}});
}

std::optional<WorkerReply> Worker::receive()
{
    std::optional<Json> message = m_channel.receive();
    if (!message)
    {
        return std::nullopt;
    }

    if (message->value("type", std::string{}) != "result")
    {
        throw ProtocolError(
            "Worker " + std::to_string(m_id) + " sent unexpected message: " + message->dump());
    }

    try
    {
        WorkerReply reply;
        reply.result = message->at("result").get<TaskResult>();
        reply.rss_kb = message->value("rssKB", std::int64_t{0});
        return reply;
    }
    catch (const Json::exception& e)
    {
        throw ProtocolError(
            "Worker " + std::to_string(m_id) + " sent malformed result: " + e.what());
    }
}

bool Worker::request_exit()
{
    return m_channel.send(Json{{"type", "shutdown"}});
}

bool Worker::wait_exit(std::chrono::milliseconds timeout)
{
    if (m_pid <= 0)
    {
        return true;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;)
    {
        int status = 0;
        pid_t rc = ::waitpid(m_pid, &status, WNOHANG);
        if (rc == m_pid || (rc == -1 && errno == ECHILD))
        {
            m_exit_description = rc == m_pid ? describe_exit_status(status) : "exited";
            m_pid = -1;
            m_channel.close();
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

std::string Worker::terminate() noexcept
{
    if (m_pid > 0)
    {
        ::kill(m_pid, SIGKILL);
    }
    return reap();
}

std::string Worker::reap() noexcept
{
    if (m_pid > 0)
    {
        int status = 0;
        pid_t rc = -1;
        do
        {
            rc = ::waitpid(m_pid, &status, WNOHANG);
        } while (rc == -1 && errno == EINTR);

        if (rc == 0)
        {
            // Channel closed but the process lingers (e.g. it closed the
            // socket itself); it is no longer usable as a worker.
            ::kill(m_pid, SIGKILL);
            do
            {
                rc = ::waitpid(m_pid, &status, 0);
            } while (rc == -1 && errno == EINTR);
        }

        if (rc == m_pid)
        {
            m_exit_description = describe_exit_status(status);
        }
        else
        {
            m_exit_description = "exited";
        }
        m_pid = -1;
    }
    m_channel.close();
    return m_exit_description;
}

} // namespace workpool
