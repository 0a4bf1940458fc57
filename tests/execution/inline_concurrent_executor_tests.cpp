#include <gtest/gtest.h>
#include "workpool/common/pool_errors.hpp"
#include "workpool/execution/inline_concurrent_executor.hpp"

#include <set>
#include <thread>

using namespace workpool;

class InlineConcurrentExecutorTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto handlers = std::make_shared<TaskHandlerRegistry>();
        handlers->register_handler("echo", [](const Json& data) { return data; });
        handlers->register_handler("fail", [](const Json&) -> Json
        {
            throw std::runtime_error("routine failed");
        });
        handlers->register_handler("sleep", [](const Json& data)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(data.at("ms").get<int>()));
            return Json(true);
        });
        registry = handlers;
    }

    static Task make_task(const std::string& id, const std::string& type,
                          Json data = Json::object(), int priority = 0)
    {
        Task task;
        task.id = id;
        task.type = type;
        task.data = std::move(data);
        task.priority = priority;
        return task;
    }

    InlineExecutorConfig config_with(int concurrency)
    {
        InlineExecutorConfig config;
        config.max_concurrency = concurrency;
        return config;
    }

    TaskHandlerRegistryPtr registry;
};

TEST_F(InlineConcurrentExecutorTests, Construct_InvalidConcurrency_Throws)
{
    EXPECT_THROW(InlineConcurrentExecutor(config_with(0), registry), ConfigurationError);
    EXPECT_THROW(InlineConcurrentExecutor(config_with(-3), registry), ConfigurationError);
}

TEST_F(InlineConcurrentExecutorTests, Construct_NullRegistry_Throws)
{
    EXPECT_THROW(InlineConcurrentExecutor(config_with(1), nullptr), ConfigurationError);
}

TEST_F(InlineConcurrentExecutorTests, Submit_ReturnsHandlerResult)
{
    InlineConcurrentExecutor executor(config_with(2), registry);
    TaskResult result = executor.submit(make_task("a", "echo", {{"v", 1}}));
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.data.at("v"), 1);
}

TEST_F(InlineConcurrentExecutorTests, Process_ResultsAreIndexAligned)
{
    InlineConcurrentExecutor executor(config_with(3), registry);
    std::vector<Task> tasks;
    for (int i = 0; i < 20; ++i)
    {
        tasks.push_back(make_task("t" + std::to_string(i), i % 4 == 0 ? "fail" : "echo",
                                  {{"i", i}}, i % 3));
    }

    auto results = executor.process(tasks);
    ASSERT_EQ(results.size(), tasks.size());
    for (size_t i = 0; i < tasks.size(); ++i)
    {
        EXPECT_EQ(results[i].task_id, tasks[i].id);
        EXPECT_EQ(results[i].success, i % 4 != 0);
    }
}

TEST_F(InlineConcurrentExecutorTests, Process_FailureDoesNotAbortBatch)
{
    InlineConcurrentExecutor executor(config_with(2), registry);
    auto results = executor.process({
        make_task("ok1", "echo"),
        make_task("bad", "fail"),
        make_task("ok2", "echo"),
    });
    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].success);
    EXPECT_FALSE(results[1].success);
    EXPECT_EQ(results[1].error, "routine failed");
    EXPECT_TRUE(results[2].success);
}

TEST_F(InlineConcurrentExecutorTests, Process_RunsTasksConcurrently)
{
    InlineConcurrentExecutor executor(config_with(4), registry);
    std::vector<Task> tasks;
    for (int i = 0; i < 4; ++i)
    {
        tasks.push_back(make_task("s" + std::to_string(i), "sleep", {{"ms", 200}}));
    }

    auto start = std::chrono::steady_clock::now();
    auto results = executor.process(tasks);
    auto elapsed = std::chrono::steady_clock::now() - start;

    for (const auto& result : results)
    {
        EXPECT_TRUE(result.success);
    }
    EXPECT_LT(elapsed, std::chrono::milliseconds(700));
}

TEST_F(InlineConcurrentExecutorTests, Process_SingleLane_StartsByPriority)
{
    InlineConcurrentExecutor executor(config_with(1), registry);
    std::vector<std::string> order;
    executor.process(
        {make_task("p1", "echo", {}, 1), make_task("p10", "echo", {}, 10), make_task("p5", "echo", {}, 5)},
        [&order](size_t, const TaskResult& result) { order.push_back(result.task_id); });
    EXPECT_EQ(order, (std::vector<std::string>{"p10", "p5", "p1"}));
}

TEST_F(InlineConcurrentExecutorTests, Process_CallbackCalledOncePerTask)
{
    InlineConcurrentExecutor executor(config_with(3), registry);
    std::mutex mutex;
    std::multiset<size_t> seen;
    std::vector<Task> tasks;
    for (int i = 0; i < 10; ++i)
    {
        tasks.push_back(make_task("c" + std::to_string(i), "echo"));
    }
    executor.process(tasks, [&](size_t index, const TaskResult& result)
    {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_EQ(result.task_id, tasks[index].id);
        seen.insert(index);
    });
    ASSERT_EQ(seen.size(), tasks.size());
    for (size_t i = 0; i < tasks.size(); ++i)
    {
        EXPECT_EQ(seen.count(i), 1u);
    }
}

TEST_F(InlineConcurrentExecutorTests, ThrowingCallback_DoesNotAbortBatch)
{
    InlineConcurrentExecutor executor(config_with(2), registry);
    auto results = executor.process(
        {make_task("a", "echo"), make_task("b", "echo")},
        [](size_t, const TaskResult&) { throw std::runtime_error("listener bug"); });
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].success);
    EXPECT_TRUE(results[1].success);
}

TEST_F(InlineConcurrentExecutorTests, Stats_ReportsConcurrencyAsWorkers)
{
    InlineConcurrentExecutor executor(config_with(3), registry);
    executor.process({make_task("a", "echo"), make_task("b", "echo")});
    PoolStats stats = executor.stats();
    EXPECT_EQ(stats.total_workers, 3u);
    EXPECT_EQ(stats.busy_workers, 0u);
    EXPECT_EQ(stats.idle_workers, 3u);
    EXPECT_EQ(stats.total_tasks_processed, 2u);
    EXPECT_DOUBLE_EQ(stats.utilization_rate, 0.0);
}

TEST_F(InlineConcurrentExecutorTests, Shutdown_RejectsLaterWork)
{
    InlineConcurrentExecutor executor(config_with(2), registry);
    executor.shutdown();
    EXPECT_TRUE(executor.is_shut_down());
    EXPECT_EQ(executor.stats().total_workers, 0u);

    TaskResult result = executor.submit(make_task("late", "echo"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure, TaskFailure::Rejected);

    auto results = executor.process({make_task("x", "echo"), make_task("y", "echo")});
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].failure, TaskFailure::Rejected);
    EXPECT_EQ(results[1].task_id, "y");
}

TEST_F(InlineConcurrentExecutorTests, Shutdown_WaitsForInFlightCall)
{
    InlineConcurrentExecutor executor(config_with(1), registry);
    std::thread caller([&executor]()
    {
        TaskResult result = executor.submit(make_task("slow", "sleep", {{"ms", 300}}));
        EXPECT_TRUE(result.success);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    auto start = std::chrono::steady_clock::now();
    executor.shutdown();
    auto waited = std::chrono::steady_clock::now() - start;
    caller.join();

    EXPECT_GE(waited, std::chrono::milliseconds(150));
}
