#include <gtest/gtest.h>
#include "workpool/analysis/task_generator.hpp"
#include "workpool/common/pool_errors.hpp"
#include "test_workspace.hpp"

#include <algorithm>
#include <fstream>

using namespace workpool;
using workpool::test_support::TestWorkspace;

namespace
{

/**
 * @brief One finding per line containing "X".
 */
class MarkerRoutine : public IRoutine
{
public:
    std::vector<Finding> run(const std::string& file_path) override
    {
        std::vector<Finding> findings;
        std::ifstream in(file_path);
        std::string line;
        int line_no = 0;
        while (std::getline(in, line))
        {
            ++line_no;
            auto pos = line.find('X');
            if (pos != std::string::npos)
            {
                Finding finding;
                finding.line = line_no;
                finding.column = static_cast<int>(pos) + 1;
                finding.rule_id = "marker";
                finding.message = "X found";
                findings.push_back(std::move(finding));
            }
        }
        return findings;
    }
};

/**
 * @brief Reports every file once.
 */
class EveryFileRoutine : public IRoutine
{
public:
    std::vector<Finding> run(const std::string& file_path) override
    {
        Finding finding;
        finding.file = file_path;
        finding.severity = Severity::Low;
        finding.rule_id = "seen";
        finding.message = "seen";
        return {finding};
    }
};

class ThrowingRoutine : public IRoutine
{
public:
    std::vector<Finding> run(const std::string& file_path) override
    {
        if (file_path.find("bad") != std::string::npos)
        {
            throw std::runtime_error("cannot parse " + file_path);
        }
        return {};
    }
};

} // namespace

class TaskGeneratorTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto routines = std::make_shared<RoutineRegistry>();
        routines->register_routine("marker", [] { return std::make_unique<MarkerRoutine>(); });
        routines->register_routine("every-file", [] { return std::make_unique<EveryFileRoutine>(); });
        routines->register_routine("python-only", [] { return std::make_unique<EveryFileRoutine>(); }, {".py"});
        routines->register_routine("throwing", [] { return std::make_unique<ThrowingRoutine>(); });
        registry = routines;

        config.pool.max_workers = 2;
        config.use_worker_pool = false;
        config.on_progress = [this](const ProgressEvent& event) { events.push_back(event); };
    }

    size_t count_phase(ProgressPhase phase, bool per_task) const
    {
        return static_cast<size_t>(std::count_if(events.begin(), events.end(),
            [&](const ProgressEvent& event)
            {
                return event.phase == phase && (!event.routine.empty()) == per_task;
            }));
    }

    TestWorkspace workspace;
    RoutineRegistryPtr registry;
    GeneratorConfig config;
    std::vector<ProgressEvent> events;
};

TEST_F(TaskGeneratorTests, Construct_InvalidConfig_Throws)
{
    config.pool.max_workers = 0;
    EXPECT_THROW(TaskGenerator(config, registry), ConfigurationError);
}

TEST_F(TaskGeneratorTests, Construct_NullRegistry_Throws)
{
    EXPECT_THROW(TaskGenerator(config, nullptr), ConfigurationError);
}

TEST_F(TaskGeneratorTests, Construct_RegistersRoutineHandler)
{
    TaskGenerator generator(config, registry);
    EXPECT_TRUE(generator.handlers()->contains(k_run_routine_task));
}

TEST_F(TaskGeneratorTests, BuildTasks_IsCartesianProduct)
{
    auto tasks = TaskGenerator::build_tasks("/w", {"/w/a.ts", "/w/b.py"}, {"r1", "r2", "r3"});
    ASSERT_EQ(tasks.size(), 6u);
    EXPECT_EQ(tasks[0].id, "r1:/w/a.ts");
    EXPECT_EQ(tasks[0].type, k_run_routine_task);
    EXPECT_EQ(tasks[0].data.at("workspaceRoot"), "/w");
    EXPECT_EQ(tasks[0].data.at("filePath"), "/w/a.ts");
    EXPECT_EQ(tasks[0].data.at("routineName"), "r1");
    EXPECT_EQ(tasks[5].id, "r3:/w/b.py");
}

TEST_F(TaskGeneratorTests, Run_NoFiles_ShortCircuits)
{
    TaskGenerator generator(config, registry);
    RunReport report = generator.run(workspace.root());

    EXPECT_TRUE(report.findings.empty());
    EXPECT_EQ(report.files_scanned, 0u);
    EXPECT_EQ(report.tasks_total, 0u);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().phase, ProgressPhase::CollectFiles);
    EXPECT_EQ(events.back().message, "no files found");
    EXPECT_EQ(count_phase(ProgressPhase::RunDetectors, false), 0u);
}

TEST_F(TaskGeneratorTests, Run_MissingWorkspace_Throws)
{
    TaskGenerator generator(config, registry);
    EXPECT_THROW(generator.run(workspace.path("missing")), std::filesystem::filesystem_error);
}

TEST_F(TaskGeneratorTests, Run_UnknownRoutine_Throws)
{
    workspace.write("a.ts");
    TaskGenerator generator(config, registry);
    EXPECT_THROW(generator.run(workspace.root(), {"no-such-routine"}), RegistryError);
}

TEST_F(TaskGeneratorTests, Run_ExecutesEveryFileRoutinePair)
{
    std::string a = workspace.write("a.ts", "X\nok\nX X\n");
    std::string b = workspace.write("src/b.py", "fine\n");
    std::string c = workspace.write("src/c.go", "X\n");

    TaskGenerator generator(config, registry);
    RunReport report = generator.run(workspace.root(), {"marker", "every-file"});

    EXPECT_EQ(report.files_scanned, 3u);
    EXPECT_EQ(report.tasks_total, 3u * 2u);
    EXPECT_EQ(report.tasks_failed, 0u);
    EXPECT_EQ(report.routines_run, (std::vector<std::string>{"every-file", "marker"}));

    // marker: a.ts lines 1 and 3, c.go line 1; every-file: one per file.
    EXPECT_EQ(report.findings.size(), 3u + 3u);
    size_t marker_findings = 0;
    for (const auto& finding : report.findings)
    {
        EXPECT_FALSE(finding.routine.empty());
        EXPECT_FALSE(finding.file.empty());
        if (finding.routine == "marker")
        {
            ++marker_findings;
            EXPECT_TRUE(finding.file == a || finding.file == c) << finding.file;
        }
    }
    EXPECT_EQ(marker_findings, 3u);
}

TEST_F(TaskGeneratorTests, Run_FailedPairIsDroppedAndRecorded)
{
    workspace.write("good.ts", "X\n");
    std::string bad = workspace.write("bad.ts", "X\n");

    TaskGenerator generator(config, registry);
    RunReport report = generator.run(workspace.root(), {"marker", "throwing"});

    EXPECT_EQ(report.tasks_total, 4u);
    EXPECT_EQ(report.tasks_failed, 1u);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].routine, "throwing");
    EXPECT_EQ(report.failures[0].file, bad);
    EXPECT_EQ(report.failures[0].failure, TaskFailure::HandlerError);
    EXPECT_NE(report.failures[0].error.find("cannot parse"), std::string::npos);
    EXPECT_EQ(report.findings.size(), 2u);
}

TEST_F(TaskGeneratorTests, Run_OutOfScopeFilesYieldNoFindings)
{
    workspace.write("a.ts");
    std::string py = workspace.write("b.py");

    TaskGenerator generator(config, registry);
    RunReport report = generator.run(workspace.root(), {"python-only"});

    EXPECT_EQ(report.tasks_total, 2u);
    ASSERT_EQ(report.findings.size(), 1u);
    EXPECT_EQ(report.findings[0].file, py);
}

TEST_F(TaskGeneratorTests, Run_ChangedFilesHint_SkipsRoutinesWithNoFileInScope)
{
    workspace.write("a.ts");
    workspace.write("src/c.go");

    TaskGenerator generator(config, registry);
    RunReport report = generator.run(
        workspace.root(), {"every-file", "python-only"},
        std::vector<std::string>{workspace.path("a.ts")});

    EXPECT_EQ(report.routines_run, std::vector<std::string>{"every-file"});
    EXPECT_EQ(report.routines_skipped, std::vector<std::string>{"python-only"});
    EXPECT_EQ(report.tasks_total, 2u);

    auto start = std::find_if(events.begin(), events.end(), [](const ProgressEvent& event)
    {
        return event.phase == ProgressPhase::RunDetectors && event.routine.empty();
    });
    ASSERT_NE(start, events.end());
    EXPECT_EQ(start->detectors_skipped, std::vector<std::string>{"python-only"});
}

TEST_F(TaskGeneratorTests, Run_ChangedFilesHint_KeepsFindingsOfUnchangedFiles)
{
    workspace.write("a.ts", "X\n");
    std::string py = workspace.write("b.py", "X\n");

    TaskGenerator plain(config, registry);
    RunReport without_hint = plain.run(workspace.root(), {"marker", "python-only"});

    events.clear();
    TaskGenerator hinted(config, registry);
    RunReport with_hint = hinted.run(
        workspace.root(), {"marker", "python-only"},
        std::vector<std::string>{workspace.path("a.ts")});

    EXPECT_TRUE(with_hint.routines_skipped.empty());
    EXPECT_EQ(with_hint.findings, without_hint.findings);

    EXPECT_EQ(with_hint.findings.size(), 3u);
    auto python = std::find_if(with_hint.findings.begin(), with_hint.findings.end(),
        [](const Finding& finding) { return finding.routine == "python-only"; });
    ASSERT_NE(python, with_hint.findings.end());
    EXPECT_EQ(python->file, py);
}

TEST_F(TaskGeneratorTests, Run_EmptyChangedFilesHint_SkipsNothing)
{
    workspace.write("a.ts");
    TaskGenerator generator(config, registry);
    RunReport report = generator.run(workspace.root(), {}, std::vector<std::string>{});
    EXPECT_TRUE(report.routines_skipped.empty());
    EXPECT_EQ(report.routines_run.size(), registry->size());
}

TEST_F(TaskGeneratorTests, Run_ProgressCoversEveryPhase)
{
    workspace.write("a.ts");
    workspace.write("b.ts");

    TaskGenerator generator(config, registry);
    generator.run(workspace.root(), {"marker", "every-file"});

    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().phase, ProgressPhase::CollectFiles);
    EXPECT_EQ(events.back().phase, ProgressPhase::Complete);
    EXPECT_EQ(events.back().total, 4u);
    EXPECT_EQ(count_phase(ProgressPhase::RunDetectors, false), 1u);
    EXPECT_EQ(count_phase(ProgressPhase::RunDetectors, true), 4u);

    std::vector<size_t> completed;
    for (const auto& event : events)
    {
        if (event.phase == ProgressPhase::RunDetectors && !event.routine.empty())
        {
            completed.push_back(event.completed.value_or(0));
            EXPECT_TRUE(event.success.value_or(false));
            EXPECT_FALSE(event.file.empty());
        }
    }
    EXPECT_EQ(completed, (std::vector<size_t>{1, 2, 3, 4}));
}

TEST_F(TaskGeneratorTests, Run_OnWorkerPool_MatchesInline)
{
    workspace.write("a.ts", "X\n");
    workspace.write("bad.py", "X\nX\n");
    workspace.write("lib/c.rs", "nothing\n");

    TaskGenerator inline_generator(config, registry);
    RunReport inline_report = inline_generator.run(workspace.root());

    config.use_worker_pool = true;
    TaskGenerator pool_generator(config, registry);
    RunReport pool_report = pool_generator.run(workspace.root());

    EXPECT_EQ(pool_report.tasks_total, inline_report.tasks_total);
    EXPECT_EQ(pool_report.tasks_failed, inline_report.tasks_failed);
    EXPECT_EQ(pool_report.findings, inline_report.findings);
}

TEST_F(TaskGeneratorTests, ReportJson_HasSummaryFields)
{
    RunReport report;
    report.files_scanned = 2;
    report.tasks_total = 4;
    report.failures.push_back(RunFailure{"r", "/w/a.ts", "boom", TaskFailure::Timeout});

    Json j = report;
    EXPECT_EQ(j.at("filesScanned"), 2);
    EXPECT_EQ(j.at("tasksTotal"), 4);
    EXPECT_EQ(j.at("failures").at(0).at("failure"), "timeout");
}
