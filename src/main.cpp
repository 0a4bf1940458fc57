#include "workpool/analysis/task_generator.hpp"
#include "workpool/common/logging.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace
{

using namespace workpool;

/**
 * @brief Reports TODO/FIXME/HACK markers in comments.
 */
class TodoMarkerRoutine : public IRoutine
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
            for (const char* marker : {"TODO", "FIXME", "HACK"})
            {
                auto pos = line.find(marker);
                if (pos == std::string::npos)
                {
                    continue;
                }
                Finding finding;
                finding.file = file_path;
                finding.line = line_no;
                finding.column = static_cast<int>(pos) + 1;
                finding.severity = Severity::Low;
                finding.rule_id = std::string("marker-") + marker;
                finding.message = std::string(marker) + " marker left in source";
                findings.push_back(std::move(finding));
                break;
            }
        }
        return findings;
    }
};

/**
 * @brief Reports lines longer than k_max_length characters.
 */
class LongLineRoutine : public IRoutine
{
public:
    static constexpr std::size_t k_max_length = 120;

    std::vector<Finding> run(const std::string& file_path) override
    {
        std::vector<Finding> findings;
        std::ifstream in(file_path);
        std::string line;
        int line_no = 0;
        while (std::getline(in, line))
        {
            ++line_no;
            if (line.size() <= k_max_length)
            {
                continue;
            }
            Finding finding;
            finding.file = file_path;
            finding.line = line_no;
            finding.column = static_cast<int>(k_max_length) + 1;
            finding.severity = line.size() > 2 * k_max_length ? Severity::High : Severity::Medium;
            finding.rule_id = "long-line";
            finding.message = "line has " + std::to_string(line.size()) + " characters";
            findings.push_back(std::move(finding));
        }
        return findings;
    }
};

void print_usage(const char* program)
{
    std::cerr << "Usage: " << program
              << " <workspace> [--workers N] [--inline] [--verbose]\n";
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        if (argc < 2)
        {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }

        std::string workspace;
        workpool::GeneratorConfig config;
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--workers" && i + 1 < argc)
            {
                config.pool.max_workers = std::stoi(argv[++i]);
            }
            else if (arg == "--inline")
            {
                config.use_worker_pool = false;
            }
            else if (arg == "--verbose")
            {
                config.pool.verbose = true;
            }
            else if (workspace.empty() && arg.rfind("--", 0) != 0)
            {
                workspace = arg;
            }
            else
            {
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
        }
        if (workspace.empty())
        {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }

        config.on_progress = [](const workpool::ProgressEvent& event)
        {
            if (event.phase != workpool::ProgressPhase::RunDetectors || !event.routine.empty())
            {
                return;
            }
            workpool::logger()->info("{}: {} tasks ({} routines skipped)",
                                     workpool::to_string(event.phase),
                                     event.total.value_or(0),
                                     event.detectors_skipped.size());
        };

        auto routines = std::make_shared<workpool::RoutineRegistry>();
        routines->register_routine("todo-marker", [] { return std::make_unique<TodoMarkerRoutine>(); });
        routines->register_routine("long-line", [] { return std::make_unique<LongLineRoutine>(); });

        workpool::TaskGenerator generator(config, routines);
        workpool::RunReport report = generator.run(workspace);

        std::cout << report.findings.size() << " findings in " << report.files_scanned
                  << " files (" << report.tasks_failed << " failed tasks)\n";
        for (const auto& finding : report.findings)
        {
            std::cout << finding.file << ":" << finding.line << ":" << finding.column
                      << ": [" << workpool::to_string(finding.severity) << "] "
                      << finding.rule_id << ": " << finding.message << "\n";
        }
        std::cout << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
