/**
 * @file routine.hpp
 * @brief IRoutine: a pluggable analysis unit run on one file at a time.
 */
#pragma once
#include "workpool/analysis/finding.hpp"

namespace workpool
{

/**
 * @brief Interface for analysis routines.
 *
 * @details
 * A routine inspects a single file and returns what it found. Instances are
 * created per task through a RoutineRegistry factory, inside whichever
 * process runs the task, so a routine may keep per-file state in members.
 * Routines must not have side effects beyond their return value: a timed-out
 * task is abandoned, not rolled back.
 *
 * Throwing from run() fails the (file, routine) task only.
 */
class IRoutine
{
public:
    virtual ~IRoutine() = default;

    /**
     * @brief Analyze one file.
     * @param file_path Absolute path of the file.
     */
    virtual std::vector<Finding> run(const std::string& file_path) = 0;
};

using RoutinePtr = std::unique_ptr<IRoutine>;
using RoutineFactory = std::function<RoutinePtr()>;

} // namespace workpool
