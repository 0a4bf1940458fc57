/**
 * @file progress.hpp
 * @brief Progress notifications of an analysis run.
 */
#pragma once
#include "workpool/common/common.hpp"

namespace workpool
{

enum class ProgressPhase
{
    CollectFiles,
    RunDetectors,
    Complete
};

inline const char* to_string(ProgressPhase phase) noexcept
{
    switch (phase)
    {
        case ProgressPhase::CollectFiles: return "collectFiles";
        case ProgressPhase::RunDetectors: return "runDetectors";
        case ProgressPhase::Complete: return "complete";
    }
    return "unknown";
}

/**
 * @brief One progress notification.
 *
 * @details
 * Phase boundary events carry totals and an optional message. Events emitted
 * after each finished task (phase RunDetectors) also carry the routine, file,
 * duration and outcome of that task.
 */
struct ProgressEvent
{
    ProgressPhase phase{ProgressPhase::CollectFiles};
    std::optional<std::size_t> total;
    std::optional<std::size_t> completed;
    std::string message;

    /**
     * @brief Names of the routines pruned by the changed-files hint. Set on
     *        the RunDetectors start event.
     */
    std::vector<std::string> detectors_skipped;

    std::string routine;
    std::string file;
    std::optional<std::int64_t> duration_ms;
    std::optional<bool> success;
};

/**
 * @brief Progress callback. Calls are serialized; never concurrent.
 */
using ProgressCallback = std::function<void(const ProgressEvent&)>;

} // namespace workpool
