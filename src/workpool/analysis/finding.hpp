/**
 * @file finding.hpp
 * @brief Finding: one issue reported by an analysis routine.
 */
#pragma once
#include "workpool/common/common.hpp"

namespace workpool
{

enum class Severity
{
    Low,
    Medium,
    High,
    Critical
};

const char* to_string(Severity severity) noexcept;

/**
 * @brief An issue found by a routine in one file.
 *
 * @details
 * `line` and `column` are 1-based; 0 means the finding applies to the file as
 * a whole. `routine` is filled in by the TaskGenerator, routines may leave it
 * empty.
 */
struct Finding
{
    std::string routine;
    std::string file;
    int line{0};
    int column{0};
    Severity severity{Severity::Medium};
    std::string rule_id;
    std::string message;
};

bool operator==(const Finding& lhs, const Finding& rhs);

void to_json(Json& j, const Finding& finding);
void from_json(const Json& j, Finding& finding);

} // namespace workpool
