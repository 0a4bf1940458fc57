#include "workpool/analysis/finding.hpp"

namespace workpool
{

NLOHMANN_JSON_SERIALIZE_ENUM(Severity, {
    {Severity::Low, "low"},
    {Severity::Medium, "medium"},
    {Severity::High, "high"},
    {Severity::Critical, "critical"},
})

const char* to_string(Severity severity) noexcept
{
    switch (severity)
    {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

bool operator==(const Finding& lhs, const Finding& rhs)
{
    return lhs.routine == rhs.routine
        && lhs.file == rhs.file
        && lhs.line == rhs.line
        && lhs.column == rhs.column
        && lhs.severity == rhs.severity
        && lhs.rule_id == rhs.rule_id
        && lhs.message == rhs.message;
}

void to_json(Json& j, const Finding& finding)
{
    j = Json{
        {"routine", finding.routine},
        {"file", finding.file},
        {"line", finding.line},
        {"column", finding.column},
        {"severity", finding.severity},
        {"ruleId", finding.rule_id},
        {"message", finding.message},
    };
}

void from_json(const Json& j, Finding& finding)
{
    finding.routine = j.value("routine", std::string{});
    j.at("file").get_to(finding.file);
    finding.line = j.value("line", 0);
    finding.column = j.value("column", 0);
    finding.severity = j.value("severity", Severity::Medium);
    finding.rule_id = j.value("ruleId", std::string{});
    j.at("message").get_to(finding.message);
}

} // namespace workpool
