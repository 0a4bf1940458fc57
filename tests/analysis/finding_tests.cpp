#include <gtest/gtest.h>
#include "workpool/analysis/finding.hpp"

using namespace workpool;

class FindingTests : public ::testing::Test
{
};

TEST_F(FindingTests, ToJson_UsesCamelCaseKeysAndSeverityName)
{
    Finding finding;
    finding.routine = "todo-marker";
    finding.file = "/w/a.ts";
    finding.line = 3;
    finding.column = 5;
    finding.severity = Severity::High;
    finding.rule_id = "marker-TODO";
    finding.message = "TODO marker";

    Json j = finding;
    EXPECT_EQ(j.at("ruleId"), "marker-TODO");
    EXPECT_EQ(j.at("severity"), "high");
    EXPECT_EQ(j.at("line"), 3);
    EXPECT_EQ(j.get<Finding>(), finding);
}

TEST_F(FindingTests, FromJson_OptionalFieldsDefault)
{
    Finding finding = Json{{"file", "/w/b.py"}, {"message", "m"}}.get<Finding>();
    EXPECT_TRUE(finding.routine.empty());
    EXPECT_EQ(finding.line, 0);
    EXPECT_EQ(finding.column, 0);
    EXPECT_EQ(finding.severity, Severity::Medium);
}

TEST_F(FindingTests, FromJson_MissingMessage_Throws)
{
    EXPECT_THROW(Json({{"file", "/w/b.py"}}).get<Finding>(), Json::exception);
}

TEST_F(FindingTests, ToString_NamesSeverities)
{
    EXPECT_STREQ(to_string(Severity::Low), "low");
    EXPECT_STREQ(to_string(Severity::Critical), "critical");
}
