/**
 * @file test_run_report.cpp
 * @brief Unit tests for report aggregation and rendering
 */

#include <gtest/gtest.h>
#include <caload/loadgen/run_report.h>
#include "test_helpers.h"

#include <sstream>

using namespace caload::loadgen;
using namespace std::chrono_literals;

namespace {

ErrorRecord makeError(const std::string& id, ErrorStage stage, const std::string& message) {
    ErrorRecord e;
    e.subjectId = id;
    e.stage = stage;
    e.message = message;
    e.timestamp = std::chrono::system_clock::from_time_t(1770035696);
    return e;
}

} // anonymous namespace

// ============================================================================
// summarize
// ============================================================================

TEST(RunReportTest, Summarize_RateFromSubmissionElapsed) {
    auto report = summarize(4, 4, 4, {}, 2s);

    EXPECT_EQ(report.totalRequested, 4u);
    EXPECT_EQ(report.generated, 4u);
    EXPECT_EQ(report.submitted, 4u);
    EXPECT_EQ(report.failed, 0u);
    EXPECT_EQ(report.skipped, 0u);
    ASSERT_TRUE(report.rate.has_value());
    EXPECT_DOUBLE_EQ(*report.rate, 2.0);
}

TEST(RunReportTest, Summarize_ZeroElapsedHasNoRate) {
    auto report = summarize(0, 0, 0, {}, std::chrono::steady_clock::duration::zero());
    EXPECT_FALSE(report.rate.has_value());
}

TEST(RunReportTest, Summarize_FailedCountsDistinctSubjects) {
    std::vector<ErrorRecord> errors = {
        makeError("a", ErrorStage::GENERATION, "x"),
        makeError("b", ErrorStage::SUBMISSION, "y"),
        makeError("b", ErrorStage::UNEXPECTED, "z"),
    };
    auto report = summarize(5, 4, 3, errors, 1s);

    EXPECT_EQ(report.failed, 2u);
    EXPECT_EQ(report.errors.size(), 3u);
    EXPECT_EQ(report.submitted + report.failed, report.totalRequested);
    EXPECT_EQ(report.skipped, 0u);
}

TEST(RunReportTest, Summarize_UnaccountedItemsAreSkipped) {
    auto report = summarize(10, 3, 2, {makeError("a", ErrorStage::SUBMISSION, "x")}, 1s);
    EXPECT_EQ(report.skipped, 7u);
}

// ============================================================================
// renderReport
// ============================================================================

TEST(RunReportTest, Render_ContainsCountsAndRate) {
    auto report = summarize(4, 4, 4, {}, 2s);
    std::string text = renderReport(report);

    EXPECT_NE(text.find("Requested : 4"), std::string::npos);
    EXPECT_NE(text.find("Submitted : 4"), std::string::npos);
    EXPECT_NE(text.find("Failed    : 0"), std::string::npos);
    EXPECT_NE(text.find("2.00 requests/s"), std::string::npos);
    EXPECT_EQ(text.find("Skipped"), std::string::npos);
    EXPECT_EQ(text.find("Errors ("), std::string::npos);
}

TEST(RunReportTest, Render_RateUnavailable) {
    auto report = summarize(0, 0, 0, {}, std::chrono::steady_clock::duration::zero());
    EXPECT_NE(renderReport(report).find("Rate      : unavailable"), std::string::npos);
}

TEST(RunReportTest, Render_ErrorBlocks) {
    auto report = summarize(2, 1, 1,
                            {makeError("id-9", ErrorStage::SUBMISSION, "  denied\r\n\r\n by policy \n")},
                            1s);
    std::string text = renderReport(report);

    EXPECT_NE(text.find("Errors (1)"), std::string::npos);
    EXPECT_NE(text.find("[2026-02-02T12:34:56.000Z] id-9 (Submission)"), std::string::npos);
    EXPECT_NE(text.find("    denied\n    by policy\n"), std::string::npos);
}

TEST(RunReportTest, Render_SkippedOnlyWhenPresent) {
    auto report = summarize(3, 0, 0, {}, std::chrono::steady_clock::duration::zero());
    EXPECT_NE(renderReport(report).find("Skipped   : 3"), std::string::npos);
}

// ============================================================================
// JSON
// ============================================================================

TEST(RunReportTest, Json_Fields) {
    auto report = summarize(3, 2, 1, {makeError("c", ErrorStage::GENERATION, " bad \n")}, 500ms);
    Json::Value json = reportToJson(report);

    EXPECT_EQ(json["totalRequested"].asUInt64(), 3u);
    EXPECT_EQ(json["generated"].asUInt64(), 2u);
    EXPECT_EQ(json["submitted"].asUInt64(), 1u);
    EXPECT_EQ(json["failed"].asUInt64(), 1u);
    EXPECT_EQ(json["skipped"].asUInt64(), 1u);
    EXPECT_DOUBLE_EQ(json["rate"].asDouble(), 2.0);
    ASSERT_EQ(json["errors"].size(), 1u);
    EXPECT_EQ(json["errors"][0]["subjectId"].asString(), "c");
    EXPECT_EQ(json["errors"][0]["stage"].asString(), "Generation");
    EXPECT_EQ(json["errors"][0]["message"].asString(), "bad");
}

TEST(RunReportTest, Json_NullRate) {
    auto report = summarize(0, 0, 0, {}, std::chrono::steady_clock::duration::zero());
    EXPECT_TRUE(reportToJson(report)["rate"].isNull());
}

TEST(RunReportTest, Json_WriteAndParseBack) {
    test_helpers::TempDir dir;
    auto path = dir.path() / "report.json";
    writeJsonReport(summarize(1, 1, 1, {}, 1s), path);

    Json::CharReaderBuilder reader;
    Json::Value parsed;
    std::string errs;
    std::istringstream in(test_helpers::readFile(path));
    ASSERT_TRUE(Json::parseFromStream(reader, in, &parsed, &errs)) << errs;
    EXPECT_EQ(parsed["submitted"].asUInt64(), 1u);
}

TEST(RunReportTest, Json_UnwritablePath_Throws) {
    test_helpers::TempDir dir;
    EXPECT_THROW(writeJsonReport(summarize(0, 0, 0, {}, 1s), dir.path() / "missing" / "r.json"),
                 caload::common::UnexpectedError);
}
