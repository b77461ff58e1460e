/**
 * @file test_submission_stage.cpp
 * @brief Unit tests for the CA submission phase
 */

#include <gtest/gtest.h>
#include <caload/loadgen/submission_stage.h>
#include "test_helpers.h"

#include <algorithm>

using namespace caload::loadgen;
using namespace test_helpers;

class SubmissionStageTest : public ::testing::Test {
protected:
    FakeEnrollmentClient client_;
    CaTarget target_{"ca01.corp.example", "Corp Issuing CA"};

    static std::vector<RequestRecord> makeRecords(int count) {
        std::vector<RequestRecord> records;
        for (int i = 1; i <= count; ++i) {
            std::string id = "id-" + std::to_string(i);
            records.push_back(RequestRecord{id, "LoadTestCert-" + id, "WebServer",
                                            RequestStage::GENERATED, "/fake/" + id + ".req"});
        }
        return records;
    }

    static const RequestRecord* findRecord(const SubmissionResult& result, const std::string& id) {
        auto it = std::find_if(result.records.begin(), result.records.end(),
                               [&id](const RequestRecord& r) { return r.id == id; });
        return it == result.records.end() ? nullptr : &*it;
    }
};

TEST_F(SubmissionStageTest, AllIssued) {
    SubmissionStage stage(client_, target_, 4);
    auto result = stage.run(makeRecords(5));

    EXPECT_EQ(result.issued.size(), 5u);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.records.size(), 5u);
    for (const auto& issued : result.issued) {
        EXPECT_EQ(issued.caRequestId, "42");
    }
    for (const auto& record : result.records) {
        EXPECT_EQ(record.stage, RequestStage::SUBMITTED);
    }
}

TEST_F(SubmissionStageTest, PassesTargetAndTemplate) {
    SubmissionStage stage(client_, target_, 1);
    stage.run(makeRecords(1));

    EXPECT_EQ(client_.lastTarget(), "ca01.corp.example\\Corp Issuing CA");
    EXPECT_EQ(client_.lastTemplate(), "WebServer");
}

TEST_F(SubmissionStageTest, RejectionIsIsolated) {
    client_.failSubmit = {"id-2"};
    SubmissionStage stage(client_, target_, 2);
    auto result = stage.run(makeRecords(4));

    EXPECT_EQ(result.issued.size(), 3u);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].subjectId, "id-2");
    EXPECT_EQ(result.errors[0].stage, ErrorStage::SUBMISSION);
    EXPECT_NE(result.errors[0].message.find("denied by policy module"), std::string::npos);

    const RequestRecord* failed = findRecord(result, "id-2");
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->stage, RequestStage::FAILED);
}

TEST_F(SubmissionStageTest, MissingRequestIdStillCountsAsIssued) {
    client_.submitOutput = "Certificate retrieved(Issued) Issued\r\n";
    SubmissionStage stage(client_, target_, 2);
    auto result = stage.run(makeRecords(3));

    ASSERT_EQ(result.issued.size(), 3u);
    EXPECT_TRUE(result.errors.empty());
    for (const auto& issued : result.issued) {
        EXPECT_TRUE(issued.caRequestId.empty());
    }
}

TEST_F(SubmissionStageTest, RecordWithoutArtifactIsUnexpected) {
    auto records = makeRecords(2);
    records[1].artifactPath.reset();
    SubmissionStage stage(client_, target_, 2);
    auto result = stage.run(records);

    EXPECT_EQ(result.issued.size(), 1u);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].subjectId, "id-2");
    EXPECT_EQ(result.errors[0].stage, ErrorStage::UNEXPECTED);
    EXPECT_EQ(client_.submitted().size(), 1u);
}

TEST_F(SubmissionStageTest, EmptyInput) {
    SubmissionStage stage(client_, target_, 4);
    auto result = stage.run({});

    EXPECT_TRUE(result.issued.empty());
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(client_.submitted().empty());
}

TEST_F(SubmissionStageTest, ConcurrencyBoundedByWorkers) {
    client_.callDelay = std::chrono::milliseconds(10);
    SubmissionStage stage(client_, target_, 2);
    auto result = stage.run(makeRecords(10));

    EXPECT_EQ(result.issued.size(), 10u);
    EXPECT_LE(client_.peakConcurrency(), 2u);
}

TEST_F(SubmissionStageTest, ElapsedCoversCalls) {
    client_.callDelay = std::chrono::milliseconds(20);
    SubmissionStage stage(client_, target_, 1);
    auto result = stage.run(makeRecords(2));

    EXPECT_GE(result.elapsed, std::chrono::milliseconds(40));
}

TEST_F(SubmissionStageTest, CancelledBeforeDispatch_SkipsEverything) {
    CancellationSource source;
    source.cancel();
    SubmissionStage stage(client_, target_, 2, source.token());
    auto result = stage.run(makeRecords(3));

    EXPECT_EQ(result.skipped, 3u);
    EXPECT_TRUE(result.issued.empty());
    EXPECT_TRUE(result.records.empty());
    EXPECT_TRUE(client_.submitted().empty());
}
