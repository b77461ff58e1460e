/**
 * @file test_certreq_client.cpp
 * @brief Tests for the certreq-backed client against a scripted certreq stand-in
 */

#include <gtest/gtest.h>
#include <caload/loadgen/cancellation.h>
#include <caload/loadgen/certreq_client.h>
#include <caload/loadgen/generation_stage.h>
#include <caload/loadgen/request_spec_builder.h>
#include <caload/utils/string_utils.h>
#include "test_helpers.h"

#include <chrono>
#include <thread>

using namespace caload::loadgen;
using namespace test_helpers;

namespace {

// Arguments: -new -q <inf> <req>  |  -submit -q -config <cfg> -attrib <attr> <req> <cer>
const char* const WELL_BEHAVED_CERTREQ = R"(#!/bin/sh
case "$1" in
  -new)
    test -f "$3" || exit 3
    cp "$3" "$4.descriptor"
    echo "CertReq: Request Created"
    printf 'REQ' > "$4"
    ;;
  -submit)
    printf '%s\n' "$@" > "$7.args"
    printf 'CERT' > "$8"
    echo 'RequestId: 314'
    echo 'RequestId: "314"'
    echo 'Certificate retrieved(Issued) Issued'
    ;;
  *)
    exit 64
    ;;
esac
)";

const char* const FAILING_CERTREQ = R"(#!/bin/sh
echo "Template WebServer not found" >&2
exit 1
)";

const char* const SILENT_CERTREQ = R"(#!/bin/sh
exit 0
)";

const char* const SLOW_CERTREQ = R"(#!/bin/sh
sleep 1
printf 'REQ' > "$4"
)";

const char* const HANGING_CERTREQ = R"(#!/bin/sh
exec sleep 30
)";

} // anonymous namespace

class CertreqClientTest : public ::testing::Test {
protected:
    TempDir dir_;
    RequestSpec spec_ = buildRequestSpec("WebServer", "c0ffee00-1111-4222-8333-444455556666");
    CaTarget target_{"ca01.corp.example", "Corp Issuing CA"};

    fs::path installScript(const char* body) {
        fs::path script = dir_.path() / "certreq";
        writeFile(script, body);
        fs::permissions(script, fs::perms::owner_all, fs::perm_options::replace);
        return script;
    }

    CertreqClient makeClient(const char* body, int timeoutSeconds = 0) {
        CertreqClientOptions options;
        options.certreqPath = installScript(body).string();
        options.outputDir = dir_.path();
        options.callTimeoutSeconds = timeoutSeconds;
        return CertreqClient(options);
    }
};

// ============================================================================
// Backend names
// ============================================================================

TEST(RequestBackendTest, ParseNames) {
    EXPECT_EQ(parseRequestBackend("certreq"), RequestBackend::CERTREQ);
    EXPECT_EQ(parseRequestBackend(" OpenSSL "), RequestBackend::OPENSSL);
    EXPECT_FALSE(parseRequestBackend("xenroll").has_value());
    EXPECT_EQ(requestBackendToString(RequestBackend::OPENSSL), "openssl");
}

// ============================================================================
// create()
// ============================================================================

TEST_F(CertreqClientTest, Create_WritesRequestAndRemovesDescriptor) {
    auto client = makeClient(WELL_BEHAVED_CERTREQ);
    RequestArtifact artifact = client.create(spec_);

    EXPECT_EQ(artifact.subjectId, spec_.id);
    EXPECT_EQ(artifact.requestPath.string(), client.requestPath(spec_.id).string());
    EXPECT_EQ(readFile(artifact.requestPath), "REQ");
    EXPECT_FALSE(fs::exists(client.descriptorPath(spec_.id)));

    // certreq saw the rendered descriptor
    EXPECT_EQ(readFile(artifact.requestPath.string() + ".descriptor"), renderInfDescriptor(spec_));
}

TEST_F(CertreqClientTest, Create_NonZeroExit_ThrowsCreationError) {
    auto client = makeClient(FAILING_CERTREQ);
    try {
        client.create(spec_);
        FAIL() << "expected CreationError";
    } catch (const caload::common::CreationError& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("exited with status 1"), std::string::npos) << what;
        EXPECT_NE(what.find("Template WebServer not found"), std::string::npos) << what;
    }
    EXPECT_FALSE(fs::exists(client.descriptorPath(spec_.id)));
}

TEST_F(CertreqClientTest, Create_NoRequestFile_ThrowsCreationError) {
    auto client = makeClient(SILENT_CERTREQ);
    EXPECT_THROW(client.create(spec_), caload::common::CreationError);
    EXPECT_FALSE(fs::exists(client.descriptorPath(spec_.id)));
}

TEST_F(CertreqClientTest, Create_MissingTool_ThrowsCreationError) {
    CertreqClientOptions options;
    options.certreqPath = (dir_.path() / "no-such-certreq").string();
    options.outputDir = dir_.path();
    CertreqClient client(options);

    // The shell reports 127 for a command it cannot find
    EXPECT_THROW(client.create(spec_), caload::common::CreationError);
    EXPECT_FALSE(fs::exists(client.descriptorPath(spec_.id)));
}

TEST_F(CertreqClientTest, Create_Timeout) {
    auto client = makeClient(HANGING_CERTREQ, 1);
    try {
        client.create(spec_);
        FAIL() << "expected CreationError";
    } catch (const caload::common::CreationError& e) {
        EXPECT_NE(std::string(e.what()).find("timed out after 1 s"), std::string::npos) << e.what();
    }
}

TEST_F(CertreqClientTest, Create_OpensslBackend) {
    CertreqClientOptions options;
    options.outputDir = dir_.path();
    options.backend = RequestBackend::OPENSSL;
    CertreqClient client(options);

    RequestArtifact artifact = client.create(spec_);
    EXPECT_EQ(readFile(artifact.requestPath).rfind("-----BEGIN CERTIFICATE REQUEST-----", 0), 0u);
    EXPECT_FALSE(fs::exists(client.descriptorPath(spec_.id)));
}

TEST_F(CertreqClientTest, Create_UnwritableOutputDir_ThrowsUnexpectedError) {
    CertreqClientOptions options;
    options.certreqPath = installScript(WELL_BEHAVED_CERTREQ).string();
    options.outputDir = dir_.path() / "missing";
    CertreqClient client(options);

    EXPECT_THROW(client.create(spec_), caload::common::UnexpectedError);
}

// ============================================================================
// submit()
// ============================================================================

TEST_F(CertreqClientTest, Submit_ReturnsOutputAndCertificate) {
    auto client = makeClient(WELL_BEHAVED_CERTREQ);
    RequestArtifact artifact = client.create(spec_);

    SubmissionResponse response = client.submit(artifact, target_, "WebServer");
    EXPECT_NE(response.output.find("RequestId: 314"), std::string::npos);
    ASSERT_TRUE(response.certificatePath.has_value());
    EXPECT_EQ(response.certificatePath->string(), client.certificatePath(spec_.id).string());
    EXPECT_EQ(readFile(*response.certificatePath), "CERT");
}

TEST_F(CertreqClientTest, Submit_PassesConfigAndTemplateAsSingleArguments) {
    auto client = makeClient(WELL_BEHAVED_CERTREQ);
    RequestArtifact artifact = client.create(spec_);
    client.submit(artifact, target_, "WebServer");

    auto args = caload::utils::nonEmptyLines(readFile(artifact.requestPath.string() + ".args"));
    ASSERT_EQ(args.size(), 8u);
    EXPECT_EQ(args[0], "-submit");
    EXPECT_EQ(args[2], "-config");
    EXPECT_EQ(args[3], "ca01.corp.example\\Corp Issuing CA");
    EXPECT_EQ(args[4], "-attrib");
    EXPECT_EQ(args[5], "CertificateTemplate:WebServer");
}

TEST_F(CertreqClientTest, Submit_NonZeroExit_ThrowsSubmissionError) {
    auto client = makeClient(FAILING_CERTREQ);
    RequestArtifact artifact{spec_.id, dir_.path() / (spec_.id + ".req")};
    writeFile(artifact.requestPath, "REQ");

    EXPECT_THROW(client.submit(artifact, target_, "WebServer"), caload::common::SubmissionError);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(CertreqClientTest, CancelMidFlight_InFlightCallsComplete) {
    auto client = makeClient(SLOW_CERTREQ);

    std::vector<RequestSpec> specs;
    for (int i = 0; i < 8; ++i) {
        specs.push_back(buildRequestSpec("WebServer", "inflight-" + std::to_string(i)));
    }

    CancellationSource source;
    std::thread canceller([&source]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        source.cancel();
    });

    GenerationStage stage(client, 4, source.token());
    GenerationResult result = stage.run(specs);
    canceller.join();

    // The first four were already running when the run was cancelled
    EXPECT_EQ(result.generated.size(), 4u);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.skipped, 4u);
    for (const auto& record : result.generated) {
        ASSERT_TRUE(record.artifactPath.has_value());
        EXPECT_EQ(readFile(*record.artifactPath), "REQ");
    }
}
