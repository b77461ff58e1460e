/**
 * @file certreq_client.h
 * @brief EnrollmentClient backed by the certreq command-line utility
 *
 * create(): writes an ephemeral INF descriptor and runs `certreq -new`,
 *           or builds the request natively with OpenSSL.
 * submit(): runs `certreq -submit` against "<server>\<ca name>".
 *
 * Artifact names derive from the subject id, so concurrent workers never
 * share a path:
 *   <outputDir>/<id>.inf  (removed before create() returns)
 *   <outputDir>/<id>.req
 *   <outputDir>/<id>.cer
 */

#pragma once

#include "caload/loadgen/enrollment_client.h"

#include <filesystem>
#include <optional>
#include <string>

namespace caload::loadgen {

/// @brief How request blobs are produced
enum class RequestBackend {
    CERTREQ,    ///< certreq -new with an INF descriptor
    OPENSSL     ///< native PKCS#10 generation
};

std::string requestBackendToString(RequestBackend backend);

/// @brief Parse "certreq" / "openssl" (case-insensitive)
std::optional<RequestBackend> parseRequestBackend(const std::string& value);

struct CertreqClientOptions {
    std::string certreqPath = "certreq";
    std::filesystem::path outputDir;
    RequestBackend backend = RequestBackend::CERTREQ;
    int callTimeoutSeconds = 0;     ///< 0 disables the per-call timeout
};

class CertreqClient : public EnrollmentClient {
public:
    explicit CertreqClient(CertreqClientOptions options);

    RequestArtifact create(const RequestSpec& spec) override;

    SubmissionResponse submit(const RequestArtifact& artifact,
                              const CaTarget& target,
                              const std::string& templateName) override;

    std::filesystem::path descriptorPath(const std::string& id) const;
    std::filesystem::path requestPath(const std::string& id) const;
    std::filesystem::path certificatePath(const std::string& id) const;

private:
    RequestArtifact createWithCertreq(const RequestSpec& spec);
    RequestArtifact createWithOpenssl(const RequestSpec& spec);

    std::string describeFailure(const std::string& step, int exitCode, bool timedOut,
                                const std::string& output) const;

    CertreqClientOptions options_;
};

} // namespace caload::loadgen
