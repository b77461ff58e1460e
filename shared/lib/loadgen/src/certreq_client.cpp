/**
 * @file certreq_client.cpp
 * @brief certreq process invocation for request creation and submission
 */

#include "caload/loadgen/certreq_client.h"
#include "caload/loadgen/openssl_request_builder.h"
#include "caload/loadgen/process_runner.h"
#include "caload/loadgen/request_spec_builder.h"
#include "caload/utils/string_utils.h"
#include "exceptions.h"

#include <fstream>
#include <system_error>
#include <vector>
#include <spdlog/spdlog.h>

namespace caload::loadgen {

namespace {

/**
 * @brief Removes the file it guards when it goes out of scope
 */
class ScopedFile {
public:
    explicit ScopedFile(std::filesystem::path path) : path_(std::move(path)) {}

    ~ScopedFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if (ec) {
            spdlog::warn("Failed to remove {}: {}", path_.string(), ec.message());
        }
    }

    ScopedFile(const ScopedFile&) = delete;
    ScopedFile& operator=(const ScopedFile&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

void writeTextFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw common::UnexpectedError("cannot open " + path.string() + " for writing");
    }
    file << content;
    file.close();
    if (!file) {
        throw common::UnexpectedError("failed writing " + path.string());
    }
}

} // anonymous namespace

std::string requestBackendToString(RequestBackend backend) {
    switch (backend) {
        case RequestBackend::CERTREQ: return "certreq";
        case RequestBackend::OPENSSL: return "openssl";
        default:                      return "unknown";
    }
}

std::optional<RequestBackend> parseRequestBackend(const std::string& value) {
    std::string lower = utils::toLower(utils::trim(value));
    if (lower == "certreq") return RequestBackend::CERTREQ;
    if (lower == "openssl") return RequestBackend::OPENSSL;
    return std::nullopt;
}

CertreqClient::CertreqClient(CertreqClientOptions options)
    : options_(std::move(options)) {}

std::filesystem::path CertreqClient::descriptorPath(const std::string& id) const {
    return options_.outputDir / (id + ".inf");
}

std::filesystem::path CertreqClient::requestPath(const std::string& id) const {
    return options_.outputDir / (id + ".req");
}

std::filesystem::path CertreqClient::certificatePath(const std::string& id) const {
    return options_.outputDir / (id + ".cer");
}

RequestArtifact CertreqClient::create(const RequestSpec& spec) {
    if (options_.backend == RequestBackend::OPENSSL) {
        return createWithOpenssl(spec);
    }
    return createWithCertreq(spec);
}

RequestArtifact CertreqClient::createWithCertreq(const RequestSpec& spec) {
    ScopedFile descriptor(descriptorPath(spec.id));
    const auto reqPath = requestPath(spec.id);

    writeTextFile(descriptor.path(), renderInfDescriptor(spec));

    ProcessResult result = runProcess(
        {options_.certreqPath, "-new", "-q", descriptor.path().string(), reqPath.string()},
        options_.callTimeoutSeconds);

    if (result.exitCode != 0) {
        throw common::CreationError(
            describeFailure("certreq -new", result.exitCode, result.timedOut, result.output));
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(reqPath, ec)) {
        throw common::CreationError("certreq -new reported success but wrote no request file: " +
                                    utils::trim(result.output));
    }

    spdlog::debug("Generated request {} -> {}", spec.id, reqPath.string());
    return RequestArtifact{spec.id, reqPath};
}

RequestArtifact CertreqClient::createWithOpenssl(const RequestSpec& spec) {
    const auto reqPath = requestPath(spec.id);
    writeTextFile(reqPath, buildPkcs10Pem(spec));

    spdlog::debug("Generated request {} natively -> {}", spec.id, reqPath.string());
    return RequestArtifact{spec.id, reqPath};
}

SubmissionResponse CertreqClient::submit(const RequestArtifact& artifact,
                                         const CaTarget& target,
                                         const std::string& templateName) {
    const auto certPath = certificatePath(artifact.subjectId);

    ProcessResult result = runProcess(
        {options_.certreqPath, "-submit", "-q",
         "-config", target.configString(),
         "-attrib", "CertificateTemplate:" + templateName,
         artifact.requestPath.string(), certPath.string()},
        options_.callTimeoutSeconds);

    if (result.exitCode != 0) {
        throw common::SubmissionError(
            describeFailure("certreq -submit", result.exitCode, result.timedOut, result.output));
    }

    SubmissionResponse response;
    response.output = result.output;

    std::error_code ec;
    if (std::filesystem::is_regular_file(certPath, ec)) {
        response.certificatePath = certPath;
    }
    return response;
}

std::string CertreqClient::describeFailure(const std::string& step, int exitCode, bool timedOut,
                                           const std::string& output) const {
    if (timedOut) {
        return step + " timed out after " + std::to_string(options_.callTimeoutSeconds) + " s";
    }
    std::string message = step + " exited with status " + std::to_string(exitCode);
    std::string detail = utils::trim(output);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

} // namespace caload::loadgen
