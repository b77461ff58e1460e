/**
 * @file types.h
 * @brief Common types for the CA load generator
 *
 * Request descriptors, per-item records and error records shared by the
 * generation and submission stages.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace caload::loadgen {

/// @brief Key usage bit for digitalSignature (certreq INF encoding)
constexpr unsigned int KEY_USAGE_DIGITAL_SIGNATURE = 0x80;

/// @brief Prefix of every generated common name
constexpr const char* COMMON_NAME_PREFIX = "LoadTestCert-";

/// @brief Logical content of one enrollment request
struct RequestSpec {
    std::string id;             ///< Unique subject id (UUID)
    std::string commonName;     ///< LoadTestCert-<id>
    std::string subject;        ///< CN=LoadTestCert-<id>
    int keyLength = 2048;
    std::string hashAlgorithm = "sha256";
    unsigned int keyUsage = KEY_USAGE_DIGITAL_SIGNATURE;
    std::string templateName;
};

/// @brief Lifecycle of one request; transitions only move forward
enum class RequestStage {
    CREATED,
    GENERATED,
    SUBMITTED,
    FAILED
};

/// @brief One request as it moves through the run
struct RequestRecord {
    std::string id;
    std::string commonName;
    std::string templateName;
    RequestStage stage = RequestStage::CREATED;
    std::optional<std::filesystem::path> artifactPath;  ///< Request blob once generated
};

/// @brief Which part of the run produced an error
enum class ErrorStage {
    GENERATION,
    SUBMISSION,
    UNEXPECTED
};

/// @brief Append-only failure record for one request
struct ErrorRecord {
    std::string subjectId;
    ErrorStage stage = ErrorStage::UNEXPECTED;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
};

/// @brief Successful issuance
struct IssuedCertificate {
    std::string subjectId;
    std::string caRequestId;    ///< Empty when the tool output carried no request id
    std::optional<std::filesystem::path> certificateBlob;
};

/// @brief Named CA reachable at a given server
struct CaTarget {
    std::string server;
    std::string name;

    /// certreq -config form: "server\name"
    std::string configString() const { return server + "\\" + name; }
};

/// @brief Convert RequestStage to string
inline std::string requestStageToString(RequestStage s) {
    switch (s) {
        case RequestStage::CREATED:   return "Created";
        case RequestStage::GENERATED: return "Generated";
        case RequestStage::SUBMITTED: return "Submitted";
        case RequestStage::FAILED:    return "Failed";
        default:                      return "Unknown";
    }
}

/// @brief Convert ErrorStage to string
inline std::string errorStageToString(ErrorStage s) {
    switch (s) {
        case ErrorStage::GENERATION: return "Generation";
        case ErrorStage::SUBMISSION: return "Submission";
        case ErrorStage::UNEXPECTED: return "Unexpected";
        default:                     return "Unknown";
    }
}

} // namespace caload::loadgen
