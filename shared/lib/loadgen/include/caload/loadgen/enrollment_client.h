/**
 * @file enrollment_client.h
 * @brief Seam to the external enrollment utility
 *
 * The load generator never parses PKI wire formats itself; request creation
 * and CA submission are delegated to an implementation of this interface.
 * Implementations must be safe to call from several worker threads at once.
 */

#pragma once

#include "caload/loadgen/types.h"

#include <filesystem>
#include <optional>
#include <string>

namespace caload::loadgen {

/// @brief Opaque reference to a generated request blob
struct RequestArtifact {
    std::string subjectId;
    std::filesystem::path requestPath;
};

/// @brief Raw result of a successful submission
struct SubmissionResponse {
    std::string output;                                     ///< Tool response text
    std::optional<std::filesystem::path> certificatePath;   ///< Issued certificate, when written
};

class EnrollmentClient {
public:
    virtual ~EnrollmentClient() = default;

    /**
     * @brief Create a PKCS#10 request blob for a spec
     * @throws common::CreationError when the tool reports failure
     * @throws common::UnexpectedError on local faults (filesystem, process spawn)
     */
    virtual RequestArtifact create(const RequestSpec& spec) = 0;

    /**
     * @brief Submit a request blob to a CA
     * @throws common::SubmissionError when the CA rejects or cannot be reached
     * @throws common::UnexpectedError on local faults
     */
    virtual SubmissionResponse submit(const RequestArtifact& artifact,
                                      const CaTarget& target,
                                      const std::string& templateName) = 0;
};

} // namespace caload::loadgen
