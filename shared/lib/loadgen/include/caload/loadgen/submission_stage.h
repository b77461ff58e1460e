/**
 * @file submission_stage.h
 * @brief Phase 2: submit every generated request to the CA
 */

#pragma once

#include "caload/loadgen/cancellation.h"
#include "caload/loadgen/enrollment_client.h"
#include "caload/loadgen/error_collector.h"
#include "caload/loadgen/types.h"

#include <chrono>
#include <optional>
#include <vector>

namespace caload::loadgen {

struct SubmissionResult {
    std::vector<IssuedCertificate> issued;
    std::vector<RequestRecord> records;     ///< Dispatched records in SUBMITTED or FAILED state
    std::vector<ErrorRecord> errors;
    size_t skipped = 0;
    std::chrono::steady_clock::duration elapsed{};  ///< Measured from entry to run()
};

/**
 * @brief Drives EnrollmentClient::submit() over generated records
 *
 * Concurrency against the CA is bounded by the worker count; extra records
 * wait in the pool queue. A response without a parsable CA request id is
 * still a successful issuance (empty caRequestId, no error).
 */
class SubmissionStage {
public:
    SubmissionStage(EnrollmentClient& client, CaTarget target, size_t workers,
                    CancellationToken cancel = {});

    SubmissionResult run(const std::vector<RequestRecord>& records);

private:
    std::optional<IssuedCertificate> submitOne(const RequestRecord& record, ErrorCollector& errors);

    EnrollmentClient& client_;
    CaTarget target_;
    size_t workers_;
    CancellationToken cancel_;
};

} // namespace caload::loadgen
