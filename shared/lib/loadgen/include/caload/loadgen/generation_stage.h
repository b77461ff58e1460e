/**
 * @file generation_stage.h
 * @brief Phase 1: create one request blob per spec
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

struct GenerationResult {
    std::vector<RequestRecord> generated;   ///< Records in state GENERATED, unordered
    std::vector<ErrorRecord> errors;        ///< One per failed spec
    size_t skipped = 0;                     ///< Specs never dispatched (cancelled)
    std::chrono::steady_clock::duration elapsed{};
};

/**
 * @brief Drives EnrollmentClient::create() over all specs on a worker pool
 *
 * Each spec is independent: a failure is recorded and never prevents the
 * remaining specs from being attempted. Counts and the error set do not
 * depend on the number of workers.
 */
class GenerationStage {
public:
    GenerationStage(EnrollmentClient& client, size_t workers, CancellationToken cancel = {});

    GenerationResult run(const std::vector<RequestSpec>& specs);

private:
    std::optional<RequestRecord> generateOne(const RequestSpec& spec, ErrorCollector& errors);

    EnrollmentClient& client_;
    size_t workers_;
    CancellationToken cancel_;
};

} // namespace caload::loadgen
