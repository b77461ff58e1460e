/**
 * @file load_test_runner.h
 * @brief Orchestrates one load test: setup, generation, submission, report
 */

#pragma once

#include "caload/loadgen/cancellation.h"
#include "caload/loadgen/enrollment_client.h"
#include "caload/loadgen/load_test_config.h"
#include "caload/loadgen/run_report.h"
#include "caload/loadgen/types.h"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace caload::loadgen {

struct RunOutcome {
    RunReport report;
    std::vector<IssuedCertificate> issued;
};

class LoadTestRunner {
public:
    using IdGenerator = std::function<std::string()>;

    /**
     * @param config Validated run settings
     * @param client Enrollment backend shared by both stages
     * @param cancel Stops dispatch of new items when cancelled
     * @param idGenerator Source of subject ids (UUIDv4 by default)
     */
    LoadTestRunner(LoadTestConfig config, EnrollmentClient& client,
                   CancellationToken cancel = {}, IdGenerator idGenerator = {});

    /**
     * @brief Create the artifact directory (and parents)
     * @throws common::SetupException if it cannot be created
     */
    static void prepareOutputDirectory(const std::filesystem::path& path);

    /**
     * @brief One spec per requested item, each with a fresh id
     * @throws common::SetupException if the id source keeps repeating itself
     */
    std::vector<RequestSpec> buildSpecs() const;

    /**
     * @brief Run both phases with a barrier between them
     *
     * Item failures are part of the report; only setup failures throw.
     *
     * @throws common::SetupException also when the run machinery itself
     *         fails (id source, worker threads)
     */
    RunOutcome run();

private:
    LoadTestConfig config_;
    EnrollmentClient& client_;
    CancellationToken cancel_;
    IdGenerator idGenerator_;
};

} // namespace caload::loadgen
