/**
 * @file load_test_runner.cpp
 * @brief LoadTestRunner implementation
 */

#include "caload/loadgen/load_test_runner.h"
#include "caload/loadgen/generation_stage.h"
#include "caload/loadgen/request_spec_builder.h"
#include "caload/loadgen/submission_stage.h"
#include "caload/utils/uuid_util.h"
#include "exceptions.h"

#include <chrono>
#include <system_error>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace caload::loadgen {

namespace {
constexpr int MAX_ID_ATTEMPTS = 8;
}

LoadTestRunner::LoadTestRunner(LoadTestConfig config, EnrollmentClient& client,
                               CancellationToken cancel, IdGenerator idGenerator)
    : config_(std::move(config)),
      client_(client),
      cancel_(std::move(cancel)),
      idGenerator_(idGenerator ? std::move(idGenerator) : IdGenerator(&utils::UuidUtil::generate)) {}

void LoadTestRunner::prepareOutputDirectory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        throw common::SetupException("cannot create output directory " + path.string() +
                                     ": " + ec.message());
    }
    if (!std::filesystem::is_directory(path, ec)) {
        throw common::SetupException("output path is not a directory: " + path.string());
    }
}

std::vector<RequestSpec> LoadTestRunner::buildSpecs() const {
    std::vector<RequestSpec> specs;
    if (config_.requestCount <= 0) {
        return specs;
    }
    specs.reserve(static_cast<size_t>(config_.requestCount));

    std::unordered_set<std::string> seen;
    for (int i = 0; i < config_.requestCount; ++i) {
        std::string id;
        int attempts = 0;
        do {
            if (++attempts > MAX_ID_ATTEMPTS) {
                throw common::SetupException("id generator produced " + std::to_string(MAX_ID_ATTEMPTS) +
                                             " duplicate ids in a row");
            }
            id = idGenerator_();
        } while (id.empty() || !seen.insert(id).second);

        specs.push_back(buildRequestSpec(config_.templateName, id));
    }
    return specs;
}

RunOutcome LoadTestRunner::run() {
    const auto start = std::chrono::steady_clock::now();

    prepareOutputDirectory(config_.outputDir);

    spdlog::info("Load test: {} request(s) against {} (template {}), workers {}/{}",
                 config_.requestCount, config_.target.configString(), config_.templateName,
                 config_.generationWorkers, config_.submissionWorkers);

    std::vector<RequestSpec> specs;
    GenerationResult generated;
    SubmissionResult submitted;
    try {
        specs = buildSpecs();

        GenerationStage generation(client_, static_cast<size_t>(config_.generationWorkers), cancel_);
        generated = generation.run(specs);

        // Barrier: submission starts only after every creation call has returned
        SubmissionStage submission(client_, config_.target,
                                   static_cast<size_t>(config_.submissionWorkers), cancel_);
        submitted = submission.run(generated.generated);
    } catch (const common::SetupException&) {
        throw;
    } catch (const std::exception& e) {
        // Item faults are recorded by the stages; this is the id source or the pools
        throw common::SetupException(std::string("run aborted: ") + e.what());
    }

    std::vector<ErrorRecord> errors = generated.errors;
    errors.insert(errors.end(), submitted.errors.begin(), submitted.errors.end());

    RunOutcome outcome;
    outcome.report = summarize(specs.size(), generated.generated.size(), submitted.issued.size(),
                               errors, submitted.elapsed);
    outcome.report.generationElapsed = generated.elapsed;
    outcome.report.totalElapsed = std::chrono::steady_clock::now() - start;
    outcome.issued = std::move(submitted.issued);

    if (cancel_.isCancelled()) {
        spdlog::warn("Run cancelled: {} request(s) skipped", outcome.report.skipped);
    }
    spdlog::info("Load test finished: {} submitted, {} failed",
                 outcome.report.submitted, outcome.report.failed);
    return outcome;
}

} // namespace caload::loadgen
