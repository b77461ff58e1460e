/**
 * @file generation_stage.cpp
 * @brief GenerationStage implementation
 */

#include "caload/loadgen/generation_stage.h"
#include "caload/loadgen/worker_pool.h"
#include "exceptions.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <spdlog/spdlog.h>

namespace caload::loadgen {

GenerationStage::GenerationStage(EnrollmentClient& client, size_t workers, CancellationToken cancel)
    : client_(client), workers_(std::max<size_t>(workers, 1)), cancel_(std::move(cancel)) {}

GenerationResult GenerationStage::run(const std::vector<RequestSpec>& specs) {
    const auto start = std::chrono::steady_clock::now();
    GenerationResult result;

    if (specs.empty()) {
        result.elapsed = std::chrono::steady_clock::now() - start;
        return result;
    }

    ErrorCollector errors;
    std::mutex generatedMutex;
    std::atomic<size_t> skipped{0};

    {
        WorkerPool pool(std::min(workers_, specs.size()), "generation");

        for (const auto& spec : specs) {
            pool.submit([this, &spec, &errors, &generatedMutex, &skipped, &result]() {
                if (cancel_.isCancelled()) {
                    skipped.fetch_add(1);
                    return;
                }

                auto record = generateOne(spec, errors);
                if (record) {
                    std::lock_guard<std::mutex> lock(generatedMutex);
                    result.generated.push_back(std::move(*record));
                }
            });
        }

        pool.waitIdle();
    }

    result.errors = errors.snapshot();
    result.skipped = skipped.load();
    result.elapsed = std::chrono::steady_clock::now() - start;

    spdlog::info("Generation finished: {} generated, {} failed, {} skipped",
                 result.generated.size(), result.errors.size(), result.skipped);
    return result;
}

std::optional<RequestRecord> GenerationStage::generateOne(const RequestSpec& spec, ErrorCollector& errors) {
    RequestRecord record{spec.id, spec.commonName, spec.templateName, RequestStage::CREATED, std::nullopt};

    try {
        RequestArtifact artifact = client_.create(spec);
        record.artifactPath = artifact.requestPath;
        record.stage = RequestStage::GENERATED;
        return record;
    } catch (const common::CreationError& e) {
        spdlog::warn("Request {} generation failed: {}", spec.id, e.what());
        errors.record(spec.id, ErrorStage::GENERATION, e.what());
    } catch (const std::exception& e) {
        spdlog::warn("Request {} generation fault: {}", spec.id, e.what());
        errors.record(spec.id, ErrorStage::UNEXPECTED, e.what());
    } catch (...) {
        spdlog::warn("Request {} generation fault: unknown exception", spec.id);
        errors.record(spec.id, ErrorStage::UNEXPECTED, "unknown exception during request creation");
    }

    return std::nullopt;
}

} // namespace caload::loadgen
