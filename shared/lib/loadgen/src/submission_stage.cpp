/**
 * @file submission_stage.cpp
 * @brief SubmissionStage implementation
 */

#include "caload/loadgen/submission_stage.h"
#include "caload/loadgen/request_id_parser.h"
#include "caload/loadgen/worker_pool.h"
#include "exceptions.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <spdlog/spdlog.h>

namespace caload::loadgen {

SubmissionStage::SubmissionStage(EnrollmentClient& client, CaTarget target, size_t workers,
                                 CancellationToken cancel)
    : client_(client),
      target_(std::move(target)),
      workers_(std::max<size_t>(workers, 1)),
      cancel_(std::move(cancel)) {}

SubmissionResult SubmissionStage::run(const std::vector<RequestRecord>& records) {
    const auto start = std::chrono::steady_clock::now();
    SubmissionResult result;

    if (records.empty()) {
        result.elapsed = std::chrono::steady_clock::now() - start;
        return result;
    }

    spdlog::info("Submitting {} requests to {} ({} workers)",
                 records.size(), target_.configString(), std::min(workers_, records.size()));

    ErrorCollector errors;
    std::mutex resultMutex;
    std::atomic<size_t> skipped{0};

    {
        WorkerPool pool(std::min(workers_, records.size()), "submission");

        for (const auto& record : records) {
            pool.submit([this, &record, &errors, &resultMutex, &skipped, &result]() {
                if (cancel_.isCancelled()) {
                    skipped.fetch_add(1);
                    return;
                }

                auto issued = submitOne(record, errors);

                RequestRecord terminal = record;
                terminal.stage = issued ? RequestStage::SUBMITTED : RequestStage::FAILED;
                spdlog::debug("Request {} -> {}", terminal.id, requestStageToString(terminal.stage));

                std::lock_guard<std::mutex> lock(resultMutex);
                if (issued) {
                    result.issued.push_back(std::move(*issued));
                }
                result.records.push_back(std::move(terminal));
            });
        }

        pool.waitIdle();
    }

    result.errors = errors.snapshot();
    result.skipped = skipped.load();
    result.elapsed = std::chrono::steady_clock::now() - start;

    spdlog::info("Submission finished: {} issued, {} failed, {} skipped",
                 result.issued.size(), result.errors.size(), result.skipped);
    return result;
}

std::optional<IssuedCertificate> SubmissionStage::submitOne(const RequestRecord& record,
                                                            ErrorCollector& errors) {
    if (record.stage != RequestStage::GENERATED || !record.artifactPath) {
        errors.record(record.id, ErrorStage::UNEXPECTED,
                      "record is not in Generated state with a request artifact");
        return std::nullopt;
    }

    try {
        SubmissionResponse response = client_.submit(
            RequestArtifact{record.id, *record.artifactPath}, target_, record.templateName);

        IssuedCertificate issued;
        issued.subjectId = record.id;
        issued.certificateBlob = response.certificatePath;

        if (auto requestId = parseCaRequestId(response.output)) {
            issued.caRequestId = *requestId;
            spdlog::debug("Request {} issued, CA RequestId {}", record.id, issued.caRequestId);
        } else {
            spdlog::debug("Request {} issued, no CA RequestId in tool output", record.id);
        }
        return issued;
    } catch (const common::SubmissionError& e) {
        spdlog::warn("Request {} submission failed: {}", record.id, e.what());
        errors.record(record.id, ErrorStage::SUBMISSION, e.what());
    } catch (const std::exception& e) {
        spdlog::warn("Request {} submission fault: {}", record.id, e.what());
        errors.record(record.id, ErrorStage::UNEXPECTED, e.what());
    } catch (...) {
        spdlog::warn("Request {} submission fault: unknown exception", record.id);
        errors.record(record.id, ErrorStage::UNEXPECTED, "unknown exception during submission");
    }

    return std::nullopt;
}

} // namespace caload::loadgen
