/**
 * @file run_report.h
 * @brief Aggregate outcome of a load test run
 */

#pragma once

#include "caload/loadgen/types.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

namespace caload::loadgen {

struct RunReport {
    size_t totalRequested = 0;
    size_t generated = 0;
    size_t submitted = 0;
    size_t failed = 0;      ///< Distinct subjects with at least one error
    size_t skipped = 0;     ///< Never dispatched because the run was cancelled
    std::vector<ErrorRecord> errors;

    std::chrono::steady_clock::duration elapsed{};  ///< Submission phase
    std::optional<double> rate;                     ///< submitted / elapsed seconds; unset when elapsed is zero

    /// Informational phase timings
    std::optional<std::chrono::steady_clock::duration> generationElapsed;
    std::optional<std::chrono::steady_clock::duration> totalElapsed;
};

/**
 * @brief Aggregate counts into a report (pure)
 *
 * @param total Requests asked for
 * @param generated Request blobs created
 * @param submitted Certificates issued
 * @param errors All error records of the run, in order
 * @param elapsed Submission phase duration (rate basis)
 */
RunReport summarize(size_t total, size_t generated, size_t submitted,
                    const std::vector<ErrorRecord>& errors,
                    std::chrono::steady_clock::duration elapsed);

/**
 * @brief Human-readable summary with one block per error
 */
std::string renderReport(const RunReport& report);

/**
 * @brief Same content as a JSON document (rate is null when unavailable)
 */
Json::Value reportToJson(const RunReport& report);

/**
 * @brief Write reportToJson() to a file
 * @throws common::UnexpectedError if the file cannot be written
 */
void writeJsonReport(const RunReport& report, const std::filesystem::path& path);

} // namespace caload::loadgen
