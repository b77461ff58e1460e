/**
 * @file error_collector.h
 * @brief Concurrency-safe accumulator for ErrorRecords
 */

#pragma once

#include "caload/loadgen/types.h"

#include <mutex>
#include <string>
#include <vector>

namespace caload::loadgen {

/**
 * @brief Mutex-guarded append-only error list shared by stage workers
 *
 * Records are timestamped on append and never modified afterwards.
 */
class ErrorCollector {
public:
    void record(const std::string& subjectId, ErrorStage stage, const std::string& message);

    std::vector<ErrorRecord> snapshot() const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<ErrorRecord> errors_;
};

} // namespace caload::loadgen
