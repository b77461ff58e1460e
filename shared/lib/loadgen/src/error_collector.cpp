#include "caload/loadgen/error_collector.h"
#include "caload/utils/time_utils.h"

namespace caload::loadgen {

void ErrorCollector::record(const std::string& subjectId, ErrorStage stage, const std::string& message) {
    ErrorRecord error{subjectId, stage, message, utils::now()};

    std::lock_guard<std::mutex> lock(mutex_);
    errors_.push_back(std::move(error));
}

std::vector<ErrorRecord> ErrorCollector::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
}

size_t ErrorCollector::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_.size();
}

} // namespace caload::loadgen
