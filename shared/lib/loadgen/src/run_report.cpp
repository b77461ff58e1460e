/**
 * @file run_report.cpp
 * @brief Report aggregation and rendering
 */

#include "caload/loadgen/run_report.h"
#include "caload/utils/string_utils.h"
#include "caload/utils/time_utils.h"
#include "exceptions.h"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace caload::loadgen {

namespace {

const char* const RULE = "============================================================";
const char* const THIN_RULE = "------------------------------------------------------------";

std::string formatSeconds(std::chrono::steady_clock::duration d) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3) << utils::toSeconds(d) << " s";
    return ss.str();
}

} // anonymous namespace

RunReport summarize(size_t total, size_t generated, size_t submitted,
                    const std::vector<ErrorRecord>& errors,
                    std::chrono::steady_clock::duration elapsed) {
    RunReport report;
    report.totalRequested = total;
    report.generated = generated;
    report.submitted = submitted;
    report.errors = errors;
    report.elapsed = elapsed;

    std::unordered_set<std::string> failedSubjects;
    for (const auto& error : errors) {
        failedSubjects.insert(error.subjectId);
    }
    report.failed = failedSubjects.size();

    size_t accounted = report.submitted + report.failed;
    report.skipped = total > accounted ? total - accounted : 0;

    double seconds = utils::toSeconds(elapsed);
    if (seconds > 0.0) {
        report.rate = static_cast<double>(submitted) / seconds;
    }

    return report;
}

std::string renderReport(const RunReport& report) {
    std::ostringstream out;

    out << RULE << "\n"
        << " CA Load Test Report\n"
        << RULE << "\n";

    out << " Requested : " << report.totalRequested << "\n"
        << " Generated : " << report.generated << "\n"
        << " Submitted : " << report.submitted << "\n"
        << " Failed    : " << report.failed << "\n";
    if (report.skipped > 0) {
        out << " Skipped   : " << report.skipped << " (run cancelled)\n";
    }

    out << " Elapsed   : " << formatSeconds(report.elapsed) << " (submission phase)\n";
    if (report.generationElapsed) {
        out << " Generation: " << formatSeconds(*report.generationElapsed) << "\n";
    }
    if (report.totalElapsed) {
        out << " End-to-end: " << formatSeconds(*report.totalElapsed) << "\n";
    }

    out << " Rate      : ";
    if (report.rate) {
        out << std::fixed << std::setprecision(2) << *report.rate << " requests/s\n";
    } else {
        out << "unavailable\n";
    }

    if (!report.errors.empty()) {
        out << THIN_RULE << "\n"
            << " Errors (" << report.errors.size() << ")\n"
            << THIN_RULE << "\n";

        for (const auto& error : report.errors) {
            out << "[" << utils::formatIso8601(error.timestamp, true) << "] "
                << error.subjectId << " (" << errorStageToString(error.stage) << ")\n";
            for (const auto& line : utils::nonEmptyLines(utils::trim(error.message))) {
                out << "    " << utils::trim(line) << "\n";
            }
        }
    }

    out << RULE << "\n";
    return out.str();
}

Json::Value reportToJson(const RunReport& report) {
    Json::Value root(Json::objectValue);
    root["totalRequested"] = static_cast<Json::UInt64>(report.totalRequested);
    root["generated"] = static_cast<Json::UInt64>(report.generated);
    root["submitted"] = static_cast<Json::UInt64>(report.submitted);
    root["failed"] = static_cast<Json::UInt64>(report.failed);
    root["skipped"] = static_cast<Json::UInt64>(report.skipped);
    root["elapsedSeconds"] = utils::toSeconds(report.elapsed);
    root["rate"] = report.rate ? Json::Value(*report.rate) : Json::Value(Json::nullValue);

    if (report.generationElapsed) {
        root["generationElapsedSeconds"] = utils::toSeconds(*report.generationElapsed);
    }
    if (report.totalElapsed) {
        root["totalElapsedSeconds"] = utils::toSeconds(*report.totalElapsed);
    }

    Json::Value errors(Json::arrayValue);
    for (const auto& error : report.errors) {
        Json::Value item(Json::objectValue);
        item["timestamp"] = utils::formatIso8601(error.timestamp, true);
        item["subjectId"] = error.subjectId;
        item["stage"] = errorStageToString(error.stage);
        item["message"] = utils::trim(error.message);
        errors.append(item);
    }
    root["errors"] = errors;

    return root;
}

void writeJsonReport(const RunReport& report, const std::filesystem::path& path) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        throw common::UnexpectedError("cannot open " + path.string() + " for writing");
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    file << Json::writeString(writer, reportToJson(report)) << "\n";

    file.close();
    if (!file) {
        throw common::UnexpectedError("failed writing " + path.string());
    }
}

} // namespace caload::loadgen
