/**
 * @file load_test_config.h
 * @brief Resolved settings for one load test run
 */

#pragma once

#include "caload/loadgen/certreq_client.h"
#include "caload/loadgen/types.h"

#include <filesystem>
#include <optional>
#include <string>

namespace caload::common {
class ConfigManager;
}

namespace caload::loadgen {

struct LoadTestConfig {
    CaTarget target;
    std::string templateName;

    int requestCount = 10;
    std::filesystem::path outputDir = "./loadtest-requests";
    int generationWorkers = 4;
    int submissionWorkers = 4;

    std::string certreqPath = "certreq";
    RequestBackend backend = RequestBackend::CERTREQ;
    int callTimeoutSeconds = 0;

    std::optional<std::filesystem::path> reportJsonPath;

    /**
     * @brief Materialize from ConfigManager (command line over environment)
     * @throws common::ConfigException on an unknown request backend
     */
    static LoadTestConfig fromConfigManager(const common::ConfigManager& config);

    /**
     * @brief Reject incomplete or out-of-range settings
     * @throws common::ConfigException describing the first problem found
     */
    void validate() const;

    CertreqClientOptions clientOptions() const;
};

} // namespace caload::loadgen
