/**
 * @file load_test_config.cpp
 * @brief LoadTestConfig resolution and validation
 */

#include "caload/loadgen/load_test_config.h"
#include "caload/loadgen/request_spec_builder.h"
#include "config_manager.h"
#include "exceptions.h"

namespace caload::loadgen {

using common::ConfigManager;

LoadTestConfig LoadTestConfig::fromConfigManager(const ConfigManager& config) {
    LoadTestConfig cfg;

    cfg.target.server = config.getString(ConfigManager::CA_SERVER);
    cfg.target.name = config.getString(ConfigManager::CA_NAME);
    cfg.templateName = config.getString(ConfigManager::CERT_TEMPLATE);

    cfg.requestCount = config.getInt(ConfigManager::REQUEST_COUNT, cfg.requestCount);
    cfg.outputDir = config.getString(ConfigManager::OUTPUT_DIR, cfg.outputDir.string());
    cfg.generationWorkers = config.getInt(ConfigManager::GENERATION_WORKERS, cfg.generationWorkers);
    cfg.submissionWorkers = config.getInt(ConfigManager::SUBMISSION_WORKERS, cfg.submissionWorkers);

    cfg.certreqPath = config.getString(ConfigManager::CERTREQ_PATH, cfg.certreqPath);
    cfg.callTimeoutSeconds = config.getInt(ConfigManager::CALL_TIMEOUT_SEC, cfg.callTimeoutSeconds);

    std::string backend = config.getString(ConfigManager::REQUEST_BACKEND);
    if (!backend.empty()) {
        auto parsed = parseRequestBackend(backend);
        if (!parsed) {
            throw common::ConfigException("unknown request backend '" + backend +
                                          "' (expected certreq or openssl)");
        }
        cfg.backend = *parsed;
    }

    std::string reportJson = config.getString(ConfigManager::REPORT_JSON);
    if (!reportJson.empty()) {
        cfg.reportJsonPath = reportJson;
    }

    return cfg;
}

void LoadTestConfig::validate() const {
    if (target.server.empty()) {
        throw common::ConfigException("CA server is required");
    }
    if (target.name.empty()) {
        throw common::ConfigException("CA name is required");
    }
    if (templateName.empty()) {
        throw common::ConfigException("certificate template is required");
    }
    try {
        validateTemplateName(templateName);
    } catch (const common::ValidationException&) {
        throw common::ConfigException("certificate template must not contain control characters or quotes");
    }
    if (requestCount < 0) {
        throw common::ConfigException("request count must not be negative");
    }
    if (generationWorkers < 1) {
        throw common::ConfigException("generation workers must be at least 1");
    }
    if (submissionWorkers < 1) {
        throw common::ConfigException("submission workers must be at least 1");
    }
    if (callTimeoutSeconds < 0) {
        throw common::ConfigException("call timeout must not be negative");
    }
    if (outputDir.empty()) {
        throw common::ConfigException("output directory is required");
    }
    if (backend == RequestBackend::CERTREQ && certreqPath.empty()) {
        throw common::ConfigException("certreq path is required");
    }
}

CertreqClientOptions LoadTestConfig::clientOptions() const {
    CertreqClientOptions options;
    options.certreqPath = certreqPath;
    options.outputDir = outputDir;
    options.backend = backend;
    options.callTimeoutSeconds = callTimeoutSeconds;
    return options;
}

} // namespace caload::loadgen
