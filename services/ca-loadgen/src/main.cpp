/**
 * @file main.cpp
 * @brief ca-loadgen - certificate enrollment load generator
 *
 * Creates N PKCS#10 requests for a synthetic subject each, submits them to a
 * Microsoft CA through certreq with bounded concurrency, and prints a
 * throughput and error report.
 */

#include "cli_options.h"
#include "config_manager.h"
#include "exceptions.h"
#include "logger.h"

#include <caload/loadgen/certreq_client.h>
#include <caload/loadgen/load_test_config.h>
#include <caload/loadgen/load_test_runner.h>
#include <caload/loadgen/run_report.h>

#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <iostream>

namespace {

constexpr int EXIT_SETUP_FAILURE = 1;
constexpr int EXIT_USAGE = 2;

// Async-signal-safe: only set flag (lock-free atomic)
std::atomic<bool>* g_cancelFlag = nullptr;

void signalHandler(int /* signal */) {
    if (g_cancelFlag) {
        g_cancelFlag->store(true);
    }
}

void initializeLogging(const caload::common::ConfigManager& config) {
    std::string logFile = config.getString(caload::common::ConfigManager::LOG_FILE);
    caload::common::Logger::initialize(
        "ca-loadgen",
        config.getString(caload::common::ConfigManager::LOG_LEVEL, "info"),
        !logFile.empty(),
        logFile);
}

} // anonymous namespace

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    using caload::common::ConfigManager;
    namespace loadgen = caload::loadgen;

    const std::string progname = argc > 0 ? argv[0] : "ca-loadgen";
    auto& config = ConfigManager::getInstance();

    try {
        caload::cli::CliOptions options = caload::cli::parseCommandLine(argc, argv);
        if (options.showHelp) {
            caload::cli::printUsage(std::cout, progname);
            return 0;
        }
        caload::cli::applyOverrides(options, config);
    } catch (const caload::common::ConfigException& e) {
        std::cerr << progname << ": " << e.what() << "\n\n";
        caload::cli::printUsage(std::cerr, progname);
        return EXIT_USAGE;
    }

    initializeLogging(config);

    loadgen::LoadTestConfig runConfig;
    try {
        runConfig = loadgen::LoadTestConfig::fromConfigManager(config);
        runConfig.validate();
    } catch (const caload::common::ConfigException& e) {
        spdlog::error("{}", e.what());
        caload::cli::printUsage(std::cerr, progname);
        return EXIT_USAGE;
    }

    spdlog::info("Target CA: {}, template: {}, backend: {}",
                 runConfig.target.configString(), runConfig.templateName,
                 loadgen::requestBackendToString(runConfig.backend));

    loadgen::CancellationSource cancel;
    g_cancelFlag = cancel.rawFlag();
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    loadgen::CertreqClient client(runConfig.clientOptions());
    loadgen::LoadTestRunner runner(runConfig, client, cancel.token());

    loadgen::RunOutcome outcome;
    try {
        outcome = runner.run();
    } catch (const caload::common::SetupException& e) {
        spdlog::critical("{}", e.what());
        caload::common::Logger::flush();
        return EXIT_SETUP_FAILURE;
    } catch (const std::exception& e) {
        spdlog::critical("Load test aborted: {}", e.what());
        caload::common::Logger::flush();
        return EXIT_SETUP_FAILURE;
    }

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_cancelFlag = nullptr;

    std::cout << loadgen::renderReport(outcome.report);

    if (runConfig.reportJsonPath) {
        try {
            loadgen::writeJsonReport(outcome.report, *runConfig.reportJsonPath);
            spdlog::info("JSON report written to {}", runConfig.reportJsonPath->string());
        } catch (const caload::common::UnexpectedError& e) {
            spdlog::error("{}", e.what());
        }
    }

    caload::common::Logger::flush();
    return 0;
}
