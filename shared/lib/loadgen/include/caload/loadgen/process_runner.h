/**
 * @file process_runner.h
 * @brief Child process invocation with captured output
 */

#pragma once

#include <string>
#include <vector>

namespace caload::loadgen {

struct ProcessResult {
    int exitCode = -1;      ///< Exit status, or 128 + signal number
    bool timedOut = false;
    std::string output;     ///< Combined stdout and stderr
};

/**
 * @brief Quote one argument for /bin/sh
 */
std::string shellQuote(const std::string& arg);

/**
 * @brief Build a shell command line from an argument vector
 */
std::string buildCommandLine(const std::vector<std::string>& argv);

/**
 * @brief Run a command and wait for it
 *
 * stderr is merged into stdout. When timeoutSeconds > 0 the command is run
 * under timeout(1) and killed if it overruns. The child starts in its own
 * process group, so terminal job-control signals aimed at the caller do not
 * reach it.
 *
 * @throws common::UnexpectedError if the process cannot be started or reaped
 */
ProcessResult runProcess(const std::vector<std::string>& argv, int timeoutSeconds = 0);

} // namespace caload::loadgen
