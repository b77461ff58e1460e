/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Error taxonomy for the load generator. Item-level errors (creation,
 * submission, unexpected) are caught by the stages and recorded; setup and
 * configuration errors stop the run before any request is generated.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace caload {
namespace common {

/**
 * @brief Base exception for all load generator exceptions
 */
class LoadgenException : public std::runtime_error {
public:
    explicit LoadgenException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Request blob generation failed
 */
class CreationError : public LoadgenException {
public:
    explicit CreationError(const std::string& message)
        : LoadgenException("Request creation failed: " + message) {}
};

/**
 * @brief CA rejected the request or was unreachable
 */
class SubmissionError : public LoadgenException {
public:
    explicit SubmissionError(const std::string& message)
        : LoadgenException("Request submission failed: " + message) {}
};

/**
 * @brief Fault outside the enrollment tool (e.g. filesystem failure)
 */
class UnexpectedError : public LoadgenException {
public:
    explicit UnexpectedError(const std::string& message)
        : LoadgenException("Unexpected error: " + message) {}
};

/**
 * @brief Invalid input to a pure builder
 */
class ValidationException : public LoadgenException {
public:
    explicit ValidationException(const std::string& message)
        : LoadgenException("Validation error: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public LoadgenException {
public:
    explicit ConfigException(const std::string& message)
        : LoadgenException("Configuration error: " + message) {}
};

/**
 * @brief Run could not be set up (output directory)
 */
class SetupException : public LoadgenException {
public:
    explicit SetupException(const std::string& message)
        : LoadgenException("Setup error: " + message) {}
};

} // namespace common
} // namespace caload
