/**
 * @file request_spec_builder.h
 * @brief Builds the logical content of one enrollment request
 *
 * Pure functions, no I/O.
 */

#pragma once

#include "caload/loadgen/types.h"

#include <string>

namespace caload::loadgen {

/**
 * @brief Check that a template name is non-empty and holds no control
 *        characters or double quotes
 * @throws common::ValidationException
 */
void validateTemplateName(const std::string& templateName);

/**
 * @brief Build a request spec for one synthetic subject
 *
 * Subject is CN=LoadTestCert-<id>; key parameters are fixed
 * (RSA 2048, sha256, digitalSignature).
 *
 * @param templateName CA template to enroll against
 * @param id Caller-supplied unique id
 * @throws common::ValidationException if id is empty or templateName is
 *         rejected by validateTemplateName
 */
RequestSpec buildRequestSpec(const std::string& templateName, const std::string& id);

/**
 * @brief Render the certreq policy (INF) file for a spec
 */
std::string renderInfDescriptor(const RequestSpec& spec);

} // namespace caload::loadgen
