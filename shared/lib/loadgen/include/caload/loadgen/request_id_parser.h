/**
 * @file request_id_parser.h
 * @brief Extracts the CA-assigned request id from enrollment tool output
 */

#pragma once

#include <optional>
#include <string>

namespace caload::loadgen {

/**
 * @brief Parse the CA request id out of certreq output
 *
 * Accepts lines such as `RequestId: 123` or `RequestId: "123"`
 * (key matched case-insensitively). The first match wins.
 *
 * @param output Free-text tool output
 * @return Request id digits, or std::nullopt when none present (not an error)
 */
std::optional<std::string> parseCaRequestId(const std::string& output);

} // namespace caload::loadgen
