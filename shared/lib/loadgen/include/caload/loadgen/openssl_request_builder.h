/**
 * @file openssl_request_builder.h
 * @brief Native PKCS#10 request generation with OpenSSL
 *
 * Produces the same request content certreq derives from the INF
 * descriptor: fresh RSA key, subject CN, critical key usage extension and
 * the Microsoft certificate template name extension.
 */

#pragma once

#include "caload/loadgen/types.h"

#include <string>

namespace caload::loadgen {

/// @brief szOID_ENROLL_CERTTYPE_EXTENSION (template name as BMPString)
constexpr const char* OID_ENROLL_CERTTYPE = "1.3.6.1.4.1.311.20.2";

/**
 * @brief Generate a key pair and a signed PKCS#10 request
 *
 * The private key is discarded after signing.
 *
 * @param spec Request descriptor
 * @return PEM-encoded certificate request
 * @throws common::CreationError on any OpenSSL failure or unknown hash algorithm
 */
std::string buildPkcs10Pem(const RequestSpec& spec);

} // namespace caload::loadgen
