/**
 * @file request_spec_builder.cpp
 * @brief Request spec construction and certreq INF rendering
 */

#include "caload/loadgen/request_spec_builder.h"
#include "exceptions.h"

#include <sstream>

namespace caload::loadgen {

void validateTemplateName(const std::string& templateName) {
    if (templateName.empty()) {
        throw common::ValidationException("certificate template name must not be empty");
    }
    // The name is written into a quoted INF value
    for (unsigned char c : templateName) {
        if (c < 0x20 || c == 0x7F || c == '"') {
            throw common::ValidationException(
                "certificate template name contains a control character or quote");
        }
    }
}

RequestSpec buildRequestSpec(const std::string& templateName, const std::string& id) {
    validateTemplateName(templateName);
    if (id.empty()) {
        throw common::ValidationException("request id must not be empty");
    }

    RequestSpec spec;
    spec.id = id;
    spec.commonName = std::string(COMMON_NAME_PREFIX) + id;
    spec.subject = "CN=" + spec.commonName;
    spec.templateName = templateName;
    return spec;
}

std::string renderInfDescriptor(const RequestSpec& spec) {
    std::ostringstream inf;
    inf << "[Version]\r\n"
        << "Signature=\"$Windows NT$\"\r\n"
        << "\r\n"
        << "[NewRequest]\r\n"
        << "Subject = \"" << spec.subject << "\"\r\n"
        << "KeyLength = " << spec.keyLength << "\r\n"
        << "KeySpec = 1\r\n"
        << "KeyUsage = 0x" << std::hex << spec.keyUsage << std::dec << "\r\n"
        << "HashAlgorithm = " << spec.hashAlgorithm << "\r\n"
        << "MachineKeySet = TRUE\r\n"
        << "Exportable = FALSE\r\n"
        << "RequestType = PKCS10\r\n"
        << "ProviderName = \"Microsoft RSA SChannel Cryptographic Provider\"\r\n"
        << "\r\n"
        << "[RequestAttributes]\r\n"
        << "CertificateTemplate = \"" << spec.templateName << "\"\r\n";
    return inf.str();
}

} // namespace caload::loadgen
