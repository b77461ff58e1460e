/**
 * @file openssl_request_builder.cpp
 * @brief PKCS#10 generation via OpenSSL EVP / X509_REQ APIs
 */

#include "caload/loadgen/openssl_request_builder.h"
#include "exceptions.h"

#include <memory>
#include <vector>
#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace caload::loadgen {

namespace {

struct PKeyDeleter { void operator()(EVP_PKEY* p) { EVP_PKEY_free(p); } };
using UniqueKey = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

struct PKeyCtxDeleter { void operator()(EVP_PKEY_CTX* p) { EVP_PKEY_CTX_free(p); } };
using UniqueKeyCtx = std::unique_ptr<EVP_PKEY_CTX, PKeyCtxDeleter>;

struct ReqDeleter { void operator()(X509_REQ* p) { X509_REQ_free(p); } };
using UniqueReq = std::unique_ptr<X509_REQ, ReqDeleter>;

struct NameDeleter { void operator()(X509_NAME* p) { X509_NAME_free(p); } };
using UniqueName = std::unique_ptr<X509_NAME, NameDeleter>;

struct ExtStackDeleter {
    void operator()(STACK_OF(X509_EXTENSION)* p) { sk_X509_EXTENSION_pop_free(p, X509_EXTENSION_free); }
};
using UniqueExtStack = std::unique_ptr<STACK_OF(X509_EXTENSION), ExtStackDeleter>;

struct BioDeleter { void operator()(BIO* p) { BIO_free(p); } };
using UniqueBio = std::unique_ptr<BIO, BioDeleter>;

/// Drain the OpenSSL error queue into one message
std::string opensslError(const std::string& what) {
    std::string message = what;
    unsigned long code;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        message += ": ";
        message += buf;
    }
    return message;
}

UniqueKey generateRsaKey(int bits) {
    UniqueKeyCtx ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0) {
        throw common::CreationError(opensslError("RSA key generation setup failed"));
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        throw common::CreationError(opensslError("RSA key generation failed"));
    }
    return UniqueKey(raw);
}

/// INF KeyUsage is the first byte of the KeyUsage BIT STRING (0x80 = bit 0)
X509_EXTENSION* createKeyUsageExtension(unsigned int keyUsage) {
    ASN1_BIT_STRING* bits = ASN1_BIT_STRING_new();
    if (!bits) return nullptr;

    for (int bit = 0; bit < 8; ++bit) {
        if (keyUsage & (0x80u >> bit)) {
            ASN1_BIT_STRING_set_bit(bits, bit, 1);
        }
    }

    X509_EXTENSION* ext = X509V3_EXT_i2d(NID_key_usage, 1, bits);
    ASN1_BIT_STRING_free(bits);
    return ext;
}

/// Template name extension: BMPString (UTF-16BE) wrapped in an OCTET STRING
X509_EXTENSION* createTemplateNameExtension(const std::string& templateName) {
    // UTF-8 input; OpenSSL rejects malformed sequences and characters outside the BMP
    ASN1_STRING* bmp = nullptr;
    if (ASN1_mbstring_copy(&bmp, reinterpret_cast<const unsigned char*>(templateName.data()),
                           static_cast<int>(templateName.size()),
                           MBSTRING_UTF8, B_ASN1_BMPSTRING) <= 0) {
        ASN1_STRING_free(bmp);
        return nullptr;
    }

    int derLen = i2d_ASN1_BMPSTRING(bmp, nullptr);
    if (derLen <= 0) {
        ASN1_STRING_free(bmp);
        return nullptr;
    }
    std::vector<unsigned char> der(static_cast<size_t>(derLen));
    unsigned char* p = der.data();
    i2d_ASN1_BMPSTRING(bmp, &p);
    ASN1_STRING_free(bmp);

    ASN1_OCTET_STRING* value = ASN1_OCTET_STRING_new();
    ASN1_OBJECT* oid = OBJ_txt2obj(OID_ENROLL_CERTTYPE, 1);
    X509_EXTENSION* ext = nullptr;
    if (value && oid && ASN1_OCTET_STRING_set(value, der.data(), derLen)) {
        ext = X509_EXTENSION_create_by_OBJ(nullptr, oid, 0, value);
    }
    ASN1_OBJECT_free(oid);
    ASN1_OCTET_STRING_free(value);
    return ext;
}

} // anonymous namespace

std::string buildPkcs10Pem(const RequestSpec& spec) {
    const EVP_MD* md = EVP_get_digestbyname(spec.hashAlgorithm.c_str());
    if (!md) {
        throw common::CreationError("unsupported hash algorithm: " + spec.hashAlgorithm);
    }

    UniqueKey key = generateRsaKey(spec.keyLength);

    UniqueReq req(X509_REQ_new());
    if (!req || !X509_REQ_set_version(req.get(), 0)) {
        throw common::CreationError(opensslError("X509_REQ allocation failed"));
    }

    UniqueName name(X509_NAME_new());
    if (!name || !X509_NAME_add_entry_by_txt(name.get(), "CN", MBSTRING_UTF8,
            reinterpret_cast<const unsigned char*>(spec.commonName.c_str()), -1, -1, 0)) {
        throw common::CreationError(opensslError("failed to build subject name"));
    }
    if (!X509_REQ_set_subject_name(req.get(), name.get()) ||
        !X509_REQ_set_pubkey(req.get(), key.get())) {
        throw common::CreationError(opensslError("failed to set subject or public key"));
    }

    UniqueExtStack exts(sk_X509_EXTENSION_new_null());
    if (!exts) {
        throw common::CreationError(opensslError("extension stack allocation failed"));
    }

    X509_EXTENSION* keyUsage = createKeyUsageExtension(spec.keyUsage);
    if (!keyUsage || !sk_X509_EXTENSION_push(exts.get(), keyUsage)) {
        X509_EXTENSION_free(keyUsage);
        throw common::CreationError(opensslError("failed to encode key usage extension"));
    }

    X509_EXTENSION* templateExt = createTemplateNameExtension(spec.templateName);
    if (!templateExt || !sk_X509_EXTENSION_push(exts.get(), templateExt)) {
        X509_EXTENSION_free(templateExt);
        throw common::CreationError(opensslError("failed to encode certificate template extension"));
    }

    if (!X509_REQ_add_extensions(req.get(), exts.get())) {
        throw common::CreationError(opensslError("failed to attach extension request"));
    }

    if (X509_REQ_sign(req.get(), key.get(), md) <= 0) {
        throw common::CreationError(opensslError("failed to sign request"));
    }

    UniqueBio bio(BIO_new(BIO_s_mem()));
    if (!bio || !PEM_write_bio_X509_REQ(bio.get(), req.get())) {
        throw common::CreationError(opensslError("failed to PEM-encode request"));
    }

    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(len));
}

} // namespace caload::loadgen
