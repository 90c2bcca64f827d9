/**
 * @file x509_certificate.cpp
 * @brief End-entity signing certificate creation
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attest/common/crypto.h"
#include "openssl_wrappers.h"
#include <openssl/asn1.h>
#include <openssl/evp.h>
#include <openssl/x509v3.h>

namespace attest {
namespace crypto {

using namespace internal;

namespace {

void AddExtension(X509* cert, int nid, const char* value, const char* what) {
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, nullptr, nid, value);
    if (!ext) {
        throw CryptoError(std::string("Failed to create ") + what + " extension");
    }
    int added = X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
    if (added != 1) {
        throw CryptoError(std::string("Failed to add ") + what + " extension");
    }
}

} // namespace

Certificate CreateEndEntityCertificate(
    const PrivateKey& signing_key,
    const PublicKey& subject_pubkey,
    const std::string& subject_name,
    int validity_days,
    const Certificate* issuer_cert
) {
    if (subject_name.empty()) {
        throw CryptoError("Certificate subject name is required");
    }

    X509_ptr cert(X509_new());
    if (!cert) {
        throw CryptoError("Failed to create X509 structure");
    }

    // Set version (X509 v3)
    X509_set_version(cert.get(), 2);

    // Set serial number
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);

    // Set validity period
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), static_cast<long>(validity_days) * 24 * 3600);

    // Set subject name
    X509_NAME_ptr subject(X509_NAME_new());
    if (!subject) {
        throw CryptoError("Failed to create subject name");
    }
    X509_NAME_add_entry_by_txt(subject.get(), "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>(subject_name.c_str()), -1, -1, 0);
    X509_set_subject_name(cert.get(), subject.get());

    // Set issuer name
    if (issuer_cert != nullptr) {
        X509* issuer_x509 = static_cast<X509*>(issuer_cert->GetNativeHandle());
        X509_set_issuer_name(cert.get(), X509_get_subject_name(issuer_x509));
    } else {
        // Self-signed certificate - issuer = subject
        X509_set_issuer_name(cert.get(), subject.get());
    }

    // Set public key
    EVP_PKEY* pub_pkey = static_cast<EVP_PKEY*>(subject_pubkey.GetNativeHandle());
    if (X509_set_pubkey(cert.get(), pub_pkey) != 1) {
        throw CryptoError("Failed to set certificate public key");
    }

    AddExtension(cert.get(), NID_key_usage, "critical,digitalSignature", "keyUsage");
    AddExtension(cert.get(), NID_basic_constraints, "critical,CA:FALSE", "basicConstraints");
    AddExtension(cert.get(), NID_ext_key_usage, "emailProtection", "extendedKeyUsage");

    // Sign the certificate (ECDSA with SHA-256)
    EVP_PKEY* priv_pkey = static_cast<EVP_PKEY*>(signing_key.GetNativeHandle());
    if (!X509_sign(cert.get(), priv_pkey, EVP_sha256())) {
        throw CryptoError("Failed to sign certificate");
    }

    // Convert to DER and create Certificate object
    unsigned char* der = nullptr;
    int len = i2d_X509(cert.get(), &der);
    if (len < 0) {
        throw CryptoError("Failed to encode certificate");
    }

    std::vector<uint8_t> der_vec(der, der + len);
    OPENSSL_free(der);

    return Certificate::LoadFromDER(der_vec);
}

} // namespace crypto
} // namespace attest
