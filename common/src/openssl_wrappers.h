/**
 * @file openssl_wrappers.h
 * @brief RAII wrappers for OpenSSL resources
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ATTEST_OPENSSL_WRAPPERS_H
#define ATTEST_OPENSSL_WRAPPERS_H

#include <memory>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

namespace attest {
namespace crypto {
namespace internal {

// Custom deleters for OpenSSL types
struct EVP_PKEY_Deleter {
    void operator()(EVP_PKEY* p) const { if (p) EVP_PKEY_free(p); }
};

struct EVP_PKEY_CTX_Deleter {
    void operator()(EVP_PKEY_CTX* p) const { if (p) EVP_PKEY_CTX_free(p); }
};

struct BIO_Deleter {
    void operator()(BIO* p) const { if (p) BIO_free(p); }
};

struct EVP_MD_CTX_Deleter {
    void operator()(EVP_MD_CTX* p) const { if (p) EVP_MD_CTX_free(p); }
};

struct X509_Deleter {
    void operator()(X509* p) const { if (p) X509_free(p); }
};

struct X509_NAME_Deleter {
    void operator()(X509_NAME* p) const { if (p) X509_NAME_free(p); }
};

struct ECDSA_SIG_Deleter {
    void operator()(ECDSA_SIG* p) const { if (p) ECDSA_SIG_free(p); }
};

struct BIGNUM_Deleter {
    void operator()(BIGNUM* p) const { if (p) BN_free(p); }
};

// RAII wrappers using unique_ptr
using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter>;
using EVP_PKEY_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_Deleter>;
using BIO_ptr = std::unique_ptr<BIO, BIO_Deleter>;
using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter>;
using X509_ptr = std::unique_ptr<X509, X509_Deleter>;
using X509_NAME_ptr = std::unique_ptr<X509_NAME, X509_NAME_Deleter>;
using ECDSA_SIG_ptr = std::unique_ptr<ECDSA_SIG, ECDSA_SIG_Deleter>;
using BIGNUM_ptr = std::unique_ptr<BIGNUM, BIGNUM_Deleter>;

} // namespace internal
} // namespace crypto
} // namespace attest

#endif // ATTEST_OPENSSL_WRAPPERS_H
