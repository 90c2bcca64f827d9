/**
 * @file crypto_keys.cpp
 * @brief ECC key and certificate wrapper implementations (OpenSSL 3.x)
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attest/common/crypto.h"
#include "openssl_wrappers.h"
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/x509.h>
#include <glog/logging.h>
#include <fstream>
#include <iterator>

namespace attest {
namespace crypto {

using namespace internal;

namespace {

std::string BioToString(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || data == nullptr) {
        return std::string();
    }
    return std::string(data, len);
}

std::string ReadTextFile(const std::string& path, const char* what) {
    std::ifstream file(path);
    if (!file) {
        throw CryptoError(std::string("Failed to open ") + what + " file: " + path);
    }
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

} // namespace

// ============================================================================
// PrivateKey Implementation
// ============================================================================

class PrivateKey::Impl {
public:
    EVP_PKEY* pkey = nullptr;

    ~Impl() {
        if (pkey) {
            EVP_PKEY_free(pkey);
        }
    }
};

PrivateKey::PrivateKey() : impl_(std::make_unique<Impl>()) {}

PrivateKey::~PrivateKey() = default;

PrivateKey::PrivateKey(PrivateKey&&) noexcept = default;
PrivateKey& PrivateKey::operator=(PrivateKey&&) noexcept = default;

PrivateKey PrivateKey::LoadFromFile(const std::string& path) {
    std::string pem = ReadTextFile(path, "private key");
    VLOG(1) << "Loading private key from " << path;
    try {
        return LoadFromPEM(pem);
    } catch (const CryptoError&) {
        throw CryptoError("Failed to parse private key from: " + path);
    }
}

PrivateKey PrivateKey::LoadFromPEM(const std::string& pem) {
    BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw CryptoError("Failed to create BIO from PEM");
    }

    PrivateKey key;
    key.impl_->pkey = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);

    if (!key.impl_->pkey) {
        throw CryptoError("Failed to parse private key from PEM");
    }

    return key;
}

PrivateKey PrivateKey::Generate() {
    // SECURITY: Verify PRNG is properly seeded before generating keys
    if (RAND_status() != 1) {
        throw CryptoError("OpenSSL PRNG not properly seeded - insufficient entropy");
    }

    EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
    if (!ctx) {
        throw CryptoError("Failed to create EC context");
    }

    if (EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        throw CryptoError("Failed to initialize EC keygen");
    }

    if (EVP_PKEY_CTX_set_group_name(ctx.get(), "P-256") <= 0) {
        throw CryptoError("Failed to select P-256 curve");
    }

    PrivateKey key;
    if (EVP_PKEY_keygen(ctx.get(), &key.impl_->pkey) <= 0) {
        throw CryptoError("Failed to generate P-256 key pair");
    }

    return key;
}

std::string PrivateKey::ToPEM() const {
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    if (!PEM_write_bio_PrivateKey(bio.get(), impl_->pkey, nullptr, nullptr, 0, nullptr, nullptr)) {
        throw CryptoError("Failed to write private key to PEM");
    }

    return BioToString(bio.get());
}

bool PrivateKey::IsP256() const {
    if (!impl_->pkey || EVP_PKEY_get_base_id(impl_->pkey) != EVP_PKEY_EC) {
        return false;
    }

    char group[64] = {0};
    size_t group_len = 0;
    if (EVP_PKEY_get_utf8_string_param(impl_->pkey, OSSL_PKEY_PARAM_GROUP_NAME,
                                       group, sizeof(group), &group_len) != 1) {
        return false;
    }

    int nid = OBJ_sn2nid(group);
    if (nid == NID_undef) {
        nid = EC_curve_nist2nid(group);
    }
    return nid == NID_X9_62_prime256v1;
}

void* PrivateKey::GetNativeHandle() const {
    return impl_->pkey;
}

// ============================================================================
// PublicKey Implementation
// ============================================================================

class PublicKey::Impl {
public:
    EVP_PKEY* pkey = nullptr;

    ~Impl() {
        if (pkey) {
            EVP_PKEY_free(pkey);
        }
    }
};

PublicKey::PublicKey() : impl_(std::make_unique<Impl>()) {}

PublicKey::~PublicKey() = default;

PublicKey::PublicKey(PublicKey&&) noexcept = default;
PublicKey& PublicKey::operator=(PublicKey&&) noexcept = default;

PublicKey PublicKey::LoadFromPEM(const std::string& pem) {
    BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw CryptoError("Failed to create BIO from PEM");
    }

    PublicKey key;
    key.impl_->pkey = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);

    if (!key.impl_->pkey) {
        throw CryptoError("Failed to parse public key from PEM");
    }

    return key;
}

PublicKey PublicKey::FromPrivateKey(const PrivateKey& privkey) {
    EVP_PKEY* priv_pkey = static_cast<EVP_PKEY*>(privkey.GetNativeHandle());

    // Export and re-import the public half via BIO
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO for public key");
    }

    if (!PEM_write_bio_PUBKEY(bio.get(), priv_pkey)) {
        throw CryptoError("Failed to write EC public key");
    }

    PublicKey pubkey;
    pubkey.impl_->pkey = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
    if (!pubkey.impl_->pkey) {
        throw CryptoError("Failed to read EC public key");
    }

    return pubkey;
}

std::string PublicKey::ToPEM() const {
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    if (!PEM_write_bio_PUBKEY(bio.get(), impl_->pkey)) {
        throw CryptoError("Failed to write public key to PEM");
    }

    return BioToString(bio.get());
}

void* PublicKey::GetNativeHandle() const {
    return impl_->pkey;
}

// ============================================================================
// Certificate Implementation
// ============================================================================

class Certificate::Impl {
public:
    X509* cert = nullptr;

    ~Impl() {
        if (cert) {
            X509_free(cert);
        }
    }
};

Certificate::Certificate() : impl_(std::make_unique<Impl>()) {}

Certificate::~Certificate() = default;

Certificate::Certificate(Certificate&&) noexcept = default;
Certificate& Certificate::operator=(Certificate&&) noexcept = default;

Certificate Certificate::LoadFromFile(const std::string& path) {
    std::string pem = ReadTextFile(path, "certificate");
    VLOG(1) << "Loading certificate from " << path;
    try {
        return LoadFromPEM(pem);
    } catch (const CryptoError&) {
        throw CryptoError("No certificates found in: " + path);
    }
}

Certificate Certificate::LoadFromPEM(const std::string& pem) {
    BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw CryptoError("Failed to create BIO from PEM data");
    }

    Certificate cert;
    cert.impl_->cert = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
    if (!cert.impl_->cert) {
        throw CryptoError("No certificates found in PEM data");
    }

    return cert;
}

Certificate Certificate::LoadFromDER(const std::vector<uint8_t>& der) {
    const unsigned char* p = der.data();
    Certificate cert;
    cert.impl_->cert = d2i_X509(nullptr, &p, static_cast<long>(der.size()));

    if (!cert.impl_->cert) {
        throw CryptoError("Failed to parse certificate from DER");
    }

    return cert;
}

std::vector<uint8_t> Certificate::ToDER() const {
    unsigned char* der = nullptr;
    int len = i2d_X509(impl_->cert, &der);

    if (len < 0) {
        throw CryptoError("Failed to encode certificate to DER");
    }

    std::vector<uint8_t> result(der, der + len);
    OPENSSL_free(der);

    return result;
}

std::string Certificate::ToPEM() const {
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    if (!PEM_write_bio_X509(bio.get(), impl_->cert)) {
        throw CryptoError("Failed to write certificate to PEM");
    }

    return BioToString(bio.get());
}

std::string Certificate::CreateChainPEM(const std::vector<std::vector<uint8_t>>& chain) {
    std::string bundle;
    for (const auto& der : chain) {
        bundle += LoadFromDER(der).ToPEM();
    }
    return bundle;
}

PublicKey Certificate::GetPublicKey() const {
    EVP_PKEY_ptr pkey(X509_get_pubkey(impl_->cert));
    if (!pkey) {
        throw CryptoError("Failed to extract public key from certificate");
    }

    // Convert to PEM and back to create PublicKey object properly
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    if (!PEM_write_bio_PUBKEY(bio.get(), pkey.get())) {
        throw CryptoError("Failed to write public key to PEM");
    }

    return PublicKey::LoadFromPEM(BioToString(bio.get()));
}

std::string Certificate::GetSubject() const {
    X509_NAME* subject = X509_get_subject_name(impl_->cert);
    if (!subject) {
        return std::string();
    }

    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    X509_NAME_print_ex(bio.get(), subject, 0, XN_FLAG_RFC2253);
    return BioToString(bio.get());
}

void* Certificate::GetNativeHandle() const {
    return impl_->cert;
}

} // namespace crypto
} // namespace attest
