/**
 * @file crypto_ecdsa.cpp
 * @brief ECDSA P-256 signing/verification and SHA-256 hashing
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attest/common/crypto.h"
#include "openssl_wrappers.h"
#include <openssl/bn.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>

namespace attest {
namespace crypto {

using namespace internal;

// ============================================================================
// ECDSA Implementation
// ============================================================================

std::vector<uint8_t> ECDSA::Sign(
    const PrivateKey& private_key,
    const std::vector<uint8_t>& data
) {
    // Validate key type
    if (!private_key.IsP256()) {
        throw CryptoError("Key is not a P-256 EC key");
    }

    EVP_PKEY* pkey = static_cast<EVP_PKEY*>(private_key.GetNativeHandle());

    // Create signature context
    EVP_MD_CTX_ptr md_ctx(EVP_MD_CTX_new());
    if (!md_ctx) {
        throw CryptoError("Failed to create signature context");
    }

    if (EVP_DigestSignInit(md_ctx.get(), nullptr, EVP_sha256(), nullptr, pkey) != 1) {
        throw CryptoError("Failed to initialize ECDSA signing");
    }

    // Get maximum signature length
    size_t sig_len = 0;
    if (EVP_DigestSign(md_ctx.get(), nullptr, &sig_len, data.data(), data.size()) != 1) {
        throw CryptoError("Failed to get ECDSA signature length");
    }

    // Create signature (DER length varies with leading zero padding)
    std::vector<uint8_t> signature(sig_len);
    if (EVP_DigestSign(md_ctx.get(), signature.data(), &sig_len, data.data(), data.size()) != 1) {
        throw CryptoError("Failed to create ECDSA signature");
    }

    signature.resize(sig_len);
    return signature;
}

bool ECDSA::Verify(
    const PublicKey& public_key,
    const std::vector<uint8_t>& data,
    const std::vector<uint8_t>& der_signature
) {
    EVP_PKEY* pkey = static_cast<EVP_PKEY*>(public_key.GetNativeHandle());

    if (EVP_PKEY_get_base_id(pkey) != EVP_PKEY_EC) {
        throw CryptoError("Key is not an EC public key");
    }

    EVP_MD_CTX_ptr md_ctx(EVP_MD_CTX_new());
    if (!md_ctx) {
        throw CryptoError("Failed to create verification context");
    }

    if (EVP_DigestVerifyInit(md_ctx.get(), nullptr, EVP_sha256(), nullptr, pkey) != 1) {
        throw CryptoError("Failed to initialize verification");
    }

    int result = EVP_DigestVerify(md_ctx.get(), der_signature.data(), der_signature.size(),
                                  data.data(), data.size());

    if (result == 1) {
        return true;
    } else if (result == 0) {
        throw SignatureVerificationError();
    } else {
        throw CryptoError("Signature verification error");
    }
}

bool ECDSA::VerifyP1363(
    const PublicKey& public_key,
    const std::vector<uint8_t>& data,
    const std::vector<uint8_t>& signature
) {
    if (signature.size() != P256_P1363_SIGNATURE_SIZE) {
        throw CryptoError("Invalid P1363 signature size (expected 64 bytes)");
    }

    BIGNUM_ptr r(BN_bin2bn(signature.data(), P256_FIELD_SIZE, nullptr));
    BIGNUM_ptr s(BN_bin2bn(signature.data() + P256_FIELD_SIZE, P256_FIELD_SIZE, nullptr));
    ECDSA_SIG_ptr sig(ECDSA_SIG_new());
    if (!r || !s || !sig) {
        throw CryptoError("Failed to allocate ECDSA signature");
    }

    // ECDSA_SIG_set0 takes ownership of r and s
    if (ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
        throw CryptoError("Failed to set ECDSA signature values");
    }
    r.release();
    s.release();

    unsigned char* der = nullptr;
    int der_len = i2d_ECDSA_SIG(sig.get(), &der);
    if (der_len <= 0) {
        throw CryptoError("Failed to encode ECDSA signature");
    }
    std::vector<uint8_t> der_signature(der, der + der_len);
    OPENSSL_free(der);

    return Verify(public_key, data, der_signature);
}

// ============================================================================
// SHA256 Implementation
// ============================================================================

std::vector<uint8_t> SHA256::Hash(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> hash(SHA256_HASH_SIZE);
    unsigned int hash_len = 0;

    if (EVP_Digest(data.data(), data.size(), hash.data(), &hash_len, EVP_sha256(), nullptr) != 1) {
        throw CryptoError("Failed to compute SHA-256 hash");
    }

    if (hash_len != SHA256_HASH_SIZE) {
        throw CryptoError("Unexpected hash size");
    }

    return hash;
}

std::string SHA256::HashHex(const std::vector<uint8_t>& data) {
    return HexEncode(Hash(data));
}

std::string HexEncode(const std::vector<uint8_t>& data) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (uint8_t byte : data) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

} // namespace crypto
} // namespace attest
