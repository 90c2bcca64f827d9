/**
 * @file hardware_signer.h
 * @brief Caller-supplied signing capability
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ATTEST_HARDWARE_SIGNER_H
#define ATTEST_HARDWARE_SIGNER_H

#include "attest/capture/errors.h"
#include "attest/common/crypto.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace attest {

/**
 * @brief Signing key held outside the library (secure enclave, keystore)
 *
 * Implementations may block on the underlying hardware. The library never
 * sees key material, only signatures and the DER certificate.
 */
class HardwareSigner {
public:
    virtual ~HardwareSigner() = default;

    /**
     * @brief Sign data with ECDSA P-256 / SHA-256
     * @param data Bytes to sign (hashed by the signer)
     * @return DER-encoded ECDSA signature
     * @throws SignerError on failure
     */
    virtual std::vector<uint8_t> Sign(const std::vector<uint8_t>& data) = 0;

    /**
     * @brief DER-encoded signing certificate
     * @throws SignerError on failure
     */
    virtual std::vector<uint8_t> CertificateDer() = 0;
};

/**
 * @brief HardwareSigner backed by a software P-256 key
 *
 * Stand-in for secure hardware on desktop builds and in tests.
 */
class SoftwareKeySigner : public HardwareSigner {
public:
    SoftwareKeySigner(crypto::PrivateKey key, crypto::Certificate certificate);

    /**
     * @brief Load key and certificate from PEM files
     * @throws crypto::CryptoError if either file cannot be parsed
     */
    static std::unique_ptr<SoftwareKeySigner> LoadFromFiles(
        const std::string& key_path,
        const std::string& cert_path
    );

    std::vector<uint8_t> Sign(const std::vector<uint8_t>& data) override;
    std::vector<uint8_t> CertificateDer() override;

private:
    crypto::PrivateKey key_;
    crypto::Certificate certificate_;
};

} // namespace attest

#endif // ATTEST_HARDWARE_SIGNER_H
