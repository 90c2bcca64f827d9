/**
 * @file signer_adapter.h
 * @brief Adapts a HardwareSigner to the embedder's Signer contract
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ATTEST_SIGNER_ADAPTER_H
#define ATTEST_SIGNER_ADAPTER_H

#include "attest/capture/hardware_signer.h"
#include "attest/capture/manifest_embedder.h"
#include <memory>
#include <vector>

namespace attest {

/**
 * @brief ES256 Signer over a HardwareSigner
 *
 * The certificate is fetched once at construction and reused for every
 * signature. Hardware DER signatures are converted to P1363 before being
 * handed to the embedder.
 */
class SignerAdapter : public Signer {
public:
    /**
     * @brief Take ownership of @p signer and fetch its certificate
     * @throws AttestationError (CertificateError) if the fetch fails
     */
    explicit SignerAdapter(std::unique_ptr<HardwareSigner> signer);

    SignerAdapter(const SignerAdapter&) = delete;
    SignerAdapter& operator=(const SignerAdapter&) = delete;

    /**
     * @throws EmbedderError (BadParam) on hardware or conversion failure
     */
    std::vector<uint8_t> Sign(const std::vector<uint8_t>& data) override;

    SigningAlgorithm Algorithm() const override;

    /**
     * @brief Single-certificate chain; chain building is left to the caller
     */
    std::vector<std::vector<uint8_t>> CertificateChain() const override;

    size_t ReserveSize() const override;

private:
    std::unique_ptr<HardwareSigner> signer_;
    std::vector<uint8_t> cached_cert_;
};

} // namespace attest

#endif // ATTEST_SIGNER_ADAPTER_H
