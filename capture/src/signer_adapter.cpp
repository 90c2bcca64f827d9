/**
 * @file signer_adapter.cpp
 * @brief Adapts a HardwareSigner to the embedder's Signer contract
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attest/capture/signer_adapter.h"
#include "attest/common/limits.h"
#include "attest/common/signature_codec.h"
#include <glog/logging.h>

namespace attest {

const char* SigningAlgorithmName(SigningAlgorithm alg) noexcept {
    switch (alg) {
        case SigningAlgorithm::Es256: return "es256";
    }
    return "unknown";
}

SignerAdapter::SignerAdapter(std::unique_ptr<HardwareSigner> signer)
    : signer_(std::move(signer))
{
    if (!signer_) {
        throw AttestationError(AttestationError::Kind::CertificateError, "no signer supplied");
    }

    try {
        cached_cert_ = signer_->CertificateDer();
    } catch (const std::exception& e) {
        LOG(WARNING) << "Certificate fetch failed: " << e.what();
        throw AttestationError(AttestationError::Kind::CertificateError, e.what());
    }

    if (cached_cert_.empty()) {
        throw AttestationError(AttestationError::Kind::CertificateError, "empty certificate");
    }

    VLOG(1) << "Cached signing certificate (" << cached_cert_.size() << " bytes)";
}

std::vector<uint8_t> SignerAdapter::Sign(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> der_signature;
    try {
        der_signature = signer_->Sign(data);
    } catch (const std::exception& e) {
        throw EmbedderError(EmbedderError::Kind::BadParam,
                            std::string("Hardware signer error: ") + e.what());
    }

    try {
        return crypto::DerToP1363(der_signature, crypto::P256_FIELD_SIZE);
    } catch (const crypto::SignatureCodecError& e) {
        throw EmbedderError(EmbedderError::Kind::BadParam,
                            std::string("DER to P1363 conversion error: ") + e.what());
    }
}

SigningAlgorithm SignerAdapter::Algorithm() const {
    return SigningAlgorithm::Es256;
}

std::vector<std::vector<uint8_t>> SignerAdapter::CertificateChain() const {
    return {cached_cert_};
}

size_t SignerAdapter::ReserveSize() const {
    return limits::SIGNATURE_RESERVE_SIZE;
}

} // namespace attest
