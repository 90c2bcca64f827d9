/**
 * @file software_key_signer.cpp
 * @brief HardwareSigner backed by an in-memory P-256 key
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attest/capture/hardware_signer.h"
#include <glog/logging.h>

namespace attest {

SoftwareKeySigner::SoftwareKeySigner(crypto::PrivateKey key, crypto::Certificate certificate)
    : key_(std::move(key))
    , certificate_(std::move(certificate))
{}

std::unique_ptr<SoftwareKeySigner> SoftwareKeySigner::LoadFromFiles(
    const std::string& key_path,
    const std::string& cert_path
) {
    auto key = crypto::PrivateKey::LoadFromFile(key_path);
    auto cert = crypto::Certificate::LoadFromFile(cert_path);
    LOG(INFO) << "Loaded signing certificate: " << cert.GetSubject();
    return std::make_unique<SoftwareKeySigner>(std::move(key), std::move(cert));
}

std::vector<uint8_t> SoftwareKeySigner::Sign(const std::vector<uint8_t>& data) {
    if (!key_.IsP256()) {
        throw SignerError(SignerError::Kind::KeyNotFound);
    }

    try {
        return crypto::ECDSA::Sign(key_, data);
    } catch (const crypto::CryptoError& e) {
        LOG(WARNING) << "Software signing failed: " << e.what();
        throw SignerError(SignerError::Kind::SignatureOperationFailed);
    }
}

std::vector<uint8_t> SoftwareKeySigner::CertificateDer() {
    if (!certificate_.GetNativeHandle()) {
        throw SignerError(SignerError::Kind::CertificateExportFailed);
    }

    try {
        return certificate_.ToDER();
    } catch (const crypto::CryptoError& e) {
        LOG(WARNING) << "Certificate export failed: " << e.what();
        throw SignerError(SignerError::Kind::CertificateExportFailed);
    }
}

} // namespace attest
