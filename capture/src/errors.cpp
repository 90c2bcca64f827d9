/**
 * @file errors.cpp
 * @brief Error message rendering
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attest/capture/errors.h"

namespace attest {

namespace {

std::string RenderAttestationError(AttestationError::Kind kind, const std::string& detail) {
    std::string message = AttestationError::KindMessage(kind);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

} // namespace

AttestationError::AttestationError(Kind kind, const std::string& detail)
    : std::runtime_error(RenderAttestationError(kind, detail))
    , kind_(kind)
    , detail_(detail)
{}

const char* AttestationError::KindMessage(Kind kind) noexcept {
    switch (kind) {
        case Kind::SigningFailed:        return "Signing failed";
        case Kind::ManifestBuildFailed:  return "Manifest build failed";
        case Kind::CertificateError:     return "Certificate error";
        case Kind::JpegEmbedFailed:      return "JPEG embed failed";
        case Kind::JpegValidationFailed: return "JPEG validation failed: not a valid JPEG";
    }
    return "Attestation failed";
}

SignerError::SignerError(Kind kind)
    : std::runtime_error(KindMessage(kind))
    , kind_(kind)
{}

const char* SignerError::KindMessage(Kind kind) noexcept {
    switch (kind) {
        case Kind::HardwareUnavailable:      return "Hardware unavailable";
        case Kind::KeyNotFound:              return "Key not found";
        case Kind::SignatureOperationFailed: return "Signature operation failed";
        case Kind::CertificateExportFailed:  return "Certificate export failed";
    }
    return "Signer failed";
}

} // namespace attest
