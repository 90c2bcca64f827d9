/**
 * @file errors.h
 * @brief Error taxonomy for the attestation pipeline
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ATTEST_ERRORS_H
#define ATTEST_ERRORS_H

#include <stdexcept>
#include <string>

namespace attest {

/**
 * @brief Failure of BuildAndSignC2pa()
 *
 * The kind identifies the failure. The detail carries the underlying
 * diagnostic text (embedder error rendering) and is not part of the
 * error's identity.
 */
class AttestationError : public std::runtime_error {
public:
    enum class Kind {
        SigningFailed,         ///< Embedder rejected signer-supplied parameters
        ManifestBuildFailed,   ///< Manifest JSON rejected by the embedder
        CertificateError,      ///< Certificate could not be obtained
        JpegEmbedFailed,       ///< Embedder failed for another reason
        JpegValidationFailed   ///< Input is not a JPEG
    };

    explicit AttestationError(Kind kind, const std::string& detail = "");

    Kind kind() const noexcept { return kind_; }

    /**
     * @brief Underlying diagnostic, empty when none was captured
     */
    const std::string& detail() const noexcept { return detail_; }

    /**
     * @brief Fixed short message for a kind (e.g. "Signing failed")
     */
    static const char* KindMessage(Kind kind) noexcept;

private:
    Kind kind_;
    std::string detail_;
};

/**
 * @brief Failure raised by a HardwareSigner implementation
 */
class SignerError : public std::runtime_error {
public:
    enum class Kind {
        HardwareUnavailable,
        KeyNotFound,
        SignatureOperationFailed,
        CertificateExportFailed
    };

    explicit SignerError(Kind kind);

    Kind kind() const noexcept { return kind_; }

    static const char* KindMessage(Kind kind) noexcept;

private:
    Kind kind_;
};

/**
 * @brief Failure reported by a ManifestEmbedder
 *
 * BadParam marks errors caused by parameters the signer supplied
 * (signature, certificate chain); everything else is Other.
 */
class EmbedderError : public std::runtime_error {
public:
    enum class Kind {
        BadParam,
        Other
    };

    EmbedderError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

} // namespace attest

#endif // ATTEST_ERRORS_H
