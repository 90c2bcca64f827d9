/**
 * @file manifest_embedder.h
 * @brief Seam to the library that embeds signed manifests into media
 *
 * The embedder owns the container format (JUMBF boxes, hash exclusions,
 * COSE claim signature). libattest only supplies the manifest definition
 * and a Signer.
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ATTEST_MANIFEST_EMBEDDER_H
#define ATTEST_MANIFEST_EMBEDDER_H

#include "attest/capture/errors.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace attest {

/**
 * @brief Claim signature algorithms
 */
enum class SigningAlgorithm {
    Es256  // ECDSA P-256 with SHA-256, P1363 signature encoding
};

/**
 * @brief Algorithm identifier as used in manifest tooling ("es256")
 */
const char* SigningAlgorithmName(SigningAlgorithm alg) noexcept;

/**
 * @brief Signing contract the embedder calls back into
 */
class Signer {
public:
    virtual ~Signer() = default;

    /**
     * @brief Sign the claim bytes
     * @return Signature in the algorithm's wire encoding
     * @throws EmbedderError on failure
     */
    virtual std::vector<uint8_t> Sign(const std::vector<uint8_t>& data) = 0;

    virtual SigningAlgorithm Algorithm() const = 0;

    /**
     * @brief DER certificates, leaf first
     */
    virtual std::vector<std::vector<uint8_t>> CertificateChain() const = 0;

    /**
     * @brief Upper bound of bytes to reserve for the signature block
     */
    virtual size_t ReserveSize() const = 0;
};

/**
 * @brief Builds and embeds signed manifests
 */
class ManifestEmbedder {
public:
    /**
     * @brief Manifest under construction
     */
    class Builder {
    public:
        virtual ~Builder() = default;

        /**
         * @brief Sign the manifest and embed it into a copy of @p source
         * @param signer Claim signer
         * @param media_type MIME type of @p source ("image/jpeg")
         * @param source Unsigned asset bytes
         * @return Asset bytes with the signed manifest embedded
         * @throws EmbedderError on failure
         */
        virtual std::vector<uint8_t> Sign(
            Signer& signer,
            const std::string& media_type,
            const std::vector<uint8_t>& source
        ) = 0;
    };

    virtual ~ManifestEmbedder() = default;

    /**
     * @brief Parse and validate a manifest definition
     * @throws EmbedderError if the definition is rejected
     */
    virtual std::unique_ptr<Builder> BuildFromJson(const std::string& manifest_json) = 0;
};

} // namespace attest

#endif // ATTEST_MANIFEST_EMBEDDER_H
