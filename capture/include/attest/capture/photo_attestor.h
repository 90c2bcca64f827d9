/**
 * @file photo_attestor.h
 * @brief Capture-to-signed-JPEG attestation pipeline
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ATTEST_PHOTO_ATTESTOR_H
#define ATTEST_PHOTO_ATTESTOR_H

#include "attest/capture/capture_context.h"
#include "attest/capture/errors.h"
#include "attest/capture/hardware_signer.h"
#include "attest/capture/manifest_embedder.h"
#include <cstdint>
#include <memory>
#include <vector>

namespace attest {

/**
 * @brief SHA-256 of a frame, hex encoded
 */
HashResult HashFrameBytes(const std::vector<uint8_t>& frame_bytes);

/**
 * @brief Signs captured JPEGs with an embedded C2PA manifest
 *
 * Example usage:
 * @code
 * C2paEmbedder embedder;
 * PhotoAttestor attestor(embedder);
 *
 * CaptureContext ctx;
 * ctx.app_name = "Attested Camera";
 * ctx.device_model = "Samsung Galaxy S24";
 * ctx.os_version = "Android 14";
 * ctx.captured_at_iso8601 = "2025-01-15T10:30:00Z";
 * ctx.trust_level = "hardware-attested";
 *
 * SignedPhoto photo = attestor.BuildAndSignC2pa(jpeg, ctx, std::move(keystore_signer));
 * @endcode
 *
 * Each call is independent: no state is shared between invocations and
 * the caller's buffers are never modified. The hardware signer may block;
 * callers needing a timeout must run the call on their own worker.
 */
class PhotoAttestor {
public:
    /**
     * @param embedder Embedder used for every call; must outlive the attestor
     */
    explicit PhotoAttestor(ManifestEmbedder& embedder);

    /**
     * @brief Build a manifest for @p context, sign it and embed it in @p jpeg_bytes
     *
     * Steps, each a hard gate:
     * 1. JPEG SOI check (JpegValidationFailed, signer untouched)
     * 2. Certificate fetch (CertificateError)
     * 3. SHA-256 of the original bytes
     * 4. Manifest definition
     * 5. Embedder parses the definition (ManifestBuildFailed)
     * 6. Embedder signs and embeds (SigningFailed for bad signer
     *    parameters, JpegEmbedFailed otherwise)
     *
     * @param jpeg_bytes Unsigned JPEG
     * @param context Capture metadata
     * @param signer Signing capability, consumed by this call
     * @return Signed JPEG, embedded manifest JSON and original asset hash
     * @throws AttestationError on any failure
     */
    SignedPhoto BuildAndSignC2pa(
        const std::vector<uint8_t>& jpeg_bytes,
        const CaptureContext& context,
        std::unique_ptr<HardwareSigner> signer
    );

private:
    ManifestEmbedder& embedder_;
};

/**
 * @brief Check for the JPEG start-of-image marker (FF D8)
 */
bool HasJpegMagic(const std::vector<uint8_t>& bytes);

} // namespace attest

#endif // ATTEST_PHOTO_ATTESTOR_H
