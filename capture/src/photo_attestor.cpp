/**
 * @file photo_attestor.cpp
 * @brief Capture-to-signed-JPEG attestation pipeline
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attest/capture/photo_attestor.h"
#include "attest/capture/manifest_builder.h"
#include "attest/capture/signer_adapter.h"
#include "attest/common/crypto.h"
#include "attest/common/limits.h"
#include <glog/logging.h>
#include <algorithm>

namespace attest {

namespace {

// Prefix of the input for diagnostics, e.g. "ffd8ffe0"
std::string LeadingBytesHex(const std::vector<uint8_t>& bytes, size_t count) {
    std::vector<uint8_t> head(bytes.begin(), bytes.begin() + std::min(count, bytes.size()));
    return crypto::HexEncode(head);
}

} // namespace

HashResult HashFrameBytes(const std::vector<uint8_t>& frame_bytes) {
    return HashResult{crypto::SHA256::HashHex(frame_bytes)};
}

bool HasJpegMagic(const std::vector<uint8_t>& bytes) {
    return bytes.size() >= 2 &&
           bytes[0] == limits::JPEG_SOI_0 &&
           bytes[1] == limits::JPEG_SOI_1;
}

PhotoAttestor::PhotoAttestor(ManifestEmbedder& embedder)
    : embedder_(embedder)
{}

SignedPhoto PhotoAttestor::BuildAndSignC2pa(
    const std::vector<uint8_t>& jpeg_bytes,
    const CaptureContext& context,
    std::unique_ptr<HardwareSigner> signer
) {
    VLOG(1) << "BuildAndSignC2pa: " << jpeg_bytes.size() << " bytes, head="
            << LeadingBytesHex(jpeg_bytes, 4);

    if (!HasJpegMagic(jpeg_bytes)) {
        LOG(WARNING) << "JPEG validation failed: expected SOI ffd8, got "
                     << LeadingBytesHex(jpeg_bytes, 2);
        throw AttestationError(AttestationError::Kind::JpegValidationFailed);
    }

    SignerAdapter adapter(std::move(signer));

    const std::string asset_hash_hex = crypto::SHA256::HashHex(jpeg_bytes);
    std::string manifest_json = BuildManifestJson(context);

    VLOG(1) << "Manifest definition: " << manifest_json.substr(0, 200);

    std::unique_ptr<ManifestEmbedder::Builder> builder;
    try {
        builder = embedder_.BuildFromJson(manifest_json);
    } catch (const EmbedderError& e) {
        LOG(WARNING) << "Embedder rejected manifest definition: " << e.what();
        throw AttestationError(AttestationError::Kind::ManifestBuildFailed, e.what());
    }
    if (!builder) {
        throw AttestationError(AttestationError::Kind::ManifestBuildFailed,
                               "embedder returned no builder");
    }

    std::vector<uint8_t> signed_jpeg;
    try {
        signed_jpeg = builder->Sign(adapter, limits::JPEG_MEDIA_TYPE, jpeg_bytes);
    } catch (const EmbedderError& e) {
        LOG(WARNING) << "Embedder sign failed: " << e.what();
        if (e.kind() == EmbedderError::Kind::BadParam) {
            throw AttestationError(AttestationError::Kind::SigningFailed, e.what());
        }
        throw AttestationError(AttestationError::Kind::JpegEmbedFailed, e.what());
    }

    LOG(INFO) << "Signed JPEG: " << jpeg_bytes.size() << " bytes -> "
              << signed_jpeg.size() << " bytes";

    SignedPhoto photo;
    photo.signed_jpeg = std::move(signed_jpeg);
    photo.manifest_json = std::move(manifest_json);
    photo.asset_hash_hex = asset_hash_hex;
    return photo;
}

} // namespace attest
