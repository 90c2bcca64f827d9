/**
 * @file capture_context.h
 * @brief Capture metadata and attestation results
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ATTEST_CAPTURE_CONTEXT_H
#define ATTEST_CAPTURE_CONTEXT_H

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace attest {

/**
 * @brief Metadata describing how and where a photo was captured
 *
 * Latitude and longitude are decimal degrees. GPS fields are only emitted
 * when both are present and finite; ranges are not validated.
 */
struct CaptureContext {
    std::string app_name;             ///< Capturing application ("Attested Camera")
    std::string device_model;         ///< "Samsung Galaxy S24"
    std::string os_version;           ///< "Android 14"
    std::string captured_at_iso8601;  ///< "2025-01-15T10:30:00Z"
    std::string trust_level;          ///< "hardware-attested", "software", ...
    std::optional<std::string> nonce; ///< Anti-replay token from the verifier
    std::optional<double> latitude;
    std::optional<double> longitude;

    bool HasCoordinates() const {
        return latitude.has_value() && longitude.has_value() &&
               std::isfinite(*latitude) && std::isfinite(*longitude);
    }
};

/**
 * @brief Result of BuildAndSignC2pa()
 */
struct SignedPhoto {
    std::vector<uint8_t> signed_jpeg;  ///< JPEG with embedded signed manifest
    std::string manifest_json;         ///< Manifest definition that was embedded
    std::string asset_hash_hex;        ///< SHA-256 of the original (unsigned) JPEG
};

/**
 * @brief Result of HashFrameBytes()
 */
struct HashResult {
    std::string sha256_hex;
};

/**
 * @brief Result of the legacy BuildC2paPlaceholder()
 */
struct SignedArtifact {
    std::vector<uint8_t> jpg_bytes;
    std::string manifest_json;
};

} // namespace attest

#endif // ATTEST_CAPTURE_CONTEXT_H
