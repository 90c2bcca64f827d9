/**
 * @file limits.h
 * @brief Size limits and fixed protocol constants for libattest
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace attest {
namespace limits {

// ============================================================================
// Signing limits
// ============================================================================

/**
 * @brief Bytes the embedder reserves for the signature block
 *
 * Must stay >= the largest signature the embedder will write, including the
 * COSE envelope and the DER certificate chain it carries:
 * - ES256 P1363 signature: 64 bytes
 * - Leaf certificate: typically 500-1500 bytes
 * - COSE headers and timestamp countersignature: ~6KB worst case
 * Larger certificate chains need a larger reservation.
 */
constexpr size_t SIGNATURE_RESERVE_SIZE = 10240;

/**
 * @brief Smallest DER ECDSA signature: 30 06 02 01 r 02 01 s
 */
constexpr size_t MIN_DER_SIGNATURE_SIZE = 8;

// ============================================================================
// Media constants
// ============================================================================

// JPEG start-of-image marker
constexpr uint8_t JPEG_SOI_0 = 0xFF;
constexpr uint8_t JPEG_SOI_1 = 0xD8;

constexpr const char* JPEG_MEDIA_TYPE = "image/jpeg";

}  // namespace limits
}  // namespace attest
