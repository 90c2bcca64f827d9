/**
 * @file placeholder.h
 * @brief Unsigned placeholder manifest for externally signed captures
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ATTEST_PLACEHOLDER_H
#define ATTEST_PLACEHOLDER_H

#include "attest/capture/capture_context.h"
#include <cstdint>
#include <string>
#include <vector>

namespace attest {

/**
 * @brief Wrap an externally produced signature in a flat placeholder manifest
 *
 * The JPEG is returned unchanged; nothing is embedded. The manifest has the
 * shape:
 * @code
 * {"alg":"ECDSA_P256_SHA256","metadata":{...},"sha256":"<hex>",
 *  "signature":"<base64>","type":"c2pa-placeholder"}
 * @endcode
 *
 * @param jpg_bytes JPEG bytes (not validated)
 * @param signature_base64 Signature over the JPEG, passed through verbatim
 * @param metadata_json Arbitrary JSON; replaced by {} when it does not parse
 */
SignedArtifact BuildC2paPlaceholder(
    const std::vector<uint8_t>& jpg_bytes,
    const std::string& signature_base64,
    const std::string& metadata_json
);

} // namespace attest

#endif // ATTEST_PLACEHOLDER_H
