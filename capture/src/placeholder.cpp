/**
 * @file placeholder.cpp
 * @brief Unsigned placeholder manifest for externally signed captures
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attest/capture/placeholder.h"
#include "attest/common/crypto.h"
#include <glog/logging.h>
#include <nlohmann/json.hpp>

namespace attest {

using json = nlohmann::json;

SignedArtifact BuildC2paPlaceholder(
    const std::vector<uint8_t>& jpg_bytes,
    const std::string& signature_base64,
    const std::string& metadata_json
) {
    json metadata = json::parse(metadata_json, nullptr, false);
    if (metadata.is_discarded()) {
        LOG(WARNING) << "Placeholder metadata is not valid JSON, using {}";
        metadata = json::object();
    }

    json manifest = {
        {"type", "c2pa-placeholder"},
        {"alg", "ECDSA_P256_SHA256"},
        {"sha256", crypto::SHA256::HashHex(jpg_bytes)},
        {"signature", signature_base64},
        {"metadata", metadata}
    };

    SignedArtifact artifact;
    artifact.jpg_bytes = jpg_bytes;
    artifact.manifest_json = manifest.dump(-1, ' ', false, json::error_handler_t::replace);
    return artifact;
}

} // namespace attest
