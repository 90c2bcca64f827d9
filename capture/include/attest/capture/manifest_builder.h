/**
 * @file manifest_builder.h
 * @brief C2PA manifest definition for captured photos
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ATTEST_MANIFEST_BUILDER_H
#define ATTEST_MANIFEST_BUILDER_H

#include "attest/capture/capture_context.h"
#include <nlohmann/json.hpp>
#include <string>

namespace attest {

// Assertion labels, in emission order
constexpr const char* LABEL_ACTIONS = "c2pa.actions";
constexpr const char* LABEL_CREATIVE_WORK = "stds.schema-org.CreativeWork";
constexpr const char* LABEL_EXIF = "stds.exif";
constexpr const char* LABEL_DEVICE = "attestation.device";
constexpr const char* LABEL_CAPTURE_TIME = "attestation.capture_time";
constexpr const char* LABEL_TRUST = "attestation.trust";

/**
 * @brief Manufacturer derived from a device model string
 *
 * First whitespace-delimited token ("Samsung" from "Samsung Galaxy S24"),
 * or the whole string when it has no such token.
 */
std::string DeviceManufacturer(const std::string& device_model);

/**
 * @brief Build the manifest definition for a capture
 *
 * Always emits, in order: c2pa.actions, stds.schema-org.CreativeWork,
 * stds.exif, attestation.device, attestation.capture_time. Appends
 * attestation.trust when a nonce is present. EXIF GPS fields are added
 * when both coordinates are present.
 *
 * Pure function: the same context always yields the same document.
 */
nlohmann::json BuildManifestDefinition(const CaptureContext& context);

/**
 * @brief Compact JSON serialization of BuildManifestDefinition()
 */
std::string BuildManifestJson(const CaptureContext& context);

} // namespace attest

#endif // ATTEST_MANIFEST_BUILDER_H
