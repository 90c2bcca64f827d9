/**
 * @file manifest_builder.cpp
 * @brief C2PA manifest definition for captured photos
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attest/capture/manifest_builder.h"
#include "attest/common/geo.h"
#include "attest/common/limits.h"
#include "attest/common/version.h"
#include <sstream>

namespace attest {

using json = nlohmann::json;

namespace {

constexpr const char* DIGITAL_CAPTURE_SOURCE_TYPE =
    "http://cv.iptc.org/newscodes/digitalsourcetype/digitalCapture";
constexpr const char* EXIF_NAMESPACE = "http://ns.adobe.com/exif/1.0/";
constexpr const char* EXIF_GPS_VERSION = "2.2.0.0";

json Assertion(const char* label, json data) {
    return json{{"label", label}, {"data", std::move(data)}};
}

json SoftwareAgent(const CaptureContext& context) {
    return json{{"name", context.app_name}, {"version", ATTEST_VERSION_STRING}};
}

json ExifData(const CaptureContext& context) {
    json exif = {
        {"@context", {{"exif", EXIF_NAMESPACE}}},
        {"exif:Make", DeviceManufacturer(context.device_model)},
        {"exif:Model", context.device_model},
        {"exif:DateTimeOriginal", context.captured_at_iso8601}
    };

    if (context.HasCoordinates()) {
        exif["exif:GPSVersionID"] = EXIF_GPS_VERSION;
        exif["exif:GPSLatitude"] = DecimalToExifDms(*context.latitude, true);
        exif["exif:GPSLongitude"] = DecimalToExifDms(*context.longitude, false);
        exif["exif:GPSTimeStamp"] = context.captured_at_iso8601;
    }

    return exif;
}

} // namespace

std::string DeviceManufacturer(const std::string& device_model) {
    std::istringstream tokens(device_model);
    std::string make;
    if (tokens >> make) {
        return make;
    }
    return device_model;
}

json BuildManifestDefinition(const CaptureContext& context) {
    json assertions = json::array();

    assertions.push_back(Assertion(LABEL_ACTIONS, {
        {"actions", json::array({
            {
                {"action", "c2pa.created"},
                {"digitalSourceType", DIGITAL_CAPTURE_SOURCE_TYPE},
                {"softwareAgent", SoftwareAgent(context)}
            }
        })}
    }));

    assertions.push_back(Assertion(LABEL_CREATIVE_WORK, {
        {"@context", "https://schema.org"},
        {"@type", "CreativeWork"},
        {"author", json::array({
            {{"@type", "Organization"}, {"name", context.app_name}}
        })}
    }));

    assertions.push_back(Assertion(LABEL_EXIF, ExifData(context)));

    assertions.push_back(Assertion(LABEL_DEVICE, {
        {"deviceModel", context.device_model},
        {"osVersion", context.os_version},
        {"trustLevel", context.trust_level}
    }));

    assertions.push_back(Assertion(LABEL_CAPTURE_TIME, {
        {"timestamp", context.captured_at_iso8601}
    }));

    if (context.nonce) {
        assertions.push_back(Assertion(LABEL_TRUST, {
            {"trustLevel", context.trust_level},
            {"nonce", *context.nonce}
        }));
    }

    return json{
        {"title", "Attested Photo " + context.captured_at_iso8601},
        {"format", limits::JPEG_MEDIA_TYPE},
        {"claim_generator_info", json::array({SoftwareAgent(context)})},
        {"assertions", std::move(assertions)}
    };
}

std::string BuildManifestJson(const CaptureContext& context) {
    // Invalid UTF-8 in caller strings becomes U+FFFD instead of throwing
    return BuildManifestDefinition(context).dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace attest
