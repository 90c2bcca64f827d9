/**
 * @file manifest_builder_test.cpp
 * @brief Unit tests for manifest definition construction
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include "attest/capture/manifest_builder.h"
#include "attest/common/version.h"
#include <nlohmann/json.hpp>
#include <cmath>
#include <limits>

using namespace attest;
using json = nlohmann::json;

class ManifestBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ctx_.app_name = "Attested Camera";
        ctx_.device_model = "Samsung Galaxy S24";
        ctx_.os_version = "Android 14";
        ctx_.captured_at_iso8601 = "2025-01-15T10:30:00Z";
        ctx_.trust_level = "hardware-attested";
    }

    static std::vector<std::string> Labels(const json& manifest) {
        std::vector<std::string> labels;
        for (const auto& a : manifest.at("assertions")) {
            labels.push_back(a.at("label").get<std::string>());
        }
        return labels;
    }

    static const json& Find(const json& manifest, const std::string& label) {
        for (const auto& a : manifest.at("assertions")) {
            if (a.at("label") == label) {
                return a.at("data");
            }
        }
        throw std::runtime_error("assertion not found: " + label);
    }

    CaptureContext ctx_;
};

// ============================================================================
// Document Shape
// ============================================================================

TEST_F(ManifestBuilderTest, TopLevelFields) {
    auto manifest = json::parse(BuildManifestJson(ctx_));

    EXPECT_EQ(manifest["title"], "Attested Photo 2025-01-15T10:30:00Z");
    EXPECT_EQ(manifest["format"], "image/jpeg");
    ASSERT_EQ(manifest["claim_generator_info"].size(), 1u);
    EXPECT_EQ(manifest["claim_generator_info"][0]["name"], "Attested Camera");
    EXPECT_EQ(manifest["claim_generator_info"][0]["version"], ATTEST_VERSION_STRING);
}

TEST_F(ManifestBuilderTest, FixedAssertionsInOrder) {
    auto manifest = BuildManifestDefinition(ctx_);

    std::vector<std::string> expected = {
        "c2pa.actions",
        "stds.schema-org.CreativeWork",
        "stds.exif",
        "attestation.device",
        "attestation.capture_time"
    };
    EXPECT_EQ(Labels(manifest), expected);
}

TEST_F(ManifestBuilderTest, ActionsAssertion) {
    auto manifest = BuildManifestDefinition(ctx_);
    const auto& actions = Find(manifest, LABEL_ACTIONS).at("actions");

    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0]["action"], "c2pa.created");
    EXPECT_EQ(actions[0]["digitalSourceType"],
              "http://cv.iptc.org/newscodes/digitalsourcetype/digitalCapture");
    EXPECT_EQ(actions[0]["softwareAgent"]["name"], "Attested Camera");
}

TEST_F(ManifestBuilderTest, CreativeWorkAuthor) {
    auto manifest = BuildManifestDefinition(ctx_);
    const auto& work = Find(manifest, LABEL_CREATIVE_WORK);

    EXPECT_EQ(work["@context"], "https://schema.org");
    EXPECT_EQ(work["@type"], "CreativeWork");
    EXPECT_EQ(work["author"][0]["@type"], "Organization");
    EXPECT_EQ(work["author"][0]["name"], "Attested Camera");
}

TEST_F(ManifestBuilderTest, DeviceAndCaptureTime) {
    auto manifest = BuildManifestDefinition(ctx_);

    const auto& device = Find(manifest, LABEL_DEVICE);
    EXPECT_EQ(device["deviceModel"], "Samsung Galaxy S24");
    EXPECT_EQ(device["osVersion"], "Android 14");
    EXPECT_EQ(device["trustLevel"], "hardware-attested");

    EXPECT_EQ(Find(manifest, LABEL_CAPTURE_TIME)["timestamp"], "2025-01-15T10:30:00Z");
}

TEST_F(ManifestBuilderTest, ExifWithoutCoordinates) {
    auto manifest = BuildManifestDefinition(ctx_);
    const auto& exif = Find(manifest, LABEL_EXIF);

    EXPECT_EQ(exif["@context"]["exif"], "http://ns.adobe.com/exif/1.0/");
    EXPECT_EQ(exif["exif:Make"], "Samsung");
    EXPECT_EQ(exif["exif:Model"], "Samsung Galaxy S24");
    EXPECT_EQ(exif["exif:DateTimeOriginal"], "2025-01-15T10:30:00Z");
    EXPECT_FALSE(exif.contains("exif:GPSLatitude"));
    EXPECT_FALSE(exif.contains("exif:GPSVersionID"));
}

// ============================================================================
// Conditional Content
// ============================================================================

TEST_F(ManifestBuilderTest, CoordinatesAddGpsFields) {
    ctx_.latitude = 39.3517;
    ctx_.longitude = -73.9857;

    auto manifest = BuildManifestDefinition(ctx_);
    const auto& exif = Find(manifest, LABEL_EXIF);

    EXPECT_EQ(exif["exif:GPSVersionID"], "2.2.0.0");
    EXPECT_EQ(exif["exif:GPSLatitude"], "39,21.102N");
    EXPECT_EQ(exif["exif:GPSLongitude"], "73,59.142W");
    EXPECT_EQ(exif["exif:GPSTimeStamp"], "2025-01-15T10:30:00Z");
    EXPECT_EQ(manifest["assertions"].size(), 5u);
}

TEST_F(ManifestBuilderTest, SingleCoordinateAddsNoGps) {
    ctx_.latitude = 39.3517;

    auto manifest = BuildManifestDefinition(ctx_);
    EXPECT_FALSE(Find(manifest, LABEL_EXIF).contains("exif:GPSLatitude"));
}

TEST_F(ManifestBuilderTest, NonFiniteCoordinatesAddNoGps) {
    ctx_.latitude = std::nan("");
    ctx_.longitude = 2.2945;
    auto manifest = BuildManifestDefinition(ctx_);
    EXPECT_FALSE(Find(manifest, LABEL_EXIF).contains("exif:GPSLatitude"));

    ctx_.latitude = 48.8584;
    ctx_.longitude = -std::numeric_limits<double>::infinity();
    manifest = BuildManifestDefinition(ctx_);
    EXPECT_FALSE(Find(manifest, LABEL_EXIF).contains("exif:GPSLongitude"));
    EXPECT_EQ(manifest["assertions"].size(), 5u);
}

TEST_F(ManifestBuilderTest, NonceAddsTrustAssertionLast) {
    ctx_.nonce = std::string("abc123");

    auto manifest = BuildManifestDefinition(ctx_);
    auto labels = Labels(manifest);

    ASSERT_EQ(labels.size(), 6u);
    EXPECT_EQ(labels.back(), "attestation.trust");
    const auto& trust = Find(manifest, LABEL_TRUST);
    EXPECT_EQ(trust["trustLevel"], "hardware-attested");
    EXPECT_EQ(trust["nonce"], "abc123");
}

TEST_F(ManifestBuilderTest, TogglesLeaveOtherAssertionsUnchanged) {
    auto base = BuildManifestDefinition(ctx_);

    CaptureContext with_extras = ctx_;
    with_extras.nonce = std::string("n");
    with_extras.latitude = 1.5;
    with_extras.longitude = 2.5;
    auto extended = BuildManifestDefinition(with_extras);

    for (const char* label : {LABEL_ACTIONS, LABEL_CREATIVE_WORK, LABEL_DEVICE, LABEL_CAPTURE_TIME}) {
        EXPECT_EQ(Find(base, label), Find(extended, label)) << label;
    }
}

TEST_F(ManifestBuilderTest, Deterministic) {
    ctx_.nonce = std::string("nonce");
    ctx_.latitude = 48.8584;
    ctx_.longitude = 2.2945;

    EXPECT_EQ(BuildManifestJson(ctx_), BuildManifestJson(ctx_));
}

TEST_F(ManifestBuilderTest, OutputIsValidJsonWithSpecialCharacters) {
    ctx_.app_name = "Cam \"Pro\"\n\\ \xc3\xa9";

    auto parsed = json::parse(BuildManifestJson(ctx_));
    EXPECT_EQ(parsed["claim_generator_info"][0]["name"], ctx_.app_name);
}

TEST_F(ManifestBuilderTest, InvalidUtf8IsReplacedNotThrown) {
    // Latin-1 encoded "Cafe Phone" with an accented e
    ctx_.device_model = "Caf\xe9 Phone";
    ctx_.nonce = std::string("\xff\xfe");

    std::string out;
    ASSERT_NO_THROW(out = BuildManifestJson(ctx_));
    auto parsed = json::parse(out);

    EXPECT_EQ(Find(parsed, LABEL_DEVICE)["deviceModel"], "Caf\xef\xbf\xbd Phone");
    EXPECT_EQ(Find(parsed, LABEL_EXIF)["exif:Model"], "Caf\xef\xbf\xbd Phone");
    EXPECT_EQ(Find(parsed, LABEL_EXIF)["exif:Make"], "Caf\xef\xbf\xbd");
    EXPECT_EQ(Find(parsed, LABEL_TRUST)["nonce"], "\xef\xbf\xbd\xef\xbf\xbd");
}

// ============================================================================
// Manufacturer Derivation
// ============================================================================

TEST(DeviceManufacturerTest, FirstToken) {
    EXPECT_EQ(DeviceManufacturer("Samsung Galaxy S24"), "Samsung");
    EXPECT_EQ(DeviceManufacturer("Google Pixel 8"), "Google");
}

TEST(DeviceManufacturerTest, SingleWordIsWholeString) {
    EXPECT_EQ(DeviceManufacturer("iPhone15,2"), "iPhone15,2");
}

TEST(DeviceManufacturerTest, EmptyModel) {
    EXPECT_EQ(DeviceManufacturer(""), "");
}
