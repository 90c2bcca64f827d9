/**
 * @file attest_sign.cpp
 * @brief Sign a JPEG with an embedded C2PA manifest using a software key
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attest/c2pa/c2pa_embedder.h"
#include "attest/capture/hardware_signer.h"
#include "attest/capture/photo_attestor.h"
#include <glog/logging.h>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <iterator>
#include <string>
#include <vector>

namespace {

std::vector<uint8_t> ReadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    return std::vector<uint8_t>(
        std::istreambuf_iterator<char>(file),
        std::istreambuf_iterator<char>()
    );
}

void WriteFile(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to create file: " + path);
    }
    file.write(reinterpret_cast<const char*>(data.data()), data.size());
}

std::string CurrentTimeIso8601() {
    std::time_t now = std::time(nullptr);
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buf;
}

void PrintUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Embed a signed C2PA manifest into a JPEG.\n"
              << "\n"
              << "Required:\n"
              << "  --input FILE          Unsigned JPEG\n"
              << "  --output FILE         Signed JPEG\n"
              << "  --key FILE            P-256 private key (PEM)\n"
              << "  --cert FILE           Signing certificate (PEM)\n"
              << "\n"
              << "Optional:\n"
              << "  --app NAME            Application name (default: libattest)\n"
              << "  --model MODEL         Device model (default: unknown)\n"
              << "  --os VERSION          OS version (default: unknown)\n"
              << "  --time ISO8601        Capture time (default: now, UTC)\n"
              << "  --trust LEVEL         Trust level (default: software)\n"
              << "  --nonce N             Verifier nonce\n"
              << "  --lat DEG --lon DEG   Capture location\n"
              << "  --tsa URL             Timestamp authority\n"
              << "  --manifest FILE       Also write the manifest definition\n"
              << "  --help                Show this help message\n"
              << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1;

    std::string input_file;
    std::string output_file;
    std::string key_file;
    std::string cert_file;
    std::string manifest_file;
    std::string tsa_url;
    std::string lat;
    std::string lon;

    attest::CaptureContext ctx;
    ctx.app_name = "libattest";
    ctx.device_model = "unknown";
    ctx.os_version = "unknown";
    ctx.trust_level = "software";

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            PrintUsage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "--input") == 0 && i + 1 < argc) {
            input_file = argv[++i];
        } else if (std::strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
            output_file = argv[++i];
        } else if (std::strcmp(argv[i], "--key") == 0 && i + 1 < argc) {
            key_file = argv[++i];
        } else if (std::strcmp(argv[i], "--cert") == 0 && i + 1 < argc) {
            cert_file = argv[++i];
        } else if (std::strcmp(argv[i], "--app") == 0 && i + 1 < argc) {
            ctx.app_name = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            ctx.device_model = argv[++i];
        } else if (std::strcmp(argv[i], "--os") == 0 && i + 1 < argc) {
            ctx.os_version = argv[++i];
        } else if (std::strcmp(argv[i], "--time") == 0 && i + 1 < argc) {
            ctx.captured_at_iso8601 = argv[++i];
        } else if (std::strcmp(argv[i], "--trust") == 0 && i + 1 < argc) {
            ctx.trust_level = argv[++i];
        } else if (std::strcmp(argv[i], "--nonce") == 0 && i + 1 < argc) {
            ctx.nonce = std::string(argv[++i]);
        } else if (std::strcmp(argv[i], "--lat") == 0 && i + 1 < argc) {
            lat = argv[++i];
        } else if (std::strcmp(argv[i], "--lon") == 0 && i + 1 < argc) {
            lon = argv[++i];
        } else if (std::strcmp(argv[i], "--tsa") == 0 && i + 1 < argc) {
            tsa_url = argv[++i];
        } else if (std::strcmp(argv[i], "--manifest") == 0 && i + 1 < argc) {
            manifest_file = argv[++i];
        } else {
            LOG(ERROR) << "Unknown option: " << argv[i];
            PrintUsage(argv[0]);
            return 1;
        }
    }

    if (input_file.empty() || output_file.empty() || key_file.empty() || cert_file.empty()) {
        LOG(ERROR) << "Missing required arguments";
        PrintUsage(argv[0]);
        return 1;
    }

    if (lat.empty() != lon.empty()) {
        LOG(ERROR) << "--lat and --lon must be given together";
        return 1;
    }

    try {
        if (!lat.empty()) {
            ctx.latitude = std::stod(lat);
            ctx.longitude = std::stod(lon);
            if (!ctx.HasCoordinates()) {
                LOG(ERROR) << "--lat and --lon must be finite numbers";
                return 1;
            }
        }
        if (ctx.captured_at_iso8601.empty()) {
            ctx.captured_at_iso8601 = CurrentTimeIso8601();
        }

        auto jpeg = ReadFile(input_file);
        LOG(INFO) << "Loaded " << input_file << " (" << jpeg.size() << " bytes)";

        auto signer = attest::SoftwareKeySigner::LoadFromFiles(key_file, cert_file);

        attest::C2paEmbedder embedder(tsa_url);
        attest::PhotoAttestor attestor(embedder);
        auto photo = attestor.BuildAndSignC2pa(jpeg, ctx, std::move(signer));

        WriteFile(output_file, photo.signed_jpeg);
        LOG(INFO) << "Signed JPEG written to: " << output_file;
        LOG(INFO) << "Original SHA-256: " << photo.asset_hash_hex;

        if (!manifest_file.empty()) {
            std::ofstream out(manifest_file);
            out << photo.manifest_json;
            LOG(INFO) << "Manifest definition written to: " << manifest_file;
        }
        return 0;

    } catch (const attest::AttestationError& e) {
        LOG(ERROR) << "Attestation failed: " << e.what();
        return 2;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Fatal error: " << e.what();
        return 1;
    }
}
