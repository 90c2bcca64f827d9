/**
 * @file attest_tool.cpp
 * @brief Command line front end for libattest
 *
 * Workflow without an embedding library:
 * 1. attest-tool keygen --key device_key.pem --cert device_cert.pem
 * 2. attest-tool hash --input photo.jpg
 * 3. attest-tool manifest --app ... > manifest.json
 * 4. attest-tool placeholder --input photo.jpg --signature ... --metadata ...
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attest/capture/manifest_builder.h"
#include "attest/capture/photo_attestor.h"
#include "attest/capture/placeholder.h"
#include "attest/common/crypto.h"
#include "attest/common/version.h"
#include <glog/logging.h>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
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

void WriteFile(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to create file: " + path);
    }
    file << content;
}

void PrintUsageHash(const char* program_name) {
    std::cout << "Usage: " << program_name << " hash --input FILE\n"
              << "\n"
              << "Print the SHA-256 of a captured frame as lowercase hex.\n"
              << std::endl;
}

void PrintUsageManifest(const char* program_name) {
    std::cout << "Usage: " << program_name << " manifest [OPTIONS]\n"
              << "\n"
              << "Print the C2PA manifest definition for a capture.\n"
              << "\n"
              << "Required:\n"
              << "  --app NAME            Capturing application name\n"
              << "  --model MODEL         Device model (\"Samsung Galaxy S24\")\n"
              << "  --os VERSION          OS version (\"Android 14\")\n"
              << "  --time ISO8601        Capture timestamp\n"
              << "  --trust LEVEL         Trust level (\"hardware-attested\")\n"
              << "\n"
              << "Optional:\n"
              << "  --nonce N             Verifier nonce, adds the trust assertion\n"
              << "  --lat DEG --lon DEG   Capture location in decimal degrees\n"
              << "\n"
              << "Example:\n"
              << "  " << program_name << " manifest --app \"Attested Camera\" \\\n"
              << "    --model \"Google Pixel 8\" --os \"Android 14\" \\\n"
              << "    --time 2025-01-15T10:30:00Z --trust hardware-attested \\\n"
              << "    --lat 39.3517 --lon -73.9857\n"
              << std::endl;
}

void PrintUsagePlaceholder(const char* program_name) {
    std::cout << "Usage: " << program_name << " placeholder [OPTIONS]\n"
              << "\n"
              << "Wrap an externally produced signature in a placeholder manifest.\n"
              << "The JPEG is not modified.\n"
              << "\n"
              << "Required:\n"
              << "  --input FILE          JPEG file\n"
              << "  --signature B64       Base64 signature over the JPEG\n"
              << "  --metadata JSON       Metadata JSON (replaced by {} if invalid)\n"
              << "\n"
              << "Optional:\n"
              << "  --output FILE         Write manifest to FILE instead of stdout\n"
              << std::endl;
}

void PrintUsageKeygen(const char* program_name) {
    std::cout << "Usage: " << program_name << " keygen [OPTIONS]\n"
              << "\n"
              << "Generate a P-256 signing key and a self-signed end-entity\n"
              << "certificate for software signing.\n"
              << "\n"
              << "Required:\n"
              << "  --key FILE            Output private key (PEM)\n"
              << "  --cert FILE           Output certificate (PEM)\n"
              << "\n"
              << "Optional:\n"
              << "  --subject CN          Certificate common name (default: libattest software signer)\n"
              << "  --days N              Validity in days (default: 365)\n"
              << std::endl;
}

int CommandHash(int argc, char* argv[]) {
    std::string input_file;

    for (int i = 2; i < argc; i++) {
        if (strcmp(argv[i], "--input") == 0 && i + 1 < argc) {
            input_file = argv[++i];
        } else {
            LOG(ERROR) << "Unknown argument: " << argv[i];
            PrintUsageHash(argv[0]);
            return 1;
        }
    }

    if (input_file.empty()) {
        LOG(ERROR) << "Missing required arguments";
        PrintUsageHash(argv[0]);
        return 1;
    }

    try {
        auto frame = ReadFile(input_file);
        LOG(INFO) << "Hashing " << input_file << " (" << frame.size() << " bytes)";
        std::cout << attest::HashFrameBytes(frame).sha256_hex << std::endl;
        return 0;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Error: " << e.what();
        return 1;
    }
}

int CommandManifest(int argc, char* argv[]) {
    attest::CaptureContext ctx;
    std::string lat;
    std::string lon;

    for (int i = 2; i < argc; i++) {
        if (strcmp(argv[i], "--app") == 0 && i + 1 < argc) {
            ctx.app_name = argv[++i];
        } else if (strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            ctx.device_model = argv[++i];
        } else if (strcmp(argv[i], "--os") == 0 && i + 1 < argc) {
            ctx.os_version = argv[++i];
        } else if (strcmp(argv[i], "--time") == 0 && i + 1 < argc) {
            ctx.captured_at_iso8601 = argv[++i];
        } else if (strcmp(argv[i], "--trust") == 0 && i + 1 < argc) {
            ctx.trust_level = argv[++i];
        } else if (strcmp(argv[i], "--nonce") == 0 && i + 1 < argc) {
            ctx.nonce = std::string(argv[++i]);
        } else if (strcmp(argv[i], "--lat") == 0 && i + 1 < argc) {
            lat = argv[++i];
        } else if (strcmp(argv[i], "--lon") == 0 && i + 1 < argc) {
            lon = argv[++i];
        } else {
            LOG(ERROR) << "Unknown argument: " << argv[i];
            PrintUsageManifest(argv[0]);
            return 1;
        }
    }

    if (ctx.app_name.empty() || ctx.device_model.empty() || ctx.os_version.empty() ||
        ctx.captured_at_iso8601.empty() || ctx.trust_level.empty()) {
        LOG(ERROR) << "Missing required arguments";
        PrintUsageManifest(argv[0]);
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
        std::cout << attest::BuildManifestDefinition(ctx).dump(
            2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        return 0;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Error: " << e.what();
        return 1;
    }
}

int CommandPlaceholder(int argc, char* argv[]) {
    std::string input_file;
    std::string signature;
    std::string metadata;
    std::string output_file;
    bool have_metadata = false;

    for (int i = 2; i < argc; i++) {
        if (strcmp(argv[i], "--input") == 0 && i + 1 < argc) {
            input_file = argv[++i];
        } else if (strcmp(argv[i], "--signature") == 0 && i + 1 < argc) {
            signature = argv[++i];
        } else if (strcmp(argv[i], "--metadata") == 0 && i + 1 < argc) {
            metadata = argv[++i];
            have_metadata = true;
        } else if (strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
            output_file = argv[++i];
        } else {
            LOG(ERROR) << "Unknown argument: " << argv[i];
            PrintUsagePlaceholder(argv[0]);
            return 1;
        }
    }

    if (input_file.empty() || signature.empty() || !have_metadata) {
        LOG(ERROR) << "Missing required arguments";
        PrintUsagePlaceholder(argv[0]);
        return 1;
    }

    try {
        auto jpg = ReadFile(input_file);
        auto artifact = attest::BuildC2paPlaceholder(jpg, signature, metadata);

        if (output_file.empty()) {
            std::cout << artifact.manifest_json << std::endl;
        } else {
            WriteFile(output_file, artifact.manifest_json);
            LOG(INFO) << "Placeholder manifest written to: " << output_file;
        }
        return 0;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Error: " << e.what();
        return 1;
    }
}

int CommandKeygen(int argc, char* argv[]) {
    std::string key_file;
    std::string cert_file;
    std::string subject = "libattest software signer";
    int validity_days = 365;

    for (int i = 2; i < argc; i++) {
        if (strcmp(argv[i], "--key") == 0 && i + 1 < argc) {
            key_file = argv[++i];
        } else if (strcmp(argv[i], "--cert") == 0 && i + 1 < argc) {
            cert_file = argv[++i];
        } else if (strcmp(argv[i], "--subject") == 0 && i + 1 < argc) {
            subject = argv[++i];
        } else if (strcmp(argv[i], "--days") == 0 && i + 1 < argc) {
            validity_days = std::atoi(argv[++i]);
        } else {
            LOG(ERROR) << "Unknown argument: " << argv[i];
            PrintUsageKeygen(argv[0]);
            return 1;
        }
    }

    if (key_file.empty() || cert_file.empty()) {
        LOG(ERROR) << "Missing required arguments";
        PrintUsageKeygen(argv[0]);
        return 1;
    }

    if (validity_days <= 0) {
        LOG(ERROR) << "Invalid validity period: " << validity_days;
        return 1;
    }

    try {
        LOG(INFO) << "Generating P-256 signing key";
        auto key = attest::crypto::PrivateKey::Generate();
        auto pubkey = attest::crypto::PublicKey::FromPrivateKey(key);
        auto cert = attest::crypto::CreateEndEntityCertificate(key, pubkey, subject, validity_days);

        WriteFile(key_file, key.ToPEM());
        WriteFile(cert_file, cert.ToPEM());

        LOG(INFO) << "Private key written to: " << key_file;
        LOG(INFO) << "Certificate written to: " << cert_file << " (" << cert.GetSubject() << ")";
        return 0;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Error: " << e.what();
        return 1;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1;

    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <command> [OPTIONS]\n"
                  << "\n"
                  << "Commands:\n"
                  << "  hash         Print SHA-256 of a frame\n"
                  << "  manifest     Print the manifest definition for a capture\n"
                  << "  placeholder  Build a placeholder manifest for an external signature\n"
                  << "  keygen       Generate a software signing key and certificate\n"
                  << "  version      Print the library version\n"
                  << "\n"
                  << "Use '" << argv[0] << " <command> --help' for more information\n"
                  << std::endl;
        return 1;
    }

    std::string command = argv[1];
    bool help = argc > 2 && strcmp(argv[2], "--help") == 0;

    if (command == "hash") {
        if (help) {
            PrintUsageHash(argv[0]);
            return 0;
        }
        return CommandHash(argc, argv);
    } else if (command == "manifest") {
        if (help) {
            PrintUsageManifest(argv[0]);
            return 0;
        }
        return CommandManifest(argc, argv);
    } else if (command == "placeholder") {
        if (help) {
            PrintUsagePlaceholder(argv[0]);
            return 0;
        }
        return CommandPlaceholder(argc, argv);
    } else if (command == "keygen") {
        if (help) {
            PrintUsageKeygen(argv[0]);
            return 0;
        }
        return CommandKeygen(argc, argv);
    } else if (command == "version") {
        std::cout << ATTEST_VERSION_STRING << std::endl;
        return 0;
    } else {
        LOG(ERROR) << "Unknown command: " << command;
        return 1;
    }
}
