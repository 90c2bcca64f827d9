/**
 * @file c2pa_embedder.h
 * @brief ManifestEmbedder backed by the c2pa C API
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ATTEST_C2PA_EMBEDDER_H
#define ATTEST_C2PA_EMBEDDER_H

#include "attest/capture/manifest_embedder.h"
#include <memory>
#include <string>

namespace attest {

/**
 * @brief Embeds signed C2PA manifests using the c2pa library
 *
 * The claim signature is produced by the caller's Signer through the
 * c2pa signer callback; no private key is handed to the library. Assets
 * are processed in memory.
 */
class C2paEmbedder : public ManifestEmbedder {
public:
    /**
     * @param tsa_url Timestamp authority URL, empty for none
     */
    explicit C2paEmbedder(const std::string& tsa_url = "");

    /**
     * @throws EmbedderError if c2pa rejects the definition
     */
    std::unique_ptr<Builder> BuildFromJson(const std::string& manifest_json) override;

private:
    std::string tsa_url_;
};

} // namespace attest

#endif // ATTEST_C2PA_EMBEDDER_H
