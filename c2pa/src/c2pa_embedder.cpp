/**
 * @file c2pa_embedder.cpp
 * @brief ManifestEmbedder backed by the c2pa C API
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attest/c2pa/c2pa_embedder.h"
#include "attest/common/crypto.h"
#include <c2pa.h>
#include <glog/logging.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <optional>

namespace attest {

namespace {

struct C2paBuilderDeleter {
    void operator()(C2paBuilder* b) const { c2pa_free(b); }
};

struct C2paSignerDeleter {
    void operator()(C2paSigner* s) const { c2pa_free(s); }
};

struct C2paStreamDeleter {
    void operator()(C2paStream* s) const { c2pa_release_stream(s); }
};

using C2paBuilderPtr = std::unique_ptr<C2paBuilder, C2paBuilderDeleter>;
using C2paSignerPtr = std::unique_ptr<C2paSigner, C2paSignerDeleter>;
using C2paStreamPtr = std::unique_ptr<C2paStream, C2paStreamDeleter>;

// Takes ownership of the error string c2pa reports for the last failure
std::string TakeC2paError() {
    auto* err = c2pa_error();
    std::string message = err ? std::string(err) : std::string("unknown c2pa error");
    c2pa_free(err);
    return message;
}

EmbedderError ClassifyC2paError(const std::string& message) {
    if (message.rfind("BadParam", 0) == 0) {
        return EmbedderError(EmbedderError::Kind::BadParam, message);
    }
    return EmbedderError(EmbedderError::Kind::Other, message);
}

intptr_t StreamFailure(int err) {
    errno = err;
    return -1;
}

/**
 * @brief Seekable in-memory byte stream for c2pa_create_stream
 */
struct MemoryStream {
    std::vector<uint8_t> data;
    size_t pos = 0;

    static MemoryStream* From(StreamContext* context) {
        return reinterpret_cast<MemoryStream*>(context);
    }

    static intptr_t Read(StreamContext* context, uint8_t* buffer, intptr_t size) {
        auto* s = From(context);
        if (!s || !buffer || size < 0) {
            return StreamFailure(EINVAL);
        }
        size_t n = std::min(static_cast<size_t>(size), s->data.size() - std::min(s->pos, s->data.size()));
        if (n > 0) {
            std::memcpy(buffer, s->data.data() + s->pos, n);
            s->pos += n;
        }
        return static_cast<intptr_t>(n);
    }

    static intptr_t Seek(StreamContext* context, intptr_t offset, C2paSeekMode whence) {
        auto* s = From(context);
        if (!s) {
            return StreamFailure(EINVAL);
        }
        intptr_t base = 0;
        switch (whence) {
            case C2paSeekMode::Start: base = 0; break;
            case C2paSeekMode::Current: base = static_cast<intptr_t>(s->pos); break;
            case C2paSeekMode::End: base = static_cast<intptr_t>(s->data.size()); break;
            default: return StreamFailure(EINVAL);
        }
        intptr_t target = base + offset;
        if (target < 0) {
            return StreamFailure(EINVAL);
        }
        s->pos = static_cast<size_t>(target);
        return target;
    }

    static intptr_t Write(StreamContext* context, const uint8_t* buffer, intptr_t size) {
        auto* s = From(context);
        if (!s || !buffer || size < 0) {
            return StreamFailure(EINVAL);
        }
        size_t n = static_cast<size_t>(size);
        if (s->pos + n > s->data.size()) {
            s->data.resize(s->pos + n);
        }
        std::memcpy(s->data.data() + s->pos, buffer, n);
        s->pos += n;
        return size;
    }

    static intptr_t Flush(StreamContext*) {
        return 0;
    }

    C2paStreamPtr Open() {
        C2paStream* stream = c2pa_create_stream(
            reinterpret_cast<StreamContext*>(this), &Read, &Seek, &Write, &Flush);
        if (!stream) {
            throw EmbedderError(EmbedderError::Kind::Other, "Failed to create stream: " + TakeC2paError());
        }
        return C2paStreamPtr(stream);
    }
};

/**
 * @brief State shared with the c2pa signing callback
 *
 * Exceptions cannot cross the C boundary, so a failure from the Signer is
 * parked here and rethrown once c2pa_builder_sign returns.
 */
struct SigningContext {
    Signer& signer;
    std::optional<EmbedderError> failure;
};

intptr_t SignCallback(const void* context, const unsigned char* data, uintptr_t len,
                      unsigned char* signature, uintptr_t sig_max_len) {
    auto* ctx = static_cast<SigningContext*>(const_cast<void*>(context));
    if (!ctx || !data || !signature) {
        return StreamFailure(EINVAL);
    }

    try {
        std::vector<uint8_t> claim(data, data + len);
        std::vector<uint8_t> sig = ctx->signer.Sign(claim);
        if (sig.size() > sig_max_len) {
            ctx->failure = EmbedderError(EmbedderError::Kind::BadParam,
                                         "signature exceeds reserved space");
            return StreamFailure(ENOBUFS);
        }
        std::copy(sig.begin(), sig.end(), signature);
        return static_cast<intptr_t>(sig.size());
    } catch (const EmbedderError& e) {
        ctx->failure = e;
    } catch (const std::exception& e) {
        ctx->failure = EmbedderError(EmbedderError::Kind::Other, e.what());
    }
    LOG(WARNING) << "Claim signing failed: " << ctx->failure->what();
    return StreamFailure(EIO);
}

C2paSigningAlg ToC2paAlg(SigningAlgorithm alg) {
    switch (alg) {
        case SigningAlgorithm::Es256: return C2paSigningAlg::Es256;
    }
    throw EmbedderError(EmbedderError::Kind::BadParam,
                        std::string("unsupported signing algorithm: ") + SigningAlgorithmName(alg));
}

class C2paBuilderImpl : public ManifestEmbedder::Builder {
public:
    C2paBuilderImpl(C2paBuilderPtr builder, const std::string& tsa_url)
        : builder_(std::move(builder)), tsa_url_(tsa_url) {}

    std::vector<uint8_t> Sign(
        Signer& signer,
        const std::string& media_type,
        const std::vector<uint8_t>& source
    ) override {
        std::string certs_pem;
        try {
            certs_pem = crypto::Certificate::CreateChainPEM(signer.CertificateChain());
        } catch (const crypto::CryptoError& e) {
            throw EmbedderError(EmbedderError::Kind::BadParam,
                                std::string("certificate chain: ") + e.what());
        }

        SigningContext ctx{signer, std::nullopt};
        C2paSignerPtr c_signer(c2pa_signer_create(
            &ctx, &SignCallback, ToC2paAlg(signer.Algorithm()), certs_pem.c_str(),
            tsa_url_.empty() ? nullptr : tsa_url_.c_str()));
        if (!c_signer) {
            throw ClassifyC2paError(TakeC2paError());
        }

        MemoryStream input;
        input.data = source;
        MemoryStream output;
        output.data.reserve(source.size() + signer.ReserveSize());

        C2paStreamPtr c_input = input.Open();
        C2paStreamPtr c_output = output.Open();

        const unsigned char* manifest_bytes = nullptr;
        int64_t result = c2pa_builder_sign(builder_.get(), media_type.c_str(),
                                           c_input.get(), c_output.get(),
                                           c_signer.get(), &manifest_bytes);
        c2pa_free(manifest_bytes);

        if (result < 0) {
            std::string message = TakeC2paError();
            if (ctx.failure) {
                throw *ctx.failure;
            }
            throw ClassifyC2paError(message);
        }

        VLOG(1) << "c2pa manifest store: " << result << " bytes";
        return std::move(output.data);
    }

private:
    C2paBuilderPtr builder_;
    std::string tsa_url_;
};

} // namespace

C2paEmbedder::C2paEmbedder(const std::string& tsa_url)
    : tsa_url_(tsa_url)
{}

std::unique_ptr<ManifestEmbedder::Builder> C2paEmbedder::BuildFromJson(const std::string& manifest_json) {
    C2paBuilderPtr builder(c2pa_builder_from_json(manifest_json.c_str()));
    if (!builder) {
        throw ClassifyC2paError(TakeC2paError());
    }
    return std::make_unique<C2paBuilderImpl>(std::move(builder), tsa_url_);
}

} // namespace attest
