/**
 * @file signature_codec.h
 * @brief ECDSA signature conversion from ASN.1 DER to fixed-width (P1363)
 *
 * Hardware keystores return ECDSA signatures as
 * SEQUENCE { INTEGER r, INTEGER s }. COSE ES256 expects r || s with each
 * value left-padded to the curve field size.
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ATTEST_SIGNATURE_CODEC_H
#define ATTEST_SIGNATURE_CODEC_H

#include "attest/common/crypto.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace attest {
namespace crypto {

/**
 * @brief DER signature decoding failure
 */
class SignatureCodecError : public CryptoError {
public:
    enum class Reason {
        NotASequence,       ///< Too short or outer tag is not 0x30
        TruncatedLength,    ///< Length field runs past the buffer
        UnsupportedLength,  ///< Length form other than short, 0x81 or 0x82
        Truncated,          ///< Declared content runs past the buffer
        ExpectedInteger,    ///< r or s tag is not 0x02
        IntegerTooLarge     ///< Stripped integer exceeds the field size
    };

    SignatureCodecError(Reason reason, const std::string& message)
        : CryptoError(message), reason_(reason) {}

    Reason reason() const noexcept { return reason_; }

private:
    Reason reason_;
};

/**
 * @brief Convert a DER-encoded ECDSA signature to P1363 (r || s)
 *
 * Leading 0x00 bytes of each INTEGER are stripped before left-padding to
 * @p field_size. Bytes following the outer SEQUENCE are ignored.
 *
 * @param der DER-encoded SEQUENCE { INTEGER r, INTEGER s }
 * @param field_size Curve field size in bytes (32 for P-256)
 * @return 2 * field_size bytes
 * @throws SignatureCodecError on malformed input
 */
std::vector<uint8_t> DerToP1363(
    const std::vector<uint8_t>& der,
    size_t field_size = P256_FIELD_SIZE
);

} // namespace crypto
} // namespace attest

#endif // ATTEST_SIGNATURE_CODEC_H
