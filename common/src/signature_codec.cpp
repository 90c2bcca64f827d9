/**
 * @file signature_codec.cpp
 * @brief DER to P1363 ECDSA signature conversion
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attest/common/signature_codec.h"
#include "attest/common/limits.h"
#include <algorithm>

namespace attest {
namespace crypto {

namespace {

constexpr uint8_t DER_TAG_SEQUENCE = 0x30;
constexpr uint8_t DER_TAG_INTEGER = 0x02;

using Reason = SignatureCodecError::Reason;

/**
 * @brief Parse a DER length field
 * @param data Start of the length field
 * @param available Bytes readable from @p data
 * @param consumed Set to the number of length bytes read
 * @return Decoded length value
 */
size_t ParseLength(const uint8_t* data, size_t available, size_t* consumed) {
    if (available == 0) {
        throw SignatureCodecError(Reason::TruncatedLength, "empty DER length");
    }

    if (data[0] < 0x80) {
        *consumed = 1;
        return data[0];
    }

    if (data[0] == 0x81) {
        if (available < 2) {
            throw SignatureCodecError(Reason::TruncatedLength, "truncated DER length");
        }
        *consumed = 2;
        return data[1];
    }

    if (data[0] == 0x82) {
        if (available < 3) {
            throw SignatureCodecError(Reason::TruncatedLength, "truncated DER length");
        }
        *consumed = 3;
        return (static_cast<size_t>(data[1]) << 8) | data[2];
    }

    throw SignatureCodecError(Reason::UnsupportedLength, "unsupported DER length encoding");
}

/**
 * @brief Strip ASN.1 sign padding and left-pad into @p out
 */
void IntegerToFixed(const uint8_t* bytes, size_t len, size_t size, uint8_t* out) {
    const uint8_t* end = bytes + len;
    const uint8_t* first = std::find_if(bytes, end, [](uint8_t b) { return b != 0; });

    // All-zero (or empty) integer encodes the value 0
    static const uint8_t zero = 0;
    if (first == end) {
        first = &zero;
        end = &zero + 1;
    }

    size_t stripped_len = static_cast<size_t>(end - first);
    if (stripped_len > size) {
        throw SignatureCodecError(Reason::IntegerTooLarge,
            "integer too large: " + std::to_string(stripped_len) +
            " bytes, expected <= " + std::to_string(size));
    }

    std::copy(first, end, out + (size - stripped_len));
}

} // namespace

std::vector<uint8_t> DerToP1363(const std::vector<uint8_t>& der, size_t field_size) {
    if (der.size() < limits::MIN_DER_SIGNATURE_SIZE || der[0] != DER_TAG_SEQUENCE) {
        throw SignatureCodecError(Reason::NotASequence, "not a DER SEQUENCE");
    }

    // Outer SEQUENCE
    size_t offset = 0;
    size_t seq_len = ParseLength(der.data() + 1, der.size() - 1, &offset);
    size_t body_start = 1 + offset;
    if (der.size() - body_start < seq_len) {
        throw SignatureCodecError(Reason::Truncated, "DER SEQUENCE truncated");
    }
    const uint8_t* body = der.data() + body_start;
    const size_t body_len = seq_len;

    // INTEGER r
    if (body_len == 0 || body[0] != DER_TAG_INTEGER) {
        throw SignatureCodecError(Reason::ExpectedInteger, "expected INTEGER tag for r");
    }
    size_t r_off = 0;
    size_t r_len = ParseLength(body + 1, body_len - 1, &r_off);
    size_t r_start = 1 + r_off;
    if (body_len < r_start || body_len - r_start < r_len) {
        throw SignatureCodecError(Reason::Truncated, "r INTEGER truncated");
    }

    // INTEGER s
    size_t s_tag_pos = r_start + r_len;
    if (body_len <= s_tag_pos || body[s_tag_pos] != DER_TAG_INTEGER) {
        throw SignatureCodecError(Reason::ExpectedInteger, "expected INTEGER tag for s");
    }
    size_t s_off = 0;
    size_t s_len = ParseLength(body + s_tag_pos + 1, body_len - s_tag_pos - 1, &s_off);
    size_t s_start = s_tag_pos + 1 + s_off;
    if (body_len < s_start || body_len - s_start < s_len) {
        throw SignatureCodecError(Reason::Truncated, "s INTEGER truncated");
    }

    std::vector<uint8_t> out(2 * field_size, 0);
    IntegerToFixed(body + r_start, r_len, field_size, out.data());
    IntegerToFixed(body + s_start, s_len, field_size, out.data() + field_size);
    return out;
}

} // namespace crypto
} // namespace attest
