/**
 * @file signature_codec_test.cpp
 * @brief Unit tests for DER to P1363 ECDSA signature conversion
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include "attest/common/crypto.h"
#include "attest/common/signature_codec.h"
#include <random>
#include <vector>

using namespace attest::crypto;
using Reason = SignatureCodecError::Reason;

namespace {

// DER INTEGER content for an unsigned big-endian value
std::vector<uint8_t> EncodeDerInteger(const std::vector<uint8_t>& value) {
    std::vector<uint8_t> v(value);
    while (v.size() > 1 && v[0] == 0x00) {
        v.erase(v.begin());
    }
    if (v.empty()) {
        v.push_back(0x00);
    }
    if (v[0] & 0x80) {
        v.insert(v.begin(), 0x00);
    }

    std::vector<uint8_t> out = {0x02, static_cast<uint8_t>(v.size())};
    out.insert(out.end(), v.begin(), v.end());
    return out;
}

std::vector<uint8_t> EncodeDerSignature(const std::vector<uint8_t>& r, const std::vector<uint8_t>& s) {
    auto r_der = EncodeDerInteger(r);
    auto s_der = EncodeDerInteger(s);

    std::vector<uint8_t> body(r_der);
    body.insert(body.end(), s_der.begin(), s_der.end());

    std::vector<uint8_t> out = {0x30};
    if (body.size() >= 0x80) {
        out.push_back(0x81);
    }
    out.push_back(static_cast<uint8_t>(body.size()));
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

std::vector<uint8_t> Concat(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
    std::vector<uint8_t> out(a);
    out.insert(out.end(), b.begin(), b.end());
    return out;
}

Reason ReasonOf(const std::vector<uint8_t>& der) {
    try {
        DerToP1363(der);
    } catch (const SignatureCodecError& e) {
        return e.reason();
    }
    ADD_FAILURE() << "DerToP1363 accepted malformed input";
    return Reason::NotASequence;
}

} // namespace

// ============================================================================
// Conversion Tests
// ============================================================================

TEST(SignatureCodecTest, MinimalSignature) {
    std::vector<uint8_t> der = {0x30, 0x06, 0x02, 0x01, 0x01, 0x02, 0x01, 0x02};

    auto p1363 = DerToP1363(der);

    ASSERT_EQ(p1363.size(), P256_P1363_SIGNATURE_SIZE);
    std::vector<uint8_t> expected(64, 0x00);
    expected[31] = 0x01;
    expected[63] = 0x02;
    EXPECT_EQ(p1363, expected);
}

TEST(SignatureCodecTest, StripsSignPaddingFromHighBitIntegers) {
    std::vector<uint8_t> r(32, 0xff);
    std::vector<uint8_t> s(32, 0x80);

    auto der = EncodeDerSignature(r, s);
    // Both integers need a leading zero, so each is 33 bytes on the wire
    ASSERT_EQ(der.size(), 2u + 2 * 35);

    EXPECT_EQ(DerToP1363(der), Concat(r, s));
}

TEST(SignatureCodecTest, LeftPadsShortIntegers) {
    std::vector<uint8_t> r(32, 0x00);
    r[31] = 0x7f;
    std::vector<uint8_t> s(32, 0x00);
    s[30] = 0x01;
    s[31] = 0x00;

    EXPECT_EQ(DerToP1363(EncodeDerSignature(r, s)), Concat(r, s));
}

TEST(SignatureCodecTest, AllZeroIntegerBecomesZero) {
    // r encoded as a redundant multi-byte zero
    std::vector<uint8_t> der = {0x30, 0x07, 0x02, 0x02, 0x00, 0x00, 0x02, 0x01, 0x05};

    auto p1363 = DerToP1363(der);

    std::vector<uint8_t> expected(64, 0x00);
    expected[63] = 0x05;
    EXPECT_EQ(p1363, expected);
}

TEST(SignatureCodecTest, RandomValuesRoundTrip) {
    std::mt19937 rng(0xC2FA);
    std::uniform_int_distribution<int> byte(0, 255);
    std::uniform_int_distribution<int> zeros(0, 4);

    for (int i = 0; i < 200; ++i) {
        std::vector<uint8_t> r(32), s(32);
        for (auto& b : r) b = static_cast<uint8_t>(byte(rng));
        for (auto& b : s) b = static_cast<uint8_t>(byte(rng));
        // Exercise shorter encodings too
        int rz = zeros(rng);
        for (int j = 0; j < rz; ++j) r[j] = 0x00;

        EXPECT_EQ(DerToP1363(EncodeDerSignature(r, s)), Concat(r, s));
    }
}

TEST(SignatureCodecTest, AcceptsLongFormSequenceLength) {
    std::vector<uint8_t> der = {0x30, 0x81, 0x06, 0x02, 0x01, 0x01, 0x02, 0x01, 0x02};

    auto p1363 = DerToP1363(der);
    EXPECT_EQ(p1363[31], 0x01);
    EXPECT_EQ(p1363[63], 0x02);
}

TEST(SignatureCodecTest, AcceptsTwoByteLongFormLength) {
    std::vector<uint8_t> der = {0x30, 0x82, 0x00, 0x06, 0x02, 0x01, 0x01, 0x02, 0x01, 0x02};

    auto p1363 = DerToP1363(der);
    EXPECT_EQ(p1363[31], 0x01);
    EXPECT_EQ(p1363[63], 0x02);
}

TEST(SignatureCodecTest, IgnoresBytesAfterSequence) {
    std::vector<uint8_t> der = {0x30, 0x06, 0x02, 0x01, 0x01, 0x02, 0x01, 0x02, 0xaa, 0xbb};

    auto p1363 = DerToP1363(der);
    EXPECT_EQ(p1363[31], 0x01);
    EXPECT_EQ(p1363[63], 0x02);
}

TEST(SignatureCodecTest, CustomFieldSize) {
    std::vector<uint8_t> der = {0x30, 0x06, 0x02, 0x01, 0x01, 0x02, 0x01, 0x02};

    auto out = DerToP1363(der, 4);
    EXPECT_EQ(out, (std::vector<uint8_t>{0, 0, 0, 1, 0, 0, 0, 2}));
}

// ============================================================================
// Real OpenSSL Signatures
// ============================================================================

TEST(SignatureCodecTest, ConvertedOpenSSLSignatureVerifies) {
    auto privkey = PrivateKey::Generate();
    auto pubkey = PublicKey::FromPrivateKey(privkey);
    std::vector<uint8_t> data = {'c', 'l', 'a', 'i', 'm'};

    for (int i = 0; i < 20; ++i) {
        auto der = ECDSA::Sign(privkey, data);
        auto p1363 = DerToP1363(der);

        ASSERT_EQ(p1363.size(), P256_P1363_SIGNATURE_SIZE);
        EXPECT_TRUE(ECDSA::VerifyP1363(pubkey, data, p1363));
    }
}

// ============================================================================
// Rejection Tests
// ============================================================================

TEST(SignatureCodecTest, RejectsShortInput) {
    EXPECT_EQ(ReasonOf({0x30, 0x05, 0x02, 0x01, 0x01, 0x02, 0x01}), Reason::NotASequence);
    EXPECT_EQ(ReasonOf({}), Reason::NotASequence);
}

TEST(SignatureCodecTest, RejectsWrongOuterTag) {
    EXPECT_EQ(ReasonOf({0x31, 0x06, 0x02, 0x01, 0x01, 0x02, 0x01, 0x02}), Reason::NotASequence);
}

TEST(SignatureCodecTest, RejectsUnsupportedLengthEncoding) {
    EXPECT_EQ(ReasonOf({0x30, 0x83, 0x00, 0x00, 0x06, 0x02, 0x01, 0x01, 0x02, 0x01, 0x02}),
              Reason::UnsupportedLength);
    EXPECT_EQ(ReasonOf({0x30, 0x80, 0x02, 0x01, 0x01, 0x02, 0x01, 0x02}),
              Reason::UnsupportedLength);
}

TEST(SignatureCodecTest, RejectsTruncatedLength) {
    // Sequence body ends right after the s INTEGER tag
    EXPECT_EQ(ReasonOf({0x30, 0x04, 0x02, 0x01, 0x01, 0x02, 0x00, 0x00}),
              Reason::TruncatedLength);
    // s declares a two-byte long-form length with no bytes left in the body
    EXPECT_EQ(ReasonOf({0x30, 0x05, 0x02, 0x01, 0x01, 0x02, 0x82, 0x00, 0x00}),
              Reason::TruncatedLength);
}

TEST(SignatureCodecTest, RejectsTruncatedSequence) {
    EXPECT_EQ(ReasonOf({0x30, 0x10, 0x02, 0x01, 0x01, 0x02, 0x01, 0x02}), Reason::Truncated);
}

TEST(SignatureCodecTest, RejectsTruncatedInteger) {
    EXPECT_EQ(ReasonOf({0x30, 0x06, 0x02, 0x01, 0x01, 0x02, 0x05, 0x02}), Reason::Truncated);
    EXPECT_EQ(ReasonOf({0x30, 0x06, 0x02, 0x09, 0x01, 0x02, 0x01, 0x02}), Reason::Truncated);
}

TEST(SignatureCodecTest, RejectsWrongIntegerTag) {
    EXPECT_EQ(ReasonOf({0x30, 0x06, 0x03, 0x01, 0x01, 0x02, 0x01, 0x02}), Reason::ExpectedInteger);
    EXPECT_EQ(ReasonOf({0x30, 0x06, 0x02, 0x01, 0x01, 0x04, 0x01, 0x02}), Reason::ExpectedInteger);
}

TEST(SignatureCodecTest, RejectsIntegerLargerThanField) {
    std::vector<uint8_t> r(33, 0x7f);
    std::vector<uint8_t> body = {0x02, 0x21};
    body.insert(body.end(), r.begin(), r.end());
    body.insert(body.end(), {0x02, 0x01, 0x01});
    std::vector<uint8_t> der = {0x30, static_cast<uint8_t>(body.size())};
    der.insert(der.end(), body.begin(), body.end());

    try {
        DerToP1363(der);
        FAIL() << "Expected SignatureCodecError";
    } catch (const SignatureCodecError& e) {
        EXPECT_EQ(e.reason(), Reason::IntegerTooLarge);
        EXPECT_NE(std::string(e.what()).find("33 bytes"), std::string::npos);
    }
}

TEST(SignatureCodecTest, CodecErrorIsCryptoError) {
    std::vector<uint8_t> garbage(8, 0xff);

    EXPECT_THROW(DerToP1363(garbage), CryptoError);
}
