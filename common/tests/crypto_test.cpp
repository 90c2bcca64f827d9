/**
 * @file crypto_test.cpp
 * @brief Unit tests for cryptographic primitives
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include "attest/common/crypto.h"
#include <vector>
#include <string>

using namespace attest::crypto;

// ============================================================================
// Key Generation Tests
// ============================================================================

TEST(CryptoTest, GeneratePrivateKey) {
    auto key = PrivateKey::Generate();

    std::string pem = key.ToPEM();
    EXPECT_FALSE(pem.empty());
    EXPECT_NE(pem.find("BEGIN"), std::string::npos);
    EXPECT_TRUE(key.IsP256());
}

TEST(CryptoTest, DerivePublicKey) {
    auto privkey = PrivateKey::Generate();
    auto pubkey = PublicKey::FromPrivateKey(privkey);

    std::string pem = pubkey.ToPEM();
    EXPECT_NE(pem.find("BEGIN PUBLIC KEY"), std::string::npos);
}

TEST(CryptoTest, LoadPrivateKeyFromPEM) {
    auto key = PrivateKey::Generate();
    auto loaded_key = PrivateKey::LoadFromPEM(key.ToPEM());

    // Loaded key must produce signatures the original public key accepts
    auto pubkey = PublicKey::FromPrivateKey(key);
    std::vector<uint8_t> data = {0x01, 0x02, 0x03};
    auto sig = ECDSA::Sign(loaded_key, data);
    EXPECT_TRUE(ECDSA::Verify(pubkey, data, sig));
}

TEST(CryptoTest, LoadPrivateKeyFromInvalidPEM) {
    EXPECT_THROW(PrivateKey::LoadFromPEM("not a key"), CryptoError);
}

TEST(CryptoTest, LoadPrivateKeyFromMissingFile) {
    EXPECT_THROW(PrivateKey::LoadFromFile("/nonexistent/key.pem"), CryptoError);
}

TEST(CryptoTest, PublicKeyPEMRoundTrip) {
    auto privkey = PrivateKey::Generate();
    auto pubkey = PublicKey::FromPrivateKey(privkey);
    auto loaded = PublicKey::LoadFromPEM(pubkey.ToPEM());

    EXPECT_EQ(loaded.ToPEM(), pubkey.ToPEM());
}

// ============================================================================
// ECDSA Signature Tests
// ============================================================================

TEST(CryptoTest, ECDSASignVerify) {
    auto privkey = PrivateKey::Generate();
    auto pubkey = PublicKey::FromPrivateKey(privkey);

    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04, 0x05};

    auto signature = ECDSA::Sign(privkey, data);
    ASSERT_FALSE(signature.empty());
    EXPECT_EQ(signature[0], 0x30);  // DER SEQUENCE
    EXPECT_LE(signature.size(), 72u);

    EXPECT_TRUE(ECDSA::Verify(pubkey, data, signature));
}

TEST(CryptoTest, ECDSAVerifyFailsOnWrongData) {
    auto privkey = PrivateKey::Generate();
    auto pubkey = PublicKey::FromPrivateKey(privkey);

    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04, 0x05};
    std::vector<uint8_t> wrong_data = {0x01, 0x02, 0x03, 0x04, 0x06};

    auto signature = ECDSA::Sign(privkey, data);

    EXPECT_THROW(ECDSA::Verify(pubkey, wrong_data, signature), SignatureVerificationError);
}

TEST(CryptoTest, ECDSAVerifyFailsOnWrongKey) {
    auto privkey1 = PrivateKey::Generate();
    auto privkey2 = PrivateKey::Generate();
    auto pubkey2 = PublicKey::FromPrivateKey(privkey2);

    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04, 0x05};
    auto signature = ECDSA::Sign(privkey1, data);

    EXPECT_THROW(ECDSA::Verify(pubkey2, data, signature), SignatureVerificationError);
}

TEST(CryptoTest, ECDSAVerifyP1363RejectsWrongSize) {
    auto privkey = PrivateKey::Generate();
    auto pubkey = PublicKey::FromPrivateKey(privkey);

    std::vector<uint8_t> data = {0x01};
    std::vector<uint8_t> short_sig(63, 0x01);

    EXPECT_THROW(ECDSA::VerifyP1363(pubkey, data, short_sig), CryptoError);
}

TEST(CryptoTest, ECDSAVerifyP1363RejectsTamperedSignature) {
    auto privkey = PrivateKey::Generate();
    auto pubkey = PublicKey::FromPrivateKey(privkey);

    std::vector<uint8_t> data = {0x01};
    std::vector<uint8_t> sig(P256_P1363_SIGNATURE_SIZE, 0x01);

    EXPECT_THROW(ECDSA::VerifyP1363(pubkey, data, sig), SignatureVerificationError);
}

// ============================================================================
// SHA-256 Tests
// ============================================================================

TEST(CryptoTest, SHA256KnownVector) {
    std::vector<uint8_t> abc = {'a', 'b', 'c'};

    EXPECT_EQ(SHA256::HashHex(abc),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CryptoTest, SHA256EmptyInput) {
    std::vector<uint8_t> empty;

    auto hash = SHA256::Hash(empty);
    EXPECT_EQ(hash.size(), SHA256_HASH_SIZE);
    EXPECT_EQ(SHA256::HashHex(empty),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(CryptoTest, HexEncodeIsLowercaseAndPadded) {
    std::vector<uint8_t> data = {0x00, 0x0a, 0xff, 0xd8};

    EXPECT_EQ(HexEncode(data), "000affd8");
    EXPECT_EQ(HexEncode({}), "");
}
