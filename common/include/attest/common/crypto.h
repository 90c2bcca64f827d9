/**
 * @file crypto.h
 * @brief Cryptographic primitives for photo attestation
 *
 * Copyright 2025 libattest contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ATTEST_CRYPTO_H
#define ATTEST_CRYPTO_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace attest {
namespace crypto {

/**
 * @brief Cryptographic exceptions
 */
class CryptoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SignatureVerificationError : public CryptoError {
public:
    SignatureVerificationError() : CryptoError("Signature verification failed") {}
};

/**
 * @brief Cryptographic size constants
 */
// SHA-256 constants
constexpr size_t SHA256_HASH_SIZE = 32;          // 256 bits

// ECDSA P-256 constants
constexpr size_t P256_FIELD_SIZE = 32;           // Coordinate / scalar size
constexpr size_t P256_P1363_SIGNATURE_SIZE = 64; // r || s

/**
 * @brief ECC private key wrapper (ECDSA P-256)
 */
class PrivateKey {
public:
    PrivateKey();
    ~PrivateKey();

    PrivateKey(PrivateKey&&) noexcept;
    PrivateKey& operator=(PrivateKey&&) noexcept;
    PrivateKey(const PrivateKey&) = delete;
    PrivateKey& operator=(const PrivateKey&) = delete;

    /**
     * @brief Load private key from PEM file
     * @param path Path to PEM-encoded private key
     * @return Loaded private key
     * @throws CryptoError on parse error
     */
    static PrivateKey LoadFromFile(const std::string& path);

    /**
     * @brief Load private key from PEM buffer
     * @param pem PEM-encoded private key
     * @return Loaded private key
     * @throws CryptoError on parse error
     */
    static PrivateKey LoadFromPEM(const std::string& pem);

    /**
     * @brief Generate new P-256 key pair
     * @return Generated private key
     * @throws CryptoError on generation error
     */
    static PrivateKey Generate();

    /**
     * @brief Export to PEM format
     * @return PEM-encoded private key
     */
    std::string ToPEM() const;

    /**
     * @brief Check whether this is an EC key on the P-256 curve
     */
    bool IsP256() const;

    void* GetNativeHandle() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief ECC public key wrapper
 */
class PublicKey {
public:
    PublicKey();
    ~PublicKey();

    PublicKey(PublicKey&&) noexcept;
    PublicKey& operator=(PublicKey&&) noexcept;
    PublicKey(const PublicKey&) = delete;
    PublicKey& operator=(const PublicKey&) = delete;

    /**
     * @brief Load public key from PEM buffer
     * @param pem PEM-encoded public key
     * @return Loaded public key
     * @throws CryptoError on parse error
     */
    static PublicKey LoadFromPEM(const std::string& pem);

    /**
     * @brief Derive public key from private key
     * @param privkey Private key
     * @return Corresponding public key
     */
    static PublicKey FromPrivateKey(const PrivateKey& privkey);

    /**
     * @brief Export to PEM format
     * @return PEM-encoded public key
     */
    std::string ToPEM() const;

    void* GetNativeHandle() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief X.509 certificate wrapper
 */
class Certificate {
public:
    Certificate();
    ~Certificate();

    Certificate(Certificate&&) noexcept;
    Certificate& operator=(Certificate&&) noexcept;
    Certificate(const Certificate&) = delete;
    Certificate& operator=(const Certificate&) = delete;

    /**
     * @brief Load the first certificate from a PEM file
     * @param path Path to PEM-encoded certificate
     * @return Loaded certificate
     * @throws CryptoError on parse error
     */
    static Certificate LoadFromFile(const std::string& path);

    /**
     * @brief Load the first certificate from a PEM buffer
     * @param pem PEM-encoded certificate
     * @return Loaded certificate
     * @throws CryptoError on parse error
     */
    static Certificate LoadFromPEM(const std::string& pem);

    /**
     * @brief Load certificate from DER buffer
     * @param der DER-encoded certificate
     * @return Loaded certificate
     * @throws CryptoError on parse error
     */
    static Certificate LoadFromDER(const std::vector<uint8_t>& der);

    /**
     * @brief Export to DER format
     * @return DER-encoded certificate
     */
    std::vector<uint8_t> ToDER() const;

    /**
     * @brief Export to PEM format
     * @return PEM-encoded certificate
     */
    std::string ToPEM() const;

    /**
     * @brief Create PEM bundle from a chain of DER certificates
     *
     * Order is preserved: [leaf, intermediate(s)...]
     *
     * @param chain DER-encoded certificates
     * @return PEM string containing all certificates
     * @throws CryptoError if any entry is not a valid certificate
     */
    static std::string CreateChainPEM(const std::vector<std::vector<uint8_t>>& chain);

    /**
     * @brief Get public key from certificate
     * @return Public key
     */
    PublicKey GetPublicKey() const;

    /**
     * @brief Get certificate subject distinguished name
     * @return Subject DN string (e.g., "CN=Attested Camera")
     */
    std::string GetSubject() const;

    void* GetNativeHandle() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Create an end-entity signing certificate
 *
 * End-entity certificates have:
 * - keyUsage: digitalSignature (critical)
 * - basicConstraints: CA:FALSE (critical)
 * - extendedKeyUsage: emailProtection
 *
 * @param signing_key Issuer's private key (same as subject key for self-signed)
 * @param subject_pubkey Public key for the certificate
 * @param subject_name Certificate subject CN
 * @param validity_days Certificate validity period in days
 * @param issuer_cert Issuing certificate, nullptr for self-signed
 * @return End-entity certificate
 * @throws CryptoError on failure
 */
Certificate CreateEndEntityCertificate(
    const PrivateKey& signing_key,
    const PublicKey& subject_pubkey,
    const std::string& subject_name,
    int validity_days = 365,
    const Certificate* issuer_cert = nullptr
);

/**
 * @brief ECDSA P-256 / SHA-256 signing and verification
 */
class ECDSA {
public:
    /**
     * @brief Sign data with ECDSA over SHA-256
     * @param private_key P-256 private key
     * @param data Data to sign (hashed internally)
     * @return DER-encoded signature (SEQUENCE { INTEGER r, INTEGER s })
     * @throws CryptoError on signing failure
     */
    static std::vector<uint8_t> Sign(
        const PrivateKey& private_key,
        const std::vector<uint8_t>& data
    );

    /**
     * @brief Verify DER-encoded ECDSA signature
     * @return true if signature is valid
     * @throws SignatureVerificationError if signature is invalid
     */
    static bool Verify(
        const PublicKey& public_key,
        const std::vector<uint8_t>& data,
        const std::vector<uint8_t>& der_signature
    );

    /**
     * @brief Verify fixed-width (r || s) ECDSA signature
     * @param signature 64-byte P1363 signature
     * @return true if signature is valid
     * @throws SignatureVerificationError if signature is invalid
     */
    static bool VerifyP1363(
        const PublicKey& public_key,
        const std::vector<uint8_t>& data,
        const std::vector<uint8_t>& signature
    );
};

/**
 * @brief SHA-256 hashing
 */
class SHA256 {
public:
    /**
     * @brief Compute SHA-256 hash
     * @param data Data to hash
     * @return 32-byte hash
     */
    static std::vector<uint8_t> Hash(const std::vector<uint8_t>& data);

    /**
     * @brief Compute SHA-256 hash as lower-case hex
     */
    static std::string HashHex(const std::vector<uint8_t>& data);
};

/**
 * @brief Lower-case hex encoding
 */
std::string HexEncode(const std::vector<uint8_t>& data);

} // namespace crypto
} // namespace attest

#endif // ATTEST_CRYPTO_H
