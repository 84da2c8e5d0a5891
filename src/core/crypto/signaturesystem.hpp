#pragma once

#include "core/core_export.hpp"
#include "core/securememory.hpp"
#include <openssl/evp.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ledgerseal::core {

/**
 * @brief Digital signature system using EdDSA
 *
 * Ed25519 signatures over timestamp token bodies and exported
 * checkpoints. Keys are raw 32-byte values.
 */
class LEDGERSEAL_CORE_EXPORT SignatureSystem {
public:
    /**
     * @brief Key pair for signing operations
     */
    struct KeyPair {
        SecureMemory::SecureVector<uint8_t> privateKey;
        std::vector<uint8_t> publicKey;
    };

    /**
     * @brief Constructor
     * @throws std::runtime_error if the EdDSA context cannot be created
     */
    SignatureSystem();

    /**
     * @brief Destructor
     */
    ~SignatureSystem();

    // Prevent copying
    SignatureSystem(const SignatureSystem&) = delete;
    SignatureSystem& operator=(const SignatureSystem&) = delete;

    /**
     * @brief Generate new key pair
     * @return Generated key pair
     * @throws std::runtime_error on key generation failure
     */
    KeyPair generateKeyPair();

    /**
     * @brief Derive the public key belonging to a raw private key
     * @return Public key or nullopt if the private key is malformed
     */
    std::optional<std::vector<uint8_t>> derivePublicKey(
        const SecureMemory::SecureVector<uint8_t>& privateKey) const;

    /**
     * @brief Sign data with private key
     * @param data Data to sign
     * @param privateKey Private key for signing
     * @return Signature bytes or empty if failed
     */
    std::vector<uint8_t> sign(
        const std::vector<uint8_t>& data,
        const SecureMemory::SecureVector<uint8_t>& privateKey) const;

    /**
     * @brief Sign UTF-8 text
     */
    std::vector<uint8_t> sign(
        const std::string& text,
        const SecureMemory::SecureVector<uint8_t>& privateKey) const;

    /**
     * @brief Verify signature with public key
     * @param data Original data
     * @param signature Signature to verify
     * @param publicKey Public key for verification
     * @return true if signature is valid
     */
    bool verify(const std::vector<uint8_t>& data,
               const std::vector<uint8_t>& signature,
               const std::vector<uint8_t>& publicKey) const;

    bool verify(const std::string& text,
               const std::vector<uint8_t>& signature,
               const std::vector<uint8_t>& publicKey) const;

private:
    EVP_PKEY_CTX* ctx_;
};

} // namespace ledgerseal::core
