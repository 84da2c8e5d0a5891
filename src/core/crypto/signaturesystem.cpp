#include "core/crypto/signaturesystem.hpp"
#include <openssl/err.h>
#include <memory>
#include <stdexcept>

namespace {

// Ed25519 key sizes
constexpr size_t ED25519_PRIVATE_KEY_SIZE = 32;
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

// Convert OpenSSL error to string
std::string getOpenSSLError() {
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    return buf;
}

std::vector<uint8_t> textBytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // anonymous namespace

namespace ledgerseal::core {

SignatureSystem::SignatureSystem() : ctx_(nullptr) {
    ctx_ = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
    if (!ctx_) {
        throw std::runtime_error("Failed to create EdDSA context: " + getOpenSSLError());
    }
}

SignatureSystem::~SignatureSystem() {
    if (ctx_) {
        EVP_PKEY_CTX_free(ctx_);
    }
}

SignatureSystem::KeyPair SignatureSystem::generateKeyPair() {
    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen_init(ctx_) <= 0 ||
        EVP_PKEY_keygen(ctx_, &pkey) <= 0) {
        throw std::runtime_error("Failed to generate key pair: " + getOpenSSLError());
    }

    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> keyGuard(pkey, EVP_PKEY_free);

    size_t privLen = ED25519_PRIVATE_KEY_SIZE;
    SecureMemory::SecureVector<uint8_t> privateKey(privLen);
    if (EVP_PKEY_get_raw_private_key(pkey, privateKey.data(), &privLen) <= 0) {
        throw std::runtime_error("Failed to extract private key: " + getOpenSSLError());
    }

    size_t pubLen = ED25519_PUBLIC_KEY_SIZE;
    std::vector<uint8_t> publicKey(pubLen);
    if (EVP_PKEY_get_raw_public_key(pkey, publicKey.data(), &pubLen) <= 0) {
        throw std::runtime_error("Failed to extract public key: " + getOpenSSLError());
    }

    return KeyPair{std::move(privateKey), std::move(publicKey)};
}

std::optional<std::vector<uint8_t>> SignatureSystem::derivePublicKey(
    const SecureMemory::SecureVector<uint8_t>& privateKey) const {
    if (privateKey.size() != ED25519_PRIVATE_KEY_SIZE) {
        return std::nullopt;
    }
    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(
        EVP_PKEY_ED25519, nullptr,
        privateKey.data(), privateKey.size());
    if (!pkey) {
        return std::nullopt;
    }
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> keyGuard(pkey, EVP_PKEY_free);

    size_t pubLen = ED25519_PUBLIC_KEY_SIZE;
    std::vector<uint8_t> publicKey(pubLen);
    if (EVP_PKEY_get_raw_public_key(pkey, publicKey.data(), &pubLen) <= 0) {
        return std::nullopt;
    }
    publicKey.resize(pubLen);
    return publicKey;
}

std::vector<uint8_t> SignatureSystem::sign(
    const std::vector<uint8_t>& data,
    const SecureMemory::SecureVector<uint8_t>& privateKey) const {

    if (privateKey.size() != ED25519_PRIVATE_KEY_SIZE) {
        return {};
    }

    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(
        EVP_PKEY_ED25519, nullptr,
        privateKey.data(), privateKey.size());
    if (!pkey) {
        return {};
    }
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> keyGuard(pkey, EVP_PKEY_free);

    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (!mdctx) {
        return {};
    }
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>
        ctxGuard(mdctx, EVP_MD_CTX_free);

    // Ed25519 is a one-shot scheme, no message digest is configured
    if (EVP_DigestSignInit(mdctx, nullptr, nullptr, nullptr, pkey) <= 0) {
        return {};
    }

    size_t sigLen = ED25519_SIGNATURE_SIZE;
    std::vector<uint8_t> signature(sigLen);

    if (EVP_DigestSign(mdctx,
                      signature.data(), &sigLen,
                      data.data(), data.size()) <= 0) {
        return {};
    }

    signature.resize(sigLen);
    return signature;
}

std::vector<uint8_t> SignatureSystem::sign(
    const std::string& text,
    const SecureMemory::SecureVector<uint8_t>& privateKey) const {
    return sign(textBytes(text), privateKey);
}

bool SignatureSystem::verify(
    const std::vector<uint8_t>& data,
    const std::vector<uint8_t>& signature,
    const std::vector<uint8_t>& publicKey) const {

    if (publicKey.size() != ED25519_PUBLIC_KEY_SIZE ||
        signature.size() != ED25519_SIGNATURE_SIZE) {
        return false;
    }

    EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(
        EVP_PKEY_ED25519, nullptr,
        publicKey.data(), publicKey.size());
    if (!pkey) {
        return false;
    }
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> keyGuard(pkey, EVP_PKEY_free);

    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (!mdctx) {
        return false;
    }
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>
        ctxGuard(mdctx, EVP_MD_CTX_free);

    if (EVP_DigestVerifyInit(mdctx, nullptr, nullptr, nullptr, pkey) <= 0) {
        return false;
    }

    return EVP_DigestVerify(mdctx,
                           signature.data(), signature.size(),
                           data.data(), data.size()) == 1;
}

bool SignatureSystem::verify(
    const std::string& text,
    const std::vector<uint8_t>& signature,
    const std::vector<uint8_t>& publicKey) const {
    return verify(textBytes(text), signature, publicKey);
}

} // namespace ledgerseal::core
