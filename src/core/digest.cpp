#include "core/digest.hpp"
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>

namespace ledgerseal::core {

namespace {

std::string getOpenSSLError() {
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    return buf;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::vector<uint8_t> Digest::sha256(const uint8_t* data, size_t size) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>
        ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Failed to create digest context: " + getOpenSSLError());
    }

    std::vector<uint8_t> hash(EVP_MAX_MD_SIZE);
    unsigned int hashLen = 0;
    if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) ||
        !EVP_DigestUpdate(ctx.get(), data, size) ||
        !EVP_DigestFinal_ex(ctx.get(), hash.data(), &hashLen)) {
        throw std::runtime_error("SHA-256 computation failed: " + getOpenSSLError());
    }

    hash.resize(hashLen);
    return hash;
}

std::vector<uint8_t> Digest::sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

std::string Digest::sha256Hex(std::string_view text) {
    auto hash = sha256(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    return toHex(hash);
}

std::string Digest::toHex(const uint8_t* data, size_t size) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

std::string Digest::toHex(const std::vector<uint8_t>& data) {
    return toHex(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> Digest::fromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexValue(hex[i]);
        int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

bool Digest::equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace ledgerseal::core
