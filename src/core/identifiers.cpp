#include "core/identifiers.hpp"
#include "core/digest.hpp"
#include <openssl/rand.h>
#include <stdexcept>
#include <vector>

namespace ledgerseal::core {

namespace {

std::vector<uint8_t> randomBytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("Random number generator failure");
    }
    return bytes;
}

} // anonymous namespace

std::string generateUuid() {
    auto bytes = randomBytes(16);
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80);

    std::string hex = Digest::toHex(bytes);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20);
}

std::string randomHex(size_t bytes) {
    return Digest::toHex(randomBytes(bytes));
}

} // namespace ledgerseal::core
