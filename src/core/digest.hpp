#pragma once

#include "core/core_export.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ledgerseal::core {

/**
 * @brief SHA-256 digests for ledger hashing
 *
 * Every hash in the ledger (event hashes, Merkle nodes, checkpoint hashes)
 * is a SHA-256 digest rendered as lowercase hex.
 */
class LEDGERSEAL_CORE_EXPORT Digest {
public:
    static constexpr size_t SHA256_SIZE = 32;

    /**
     * @brief Calculate SHA-256 of raw bytes
     * @param data Data to hash
     * @return 32-byte digest
     * @throws std::runtime_error if the digest context cannot be used
     */
    static std::vector<uint8_t> sha256(const uint8_t* data, size_t size);
    static std::vector<uint8_t> sha256(const std::vector<uint8_t>& data);

    /**
     * @brief Calculate SHA-256 of UTF-8 text and return lowercase hex
     */
    static std::string sha256Hex(std::string_view text);

    /**
     * @brief Encode bytes as lowercase hex
     */
    static std::string toHex(const uint8_t* data, size_t size);
    static std::string toHex(const std::vector<uint8_t>& data);

    /**
     * @brief Decode hex text (either case)
     * @return Bytes or nullopt on odd length or non-hex characters
     */
    static std::optional<std::vector<uint8_t>> fromHex(std::string_view hex);

    /**
     * @brief Constant-time comparison of two strings of equal length
     */
    static bool equals(std::string_view a, std::string_view b);
};

} // namespace ledgerseal::core
