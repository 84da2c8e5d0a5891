#pragma once

#include "core/core_export.hpp"
#include "core/compat/clock.hpp"
#include "core/crypto/signaturesystem.hpp"
#include "core/securememory.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ledgerseal::core {

/**
 * @brief Attestation binding a hash to a trusted time
 */
struct LEDGERSEAL_CORE_EXPORT TimestampToken {
    static constexpr const char* PROVENANCE_UNATTESTED = "unattested";

    std::string hashAlgorithm{"sha256"};
    std::string messageImprint;
    compat::Timestamp timestamp{};
    std::string tsaName;
    std::string serialNumber;
    std::vector<uint8_t> signature;
    std::vector<std::string> certificateChain;
    std::optional<std::string> policyOid;
    std::string provenance;

    /**
     * @brief Signed portion of the token as canonical JSON text
     *
     * Everything except signature and certificate chain.
     */
    std::string signedBody() const;

    nlohmann::json toJson() const;

    /**
     * @throws std::runtime_error on malformed input
     */
    static TimestampToken fromJson(const nlohmann::json& json);
};

/**
 * @brief Source of timestamp attestations
 *
 * Implementations talking to an external service override getToken and,
 * where they can check the authority's signature, verifyToken. The base
 * verifyToken enforces that the token attests @p hash and is not dated
 * further in the future than the tolerance.
 */
class LEDGERSEAL_CORE_EXPORT TimestampAuthority {
public:
    explicit TimestampAuthority(compat::Timestamp::duration tolerance = compat::minutes(5))
        : tolerance_(tolerance) {}
    virtual ~TimestampAuthority() = default;

    // Prevent copying
    TimestampAuthority(const TimestampAuthority&) = delete;
    TimestampAuthority& operator=(const TimestampAuthority&) = delete;

    /**
     * @brief Obtain a token for a hex hash
     * @return Token, or nullopt if the authority could not issue one
     */
    virtual std::optional<TimestampToken> getToken(const std::string& hash) = 0;

    /**
     * @brief Check a token against the hash it should attest
     */
    virtual bool verifyToken(const TimestampToken& token, const std::string& hash) const;

    /**
     * @brief Name recorded in issued tokens
     */
    virtual std::string name() const = 0;

    compat::Timestamp::duration tolerance() const { return tolerance_; }

private:
    compat::Timestamp::duration tolerance_;
};

/**
 * @brief In-process authority issuing unattested, Ed25519-signed tokens
 *
 * Used when no external authority is configured. Tokens are marked with
 * provenance "unattested" and carry no certificate chain; the signature
 * only proves the token came from the holder of this instance's key.
 */
class LEDGERSEAL_CORE_EXPORT LocalTimestampAuthority : public TimestampAuthority {
public:
    /**
     * @brief Create with a freshly generated signing key
     * @throws std::runtime_error if key generation fails
     */
    explicit LocalTimestampAuthority(std::string name = "ledgerseal-local",
                                     compat::Timestamp::duration tolerance = compat::minutes(5));

    /**
     * @brief Create with an existing Ed25519 private key
     * @throws std::runtime_error if the key is malformed
     */
    LocalTimestampAuthority(SecureMemory::SecureVector<uint8_t> privateKey,
                            std::string name,
                            compat::Timestamp::duration tolerance = compat::minutes(5));

    std::optional<TimestampToken> getToken(const std::string& hash) override;
    bool verifyToken(const TimestampToken& token, const std::string& hash) const override;
    std::string name() const override { return name_; }

    const std::vector<uint8_t>& publicKey() const { return publicKey_; }

private:
    std::string name_;
    SignatureSystem signer_;
    SecureMemory::SecureVector<uint8_t> privateKey_;
    std::vector<uint8_t> publicKey_;
};

} // namespace ledgerseal::core
