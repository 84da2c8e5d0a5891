#include "core/timestamp/timestampauthority.hpp"
#include "core/digest.hpp"
#include "core/identifiers.hpp"
#include "core/logging.hpp"
#include <stdexcept>

namespace ledgerseal::core {

std::string TimestampToken::signedBody() const {
    nlohmann::json body = {
        {"hash_algorithm", hashAlgorithm},
        {"message_imprint", messageImprint},
        {"timestamp", compat::toIso8601(timestamp)},
        {"tsa_name", tsaName},
        {"serial_number", serialNumber},
        {"policy_oid", policyOid ? nlohmann::json(*policyOid) : nlohmann::json()},
        {"provenance", provenance}
    };
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json TimestampToken::toJson() const {
    return {
        {"hash_algorithm", hashAlgorithm},
        {"message_imprint", messageImprint},
        {"timestamp", compat::toIso8601(timestamp)},
        {"tsa_name", tsaName},
        {"serial_number", serialNumber},
        {"signature", Digest::toHex(signature)},
        {"certificate_chain", certificateChain},
        {"policy_oid", policyOid ? nlohmann::json(*policyOid) : nlohmann::json()},
        {"provenance", provenance}
    };
}

TimestampToken TimestampToken::fromJson(const nlohmann::json& json) {
    try {
        TimestampToken token;
        token.hashAlgorithm = json.at("hash_algorithm").get<std::string>();
        token.messageImprint = json.at("message_imprint").get<std::string>();
        auto ts = compat::parseIso8601(json.at("timestamp").get<std::string>());
        if (!ts) {
            throw std::runtime_error("Malformed timestamp token: bad timestamp");
        }
        token.timestamp = *ts;
        token.tsaName = json.at("tsa_name").get<std::string>();
        token.serialNumber = json.at("serial_number").get<std::string>();
        auto signature = Digest::fromHex(json.at("signature").get<std::string>());
        if (!signature) {
            throw std::runtime_error("Malformed timestamp token: bad signature encoding");
        }
        token.signature = std::move(*signature);
        if (json.contains("certificate_chain")) {
            token.certificateChain = json.at("certificate_chain").get<std::vector<std::string>>();
        }
        if (json.contains("policy_oid") && !json.at("policy_oid").is_null()) {
            token.policyOid = json.at("policy_oid").get<std::string>();
        }
        token.provenance = json.value("provenance", std::string());
        return token;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed timestamp token: ") + e.what());
    }
}

bool TimestampAuthority::verifyToken(const TimestampToken& token, const std::string& hash) const {
    if (token.messageImprint != hash) {
        return false;
    }
    return token.timestamp <= compat::now() + tolerance_;
}

LocalTimestampAuthority::LocalTimestampAuthority(std::string name,
                                                 compat::Timestamp::duration tolerance)
    : TimestampAuthority(tolerance), name_(std::move(name)) {
    auto keyPair = signer_.generateKeyPair();
    privateKey_ = std::move(keyPair.privateKey);
    publicKey_ = std::move(keyPair.publicKey);
}

LocalTimestampAuthority::LocalTimestampAuthority(SecureMemory::SecureVector<uint8_t> privateKey,
                                                 std::string name,
                                                 compat::Timestamp::duration tolerance)
    : TimestampAuthority(tolerance), name_(std::move(name)), privateKey_(std::move(privateKey)) {
    auto publicKey = signer_.derivePublicKey(privateKey_);
    if (!publicKey) {
        throw std::runtime_error("Invalid timestamp authority signing key");
    }
    publicKey_ = std::move(*publicKey);
}

std::optional<TimestampToken> LocalTimestampAuthority::getToken(const std::string& hash) {
    TimestampToken token;
    token.messageImprint = hash;
    token.timestamp = compat::now();
    token.tsaName = name_;
    token.serialNumber = randomHex(16);
    token.provenance = TimestampToken::PROVENANCE_UNATTESTED;

    token.signature = signer_.sign(token.signedBody(), privateKey_);
    if (token.signature.empty()) {
        logger()->error("Timestamp authority {} failed to sign token for {}", name_, hash);
        return std::nullopt;
    }
    return token;
}

bool LocalTimestampAuthority::verifyToken(const TimestampToken& token,
                                          const std::string& hash) const {
    if (!TimestampAuthority::verifyToken(token, hash)) {
        return false;
    }
    return signer_.verify(token.signedBody(), token.signature, publicKey_);
}

} // namespace ledgerseal::core
