#include "core/event/auditevent.hpp"
#include "core/digest.hpp"
#include <stdexcept>

namespace ledgerseal::core {

namespace {

template<typename T>
nlohmann::json optionalValue(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

const nlohmann::json& requireField(const nlohmann::json& json, const char* key) {
    auto it = json.find(key);
    if (it == json.end()) {
        throw std::runtime_error(std::string("Audit record is missing field: ") + key);
    }
    return *it;
}

std::string requireString(const nlohmann::json& json, const char* key) {
    const auto& value = requireField(json, key);
    if (!value.is_string()) {
        throw std::runtime_error(std::string("Audit record field is not a string: ") + key);
    }
    return value.get<std::string>();
}

std::optional<std::string> optionalString(const nlohmann::json& json, const char* key) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw std::runtime_error(std::string("Audit record field is not a string: ") + key);
    }
    return it->get<std::string>();
}

std::optional<nlohmann::json> optionalJson(const nlohmann::json& json, const char* key) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return std::nullopt;
    }
    return *it;
}

template<typename T>
T requireEnum(const nlohmann::json& json, const char* key,
              std::optional<T> (*parse)(const std::string&)) {
    auto text = requireString(json, key);
    auto value = parse(text);
    if (!value) {
        throw std::runtime_error(std::string("Audit record field has unknown value: ") +
                                 key + "=" + text);
    }
    return *value;
}

} // anonymous namespace

nlohmann::json AuditEvent::canonicalJson() const {
    // nlohmann::json objects are std::map backed, so keys serialize sorted
    nlohmann::json json = nlohmann::json::object();
    json["event_id"] = id;
    json["timestamp"] = compat::toIso8601(timestamp);
    json["tenant_id"] = tenantId;
    json["project_id"] = optionalValue(projectId);

    json["actor_type"] = toString(actorType);
    json["actor_id"] = actorId;
    json["actor_email"] = optionalValue(actorEmail);
    json["actor_ip"] = optionalValue(actorIp);
    json["actor_user_agent"] = optionalValue(actorUserAgent);

    json["event_category"] = toString(category);
    json["event_type"] = eventType;
    json["event_severity"] = toString(severity);

    json["resource_type"] = resourceType;
    json["resource_id"] = resourceId;
    json["resource_name"] = optionalValue(resourceName);

    json["action"] = toString(action);
    json["previous_state"] = optionalValue(previousState);
    json["new_state"] = optionalValue(newState);
    json["metadata"] = optionalValue(metadata);

    json["request_id"] = requestId;
    json["session_id"] = optionalValue(sessionId);

    json["previous_hash"] = previousHash;
    return json;
}

std::string AuditEvent::computeHash() const {
    // Invalid UTF-8 is replaced rather than rejected so hashing stays total
    const std::string encoded = canonicalJson().dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
    return Digest::sha256Hex(encoded);
}

void AuditEvent::seal() {
    hash = computeHash();
}

bool AuditEvent::verifyHash() const {
    return !hash.empty() && Digest::equals(hash, computeHash());
}

bool AuditEvent::verifyChain(const AuditEvent* predecessor) const {
    if (!predecessor) {
        return previousHash.empty();
    }
    return previousHash == predecessor->hash;
}

std::string AuditEvent::deduplicationKey() const {
    return tenantId + ":" + eventType + ":" + resourceType + ":" + resourceId + ":" +
           toString(action);
}

nlohmann::json AuditEvent::toJson() const {
    auto json = canonicalJson();
    json["hash"] = hash;
    return json;
}

AuditEvent AuditEvent::fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::runtime_error("Audit record is not a JSON object");
    }

    AuditEvent event;
    event.id = requireString(json, "event_id");
    auto ts = compat::parseIso8601(requireString(json, "timestamp"));
    if (!ts) {
        throw std::runtime_error("Audit record has malformed timestamp");
    }
    event.timestamp = *ts;
    event.tenantId = requireString(json, "tenant_id");
    event.projectId = optionalString(json, "project_id");

    event.actorType = requireEnum<ActorType>(json, "actor_type", actorTypeFromString);
    event.actorId = requireString(json, "actor_id");
    event.actorEmail = optionalString(json, "actor_email");
    event.actorIp = optionalString(json, "actor_ip");
    event.actorUserAgent = optionalString(json, "actor_user_agent");

    event.category = requireEnum<EventCategory>(json, "event_category", categoryFromString);
    event.eventType = requireString(json, "event_type");
    event.severity = requireEnum<Severity>(json, "event_severity", severityFromString);

    event.resourceType = requireString(json, "resource_type");
    event.resourceId = requireString(json, "resource_id");
    event.resourceName = optionalString(json, "resource_name");

    event.action = requireEnum<Action>(json, "action", actionFromString);
    event.previousState = optionalJson(json, "previous_state");
    event.newState = optionalJson(json, "new_state");
    event.metadata = optionalJson(json, "metadata");

    event.requestId = requireString(json, "request_id");
    event.sessionId = optionalString(json, "session_id");

    event.previousHash = requireString(json, "previous_hash");
    event.hash = requireString(json, "hash");
    return event;
}

} // namespace ledgerseal::core
