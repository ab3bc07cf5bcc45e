#include "nicknym/keys/keys.hpp"

namespace nicknym {
namespace keys {

std::string KeyTypeToString(KeyType type) {
    switch (type) {
        case KeyType::OpenPGP: return OPENPGP_KEY;
    }
    return "unknown";
}

Result<KeyType> ParseKeyType(const std::string& tag) {
    if (tag == OPENPGP_KEY) {
        return KeyType::OpenPGP;
    }
    return Error(ErrorCode::UnknownKeyType, "Unknown key type: " + tag);
}

int ValidationRank(const std::string& validation) {
    static const std::vector<std::string> levels = {
        WEAK_CHAIN, PROVIDER_TRUST, PROVIDER_ENDORSEMENT, THIRD_PARTY_ENDORSEMENT,
        THIRD_PARTY_CONSENSUS, HISTORICALLY_AUDITING, KNOWN_KEY, FINGERPRINT
    };
    for (size_t i = 0; i < levels.size(); ++i) {
        if (levels[i] == validation) {
            return static_cast<int>(i);
        }
    }
    return 0;
}

json EncryptionKey::ToJson() const {
    return json{
        {"type", KeyTypeToString(Type())},
        {"address", address_},
        {"key_id", keyId_},
        {"fingerprint", fingerprint_},
        {"key_data", keyData_},
        {"private", private_},
        {"length", metadata_.length},
        {"expiry_date", metadata_.expiryDate},
        {"validation", metadata_.validation},
        {"first_seen_at", metadata_.firstSeenAt},
        {"last_audited_at", metadata_.lastAuditedAt},
        {"tags", json::array({KEYMANAGER_KEY_TAG})}
    };
}

Result<std::shared_ptr<EncryptionKey>> BuildKeyFromJson(KeyType type, const json& content) {
    try {
        KeyMetadata metadata;
        metadata.length = content.value("length", 0u);
        metadata.expiryDate = content.value("expiry_date", static_cast<int64_t>(0));
        metadata.validation = content.value("validation", WEAK_CHAIN);
        metadata.firstSeenAt = content.value("first_seen_at", static_cast<int64_t>(0));
        metadata.lastAuditedAt = content.value("last_audited_at", static_cast<int64_t>(0));

        const std::string address = content.at("address").get<std::string>();
        const std::string keyData = content.at("key_data").get<std::string>();
        const bool isPrivate = content.at("private").get<bool>();
        const std::string keyId = content.value("key_id", "");
        const std::string fingerprint = content.value("fingerprint", "");

        switch (type) {
            case KeyType::OpenPGP:
                return std::shared_ptr<EncryptionKey>(std::make_shared<OpenPGPKey>(
                    address, keyId, fingerprint, keyData, isPrivate, metadata));
        }
        return Error(ErrorCode::UnknownKeyType, "Unknown key type: " + KeyTypeToString(type));
    } catch (const json::exception& e) {
        return Error(ErrorCode::StorageFailure, std::string("Malformed key document: ") + e.what());
    }
}

} // namespace keys
} // namespace nicknym
