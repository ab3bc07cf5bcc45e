#include "nicknym/registry/scheme_registry.hpp"
#include "nicknym/utils/logger.hpp"

namespace nicknym {
namespace registry {

SchemeRegistry::SchemeRegistry(const std::vector<SchemePtr>& schemes) {
    for (const auto& backend : schemes) {
        if (!backend) {
            continue;
        }
        if (schemes_.count(backend->Type()) > 0) {
            utils::GetLogger().Warn("Duplicate backend registration ignored",
                utils::LogContext().With("type", keys::KeyTypeToString(backend->Type())));
            continue;
        }
        schemes_[backend->Type()] = backend;
    }
}

std::shared_ptr<const SchemeRegistry> SchemeRegistry::CreateDefault(
    std::shared_ptr<storage::DocumentStore> store,
    const scheme::OpenPGPOptions& options) {
    std::vector<SchemePtr> schemes;
    schemes.push_back(std::make_shared<scheme::OpenPGPScheme>(std::move(store), options));
    return std::make_shared<const SchemeRegistry>(schemes);
}

bool SchemeRegistry::Contains(keys::KeyType type) const {
    return schemes_.count(type) > 0;
}

Result<SchemeRegistry::SchemePtr> SchemeRegistry::BackendFor(keys::KeyType type) const {
    auto it = schemes_.find(type);
    if (it == schemes_.end()) {
        return Error(ErrorCode::UnknownKeyType,
                     "Key type " + keys::KeyTypeToString(type) + " is not registered");
    }
    return it->second;
}

std::string SchemeRegistry::TypeTagFor(keys::KeyType type) const {
    return keys::KeyTypeToString(type);
}

Result<keys::KeyType> SchemeRegistry::KeyTypeForTag(const std::string& tag) const {
    auto typeResult = keys::ParseKeyType(tag);
    if (!typeResult.ok()) {
        return typeResult.error();
    }
    if (!Contains(typeResult.value())) {
        return Error(ErrorCode::UnknownKeyType, "Key type " + tag + " is not registered");
    }
    return typeResult.value();
}

Result<scheme::KeyPtr> SchemeRegistry::BuildKeyFromDocument(const nlohmann::json& content) const {
    if (!content.is_object() || !content.contains("type") || !content["type"].is_string()) {
        return Error(ErrorCode::StorageFailure, "Key document has no type tag");
    }
    auto typeResult = KeyTypeForTag(content["type"].get<std::string>());
    if (!typeResult.ok()) {
        return typeResult.error();
    }
    return keys::BuildKeyFromJson(typeResult.value(), content);
}

std::vector<SchemeRegistry::SchemePtr> SchemeRegistry::Backends() const {
    std::vector<SchemePtr> result;
    for (const auto& pair : schemes_) {
        result.push_back(pair.second);
    }
    return result;
}

} // namespace registry
} // namespace nicknym
