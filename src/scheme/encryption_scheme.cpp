#include "nicknym/scheme/encryption_scheme.hpp"
#include "nicknym/utils/logger.hpp"

namespace nicknym {
namespace scheme {

namespace {

std::string boolIndexValue(bool value) {
    return value ? "1" : "0";
}

} // namespace

EncryptionScheme::EncryptionScheme(std::shared_ptr<storage::DocumentStore> store)
    : store_(std::move(store)) {}

Error EncryptionScheme::ensureIndexes() {
    std::lock_guard<std::mutex> lock(indexMutex_);
    if (indexesReady_) {
        return Error();
    }
    if (!store_) {
        return Error(ErrorCode::StorageFailure, "No local store configured");
    }

    Error err = store_->CreateIndex(TAGS_PRIVATE_INDEX, {"tags", "private"});
    if (err.hasError()) {
        return err;
    }
    err = store_->CreateIndex(TAGS_TYPE_ADDRESS_PRIVATE_INDEX, {"tags", "type", "address", "private"});
    if (err.hasError()) {
        return err;
    }

    indexesReady_ = true;
    return Error();
}

Result<std::vector<storage::Document>> EncryptionScheme::getKeyDocuments(const std::string& address,
                                                                         bool isPrivate) {
    Error err = ensureIndexes();
    if (err.hasError()) {
        return err;
    }
    return store_->GetFromIndex(TAGS_TYPE_ADDRESS_PRIVATE_INDEX, {
        KEYMANAGER_KEY_TAG,
        keys::KeyTypeToString(Type()),
        address,
        boolIndexValue(isPrivate)
    });
}

Result<KeyPtr> EncryptionScheme::GetKey(const std::string& address, bool isPrivate) {
    auto docsResult = getKeyDocuments(address, isPrivate);
    if (!docsResult.ok()) {
        return docsResult.error();
    }

    const auto& docs = docsResult.value();
    if (docs.empty()) {
        return Error(ErrorCode::KeyNotFound,
                     std::string(isPrivate ? "Private" : "Public") + " " +
                     keys::KeyTypeToString(Type()) + " key not found for " + address);
    }
    if (docs.size() > 1) {
        utils::GetLogger().Warn("More than one key document for address",
            utils::LogContext()
                .With("address", address)
                .With("private", boolIndexValue(isPrivate))
                .With("count", std::to_string(docs.size())));
    }
    return keys::BuildKeyFromJson(Type(), docs.front().content);
}

Error EncryptionScheme::PutKey(const KeyPtr& key) {
    if (!key) {
        return Error(ErrorCode::InvalidArgument, "Cannot store an empty key");
    }
    if (key->Type() != Type()) {
        return Error(ErrorCode::UnknownKeyType,
                     "Key of type " + keys::KeyTypeToString(key->Type()) +
                     " given to " + keys::KeyTypeToString(Type()) + " scheme");
    }

    auto docsResult = getKeyDocuments(key->Address(), key->IsPrivate());
    if (!docsResult.ok()) {
        return docsResult.error();
    }

    storage::json content = key->ToJson();
    auto docs = docsResult.value();
    if (docs.empty()) {
        auto created = store_->CreateDoc(content);
        return created.ok() ? Error() : created.error();
    }

    // 首次出现时间沿用旧记录
    auto& doc = docs.front();
    if (doc.content.contains("first_seen_at") && doc.content["first_seen_at"].is_number_integer()) {
        auto firstSeen = doc.content["first_seen_at"].get<int64_t>();
        if (firstSeen != 0) {
            content["first_seen_at"] = firstSeen;
        }
    }
    doc.content = content;
    return store_->PutDoc(doc);
}

Result<std::vector<KeyPtr>> EncryptionScheme::PutAsciiKey(const std::string& keyData,
                                                          const std::string& validation,
                                                          bool publicOnly) {
    auto parsed = ParseAsciiKey(keyData, validation, publicOnly);
    if (!parsed.ok()) {
        return parsed.error();
    }
    for (const auto& key : parsed.value()) {
        Error err = PutKey(key);
        if (err.hasError()) {
            return err;
        }
    }
    return parsed;
}

Error EncryptionScheme::DeleteKey(const KeyPtr& key) {
    if (!key) {
        return Error(ErrorCode::InvalidArgument, "Cannot delete an empty key");
    }

    auto docsResult = getKeyDocuments(key->Address(), key->IsPrivate());
    if (!docsResult.ok()) {
        return docsResult.error();
    }

    for (const auto& doc : docsResult.value()) {
        if (doc.content.value("fingerprint", "") == key->Fingerprint()) {
            return store_->DeleteDoc(doc.id);
        }
    }
    return Error(ErrorCode::KeyNotFound, "Key " + key->Fingerprint() + " not found for " + key->Address());
}

} // namespace scheme
} // namespace nicknym
