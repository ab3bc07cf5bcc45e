#include "nicknym/keymanager.hpp"
#include "nicknym/utils/logger.hpp"
#include "nicknym/utils/tools.hpp"
#include <set>

namespace nicknym {

namespace {

const std::string JSON_CONTENT_TYPE = "application/json";

bool isJsonContentType(const std::string& contentType) {
    return contentType.compare(0, JSON_CONTENT_TYPE.size(), JSON_CONTENT_TYPE) == 0;
}

utils::LogContext keyContext(const KeyPtr& key) {
    return utils::LogContext()
        .With("address", key->Address())
        .With("type", keys::KeyTypeToString(key->Type()))
        .With("fingerprint", key->Fingerprint());
}

} // namespace

KeyManager::KeyManager(const KeyManagerConfig& config,
                       std::shared_ptr<storage::DocumentStore> store,
                       std::shared_ptr<transport::Transport> transport)
    : KeyManager(config, store,
                 registry::SchemeRegistry::CreateDefault(store, config.openpgp),
                 std::move(transport)) {}

KeyManager::KeyManager(const KeyManagerConfig& config,
                       std::shared_ptr<storage::DocumentStore> store,
                       registry::RegistryPtr schemes,
                       std::shared_ptr<transport::Transport> transport)
    : address_(config.address),
      config_(config),
      store_(std::move(store)),
      registry_(schemes ? std::move(schemes) : std::make_shared<const registry::SchemeRegistry>()),
      transport_(std::move(transport)) {}

// ---------------------------------------------------------------------------
// 配置

std::string KeyManager::NickserverUri() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.nickserverUri;
}

void KeyManager::SetNickserverUri(const std::string& uri) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.nickserverUri = uri;
}

std::string KeyManager::SessionId() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.sessionId;
}

void KeyManager::SetSessionId(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.sessionId = sessionId;
}

std::string KeyManager::CaCertPath() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.caCertPath;
}

void KeyManager::SetCaCertPath(const std::string& path) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.caCertPath = path;
}

std::string KeyManager::ApiUri() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.apiUri;
}

void KeyManager::SetApiUri(const std::string& uri) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.apiUri = uri;
}

std::string KeyManager::ApiVersion() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.apiVersion;
}

void KeyManager::SetApiVersion(const std::string& version) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.apiVersion = version;
}

std::string KeyManager::Uid() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.uid;
}

void KeyManager::SetUid(const std::string& uid) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.uid = uid;
}

KeyManagerConfig KeyManager::Config() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

// ---------------------------------------------------------------------------
// 密钥解析

Result<registry::SchemeRegistry::SchemePtr> KeyManager::backendFor(keys::KeyType type) const {
    return registry_->BackendFor(type);
}

Result<KeyPtr> KeyManager::GetKey(const std::string& address,
                                  keys::KeyType type,
                                  bool isPrivate,
                                  bool fetchRemote) {
    auto backend = backendFor(type);
    if (!backend.ok()) {
        return backend.error();
    }

    auto key = backend.value()->GetKey(address, isPrivate);
    if (key.ok() || key.error().code() != ErrorCode::KeyNotFound) {
        return key;
    }
    if (isPrivate || !fetchRemote) {
        return key;
    }

    utils::GetLogger().Debug("Key not found locally, fetching from directory",
        utils::LogContext().With("address", address).With("type", keys::KeyTypeToString(type)));

    Error err = fetchKeys(address, Config());
    if (err.hasError()) {
        return err;
    }
    return backend.value()->GetKey(address, false);
}

Error KeyManager::FetchKeysFromServer(const std::string& address) {
    return fetchKeys(address, Config());
}

Error KeyManager::fetchKeys(const std::string& address, const KeyManagerConfig& config) {
    if (!transport_) {
        return Error(ErrorCode::MissingConfiguration, "No transport configured");
    }
    if (config.nickserverUri.empty()) {
        return Error(ErrorCode::MissingConfiguration, "Nickserver URI not set");
    }
    if (config.caCertPath.empty()) {
        return Error(ErrorCode::MissingConfiguration, "CA certificate path not set");
    }

    auto response = transport_->Get(config.nickserverUri, {{"address", address}}, config.caCertPath);
    if (!response.ok()) {
        utils::GetLogger().Error("Key lookup request failed",
            utils::LogContext().With("address", address).With("error", response.error().what()));
        return response.error();
    }

    const auto& resp = response.value();
    if (!resp.IsSuccess()) {
        utils::GetLogger().Error("Key lookup returned error status",
            utils::LogContext().With("address", address).With("status", std::to_string(resp.status)));
        return Error(ErrorCode::TransportFailure,
                     "Key lookup for " + address + " failed with status " + std::to_string(resp.status));
    }
    if (!isJsonContentType(resp.contentType)) {
        return Error(ErrorCode::TransportFailure,
                     "Unexpected content type from key lookup: " + resp.contentType);
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(resp.body);
    } catch (const nlohmann::json::exception& e) {
        return Error(ErrorCode::TransportFailure, std::string("Malformed key lookup response: ") + e.what());
    }
    if (!body.is_object()) {
        return Error(ErrorCode::TransportFailure, "Malformed key lookup response: not an object");
    }

    bool found = false;
    for (const auto& backend : registry_->Backends()) {
        std::string tag = registry_->TypeTagFor(backend->Type());
        auto it = body.find(tag);
        if (it == body.end() || !it->is_string()) {
            continue;
        }

        auto parsed = backend->ParseAsciiKey(it->get<std::string>(), keys::PROVIDER_TRUST, true);
        if (!parsed.ok()) {
            utils::GetLogger().Error("Failed to parse fetched key",
                utils::LogContext().With("address", address).With("type", tag)
                    .With("error", parsed.error().what()));
            return parsed.error();
        }

        // 只接受绑定到所查地址的公钥
        for (const auto& key : parsed.value()) {
            if (key->IsPrivate()) {
                continue;
            }
            if (key->Address() != address) {
                utils::GetLogger().Warn("Ignoring fetched key bound to a different address",
                    keyContext(key).With("requested", address));
                continue;
            }
            Error err = storeFetchedKey(backend, key);
            if (err.hasError()) {
                utils::GetLogger().Error("Failed to store fetched key",
                    keyContext(key).With("error", err.what()));
                return err;
            }
            found = true;
        }
    }

    utils::GetLogger().Info("Fetched keys from directory",
        utils::LogContext().With("address", address).With("found", found ? "true" : "false"));
    return Error();
}

Error KeyManager::storeFetchedKey(const registry::SchemeRegistry::SchemePtr& backend, const KeyPtr& key) {
    auto existing = backend->GetKey(key->Address(), false);
    if (!existing.ok()) {
        if (existing.error().code() != ErrorCode::KeyNotFound) {
            return existing.error();
        }
        return backend->PutKey(key);
    }

    const auto& current = existing.value();
    int currentRank = keys::ValidationRank(current->Metadata().validation);
    if (currentRank <= keys::ValidationRank(key->Metadata().validation)) {
        return backend->PutKey(key);
    }

    // 本地密钥更可信：指纹不同则保留本地密钥，相同则只更新密钥数据
    if (current->Fingerprint() != key->Fingerprint()) {
        utils::GetLogger().Warn("Fetched key does not replace a more trusted local key",
            keyContext(key)
                .With("local_fingerprint", current->Fingerprint())
                .With("local_validation", current->Metadata().validation));
        return Error();
    }
    auto content = key->ToJson();
    content["validation"] = current->Metadata().validation;
    auto merged = keys::BuildKeyFromJson(key->Type(), content);
    if (!merged.ok()) {
        return merged.error();
    }
    return backend->PutKey(merged.value());
}

Error KeyManager::RefreshKeys() {
    KeyManagerConfig config = Config();

    auto keysResult = GetAllKeysInLocalDb(false);
    if (!keysResult.ok()) {
        return keysResult.error();
    }

    std::set<std::string> addresses;
    for (const auto& key : keysResult.value()) {
        addresses.insert(key->Address());
    }
    addresses.erase(address_);

    std::vector<std::string> failed;
    ErrorCode failureCode = ErrorCode::Ok;
    bool allTransport = true;
    for (const auto& address : addresses) {
        Error err = fetchKeys(address, config);
        if (err.ok()) {
            continue;
        }
        if (failed.empty()) {
            failureCode = err.code();
        }
        allTransport = allTransport && err.code() == ErrorCode::TransportFailure;
        failed.push_back(address + " (" + err.what() + ")");
    }

    utils::GetLogger().Info("Refreshed keys",
        utils::LogContext()
            .With("addresses", std::to_string(addresses.size()))
            .With("failed", std::to_string(failed.size())));

    if (failed.empty()) {
        return Error();
    }
    return Error(allTransport ? ErrorCode::TransportFailure : failureCode,
                 "Failed to refresh keys for: " + utils::VectorToString(failed));
}

Result<KeyPtr> KeyManager::GenKey(keys::KeyType type) {
    auto backend = backendFor(type);
    if (!backend.ok()) {
        return backend.error();
    }
    return backend.value()->GenKey(address_);
}

Error KeyManager::SendKey(keys::KeyType type) {
    auto backend = backendFor(type);
    if (!backend.ok()) {
        return backend.error();
    }
    if (!backend.value()->CanPublish()) {
        return Error(ErrorCode::UnknownKeyType,
                     "Publishing " + keys::KeyTypeToString(type) + " keys is not supported");
    }

    KeyManagerConfig config = Config();
    if (config.caCertPath.empty()) {
        return Error(ErrorCode::MissingConfiguration, "CA certificate path not set");
    }
    if (config.sessionId.empty()) {
        return Error(ErrorCode::AuthenticationRequired, "No session id, log in first");
    }
    if (config.apiUri.empty() || config.uid.empty()) {
        return Error(ErrorCode::MissingConfiguration, "API URI and uid are required to publish keys");
    }
    if (!transport_) {
        return Error(ErrorCode::MissingConfiguration, "No transport configured");
    }

    auto key = GetKey(address_, type, false, false);
    if (!key.ok()) {
        return key.error();
    }

    std::string url = utils::TrimTrailingSlash(config.apiUri) + "/" + config.apiVersion +
                      "/users/" + config.uid + ".json";
    auto response = transport_->Put(url,
                                    {{PUBKEY_KEY, key.value()->KeyData()}},
                                    config.caCertPath,
                                    {{SESSION_COOKIE, config.sessionId}});
    if (!response.ok()) {
        utils::GetLogger().Error("Key publish request failed",
            keyContext(key.value()).With("error", response.error().what()));
        return response.error();
    }
    if (!response.value().IsSuccess()) {
        utils::GetLogger().Error("Key publish returned error status",
            keyContext(key.value()).With("status", std::to_string(response.value().status)));
        return Error(ErrorCode::TransportFailure,
                     "Key publish failed with status " + std::to_string(response.value().status));
    }

    utils::GetLogger().Info("Published public key", keyContext(key.value()));
    return Error();
}

Result<std::vector<KeyPtr>> KeyManager::GetAllKeysInLocalDb(bool isPrivate) {
    if (!store_) {
        return Error(ErrorCode::StorageFailure, "No local store configured");
    }

    Error err = store_->CreateIndex(TAGS_PRIVATE_INDEX, {"tags", "private"});
    if (err.hasError()) {
        return err;
    }
    auto docs = store_->GetFromIndex(TAGS_PRIVATE_INDEX, {KEYMANAGER_KEY_TAG, isPrivate ? "1" : "0"});
    if (!docs.ok()) {
        return docs.error();
    }

    std::vector<KeyPtr> result;
    for (const auto& doc : docs.value()) {
        auto key = registry_->BuildKeyFromDocument(doc.content);
        if (!key.ok()) {
            utils::GetLogger().Error("Unreadable key document in local store",
                utils::LogContext().With("doc", doc.id).With("error", key.error().what()));
            return key.error();
        }
        result.push_back(key.value());
    }
    return result;
}

Error KeyManager::PutKey(const KeyPtr& key) {
    if (!key) {
        return Error(ErrorCode::InvalidArgument, "Cannot store an empty key");
    }
    auto backend = backendFor(key->Type());
    if (!backend.ok()) {
        return backend.error();
    }
    return backend.value()->PutKey(key);
}

Result<std::vector<KeyPtr>> KeyManager::PutAsciiKey(keys::KeyType type, const std::string& keyData) {
    auto backend = backendFor(type);
    if (!backend.ok()) {
        return backend.error();
    }
    return backend.value()->PutAsciiKey(keyData);
}

Error KeyManager::DeleteKey(const KeyPtr& key) {
    if (!key) {
        return Error(ErrorCode::InvalidArgument, "Cannot delete an empty key");
    }
    auto backend = backendFor(key->Type());
    if (!backend.ok()) {
        return backend.error();
    }
    return backend.value()->DeleteKey(key);
}

// ---------------------------------------------------------------------------
// 操作分派

Result<registry::SchemeRegistry::SchemePtr> KeyManager::backendForKey(const KeyPtr& key,
                                                                      bool wantPrivate,
                                                                      const std::string& operation) const {
    if (!key) {
        return Error(ErrorCode::InvalidArgument, operation + " requires a key");
    }
    auto backend = backendFor(key->Type());
    if (!backend.ok()) {
        return backend.error();
    }
    if (key->IsPrivate() != wantPrivate) {
        return Error(ErrorCode::RoleViolation,
                     operation + " requires a " + (wantPrivate ? "private" : "public") +
                     " key, got " + (key->IsPrivate() ? "private" : "public") +
                     " key for " + key->Address());
    }
    return backend;
}

Result<std::string> KeyManager::Encrypt(const std::string& data,
                                        const KeyPtr& pubkey,
                                        const std::string& passphrase,
                                        const KeyPtr& signWith) {
    auto backend = backendForKey(pubkey, false, "Encrypt");
    if (!backend.ok()) {
        return backend.error();
    }
    if (signWith) {
        auto signer = backendForKey(signWith, true, "Signing while encrypting");
        if (!signer.ok()) {
            return signer.error();
        }
        if (signWith->Type() != pubkey->Type()) {
            return Error(ErrorCode::UnknownKeyType,
                         "Cannot sign " + keys::KeyTypeToString(pubkey->Type()) + " data with a " +
                         keys::KeyTypeToString(signWith->Type()) + " key");
        }
    }
    return backend.value()->Encrypt(data, pubkey, passphrase, signWith);
}

Result<std::string> KeyManager::Decrypt(const std::string& data,
                                        const KeyPtr& privkey,
                                        const std::string& passphrase,
                                        const KeyPtr& verifyWith) {
    auto backend = backendForKey(privkey, true, "Decrypt");
    if (!backend.ok()) {
        return backend.error();
    }
    if (verifyWith) {
        auto verifier = backendForKey(verifyWith, false, "Verifying while decrypting");
        if (!verifier.ok()) {
            return verifier.error();
        }
        if (verifyWith->Type() != privkey->Type()) {
            return Error(ErrorCode::UnknownKeyType,
                         "Cannot verify " + keys::KeyTypeToString(privkey->Type()) + " data with a " +
                         keys::KeyTypeToString(verifyWith->Type()) + " key");
        }
    }
    return backend.value()->Decrypt(data, privkey, passphrase, verifyWith);
}

Result<std::string> KeyManager::Sign(const std::string& data,
                                     const KeyPtr& privkey,
                                     bool detach) {
    auto backend = backendForKey(privkey, true, "Sign");
    if (!backend.ok()) {
        return backend.error();
    }
    return backend.value()->Sign(data, privkey, detach);
}

Result<bool> KeyManager::Verify(const std::string& data,
                                const KeyPtr& pubkey,
                                const std::string& signature) {
    auto backend = backendForKey(pubkey, false, "Verify");
    if (!backend.ok()) {
        return backend.error();
    }
    return backend.value()->Verify(data, pubkey, signature);
}

} // namespace nicknym
