#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "nicknym/types.hpp"
#include "nicknym/keys/keys.hpp"
#include "nicknym/storage/document_store.hpp"
#include "nicknym/scheme/encryption_scheme.hpp"
#include "nicknym/scheme/openpgp_scheme.hpp"
#include "nicknym/registry/scheme_registry.hpp"
#include "nicknym/transport/transport.hpp"

namespace nicknym {

using KeyPtr = scheme::KeyPtr;

// 密钥管理器配置。可选项用空字符串表示未设置。
struct KeyManagerConfig {
    std::string address;        // 本机用户地址，构造后不可修改
    std::string nickserverUri;  // 公钥目录服务
    std::string sessionId;      // 登录后的会话令牌，发布公钥时需要
    std::string caCertPath;     // 服务端证书的CA文件，任何网络请求都需要
    std::string apiUri;
    std::string apiVersion = "1";
    std::string uid;            // 服务商分配的用户ID
    scheme::OpenPGPOptions openpgp;
};

// 密钥管理器：按地址解析密钥（本地优先，缺失时从目录服务获取），
// 向服务商发布自己的公钥，并把加解密/签名/验签分派给对应类型的后端。
//
// 配置可以在运行中修改，所有读写都经过同一个互斥量；
// 每个请求开始时取一次配置快照。
class KeyManager {
public:
    KeyManager(const KeyManagerConfig& config,
               std::shared_ptr<storage::DocumentStore> store,
               std::shared_ptr<transport::Transport> transport);

    KeyManager(const KeyManagerConfig& config,
               std::shared_ptr<storage::DocumentStore> store,
               registry::RegistryPtr schemes,
               std::shared_ptr<transport::Transport> transport);

    // 查找地址对应的密钥。本地没有时，若允许远程获取且查找的是公钥，
    // 则从目录服务获取后再查一次本地。私钥永远不会从远程获取。
    Result<KeyPtr> GetKey(const std::string& address,
                          keys::KeyType type,
                          bool isPrivate = false,
                          bool fetchRemote = true);

    // 从目录服务获取地址的公钥并存入本地。目录中没有该地址不算错误。
    Error FetchKeysFromServer(const std::string& address);

    // 重新获取本地所有公钥（自己的除外），单个地址失败不影响其他地址，
    // 最后汇总返回失败的地址。
    Error RefreshKeys();

    // 为自己的地址生成密钥对
    Result<KeyPtr> GenKey(keys::KeyType type);

    // 把自己的公钥发布到服务商
    Error SendKey(keys::KeyType type);

    Result<std::vector<KeyPtr>> GetAllKeysInLocalDb(bool isPrivate = false);

    Error PutKey(const KeyPtr& key);
    Result<std::vector<KeyPtr>> PutAsciiKey(keys::KeyType type, const std::string& keyData);
    Error DeleteKey(const KeyPtr& key);

    Result<std::string> Encrypt(const std::string& data,
                                const KeyPtr& pubkey,
                                const std::string& passphrase = "",
                                const KeyPtr& signWith = nullptr);

    Result<std::string> Decrypt(const std::string& data,
                                const KeyPtr& privkey,
                                const std::string& passphrase = "",
                                const KeyPtr& verifyWith = nullptr);

    Result<std::string> Sign(const std::string& data,
                             const KeyPtr& privkey,
                             bool detach = false);

    Result<bool> Verify(const std::string& data,
                        const KeyPtr& pubkey,
                        const std::string& signature = "");

    const std::string& Address() const { return address_; }

    std::string NickserverUri() const;
    void SetNickserverUri(const std::string& uri);
    std::string SessionId() const;
    void SetSessionId(const std::string& sessionId);
    std::string CaCertPath() const;
    void SetCaCertPath(const std::string& path);
    std::string ApiUri() const;
    void SetApiUri(const std::string& uri);
    std::string ApiVersion() const;
    void SetApiVersion(const std::string& version);
    std::string Uid() const;
    void SetUid(const std::string& uid);

    // 当前配置的快照
    KeyManagerConfig Config() const;

    const registry::SchemeRegistry& Registry() const { return *registry_; }

private:
    Result<registry::SchemeRegistry::SchemePtr> backendFor(keys::KeyType type) const;

    // 先检查类型已注册，再检查公私钥角色
    Result<registry::SchemeRegistry::SchemePtr> backendForKey(const KeyPtr& key,
                                                              bool wantPrivate,
                                                              const std::string& operation) const;

    Error fetchKeys(const std::string& address, const KeyManagerConfig& config);

    // 写入从目录获取的公钥，不覆盖可信度更高的本地密钥
    Error storeFetchedKey(const registry::SchemeRegistry::SchemePtr& backend, const KeyPtr& key);

    const std::string address_;
    mutable std::mutex configMutex_;
    KeyManagerConfig config_;
    std::shared_ptr<storage::DocumentStore> store_;
    registry::RegistryPtr registry_;
    std::shared_ptr<transport::Transport> transport_;
};

} // namespace nicknym
