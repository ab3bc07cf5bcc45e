#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "nicknym/types.hpp"
#include "nicknym/keys/keys.hpp"
#include "nicknym/storage/document_store.hpp"

namespace nicknym {
namespace scheme {

using keys::EncryptionKey;
using KeyPtr = std::shared_ptr<keys::EncryptionKey>;

// 某一密钥类型的后端：密钥生成、本地存取和加解密/签名/验签。
//
// 基类负责与本地文档存储打交道的公共部分，子类只需实现密码学操作和
// 密钥导入。调用方（KeyManager）已经检查过密钥类型和公私钥角色。
class EncryptionScheme {
public:
    explicit EncryptionScheme(std::shared_ptr<storage::DocumentStore> store);
    virtual ~EncryptionScheme() = default;

    virtual keys::KeyType Type() const = 0;

    // 是否支持把公钥发布到服务商
    virtual bool CanPublish() const { return false; }

    // 为地址生成密钥对并存入本地，返回私钥
    virtual Result<KeyPtr> GenKey(const std::string& address) = 0;

    // 解析ASCII armor格式的密钥数据，不写入本地存储。
    // publicOnly 为 true 时忽略其中的私钥部分（用于远程获取的密钥）。
    virtual Result<std::vector<KeyPtr>> ParseAsciiKey(const std::string& keyData,
                                                      const std::string& validation = keys::WEAK_CHAIN,
                                                      bool publicOnly = false) = 0;

    // 解析并把其中所有密钥存入本地，返回存入的密钥
    Result<std::vector<KeyPtr>> PutAsciiKey(const std::string& keyData,
                                            const std::string& validation = keys::WEAK_CHAIN,
                                            bool publicOnly = false);

    virtual Result<std::string> Encrypt(const std::string& data,
                                        const KeyPtr& pubkey,
                                        const std::string& passphrase = "",
                                        const KeyPtr& signWith = nullptr) = 0;

    virtual Result<std::string> Decrypt(const std::string& data,
                                        const KeyPtr& privkey,
                                        const std::string& passphrase = "",
                                        const KeyPtr& verifyWith = nullptr) = 0;

    // detach 为 true 时只返回签名本身
    virtual Result<std::string> Sign(const std::string& data,
                                     const KeyPtr& privkey,
                                     bool detach = false) = 0;

    // signature 为空时 data 应是内嵌签名的数据
    virtual Result<bool> Verify(const std::string& data,
                                const KeyPtr& pubkey,
                                const std::string& signature = "") = 0;

    // 在本地存储中查找地址对应的密钥，找不到返回 KeyNotFound
    virtual Result<KeyPtr> GetKey(const std::string& address, bool isPrivate);

    // 写入密钥，同一地址同一角色已有密钥时覆盖
    virtual Error PutKey(const KeyPtr& key);

    // 删除密钥，指纹不一致时返回 KeyNotFound
    virtual Error DeleteKey(const KeyPtr& key);

protected:
    // 查找 (address, private) 对应的文档，找不到时返回的 vector 为空
    Result<std::vector<storage::Document>> getKeyDocuments(const std::string& address, bool isPrivate);

    std::shared_ptr<storage::DocumentStore> store_;

private:
    Error ensureIndexes();

    std::mutex indexMutex_;
    bool indexesReady_ = false;
};

} // namespace scheme
} // namespace nicknym
