#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "nicknym/types.hpp"

namespace nicknym {
namespace keys {

using json = nlohmann::json;

// 支持的密钥类型，新增类型时同时扩展 KeyTypeToString/ParseKeyType
enum class KeyType {
    OpenPGP
};

std::string KeyTypeToString(KeyType type);

// 由存储中的类型标签还原密钥类型，未知标签返回 UnknownKeyType
Result<KeyType> ParseKeyType(const std::string& tag);

// 密钥可信度等级，从弱到强
const std::string WEAK_CHAIN              = "weak_chain";
const std::string PROVIDER_TRUST          = "provider_trust";
const std::string PROVIDER_ENDORSEMENT    = "provider_endorsement";
const std::string THIRD_PARTY_ENDORSEMENT = "third_party_endorsement";
const std::string THIRD_PARTY_CONSENSUS   = "third_party_consensus";
const std::string HISTORICALLY_AUDITING   = "historically_auditing";
const std::string KNOWN_KEY               = "known_key";
const std::string FINGERPRINT             = "fingerprint";

// 可信度在上面列表中的位置，越大越可信；未知等级按最弱处理
int ValidationRank(const std::string& validation);

// 密钥附加属性
struct KeyMetadata {
    uint32_t length = 0;
    int64_t expiryDate = 0;      // 0 表示永不过期
    std::string validation = WEAK_CHAIN;
    int64_t firstSeenAt = 0;
    int64_t lastAuditedAt = 0;
};

// 加密密钥基类。私钥标志在构造后不可修改，
// 公钥只能用于加密和验签，私钥只能用于解密和签名。
class EncryptionKey {
public:
    virtual ~EncryptionKey() = default;

    virtual KeyType Type() const = 0;

    const std::string& Address() const { return address_; }
    const std::string& KeyID() const { return keyId_; }
    const std::string& Fingerprint() const { return fingerprint_; }
    const std::string& KeyData() const { return keyData_; }
    bool IsPrivate() const { return private_; }
    const KeyMetadata& Metadata() const { return metadata_; }

    // 转换为本地存储的文档内容
    json ToJson() const;

protected:
    EncryptionKey(const std::string& address,
                  const std::string& keyId,
                  const std::string& fingerprint,
                  const std::string& keyData,
                  bool isPrivate,
                  const KeyMetadata& metadata)
        : address_(address), keyId_(keyId), fingerprint_(fingerprint),
          keyData_(keyData), private_(isPrivate), metadata_(metadata) {}

private:
    std::string address_;
    std::string keyId_;
    std::string fingerprint_;
    std::string keyData_;   // ASCII armor
    const bool private_;
    KeyMetadata metadata_;
};

class OpenPGPKey : public EncryptionKey {
public:
    OpenPGPKey(const std::string& address,
               const std::string& keyId,
               const std::string& fingerprint,
               const std::string& keyData,
               bool isPrivate,
               const KeyMetadata& metadata = KeyMetadata())
        : EncryptionKey(address, keyId, fingerprint, keyData, isPrivate, metadata) {}

    KeyType Type() const override { return KeyType::OpenPGP; }
};

// 按类型构造具体密钥对象，地址取自文档
Result<std::shared_ptr<EncryptionKey>> BuildKeyFromJson(KeyType type, const json& content);

} // namespace keys
} // namespace nicknym
