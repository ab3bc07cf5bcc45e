#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "nicknym/types.hpp"
#include "nicknym/keys/keys.hpp"
#include "nicknym/scheme/encryption_scheme.hpp"
#include "nicknym/scheme/openpgp_scheme.hpp"

namespace nicknym {
namespace registry {

// 密钥类型到后端的映射表。构造完成后不再修改，可以在线程间共享。
class SchemeRegistry {
public:
    using SchemePtr = std::shared_ptr<scheme::EncryptionScheme>;

    SchemeRegistry() = default;
    explicit SchemeRegistry(const std::vector<SchemePtr>& schemes);

    // 默认注册表：只包含 OpenPGP 后端
    static std::shared_ptr<const SchemeRegistry> CreateDefault(
        std::shared_ptr<storage::DocumentStore> store,
        const scheme::OpenPGPOptions& options);

    bool Contains(keys::KeyType type) const;

    // 未注册的类型返回 UnknownKeyType
    Result<SchemePtr> BackendFor(keys::KeyType type) const;

    std::string TypeTagFor(keys::KeyType type) const;

    // 存储标签的逆映射，只接受已注册的类型
    Result<keys::KeyType> KeyTypeForTag(const std::string& tag) const;

    // 按文档中的 type 字段还原密钥对象
    Result<scheme::KeyPtr> BuildKeyFromDocument(const nlohmann::json& content) const;

    std::vector<SchemePtr> Backends() const;

private:
    std::map<keys::KeyType, SchemePtr> schemes_;
};

using RegistryPtr = std::shared_ptr<const SchemeRegistry>;

} // namespace registry
} // namespace nicknym
