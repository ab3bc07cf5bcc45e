#pragma once

#include <cstdint>
#include <string>
#include "nicknym/scheme/encryption_scheme.hpp"

namespace nicknym {
namespace scheme {

// OpenPGP 后端参数
struct OpenPGPOptions {
    std::string keystoreFormat = "GPG";
    std::string keyAlg = "RSA";
    std::string subAlg = "RSA";
    uint32_t keyBits = 4096;
    uint32_t subBits = 4096;
    std::string keyCurve;   // 空表示算法默认曲线
    std::string subCurve;
};

// 基于 librnp 的 OpenPGP 实现。
// 每次操作都新建一个内存密钥环，只导入本次需要的密钥，用完即销毁。
class OpenPGPScheme : public EncryptionScheme {
public:
    OpenPGPScheme(std::shared_ptr<storage::DocumentStore> store,
                  const OpenPGPOptions& options = OpenPGPOptions());

    keys::KeyType Type() const override { return keys::KeyType::OpenPGP; }
    bool CanPublish() const override { return true; }

    Result<KeyPtr> GenKey(const std::string& address) override;
    Result<std::vector<KeyPtr>> ParseAsciiKey(const std::string& keyData,
                                              const std::string& validation = keys::WEAK_CHAIN,
                                              bool publicOnly = false) override;

    Result<std::string> Encrypt(const std::string& data,
                                const KeyPtr& pubkey,
                                const std::string& passphrase = "",
                                const KeyPtr& signWith = nullptr) override;

    Result<std::string> Decrypt(const std::string& data,
                                const KeyPtr& privkey,
                                const std::string& passphrase = "",
                                const KeyPtr& verifyWith = nullptr) override;

    Result<std::string> Sign(const std::string& data,
                             const KeyPtr& privkey,
                             bool detach = false) override;

    Result<bool> Verify(const std::string& data,
                        const KeyPtr& pubkey,
                        const std::string& signature = "") override;

    const OpenPGPOptions& Options() const { return options_; }

private:
    OpenPGPOptions options_;
};

} // namespace scheme
} // namespace nicknym
