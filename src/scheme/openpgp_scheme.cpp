#include "nicknym/scheme/openpgp_scheme.hpp"
#include "nicknym/utils/logger.hpp"
#include "nicknym/utils/tools.hpp"
#include <rnp/rnp.h>
#include <rnp/rnp_err.h>
#include <chrono>
#include <cstring>
#include <type_traits>

namespace nicknym {
namespace scheme {

namespace {

template<typename Handle, typename Deleter>
using RnpPtr = std::unique_ptr<typename std::remove_pointer<Handle>::type, Deleter>;

using FfiPtr = RnpPtr<rnp_ffi_t, decltype(&rnp_ffi_destroy)>;
using InputPtr = RnpPtr<rnp_input_t, decltype(&rnp_input_destroy)>;
using OutputPtr = RnpPtr<rnp_output_t, decltype(&rnp_output_destroy)>;
using KeyHandlePtr = RnpPtr<rnp_key_handle_t, decltype(&rnp_key_handle_destroy)>;
using EncryptOpPtr = RnpPtr<rnp_op_encrypt_t, decltype(&rnp_op_encrypt_destroy)>;
using SignOpPtr = RnpPtr<rnp_op_sign_t, decltype(&rnp_op_sign_destroy)>;
using VerifyOpPtr = RnpPtr<rnp_op_verify_t, decltype(&rnp_op_verify_destroy)>;

Error rnpError(const std::string& what, rnp_result_t ret) {
    return Error(ErrorCode::BackendFailure, what + ": " + rnp_result_to_string(ret));
}

// 口令错误时区分"没给口令"和"口令不对"
Error operationError(const std::string& what, rnp_result_t ret, const std::string& passphrase) {
    if (ret == RNP_ERROR_BAD_PASSWORD) {
        if (passphrase.empty()) {
            return Error(ErrorCode::MissingCredential, what + ": passphrase required");
        }
        return Error(ErrorCode::BackendFailure, what + ": wrong passphrase");
    }
    return rnpError(what, ret);
}

bool isSignatureFailure(rnp_result_t ret) {
    return ret == RNP_ERROR_SIGNATURE_INVALID ||
           ret == RNP_ERROR_SIGNATURE_EXPIRED ||
           ret == RNP_ERROR_KEY_NOT_FOUND ||
           ret == RNP_ERROR_NO_SIGNATURES_FOUND;
}

std::string takeString(char* value) {
    std::string result = value ? value : "";
    rnp_buffer_destroy(value);
    return result;
}

int64_t nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

Error memoryInput(const std::string& data, InputPtr& input) {
    rnp_input_t raw = nullptr;
    rnp_result_t ret = rnp_input_from_memory(&raw, reinterpret_cast<const uint8_t*>(data.data()),
                                             data.size(), true);
    if (ret != RNP_SUCCESS) {
        return rnpError("Failed to create input", ret);
    }
    input.reset(raw);
    return Error();
}

Error memoryOutput(OutputPtr& output) {
    rnp_output_t raw = nullptr;
    rnp_result_t ret = rnp_output_to_memory(&raw, 0);
    if (ret != RNP_SUCCESS) {
        return rnpError("Failed to create output", ret);
    }
    output.reset(raw);
    return Error();
}

Result<std::string> outputString(rnp_output_t output) {
    uint8_t* buf = nullptr;
    size_t len = 0;
    rnp_result_t ret = rnp_output_memory_get_buf(output, &buf, &len, false);
    if (ret != RNP_SUCCESS) {
        return rnpError("Failed to read output", ret);
    }
    return std::string(reinterpret_cast<const char*>(buf), len);
}

// 一次操作用的内存密钥环，口令通过回调提供
class RnpSession {
public:
    RnpSession() : ffi_(nullptr, rnp_ffi_destroy) {}
    RnpSession(const RnpSession&) = delete;
    RnpSession& operator=(const RnpSession&) = delete;

    Error Open(const std::string& format, const std::string& passphrase) {
        rnp_ffi_t raw = nullptr;
        rnp_result_t ret = rnp_ffi_create(&raw, format.c_str(), format.c_str());
        if (ret != RNP_SUCCESS) {
            return rnpError("Failed to create keyring", ret);
        }
        ffi_.reset(raw);
        passphrase_ = passphrase;

        ret = rnp_ffi_set_pass_provider(raw, &RnpSession::passProvider, this);
        if (ret != RNP_SUCCESS) {
            return rnpError("Failed to set passphrase provider", ret);
        }
        return Error();
    }

    rnp_ffi_t get() const { return ffi_.get(); }

    Error Import(const std::string& armored, std::string* results = nullptr) {
        InputPtr input(nullptr, rnp_input_destroy);
        Error err = memoryInput(armored, input);
        if (err.hasError()) {
            return err;
        }

        char* raw = nullptr;
        rnp_result_t ret = rnp_import_keys(ffi_.get(), input.get(),
                                           RNP_LOAD_SAVE_PUBLIC_KEYS | RNP_LOAD_SAVE_SECRET_KEYS,
                                           results ? &raw : nullptr);
        if (ret != RNP_SUCCESS) {
            return Error(ErrorCode::InvalidArgument,
                         std::string("Failed to import key data: ") + rnp_result_to_string(ret));
        }
        if (results) {
            *results = takeString(raw);
        }
        return Error();
    }

    Error Locate(const std::string& fingerprint, KeyHandlePtr& handle) {
        rnp_key_handle_t raw = nullptr;
        rnp_result_t ret = rnp_locate_key(ffi_.get(), "fingerprint", fingerprint.c_str(), &raw);
        if (ret != RNP_SUCCESS) {
            return rnpError("Failed to locate key " + fingerprint, ret);
        }
        if (!raw) {
            return Error(ErrorCode::KeyNotFound, "Key " + fingerprint + " not present in key data");
        }
        handle.reset(raw);
        return Error();
    }

    // 导入存储中的密钥并取得句柄
    Error Load(const KeyPtr& key, KeyHandlePtr& handle) {
        Error err = Import(key->KeyData());
        if (err.hasError()) {
            return err;
        }
        return Locate(key->Fingerprint(), handle);
    }

private:
    static bool passProvider(rnp_ffi_t, void* ctx, rnp_key_handle_t, const char*,
                             char buf[], size_t len) {
        auto* self = static_cast<RnpSession*>(ctx);
        if (self->passphrase_.empty() || self->passphrase_.size() >= len) {
            return false;
        }
        std::memcpy(buf, self->passphrase_.c_str(), self->passphrase_.size() + 1);
        return true;
    }

    FfiPtr ffi_;
    std::string passphrase_;
};

Error keyString(rnp_key_handle_t key, rnp_result_t (*getter)(rnp_key_handle_t, char**),
                const std::string& what, std::string& out) {
    char* raw = nullptr;
    rnp_result_t ret = getter(key, &raw);
    if (ret != RNP_SUCCESS) {
        return rnpError("Failed to read key " + what, ret);
    }
    out = takeString(raw);
    return Error();
}

Error requirePassphrase(rnp_key_handle_t key, const std::string& passphrase) {
    bool isProtected = false;
    rnp_result_t ret = rnp_key_is_protected(key, &isProtected);
    if (ret != RNP_SUCCESS) {
        return rnpError("Failed to query key protection", ret);
    }
    if (isProtected && passphrase.empty()) {
        return Error(ErrorCode::MissingCredential, "Private key is protected, passphrase required");
    }
    return Error();
}

Result<std::string> exportKey(rnp_key_handle_t key, bool secret) {
    OutputPtr output(nullptr, rnp_output_destroy);
    Error err = memoryOutput(output);
    if (err.hasError()) {
        return err;
    }

    uint32_t flags = RNP_KEY_EXPORT_ARMORED | RNP_KEY_EXPORT_SUBKEYS |
                     (secret ? RNP_KEY_EXPORT_SECRET : RNP_KEY_EXPORT_PUBLIC);
    rnp_result_t ret = rnp_key_export(key, output.get(), flags);
    if (ret != RNP_SUCCESS) {
        return rnpError("Failed to export key", ret);
    }
    return outputString(output.get());
}

// 由 rnp 密钥句柄构造存储用的密钥对象
Result<KeyPtr> buildKey(rnp_key_handle_t handle, bool isPrivate, const std::string& validation) {
    std::string fingerprint;
    std::string keyId;
    std::string userId;
    Error err = keyString(handle, rnp_key_get_fprint, "fingerprint", fingerprint);
    if (err.hasError()) {
        return err;
    }
    err = keyString(handle, rnp_key_get_keyid, "key id", keyId);
    if (err.hasError()) {
        return err;
    }
    err = keyString(handle, rnp_key_get_primary_uid, "user id", userId);
    if (err.hasError()) {
        return err;
    }

    std::string address = utils::AddressFromUserID(userId);
    if (address.empty()) {
        return Error(ErrorCode::InvalidArgument, "Key " + fingerprint + " has no usable user id");
    }

    auto armored = exportKey(handle, isPrivate);
    if (!armored.ok()) {
        return armored.error();
    }

    uint32_t bits = 0;
    uint32_t creation = 0;
    uint32_t expiration = 0;
    rnp_key_get_bits(handle, &bits);
    rnp_key_get_creation(handle, &creation);
    if (rnp_key_get_expiration(handle, &expiration) != RNP_SUCCESS) {
        expiration = 0;
    }

    keys::KeyMetadata metadata;
    metadata.length = bits;
    metadata.expiryDate = expiration ? static_cast<int64_t>(creation) + expiration : 0;
    metadata.validation = validation;
    metadata.firstSeenAt = nowSeconds();

    return KeyPtr(std::make_shared<keys::OpenPGPKey>(
        address, keyId, fingerprint, armored.value(), isPrivate, metadata));
}

// 检查验签结果中是否有指定密钥的有效签名，子密钥签名按主密钥计
bool hasValidSignature(rnp_op_verify_t op, const std::string& fingerprint) {
    size_t count = 0;
    if (rnp_op_verify_get_signature_count(op, &count) != RNP_SUCCESS) {
        return false;
    }

    for (size_t i = 0; i < count; ++i) {
        rnp_op_verify_signature_t sig = nullptr;
        if (rnp_op_verify_get_signature_at(op, i, &sig) != RNP_SUCCESS) {
            continue;
        }
        if (rnp_op_verify_signature_get_status(sig) != RNP_SUCCESS) {
            continue;
        }

        rnp_key_handle_t raw = nullptr;
        if (rnp_op_verify_signature_get_key(sig, &raw) != RNP_SUCCESS || !raw) {
            continue;
        }
        KeyHandlePtr signer(raw, rnp_key_handle_destroy);

        bool isSub = false;
        std::string signerFingerprint;
        rnp_key_is_sub(signer.get(), &isSub);
        Error err = keyString(signer.get(), isSub ? rnp_key_get_primary_fprint : rnp_key_get_fprint,
                              "fingerprint", signerFingerprint);
        if (err.ok() && signerFingerprint == fingerprint) {
            return true;
        }
    }
    return false;
}

} // namespace

OpenPGPScheme::OpenPGPScheme(std::shared_ptr<storage::DocumentStore> store,
                             const OpenPGPOptions& options)
    : EncryptionScheme(std::move(store)), options_(options) {}

Result<KeyPtr> OpenPGPScheme::GenKey(const std::string& address) {
    auto existing = GetKey(address, true);
    if (existing.ok()) {
        return Error(ErrorCode::InvalidArgument, "Key already exists for " + address);
    }
    if (existing.error().code() != ErrorCode::KeyNotFound) {
        return existing.error();
    }

    RnpSession session;
    Error err = session.Open(options_.keystoreFormat, "");
    if (err.hasError()) {
        return err;
    }

    utils::GetLogger().Info("Generating OpenPGP key",
        utils::LogContext().With("address", address).With("algorithm", options_.keyAlg));

    rnp_key_handle_t raw = nullptr;
    rnp_result_t ret = rnp_generate_key_ex(
        session.get(),
        options_.keyAlg.c_str(),
        options_.subAlg.empty() ? nullptr : options_.subAlg.c_str(),
        options_.keyBits,
        options_.subBits,
        options_.keyCurve.empty() ? nullptr : options_.keyCurve.c_str(),
        options_.subCurve.empty() ? nullptr : options_.subCurve.c_str(),
        address.c_str(),
        nullptr,
        &raw);
    if (ret != RNP_SUCCESS) {
        return rnpError("Failed to generate key for " + address, ret);
    }
    KeyHandlePtr handle(raw, rnp_key_handle_destroy);

    auto privkey = buildKey(handle.get(), true, keys::FINGERPRINT);
    if (!privkey.ok()) {
        return privkey.error();
    }
    auto pubkey = buildKey(handle.get(), false, keys::FINGERPRINT);
    if (!pubkey.ok()) {
        return pubkey.error();
    }

    err = PutKey(privkey.value());
    if (err.hasError()) {
        return err;
    }
    err = PutKey(pubkey.value());
    if (err.hasError()) {
        return err;
    }

    utils::GetLogger().Info("OpenPGP key generated",
        utils::LogContext().With("address", address).With("fingerprint", privkey.value()->Fingerprint()));
    return privkey.value();
}

Result<std::vector<KeyPtr>> OpenPGPScheme::ParseAsciiKey(const std::string& keyData,
                                                         const std::string& validation,
                                                         bool publicOnly) {
    RnpSession session;
    Error err = session.Open(options_.keystoreFormat, "");
    if (err.hasError()) {
        return err;
    }

    std::string results;
    err = session.Import(keyData, &results);
    if (err.hasError()) {
        return err;
    }

    std::vector<std::string> fingerprints;
    try {
        auto parsed = nlohmann::json::parse(results);
        for (const auto& entry : parsed.at("keys")) {
            fingerprints.push_back(entry.at("fingerprint").get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        return Error(ErrorCode::BackendFailure, std::string("Failed to parse import results: ") + e.what());
    }

    std::vector<KeyPtr> parsed;
    for (const auto& fingerprint : fingerprints) {
        KeyHandlePtr handle(nullptr, rnp_key_handle_destroy);
        err = session.Locate(fingerprint, handle);
        if (err.hasError()) {
            return err;
        }

        bool isSub = false;
        rnp_key_is_sub(handle.get(), &isSub);
        if (isSub) {
            continue;
        }

        auto pubkey = buildKey(handle.get(), false, validation);
        if (!pubkey.ok()) {
            return pubkey.error();
        }
        parsed.push_back(pubkey.value());

        bool haveSecret = false;
        rnp_key_have_secret(handle.get(), &haveSecret);
        if (haveSecret && publicOnly) {
            utils::GetLogger().Warn("Ignoring secret key material in public key data",
                utils::LogContext().With("fingerprint", fingerprint));
        } else if (haveSecret) {
            auto privkey = buildKey(handle.get(), true, validation);
            if (!privkey.ok()) {
                return privkey.error();
            }
            parsed.push_back(privkey.value());
        }

        utils::GetLogger().Debug("Parsed OpenPGP key",
            utils::LogContext()
                .With("address", pubkey.value()->Address())
                .With("fingerprint", fingerprint)
                .With("validation", validation));
    }

    if (parsed.empty()) {
        return Error(ErrorCode::InvalidArgument, "No OpenPGP key found in key data");
    }
    return parsed;
}

Result<std::string> OpenPGPScheme::Encrypt(const std::string& data,
                                           const KeyPtr& pubkey,
                                           const std::string& passphrase,
                                           const KeyPtr& signWith) {
    RnpSession session;
    Error err = session.Open(options_.keystoreFormat, passphrase);
    if (err.hasError()) {
        return err;
    }

    KeyHandlePtr recipient(nullptr, rnp_key_handle_destroy);
    err = session.Load(pubkey, recipient);
    if (err.hasError()) {
        return err;
    }

    KeyHandlePtr signer(nullptr, rnp_key_handle_destroy);
    if (signWith) {
        err = session.Load(signWith, signer);
        if (err.hasError()) {
            return err;
        }
        err = requirePassphrase(signer.get(), passphrase);
        if (err.hasError()) {
            return err;
        }
    }

    InputPtr input(nullptr, rnp_input_destroy);
    OutputPtr output(nullptr, rnp_output_destroy);
    err = memoryInput(data, input);
    if (err.hasError()) {
        return err;
    }
    err = memoryOutput(output);
    if (err.hasError()) {
        return err;
    }

    rnp_op_encrypt_t rawOp = nullptr;
    rnp_result_t ret = rnp_op_encrypt_create(&rawOp, session.get(), input.get(), output.get());
    if (ret != RNP_SUCCESS) {
        return rnpError("Failed to create encryption operation", ret);
    }
    EncryptOpPtr op(rawOp, rnp_op_encrypt_destroy);

    ret = rnp_op_encrypt_add_recipient(op.get(), recipient.get());
    if (ret != RNP_SUCCESS) {
        return rnpError("Failed to add recipient " + pubkey->Address(), ret);
    }
    if (signer) {
        ret = rnp_op_encrypt_add_signature(op.get(), signer.get(), nullptr);
        if (ret != RNP_SUCCESS) {
            return rnpError("Failed to add signer " + signWith->Address(), ret);
        }
    }
    rnp_op_encrypt_set_armor(op.get(), true);

    ret = rnp_op_encrypt_execute(op.get());
    if (ret != RNP_SUCCESS) {
        return operationError("Failed to encrypt to " + pubkey->Address(), ret, passphrase);
    }
    return outputString(output.get());
}

Result<std::string> OpenPGPScheme::Decrypt(const std::string& data,
                                           const KeyPtr& privkey,
                                           const std::string& passphrase,
                                           const KeyPtr& verifyWith) {
    RnpSession session;
    Error err = session.Open(options_.keystoreFormat, passphrase);
    if (err.hasError()) {
        return err;
    }

    KeyHandlePtr handle(nullptr, rnp_key_handle_destroy);
    err = session.Load(privkey, handle);
    if (err.hasError()) {
        return err;
    }
    err = requirePassphrase(handle.get(), passphrase);
    if (err.hasError()) {
        return err;
    }

    if (verifyWith) {
        KeyHandlePtr signer(nullptr, rnp_key_handle_destroy);
        err = session.Load(verifyWith, signer);
        if (err.hasError()) {
            return err;
        }
    }

    InputPtr input(nullptr, rnp_input_destroy);
    OutputPtr output(nullptr, rnp_output_destroy);
    err = memoryInput(data, input);
    if (err.hasError()) {
        return err;
    }
    err = memoryOutput(output);
    if (err.hasError()) {
        return err;
    }

    if (!verifyWith) {
        rnp_result_t ret = rnp_decrypt(session.get(), input.get(), output.get());
        if (ret != RNP_SUCCESS) {
            return operationError("Failed to decrypt for " + privkey->Address(), ret, passphrase);
        }
        return outputString(output.get());
    }

    rnp_op_verify_t rawOp = nullptr;
    rnp_result_t ret = rnp_op_verify_create(&rawOp, session.get(), input.get(), output.get());
    if (ret != RNP_SUCCESS) {
        return rnpError("Failed to create decryption operation", ret);
    }
    VerifyOpPtr op(rawOp, rnp_op_verify_destroy);

    ret = rnp_op_verify_execute(op.get());
    if (ret != RNP_SUCCESS && !isSignatureFailure(ret)) {
        return operationError("Failed to decrypt for " + privkey->Address(), ret, passphrase);
    }
    if (!hasValidSignature(op.get(), verifyWith->Fingerprint())) {
        utils::GetLogger().Warn("Decrypted data has no valid signature",
            utils::LogContext()
                .With("address", verifyWith->Address())
                .With("fingerprint", verifyWith->Fingerprint()));
        return Error(ErrorCode::InvalidSignature,
                     "No valid signature by " + verifyWith->Address() + " (" + verifyWith->Fingerprint() + ")");
    }
    return outputString(output.get());
}

Result<std::string> OpenPGPScheme::Sign(const std::string& data,
                                        const KeyPtr& privkey,
                                        bool detach) {
    RnpSession session;
    Error err = session.Open(options_.keystoreFormat, "");
    if (err.hasError()) {
        return err;
    }

    KeyHandlePtr handle(nullptr, rnp_key_handle_destroy);
    err = session.Load(privkey, handle);
    if (err.hasError()) {
        return err;
    }
    err = requirePassphrase(handle.get(), "");
    if (err.hasError()) {
        return err;
    }

    InputPtr input(nullptr, rnp_input_destroy);
    OutputPtr output(nullptr, rnp_output_destroy);
    err = memoryInput(data, input);
    if (err.hasError()) {
        return err;
    }
    err = memoryOutput(output);
    if (err.hasError()) {
        return err;
    }

    rnp_op_sign_t rawOp = nullptr;
    rnp_result_t ret = detach
        ? rnp_op_sign_detached_create(&rawOp, session.get(), input.get(), output.get())
        : rnp_op_sign_create(&rawOp, session.get(), input.get(), output.get());
    if (ret != RNP_SUCCESS) {
        return rnpError("Failed to create signing operation", ret);
    }
    SignOpPtr op(rawOp, rnp_op_sign_destroy);

    ret = rnp_op_sign_add_signature(op.get(), handle.get(), nullptr);
    if (ret != RNP_SUCCESS) {
        return rnpError("Failed to add signer " + privkey->Address(), ret);
    }
    rnp_op_sign_set_armor(op.get(), true);

    ret = rnp_op_sign_execute(op.get());
    if (ret != RNP_SUCCESS) {
        return operationError("Failed to sign with " + privkey->Address(), ret, "");
    }
    return outputString(output.get());
}

Result<bool> OpenPGPScheme::Verify(const std::string& data,
                                   const KeyPtr& pubkey,
                                   const std::string& signature) {
    RnpSession session;
    Error err = session.Open(options_.keystoreFormat, "");
    if (err.hasError()) {
        return err;
    }

    KeyHandlePtr handle(nullptr, rnp_key_handle_destroy);
    err = session.Load(pubkey, handle);
    if (err.hasError()) {
        return err;
    }

    InputPtr input(nullptr, rnp_input_destroy);
    err = memoryInput(data, input);
    if (err.hasError()) {
        return err;
    }

    rnp_op_verify_t rawOp = nullptr;
    rnp_result_t ret;
    InputPtr sigInput(nullptr, rnp_input_destroy);
    OutputPtr output(nullptr, rnp_output_destroy);
    if (!signature.empty()) {
        err = memoryInput(signature, sigInput);
        if (err.hasError()) {
            return err;
        }
        ret = rnp_op_verify_detached_create(&rawOp, session.get(), input.get(), sigInput.get());
    } else {
        rnp_output_t rawOutput = nullptr;
        ret = rnp_output_to_null(&rawOutput);
        if (ret != RNP_SUCCESS) {
            return rnpError("Failed to create output", ret);
        }
        output.reset(rawOutput);
        ret = rnp_op_verify_create(&rawOp, session.get(), input.get(), output.get());
    }
    if (ret != RNP_SUCCESS) {
        return rnpError("Failed to create verification operation", ret);
    }
    VerifyOpPtr op(rawOp, rnp_op_verify_destroy);

    ret = rnp_op_verify_execute(op.get());
    if (ret != RNP_SUCCESS && !isSignatureFailure(ret)) {
        return rnpError("Failed to verify signature of " + pubkey->Address(), ret);
    }

    bool valid = hasValidSignature(op.get(), pubkey->Fingerprint());
    utils::GetLogger().Debug("Signature verified",
        utils::LogContext()
            .With("address", pubkey->Address())
            .With("valid", valid ? "true" : "false"));
    return valid;
}

} // namespace scheme
} // namespace nicknym
