#pragma once

#include <string>
#include <vector>
#include <memory>
#include <utility>

namespace nicknym {

// 服务端密钥存储常量
const std::string OPENPGP_KEY       = "openpgp";
const std::string PUBKEY_KEY        = "user[public_key]";
const std::string SESSION_COOKIE    = "_session_id";

// 本地文档存储常量
const std::string KEYMANAGER_KEY_TAG            = "keymanager-key";
const std::string TAGS_PRIVATE_INDEX            = "by-tags-private";
const std::string TAGS_TYPE_ADDRESS_PRIVATE_INDEX = "by-tags-type-address-private";

// 错误码
enum class ErrorCode : int {
    Ok = 0,
    KeyNotFound,
    UnknownKeyType,
    RoleViolation,
    TransportFailure,
    AuthenticationRequired,
    InvalidSignature,
    MissingCredential,
    MissingConfiguration,
    StorageFailure,
    BackendFailure,
    InvalidArgument
};

// 错误码名称
inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "ok";
        case ErrorCode::KeyNotFound: return "key not found";
        case ErrorCode::UnknownKeyType: return "unknown key type";
        case ErrorCode::RoleViolation: return "role violation";
        case ErrorCode::TransportFailure: return "transport failure";
        case ErrorCode::AuthenticationRequired: return "authentication required";
        case ErrorCode::InvalidSignature: return "invalid signature";
        case ErrorCode::MissingCredential: return "missing credential";
        case ErrorCode::MissingConfiguration: return "missing configuration";
        case ErrorCode::StorageFailure: return "storage failure";
        case ErrorCode::BackendFailure: return "backend failure";
        case ErrorCode::InvalidArgument: return "invalid argument";
        default: return "unknown";
    }
}

// 错误类型，默认构造表示成功
class Error {
public:
    Error() : code_(ErrorCode::Ok) {}
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    const std::string& what() const { return message_; }
    ErrorCode code() const { return code_; }
    bool ok() const { return code_ == ErrorCode::Ok; }
    bool hasError() const { return code_ != ErrorCode::Ok; }

private:
    ErrorCode code_;
    std::string message_;
};

// 结果类型
template<typename T>
class Result {
public:
    Result(const T& value) : value_(value), hasError_(false) {}
    Result(T&& value) : value_(std::move(value)), hasError_(false) {}
    Result(const Error& error) : value_(), error_(error), hasError_(true) {}

    bool ok() const { return !hasError_; }
    const T& value() const & { return value_; }
    T&& value() && { return std::move(value_); }
    const Error& error() const { return error_; }

private:
    T value_;
    Error error_;
    bool hasError_;
};

} // namespace nicknym
