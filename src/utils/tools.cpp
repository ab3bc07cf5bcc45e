#include "nicknym/utils/tools.hpp"
#include <openssl/evp.h>
#include <uuid/uuid.h>
#include <algorithm>
#include <iomanip>
#include <memory>
#include <sstream>

namespace nicknym {
namespace utils {

Result<std::vector<uint8_t>> CalculateSHA256Hash(const std::vector<uint8_t>& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!mdctx) {
        return Error(ErrorCode::BackendFailure, "创建MD上下文失败");
    }

    if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(mdctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(mdctx.get(), hash, &hashLen) != 1) {
        return Error(ErrorCode::BackendFailure, "计算SHA-256摘要失败");
    }

    return std::vector<uint8_t>(hash, hash + hashLen);
}

std::string HexEncode(const std::vector<uint8_t>& data) {
    std::stringstream ss;
    ss << std::hex;
    for (size_t i = 0; i < data.size(); i++) {
        ss << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string GenerateDocID() {
    uuid_t uuid;
    uuid_generate(uuid);
    char uuidStr[37];
    uuid_unparse_lower(uuid, uuidStr);

    std::string id(uuidStr);
    id.erase(std::remove(id.begin(), id.end(), '-'), id.end());
    return id;
}

std::string AddressFromUserID(const std::string& userId) {
    size_t open = userId.rfind('<');
    size_t close = userId.rfind('>');
    if (open != std::string::npos && close != std::string::npos && close > open + 1) {
        return userId.substr(open + 1, close - open - 1);
    }

    // 没有尖括号时整个用户ID就是地址
    size_t begin = userId.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = userId.find_last_not_of(" \t");
    return userId.substr(begin, end - begin + 1);
}

std::string AppendQuery(const std::string& url, const std::string& query) {
    if (query.empty()) {
        return url;
    }
    return url + (url.find('?') == std::string::npos ? "?" : "&") + query;
}

std::string TrimTrailingSlash(const std::string& url) {
    std::string result = url;
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

std::string VectorToString(const std::vector<std::string>& vec) {
    std::string result = "[";
    for (size_t i = 0; i < vec.size(); ++i) {
        if (i > 0) result += ", ";
        result += vec[i];
    }
    result += "]";
    return result;
}

} // namespace utils
} // namespace nicknym
