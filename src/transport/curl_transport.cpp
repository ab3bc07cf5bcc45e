#include "nicknym/transport/curl_transport.hpp"
#include "nicknym/utils/logger.hpp"
#include "nicknym/utils/tools.hpp"
#include <curl/curl.h>
#include <memory>

namespace nicknym {
namespace transport {

namespace {

using CurlPtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using SlistPtr = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

struct ResponseSink {
    std::string buffer;
    size_t limit = 0;
    bool exceeded = false;
};

// libcurl写入回调函数，超过上限时返回0让curl中止
size_t WriteCallback(void* contents, size_t size, size_t nmemb, ResponseSink* sink) {
    size_t totalSize = size * nmemb;
    if (sink->limit > 0 && sink->buffer.size() + totalSize > sink->limit) {
        sink->exceeded = true;
        return 0;
    }
    sink->buffer.append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

bool isCookieChar(char c, bool isName) {
    auto u = static_cast<unsigned char>(c);
    if (u <= 0x20 || u == 0x7f) {
        return false;
    }
    switch (c) {
    case ';': case ',': case '"': case '\\':
        return false;
    case '=':
        return !isName;
    default:
        return true;
    }
}

std::string escape(CURL* curl, const std::string& value) {
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        return "";
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

// 编码为 k1=v1&k2=v2
std::string encodeParams(CURL* curl, const Params& params) {
    std::string result;
    for (const auto& pair : params) {
        if (!result.empty()) {
            result += "&";
        }
        result += escape(curl, pair.first) + "=" + escape(curl, pair.second);
    }
    return result;
}

std::string cookieHeader(const Params& cookies) {
    std::string result;
    for (const auto& pair : cookies) {
        if (!result.empty()) {
            result += "; ";
        }
        result += pair.first + "=" + pair.second;
    }
    return result;
}

} // namespace

CurlTransport::CurlTransport(const CurlOptions& options)
    : options_(options) {
    // 全局初始化libcurl
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlTransport::~CurlTransport() {
    curl_global_cleanup();
}

Result<HttpResponse> CurlTransport::Get(const std::string& url,
                                        const Params& query,
                                        const std::string& caCertPath) {
    CurlPtr curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        return Error(ErrorCode::TransportFailure, "Failed to initialize CURL");
    }
    std::string fullUrl = utils::AppendQuery(url, encodeParams(curl.get(), query));
    return perform("GET", fullUrl, "", caCertPath, Params());
}

Result<HttpResponse> CurlTransport::Put(const std::string& url,
                                        const Params& form,
                                        const std::string& caCertPath,
                                        const Params& cookies) {
    Error err = CheckCookies(cookies);
    if (err.hasError()) {
        return err;
    }
    CurlPtr curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        return Error(ErrorCode::TransportFailure, "Failed to initialize CURL");
    }
    return perform("PUT", url, encodeParams(curl.get(), form), caCertPath, cookies);
}

Error CurlTransport::CheckCookies(const Params& cookies) {
    for (const auto& pair : cookies) {
        if (pair.first.empty()) {
            return Error(ErrorCode::InvalidArgument, "Empty cookie name");
        }
        for (char c : pair.first) {
            if (!isCookieChar(c, true)) {
                return Error(ErrorCode::InvalidArgument, "Invalid character in cookie name: " + pair.first);
            }
        }
        for (char c : pair.second) {
            if (!isCookieChar(c, false)) {
                return Error(ErrorCode::InvalidArgument, "Invalid character in cookie " + pair.first);
            }
        }
    }
    return Error();
}

Result<HttpResponse> CurlTransport::perform(const std::string& method,
                                            const std::string& url,
                                            const std::string& body,
                                            const std::string& caCertPath,
                                            const Params& cookies) {
    CurlPtr curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        return Error(ErrorCode::TransportFailure, "Failed to initialize CURL");
    }

    ResponseSink sink;
    sink.limit = options_.maxResponseSize;
    SlistPtr headers(nullptr, curl_slist_free_all);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    if (!caCertPath.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_CAINFO, caCertPath.c_str());
    }
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options_.connectTimeout);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options_.timeout);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.userAgent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);

    std::string cookie = cookieHeader(cookies);
    if (!cookie.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_COOKIE, cookie.c_str());
    }

    if (method == "PUT") {
        headers.reset(curl_slist_append(headers.release(),
                                        "Content-Type: application/x-www-form-urlencoded"));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl.get(), CURLOPT_COPYPOSTFIELDS, body.c_str());
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    }

    utils::GetLogger().Debug("HTTP request",
        utils::LogContext().With("method", method).With("url", url));

    CURLcode res = curl_easy_perform(curl.get());
    if (sink.exceeded) {
        utils::GetLogger().Error("HTTP response too large",
            utils::LogContext().With("method", method).With("url", url)
                .With("limit", std::to_string(sink.limit)));
        return Error(ErrorCode::TransportFailure,
                     method + " " + url + " failed: response exceeds " + std::to_string(sink.limit) + " bytes");
    }
    if (res != CURLE_OK) {
        std::string errorMsg = curl_easy_strerror(res);
        utils::GetLogger().Error("HTTP request failed",
            utils::LogContext().With("method", method).With("url", url).With("error", errorMsg));
        return Error(ErrorCode::TransportFailure, method + " " + url + " failed: " + errorMsg);
    }

    HttpResponse response;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    char* contentType = nullptr;
    if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &contentType) == CURLE_OK && contentType) {
        response.contentType = contentType;
    }
    response.body = std::move(sink.buffer);

    utils::GetLogger().Debug("HTTP response",
        utils::LogContext()
            .With("method", method)
            .With("url", url)
            .With("status", std::to_string(response.status)));
    return response;
}

} // namespace transport
} // namespace nicknym
