#pragma once

#include "nicknym/transport/transport.hpp"
#include <cstddef>

namespace nicknym {
namespace transport {

struct CurlOptions {
    long connectTimeout = 10;   // 秒
    long timeout = 30;          // 秒
    std::string userAgent = "nicknym";
    // 响应体上限，超出即中止传输；0 表示不限制
    size_t maxResponseSize = 1024 * 1024;
};

// 基于 libcurl 的实现，总是校验服务端证书
class CurlTransport : public Transport {
public:
    explicit CurlTransport(const CurlOptions& options = CurlOptions());
    ~CurlTransport() override;

    Result<HttpResponse> Get(const std::string& url,
                             const Params& query,
                             const std::string& caCertPath) override;

    Result<HttpResponse> Put(const std::string& url,
                             const Params& form,
                             const std::string& caCertPath,
                             const Params& cookies) override;

    // cookie 名与值不得含分隔符、空白或控制字符
    static Error CheckCookies(const Params& cookies);

private:
    Result<HttpResponse> perform(const std::string& method,
                                 const std::string& url,
                                 const std::string& body,
                                 const std::string& caCertPath,
                                 const Params& cookies);

    CurlOptions options_;
};

} // namespace transport
} // namespace nicknym
