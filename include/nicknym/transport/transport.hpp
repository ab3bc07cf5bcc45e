#pragma once

#include <map>
#include <string>
#include "nicknym/types.hpp"

namespace nicknym {
namespace transport {

using Params = std::map<std::string, std::string>;

struct HttpResponse {
    long status = 0;
    std::string contentType;
    std::string body;

    bool IsSuccess() const { return status >= 200 && status < 300; }
};

// HTTP 客户端接口。只有连接层面的失败返回 TransportFailure，
// HTTP 状态码原样交给调用方判断。
class Transport {
public:
    virtual ~Transport() = default;

    // query 中的值未转义，由实现负责编码
    virtual Result<HttpResponse> Get(const std::string& url,
                                     const Params& query,
                                     const std::string& caCertPath) = 0;

    // form 以 application/x-www-form-urlencoded 提交
    virtual Result<HttpResponse> Put(const std::string& url,
                                     const Params& form,
                                     const std::string& caCertPath,
                                     const Params& cookies) = 0;
};

} // namespace transport
} // namespace nicknym
