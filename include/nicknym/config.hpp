#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "nicknym/types.hpp"
#include "nicknym/keymanager.hpp"
#include "nicknym/transport/curl_transport.hpp"
#include "nicknym/utils/logger.hpp"

namespace nicknym {

// 程序配置，对应配置文件:
// {
//   "address": "user@example.org",
//   "nickserver_uri": "https://nicknym.example.org:6425",
//   "ca_cert_path": "/etc/nicknym/cacert.pem",
//   "api_uri": "https://api.example.org:4430", "api_version": "1", "uid": "...",
//   "session_id": "...",
//   "store_path": "~/.config/nicknym/store",
//   "logging": {"level": "info", "format": "text", "output": "console", "file": "nicknym.log"},
//   "openpgp": {"key_alg": "RSA", "key_bits": 4096, ...},
//   "http": {"connect_timeout": 10, "timeout": 30, "max_response_size": 1048576}
// }
struct Config {
    KeyManagerConfig keymanager;
    std::string storePath = "nicknym-store";
    utils::LoggingConfig logging;
    transport::CurlOptions http;
};

// 从JSON解析配置，缺少 address 或 nickserver_uri 返回 MissingConfiguration
Result<Config> ParseConfig(const nlohmann::json& data);

Result<Config> LoadConfig(const std::string& path);

} // namespace nicknym
