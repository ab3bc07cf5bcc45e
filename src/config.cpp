#include "nicknym/config.hpp"
#include <fstream>

namespace nicknym {

namespace {

using json = nlohmann::json;

template<typename T>
void readField(const json& data, const std::string& name, T& target) {
    auto it = data.find(name);
    if (it != data.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

void readOpenPGP(const json& data, scheme::OpenPGPOptions& options) {
    readField(data, "keystore_format", options.keystoreFormat);
    readField(data, "key_alg", options.keyAlg);
    readField(data, "sub_alg", options.subAlg);
    readField(data, "key_bits", options.keyBits);
    readField(data, "sub_bits", options.subBits);
    readField(data, "key_curve", options.keyCurve);
    readField(data, "sub_curve", options.subCurve);
}

} // namespace

Result<Config> ParseConfig(const json& data) {
    if (!data.is_object()) {
        return Error(ErrorCode::InvalidArgument, "Configuration must be a JSON object");
    }

    Config config;
    try {
        auto& km = config.keymanager;
        readField(data, "address", km.address);
        readField(data, "nickserver_uri", km.nickserverUri);
        readField(data, "session_id", km.sessionId);
        readField(data, "ca_cert_path", km.caCertPath);
        readField(data, "api_uri", km.apiUri);
        readField(data, "api_version", km.apiVersion);
        readField(data, "uid", km.uid);
        readField(data, "store_path", config.storePath);

        if (data.contains("openpgp")) {
            readOpenPGP(data.at("openpgp"), km.openpgp);
        }
        if (data.contains("logging")) {
            const auto& logging = data.at("logging");
            readField(logging, "level", config.logging.level);
            readField(logging, "format", config.logging.format);
            readField(logging, "output", config.logging.output);
            readField(logging, "file", config.logging.file);
        }
        if (data.contains("http")) {
            const auto& http = data.at("http");
            readField(http, "connect_timeout", config.http.connectTimeout);
            readField(http, "timeout", config.http.timeout);
            readField(http, "user_agent", config.http.userAgent);
            readField(http, "max_response_size", config.http.maxResponseSize);
        }
    } catch (const json::exception& e) {
        return Error(ErrorCode::InvalidArgument, std::string("Invalid configuration: ") + e.what());
    }

    if (config.keymanager.address.empty()) {
        return Error(ErrorCode::MissingConfiguration, "Configuration is missing address");
    }
    if (config.keymanager.nickserverUri.empty()) {
        return Error(ErrorCode::MissingConfiguration, "Configuration is missing nickserver_uri");
    }
    return config;
}

Result<Config> LoadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Error(ErrorCode::MissingConfiguration, "Cannot open configuration file: " + path);
    }

    json data;
    try {
        data = json::parse(file);
    } catch (const json::exception& e) {
        return Error(ErrorCode::InvalidArgument, "Failed to parse configuration " + path + ": " + e.what());
    }
    return ParseConfig(data);
}

} // namespace nicknym
