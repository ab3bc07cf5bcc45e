#include <functional>
#include <iostream>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <CLI/CLI.hpp>
#include "nicknym/config.hpp"
#include "nicknym/keymanager.hpp"
#include "nicknym/storage/file_document_store.hpp"
#include "nicknym/transport/curl_transport.hpp"
#include "nicknym/utils/logger.hpp"

using namespace nicknym;

namespace {

Result<std::string> readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::InvalidArgument, "Cannot open file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

Error writeFile(const std::string& path, const std::string& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Error(ErrorCode::InvalidArgument, "Cannot create file: " + path);
    }
    file << data;
    if (!file) {
        return Error(ErrorCode::InvalidArgument, "Failed to write file: " + path);
    }
    return Error();
}

// 加载配置、初始化日志并创建密钥管理器
Result<std::shared_ptr<KeyManager>> setup(const std::string& configFile,
                                          const std::string& storePath,
                                          const std::string& logLevel) {
    auto config = LoadConfig(configFile);
    if (!config.ok()) {
        return config.error();
    }

    Config cfg = config.value();
    if (!storePath.empty()) {
        cfg.storePath = storePath;
    }
    if (!logLevel.empty()) {
        cfg.logging.level = logLevel;
    }
    utils::GetLogger().Initialize(cfg.logging);

    utils::GetLogger().Debug("Loaded configuration", utils::LogContext()
        .With("config", configFile)
        .With("address", cfg.keymanager.address)
        .With("store", cfg.storePath));

    auto store = std::make_shared<storage::FileDocumentStore>(cfg.storePath);
    auto http = std::make_shared<transport::CurlTransport>(cfg.http);
    return std::make_shared<KeyManager>(cfg.keymanager, store, http);
}

void printKeys(const std::vector<KeyPtr>& list) {
    if (list.empty()) {
        std::cout << "No keys found." << std::endl;
        return;
    }

    std::cout << std::left
              << std::setw(32) << "ADDRESS"
              << std::setw(10) << "TYPE"
              << std::setw(44) << "FINGERPRINT"
              << "VALIDATION" << std::endl;
    for (const auto& key : list) {
        std::cout << std::left
                  << std::setw(32) << key->Address()
                  << std::setw(10) << keys::KeyTypeToString(key->Type())
                  << std::setw(44) << key->Fingerprint()
                  << key->Metadata().validation << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"nicknym - key manager for addresses and their OpenPGP keys"};
    app.require_subcommand(1);

    // 全局选项
    std::string configFile = "nicknym.json";
    std::string storePath;
    std::string logLevel;
    int exitCode = 0;

    app.add_option("-c,--config", configFile, "Configuration file path");
    app.add_option("-s,--store", storePath, "Local key store directory");
    app.add_option("-l,--log-level", logLevel, "Log level: fatal, error, warn, info, debug");

    // 每个子命令都先建立密钥管理器，失败时记录错误并设置退出码
    auto run = [&](const std::function<Error(KeyManager&)>& body) {
        auto manager = setup(configFile, storePath, logLevel);
        if (!manager.ok()) {
            utils::GetLogger().Error("Error loading configuration: " + manager.error().what());
            exitCode = 1;
            return;
        }
        Error err = body(*manager.value());
        if (err.hasError()) {
            utils::GetLogger().Error(err.what(), utils::LogContext()
                .With("code", errorCodeToString(err.code())));
            exitCode = 1;
        }
    };

    // gen-key
    auto genKey = app.add_subcommand("gen-key", "Generate a key pair for the configured address");
    genKey->callback([&]() {
        run([&](KeyManager& km) {
            auto key = km.GenKey(keys::KeyType::OpenPGP);
            if (!key.ok()) {
                return key.error();
            }
            std::cout << "Generated key " << key.value()->Fingerprint()
                      << " for " << key.value()->Address() << std::endl;
            return Error();
        });
    });

    // get-key
    auto getKey = app.add_subcommand("get-key", "Print the key bound to an address");
    std::string keyAddress;
    bool wantPrivate = false;
    bool noFetch = false;
    getKey->add_option("address", keyAddress, "Address")->required();
    getKey->add_flag("-p,--private", wantPrivate, "Look up the private key");
    getKey->add_flag("--no-fetch", noFetch, "Do not query the directory on a local miss");
    getKey->callback([&]() {
        run([&](KeyManager& km) {
            auto key = km.GetKey(keyAddress, keys::KeyType::OpenPGP, wantPrivate, !noFetch);
            if (!key.ok()) {
                return key.error();
            }
            std::cout << key.value()->KeyData();
            return Error();
        });
    });

    // list-keys
    auto listKeys = app.add_subcommand("list-keys", "List keys in the local store");
    bool listPrivate = false;
    listKeys->add_flag("-p,--private", listPrivate, "List private keys");
    listKeys->callback([&]() {
        run([&](KeyManager& km) {
            auto localKeys = km.GetAllKeysInLocalDb(listPrivate);
            if (!localKeys.ok()) {
                return localKeys.error();
            }
            printKeys(localKeys.value());
            return Error();
        });
    });

    // refresh
    auto refresh = app.add_subcommand("refresh", "Fetch fresh copies of all known public keys");
    refresh->callback([&]() {
        run([&](KeyManager& km) {
            return km.RefreshKeys();
        });
    });

    // send-key
    auto sendKey = app.add_subcommand("send-key", "Publish the public key of the configured address");
    sendKey->callback([&]() {
        run([&](KeyManager& km) {
            Error err = km.SendKey(keys::KeyType::OpenPGP);
            if (err.ok()) {
                std::cout << "Public key published for " << km.Address() << std::endl;
            }
            return err;
        });
    });

    // import
    auto importCmd = app.add_subcommand("import", "Import an ASCII armored key file");
    std::string importPath;
    importCmd->add_option("file", importPath, "Key file")->required();
    importCmd->callback([&]() {
        run([&](KeyManager& km) {
            auto data = readFile(importPath);
            if (!data.ok()) {
                return data.error();
            }
            auto imported = km.PutAsciiKey(keys::KeyType::OpenPGP, data.value());
            if (!imported.ok()) {
                return imported.error();
            }
            printKeys(imported.value());
            return Error();
        });
    });

    // encrypt
    auto encrypt = app.add_subcommand("encrypt", "Encrypt a file to the key of an address");
    std::string inPath;
    std::string outPath;
    std::string passphrase;
    bool signToo = false;
    encrypt->add_option("address", keyAddress, "Recipient address")->required();
    encrypt->add_option("in", inPath, "Input file")->required();
    encrypt->add_option("out", outPath, "Output file")->required();
    encrypt->add_flag("--sign", signToo, "Sign with the private key of the configured address");
    encrypt->add_option("--passphrase", passphrase, "Passphrase of the signing key");
    encrypt->callback([&]() {
        run([&](KeyManager& km) {
            auto pubkey = km.GetKey(keyAddress, keys::KeyType::OpenPGP);
            if (!pubkey.ok()) {
                return pubkey.error();
            }
            KeyPtr signer;
            if (signToo) {
                auto privkey = km.GetKey(km.Address(), keys::KeyType::OpenPGP, true);
                if (!privkey.ok()) {
                    return privkey.error();
                }
                signer = privkey.value();
            }
            auto data = readFile(inPath);
            if (!data.ok()) {
                return data.error();
            }
            auto encrypted = km.Encrypt(data.value(), pubkey.value(), passphrase, signer);
            if (!encrypted.ok()) {
                return encrypted.error();
            }
            return writeFile(outPath, encrypted.value());
        });
    });

    // decrypt
    auto decrypt = app.add_subcommand("decrypt", "Decrypt a file with the private key of the configured address");
    std::string verifyAddress;
    decrypt->add_option("in", inPath, "Input file")->required();
    decrypt->add_option("out", outPath, "Output file")->required();
    decrypt->add_option("--verify", verifyAddress, "Require a valid signature by this address");
    decrypt->add_option("--passphrase", passphrase, "Passphrase of the private key");
    decrypt->callback([&]() {
        run([&](KeyManager& km) {
            auto privkey = km.GetKey(km.Address(), keys::KeyType::OpenPGP, true);
            if (!privkey.ok()) {
                return privkey.error();
            }
            KeyPtr verifier;
            if (!verifyAddress.empty()) {
                auto pubkey = km.GetKey(verifyAddress, keys::KeyType::OpenPGP);
                if (!pubkey.ok()) {
                    return pubkey.error();
                }
                verifier = pubkey.value();
            }
            auto data = readFile(inPath);
            if (!data.ok()) {
                return data.error();
            }
            auto decrypted = km.Decrypt(data.value(), privkey.value(), passphrase, verifier);
            if (!decrypted.ok()) {
                return decrypted.error();
            }
            return writeFile(outPath, decrypted.value());
        });
    });

    // sign
    auto sign = app.add_subcommand("sign", "Sign a file with the private key of the configured address");
    bool detach = false;
    sign->add_option("in", inPath, "Input file")->required();
    sign->add_option("out", outPath, "Output file")->required();
    sign->add_flag("-d,--detach", detach, "Write a detached signature");
    sign->callback([&]() {
        run([&](KeyManager& km) {
            auto privkey = km.GetKey(km.Address(), keys::KeyType::OpenPGP, true);
            if (!privkey.ok()) {
                return privkey.error();
            }
            auto data = readFile(inPath);
            if (!data.ok()) {
                return data.error();
            }
            auto signedData = km.Sign(data.value(), privkey.value(), detach);
            if (!signedData.ok()) {
                return signedData.error();
            }
            return writeFile(outPath, signedData.value());
        });
    });

    // verify
    auto verify = app.add_subcommand("verify", "Verify a signed file against the key of an address");
    std::string signaturePath;
    verify->add_option("address", keyAddress, "Signer address")->required();
    verify->add_option("in", inPath, "Signed file, or data file with --signature")->required();
    verify->add_option("--signature", signaturePath, "Detached signature file");
    verify->callback([&]() {
        run([&](KeyManager& km) {
            auto pubkey = km.GetKey(keyAddress, keys::KeyType::OpenPGP);
            if (!pubkey.ok()) {
                return pubkey.error();
            }
            auto data = readFile(inPath);
            if (!data.ok()) {
                return data.error();
            }
            std::string signature;
            if (!signaturePath.empty()) {
                auto sig = readFile(signaturePath);
                if (!sig.ok()) {
                    return sig.error();
                }
                signature = sig.value();
            }
            auto valid = km.Verify(data.value(), pubkey.value(), signature);
            if (!valid.ok()) {
                return valid.error();
            }
            if (!valid.value()) {
                return Error(ErrorCode::InvalidSignature, "BAD signature from " + keyAddress);
            }
            std::cout << "Good signature from " << keyAddress << std::endl;
            return Error();
        });
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    return exitCode;
}
