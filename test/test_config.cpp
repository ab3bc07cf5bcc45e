#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include "nicknym/config.hpp"
#include "nicknym/utils/tools.hpp"

using namespace nicknym;
using json = nlohmann::json;

TEST_CASE("ParseConfig", "[config]") {
    json minimal = {
        {"address", "alice@example.org"},
        {"nickserver_uri", "https://nicknym.example.org:6425"}
    };

    SECTION("Defaults") {
        auto config = ParseConfig(minimal);
        REQUIRE(config.ok());
        const auto& c = config.value();
        REQUIRE(c.keymanager.address == "alice@example.org");
        REQUIRE(c.keymanager.apiVersion == "1");
        REQUIRE(c.keymanager.sessionId.empty());
        REQUIRE(c.keymanager.openpgp.keyAlg == "RSA");
        REQUIRE(c.keymanager.openpgp.keyBits == 4096);
        REQUIRE(c.storePath == "nicknym-store");
        REQUIRE(c.logging.level == "info");
        REQUIRE(c.http.timeout == 30);
        REQUIRE(c.http.maxResponseSize == 1024 * 1024);
    }

    SECTION("All sections") {
        json full = minimal;
        full["ca_cert_path"] = "/etc/nicknym/cacert.pem";
        full["api_uri"] = "https://api.example.org:4430";
        full["api_version"] = "2";
        full["uid"] = "0123abcd";
        full["session_id"] = "token";
        full["store_path"] = "/var/lib/nicknym";
        full["openpgp"] = {{"key_alg", "EDDSA"}, {"sub_alg", "ECDH"}, {"sub_curve", "Curve25519"}, {"key_bits", 0}};
        full["logging"] = {{"level", "debug"}, {"format", "json"}};
        full["http"] = {{"connect_timeout", 5}, {"user_agent", "tester"}, {"max_response_size", 4096}};

        auto config = ParseConfig(full);
        REQUIRE(config.ok());
        const auto& c = config.value();
        REQUIRE(c.keymanager.caCertPath == "/etc/nicknym/cacert.pem");
        REQUIRE(c.keymanager.apiUri == "https://api.example.org:4430");
        REQUIRE(c.keymanager.apiVersion == "2");
        REQUIRE(c.keymanager.uid == "0123abcd");
        REQUIRE(c.keymanager.sessionId == "token");
        REQUIRE(c.storePath == "/var/lib/nicknym");
        REQUIRE(c.keymanager.openpgp.keyAlg == "EDDSA");
        REQUIRE(c.keymanager.openpgp.subCurve == "Curve25519");
        REQUIRE(c.keymanager.openpgp.keyBits == 0);
        REQUIRE(c.logging.level == "debug");
        REQUIRE(c.logging.format == "json");
        REQUIRE(c.http.connectTimeout == 5);
        REQUIRE(c.http.userAgent == "tester");
        REQUIRE(c.http.maxResponseSize == 4096);
    }

    SECTION("Required fields") {
        json noAddress = minimal;
        noAddress.erase("address");
        REQUIRE(ParseConfig(noAddress).error().code() == ErrorCode::MissingConfiguration);

        json noNickserver = minimal;
        noNickserver.erase("nickserver_uri");
        REQUIRE(ParseConfig(noNickserver).error().code() == ErrorCode::MissingConfiguration);
    }

    SECTION("Wrong field types") {
        json bad = minimal;
        bad["http"] = {{"timeout", "slow"}};
        REQUIRE(ParseConfig(bad).error().code() == ErrorCode::InvalidArgument);
        REQUIRE(ParseConfig(json::array()).error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("LoadConfig", "[config]") {
    namespace fs = std::filesystem;
    std::string path = (fs::temp_directory_path() / ("nicknym-config-" + utils::GenerateDocID() + ".json")).string();

    SECTION("Missing file") {
        REQUIRE(LoadConfig(path).error().code() == ErrorCode::MissingConfiguration);
    }

    SECTION("Valid file") {
        {
            std::ofstream out(path);
            out << R"({"address": "alice@example.org", "nickserver_uri": "https://n.example.org"})";
        }
        auto config = LoadConfig(path);
        REQUIRE(config.ok());
        REQUIRE(config.value().keymanager.nickserverUri == "https://n.example.org");
    }

    SECTION("Broken file") {
        {
            std::ofstream out(path);
            out << "{not json";
        }
        REQUIRE(LoadConfig(path).error().code() == ErrorCode::InvalidArgument);
    }

    std::error_code ec;
    fs::remove(path, ec);
}
