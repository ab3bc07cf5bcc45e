#include <catch2/catch_test_macros.hpp>
#include "nicknym/keys/keys.hpp"
#include "nicknym/utils/tools.hpp"

using namespace nicknym;

TEST_CASE("Key type tags", "[keys]") {
    REQUIRE(keys::KeyTypeToString(keys::KeyType::OpenPGP) == "openpgp");

    auto parsed = keys::ParseKeyType("openpgp");
    REQUIRE(parsed.ok());
    REQUIRE(parsed.value() == keys::KeyType::OpenPGP);

    auto unknown = keys::ParseKeyType("smime");
    REQUIRE_FALSE(unknown.ok());
    REQUIRE(unknown.error().code() == ErrorCode::UnknownKeyType);
}

TEST_CASE("Validation levels are ordered", "[keys]") {
    REQUIRE(keys::ValidationRank(keys::WEAK_CHAIN) < keys::ValidationRank(keys::PROVIDER_TRUST));
    REQUIRE(keys::ValidationRank(keys::PROVIDER_TRUST) < keys::ValidationRank(keys::KNOWN_KEY));
    REQUIRE(keys::ValidationRank(keys::KNOWN_KEY) < keys::ValidationRank(keys::FINGERPRINT));
    REQUIRE(keys::ValidationRank("made_up") == keys::ValidationRank(keys::WEAK_CHAIN));
}

TEST_CASE("Key documents", "[keys]") {
    keys::KeyMetadata metadata;
    metadata.length = 4096;
    metadata.expiryDate = 1900000000;
    metadata.validation = keys::PROVIDER_TRUST;
    metadata.firstSeenAt = 1600000000;

    keys::OpenPGPKey key("alice@example.org", "89ABCDEF", "0123456789ABCDEF0123456789ABCDEF89ABCDEF",
                         "-----BEGIN PGP PUBLIC KEY BLOCK-----", false, metadata);

    SECTION("ToJson carries the index fields") {
        auto content = key.ToJson();
        REQUIRE(content["type"] == "openpgp");
        REQUIRE(content["address"] == "alice@example.org");
        REQUIRE(content["private"] == false);
        REQUIRE(content["tags"] == keys::json::array({KEYMANAGER_KEY_TAG}));
        REQUIRE(content["validation"] == keys::PROVIDER_TRUST);
    }

    SECTION("Documents rebuild the same key") {
        auto rebuilt = keys::BuildKeyFromJson(keys::KeyType::OpenPGP, key.ToJson());
        REQUIRE(rebuilt.ok());
        auto copy = rebuilt.value();
        REQUIRE(copy->Type() == keys::KeyType::OpenPGP);
        REQUIRE(copy->Address() == key.Address());
        REQUIRE(copy->KeyID() == key.KeyID());
        REQUIRE(copy->Fingerprint() == key.Fingerprint());
        REQUIRE(copy->KeyData() == key.KeyData());
        REQUIRE_FALSE(copy->IsPrivate());
        REQUIRE(copy->Metadata().length == 4096);
        REQUIRE(copy->Metadata().expiryDate == 1900000000);
        REQUIRE(copy->Metadata().firstSeenAt == 1600000000);
        REQUIRE(copy->Metadata().validation == keys::PROVIDER_TRUST);
    }

    SECTION("Missing fields are a storage failure") {
        auto content = key.ToJson();
        content.erase("key_data");
        auto rebuilt = keys::BuildKeyFromJson(keys::KeyType::OpenPGP, content);
        REQUIRE_FALSE(rebuilt.ok());
        REQUIRE(rebuilt.error().code() == ErrorCode::StorageFailure);
    }

    SECTION("Metadata defaults when absent") {
        keys::json minimal = {
            {"address", "bob@example.org"},
            {"key_data", "armored"},
            {"private", true}
        };
        auto rebuilt = keys::BuildKeyFromJson(keys::KeyType::OpenPGP, minimal);
        REQUIRE(rebuilt.ok());
        REQUIRE(rebuilt.value()->IsPrivate());
        REQUIRE(rebuilt.value()->Metadata().validation == keys::WEAK_CHAIN);
        REQUIRE(rebuilt.value()->Metadata().expiryDate == 0);
    }
}

TEST_CASE("Tools", "[utils]") {
    SECTION("Address from user id") {
        REQUIRE(utils::AddressFromUserID("Alice <alice@example.org>") == "alice@example.org");
        REQUIRE(utils::AddressFromUserID("alice@example.org") == "alice@example.org");
    }

    SECTION("URL helpers") {
        REQUIRE(utils::TrimTrailingSlash("https://api.example.org:4430/") == "https://api.example.org:4430");
        REQUIRE(utils::TrimTrailingSlash("https://api.example.org") == "https://api.example.org");
        REQUIRE(utils::AppendQuery("https://n.example.org", "address=a%40b") ==
                "https://n.example.org?address=a%40b");
        REQUIRE(utils::AppendQuery("https://n.example.org?x=1", "address=a") ==
                "https://n.example.org?x=1&address=a");
    }

    SECTION("Hashing and ids") {
        std::string abc = "abc";
        auto hash = utils::CalculateSHA256Hash(std::vector<uint8_t>(abc.begin(), abc.end()));
        REQUIRE(hash.ok());
        REQUIRE(utils::HexEncode(hash.value()) ==
                "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

        auto first = utils::GenerateDocID();
        auto second = utils::GenerateDocID();
        REQUIRE(first.size() == 32);
        REQUIRE(first != second);
    }

    REQUIRE(utils::VectorToString({"a", "b"}) == "[a, b]");
}
