#include <catch2/catch_test_macros.hpp>
#include "nicknym/keymanager.hpp"
#include "nicknym/storage/memory_document_store.hpp"
#include "fakes.hpp"
#include <algorithm>

using namespace nicknym;
using nicknym::testing::FakeScheme;
using nicknym::testing::FakeTransport;

namespace {

const std::string OWN_ADDRESS = "alice@example.org";

KeyManagerConfig testConfig() {
    KeyManagerConfig config;
    config.address = OWN_ADDRESS;
    config.nickserverUri = "https://nicknym.example.org:6425";
    config.caCertPath = "/etc/ssl/example-ca.pem";
    config.sessionId = "session-token";
    config.apiUri = "https://api.example.org:4430/";
    config.apiVersion = "1";
    config.uid = "0123abcd";
    return config;
}

struct Resolver {
    explicit Resolver(bool canPublish = true, KeyManagerConfig config = testConfig())
        : store(std::make_shared<storage::MemoryDocumentStore>()),
          scheme(std::make_shared<FakeScheme>(store, canPublish)),
          http(std::make_shared<FakeTransport>()) {
        auto schemes = std::make_shared<const registry::SchemeRegistry>(
            std::vector<registry::SchemeRegistry::SchemePtr>{scheme});
        km = std::make_unique<KeyManager>(config, store, schemes, http);
    }

    void storeKey(const std::string& address, const std::string& fingerprint, bool isPrivate) {
        REQUIRE(scheme->PutKey(FakeScheme::MakeKey(address, fingerprint, isPrivate)).ok());
    }

    std::shared_ptr<storage::MemoryDocumentStore> store;
    std::shared_ptr<FakeScheme> scheme;
    std::shared_ptr<FakeTransport> http;
    std::unique_ptr<KeyManager> km;
};

} // namespace

TEST_CASE("GetKey local lookup", "[keymanager][resolver]") {
    Resolver r;

    SECTION("No local and no remote key is KeyNotFound") {
        auto key = r.km->GetKey("bob@example.org", keys::KeyType::OpenPGP);
        REQUIRE_FALSE(key.ok());
        REQUIRE(key.error().code() == ErrorCode::KeyNotFound);
        REQUIRE(r.http->getCalls == 1);
        REQUIRE(r.http->requestedAddresses == std::vector<std::string>{"bob@example.org"});
    }

    SECTION("Local public key is returned without network access") {
        r.storeKey("bob@example.org", "BOBFPR01", false);

        auto key = r.km->GetKey("bob@example.org", keys::KeyType::OpenPGP);
        REQUIRE(key.ok());
        REQUIRE(key.value()->Fingerprint() == "BOBFPR01");
        REQUIRE_FALSE(key.value()->IsPrivate());
        REQUIRE(r.http->Calls() == 0);
    }

    SECTION("Local miss without remote fetch makes no request") {
        r.http->Publish("bob@example.org", OPENPGP_KEY, FakeScheme::KeyData("bob@example.org", "BOBFPR01", false));

        auto key = r.km->GetKey("bob@example.org", keys::KeyType::OpenPGP, false, false);
        REQUIRE_FALSE(key.ok());
        REQUIRE(key.error().code() == ErrorCode::KeyNotFound);
        REQUIRE(r.http->Calls() == 0);
    }
}

TEST_CASE("GetKey remote fallback", "[keymanager][resolver]") {
    Resolver r;
    r.http->Publish("bob@example.org", OPENPGP_KEY, FakeScheme::KeyData("bob@example.org", "BOBFPR01", false));

    SECTION("Fetches once, stores locally and serves later calls from the store") {
        auto first = r.km->GetKey("bob@example.org", keys::KeyType::OpenPGP);
        REQUIRE(first.ok());
        REQUIRE(first.value()->Address() == "bob@example.org");
        REQUIRE(first.value()->Metadata().validation == keys::PROVIDER_TRUST);
        REQUIRE(r.http->getCalls == 1);
        REQUIRE(r.http->lastGetUrl == "https://nicknym.example.org:6425");
        REQUIRE(r.http->lastCaCertPath == "/etc/ssl/example-ca.pem");

        auto second = r.km->GetKey("bob@example.org", keys::KeyType::OpenPGP);
        REQUIRE(second.ok());
        REQUIRE(second.value()->Fingerprint() == "BOBFPR01");
        REQUIRE(r.http->getCalls == 1);
    }

    SECTION("Private keys are never fetched") {
        auto key = r.km->GetKey("bob@example.org", keys::KeyType::OpenPGP, true);
        REQUIRE_FALSE(key.ok());
        REQUIRE(key.error().code() == ErrorCode::KeyNotFound);

        auto again = r.km->GetKey("bob@example.org", keys::KeyType::OpenPGP, true, true);
        REQUIRE_FALSE(again.ok());
        REQUIRE(r.http->Calls() == 0);
    }

    SECTION("Secret material served by the directory is not stored") {
        r.http->Publish("carol@example.org", OPENPGP_KEY,
                        FakeScheme::KeyData("carol@example.org", "CAROLFPR", true));

        auto pub = r.km->GetKey("carol@example.org", keys::KeyType::OpenPGP);
        REQUIRE(pub.ok());
        auto priv = r.scheme->GetKey("carol@example.org", true);
        REQUIRE_FALSE(priv.ok());
        REQUIRE(priv.error().code() == ErrorCode::KeyNotFound);
    }
}

TEST_CASE("Fetched keys only land on the requested address", "[keymanager][resolver]") {
    Resolver r;
    keys::KeyMetadata trusted;
    trusted.validation = keys::FINGERPRINT;
    REQUIRE(r.scheme->PutKey(std::make_shared<keys::OpenPGPKey>(
        OWN_ADDRESS, "ALICEFPR", "ALICEFPR", FakeScheme::KeyData(OWN_ADDRESS, "ALICEFPR", false),
        false, trusted)).ok());

    SECTION("A key bound to our own address is ignored") {
        r.http->Publish("bob@example.org", OPENPGP_KEY, FakeScheme::KeyData(OWN_ADDRESS, "EVILFPR1", false));

        auto bob = r.km->GetKey("bob@example.org", keys::KeyType::OpenPGP);
        REQUIRE_FALSE(bob.ok());
        REQUIRE(bob.error().code() == ErrorCode::KeyNotFound);
        REQUIRE(r.http->getCalls == 1);

        auto own = r.km->GetKey(OWN_ADDRESS, keys::KeyType::OpenPGP, false, false);
        REQUIRE(own.ok());
        REQUIRE(own.value()->Fingerprint() == "ALICEFPR");
        REQUIRE(own.value()->Metadata().validation == keys::FINGERPRINT);
    }

    SECTION("A more trusted local key is not replaced on refresh") {
        REQUIRE(r.scheme->PutKey(std::make_shared<keys::OpenPGPKey>(
            "bob@example.org", "BOBFPR01", "BOBFPR01", FakeScheme::KeyData("bob@example.org", "BOBFPR01", false),
            false, trusted)).ok());
        r.http->Publish("bob@example.org", OPENPGP_KEY, FakeScheme::KeyData("bob@example.org", "EVILFPR2", false));

        REQUIRE(r.km->RefreshKeys().ok());

        auto bob = r.km->GetKey("bob@example.org", keys::KeyType::OpenPGP, false, false);
        REQUIRE(bob.ok());
        REQUIRE(bob.value()->Fingerprint() == "BOBFPR01");
        REQUIRE(bob.value()->Metadata().validation == keys::FINGERPRINT);
    }

    SECTION("The same key keeps its stronger validation") {
        REQUIRE(r.scheme->PutKey(std::make_shared<keys::OpenPGPKey>(
            "bob@example.org", "BOBFPR01", "BOBFPR01", "old key data", false, trusted)).ok());
        r.http->Publish("bob@example.org", OPENPGP_KEY, FakeScheme::KeyData("bob@example.org", "BOBFPR01", false));

        REQUIRE(r.km->FetchKeysFromServer("bob@example.org").ok());

        auto bob = r.km->GetKey("bob@example.org", keys::KeyType::OpenPGP, false, false);
        REQUIRE(bob.ok());
        REQUIRE(bob.value()->KeyData() == FakeScheme::KeyData("bob@example.org", "BOBFPR01", false));
        REQUIRE(bob.value()->Metadata().validation == keys::FINGERPRINT);
    }
}

TEST_CASE("Directory response checks", "[keymanager][resolver]") {
    Resolver r;

    SECTION("Non-2xx status is a transport failure") {
        r.http->directory["bob@example.org"] = transport::HttpResponse{500, "application/json", "{}"};
        auto key = r.km->GetKey("bob@example.org", keys::KeyType::OpenPGP);
        REQUIRE_FALSE(key.ok());
        REQUIRE(key.error().code() == ErrorCode::TransportFailure);
    }

    SECTION("Wrong content type is a transport failure") {
        r.http->directory["bob@example.org"] = transport::HttpResponse{200, "text/html", "<html></html>"};
        Error err = r.km->FetchKeysFromServer("bob@example.org");
        REQUIRE(err.code() == ErrorCode::TransportFailure);
    }

    SECTION("Malformed JSON is a transport failure") {
        r.http->directory["bob@example.org"] = transport::HttpResponse{200, "application/json", "{not json"};
        Error err = r.km->FetchKeysFromServer("bob@example.org");
        REQUIRE(err.code() == ErrorCode::TransportFailure);
    }

    SECTION("Connection errors propagate") {
        r.http->failure = Error(ErrorCode::TransportFailure, "certificate verify failed");
        auto key = r.km->GetKey("bob@example.org", keys::KeyType::OpenPGP);
        REQUIRE_FALSE(key.ok());
        REQUIRE(key.error().code() == ErrorCode::TransportFailure);
        REQUIRE(key.error().what() == "certificate verify failed");
    }

    SECTION("No entry for the address is not an error") {
        Error err = r.km->FetchKeysFromServer("nobody@example.org");
        REQUIRE(err.ok());
        REQUIRE(r.scheme->importCalls == 0);
    }

    SECTION("Fetching without a CA path fails before any request") {
        r.km->SetCaCertPath("");
        auto key = r.km->GetKey("bob@example.org", keys::KeyType::OpenPGP);
        REQUIRE_FALSE(key.ok());
        REQUIRE(key.error().code() == ErrorCode::MissingConfiguration);
        REQUIRE(r.http->Calls() == 0);
    }
}

TEST_CASE("RefreshKeys", "[keymanager][resolver]") {
    Resolver r;
    r.storeKey("bob@example.org", "BOBFPR01", false);
    r.storeKey("carol@example.org", "CAROLFPR", false);
    r.storeKey(OWN_ADDRESS, "ALICEFPR", false);
    r.storeKey(OWN_ADDRESS, "ALICEFPR", true);
    r.storeKey("dave@example.org", "DAVEFPR1", true);

    // 同一地址的第二份文档
    auto extra = FakeScheme::MakeKey("bob@example.org", "BOBFPR02", false);
    REQUIRE(r.store->CreateDoc(extra->ToJson()).ok());

    SECTION("Fetches every distinct public address once, except our own") {
        Error err = r.km->RefreshKeys();
        REQUIRE(err.ok());

        auto requested = r.http->requestedAddresses;
        std::sort(requested.begin(), requested.end());
        REQUIRE(requested == std::vector<std::string>{"bob@example.org", "carol@example.org"});
    }

    SECTION("Continues past failures and reports them together") {
        r.http->directory["bob@example.org"] = transport::HttpResponse{503, "text/plain", "busy"};
        r.http->Publish("carol@example.org", OPENPGP_KEY,
                        FakeScheme::KeyData("carol@example.org", "CAROLNEW", false));

        Error err = r.km->RefreshKeys();
        REQUIRE(err.code() == ErrorCode::TransportFailure);
        REQUIRE(err.what().find("bob@example.org") != std::string::npos);
        REQUIRE(err.what().find("carol@example.org") == std::string::npos);
        REQUIRE(r.http->getCalls == 2);

        auto carol = r.km->GetKey("carol@example.org", keys::KeyType::OpenPGP, false, false);
        REQUIRE(carol.ok());
        REQUIRE(carol.value()->Fingerprint() == "CAROLNEW");
    }
}

TEST_CASE("GenKey", "[keymanager][resolver]") {
    Resolver r;

    auto key = r.km->GenKey(keys::KeyType::OpenPGP);
    REQUIRE(key.ok());
    REQUIRE(key.value()->IsPrivate());
    REQUIRE(key.value()->Address() == OWN_ADDRESS);

    auto stored = r.km->GetKey(OWN_ADDRESS, keys::KeyType::OpenPGP, true);
    REQUIRE(stored.ok());
    REQUIRE(stored.value()->Fingerprint() == key.value()->Fingerprint());
    REQUIRE(r.km->GetKey(OWN_ADDRESS, keys::KeyType::OpenPGP, false, false).ok());
    REQUIRE(r.http->Calls() == 0);
}

TEST_CASE("SendKey", "[keymanager][resolver]") {
    SECTION("Publishes our public key") {
        Resolver r;
        r.storeKey(OWN_ADDRESS, "ALICEFPR", false);
        r.storeKey(OWN_ADDRESS, "ALICEFPR", true);

        Error err = r.km->SendKey(keys::KeyType::OpenPGP);
        REQUIRE(err.ok());
        REQUIRE(r.http->putCalls == 1);
        REQUIRE(r.http->lastPutUrl == "https://api.example.org:4430/1/users/0123abcd.json");
        REQUIRE(r.http->lastForm.at(PUBKEY_KEY) == FakeScheme::KeyData(OWN_ADDRESS, "ALICEFPR", false));
        REQUIRE(r.http->lastCookies.at(SESSION_COOKIE) == "session-token");
        REQUIRE(r.http->lastCaCertPath == "/etc/ssl/example-ca.pem");
    }

    SECTION("Without a local public key nothing is sent") {
        Resolver r;
        r.storeKey(OWN_ADDRESS, "ALICEFPR", true);

        Error err = r.km->SendKey(keys::KeyType::OpenPGP);
        REQUIRE(err.code() == ErrorCode::KeyNotFound);
        REQUIRE(r.http->Calls() == 0);
    }

    SECTION("Requires a session") {
        KeyManagerConfig config = testConfig();
        config.sessionId = "";
        Resolver r(true, config);
        r.storeKey(OWN_ADDRESS, "ALICEFPR", false);

        Error err = r.km->SendKey(keys::KeyType::OpenPGP);
        REQUIRE(err.code() == ErrorCode::AuthenticationRequired);
        REQUIRE(r.http->Calls() == 0);

        r.km->SetSessionId("new-token");
        REQUIRE(r.km->SendKey(keys::KeyType::OpenPGP).ok());
        REQUIRE(r.http->lastCookies.at(SESSION_COOKIE) == "new-token");
    }

    SECTION("Requires a CA path") {
        Resolver r;
        r.storeKey(OWN_ADDRESS, "ALICEFPR", false);
        r.km->SetCaCertPath("");

        Error err = r.km->SendKey(keys::KeyType::OpenPGP);
        REQUIRE(err.code() == ErrorCode::MissingConfiguration);
        REQUIRE(r.http->Calls() == 0);
    }

    SECTION("Backends that cannot publish are rejected") {
        Resolver r(false);
        r.storeKey(OWN_ADDRESS, "ALICEFPR", false);

        Error err = r.km->SendKey(keys::KeyType::OpenPGP);
        REQUIRE(err.code() == ErrorCode::UnknownKeyType);
        REQUIRE(r.http->Calls() == 0);
    }

    SECTION("Server rejection is a transport failure") {
        Resolver r;
        r.storeKey(OWN_ADDRESS, "ALICEFPR", false);
        r.http->putResponse = transport::HttpResponse{422, "application/json", "{\"errors\":{}}"};

        Error err = r.km->SendKey(keys::KeyType::OpenPGP);
        REQUIRE(err.code() == ErrorCode::TransportFailure);
    }
}

TEST_CASE("Local key listing", "[keymanager][resolver]") {
    Resolver r;
    r.storeKey("bob@example.org", "BOBFPR01", false);
    r.storeKey(OWN_ADDRESS, "ALICEFPR", true);

    SECTION("Public and private keys are listed separately") {
        auto pub = r.km->GetAllKeysInLocalDb(false);
        REQUIRE(pub.ok());
        REQUIRE(pub.value().size() == 1);
        REQUIRE(pub.value()[0]->Address() == "bob@example.org");

        auto priv = r.km->GetAllKeysInLocalDb(true);
        REQUIRE(priv.ok());
        REQUIRE(priv.value().size() == 1);
        REQUIRE(priv.value()[0]->IsPrivate());
    }

    SECTION("A document with an unregistered type tag is reported") {
        auto doc = FakeScheme::MakeKey("eve@example.org", "EVEFPR01", false)->ToJson();
        doc["type"] = "x509";
        REQUIRE(r.store->CreateDoc(doc).ok());

        auto all = r.km->GetAllKeysInLocalDb(false);
        REQUIRE_FALSE(all.ok());
        REQUIRE(all.error().code() == ErrorCode::UnknownKeyType);
    }

    SECTION("Deleted keys disappear") {
        auto bob = r.km->GetKey("bob@example.org", keys::KeyType::OpenPGP, false, false);
        REQUIRE(bob.ok());
        REQUIRE(r.km->DeleteKey(bob.value()).ok());

        auto again = r.km->GetKey("bob@example.org", keys::KeyType::OpenPGP, false, false);
        REQUIRE(again.error().code() == ErrorCode::KeyNotFound);
    }
}

TEST_CASE("Configuration accessors", "[keymanager]") {
    Resolver r;

    REQUIRE(r.km->Address() == OWN_ADDRESS);
    r.km->SetApiUri("https://api2.example.org");
    r.km->SetApiVersion("2");
    r.km->SetUid("ffff");
    r.km->SetNickserverUri("https://nicknym2.example.org");

    KeyManagerConfig snapshot = r.km->Config();
    REQUIRE(snapshot.apiUri == "https://api2.example.org");
    REQUIRE(snapshot.apiVersion == "2");
    REQUIRE(snapshot.uid == "ffff");
    REQUIRE(r.km->NickserverUri() == "https://nicknym2.example.org");
    REQUIRE(snapshot.address == OWN_ADDRESS);
}
