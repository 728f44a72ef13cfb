#include <doctest/doctest.h>
#include <nlohmann/json.hpp>
#include "acmeflow/jwk.hpp"
#include "acmeflow/crypto.hpp"
#include "test_helpers.hpp"

using namespace acmeflow;
using json = nlohmann::json;

TEST_CASE("JwkThumbprintKnownVector") {
    // RFC 7638 section 3.1
    json jwk = {
        {"kty", "RSA"},
        {"n", "0vx7agoebGcQSuuPiLJXZptN9nndrQmbXEps2aiAFbWhM78LhWx4cbbfAAtVT86zwu1RK7aPFFxuhDR1L6tSoc_BJECPebWKRXjBZCiFV4n3oknjhMstn64tZ_2W-5JsGY4Hc5n9yBXArwl93lqt7_RN5w6Cf0h4QyQ5v-65YGjQR0_FDW2QvzqY368QQMicAtaSqzs8KJZgnYb9c7d0zgdAZHzu6qMQvRL5hajrn1n91CbOpbISD08qNLyrdkt-bFTWhAI4vMQFh6WeZu0fM4lFd2NcRwr3XPksINHaQ-G_xBniIqbw0Ls1jF44-csFCur-kEgU8awapJzKnqDKgw"},
        {"e", "AQAB"},
        {"alg", "RS256"},
        {"kid", "2011-04-29"}
    };
    CHECK(jwk::calculateJWKThumbprint(jwk.dump()) == "NzbLsXh8uDCcd-6MNwXF4W_7noWXFZAfHkxZsRGC9Xs");
}

TEST_CASE("JwkFromAccountKey") {
    const auto& key = test::rsaAccountKey();
    json jwk = json::parse(jwk::createJWKFromKeyPair(key));

    CHECK(jwk.size() == 3);
    CHECK(jwk["kty"] == "RSA");
    CHECK(jwk["e"] == "AQAB");

    std::string n = jwk["n"];
    CHECK(n.find('=') == std::string::npos);
    CHECK(n.find('+') == std::string::npos);
    CHECK(n.find('/') == std::string::npos);
    CHECK(base64UrlDecode(n).size() == 256);
}

TEST_CASE("JwkRoundTripToPublicKey") {
    const auto& key = test::rsaAccountKey();
    std::string jwk = jwk::createJWKFromKeyPair(key);
    CHECK(jwk::publicKeyDerFromJWK(jwk) == key.publicKeyDer());
}

TEST_CASE("JwkThumbprintIgnoresMemberOrder") {
    json a = {{"kty", "RSA"}, {"n", "AQID"}, {"e", "AQAB"}};
    std::string reordered = R"({"n":"AQID","e":"AQAB","kty":"RSA","use":"sig"})";
    CHECK(jwk::calculateJWKThumbprint(a.dump()) == jwk::calculateJWKThumbprint(reordered));
}

TEST_CASE("JwkRejectsEcKeys") {
    auto key = AccountKeyPair::generateEc();
    CHECK_THROWS_AS(jwk::createJWKFromKeyPair(key), UnsupportedKeyTypeError);
    CHECK_THROWS_AS(jwk::calculateJWKThumbprint(R"({"kty":"EC","crv":"P-256","x":"AA","y":"AA"})"),
                    UnsupportedKeyTypeError);
}

TEST_CASE("JwkMalformedInput") {
    CHECK_THROWS_AS(jwk::calculateJWKThumbprint("not json"), CryptoError);
    CHECK_THROWS_AS(jwk::calculateJWKThumbprint(R"({"kty":"RSA","n":"AQID"})"), CryptoError);
    CHECK_THROWS_AS(jwk::publicKeyDerFromJWK(R"({"kty":"RSA","n":"","e":"AQAB"})"), CryptoError);
}
