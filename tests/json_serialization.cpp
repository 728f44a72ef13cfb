#include <doctest/doctest.h>
#include "acmeflow/json_serialization.hpp"
#include "acmeflow/error.hpp"

using namespace acmeflow;
using json = nlohmann::json;

TEST_CASE("ParseAuthorization") {
    json j = {
        {"identifier", {{"type", "dns"}, {"value", "example.com"}}},
        {"status", "pending"},
        {"expires", "2015-03-01T14:09:00Z"},
        {"challenges", json::array({
            {{"type", "dns-01"}, {"token", "DGyRejmCefe7v4NfDGDKfA"}, {"uri", "https://ca.example/chall/1"}},
            {{"type", "http-01"}, {"token", "IlirfxKKXAsHtmzK29Pj8A"}, {"status", "pending"}}
        })},
        {"combinations", json::array({json::array({0}), json::array({1})})}
    };

    Authorization authz;
    json_serialization::from_json(j, authz);

    CHECK(authz.identifier.value == "example.com");
    CHECK(authz.state() == ResourceStatus::Pending);
    CHECK(authz.expires == std::optional<std::string>("2015-03-01T14:09:00Z"));
    REQUIRE(authz.challenges.size() == 2);
    CHECK(authz.challenges[0].uri == std::optional<std::string>("https://ca.example/chall/1"));
    CHECK_FALSE(authz.challenges[1].uri.has_value());
    CHECK(authz.challenges[1].state() == ResourceStatus::Pending);
    REQUIRE(authz.combinations.has_value());
    CHECK(authz.combinations->size() == 2);
    CHECK((*authz.combinations)[1] == std::vector<size_t>{1});
}

TEST_CASE("ParseAuthorizationWithoutCombinations") {
    json j = {{"challenges", json::array({{{"type", "http-01"}, {"token", "t"}}})}};
    Authorization authz;
    json_serialization::from_json(j, authz);
    CHECK_FALSE(authz.combinations.has_value());
    CHECK(authz.challenges.size() == 1);
}

TEST_CASE("ParseAuthorizationRejectsBadShapes") {
    Authorization authz;
    CHECK_THROWS_AS(json_serialization::from_json(json::object(), authz), MalformedResponseError);
    CHECK_THROWS_AS(json_serialization::from_json(json::array(), authz), MalformedResponseError);

    json bad_index = {
        {"challenges", json::array({{{"type", "http-01"}, {"token", "t"}}})},
        {"combinations", json::array({json::array({3})})}
    };
    CHECK_THROWS_AS(json_serialization::from_json(bad_index, authz), MalformedResponseError);

    json missing_type = {{"challenges", json::array({{{"token", "t"}}})}};
    CHECK_THROWS_AS(json_serialization::from_json(missing_type, authz), MalformedResponseError);
}

TEST_CASE("ParseRegistration") {
    json j = {{"contact", json::array({"mailto:admin@example.com"})}, {"agreement", "https://ca.example/terms"}, {"key", {{"kty", "RSA"}}}};
    RegistrationRecord record;
    json_serialization::from_json(j, record);
    CHECK(record.contact == std::vector<std::string>{"mailto:admin@example.com"});
    CHECK(record.agreement == std::optional<std::string>("https://ca.example/terms"));
    CHECK(record.raw == j);
    CHECK_FALSE(record.location.has_value());

    json bad = {{"contact", "mailto:admin@example.com"}};
    CHECK_THROWS_AS(json_serialization::from_json(bad, record), MalformedResponseError);
}

TEST_CASE("ParseBody") {
    CHECK(json_serialization::parseBody(R"({"status":"valid"})")["status"] == "valid");
    CHECK_THROWS_AS(json_serialization::parseBody("<html>"), MalformedResponseError);
    CHECK_THROWS_AS(json_serialization::parseBody("[1,2]"), MalformedResponseError);

    // Malformed bodies are protocol violations
    CHECK_THROWS_AS(json_serialization::parseBody(""), ProtocolViolationError);
}

TEST_CASE("StatusOf") {
    CHECK(json_serialization::statusOf({{"status", "invalid"}}) == "invalid");
    CHECK_THROWS_AS(json_serialization::statusOf(json::object()), MalformedResponseError);
    CHECK_THROWS_AS(json_serialization::statusOf({{"status", 3}}), MalformedResponseError);
}

TEST_CASE("RequestPayloads") {
    AcmeRequest reg = NewRegistrationRequest{{"mailto:a@example.com"}, std::string("https://ca.example/terms")};
    CHECK(resourceTag(reg) == "new-reg");
    json payload = toPayload(reg);
    CHECK(payload["resource"] == "new-reg");
    CHECK(payload["contact"] == json::array({"mailto:a@example.com"}));
    CHECK(payload["agreement"] == "https://ca.example/terms");

    AcmeRequest fetch = RegistrationUpdateRequest{{}, std::nullopt};
    CHECK(toPayload(fetch)["resource"] == "reg");
    CHECK_FALSE(toPayload(fetch).contains("agreement"));

    NewAuthorizationRequest authz;
    authz.identifier.value = "example.com";
    json authz_payload = toPayload(authz);
    CHECK(authz_payload == json{{"resource", "new-authz"}, {"identifier", {{"type", "dns"}, {"value", "example.com"}}}});

    AcmeRequest answer = ChallengeAnswerRequest{"http-01", "tok", "a.b.c"};
    CHECK(resourceTag(answer) == "authz");
    CHECK(toPayload(answer) == json{{"resource", "authz"}, {"type", "http-01"}, {"token", "tok"}, {"keyAuthorization", "a.b.c"}});
}

TEST_CASE("TokenAlphabet") {
    CHECK(isValidToken("abc_-123"));
    CHECK(isValidToken("DGyRejmCefe7v4NfDGDKfA"));
    CHECK_FALSE(isValidToken(""));
    CHECK_FALSE(isValidToken("abc/123"));
    CHECK_FALSE(isValidToken("abc 123"));
    CHECK_FALSE(isValidToken("abc.123"));
    static_assert(isValidToken("compile-time_ok"));
}
