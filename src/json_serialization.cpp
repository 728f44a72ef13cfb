/**
 * @file json_serialization.cpp
 * @brief JSON serialization implementation for ACME resources
 */

#include "acmeflow/json_serialization.hpp"

#include <cstdint>
#include <string>

#include "acmeflow/error.hpp"

namespace acmeflow {
namespace json_serialization {

namespace {

std::string requireString(const nlohmann::json& j, const char* name,
                          const char* owner) {
  auto it = j.find(name);
  if (it == j.end() || !it->is_string()) {
    throw MalformedResponseError(std::string(owner) + " lacks string member \"" +
                                 name + "\"");
  }
  return it->get<std::string>();
}

std::optional<std::string> optionalString(const nlohmann::json& j,
                                          const char* name) {
  auto it = j.find(name);
  if (it != j.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return std::nullopt;
}

void requireObject(const nlohmann::json& j, const char* owner) {
  if (!j.is_object()) {
    throw MalformedResponseError(std::string(owner) + " is not a JSON object");
  }
}

}  // namespace

nlohmann::json parseBody(std::string_view body) {
  nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    throw MalformedResponseError("body is not valid JSON");
  }
  requireObject(parsed, "body");
  return parsed;
}

void to_json(nlohmann::json& j, const Identifier& identifier) {
  j = nlohmann::json::object();
  j["type"] = identifier.type;
  j["value"] = identifier.value;
}

void from_json(const nlohmann::json& j, Identifier& identifier) {
  requireObject(j, "identifier");
  identifier.type = requireString(j, "type", "identifier");
  identifier.value = requireString(j, "value", "identifier");
}

void to_json(nlohmann::json& j, const Challenge& challenge) {
  j = nlohmann::json::object();
  j["type"] = challenge.type;
  j["token"] = challenge.token;
  j["status"] = challenge.status;
  if (challenge.uri.has_value()) {
    j["uri"] = challenge.uri.value();
  }
}

void from_json(const nlohmann::json& j, Challenge& challenge) {
  requireObject(j, "challenge");
  challenge = Challenge{};
  challenge.type = requireString(j, "type", "challenge");
  // Tokens are checked against the allowed alphabet when signed
  challenge.token = optionalString(j, "token").value_or("");
  challenge.status = optionalString(j, "status").value_or("pending");
  challenge.uri = optionalString(j, "uri");
}

void to_json(nlohmann::json& j, const Authorization& authorization) {
  j = nlohmann::json::object();
  to_json(j["identifier"], authorization.identifier);
  j["status"] = authorization.status;
  if (authorization.expires.has_value()) {
    j["expires"] = authorization.expires.value();
  }
  j["challenges"] = nlohmann::json::array();
  for (const auto& challenge : authorization.challenges) {
    nlohmann::json entry;
    to_json(entry, challenge);
    j["challenges"].push_back(std::move(entry));
  }
  if (authorization.combinations.has_value()) {
    j["combinations"] = authorization.combinations.value();
  }
}

void from_json(const nlohmann::json& j, Authorization& authorization) {
  requireObject(j, "authorization");
  authorization = Authorization{};

  if (j.contains("identifier")) {
    from_json(j["identifier"], authorization.identifier);
  }
  authorization.status = optionalString(j, "status").value_or("pending");
  authorization.expires = optionalString(j, "expires");

  auto challenges = j.find("challenges");
  if (challenges == j.end() || !challenges->is_array()) {
    throw MalformedResponseError("authorization lacks a challenges array");
  }
  for (const auto& entry : *challenges) {
    Challenge challenge;
    from_json(entry, challenge);
    authorization.challenges.push_back(std::move(challenge));
  }

  auto combinations = j.find("combinations");
  if (combinations == j.end() || combinations->is_null()) {
    return;
  }
  if (!combinations->is_array()) {
    throw MalformedResponseError("combinations is not an array");
  }

  std::vector<std::vector<size_t>> sets;
  for (const auto& combination : *combinations) {
    if (!combination.is_array()) {
      throw MalformedResponseError("combination is not an array");
    }
    std::vector<size_t> indices;
    for (const auto& index : combination) {
      if (!index.is_number_integer() || index.get<int64_t>() < 0 ||
          index.get<uint64_t>() >= authorization.challenges.size()) {
        throw MalformedResponseError("combination index out of range");
      }
      indices.push_back(index.get<size_t>());
    }
    sets.push_back(std::move(indices));
  }
  authorization.combinations = std::move(sets);
}

void from_json(const nlohmann::json& j, RegistrationRecord& record) {
  requireObject(j, "registration");
  record = RegistrationRecord{};
  record.raw = j;

  auto contact = j.find("contact");
  if (contact != j.end()) {
    if (!contact->is_array()) {
      throw MalformedResponseError("registration contact is not an array");
    }
    for (const auto& entry : *contact) {
      if (!entry.is_string()) {
        throw MalformedResponseError("registration contact entry is not a string");
      }
      record.contact.push_back(entry.get<std::string>());
    }
  }
  record.agreement = optionalString(j, "agreement");
}

void to_json(nlohmann::json& j, const NewRegistrationRequest& request) {
  j = nlohmann::json::object();
  j["contact"] = request.contact;
  if (request.agreement.has_value()) {
    j["agreement"] = request.agreement.value();
  }
}

void to_json(nlohmann::json& j, const RegistrationUpdateRequest& request) {
  j = nlohmann::json::object();
  j["contact"] = request.contact;
  if (request.agreement.has_value()) {
    j["agreement"] = request.agreement.value();
  }
}

void to_json(nlohmann::json& j, const NewAuthorizationRequest& request) {
  j = nlohmann::json::object();
  to_json(j["identifier"], request.identifier);
}

void to_json(nlohmann::json& j, const ChallengeAnswerRequest& request) {
  j = nlohmann::json::object();
  j["type"] = request.type;
  j["token"] = request.token;
  j["keyAuthorization"] = request.key_authorization;
}

std::string statusOf(const nlohmann::json& j) {
  return requireString(j, "status", "resource");
}

}  // namespace json_serialization
}  // namespace acmeflow
