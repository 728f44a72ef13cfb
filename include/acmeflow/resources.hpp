/**
 * @file resources.hpp
 * @brief ACME protocol resources and request messages
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace acmeflow {

/**
 * @brief Resource tags sent in the "resource" member of each request
 */
namespace resource {
constexpr std::string_view NEW_REGISTRATION = "new-reg";
constexpr std::string_view REGISTRATION = "reg";
constexpr std::string_view NEW_AUTHORIZATION = "new-authz";
constexpr std::string_view AUTHORIZATION = "authz";
}  // namespace resource

namespace challenge_type {
constexpr std::string_view HTTP_01 = "http-01";
}  // namespace challenge_type

/**
 * @brief Lifecycle state of an authorization or challenge
 *
 * pending -> valid | invalid; both terminal.
 */
enum class ResourceStatus { Pending, Valid, Invalid, Unknown };

constexpr ResourceStatus parseStatus(std::string_view status) noexcept {
  if (status == "pending") return ResourceStatus::Pending;
  if (status == "valid") return ResourceStatus::Valid;
  if (status == "invalid") return ResourceStatus::Invalid;
  return ResourceStatus::Unknown;
}

/**
 * @brief Check a challenge token against [A-Za-z0-9_-]+
 */
constexpr bool isValidToken(std::string_view token) noexcept {
  if (token.empty()) {
    return false;
  }
  for (char c : token) {
    bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
              (c >= '0' && c <= '9') || c == '_' || c == '-';
    if (!ok) {
      return false;
    }
  }
  return true;
}

struct Identifier {
  std::string type = "dns";
  std::string value;
};

/**
 * @brief One way of proving control of a domain
 *
 * The raw status string is kept so an unrecognized value can be reported.
 */
struct Challenge {
  std::string type;
  std::string token;
  std::string status = "pending";
  std::optional<std::string> uri;

  [[nodiscard]] ResourceStatus state() const noexcept {
    return parseStatus(status);
  }
};

/**
 * @brief Proof-of-control record for one domain
 */
struct Authorization {
  Identifier identifier;
  std::string status = "pending";
  std::optional<std::string> expires;
  std::vector<Challenge> challenges;
  /// Index sets into challenges; absent when the CA sent none
  std::optional<std::vector<std::vector<size_t>>> combinations;

  [[nodiscard]] ResourceStatus state() const noexcept {
    return parseStatus(status);
  }
};

struct AuthorizationResponse {
  std::string location;
  Authorization authorization;
};

struct RegistrationRecord {
  std::vector<std::string> contact;
  std::optional<std::string> agreement;
  std::optional<std::string> location;
  nlohmann::json raw;
};

//
// Request messages
//

struct NewRegistrationRequest {
  std::vector<std::string> contact;
  std::optional<std::string> agreement;
};

/**
 * @brief Re-issued registration sent to an existing account URL
 */
struct RegistrationUpdateRequest {
  std::vector<std::string> contact;
  std::optional<std::string> agreement;
};

struct NewAuthorizationRequest {
  Identifier identifier;
};

struct ChallengeAnswerRequest {
  std::string type;
  std::string token;
  std::string key_authorization;  ///< Compact JWS proof
};

using AcmeRequest =
    std::variant<NewRegistrationRequest, RegistrationUpdateRequest,
                 NewAuthorizationRequest, ChallengeAnswerRequest>;

/**
 * @brief Resource tag for a request
 */
std::string_view resourceTag(const AcmeRequest& request) noexcept;

/**
 * @brief Build the JSON payload, including the "resource" member
 */
nlohmann::json toPayload(const AcmeRequest& request);

}  // namespace acmeflow
