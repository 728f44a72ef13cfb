/**
 * @file json_serialization.hpp
 * @brief JSON serialization utilities for ACME resources
 */

#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

#include "resources.hpp"

namespace acmeflow {

/**
 * @brief JSON serialization utilities for ACME resources
 *
 * Decoders throw MalformedResponseError when a required member is missing
 * or has the wrong type; unknown members are ignored.
 */
namespace json_serialization {

/**
 * @brief Parse a response body into a JSON object
 * @throws MalformedResponseError if the body is not a JSON object
 */
nlohmann::json parseBody(std::string_view body);

void to_json(nlohmann::json& j, const Identifier& identifier);
void from_json(const nlohmann::json& j, Identifier& identifier);

void to_json(nlohmann::json& j, const Challenge& challenge);
void from_json(const nlohmann::json& j, Challenge& challenge);

void to_json(nlohmann::json& j, const Authorization& authorization);

/**
 * @brief Parse an authorization object
 *
 * "combinations" stays std::nullopt when absent, and every index it holds
 * must refer to an entry of "challenges".
 */
void from_json(const nlohmann::json& j, Authorization& authorization);

/**
 * @brief Parse a registration object, keeping the raw JSON
 */
void from_json(const nlohmann::json& j, RegistrationRecord& record);

/**
 * @brief Convert request messages to JSON (without the "resource" tag)
 */
void to_json(nlohmann::json& j, const NewRegistrationRequest& request);
void to_json(nlohmann::json& j, const RegistrationUpdateRequest& request);
void to_json(nlohmann::json& j, const NewAuthorizationRequest& request);
void to_json(nlohmann::json& j, const ChallengeAnswerRequest& request);

/**
 * @brief Read the "status" member of a polled resource
 * @throws MalformedResponseError if it is missing or not a string
 */
std::string statusOf(const nlohmann::json& j);

}  // namespace json_serialization

}  // namespace acmeflow
