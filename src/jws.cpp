/**
 * @file jws.cpp
 * @brief Implementation of JWS challenge proofs
 */

#include "acmeflow/jws.hpp"

#include <nlohmann/json.hpp>

#include "acmeflow/base64.hpp"
#include "acmeflow/jwk.hpp"
#include "acmeflow/logging.hpp"

using json = nlohmann::json;

namespace acmeflow {

namespace {

constexpr std::string_view KEY_AUTHORIZATION_CLAIM = "keyAuthorization";

std::vector<std::string_view> splitCompact(std::string_view compact) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (true) {
    size_t dot = compact.find('.', start);
    if (dot == std::string_view::npos) {
      parts.push_back(compact.substr(start));
      break;
    }
    parts.push_back(compact.substr(start, dot - start));
    start = dot + 1;
  }
  return parts;
}

json decodeSegment(std::string_view segment, const char* what) {
  try {
    json parsed = json::parse(base64UrlDecodeToString(segment));
    if (!parsed.is_object()) {
      throw MalformedResponseError(std::string("JWS ") + what +
                                   " is not a JSON object");
    }
    return parsed;
  } catch (const InvalidBase64Error& e) {
    throw MalformedResponseError(std::string("JWS ") + what + ": " + e.what());
  } catch (const json::exception& e) {
    throw MalformedResponseError(std::string("JWS ") + what + ": " + e.what());
  }
}

}  // namespace

ChallengeProof::ChallengeProof(JwsHeader header, std::string token,
                               std::string protected_b64,
                               std::string payload_b64,
                               std::vector<uint8_t> signature)
    : header_(std::move(header)),
      token_(std::move(token)),
      protected_b64_(std::move(protected_b64)),
      payload_b64_(std::move(payload_b64)),
      signature_(std::move(signature)) {}

ChallengeProof ChallengeProof::sign(std::string_view token,
                                    const CryptographicAlgorithm& algorithm,
                                    const std::string& public_key_jwk) {
  JwsHeader header{algorithm.algorithmName(), public_key_jwk};

  json protected_json = {{"alg", header.alg},
                         {"jwk", json::parse(header.jwk)}};
  json payload_json = {{KEY_AUTHORIZATION_CLAIM, token}};

  std::string protected_b64 = base64UrlEncode(protected_json.dump());
  std::string payload_b64 = base64UrlEncode(payload_json.dump());

  std::string signing_input = protected_b64 + "." + payload_b64;
  std::vector<uint8_t> input_bytes(signing_input.begin(), signing_input.end());
  auto signature = algorithm.sign(input_bytes);

  ACMEFLOW_LOG_DEBUG("Signed challenge proof with {} ({} byte signature)",
                     header.alg, signature.size());

  return ChallengeProof{std::move(header), std::string(token),
                        std::move(protected_b64), std::move(payload_b64),
                        std::move(signature)};
}

ChallengeProof ChallengeProof::from_compact(std::string_view compact) {
  auto parts = splitCompact(compact);
  if (parts.size() != 3) {
    throw MalformedResponseError("JWS compact form must have three parts");
  }

  json header_json = decodeSegment(parts[0], "header");
  json payload_json = decodeSegment(parts[1], "payload");

  JwsHeader header;
  auto alg = header_json.find("alg");
  if (alg != header_json.end() && alg->is_string()) {
    header.alg = alg->get<std::string>();
  }
  auto jwk = header_json.find("jwk");
  if (jwk != header_json.end() && jwk->is_object()) {
    header.jwk = jwk->dump();
  }
  if (!header.is_valid()) {
    throw MalformedResponseError("JWS header lacks alg or jwk");
  }

  auto claim = payload_json.find(KEY_AUTHORIZATION_CLAIM);
  if (claim == payload_json.end() || !claim->is_string()) {
    throw MalformedResponseError("JWS payload lacks keyAuthorization claim");
  }

  std::vector<uint8_t> signature;
  try {
    signature = base64UrlDecode(parts[2]);
  } catch (const InvalidBase64Error& e) {
    throw MalformedResponseError(std::string("JWS signature: ") + e.what());
  }

  return ChallengeProof{std::move(header), claim->get<std::string>(),
                        std::string(parts[0]), std::string(parts[1]),
                        std::move(signature)};
}

std::string ChallengeProof::to_compact() const {
  return protected_b64_ + "." + payload_b64_ + "." +
         base64UrlEncode(signature_);
}

std::vector<uint8_t> ChallengeProof::create_signing_input() const {
  std::string input = protected_b64_ + "." + payload_b64_;
  return std::vector<uint8_t>(input.begin(), input.end());
}

bool ChallengeProof::verify_signature(
    const CryptographicAlgorithm& algorithm) const {
  if (header_.alg != algorithm.algorithmName()) {
    return false;
  }
  try {
    return algorithm.verify(create_signing_input(), signature_);
  } catch (const AcmeError& e) {
    ACMEFLOW_LOG_DEBUG("Challenge proof verification failed: {}", e.what());
    return false;
  }
}

bool ChallengeProof::verify_signature() const {
  if (!header_.is_valid()) {
    return false;
  }
  try {
    Rs256Algorithm algorithm(jwk::publicKeyDerFromJWK(header_.jwk));
    return verify_signature(algorithm);
  } catch (const AcmeError& e) {
    ACMEFLOW_LOG_DEBUG("Cannot rebuild key from proof JWK: {}", e.what());
    return false;
  }
}

}  // namespace acmeflow
