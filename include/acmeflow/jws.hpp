/**
 * @file jws.hpp
 * @brief JWS challenge proofs binding a challenge token to the account key
 *
 * A proof is a compact-serialized JWS (RFC 7515) whose protected header
 * embeds the account public key as a JWK and whose payload carries the
 * challenge token as the "keyAuthorization" claim.
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "crypto.hpp"
#include "error.hpp"

namespace acmeflow {

/**
 * @brief JWS protected header parameters
 */
struct JwsHeader {
  std::string alg;  ///< Signing algorithm, "RS256"
  std::string jwk;  ///< JSON Web Key (public key) as JSON text

  [[nodiscard]] bool is_valid() const noexcept {
    return !alg.empty() && !jwk.empty();
  }
};

/**
 * @brief Signed artifact proving control of the account key for one token
 *
 * Immutable once created. The base64url segments are kept exactly as
 * signed so a parsed proof verifies against the original bytes.
 */
class ChallengeProof {
 public:
  /**
   * @brief Sign a token claim with the given algorithm
   * @param token Challenge token (validated by the caller)
   * @param algorithm Signing algorithm holding the private key
   * @param public_key_jwk JWK of the signing key
   * @throws CryptoError if signing fails
   */
  static ChallengeProof sign(std::string_view token,
                             const CryptographicAlgorithm& algorithm,
                             const std::string& public_key_jwk);

  /**
   * @brief Parse from compact serialization "header.payload.signature"
   * @throws MalformedResponseError if the structure is not a JWS proof
   */
  static ChallengeProof from_compact(std::string_view compact);

  /**
   * @brief Serialize to compact form
   */
  [[nodiscard]] std::string to_compact() const;

  /**
   * @brief Bytes covered by the signature: ASCII(header "." payload)
   */
  [[nodiscard]] std::vector<uint8_t> create_signing_input() const;

  /**
   * @brief Verify with an explicit algorithm
   */
  [[nodiscard]] bool verify_signature(
      const CryptographicAlgorithm& algorithm) const;

  /**
   * @brief Verify using the public key embedded in the header JWK
   */
  [[nodiscard]] bool verify_signature() const;

  [[nodiscard]] const JwsHeader& get_header() const noexcept { return header_; }
  [[nodiscard]] const std::string& get_token() const noexcept { return token_; }
  [[nodiscard]] std::span<const uint8_t> get_signature() const noexcept {
    return std::span<const uint8_t>{signature_};
  }

 private:
  ChallengeProof(JwsHeader header, std::string token,
                 std::string protected_b64, std::string payload_b64,
                 std::vector<uint8_t> signature);

  JwsHeader header_;
  std::string token_;
  std::string protected_b64_;
  std::string payload_b64_;
  std::vector<uint8_t> signature_;
};

}  // namespace acmeflow
