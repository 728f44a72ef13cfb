/**
 * @file jwk.hpp
 * @brief JSON Web Key (JWK) utilities for the account key
 *
 * Builds the RFC 7517 representation embedded in challenge proofs and
 * computes RFC 7638 thumbprints.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace acmeflow {

class AccountKeyPair;

/**
 * @brief JWK utilities namespace
 */
namespace jwk {

/**
 * @brief Create RSA JWK from DER-encoded public key
 * @param public_key_der DER-encoded SubjectPublicKeyInfo
 * @return JWK JSON string with "kty", "n" and "e"
 * @throws CryptoError if key parsing or extraction fails
 */
std::string createRS256JWK(const std::vector<uint8_t>& public_key_der);

/**
 * @brief Create the JWK for an account key
 * @throws UnsupportedKeyTypeError if the key is not RSA
 */
std::string createJWKFromKeyPair(const AccountKeyPair& key_pair);

/**
 * @brief Calculate JWK thumbprint using SHA-256
 * @param jwk_json JWK in JSON string format
 * @return Base64url-encoded thumbprint
 * @throws UnsupportedKeyTypeError if the JWK is not RSA
 * @throws CryptoError if the JWK is malformed
 */
std::string calculateJWKThumbprint(const std::string& jwk_json);

/**
 * @brief Rebuild a DER public key from an RSA JWK
 * @param jwk_json JWK in JSON string format
 * @return DER-encoded SubjectPublicKeyInfo
 * @throws CryptoError if the JWK is malformed or not RSA
 */
std::vector<uint8_t> publicKeyDerFromJWK(const std::string& jwk_json);

}  // namespace jwk
}  // namespace acmeflow
