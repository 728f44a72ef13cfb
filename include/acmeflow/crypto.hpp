/**
 * @file crypto.hpp
 * @brief Account key material and the RS256 signing algorithm
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "base64.hpp"
#include "error.hpp"

// Forward declarations for OpenSSL types
typedef struct evp_pkey_st EVP_PKEY;
typedef struct bio_st BIO;

namespace acmeflow {

namespace crypto_constants {
constexpr int RSA_DEFAULT_KEY_BITS = 2048;  ///< Default account key size
constexpr int RSA_MIN_KEY_BITS = 2048;      ///< Smallest key accepted for RS256
constexpr size_t SHA256_DIGEST_SIZE = 32;

constexpr bool is_valid_rsa_key_bits(int bits) noexcept {
  return bits >= RSA_MIN_KEY_BITS && bits <= 8192;
}
}  // namespace crypto_constants

static_assert(crypto_constants::is_valid_rsa_key_bits(
                  crypto_constants::RSA_DEFAULT_KEY_BITS),
              "Default RSA key size is invalid");

/**
 * @brief RAII deleter for OpenSSL EVP_PKEY
 */
struct EvpKeyDeleter {
  void operator()(EVP_PKEY* key) const noexcept;
};
using EvpKeyPtr = std::unique_ptr<EVP_PKEY, EvpKeyDeleter>;

/**
 * @brief RAII deleter for OpenSSL BIO
 */
struct BioDeleter {
  void operator()(BIO* bio) const noexcept;
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

/**
 * @brief Family of an asymmetric key
 */
enum class KeyType { RSA, EC, OTHER };

constexpr std::string_view keyTypeName(KeyType type) noexcept {
  switch (type) {
    case KeyType::RSA:
      return "RSA";
    case KeyType::EC:
      return "EC";
    case KeyType::OTHER:
      break;
  }
  return "OTHER";
}

/**
 * @brief Concept for byte containers accepted by the signing API
 */
template <typename T>
concept CryptoData = requires(T t) {
  std::data(t);
  std::size(t);
  typename T::value_type;
  requires std::same_as<typename T::value_type, uint8_t>;
};

/**
 * @brief Compute SHA-256 hash
 * @param data Input data
 * @return 32 hash bytes
 */
std::vector<uint8_t> hashSha256(const std::vector<uint8_t>& data);

/**
 * @brief The ACME account key pair
 *
 * Owned by the caller and borrowed by the orchestrator for the whole
 * session. Move-only; the underlying EVP_PKEY is never mutated after
 * construction, so a const instance may be shared between threads.
 */
class AccountKeyPair {
 public:
  /**
   * @brief Load a private key from PEM (PKCS#1, PKCS#8 or SEC1)
   * @throws CryptoError if the PEM cannot be parsed
   */
  static AccountKeyPair fromPem(std::string_view privateKeyPem);

  /**
   * @brief Generate a fresh RSA key pair
   * @param bits Modulus size in bits
   * @throws CryptoError on generation failure or unsupported size
   */
  static AccountKeyPair generateRsa(
      int bits = crypto_constants::RSA_DEFAULT_KEY_BITS);

  /**
   * @brief Generate a P-256 EC key pair
   */
  static AccountKeyPair generateEc();

  AccountKeyPair(AccountKeyPair&& other) noexcept = default;
  AccountKeyPair& operator=(AccountKeyPair&& other) noexcept = default;
  AccountKeyPair(const AccountKeyPair&) = delete;
  AccountKeyPair& operator=(const AccountKeyPair&) = delete;
  ~AccountKeyPair() = default;

  [[nodiscard]] KeyType keyType() const noexcept;

  /**
   * @brief Export the private key as PKCS#8 PEM
   */
  [[nodiscard]] std::string privateKeyPem() const;

  /**
   * @brief Export the public key as DER SubjectPublicKeyInfo
   */
  [[nodiscard]] std::vector<uint8_t> publicKeyDer() const;

  /**
   * @brief Borrow the OpenSSL handle
   */
  [[nodiscard]] EVP_PKEY* native() const noexcept { return key_.get(); }

 private:
  explicit AccountKeyPair(EvpKeyPtr key);

  EvpKeyPtr key_;
};

/**
 * @brief Abstract base class for signature algorithms
 */
class CryptographicAlgorithm {
 public:
  virtual ~CryptographicAlgorithm() = default;

  /**
   * @brief Sign data with the algorithm
   * @param data Data to sign
   * @return Signature bytes
   */
  template <CryptoData T>
  std::vector<uint8_t> sign(const T& data) const {
    return signImpl({std::data(data), std::size(data)});
  }

  /**
   * @brief Verify a signature
   * @param data Original data
   * @param signature Signature to verify
   * @return True if signature is valid
   */
  template <CryptoData T1, CryptoData T2>
  bool verify(const T1& data, const T2& signature) const {
    return verifyImpl({std::data(data), std::size(data)},
                      {std::data(signature), std::size(signature)});
  }

  /**
   * @brief JOSE algorithm name, e.g. "RS256"
   */
  virtual std::string algorithmName() const = 0;

 protected:
  virtual std::vector<uint8_t> signImpl(
      std::span<const uint8_t> data) const = 0;
  virtual bool verifyImpl(std::span<const uint8_t> data,
                          std::span<const uint8_t> signature) const = 0;
};

/**
 * @brief RSASSA-PKCS1-v1_5 with SHA-256 (JOSE "RS256")
 */
class Rs256Algorithm : public CryptographicAlgorithm {
 public:
  struct Impl;

 private:
  std::unique_ptr<Impl> pImpl_;

 public:
  /**
   * @brief Sign and verify with the account key
   * @throws UnsupportedKeyTypeError if the key is not RSA
   */
  explicit Rs256Algorithm(const AccountKeyPair& keyPair);

  /**
   * @brief Verification only, from a DER SubjectPublicKeyInfo
   * @throws CryptoError if the DER cannot be parsed
   * @throws UnsupportedKeyTypeError if the key is not RSA
   */
  explicit Rs256Algorithm(const std::vector<uint8_t>& publicKeyDer);
  ~Rs256Algorithm() override;

  Rs256Algorithm(Rs256Algorithm&& other) noexcept;
  Rs256Algorithm& operator=(Rs256Algorithm&& other) noexcept;

  Rs256Algorithm(const Rs256Algorithm&) = delete;
  Rs256Algorithm& operator=(const Rs256Algorithm&) = delete;

  std::vector<uint8_t> getPublicKey() const;

  std::string algorithmName() const override { return "RS256"; }

 protected:
  std::vector<uint8_t> signImpl(std::span<const uint8_t> data) const override;
  bool verifyImpl(std::span<const uint8_t> data,
                  std::span<const uint8_t> signature) const override;
};

}  // namespace acmeflow
