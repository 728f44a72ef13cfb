#include "acmeflow/crypto.hpp"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/sha.h>
#include <openssl/x509.h>

#include "acmeflow/logging.hpp"
#include "openssl_wrapper.hpp"

namespace acmeflow {

using detail::OpenSSLWrapper;

// RAII deleter implementations
void EvpKeyDeleter::operator()(EVP_PKEY* key) const noexcept {
  if (key) EVP_PKEY_free(key);
}

void BioDeleter::operator()(BIO* bio) const noexcept {
  if (bio) BIO_free(bio);
}

using EvpMdCtxWrapper = OpenSSLWrapper<EVP_MD_CTX, EVP_MD_CTX_free>;
using EvpPkeyCtxWrapper = OpenSSLWrapper<EVP_PKEY_CTX, EVP_PKEY_CTX_free>;

namespace {

KeyType keyTypeOf(const EVP_PKEY* key) noexcept {
  switch (EVP_PKEY_get_base_id(key)) {
    case EVP_PKEY_RSA:
      return KeyType::RSA;
    case EVP_PKEY_EC:
      return KeyType::EC;
    default:
      return KeyType::OTHER;
  }
}

EvpKeyPtr sharedKey(EVP_PKEY* key) {
  if (EVP_PKEY_up_ref(key) != 1) {
    throw CryptoError("Failed to take a reference on the account key");
  }
  return EvpKeyPtr(key);
}

}  // namespace

std::vector<uint8_t> hashSha256(const std::vector<uint8_t>& data) {
  std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
  SHA256(data.data(), data.size(), hash.data());
  return hash;
}

//
// AccountKeyPair
//

AccountKeyPair::AccountKeyPair(EvpKeyPtr key) : key_(std::move(key)) {
  if (!key_) {
    throw CryptoError("Account key is empty");
  }
}

AccountKeyPair AccountKeyPair::fromPem(std::string_view privateKeyPem) {
  if (!detail::fitsOpenSSLLength(privateKeyPem.size())) {
    throw CryptoError("Private key PEM too large");
  }
  auto bio = BioPtr(BIO_new_mem_buf(privateKeyPem.data(),
                                    static_cast<int>(privateKeyPem.size())));
  if (!bio) {
    throw CryptoError("Failed to create BIO for private key");
  }

  EvpKeyPtr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
  if (!key) {
    ACMEFLOW_LOG_ERROR("Failed to parse account key PEM: {}",
                       detail::lastOpenSSLError());
    throw CryptoError("Failed to load private key from PEM");
  }
  return AccountKeyPair(std::move(key));
}

AccountKeyPair AccountKeyPair::generateRsa(int bits) {
  if (!crypto_constants::is_valid_rsa_key_bits(bits)) {
    throw CryptoError("Invalid RSA key size: " + std::to_string(bits));
  }

  ACMEFLOW_LOG_DEBUG("Generating {}-bit RSA account key", bits);
  auto pctx = EvpPkeyCtxWrapper(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
  if (!pctx) throw CryptoError("Failed to create RSA key context");

  if (EVP_PKEY_keygen_init(pctx.get()) <= 0) {
    throw CryptoError("Failed to initialize RSA key generation");
  }

  if (EVP_PKEY_CTX_set_rsa_keygen_bits(pctx.get(), bits) <= 0) {
    throw CryptoError("Failed to set RSA key size");
  }

  EVP_PKEY* pkey = nullptr;
  if (EVP_PKEY_keygen(pctx.get(), &pkey) <= 0) {
    throw CryptoError("Failed to generate RSA key pair");
  }
  return AccountKeyPair(EvpKeyPtr(pkey));
}

AccountKeyPair AccountKeyPair::generateEc() {
  auto pctx = EvpPkeyCtxWrapper(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
  if (!pctx) {
    throw CryptoError("Failed to create EC key context");
  }

  if (EVP_PKEY_keygen_init(pctx.get()) <= 0) {
    throw CryptoError("Failed to initialize EC key generation");
  }

  if (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(pctx.get(),
                                             NID_X9_62_prime256v1) <= 0) {
    throw CryptoError("Failed to set EC curve");
  }

  EVP_PKEY* pkey = nullptr;
  if (EVP_PKEY_keygen(pctx.get(), &pkey) <= 0) {
    throw CryptoError("Failed to generate EC key pair");
  }
  return AccountKeyPair(EvpKeyPtr(pkey));
}

KeyType AccountKeyPair::keyType() const noexcept { return keyTypeOf(key_.get()); }

std::string AccountKeyPair::privateKeyPem() const {
  auto bio = BioPtr(BIO_new(BIO_s_mem()));
  if (!bio) {
    throw CryptoError("Failed to create BIO object");
  }
  if (!PEM_write_bio_PrivateKey(bio.get(), key_.get(), nullptr, nullptr, 0,
                                nullptr, nullptr)) {
    throw CryptoError("Failed to serialize private key");
  }
  return detail::bioToString(bio.get());
}

std::vector<uint8_t> AccountKeyPair::publicKeyDer() const {
  auto bio = BioPtr(BIO_new(BIO_s_mem()));
  if (!bio || !i2d_PUBKEY_bio(bio.get(), key_.get())) {
    throw CryptoError("Failed to serialize public key");
  }
  return detail::bioToBytes(bio.get());
}

//
// RS256 Implementation (RSASSA-PKCS1-v1_5 with SHA-256)
//

struct Rs256Algorithm::Impl {
  EvpKeyPtr privateKey;
  EvpKeyPtr publicKey;
};

Rs256Algorithm::Rs256Algorithm(const AccountKeyPair& keyPair)
    : pImpl_(std::make_unique<Impl>()) {
  if (keyPair.keyType() != KeyType::RSA) {
    throw UnsupportedKeyTypeError(keyTypeName(keyPair.keyType()));
  }
  pImpl_->privateKey = sharedKey(keyPair.native());
  pImpl_->publicKey = sharedKey(keyPair.native());
}

Rs256Algorithm::Rs256Algorithm(const std::vector<uint8_t>& publicKeyDer)
    : pImpl_(std::make_unique<Impl>()) {
  const uint8_t* data = publicKeyDer.data();
  pImpl_->publicKey.reset(
      d2i_PUBKEY(nullptr, &data, static_cast<long>(publicKeyDer.size())));
  if (!pImpl_->publicKey) {
    throw CryptoError("Failed to load public key");
  }
  KeyType type = keyTypeOf(pImpl_->publicKey.get());
  if (type != KeyType::RSA) {
    throw UnsupportedKeyTypeError(keyTypeName(type));
  }
}

Rs256Algorithm::~Rs256Algorithm() = default;

Rs256Algorithm::Rs256Algorithm(Rs256Algorithm&& other) noexcept
    : pImpl_(std::move(other.pImpl_)) {}

Rs256Algorithm& Rs256Algorithm::operator=(Rs256Algorithm&& other) noexcept {
  if (this != &other) {
    pImpl_ = std::move(other.pImpl_);
  }
  return *this;
}

std::vector<uint8_t> Rs256Algorithm::getPublicKey() const {
  if (!pImpl_ || !pImpl_->publicKey) {
    return std::vector<uint8_t>();
  }

  auto bio = BioPtr(BIO_new(BIO_s_mem()));
  if (!bio || !i2d_PUBKEY_bio(bio.get(), pImpl_->publicKey.get())) {
    return std::vector<uint8_t>();
  }
  return detail::bioToBytes(bio.get());
}

std::vector<uint8_t> Rs256Algorithm::signImpl(
    std::span<const uint8_t> data) const {
  if (!pImpl_ || !pImpl_->privateKey) {
    throw CryptoError("No private key available for signing");
  }

  auto mdctx = EvpMdCtxWrapper(EVP_MD_CTX_new());
  if (!mdctx) throw CryptoError("Failed to create signing context");

  EVP_PKEY_CTX* pctx = nullptr;
  if (EVP_DigestSignInit(mdctx.get(), &pctx, EVP_sha256(), nullptr,
                         pImpl_->privateKey.get()) <= 0) {
    throw CryptoError("Failed to initialize signing");
  }

  if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PADDING) <= 0) {
    throw CryptoError("Failed to set PKCS#1 v1.5 padding");
  }

  if (EVP_DigestSignUpdate(mdctx.get(), data.data(), data.size()) <= 0) {
    throw CryptoError("Failed to update signing context");
  }

  size_t sigLen = 0;
  if (EVP_DigestSignFinal(mdctx.get(), nullptr, &sigLen) <= 0) {
    throw CryptoError("Failed to determine signature length");
  }

  std::vector<uint8_t> signature(sigLen);
  if (EVP_DigestSignFinal(mdctx.get(), signature.data(), &sigLen) <= 0) {
    throw CryptoError("Failed to sign data");
  }

  signature.resize(sigLen);
  return signature;
}

bool Rs256Algorithm::verifyImpl(std::span<const uint8_t> data,
                                std::span<const uint8_t> signature) const {
  if (!pImpl_ || !pImpl_->publicKey) {
    return false;
  }

  auto mdctx = EvpMdCtxWrapper(EVP_MD_CTX_new());
  if (!mdctx) return false;

  EVP_PKEY_CTX* pctx = nullptr;
  if (EVP_DigestVerifyInit(mdctx.get(), &pctx, EVP_sha256(), nullptr,
                           pImpl_->publicKey.get()) <= 0) {
    return false;
  }

  if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PADDING) <= 0) {
    return false;
  }

  if (EVP_DigestVerifyUpdate(mdctx.get(), data.data(), data.size()) <= 0) {
    return false;
  }

  int result =
      EVP_DigestVerifyFinal(mdctx.get(), signature.data(), signature.size());
  // A failed verification leaves an error on the queue
  ERR_clear_error();
  return result == 1;
}

}  // namespace acmeflow
