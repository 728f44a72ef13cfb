/**
 * @file jwk.cpp
 * @brief Implementation of JSON Web Key (JWK) utilities
 */

#include "acmeflow/jwk.hpp"

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>
#include <openssl/x509.h>

#include <nlohmann/json.hpp>

#include "acmeflow/base64.hpp"
#include "acmeflow/crypto.hpp"
#include "acmeflow/error.hpp"
#include "openssl_wrapper.hpp"

using json = nlohmann::json;

namespace acmeflow {
namespace jwk {

namespace {

using BignumWrapper = detail::OpenSSLWrapper<BIGNUM, BN_free>;
using ParamBldWrapper = detail::OpenSSLWrapper<OSSL_PARAM_BLD, OSSL_PARAM_BLD_free>;
using ParamWrapper = detail::OpenSSLWrapper<OSSL_PARAM, OSSL_PARAM_free>;
using EvpPkeyCtxWrapper = detail::OpenSSLWrapper<EVP_PKEY_CTX, EVP_PKEY_CTX_free>;

std::vector<uint8_t> bignumBytes(const BIGNUM* bn) {
  std::vector<uint8_t> bytes(static_cast<size_t>(BN_num_bytes(bn)));
  BN_bn2bin(bn, bytes.data());
  return bytes;
}

json parseJwk(const std::string& jwk_json) {
  json parsed = json::parse(jwk_json, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    throw CryptoError("JWK is not a JSON object");
  }
  return parsed;
}

std::string requireMember(const json& jwk, const char* name) {
  auto it = jwk.find(name);
  if (it == jwk.end() || !it->is_string()) {
    throw CryptoError(std::string("JWK is missing member ") + name);
  }
  return it->get<std::string>();
}

}  // namespace

std::string createRS256JWK(const std::vector<uint8_t>& public_key_der) {
  const uint8_t* data = public_key_der.data();
  EvpKeyPtr pkey(
      d2i_PUBKEY(nullptr, &data, static_cast<long>(public_key_der.size())));
  if (!pkey) {
    throw CryptoError("Failed to parse public key DER");
  }

  // Extract RSA parameters using OpenSSL 3.0 API
  BIGNUM* n = nullptr;
  BIGNUM* e = nullptr;
  if (!EVP_PKEY_get_bn_param(pkey.get(), OSSL_PKEY_PARAM_RSA_N, &n) ||
      !EVP_PKEY_get_bn_param(pkey.get(), OSSL_PKEY_PARAM_RSA_E, &e)) {
    BN_free(n);
    BN_free(e);
    throw CryptoError("Failed to extract RSA parameters");
  }
  BignumWrapper modulus(n);
  BignumWrapper exponent(e);

  json jwk = {{"kty", "RSA"},
              {"n", base64UrlEncode(bignumBytes(modulus.get()))},
              {"e", base64UrlEncode(bignumBytes(exponent.get()))}};

  return jwk.dump();
}

std::string createJWKFromKeyPair(const AccountKeyPair& key_pair) {
  if (key_pair.keyType() != KeyType::RSA) {
    throw UnsupportedKeyTypeError(keyTypeName(key_pair.keyType()));
  }
  return createRS256JWK(key_pair.publicKeyDer());
}

std::string calculateJWKThumbprint(const std::string& jwk_json) {
  json jwk = parseJwk(jwk_json);

  std::string kty = requireMember(jwk, "kty");
  if (kty != "RSA") {
    throw UnsupportedKeyTypeError(kty);
  }

  // Required members only, lexicographic order per RFC 7638
  json canonical = {{"e", requireMember(jwk, "e")},
                    {"kty", kty},
                    {"n", requireMember(jwk, "n")}};

  std::string canonical_str = canonical.dump();
  std::vector<uint8_t> canonical_bytes(canonical_str.begin(),
                                       canonical_str.end());

  return base64UrlEncode(hashSha256(canonical_bytes));
}

std::vector<uint8_t> publicKeyDerFromJWK(const std::string& jwk_json) {
  json jwk = parseJwk(jwk_json);
  if (requireMember(jwk, "kty") != "RSA") {
    throw CryptoError("JWK is not an RSA key");
  }

  auto n_bytes = base64UrlDecode(requireMember(jwk, "n"));
  auto e_bytes = base64UrlDecode(requireMember(jwk, "e"));
  if (n_bytes.empty() || e_bytes.empty()) {
    throw CryptoError("JWK carries empty RSA parameters");
  }
  if (!detail::fitsOpenSSLLength(n_bytes.size()) ||
      !detail::fitsOpenSSLLength(e_bytes.size())) {
    throw CryptoError("JWK RSA parameters too large");
  }

  BignumWrapper n_bn(BN_bin2bn(n_bytes.data(), static_cast<int>(n_bytes.size()), nullptr));
  BignumWrapper e_bn(BN_bin2bn(e_bytes.data(), static_cast<int>(e_bytes.size()), nullptr));
  if (!n_bn || !e_bn) {
    throw CryptoError("Failed to create BIGNUM from RSA parameters");
  }

  ParamBldWrapper param_bld(OSSL_PARAM_BLD_new());
  if (!param_bld ||
      !OSSL_PARAM_BLD_push_BN(param_bld.get(), OSSL_PKEY_PARAM_RSA_N, n_bn.get()) ||
      !OSSL_PARAM_BLD_push_BN(param_bld.get(), OSSL_PKEY_PARAM_RSA_E, e_bn.get())) {
    throw CryptoError("Failed to build RSA parameters");
  }

  ParamWrapper params(OSSL_PARAM_BLD_to_param(param_bld.get()));
  EvpPkeyCtxWrapper ctx(EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr));
  EVP_PKEY* raw_key = nullptr;
  if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) <= 0 ||
      EVP_PKEY_fromdata(ctx.get(), &raw_key, EVP_PKEY_PUBLIC_KEY,
                        params.get()) <= 0) {
    throw CryptoError("Failed to create RSA public key from JWK");
  }
  EvpKeyPtr pkey(raw_key);

  int der_len = i2d_PUBKEY(pkey.get(), nullptr);
  if (der_len <= 0) {
    throw CryptoError("Failed to get DER length for RSA public key");
  }

  std::vector<uint8_t> der_bytes(static_cast<size_t>(der_len));
  uint8_t* der_ptr = der_bytes.data();
  if (i2d_PUBKEY(pkey.get(), &der_ptr) != der_len) {
    throw CryptoError("Failed to encode RSA public key to DER");
  }
  return der_bytes;
}

}  // namespace jwk
}  // namespace acmeflow
