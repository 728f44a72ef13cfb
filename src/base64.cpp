/**
 * @file base64.cpp
 * @brief base64url on top of the OpenSSL block codec
 */

#include "acmeflow/base64.hpp"

#include <openssl/evp.h>

#include <climits>

namespace acmeflow {

namespace {

// EVP_EncodeBlock/EVP_DecodeBlock take int lengths
constexpr size_t MAX_BLOCK_INPUT = (INT_MAX / 4) * 3;

bool isUrlAlphabet(char c) noexcept {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '-' || c == '_';
}

}  // namespace

std::string base64UrlEncodeImpl(std::span<const uint8_t> data) {
  if (data.empty()) {
    return {};
  }
  if (data.size() > MAX_BLOCK_INPUT) {
    throw CryptoError("input too large for base64 encoding");
  }

  std::string result(4 * ((data.size() + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(result.data()),
                                data.data(), static_cast<int>(data.size()));
  result.resize(static_cast<size_t>(written));

  while (!result.empty() && result.back() == '=') {
    result.pop_back();
  }
  for (char& c : result) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  return result;
}

std::string base64UrlEncode(std::string_view text) {
  return base64UrlEncodeImpl(
      {reinterpret_cast<const uint8_t*>(text.data()), text.size()});
}

std::vector<uint8_t> base64UrlDecode(std::string_view encoded) {
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.remove_suffix(1);
  }
  if (encoded.empty()) {
    return {};
  }
  if (encoded.size() % 4 == 1) {
    throw InvalidBase64Error("Truncated base64url string");
  }
  if (encoded.size() > MAX_BLOCK_INPUT) {
    throw InvalidBase64Error("base64url string too long");
  }

  // EVP_DecodeBlock wants the standard alphabet in whole quanta
  std::string standard;
  standard.reserve(encoded.size() + 3);
  for (char c : encoded) {
    if (!isUrlAlphabet(c)) {
      throw InvalidBase64Error("Invalid character in base64url string");
    }
    standard.push_back(c == '-' ? '+' : c == '_' ? '/' : c);
  }
  size_t padding = (4 - standard.size() % 4) % 4;
  standard.append(padding, '=');

  std::vector<uint8_t> result(standard.size() / 4 * 3);
  int decoded = EVP_DecodeBlock(result.data(),
                                reinterpret_cast<const unsigned char*>(standard.data()),
                                static_cast<int>(standard.size()));
  if (decoded < 0) {
    throw InvalidBase64Error("Invalid base64url string");
  }
  // The block decoder counts the bytes implied by '=' padding
  result.resize(static_cast<size_t>(decoded) - padding);
  return result;
}

std::string base64UrlDecodeToString(std::string_view data) {
  auto bytes = base64UrlDecode(data);
  return std::string(bytes.begin(), bytes.end());
}

}  // namespace acmeflow
