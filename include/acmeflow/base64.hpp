/**
 * @file base64.hpp
 * @brief URL-safe, unpadded base64 as used by JOSE objects
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

namespace acmeflow {

/**
 * @brief Implementation for base64url encoding from span
 * @param data Input byte span
 * @return Base64url string without padding
 */
std::string base64UrlEncodeImpl(std::span<const uint8_t> data);

/**
 * @brief Concept for byte containers suitable for base64 encoding
 */
template <typename T>
concept Base64Data = requires(T t) {
  std::data(t);
  std::size(t);
  typename T::value_type;
  requires std::same_as<typename T::value_type, uint8_t>;
};

/**
 * @brief Encode bytes as base64url
 */
template <Base64Data T>
std::string base64UrlEncode(const T& data) {
  return base64UrlEncodeImpl({std::data(data), std::size(data)});
}

/**
 * @brief Encode text (e.g. a serialized JSON object) as base64url
 */
std::string base64UrlEncode(std::string_view text);

/**
 * @brief Decode base64url string
 * @param data Base64url string, trailing '=' padding tolerated
 * @return Decoded bytes
 * @throws InvalidBase64Error if invalid characters found
 */
std::vector<uint8_t> base64UrlDecode(std::string_view data);

/**
 * @brief Decode base64url string into text
 * @throws InvalidBase64Error if invalid characters found
 */
std::string base64UrlDecodeToString(std::string_view data);

}  // namespace acmeflow
