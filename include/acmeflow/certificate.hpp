/**
 * @file certificate.hpp
 * @brief Inspection of stored X.509 certificates
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

namespace acmeflow {

/**
 * @brief What a stored certificate file tells us about its validity
 */
struct CertificateInfo {
  std::optional<std::string> common_name;  ///< Lower-cased subject CN
  std::vector<std::string> subject_alt_names;  ///< Lower-cased DNS SANs
  std::chrono::system_clock::time_point not_after;
  bool has_private_key = false;

  /**
   * @brief CN followed by the SAN DNS names
   */
  [[nodiscard]] std::vector<std::string> names() const;

  /**
   * @brief Case-insensitive match of the domain against names()
   */
  [[nodiscard]] bool covers(std::string_view domain) const;

  [[nodiscard]] bool isExpired(
      std::chrono::system_clock::time_point now) const noexcept {
    return not_after <= now;
  }
};

/**
 * @brief Parse the first certificate of a PEM file
 *
 * The private key, if any, is only detected, never parsed.
 *
 * @return CertificateInfo, or InvalidCertificateError when no X.509
 *         certificate can be read
 */
AcmeResult<CertificateInfo> inspectCertificate(std::string_view pem);

/**
 * @brief Whether the text holds a "-----BEGIN ... PRIVATE KEY-----" block
 */
bool containsPrivateKey(std::string_view pem);

/**
 * @brief Extract DNS names from a printed subjectAltName extension
 *
 * Input is the comma separated form OpenSSL prints, e.g.
 * "DNS:example.com, IP Address:10.0.0.1, DNS:www.example.com".
 * Entries are trimmed, non-DNS entries dropped and names lower-cased.
 */
std::vector<std::string> parseSubjectAltNames(std::string_view text);

}  // namespace acmeflow
