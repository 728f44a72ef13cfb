/**
 * @file certificate_store.hpp
 * @brief Read-only access to previously issued certificates
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace acmeflow {

/**
 * @brief Locates and reads stored certificate files
 *
 * A stored file holds the certificate PEM and, in the same file, the
 * matching private key PEM.
 */
class CertificateStore {
 public:
  virtual ~CertificateStore() = default;

  /**
   * @brief Path of the certificate file for a domain
   * @throws IoError if no path can be derived for the domain
   */
  virtual std::filesystem::path pathFor(std::string_view domain) const = 0;

  /**
   * @brief Check whether a regular file exists; never throws
   */
  virtual bool exists(const std::filesystem::path& path) const;

  /**
   * @brief Read the whole file
   * @return Contents, or std::nullopt if the file cannot be read
   */
  virtual std::optional<std::string> read(
      const std::filesystem::path& path) const;
};

/**
 * @brief Store mapping a domain to "<directory>/<domain>.pem"
 */
class DirectoryCertificateStore : public CertificateStore {
 public:
  explicit DirectoryCertificateStore(std::filesystem::path directory);

  /**
   * @throws IoError for an empty domain or one containing path separators
   *         or ".."
   */
  std::filesystem::path pathFor(std::string_view domain) const override;

  [[nodiscard]] const std::filesystem::path& directory() const noexcept {
    return directory_;
  }

 private:
  std::filesystem::path directory_;
};

}  // namespace acmeflow
