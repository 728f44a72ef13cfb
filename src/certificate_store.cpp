#include "acmeflow/certificate_store.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>

#include "acmeflow/error.hpp"
#include "acmeflow/logging.hpp"

namespace acmeflow {

bool CertificateStore::exists(const std::filesystem::path& path) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) && !ec;
}

std::optional<std::string> CertificateStore::read(
    const std::filesystem::path& path) const {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    ACMEFLOW_LOG_DEBUG("Cannot open certificate file {}", path.string());
    return std::nullopt;
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    ACMEFLOW_LOG_WARN("Failed reading certificate file {}", path.string());
    return std::nullopt;
  }
  return contents.str();
}

DirectoryCertificateStore::DirectoryCertificateStore(
    std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path DirectoryCertificateStore::pathFor(
    std::string_view domain) const {
  if (domain.empty() || domain.find('/') != std::string_view::npos ||
      domain.find('\\') != std::string_view::npos ||
      domain.find("..") != std::string_view::npos) {
    throw IoError("no certificate path for domain '" + std::string(domain) +
                  "'");
  }

  std::string name(domain);
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return directory_ / (name + ".pem");
}

}  // namespace acmeflow
