#include "acmeflow/certificate.hpp"

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <regex>

#include "acmeflow/crypto.hpp"
#include "acmeflow/logging.hpp"
#include "openssl_wrapper.hpp"

namespace acmeflow {

namespace {

using X509Wrapper = detail::OpenSSLWrapper<X509, X509_free>;

std::string toLower(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

std::string_view trim(std::string_view value) noexcept {
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  return value;
}

std::optional<std::string> commonNameOf(X509* cert) {
  X509_NAME* subject = X509_get_subject_name(cert);
  if (!subject) {
    return std::nullopt;
  }
  int index = X509_NAME_get_index_by_NID(subject, NID_commonName, -1);
  if (index < 0) {
    return std::nullopt;
  }
  X509_NAME_ENTRY* entry = X509_NAME_get_entry(subject, index);
  ASN1_STRING* data = X509_NAME_ENTRY_get_data(entry);
  if (!data) {
    return std::nullopt;
  }

  unsigned char* utf8 = nullptr;
  int length = ASN1_STRING_to_UTF8(&utf8, data);
  if (length < 0) {
    return std::nullopt;
  }
  std::string cn(reinterpret_cast<char*>(utf8), static_cast<size_t>(length));
  OPENSSL_free(utf8);
  return toLower(cn);
}

std::vector<std::string> subjectAltNamesOf(X509* cert) {
  int index = X509_get_ext_by_NID(cert, NID_subject_alt_name, -1);
  if (index < 0) {
    return {};
  }
  X509_EXTENSION* extension = X509_get_ext(cert, index);

  auto bio = BioPtr(BIO_new(BIO_s_mem()));
  if (!bio || X509V3_EXT_print(bio.get(), extension, 0, 0) != 1) {
    ACMEFLOW_LOG_DEBUG("Cannot print subjectAltName: {}",
                       detail::lastOpenSSLError());
    return {};
  }
  return parseSubjectAltNames(detail::bioToString(bio.get()));
}

std::optional<std::chrono::system_clock::time_point> notAfterOf(X509* cert) {
  const ASN1_TIME* not_after = X509_get0_notAfter(cert);
  if (!not_after) {
    return std::nullopt;
  }
  std::tm tm{};
  if (ASN1_TIME_to_tm(not_after, &tm) != 1) {
    return std::nullopt;
  }
#ifdef _WIN32
  std::time_t t = _mkgmtime(&tm);
#else
  std::time_t t = timegm(&tm);
#endif
  if (t == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(t);
}

}  // namespace

std::vector<std::string> CertificateInfo::names() const {
  std::vector<std::string> all;
  if (common_name) {
    all.push_back(*common_name);
  }
  all.insert(all.end(), subject_alt_names.begin(), subject_alt_names.end());
  return all;
}

bool CertificateInfo::covers(std::string_view domain) const {
  std::string wanted = toLower(domain);
  auto all = names();
  return std::find(all.begin(), all.end(), wanted) != all.end();
}

bool containsPrivateKey(std::string_view pem) {
  static const std::regex PRIVATE_KEY_BLOCK(
      "-----BEGIN ([A-Z]+ )?PRIVATE KEY-----");
  return std::regex_search(pem.begin(), pem.end(), PRIVATE_KEY_BLOCK);
}

std::vector<std::string> parseSubjectAltNames(std::string_view text) {
  constexpr std::string_view DNS_PREFIX = "dns:";

  std::vector<std::string> names;
  size_t start = 0;
  while (start <= text.size()) {
    size_t comma = text.find(',', start);
    std::string_view entry = trim(text.substr(
        start, comma == std::string_view::npos ? std::string_view::npos
                                               : comma - start));
    if (entry.size() > DNS_PREFIX.size() &&
        toLower(entry.substr(0, DNS_PREFIX.size())) == DNS_PREFIX) {
      names.push_back(toLower(trim(entry.substr(DNS_PREFIX.size()))));
    }
    if (comma == std::string_view::npos) {
      break;
    }
    start = comma + 1;
  }
  return names;
}

AcmeResult<CertificateInfo> inspectCertificate(std::string_view pem) {
  if (!detail::fitsOpenSSLLength(pem.size())) {
    return InvalidCertificateError("certificate file too large");
  }
  auto bio = BioPtr(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
  if (!bio) {
    return InvalidCertificateError("failed to create BIO");
  }

  X509Wrapper cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
  if (!cert) {
    return InvalidCertificateError("no X.509 certificate in PEM: " +
                                   detail::lastOpenSSLError());
  }

  auto not_after = notAfterOf(cert.get());
  if (!not_after) {
    return InvalidCertificateError("unreadable notAfter");
  }

  CertificateInfo info;
  info.common_name = commonNameOf(cert.get());
  info.subject_alt_names = subjectAltNamesOf(cert.get());
  info.not_after = *not_after;
  info.has_private_key = containsPrivateKey(pem);
  return info;
}

}  // namespace acmeflow
