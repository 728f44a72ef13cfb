/**
 * @file transport.hpp
 * @brief Signed HTTP transport seam used by the orchestrator
 *
 * The transport owns nonce handling, JWS request signing and directory
 * resolution. The orchestrator only sees resource tags, URLs, status codes,
 * headers and bodies.
 */

#pragma once

#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace acmeflow {

namespace http_status {
constexpr int OK = 200;
constexpr int CREATED = 201;
constexpr int CONFLICT = 409;

constexpr bool isSuccess(int status) noexcept {
  return status >= 200 && status < 300;
}
}  // namespace http_status

/**
 * @brief Case-insensitive, multi-valued HTTP header map
 */
class HeaderMap {
 public:
  HeaderMap() = default;
  HeaderMap(std::initializer_list<std::pair<const std::string, std::string>> init);

  void add(std::string name, std::string value);

  [[nodiscard]] bool has(std::string_view name) const;

  /**
   * @brief All values of a header, in insertion order
   */
  [[nodiscard]] std::vector<std::string> get(std::string_view name) const;

  /**
   * @brief First value of a header
   */
  [[nodiscard]] std::optional<std::string> first(std::string_view name) const;

  [[nodiscard]] size_t size() const noexcept { return headers_.size(); }
  [[nodiscard]] bool empty() const noexcept { return headers_.empty(); }

 private:
  struct CaseInsensitiveLess {
    using is_transparent = void;
    bool operator()(std::string_view lhs, std::string_view rhs) const noexcept;
  };

  std::multimap<std::string, std::string, CaseInsensitiveLess> headers_;
};

struct HttpResponse {
  int status = 0;
  HeaderMap headers;
  std::string body;
};

/**
 * @brief Sends authenticated requests to the CA
 *
 * Implementations sign each payload with the account key. Calls for
 * independent flows may arrive from several threads.
 */
class SignedTransport {
 public:
  virtual ~SignedTransport() = default;

  /**
   * @brief Send a signed request
   * @param resourceOrUrl Directory resource tag (e.g. "new-reg") or an
   *        absolute resource URL
   * @param payload JSON payload, including the "resource" member
   */
  virtual HttpResponse post(const std::string& resourceOrUrl,
                            const nlohmann::json& payload) = 0;

  /**
   * @brief Fetch a resource
   */
  virtual HttpResponse get(const std::string& url) = 0;
};

}  // namespace acmeflow
