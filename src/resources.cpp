#include "acmeflow/resources.hpp"

#include <type_traits>

#include "acmeflow/json_serialization.hpp"

namespace acmeflow {

namespace {

template <typename T>
constexpr std::string_view tagFor() noexcept {
  if constexpr (std::is_same_v<T, NewRegistrationRequest>) {
    return resource::NEW_REGISTRATION;
  } else if constexpr (std::is_same_v<T, RegistrationUpdateRequest>) {
    return resource::REGISTRATION;
  } else if constexpr (std::is_same_v<T, NewAuthorizationRequest>) {
    return resource::NEW_AUTHORIZATION;
  } else {
    static_assert(std::is_same_v<T, ChallengeAnswerRequest>,
                  "unhandled request type");
    return resource::AUTHORIZATION;
  }
}

}  // namespace

std::string_view resourceTag(const AcmeRequest& request) noexcept {
  return std::visit(
      [](const auto& r) { return tagFor<std::decay_t<decltype(r)>>(); },
      request);
}

nlohmann::json toPayload(const AcmeRequest& request) {
  return std::visit(
      [](const auto& r) {
        nlohmann::json payload;
        json_serialization::to_json(payload, r);
        payload["resource"] = std::string(tagFor<std::decay_t<decltype(r)>>());
        return payload;
      },
      request);
}

}  // namespace acmeflow
