/**
 * @file orchestrator.cpp
 * @brief ACME issuance flow
 */

#include "acmeflow/orchestrator.hpp"

#include <chrono>
#include <exception>

#include "acmeflow/certificate.hpp"
#include "acmeflow/error.hpp"
#include "acmeflow/json_serialization.hpp"
#include "acmeflow/jwk.hpp"
#include "acmeflow/logging.hpp"
#include "acmeflow/retry_after.hpp"

namespace acmeflow {

namespace {

constexpr std::string_view LOCATION_HEADER = "Location";
constexpr std::string_view RETRY_AFTER_HEADER = "Retry-After";

void throwIfStopped(const std::stop_token& stop) {
  if (stop.stop_requested()) {
    throw OperationCancelledError();
  }
}

RegistrationRecord decodeRegistration(const HttpResponse& response) {
  RegistrationRecord record;
  json_serialization::from_json(json_serialization::parseBody(response.body),
                                record);
  return record;
}

}  // namespace

AcmeOrchestrator::AcmeOrchestrator(SignedTransport& transport,
                                   const AccountKeyPair& key,
                                   ChallengePublisher& publisher,
                                   const CertificateStore& store,
                                   OrchestratorSettings settings,
                                   std::unique_ptr<Timer> timer)
    : transport_(transport),
      key_(key),
      publisher_(publisher),
      store_(store),
      settings_(std::move(settings)),
      timer_(timer ? std::move(timer) : std::make_unique<SteadyTimer>()) {
  settings_.applyLogging();
}

RegistrationRecord AcmeOrchestrator::registerAccount(
    const std::vector<std::string>& contact,
    const std::optional<std::string>& agreement) {
  enum class RegistrationState { Creating, Fetching };

  const std::optional<std::string> terms =
      agreement ? agreement : settings_.agreement;
  RegistrationState state = RegistrationState::Creating;
  std::string target(resource::NEW_REGISTRATION);

  while (true) {
    switch (state) {
      case RegistrationState::Creating: {
        ACMEFLOW_LOG_DEBUG("Creating account for {} contact(s)", contact.size());
        HttpResponse response = transport_.post(
            target, toPayload(NewRegistrationRequest{contact, terms}));

        if (response.status == http_status::CREATED) {
          RegistrationRecord record = decodeRegistration(response);
          record.location = response.headers.first(LOCATION_HEADER);
          ACMEFLOW_LOG_INFO("Account created");
          return record;
        }

        if (response.status != http_status::CONFLICT) {
          throw UnexpectedStatusError(response.status, target);
        }

        auto location = response.headers.first(LOCATION_HEADER);
        if (!location) {
          throw ProtocolViolationError(
              "409 Conflict response didn't carry any location header");
        }
        ACMEFLOW_LOG_INFO("Account already exists at {}", *location);
        target = *location;
        state = RegistrationState::Fetching;
        break;
      }

      case RegistrationState::Fetching: {
        HttpResponse response = transport_.post(
            target, toPayload(RegistrationUpdateRequest{contact, terms}));
        if (!http_status::isSuccess(response.status)) {
          throw UnexpectedStatusError(response.status, target);
        }
        RegistrationRecord record = decodeRegistration(response);
        record.location = target;
        return record;
      }
    }
  }
}

AuthorizationResponse AcmeOrchestrator::requestAuthorization(
    const std::string& domain) {
  ACMEFLOW_LOG_DEBUG("Requesting authorization for {}", domain);

  NewAuthorizationRequest request;
  request.identifier.value = domain;
  HttpResponse response =
      transport_.post(std::string(resource::NEW_AUTHORIZATION), toPayload(request));

  if (response.status != http_status::OK) {
    throw UnexpectedStatusError(response.status,
                                std::string(resource::NEW_AUTHORIZATION));
  }

  auto location = response.headers.first(LOCATION_HEADER);
  if (!location) {
    throw ProtocolViolationError("authorization response has no Location header");
  }

  AuthorizationResponse result;
  result.location = *location;
  json_serialization::from_json(json_serialization::parseBody(response.body),
                                result.authorization);
  ACMEFLOW_LOG_DEBUG("Authorization {} offers {} challenge(s)", result.location,
                     result.authorization.challenges.size());
  return result;
}

std::optional<Challenge> AcmeOrchestrator::selectChallenge(
    const Authorization& authorization) const {
  const auto& challenges = authorization.challenges;
  // No combinations: no challenge is known to suffice on its own
  if (!authorization.combinations) {
    return std::nullopt;
  }

  for (size_t i = 0; i < challenges.size(); ++i) {
    if (challenges[i].type != settings_.challenge_type) {
      continue;
    }
    for (const auto& combination : *authorization.combinations) {
      if (combination.size() == 1 && combination.front() == i) {
        return challenges[i];
      }
    }
  }
  return std::nullopt;
}

ChallengeProof AcmeOrchestrator::signChallenge(const std::string& token) const {
  if (!isValidToken(token)) {
    throw ProtocolViolationError("invalid challenge token '" + token + "'");
  }
  if (key_.keyType() != KeyType::RSA) {
    throw UnsupportedKeyTypeError(keyTypeName(key_.keyType()));
  }

  Rs256Algorithm algorithm(key_);
  return ChallengeProof::sign(token, algorithm, jwk::createJWKFromKeyPair(key_));
}

Challenge AcmeOrchestrator::submitChallenge(const std::string& location,
                                            const Challenge& challenge,
                                            const ChallengeProof& proof) {
  ChallengeAnswerRequest answer{challenge.type, challenge.token,
                                proof.to_compact()};
  HttpResponse response = transport_.post(location, toPayload(answer));

  if (response.status != http_status::OK) {
    throw UnexpectedStatusError(response.status, location);
  }

  Challenge updated;
  json_serialization::from_json(json_serialization::parseBody(response.body),
                                updated);
  return updated;
}

void AcmeOrchestrator::pollUntilDecided(const std::string& location,
                                        std::stop_token stop) {
  for (size_t attempt = 1;; ++attempt) {
    throwIfStopped(stop);

    HttpResponse response = transport_.get(location);
    if (!http_status::isSuccess(response.status)) {
      throw UnexpectedStatusError(response.status, location);
    }

    std::string status =
        json_serialization::statusOf(json_serialization::parseBody(response.body));
    ACMEFLOW_LOG_DEBUG("Poll {} of {}: {}", attempt, location, status);

    switch (parseStatus(status)) {
      case ResourceStatus::Pending: {
        auto retry_after = response.headers.first(RETRY_AFTER_HEADER);
        if (!retry_after) {
          throw ProtocolViolationError("pending response for " + location +
                                       " has no Retry-After header");
        }
        auto delay = retryDelay(*retry_after, std::chrono::system_clock::now(),
                                settings_.min_retry_delay);
        timer_->waitFor(delay, stop);
        break;
      }
      case ResourceStatus::Valid:
        ACMEFLOW_LOG_INFO("{} is valid after {} poll(s)", location, attempt);
        return;
      case ResourceStatus::Invalid:
        ACMEFLOW_LOG_WARN("{} was marked invalid", location);
        throw ChallengeInvalidatedError(location);
      case ResourceStatus::Unknown:
        throw ProtocolViolationError("invalid challenge status '" + status + "'");
    }
  }
}

bool AcmeOrchestrator::hasValidCertificate(const std::string& domain) const {
  try {
    auto path = store_.pathFor(domain);
    if (!store_.exists(path)) {
      ACMEFLOW_LOG_DEBUG("No certificate for {} at {}", domain, path.string());
      return false;
    }

    auto contents = store_.read(path);
    if (!contents || contents->empty()) {
      return false;
    }

    auto inspected = inspectCertificate(*contents);
    if (inspected.isError()) {
      ACMEFLOW_LOG_DEBUG("{}: {}", path.string(), inspected.error().what());
      return false;
    }

    const CertificateInfo& info = inspected.value();
    if (!info.has_private_key) {
      ACMEFLOW_LOG_DEBUG("{} has no private key", path.string());
      return false;
    }
    if (!info.covers(domain)) {
      ACMEFLOW_LOG_DEBUG("{} does not cover {}", path.string(), domain);
      return false;
    }
    if (info.isExpired(std::chrono::system_clock::now())) {
      ACMEFLOW_LOG_DEBUG("{} has expired", path.string());
      return false;
    }
    return true;
  } catch (const AcmeError& e) {
    ACMEFLOW_LOG_DEBUG("Certificate check for {} failed: {}", domain, e.what());
    return false;
  }
}

void AcmeOrchestrator::issueCertificate(
    const std::string& domain, const std::vector<std::string>& contact,
    const std::optional<std::string>& agreement, std::stop_token stop) {
  ACMEFLOW_LOG_INFO("Registering account for {}", domain);
  throwIfStopped(stop);
  registerAccount(contact, agreement);

  ACMEFLOW_LOG_INFO("Requesting challenges for {}", domain);
  throwIfStopped(stop);
  AuthorizationResponse authz = requestAuthorization(domain);

  auto challenge = selectChallenge(authz.authorization);
  if (!challenge) {
    throw NoSuitableChallengeError(domain);
  }

  ACMEFLOW_LOG_INFO("Providing {} challenge for {}", challenge->type, domain);
  ChallengeProof proof = signChallenge(challenge->token);
  throwIfStopped(stop);
  publisher_.provide(domain, challenge->token, proof.to_compact());

  ACMEFLOW_LOG_INFO("Answering challenge for {}", domain);
  throwIfStopped(stop);
  submitChallenge(authz.location, *challenge, proof);

  ACMEFLOW_LOG_INFO("Waiting for {} to be validated", domain);
  pollUntilDecided(authz.location, stop);
  ACMEFLOW_LOG_INFO("Authorization for {} is valid", domain);
}

IssuanceTask AcmeOrchestrator::issueCertificateAsync(
    std::string domain, std::vector<std::string> contact,
    std::optional<std::string> agreement) {
  std::promise<void> promise;
  std::future<void> result = promise.get_future();

  std::jthread worker(
      [this, domain, contact = std::move(contact),
       agreement = std::move(agreement),
       promise = std::move(promise)](std::stop_token stop) mutable {
        try {
          issueCertificate(domain, contact, agreement, stop);
          promise.set_value();
        } catch (...) {
          // Rethrown to the caller by IssuanceTask::get()
          promise.set_exception(std::current_exception());
        }
      });

  return IssuanceTask(std::move(domain), std::move(result), std::move(worker));
}

std::string AcmeOrchestrator::accountThumbprint() const {
  return jwk::calculateJWKThumbprint(jwk::createJWKFromKeyPair(key_));
}

}  // namespace acmeflow
