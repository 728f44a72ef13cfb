/**
 * @file orchestrator.hpp
 * @brief Drives the ACME issuance protocol for one account key
 *
 * The orchestrator sequences registration, authorization, challenge
 * selection, proof signing, publication, submission and status polling.
 * Transport, publication and storage are borrowed collaborators.
 */

#pragma once

#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "certificate_store.hpp"
#include "crypto.hpp"
#include "jws.hpp"
#include "publisher.hpp"
#include "resources.hpp"
#include "settings.hpp"
#include "timer.hpp"
#include "transport.hpp"

namespace acmeflow {

/**
 * @brief Handle on an issuance flow running on its own thread
 *
 * Destroying the task requests a stop and joins the worker.
 */
class IssuanceTask {
 public:
  IssuanceTask(IssuanceTask&&) noexcept = default;
  IssuanceTask& operator=(IssuanceTask&&) noexcept = default;
  IssuanceTask(const IssuanceTask&) = delete;
  IssuanceTask& operator=(const IssuanceTask&) = delete;
  ~IssuanceTask() = default;

  /**
   * @brief Request a stop; a pending poll delay ends at once
   */
  void cancel() noexcept { worker_.request_stop(); }

  /**
   * @brief Block until the flow has finished
   */
  void wait() const { result_.wait(); }

  /**
   * @brief Wait for the flow and rethrow its failure, if any
   *
   * May be called once.
   */
  void get() { result_.get(); }

  [[nodiscard]] const std::string& domain() const noexcept { return domain_; }

 private:
  friend class AcmeOrchestrator;

  IssuanceTask(std::string domain, std::future<void> result,
               std::jthread worker)
      : domain_(std::move(domain)),
        result_(std::move(result)),
        worker_(std::move(worker)) {}

  std::string domain_;
  std::future<void> result_;
  std::jthread worker_;  // last: joined before result_ goes away
};

class AcmeOrchestrator {
 public:
  /**
   * @param transport Signed transport to the CA
   * @param key Account key, borrowed for the orchestrator's lifetime
   * @param publisher Makes proofs reachable by the CA
   * @param store Where issued certificates are looked up
   * @param settings Challenge type, retry floor, default agreement
   * @param timer Delay source between polls; nullptr selects SteadyTimer
   */
  AcmeOrchestrator(SignedTransport& transport, const AccountKeyPair& key,
                   ChallengePublisher& publisher, const CertificateStore& store,
                   OrchestratorSettings settings = {},
                   std::unique_ptr<Timer> timer = nullptr);

  AcmeOrchestrator(const AcmeOrchestrator&) = delete;
  AcmeOrchestrator& operator=(const AcmeOrchestrator&) = delete;

  /**
   * @brief Create the account, or fetch it when it already exists
   *
   * A 409 Conflict is followed by a registration request to the URL in its
   * Location header, whose answer is returned.
   *
   * @throws ProtocolViolationError on 409 without Location
   * @throws UnexpectedStatusError on any other status
   */
  RegistrationRecord registerAccount(
      const std::vector<std::string>& contact,
      const std::optional<std::string>& agreement = std::nullopt);

  /**
   * @brief Ask the CA for an authorization of a DNS name
   * @throws ProtocolViolationError if the 200 response has no Location
   * @throws UnexpectedStatusError on any status but 200
   */
  AuthorizationResponse requestAuthorization(const std::string& domain);

  /**
   * @brief First challenge of the configured type that the CA accepts alone
   *
   * Only challenges listed as a single-index combination qualify; without a
   * combinations list nothing does.
   */
  [[nodiscard]] std::optional<Challenge> selectChallenge(
      const Authorization& authorization) const;

  /**
   * @brief Sign a challenge token with the account key
   * @throws ProtocolViolationError if the token has characters outside
   *         [A-Za-z0-9_-]
   * @throws UnsupportedKeyTypeError if the account key is not RSA
   */
  [[nodiscard]] ChallengeProof signChallenge(const std::string& token) const;

  /**
   * @brief Tell the CA the challenge is ready to be checked
   * @param location Authorization location from requestAuthorization
   * @return The challenge as echoed back by the CA
   * @throws UnexpectedStatusError on any status but 200
   */
  Challenge submitChallenge(const std::string& location,
                            const Challenge& challenge,
                            const ChallengeProof& proof);

  /**
   * @brief Poll a resource until it is valid
   * @throws ChallengeInvalidatedError if the CA reports "invalid"
   * @throws ProtocolViolationError on an unknown status or a pending
   *         response without a usable Retry-After
   * @throws OperationCancelledError if stop is requested
   */
  void pollUntilDecided(const std::string& location,
                        std::stop_token stop = {});

  /**
   * @brief Whether the store holds a usable certificate for the domain
   *
   * Never throws for missing, unreadable or invalid files.
   */
  [[nodiscard]] bool hasValidCertificate(const std::string& domain) const;

  /**
   * @brief Run the whole flow up to a validated authorization
   */
  void issueCertificate(const std::string& domain,
                        const std::vector<std::string>& contact,
                        const std::optional<std::string>& agreement = std::nullopt,
                        std::stop_token stop = {});

  /**
   * @brief Run issueCertificate() on a dedicated thread
   *
   * The task must not outlive this orchestrator.
   */
  [[nodiscard]] IssuanceTask issueCertificateAsync(
      std::string domain, std::vector<std::string> contact,
      std::optional<std::string> agreement = std::nullopt);

  /**
   * @brief RFC 7638 thumbprint of the account key
   */
  [[nodiscard]] std::string accountThumbprint() const;

  [[nodiscard]] const OrchestratorSettings& settings() const noexcept {
    return settings_;
  }

 private:
  SignedTransport& transport_;
  const AccountKeyPair& key_;
  ChallengePublisher& publisher_;
  const CertificateStore& store_;
  const OrchestratorSettings settings_;
  std::unique_ptr<Timer> timer_;
};

}  // namespace acmeflow
