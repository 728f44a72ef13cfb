/**
 * @file publisher.hpp
 * @brief Makes challenge proofs reachable by the CA
 */

#pragma once

#include <string>

namespace acmeflow {

/**
 * @brief Publishes a proof where the CA expects to find it
 *
 * For http-01 that is /.well-known/acme-challenge/<token> on the domain.
 * provide() must return only once the proof is reachable; failures are
 * reported by throwing.
 */
class ChallengePublisher {
 public:
  virtual ~ChallengePublisher() = default;

  virtual void provide(const std::string& domain, const std::string& token,
                       const std::string& proof) = 0;
};

}  // namespace acmeflow
