#pragma once

#include <chrono>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "acmeflow/certificate_store.hpp"
#include "acmeflow/crypto.hpp"
#include "acmeflow/error.hpp"
#include "acmeflow/publisher.hpp"
#include "acmeflow/timer.hpp"
#include "acmeflow/transport.hpp"

namespace acmeflow {
namespace test {

/**
 * @brief One RSA key for the whole test run; generation is slow
 */
inline const AccountKeyPair& rsaAccountKey() {
    static const AccountKeyPair key = AccountKeyPair::generateRsa();
    return key;
}

inline HttpResponse response(int status, const nlohmann::json& body = nlohmann::json::object(),
                             HeaderMap headers = {}) {
    HttpResponse r;
    r.status = status;
    r.headers = std::move(headers);
    r.body = body.dump();
    return r;
}

/**
 * @brief Transport answering from a script and recording every request
 */
class ScriptedTransport : public SignedTransport {
public:
    struct Request {
        std::string method;
        std::string target;
        nlohmann::json payload;
    };

    void enqueue(HttpResponse r) {
        std::lock_guard lock(mutex_);
        responses_.push_back(std::move(r));
    }

    HttpResponse post(const std::string& resourceOrUrl,
                      const nlohmann::json& payload) override {
        return next("POST", resourceOrUrl, payload);
    }

    HttpResponse get(const std::string& url) override {
        return next("GET", url, nullptr);
    }

    std::vector<Request> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    size_t remaining() const {
        std::lock_guard lock(mutex_);
        return responses_.size();
    }

private:
    HttpResponse next(const char* method, const std::string& target,
                      const nlohmann::json& payload) {
        std::lock_guard lock(mutex_);
        requests_.push_back({method, target, payload});
        if (responses_.empty()) {
            throw std::logic_error(std::string("unscripted ") + method + " " + target);
        }
        HttpResponse r = std::move(responses_.front());
        responses_.pop_front();
        return r;
    }

    mutable std::mutex mutex_;
    std::deque<HttpResponse> responses_;
    std::vector<Request> requests_;
};

class RecordingPublisher : public ChallengePublisher {
public:
    struct Published {
        std::string domain;
        std::string token;
        std::string proof;
    };

    void provide(const std::string& domain, const std::string& token,
                 const std::string& proof) override {
        std::lock_guard lock(mutex_);
        published_.push_back({domain, token, proof});
    }

    std::vector<Published> published() const {
        std::lock_guard lock(mutex_);
        return published_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Published> published_;
};

/**
 * @brief Timer that records delays instead of sleeping
 *
 * The recorded vector outlives the timer, which the orchestrator owns.
 */
class RecordingTimer : public Timer {
public:
    explicit RecordingTimer(std::vector<std::chrono::milliseconds>& waits)
        : waits_(waits) {}

    void waitFor(std::chrono::milliseconds delay, std::stop_token stop) override {
        if (stop.stop_requested()) {
            throw OperationCancelledError();
        }
        waits_.push_back(delay);
    }

private:
    std::vector<std::chrono::milliseconds>& waits_;
};

/**
 * @brief In-memory store keyed by "<domain>.pem"
 */
class MemoryCertificateStore : public CertificateStore {
public:
    void put(const std::string& domain, std::string contents) {
        files_[domain + ".pem"] = std::move(contents);
    }

    std::filesystem::path pathFor(std::string_view domain) const override {
        return std::string(domain) + ".pem";
    }

    bool exists(const std::filesystem::path& path) const override {
        return files_.count(path.string()) != 0;
    }

    std::optional<std::string> read(const std::filesystem::path& path) const override {
        auto it = files_.find(path.string());
        if (it == files_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::map<std::string, std::string> files_;
};

/**
 * @brief Options for a self-signed test certificate
 */
struct CertificateParams {
    std::optional<std::string> common_name;
    std::vector<std::string> dns_names;
    long valid_from_seconds = -3600;
    long valid_for_seconds = 86400;
    bool include_private_key = true;
};

/**
 * @brief Self-signed certificate PEM, with the key appended on request
 */
std::string makeCertificatePem(const CertificateParams& params);

/**
 * @brief Uninitialized buffer of more than INT_MAX bytes, or null when the
 * allocation is refused; its pages are never touched
 */
std::unique_ptr<char[]> oversizedBuffer(size_t& size);

}  // namespace test
}  // namespace acmeflow
