/**
 * @file error.hpp
 * @brief Error classes and exception hierarchy for the ACME orchestration core
 */

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace acmeflow {

/**
 * @brief Error codes for programmatic error handling
 */
enum class AcmeErrorCode : uint32_t {
  SUCCESS = 0,
  PROTOCOL_VIOLATION = 1000,
  MALFORMED_RESPONSE = 1001,
  UNEXPECTED_STATUS = 1002,
  INVALID_BASE64 = 1003,
  NO_SUITABLE_CHALLENGE = 2000,
  CHALLENGE_INVALIDATED = 2001,
  UNSUPPORTED_KEY_TYPE = 3000,
  CRYPTO_OPERATION_FAILED = 3001,
  INVALID_CERTIFICATE = 3002,
  OPERATION_CANCELLED = 4000,
  INVALID_CONFIG = 5000,
  IO_ERROR = 6000
};

/**
 * @brief Convert error code to string description
 */
constexpr std::string_view errorCodeToString(AcmeErrorCode code) noexcept {
  switch (code) {
    case AcmeErrorCode::SUCCESS:
      return "Success";
    case AcmeErrorCode::PROTOCOL_VIOLATION:
      return "Protocol violation";
    case AcmeErrorCode::MALFORMED_RESPONSE:
      return "Malformed response";
    case AcmeErrorCode::UNEXPECTED_STATUS:
      return "Unexpected status code";
    case AcmeErrorCode::INVALID_BASE64:
      return "Invalid base64 encoding";
    case AcmeErrorCode::NO_SUITABLE_CHALLENGE:
      return "No suitable challenge";
    case AcmeErrorCode::CHALLENGE_INVALIDATED:
      return "Challenge marked as invalid";
    case AcmeErrorCode::UNSUPPORTED_KEY_TYPE:
      return "Unsupported key type";
    case AcmeErrorCode::CRYPTO_OPERATION_FAILED:
      return "Cryptographic operation failed";
    case AcmeErrorCode::INVALID_CERTIFICATE:
      return "Invalid certificate";
    case AcmeErrorCode::OPERATION_CANCELLED:
      return "Operation cancelled";
    case AcmeErrorCode::INVALID_CONFIG:
      return "Invalid configuration";
    case AcmeErrorCode::IO_ERROR:
      return "Input/output error";
    default:
      return "Unknown error";
  }
}

/**
 * @brief Base exception class for all ACME-related errors
 */
class AcmeError : public std::runtime_error {
 public:
  /**
   * @brief Construct an ACME error with message and error code
   * @param code Error code
   * @param message Error description (optional, uses default if empty)
   */
  explicit AcmeError(AcmeErrorCode code, std::string_view message = {})
      : std::runtime_error(message.empty()
                               ? std::string(errorCodeToString(code))
                               : std::string(message)),
        error_code_(code) {}

  /**
   * @brief Get the error code
   * @return The error code
   */
  [[nodiscard]] AcmeErrorCode errorCode() const noexcept { return error_code_; }

 private:
  AcmeErrorCode error_code_;
};

/**
 * @brief The CA answered in a way that breaks an expected contract
 *
 * Missing headers, unrecognized status values and malformed tokens all end
 * up here. Never retried automatically.
 */
class ProtocolViolationError : public AcmeError {
 public:
  explicit ProtocolViolationError(std::string_view details)
      : AcmeError(AcmeErrorCode::PROTOCOL_VIOLATION,
                  std::string("Protocol violation: ") + std::string(details)) {}

 protected:
  ProtocolViolationError(AcmeErrorCode code, std::string_view message)
      : AcmeError(code, message) {}
};

/**
 * @brief Response body could not be decoded into the expected resource
 */
class MalformedResponseError : public ProtocolViolationError {
 public:
  explicit MalformedResponseError(std::string_view details)
      : ProtocolViolationError(
            AcmeErrorCode::MALFORMED_RESPONSE,
            std::string("Malformed response: ") + std::string(details)) {}
};

/**
 * @brief HTTP status outside the defined success set
 */
class UnexpectedStatusError : public AcmeError {
 public:
  UnexpectedStatusError(int status, std::string_view context)
      : AcmeError(AcmeErrorCode::UNEXPECTED_STATUS,
                  std::string("Invalid response code ") +
                      std::to_string(status) + " for " + std::string(context)),
        status_(status) {}

  [[nodiscard]] int status() const noexcept { return status_; }

 private:
  int status_;
};

class InvalidBase64Error : public AcmeError {
 public:
  explicit InvalidBase64Error(std::string_view details)
      : AcmeError(
            AcmeErrorCode::INVALID_BASE64,
            std::string("Invalid base64 encoding: ") + std::string(details)) {}
};

/**
 * @brief No challenge offered by the CA can be solved by this client
 */
class NoSuitableChallengeError : public AcmeError {
 public:
  explicit NoSuitableChallengeError(std::string_view domain)
      : AcmeError(AcmeErrorCode::NO_SUITABLE_CHALLENGE,
                  std::string("Couldn't find any combination of challenges "
                              "which this client can solve for ") +
                      std::string(domain)) {}
};

/**
 * @brief The CA rejected the challenge response
 */
class ChallengeInvalidatedError : public AcmeError {
 public:
  explicit ChallengeInvalidatedError(std::string_view location)
      : AcmeError(AcmeErrorCode::CHALLENGE_INVALIDATED,
                  std::string("Challenge marked as invalid: ") +
                      std::string(location)) {}
};

class UnsupportedKeyTypeError : public AcmeError {
 public:
  explicit UnsupportedKeyTypeError(std::string_view keyType)
      : AcmeError(AcmeErrorCode::UNSUPPORTED_KEY_TYPE,
                  std::string("Only RSA keys are supported, got ") +
                      std::string(keyType)) {}
};

/**
 * @brief Exception for cryptographic operation failures
 */
class CryptoError : public AcmeError {
 public:
  explicit CryptoError(std::string_view details)
      : AcmeError(AcmeErrorCode::CRYPTO_OPERATION_FAILED,
                  std::string("Cryptographic operation failed: ") +
                      std::string(details)) {}
};

class InvalidCertificateError : public AcmeError {
 public:
  explicit InvalidCertificateError(std::string_view details)
      : AcmeError(AcmeErrorCode::INVALID_CERTIFICATE,
                  std::string("Invalid certificate: ") + std::string(details)) {
  }
};

/**
 * @brief The caller requested a stop while the flow was suspended
 */
class OperationCancelledError : public AcmeError {
 public:
  OperationCancelledError() : AcmeError(AcmeErrorCode::OPERATION_CANCELLED) {}
};

class InvalidConfigError : public AcmeError {
 public:
  explicit InvalidConfigError(std::string_view details)
      : AcmeError(AcmeErrorCode::INVALID_CONFIG,
                  std::string("Invalid configuration: ") +
                      std::string(details)) {}
};

/**
 * @brief Exception for I/O errors
 */
class IoError : public AcmeError {
 public:
  explicit IoError(std::string_view details)
      : AcmeError(AcmeErrorCode::IO_ERROR,
                  std::string("Input/output error: ") + std::string(details)) {}
};

/**
 * @brief Result type for error handling without exceptions
 */
template <typename T, typename E = AcmeError>
class Result {
 public:
  Result(const T& value) : data_(value) {}
  Result(T&& value) : data_(std::move(value)) {}
  Result(const E& error) : data_(error) {}
  Result(E&& error) : data_(std::move(error)) {}

  static Result success(T value) { return Result(std::move(value)); }
  static Result error(E error) { return Result(std::move(error)); }

  bool isSuccess() const noexcept { return std::holds_alternative<T>(data_); }
  bool isError() const noexcept { return std::holds_alternative<E>(data_); }
  explicit operator bool() const noexcept { return isSuccess(); }

  // Value access (throws if error)
  const T& value() const& {
    if (isError()) {
      throw std::get<E>(data_);
    }
    return std::get<T>(data_);
  }

  T&& value() && {
    if (isError()) {
      throw std::get<E>(data_);
    }
    return std::move(std::get<T>(data_));
  }

  const E& error() const& {
    if (isSuccess()) {
      throw std::logic_error("Accessing error on successful result");
    }
    return std::get<E>(data_);
  }

 private:
  std::variant<T, E> data_;
};

template <typename T>
using AcmeResult = Result<T, AcmeError>;

/**
 * @brief Throw an IoError describing a failed operation and errno
 */
inline void throwIoError(const std::string& operation, int error_code = errno) {
  throw IoError(operation + ": " + std::strerror(error_code));
}

}  // namespace acmeflow
