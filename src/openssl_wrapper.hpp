#pragma once

#include <openssl/bio.h>
#include <openssl/err.h>

#include <climits>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace acmeflow {
namespace detail {

/**
 * @brief RAII wrapper for OpenSSL contexts
 */
template <typename T, void (*Deleter)(T*)>
class OpenSSLWrapper {
 public:
  explicit OpenSSLWrapper(T* ptr) : ptr_(ptr) {}
  ~OpenSSLWrapper() {
    if (ptr_) Deleter(ptr_);
  }

  // Move-only semantics
  OpenSSLWrapper(const OpenSSLWrapper&) = delete;
  OpenSSLWrapper& operator=(const OpenSSLWrapper&) = delete;
  OpenSSLWrapper(OpenSSLWrapper&& other) noexcept : ptr_(other.ptr_) {
    other.ptr_ = nullptr;
  }
  OpenSSLWrapper& operator=(OpenSSLWrapper&& other) noexcept {
    if (this != &other) {
      if (ptr_) Deleter(ptr_);
      ptr_ = other.ptr_;
      other.ptr_ = nullptr;
    }
    return *this;
  }

  T* get() const noexcept { return ptr_; }
  T* release() noexcept {
    T* tmp = ptr_;
    ptr_ = nullptr;
    return tmp;
  }
  explicit operator bool() const noexcept { return ptr_ != nullptr; }

 private:
  T* ptr_;
};

/**
 * @brief Drain a memory BIO into a byte vector
 */
inline std::vector<uint8_t> bioToBytes(BIO* bio) {
  char* data = nullptr;
  long len = BIO_get_mem_data(bio, &data);
  if (len <= 0 || data == nullptr) {
    return {};
  }
  return std::vector<uint8_t>(data, data + len);
}

inline std::string bioToString(BIO* bio) {
  char* data = nullptr;
  long len = BIO_get_mem_data(bio, &data);
  if (len <= 0 || data == nullptr) {
    return {};
  }
  return std::string(data, static_cast<size_t>(len));
}

/**
 * @brief Whether a buffer length fits the int length OpenSSL APIs take
 */
constexpr bool fitsOpenSSLLength(size_t size) noexcept {
  return size <= static_cast<size_t>(INT_MAX);
}

/**
 * @brief Most recent OpenSSL error as text, clearing the queue
 */
inline std::string lastOpenSSLError() {
  unsigned long err = ERR_get_error();
  ERR_clear_error();
  if (err == 0) {
    return "no OpenSSL error queued";
  }
  char buffer[256];
  ERR_error_string_n(err, buffer, sizeof(buffer));
  return buffer;
}

}  // namespace detail
}  // namespace acmeflow
