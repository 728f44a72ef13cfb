#include "acmeflow/retry_after.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <locale>
#include <optional>
#include <sstream>
#include <string>

#include "acmeflow/error.hpp"
#include "acmeflow/logging.hpp"

namespace acmeflow {

namespace {

// Accepted absolute forms, tried in order
constexpr const char* DATE_FORMATS[] = {
    "%a, %d %b %Y %H:%M:%S GMT",  // IMF-fixdate
    "%A, %d-%b-%y %H:%M:%S GMT",  // RFC 850
    "%a %b %d %H:%M:%S %Y",       // asctime
    "%Y-%m-%dT%H:%M:%SZ",         // ISO-8601 UTC
};

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

bool allDigits(std::string_view value) noexcept {
  return std::all_of(value.begin(), value.end(), [](char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
  });
}

std::time_t toUtcTime(std::tm* tm) {
#ifdef _WIN32
  return _mkgmtime(tm);
#else
  return timegm(tm);
#endif
}

// Seconds since the epoch; kept out of system_clock, whose nanosecond
// representation overflows for dates past 2262
std::optional<int64_t> parseHttpDate(std::string_view value) {
  for (const char* format : DATE_FORMATS) {
    std::tm tm{};
    std::istringstream in{std::string(value)};
    in.imbue(std::locale::classic());
    in >> std::get_time(&tm, format);
    if (in.fail()) {
      continue;
    }
    // Reject trailing garbage
    in >> std::ws;
    if (!in.eof()) {
      continue;
    }
    std::time_t t = toUtcTime(&tm);
    if (t == static_cast<std::time_t>(-1)) {
      continue;
    }
    return static_cast<int64_t>(t);
  }
  return std::nullopt;
}

}  // namespace

std::chrono::seconds parseRetryAfter(
    std::string_view value, std::chrono::system_clock::time_point now) {
  std::string_view trimmed = trim(value);
  if (trimmed.empty()) {
    throw ProtocolViolationError("empty Retry-After header");
  }

  if (allDigits(trimmed)) {
    int64_t seconds = 0;
    auto [ptr, ec] = std::from_chars(trimmed.data(),
                                     trimmed.data() + trimmed.size(), seconds);
    if (ec == std::errc::result_out_of_range ||
        seconds > MAX_RETRY_DELAY.count()) {
      return MAX_RETRY_DELAY;
    }
    if (ec != std::errc() || ptr != trimmed.data() + trimmed.size()) {
      throw ProtocolViolationError("invalid Retry-After delay: " +
                                   std::string(trimmed));
    }
    return std::chrono::seconds(seconds);
  }

  auto when = parseHttpDate(trimmed);
  if (!when) {
    throw ProtocolViolationError("unparseable Retry-After header: " +
                                 std::string(trimmed));
  }

  int64_t now_seconds =
      std::chrono::floor<std::chrono::seconds>(now.time_since_epoch()).count();
  int64_t delta = *when - now_seconds;
  return std::chrono::seconds(
      std::clamp<int64_t>(delta, 0, MAX_RETRY_DELAY.count()));
}

std::chrono::milliseconds retryDelay(std::string_view value,
                                     std::chrono::system_clock::time_point now,
                                     std::chrono::milliseconds minimum) {
  std::chrono::milliseconds parsed = parseRetryAfter(value, now);
  auto delay = std::min<std::chrono::milliseconds>(std::max(parsed, minimum),
                                                  MAX_RETRY_DELAY);
  ACMEFLOW_LOG_DEBUG("Retry-After '{}' -> waiting {} ms", value,
                     delay.count());
  return delay;
}

}  // namespace acmeflow
