/**
 * @file retry_after.hpp
 * @brief Retry-After header interpretation (RFC 9110 section 10.2.3)
 */

#pragma once

#include <chrono>
#include <string_view>

namespace acmeflow {

/**
 * @brief Longest delay a Retry-After value can request (about 100 years)
 *
 * Larger delay-seconds values and later dates are clamped to this, which
 * keeps steady_clock deadlines representable.
 */
constexpr std::chrono::seconds MAX_RETRY_DELAY =
    std::chrono::hours(24 * 365 * 100);

/**
 * @brief Parse a Retry-After value into a delay
 *
 * Accepts delay-seconds or an absolute date in IMF-fixdate, RFC 850,
 * asctime or ISO-8601 UTC form. A date in the past yields zero; the result
 * never exceeds MAX_RETRY_DELAY.
 *
 * @param value Header value, surrounding whitespace allowed
 * @param now Reference time for absolute dates
 * @throws ProtocolViolationError if the value cannot be parsed
 */
std::chrono::seconds parseRetryAfter(std::string_view value,
                                     std::chrono::system_clock::time_point now);

/**
 * @brief Effective wait before the next poll: max(parsed, minimum),
 * capped at MAX_RETRY_DELAY
 */
std::chrono::milliseconds retryDelay(
    std::string_view value, std::chrono::system_clock::time_point now,
    std::chrono::milliseconds minimum = std::chrono::seconds(1));

}  // namespace acmeflow
