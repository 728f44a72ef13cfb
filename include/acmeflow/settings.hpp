/**
 * @file settings.hpp
 * @brief Orchestrator configuration
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "logging.hpp"
#include "resources.hpp"

namespace acmeflow {

/**
 * @brief Settings shared by every flow of one orchestrator
 *
 * JSON form, all keys optional:
 * @code
 * {
 *   "challenge_type": "http-01",
 *   "min_retry_delay_ms": 1000,
 *   "agreement": "https://ca.example/terms",
 *   "log_level": "info"
 * }
 * @endcode
 */
struct OrchestratorSettings {
  std::string challenge_type{acmeflow::challenge_type::HTTP_01};
  std::chrono::milliseconds min_retry_delay{std::chrono::seconds(1)};
  std::optional<std::string> agreement;  ///< Used when a call passes none
  std::optional<logging::LogLevel> log_level;

  /**
   * @brief Build settings from JSON, keeping defaults for missing keys
   * @throws InvalidConfigError on wrong types or values
   */
  static OrchestratorSettings fromJson(const nlohmann::json& j);

  /**
   * @brief Load settings from a JSON file
   * @throws IoError if the file cannot be read
   * @throws InvalidConfigError if it is not valid settings JSON
   */
  static OrchestratorSettings fromFile(const std::filesystem::path& path);

  /**
   * @brief Push log_level (when set) to the shared logger
   */
  void applyLogging() const;
};

}  // namespace acmeflow
