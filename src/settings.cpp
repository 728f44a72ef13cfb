#include "acmeflow/settings.hpp"

#include <cerrno>
#include <cstdint>
#include <fstream>

#include "acmeflow/error.hpp"

namespace acmeflow {

OrchestratorSettings OrchestratorSettings::fromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw InvalidConfigError("settings must be a JSON object");
  }

  OrchestratorSettings settings;

  if (auto it = j.find("challenge_type"); it != j.end()) {
    if (!it->is_string() || it->get<std::string>().empty()) {
      throw InvalidConfigError("challenge_type must be a non-empty string");
    }
    settings.challenge_type = it->get<std::string>();
  }

  if (auto it = j.find("min_retry_delay_ms"); it != j.end()) {
    if (!it->is_number_integer() || it->get<int64_t>() < 0) {
      throw InvalidConfigError("min_retry_delay_ms must be a non-negative integer");
    }
    settings.min_retry_delay = std::chrono::milliseconds(it->get<int64_t>());
  }

  if (auto it = j.find("agreement"); it != j.end() && !it->is_null()) {
    if (!it->is_string()) {
      throw InvalidConfigError("agreement must be a string");
    }
    settings.agreement = it->get<std::string>();
  }

  if (auto it = j.find("log_level"); it != j.end() && !it->is_null()) {
    if (!it->is_string()) {
      throw InvalidConfigError("log_level must be a string");
    }
    auto level = logging::parseLogLevel(it->get<std::string>());
    if (!level) {
      throw InvalidConfigError("unknown log_level '" +
                               it->get<std::string>() + "'");
    }
    settings.log_level = level;
  }

  return settings;
}

OrchestratorSettings OrchestratorSettings::fromFile(
    const std::filesystem::path& path) {
  std::ifstream file(path);
  if (!file) {
    throwIoError("open " + path.string());
  }

  nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
  if (j.is_discarded()) {
    throw InvalidConfigError(path.string() + " is not valid JSON");
  }
  return fromJson(j);
}

void OrchestratorSettings::applyLogging() const {
  if (log_level) {
    logging::Logger::getInstance().setLevel(*log_level);
  }
}

}  // namespace acmeflow
