#include "EngineConfig.h"
#include "../lib/Utilities.h"

#include <limits>

namespace bz {

nlohmann::json EngineConfig::toJson() const {
  nlohmann::json j;
  j["rating"]["min"] = minRating;
  j["rating"]["max"] = maxRating;
  j["log"]["level"] = logging::levelToString(logLevel);
  j["log"]["file"] = logFile;
  j["events"]["log"] = logEvents;
  return j;
}

static bool readRatingBound(const nlohmann::json &rating, const char *key,
                            int32_t &out) {
  if (!rating.contains(key)) {
    return true;
  }
  const auto &value = rating[key];
  if (!value.is_number_integer()) {
    return false;
  }
  int64_t raw = value.get<int64_t>();
  if (raw < std::numeric_limits<int32_t>::min() ||
      raw > std::numeric_limits<int32_t>::max()) {
    return false;
  }
  out = static_cast<int32_t>(raw);
  return true;
}

EngineConfig::Roe<EngineConfig> EngineConfig::fromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_CONFIG, "Configuration must be a JSON object");
  }

  EngineConfig config;

  if (jd.contains("rating")) {
    const auto &rating = jd["rating"];
    if (!rating.is_object()) {
      return Error(E_CONFIG, "'rating' must be an object");
    }
    if (!readRatingBound(rating, "min", config.minRating)) {
      return Error(E_CONFIG, "'rating.min' must be a 32-bit integer");
    }
    if (!readRatingBound(rating, "max", config.maxRating)) {
      return Error(E_CONFIG, "'rating.max' must be a 32-bit integer");
    }
    if (config.minRating > config.maxRating) {
      return Error(E_CONFIG, "'rating.min' must not exceed 'rating.max'");
    }
  }

  if (jd.contains("log")) {
    const auto &log = jd["log"];
    if (!log.is_object()) {
      return Error(E_CONFIG, "'log' must be an object");
    }
    if (log.contains("level")) {
      if (!log["level"].is_string() ||
          !logging::parseLevel(log["level"].get<std::string>(),
                               config.logLevel)) {
        return Error(E_CONFIG, "'log.level' must be one of debug, info, "
                               "warning, error, critical");
      }
    }
    if (log.contains("file")) {
      if (!log["file"].is_string()) {
        return Error(E_CONFIG, "'log.file' must be a string");
      }
      config.logFile = log["file"].get<std::string>();
    }
  }

  if (jd.contains("events")) {
    const auto &events = jd["events"];
    if (!events.is_object()) {
      return Error(E_CONFIG, "'events' must be an object");
    }
    if (events.contains("log")) {
      if (!events["log"].is_boolean()) {
        return Error(E_CONFIG, "'events.log' must be a boolean");
      }
      config.logEvents = events["log"].get<bool>();
    }
  }

  return config;
}

EngineConfig::Roe<EngineConfig>
EngineConfig::loadFile(const std::string &configPath) {
  auto jsonResult = utl::loadJsonFile(configPath);
  if (!jsonResult) {
    return Error(E_FILE, jsonResult.error().message);
  }
  return fromJson(jsonResult.value());
}

} // namespace bz
