#ifndef BAZAAR_ENGINE_CONFIG_H
#define BAZAAR_ENGINE_CONFIG_H

#include "../lib/Logger.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace bz {

/**
 * EngineConfig - Settings read from the JSON configuration file.
 *
 * {
 *   "rating": { "min": 1, "max": 5 },
 *   "log":    { "level": "info", "file": "bazaar.log" },
 *   "events": { "log": true }
 * }
 *
 * Every key is optional.
 */
struct EngineConfig {
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CONFIG = 1;
  constexpr static int32_t E_FILE = 2;

  int32_t minRating{ 1 };
  int32_t maxRating{ 5 };
  logging::Level logLevel{ logging::Level::INFO };
  std::string logFile;
  bool logEvents{ true };

  bool isValidRating(int32_t rating) const {
    return rating >= minRating && rating <= maxRating;
  }

  nlohmann::json toJson() const;

  static Roe<EngineConfig> fromJson(const nlohmann::json &jd);
  static Roe<EngineConfig> loadFile(const std::string &configPath);
};

} // namespace bz

#endif // BAZAAR_ENGINE_CONFIG_H
