#include "Lib.h"

#include <sodium.h>

namespace bz {

std::string Lib::getName() { return NAME; }

std::string Lib::getVersion() { return VERSION; }

nlohmann::json Lib::getBuildInfo() {
  nlohmann::json info;
  info["name"] = NAME;
  info["version"] = VERSION;
  info["sodium"] = sodium_version_string();
  return info;
}

} // namespace bz
