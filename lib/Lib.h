#ifndef BAZAAR_LIB_H
#define BAZAAR_LIB_H

#include <nlohmann/json.hpp>

#include <string>

namespace bz {

/**
 * Library identity reported at startup and by the "version" request.
 */
class Lib {
public:
  constexpr static const char *NAME = "bazaar";
  constexpr static const char *VERSION = "0.3.0";

  static std::string getName();
  static std::string getVersion();

  // Name, version and the linked libsodium version
  static nlohmann::json getBuildInfo();
};

} // namespace bz

#endif // BAZAAR_LIB_H
