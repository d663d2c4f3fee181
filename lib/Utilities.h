#ifndef BAZAAR_UTILITIES_H
#define BAZAAR_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace bz {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current wall clock time in milliseconds since the epoch
 * @return Current time in milliseconds
 */
int64_t getCurrentTimeMs();

/**
 * Add two non-negative 64-bit values, failing on overflow
 * @return false if a + b would exceed INT64_MAX or either operand is negative
 */
bool safeAdd(int64_t a, int64_t b, int64_t &out);

/**
 * Join a vector of strings with a delimiter
 */
std::string join(const std::vector<std::string> &strings,
                 const std::string &delimiter);

/**
 * Load and parse a JSON configuration file
 * @param configPath Path to the JSON configuration file
 * @return Parsed JSON object, or error if missing or malformed
 */
bz::Roe<nlohmann::json> loadJsonFile(const std::string &configPath);

/**
 * Parse and validate a JSON request string
 * @param request The JSON request string to parse
 * @return Parsed JSON object, or error if malformed or missing "type"
 */
bz::Roe<nlohmann::json> parseJsonRequest(const std::string &request);

/**
 * Compute SHA-256 hash using Libsodium
 * @param input Input string to hash
 * @return Hexadecimal string representation of the SHA-256 hash
 * @throws std::runtime_error if hash computation fails
 */
std::string sha256(const std::string &input);

/**
 * Encode binary data as hex string
 * @param data Raw bytes
 * @return Lowercase hex string (two chars per byte)
 */
std::string hexEncode(const std::string &data);

/**
 * Return a string safe for JSON (UTF-8). If input contains non-printable or
 * non-ASCII bytes, returns "0x" + hexEncode(input).
 */
std::string toJsonSafeString(const std::string &s);

} // namespace utl
} // namespace bz

#endif // BAZAAR_UTILITIES_H
