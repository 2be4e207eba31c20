#ifndef CHAIN_LEDGER_UTILITIES_H
#define CHAIN_LEDGER_UTILITIES_H

#include "ResultOrError.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace cl {

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
 * Get the current time in seconds since the epoch
 */
int64_t getCurrentTime();

/**
 * Current time in seconds since the epoch with sub-second precision
 */
double currentTimeSeconds();

/**
 * Current local time as ISO-8601 with microseconds, e.g.
 * "2024-05-01T12:30:45.123456"
 */
std::string formatIsoTimestamp();

// Strip leading and trailing whitespace
std::string trim(const std::string &str);

/**
 * Canonical form of a peer base URL: surrounding whitespace removed,
 * trailing slashes stripped.
 */
std::string normalizePeerUrl(const std::string &url);

/**
 * Load and parse a JSON file
 * @return Parsed document, or error if missing or malformed
 */
cl::Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Write a JSON document to a file, creating parent directories if needed.
 * Existing content is replaced.
 */
cl::Roe<void> writeJsonFile(const std::string &path, const nlohmann::json &j);

/**
 * Parse a JSON request body that must be an object
 */
cl::Roe<nlohmann::json> parseJsonObject(const std::string &body);

/**
 * Compute SHA-256 with libsodium
 * @return Lowercase hex digest
 * @throws std::runtime_error if hash computation fails
 */
std::string sha256(const std::string &input);

} // namespace utl
} // namespace cl

#endif // CHAIN_LEDGER_UTILITIES_H
