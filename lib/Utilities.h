#ifndef QCHAIN_UTILITIES_H
#define QCHAIN_UTILITIES_H

#include "ResultOrError.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace qc {

// Error type for utility functions
struct Error : public RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time as fractional seconds since the epoch
 */
double getTimestamp();

/**
 * Parse an integer from a string
 * @param str String to parse
 * @param value Output parameter for the parsed value
 * @return true if parsing succeeded, false otherwise
 */
bool parseInt(const std::string &str, int &value);

/**
 * Parse a port number from a string (validates range 0-65535)
 */
bool parsePort(const std::string &str, uint16_t &port);

/**
 * Parse a host:port string into separate host and port components
 * @param hostPort String in format "host:port"
 * @param host Output parameter for the host part
 * @param port Output parameter for the port part
 * @return true if parsing succeeded, false otherwise
 */
bool parseHostPort(const std::string &hostPort, std::string &host,
                   uint16_t &port);

/**
 * Load and parse a JSON file
 * @param filePath Path to the JSON file
 * @return Parsed document or error
 */
Roe<nlohmann::json> loadJsonFile(const std::string &filePath);

/**
 * Serialize a JSON value deterministically: keys sorted, ", " and ": "
 * separators, non-ASCII escaped. Every hash and signature payload goes
 * through this so independent nodes agree byte for byte.
 */
std::string canonicalJson(const nlohmann::json &value);

/**
 * Encode binary data as hex string
 * @return Lowercase hex string (two chars per byte)
 */
std::string hexEncode(const std::string &data);

/**
 * Decode hex string back to binary
 * @return Decoded bytes, or empty string if input is invalid
 */
std::string hexDecode(const std::string &hex);

bool isHexString(const std::string &s);

/**
 * Write a string to a file, replacing any previous content.
 * Creates parent directories if needed. The content is written to a
 * temporary sibling first and renamed into place.
 */
Roe<void> writeToFile(const std::string &filePath, const std::string &content);

} // namespace utl
} // namespace qc

#endif // QCHAIN_UTILITIES_H
