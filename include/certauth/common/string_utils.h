/**
 * @file string_utils.h
 * @brief String manipulation utilities
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace certauth {
namespace common {

/**
 * @brief Convert string to lowercase
 */
std::string toLower(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string (empty if all whitespace)
 */
std::string trim(const std::string& str);

/**
 * @brief True if the string is empty or contains only whitespace
 */
bool isBlank(const std::string& str);

/**
 * @brief Split string by delimiter
 *
 * @param str Input string
 * @param delimiter Delimiter character
 * @return Vector of string parts
 */
std::vector<std::string> split(const std::string& str, char delimiter);

/**
 * @brief Convert binary data to hex string
 *
 * @param data Binary data
 * @param len Number of bytes
 * @param uppercase true for uppercase hex digits
 * @return Hex string (2 chars per byte), empty for empty input
 */
std::string bytesToHex(const uint8_t* data, size_t len, bool uppercase = false);

/**
 * @brief Convert hex string to binary data (either case accepted)
 *
 * @throws std::invalid_argument on odd length or non-hex characters
 */
std::vector<uint8_t> hexToBytes(const std::string& hex);

} // namespace common
} // namespace certauth
