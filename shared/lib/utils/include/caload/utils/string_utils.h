/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Common string operations used by the load generator.
 */

#pragma once

#include <string>
#include <vector>

namespace caload {
namespace utils {

/**
 * @brief Convert string to lowercase
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Split string by delimiter
 *
 * @param str Input string
 * @param delimiter Delimiter character
 * @return Vector of string parts (empty input yields a single empty part)
 */
std::vector<std::string> split(const std::string& str, char delimiter);

/**
 * @brief Split text into lines, dropping '\r' and blank lines
 */
std::vector<std::string> nonEmptyLines(const std::string& text);

} // namespace utils
} // namespace caload
