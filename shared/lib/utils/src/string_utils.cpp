/**
 * @file string_utils.cpp
 * @brief Common string utility functions implementation
 */

#include "caload/utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace caload {
namespace utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& str) {
    // Find first non-whitespace character
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    // If all whitespace, return empty string
    if (start == str.length()) {
        return "";
    }

    // Find last non-whitespace character
    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;

    if (str.empty()) {
        tokens.push_back("");  // Empty string → [""]
        return tokens;
    }

    std::string token;
    std::istringstream tokenStream(str);

    while (std::getline(tokenStream, token, delimiter)) {
        tokens.push_back(token);
    }

    // Handle trailing delimiter: "a,b," should produce ["a", "b", ""]
    if (str.back() == delimiter) {
        tokens.push_back("");
    }

    return tokens;
}

std::vector<std::string> nonEmptyLines(const std::string& text) {
    std::vector<std::string> lines;
    for (const auto& raw : split(text, '\n')) {
        std::string line = raw;
        line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());
        if (!trim(line).empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

} // namespace utils
} // namespace caload
