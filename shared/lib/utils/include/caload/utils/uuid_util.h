#pragma once

#include <string>

namespace caload {
namespace utils {

/**
 * UUID generation utility.
 */
class UuidUtil {
public:
    /**
     * Generate a lowercase UUID v4 (random) using libuuid.
     */
    static std::string generate();

    /**
     * Validate UUID format (8-4-4-4-12 hex digits).
     */
    static bool isValid(const std::string& uuid);
};

} // namespace utils
} // namespace caload
