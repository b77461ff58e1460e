#include "caload/utils/uuid_util.h"

#include <uuid/uuid.h>

namespace caload {
namespace utils {

std::string UuidUtil::generate() {
    uuid_t uuid;
    uuid_generate_random(uuid);

    char str[37];
    uuid_unparse_lower(uuid, str);

    return std::string(str);
}

bool UuidUtil::isValid(const std::string& uuid) {
    if (uuid.length() != 36) {
        return false;
    }

    for (size_t i = 0; i < uuid.length(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (uuid[i] != '-') {
                return false;
            }
        } else {
            char c = uuid[i];
            if (!((c >= '0' && c <= '9') ||
                  (c >= 'a' && c <= 'f') ||
                  (c >= 'A' && c <= 'F'))) {
                return false;
            }
        }
    }

    return true;
}

} // namespace utils
} // namespace caload
