#include "caload/loadgen/request_id_parser.h"

#include <regex>

namespace caload::loadgen {

std::optional<std::string> parseCaRequestId(const std::string& output) {
    static const std::regex pattern(R"re(RequestId\s*:\s*"?([0-9]+)"?)re", std::regex::icase);

    std::smatch match;
    if (std::regex_search(output, match, pattern)) {
        return match[1].str();
    }
    return std::nullopt;
}

} // namespace caload::loadgen
