#include "core/types/Host.hpp"

#include <algorithm>
#include <cctype>

namespace mping::core {

bool Host::isValid() const {
    return !trim(address).empty();
}

Host Host::trimmed() const {
    return Host{trim(address), trim(description)};
}

std::string trim(const std::string& str) {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto first = std::find_if_not(str.begin(), str.end(), isSpace);
    auto last = std::find_if_not(str.rbegin(), str.rend(), isSpace).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

std::string toLower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace mping::core
