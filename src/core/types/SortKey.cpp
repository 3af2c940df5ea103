#include "core/types/SortKey.hpp"

#include <algorithm>

namespace mping::core {

std::string sortKeyToString(SortKey key) {
    switch (key) {
    case SortKey::Name:
        return "name";
    case SortKey::Address:
        return "ip";
    case SortKey::Status:
        return "status";
    case SortKey::Latency:
        return "reply";
    case SortKey::Age:
        return "age";
    }
    return "name";
}

std::string sortKeyLabel(SortKey key) {
    switch (key) {
    case SortKey::Name:
        return "Name";
    case SortKey::Address:
        return "IP";
    case SortKey::Status:
        return "Status";
    case SortKey::Latency:
        return "Reply";
    case SortKey::Age:
        return "Age";
    }
    return "Name";
}

std::optional<SortKey> sortKeyFromString(const std::string& str) {
    for (auto key : kSortKeys) {
        if (sortKeyToString(key) == str) {
            return key;
        }
    }
    return std::nullopt;
}

std::size_t sortKeyIndex(SortKey key) {
    auto it = std::find(kSortKeys.begin(), kSortKeys.end(), key);
    return static_cast<std::size_t>(std::distance(kSortKeys.begin(), it));
}

bool sortKeyDependsOnStatus(SortKey key) {
    return key == SortKey::Status || key == SortKey::Latency || key == SortKey::Age;
}

} // namespace mping::core
