/**
 * @file SortKey.hpp
 * @brief Sort preference for the host table.
 */

#pragma once

#include <array>
#include <optional>
#include <string>

namespace mping::core {

/**
 * @brief Key governing the order of the host table.
 */
enum class SortKey : int {
    Name = 0,    ///< Case-insensitive address
    Address = 1, ///< Resolved network address, raw address when unresolved
    Status = 2,  ///< Reachable hosts first
    Latency = 3, ///< Fastest reply first, unknown latency last
    Age = 4      ///< Longest unchanged status first
};

/**
 * @brief All sort keys in the order the options dialog lists them.
 */
inline constexpr std::array<SortKey, 5> kSortKeys{SortKey::Name, SortKey::Address,
                                                  SortKey::Status, SortKey::Latency,
                                                  SortKey::Age};

/**
 * @brief Short identifier used on the command line ("name", "ip", "status", "reply", "age").
 */
std::string sortKeyToString(SortKey key);

/**
 * @brief Human-readable label shown in the options dialog.
 */
std::string sortKeyLabel(SortKey key);

/**
 * @brief Parses a short identifier produced by sortKeyToString().
 * @return The key, or std::nullopt for unknown input.
 */
std::optional<SortKey> sortKeyFromString(const std::string& str);

/**
 * @brief Position of a key within kSortKeys.
 */
std::size_t sortKeyIndex(SortKey key);

/**
 * @brief Whether the order produced by this key depends on probe results.
 */
bool sortKeyDependsOnStatus(SortKey key);

} // namespace mping::core
