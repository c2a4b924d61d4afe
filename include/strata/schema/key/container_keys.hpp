#pragma once

#include <strata/schema/primitives.hpp>
#include <array>
#include <optional>
#include <string_view>

// Canonical key prefixes and key codecs of the container keyspace. Every
// record key is a prefix followed by the 16 raw bytes of a uid.
namespace strata::schema::key {

inline constexpr std::string_view kHeaderKey{"SYS|CONTAINER|HEADER"};
inline constexpr std::string_view kTypeKeyPrefix{"TYPE|"};
inline constexpr std::string_view kGroupKeyPrefix{"GROUP|"};
inline constexpr std::string_view kObjectKeyPrefix{"OBJECT|"};
inline constexpr std::string_view kDataKeyPrefix{"DATA|"};
inline constexpr std::string_view kCellsKeyPrefix{"CELLS|"};

inline constexpr std::array<std::string_view, 3> kEntityKeyspaces{
    kGroupKeyPrefix, kObjectKeyPrefix, kDataKeyPrefix};

strata::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                          const strata::schema::uid_t& uid);

/// Uid part of a record key, or std::nullopt when `key` does not start with
/// `prefix` followed by exactly one uid.
std::optional<strata::schema::uid_t> parse_prefixed_key(
    std::string_view prefix,
    const strata::schema::bytes_view_t& key);

}  // namespace strata::schema::key
