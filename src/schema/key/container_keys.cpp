#include <strata/schema/key/container_keys.hpp>

#include <algorithm>
#include <iterator>

namespace strata::schema::key {

strata::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                          const strata::schema::uid_t& uid) {
  auto key = strata::schema::bytes_t{};
  key.reserve(prefix.size() + uid.size());
  std::copy(std::begin(prefix), std::end(prefix), std::back_inserter(key));
  std::copy(uid.begin(), uid.end(), std::back_inserter(key));
  return key;
}

std::optional<strata::schema::uid_t> parse_prefixed_key(
    std::string_view prefix,
    const strata::schema::bytes_view_t& key) {
  auto uid_bytes = strata::schema::uid_bytes_t{};
  if (key.size() != prefix.size() + uid_bytes.size()) {
    return std::nullopt;
  }
  if (!std::equal(std::begin(prefix), std::end(prefix), key.begin(),
                  [](char lhs, uint8_t rhs) {
                    return static_cast<uint8_t>(lhs) == rhs;
                  })) {
    return std::nullopt;
  }
  std::copy(key.begin() + prefix.size(), key.end(), std::begin(uid_bytes));
  return strata::schema::make_uid(uid_bytes);
}

}  // namespace strata::schema::key
