#pragma once
#include <strata/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace strata::storage {

using key_value_entry_t =
    std::pair<strata::schema::bytes_t, strata::schema::bytes_t>;

inline constexpr uint32_t kContainerVersion{1};

/// Container-level record: format version and the identity of the root
/// group every other entity descends from.
struct container_header final {
  uint32_t version{kContainerVersion};
  strata::schema::uid_t root_uid{};
  std::string root_name;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const strata::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const strata::schema::bytes_view_t& key,
           const T& value);

  /// Delete key; missing keys are not an error.
  void erase(const strata::schema::bytes_view_t& key) const;

  /// Load the container header, or std::nullopt for an empty store.
  template <typename Encoder>
  std::optional<container_header> load_header(Encoder& encoder) const;

  template <typename Encoder>
  void save_header(Encoder& encoder, const container_header& header) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const strata::schema::bytes_view_t& prefix) const;

  /// Atomically replace all entries under prefix with provided entries.
  void replace_by_prefix(const strata::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace strata::storage
