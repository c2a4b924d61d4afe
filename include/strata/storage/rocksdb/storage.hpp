#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <strata/common/critical.hpp>
#include <strata/schema/encoding/scale/encoder.hpp>
#include <strata/schema/key/container_keys.hpp>
#include <strata/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>
#include <tuple>

namespace strata::storage {

namespace detail {

inline strata::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const strata::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const strata::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const strata::schema::bytes_view_t& key,
           const T& value) const;

  void erase(const strata::schema::bytes_view_t& key) const;

  template <typename Encoder>
  std::optional<container_header> load_header(Encoder& encoder) const;

  template <typename Encoder>
  void save_header(Encoder& encoder, const container_header& header) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const strata::schema::bytes_view_t& prefix) const;
  void replace_by_prefix(const strata::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const strata::schema::bytes_view_t& key) const {
  if (!database) {
    strata::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      strata::common::critical("Failed to get value from RocksDB");
    }
  }
  return {encoder.template decode<T>(strata::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const strata::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    strata::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(strata::schema::make_bytes_view(encoded_value)));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    strata::common::critical("Failed to put value into RocksDB");
  }
}

template <typename Encoder>
std::optional<container_header> storage<rocksdb_storage_tag>::load_header(
    Encoder& encoder) const {
  auto key = strata::schema::make_bytes(strata::schema::key::kHeaderKey);
  auto decoded =
      get<std::tuple<uint32_t, strata::schema::uid_bytes_t, std::string>>(
          encoder, strata::schema::make_bytes_view(key));
  if (!decoded) {
    return std::nullopt;
  }
  auto header = container_header{};
  header.version = std::get<0>(*decoded);
  header.root_uid = strata::schema::make_uid(std::get<1>(*decoded));
  header.root_name = std::get<2>(*decoded);
  if (header.version != kContainerVersion) {
    spdlog::error("Unsupported container version {}", header.version);
    strata::common::critical("Unsupported container version");
  }
  return header;
}

template <typename Encoder>
void storage<rocksdb_storage_tag>::save_header(
    Encoder& encoder,
    const container_header& header) const {
  auto key = strata::schema::make_bytes(strata::schema::key::kHeaderKey);
  put(encoder, strata::schema::make_bytes_view(key),
      std::tuple{header.version, strata::schema::to_uid_bytes(header.root_uid),
                 header.root_name});
}

}  // namespace strata::storage
