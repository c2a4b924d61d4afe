#pragma once

#include <strata/storage/container.hpp>
#include <strata/storage/rocksdb/storage.hpp>
#include <gtest/gtest.h>
#include <strata/testing/common.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace strata::testing {

/// Temporary container store, removed with the fixture. Workspaces loaded
/// here read octree cells through it and must not outlive it.
class container_fixture final {
 public:
  explicit container_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{strata::storage::make_storage<
            strata::storage::rocksdb_storage_tag>(db_path_)},
        container_{encoder_, storage_} {}

  container_fixture(const container_fixture&) = delete;
  container_fixture& operator=(const container_fixture&) = delete;
  container_fixture(container_fixture&&) = delete;
  container_fixture& operator=(container_fixture&&) = delete;

  ~container_fixture() {
    storage_.database.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }
  strata::storage::encoder_t& encoder() { return encoder_; }
  strata::storage::storage_t& storage() { return storage_; }
  strata::storage::container& container() { return container_; }

  /// Load the stored workspace, failing the calling test on error.
  std::shared_ptr<strata::workspace::workspace> reload() {
    auto loaded = container_.load();
    if (!loaded) {
      ADD_FAILURE() << "load failed: " << loaded.log;
      return nullptr;
    }
    return loaded.value;
  }

 private:
  std::string db_path_;
  strata::storage::encoder_t encoder_;
  strata::storage::storage_t storage_;
  strata::storage::container container_;
};

}  // namespace strata::testing
