#pragma once
#include <strata/common/result.hpp>
#include <strata/model/octree.hpp>
#include <strata/schema/primitives.hpp>
#include <strata/storage/records.hpp>
#include <strata/storage/rocksdb/storage.hpp>
#include <strata/workspace/workspace.hpp>
#include <memory>
#include <optional>
#include <vector>

namespace strata::storage {

using storage_t = storage<rocksdb_storage_tag>;

/// Persists workspaces to, and rebuilds them from, one container store.
///
/// A workspace loaded from (or finalized into) a container reads octree
/// cells back through it, so the container must outlive such workspaces.
class container final {
 public:
  container(encoder_t& encoder, storage_t& storage);

  /// Write one entity, its type and (for octrees with cells) its cell
  /// records, then clear its modified flag. Unknown uids are a no-op.
  void save_entity(strata::workspace::workspace& workspace,
                   const strata::schema::uid_t& uid);

  /// Bring the store in line with `workspace`: delete records of pending
  /// removals, rewrite the type table, write every modified entity and the
  /// header. Afterwards every entity is unmodified and existing in the
  /// container.
  void finalize(strata::workspace::workspace& workspace);

  /// Rebuild the stored workspace, or a fresh one for an empty store.
  strata::common::result<std::shared_ptr<strata::workspace::workspace>>
  load();

  std::optional<std::vector<strata::model::octree_cell_t>> fetch_octree_cells(
      const strata::schema::uid_t& uid) const;

  /// Install this container as the octree cells source of `workspace`.
  void attach(strata::workspace::workspace& workspace);

 private:
  void write_entity(strata::model::entity& entity);
  void write_header(const strata::workspace::workspace& workspace);

  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace strata::storage
