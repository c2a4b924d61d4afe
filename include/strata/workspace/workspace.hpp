#pragma once

#include <spdlog/spdlog.h>
#include <strata/common/result.hpp>
#include <strata/model/data.hpp>
#include <strata/model/entity_type.hpp>
#include <strata/model/group.hpp>
#include <strata/model/object_base.hpp>
#include <strata/model/octree.hpp>
#include <strata/schema/primitives.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace strata::workspace {

template <typename T>
using collection_t = std::unordered_map<strata::schema::uid_t,
                                        std::unique_ptr<T>,
                                        strata::schema::uid_hash_t>;

/// Read path into a persisted container for octree cell records.
using octree_cells_source_t =
    std::function<std::optional<std::vector<strata::model::octree_cell_t>>(
        const strata::schema::uid_t& uid)>;

/// Process-local registry of one container's entity graph.
///
/// The workspace is the sole owner of its entity types, groups, objects and
/// data. Entities are addressed by uid; a uid is unique across all four
/// collections. Not thread-safe: callers serialize access.
///
/// Workspaces are always held by `std::shared_ptr` so that the process-wide
/// active slot can observe them through a `std::weak_ptr`.
class workspace final : public std::enable_shared_from_this<workspace> {
  struct private_tag final {};

 public:
  /// Build an empty workspace with its root group. `root_uid` is used when
  /// loading an existing container, a fresh uid otherwise.
  static std::shared_ptr<workspace> create(
      std::optional<strata::schema::uid_t> root_uid = std::nullopt,
      std::string root_name = "Workspace");

  workspace(private_tag,
            std::optional<strata::schema::uid_t> root_uid,
            std::string root_name);
  ~workspace();

  workspace(const workspace&) = delete;
  workspace& operator=(const workspace&) = delete;
  workspace(workspace&&) = delete;
  workspace& operator=(workspace&&) = delete;

  // Active workspace slot.
  void activate();
  void deactivate();
  static strata::common::result<std::shared_ptr<workspace>> active();

  // Types.
  /// Insert or overwrite the type keyed by its uid.
  strata::model::entity_type& register_type(
      std::unique_ptr<strata::model::entity_type> type);
  /// The registered type only if it exists and is of `kind`.
  strata::model::entity_type* find_type(const strata::schema::uid_t& uid,
                                        strata::model::entity_kind_t kind) const;
  const collection_t<strata::model::entity_type>& types() const {
    return types_;
  }
  /// Number of live entities referencing the type.
  std::size_t type_usage(const strata::schema::uid_t& uid) const;

  // Entities.
  strata::model::group& root() const { return *root_; }

  template <typename T>
  strata::common::result<T*> create_group(
      std::string name,
      std::optional<strata::schema::uid_t> parent = std::nullopt);

  /// Create a group typed by a registered (usually custom) group type.
  strata::common::result<strata::model::custom_group*> create_custom_group(
      const strata::schema::uid_t& type_uid,
      std::string name,
      std::optional<strata::schema::uid_t> parent = std::nullopt);

  template <typename T>
  strata::common::result<T*> create_object(
      std::string name,
      std::optional<strata::schema::uid_t> parent = std::nullopt);

  /// Create a data channel under object `parent`.
  ///
  /// Without `data_type` a fresh custom data type is created for the
  /// channel. With `property_group` the channel is listed in that property
  /// group of the parent, created on demand.
  strata::common::result<strata::model::data*> create_data(
      const strata::schema::uid_t& parent,
      std::string name,
      strata::model::association_t association,
      strata::model::data_values_t values,
      std::optional<strata::schema::uid_t> data_type = std::nullopt,
      std::optional<std::string> property_group = std::nullopt);

  strata::model::group* find_group(const strata::schema::uid_t& uid) const;
  strata::model::object_base* find_object(
      const strata::schema::uid_t& uid) const;
  strata::model::data* find_data(const strata::schema::uid_t& uid) const;
  strata::model::entity* find_entity(const strata::schema::uid_t& uid) const;
  /// Every entity called `name`, in no particular order.
  std::vector<strata::model::entity*> get_entity(std::string_view name) const;

  std::vector<strata::model::group*> all_groups() const;
  std::vector<strata::model::object_base*> all_objects() const;
  std::vector<strata::model::data*> all_data() const;

  const collection_t<strata::model::group>& groups() const { return groups_; }
  const collection_t<strata::model::object_base>& objects() const {
    return objects_;
  }
  const collection_t<strata::model::data>& data() const { return data_; }

  /// Remove an entity and, depth first, all of its descendants.
  ///
  /// Unknown or already removed uids are a no-op. Types left without any
  /// referencing entity are evicted immediately.
  void remove_entity(const strata::schema::uid_t& entity_uid);

  /// Uids removed since the container last consumed them.
  const std::vector<strata::schema::uid_t>& pending_removals() const {
    return pending_removals_;
  }
  void clear_pending_removals() { pending_removals_.clear(); }

  // Container collaboration.
  void set_octree_cells_source(octree_cells_source_t source);
  std::optional<std::vector<strata::model::octree_cell_t>> fetch_octree_cells(
      const strata::schema::uid_t& uid) const;

  /// Adopt an entity read from a container under an already registered
  /// parent. The entity keeps its stored uid and type. A uid that is already
  /// registered is rejected with `invalid_record` and leaves the workspace
  /// untouched.
  strata::common::result<strata::model::entity*> adopt(
      std::unique_ptr<strata::model::entity> entity,
      const strata::schema::uid_t& parent);

 private:
  /// Parent validation shared by every create path.
  strata::common::result<strata::model::entity*> resolve_parent(
      const std::optional<strata::schema::uid_t>& parent,
      strata::model::entity_kind_t child_kind) const;

  /// Insert into the matching collection, link to `parent` and count the
  /// type usage. Returns the stored entity. The uid must not be registered.
  strata::model::entity& register_entity(
      std::unique_ptr<strata::model::entity> entity,
      strata::model::entity& parent);

  void release_type(const strata::schema::uid_t& type_uid);

  collection_t<strata::model::entity_type> types_;
  collection_t<strata::model::group> groups_;
  collection_t<strata::model::object_base> objects_;
  collection_t<strata::model::data> data_;
  std::unordered_map<strata::schema::uid_t,
                     std::size_t,
                     strata::schema::uid_hash_t>
      type_usage_;
  strata::model::group* root_{nullptr};
  std::vector<strata::schema::uid_t> pending_removals_;
  octree_cells_source_t octree_cells_source_;
};

template <typename T>
strata::common::result<T*> workspace::create_group(
    std::string name,
    std::optional<strata::schema::uid_t> parent) {
  static_assert(std::is_base_of_v<strata::model::group, T>,
                "create_group requires a group class");
  auto resolved = resolve_parent(parent, strata::model::entity_kind_t::group);
  if (!resolved) {
    return strata::common::make_error<T*>(resolved.code,
                                          std::move(resolved.log));
  }
  auto type = strata::model::entity_type::find_or_create(*this,
                                                         T::entity_class());
  if (!type) {
    return strata::common::make_error<T*>(type.code, std::move(type.log));
  }
  auto& stored = register_entity(
      std::make_unique<T>(*this, strata::schema::make_uid(),
                          type.value->uid(), std::move(name)),
      *resolved.value);
  return strata::common::make_result(static_cast<T*>(&stored));
}

template <typename T>
strata::common::result<T*> workspace::create_object(
    std::string name,
    std::optional<strata::schema::uid_t> parent) {
  static_assert(std::is_base_of_v<strata::model::object_base, T>,
                "create_object requires an object class");
  auto resolved =
      resolve_parent(parent, strata::model::entity_kind_t::object);
  if (!resolved) {
    return strata::common::make_error<T*>(resolved.code,
                                          std::move(resolved.log));
  }
  auto type = strata::model::entity_type::find_or_create(*this,
                                                         T::entity_class());
  if (!type) {
    return strata::common::make_error<T*>(type.code, std::move(type.log));
  }
  auto& stored = register_entity(
      std::make_unique<T>(*this, strata::schema::make_uid(),
                          type.value->uid(), std::move(name)),
      *resolved.value);
  return strata::common::make_result(static_cast<T*>(&stored));
}

/// Scoped activation: makes `target` the active one for the lifetime of
/// the guard and restores whatever was active before (including nothing)
/// on destruction, also during stack unwinding.
class active_workspace final {
 public:
  explicit active_workspace(std::shared_ptr<workspace> target);
  ~active_workspace();

  active_workspace(const active_workspace&) = delete;
  active_workspace& operator=(const active_workspace&) = delete;
  active_workspace(active_workspace&&) = delete;
  active_workspace& operator=(active_workspace&&) = delete;

  workspace& get() const { return *workspace_; }

 private:
  std::shared_ptr<workspace> workspace_;
  std::weak_ptr<workspace> previous_;
};

}  // namespace strata::workspace
