#pragma once
#include <strata/model/entity_kind.hpp>
#include <strata/schema/primitives.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace strata::workspace {
class workspace;
}

namespace strata::model {

class curve;
class data;
class object_base;
class octree;
class points;

/// Common contract of groups, objects and data.
///
/// The workspace owns every entity. An entity refers to its parent, its
/// children and its type by uid only, and to its workspace by a non-owning
/// reference that stays valid for the entity's whole lifetime.
class entity {
 public:
  entity(const entity&) = delete;
  entity& operator=(const entity&) = delete;
  virtual ~entity() = default;

  virtual entity_kind_t kind() const = 0;

  /// Capability checks for the concrete entity classes.
  virtual object_base* as_object() { return nullptr; }
  virtual points* as_points() { return nullptr; }
  virtual curve* as_curve() { return nullptr; }
  virtual octree* as_octree() { return nullptr; }
  virtual data* as_data() { return nullptr; }

  const strata::schema::uid_t& uid() const { return uid_; }
  const strata::schema::uid_t& type_uid() const { return type_uid_; }

  const std::string& name() const { return name_; }
  void set_name(std::string name);

  /// Absent only for the root group.
  const std::optional<strata::schema::uid_t>& parent() const {
    return parent_;
  }
  const std::vector<strata::schema::uid_t>& children() const {
    return children_;
  }
  bool has_child(const strata::schema::uid_t& uid) const;

  /// Set whenever something a container needs to write has changed.
  bool modified() const { return modified_; }
  void set_modified(bool modified) { modified_ = modified; }

  /// True when the entity was read from a container rather than created.
  bool existing_in_container() const { return existing_in_container_; }
  void set_existing_in_container(bool existing) {
    existing_in_container_ = existing;
  }

  strata::workspace::workspace& owner() const { return workspace_; }

 protected:
  entity(strata::workspace::workspace& workspace,
         const strata::schema::uid_t& uid,
         const strata::schema::uid_t& type_uid,
         std::string name);

 private:
  friend class strata::workspace::workspace;

  void set_parent(std::optional<strata::schema::uid_t> parent) {
    parent_ = std::move(parent);
  }
  void add_child(const strata::schema::uid_t& uid);
  bool remove_child(const strata::schema::uid_t& uid);

  strata::workspace::workspace& workspace_;
  strata::schema::uid_t uid_;
  strata::schema::uid_t type_uid_;
  std::string name_;
  std::optional<strata::schema::uid_t> parent_;
  std::vector<strata::schema::uid_t> children_;
  bool modified_{true};
  bool existing_in_container_{false};
};

}  // namespace strata::model
