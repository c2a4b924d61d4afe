#pragma once
#include <strata/common/result.hpp>
#include <strata/model/entity.hpp>
#include <strata/model/entity_type.hpp>
#include <strata/model/property_group.hpp>
#include <list>
#include <string>
#include <string_view>

namespace strata::model {

/// Spatial entity of the tree. Objects own the property groups of their
/// data children.
class object_base : public entity {
 public:
  entity_kind_t kind() const override { return entity_kind_t::object; }
  object_base* as_object() override { return this; }

  const std::list<property_group>& property_groups() const {
    return property_groups_;
  }
  property_group* find_property_group(std::string_view name);

  /// Return the property group called `name`, creating it when missing.
  property_group& find_or_create_property_group(
      std::string name,
      association_t association = association_t::unknown);

  /// Recreate an empty property group read from a container, keeping its
  /// stored uid.
  property_group& restore_property_group(const strata::schema::uid_t& uid,
                                         std::string name,
                                         association_t association);

  /// List `data_uid` in the property group called `name`.
  ///
  /// Fails with `not_a_child` when `data_uid` is not a child of this object.
  strata::common::result<property_group*> add_to_property_group(
      const strata::schema::uid_t& data_uid,
      std::string name,
      association_t association = association_t::unknown);

  /// Drop `data_uid` from every property group; returns how many listed it.
  std::size_t remove_from_property_groups(const strata::schema::uid_t& data_uid);

 protected:
  object_base(strata::workspace::workspace& workspace,
              const strata::schema::uid_t& uid,
              const strata::schema::uid_t& type_uid,
              std::string name);

 private:
  std::list<property_group> property_groups_;
};

}  // namespace strata::model
