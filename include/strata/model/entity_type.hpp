#pragma once
#include <strata/common/result.hpp>
#include <strata/model/entity_kind.hpp>
#include <strata/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace strata::workspace {
class workspace;
}

namespace strata::model {

/// Static identity of a concrete entity class.
///
/// Every concrete entity class publishes one of these through
/// `entity_class()`. A nil `type_uid` marks classes whose types are always
/// created through `entity_type::create_custom`.
struct entity_class_t final {
  entity_kind_t kind{entity_kind_t::group};
  strata::schema::uid_t type_uid{};
  std::optional<strata::schema::uid_t> class_id;
  std::string_view name;
  std::string_view description;
};

/// Identity record shared by all entities of one concrete kind within one
/// workspace. Owned by the workspace type collection.
class entity_type final {
 public:
  entity_type(entity_kind_t kind,
              const strata::schema::uid_t& uid,
              std::string name,
              std::string description,
              std::optional<strata::schema::uid_t> class_id = std::nullopt);

  /// Return the registered type for `entity_class`, creating and
  /// registering it on first use. Fails with `invalid_type` when the class
  /// has no type uid.
  static strata::common::result<entity_type*> find_or_create(
      strata::workspace::workspace& workspace,
      const entity_class_t& entity_class);

  /// Register a brand-new type with a random uid that doubles as class id.
  static entity_type& create_custom(strata::workspace::workspace& workspace,
                                    entity_kind_t kind,
                                    std::string name,
                                    std::string description = {});

  entity_kind_t kind() const { return kind_; }
  const strata::schema::uid_t& uid() const { return uid_; }
  /// Falls back to the type uid when no class id was given.
  const strata::schema::uid_t& class_id() const;
  const std::string& name() const { return name_; }
  const std::string& description() const { return description_; }

  // Content policy, only meaningful on group types.
  bool allow_move_content() const { return allow_move_content_; }
  void set_allow_move_content(bool allow);
  bool allow_delete_content() const { return allow_delete_content_; }
  void set_allow_delete_content(bool allow);

  // Only meaningful on data types.
  primitive_type_t primitive_type() const { return primitive_type_; }
  void set_primitive_type(primitive_type_t primitive_type);

  bool modified() const { return modified_; }
  void set_modified(bool modified) { modified_ = modified; }

 private:
  entity_kind_t kind_;
  strata::schema::uid_t uid_;
  std::optional<strata::schema::uid_t> class_id_;
  std::string name_;
  std::string description_;
  bool allow_move_content_{true};
  bool allow_delete_content_{true};
  primitive_type_t primitive_type_{primitive_type_t::invalid};
  bool modified_{true};
};

}  // namespace strata::model
