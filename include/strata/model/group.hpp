#pragma once
#include <strata/model/entity.hpp>
#include <strata/model/entity_type.hpp>
#include <string>

namespace strata::model {

/// Container node of the entity tree.
class group : public entity {
 public:
  entity_kind_t kind() const override { return entity_kind_t::group; }
  virtual bool is_root() const { return false; }

 protected:
  group(strata::workspace::workspace& workspace,
        const strata::schema::uid_t& uid,
        const strata::schema::uid_t& type_uid,
        std::string name);
};

/// The single parentless group of a workspace.
class root_group final : public group {
 public:
  root_group(strata::workspace::workspace& workspace,
             const strata::schema::uid_t& uid,
             const strata::schema::uid_t& type_uid,
             std::string name = "Workspace");

  static const entity_class_t& entity_class();
  bool is_root() const override { return true; }
};

/// Plain folder-like group.
class container_group final : public group {
 public:
  container_group(strata::workspace::workspace& workspace,
                  const strata::schema::uid_t& uid,
                  const strata::schema::uid_t& type_uid,
                  std::string name);

  static const entity_class_t& entity_class();
};

/// Group of a user-defined type created through
/// `entity_type::create_custom`.
class custom_group final : public group {
 public:
  custom_group(strata::workspace::workspace& workspace,
               const strata::schema::uid_t& uid,
               const strata::schema::uid_t& type_uid,
               std::string name);
};

}  // namespace strata::model
