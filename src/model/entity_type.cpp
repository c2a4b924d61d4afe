#include <spdlog/spdlog.h>
#include <strata/common/critical.hpp>
#include <strata/model/entity_type.hpp>
#include <strata/workspace/workspace.hpp>

#include <memory>
#include <utility>

namespace strata::model {

entity_type::entity_type(entity_kind_t kind,
                         const strata::schema::uid_t& uid,
                         std::string name,
                         std::string description,
                         std::optional<strata::schema::uid_t> class_id)
    : kind_{kind},
      uid_{uid},
      class_id_{std::move(class_id)},
      name_{std::move(name)},
      description_{std::move(description)} {}

strata::common::result<entity_type*> entity_type::find_or_create(
    strata::workspace::workspace& workspace,
    const entity_class_t& entity_class) {
  if (strata::schema::is_nil(entity_class.type_uid)) {
    return strata::common::make_error<entity_type*>(
        strata::common::error_code::invalid_type,
        "cannot create " + std::string{to_string(entity_class.kind)} +
            " type with null uid from '" + std::string{entity_class.name} +
            "'");
  }

  if (auto* found = workspace.find_type(entity_class.type_uid,
                                        entity_class.kind)) {
    return strata::common::make_result(found);
  }

  auto& registered = workspace.register_type(std::make_unique<entity_type>(
      entity_class.kind, entity_class.type_uid,
      std::string{entity_class.name}, std::string{entity_class.description},
      entity_class.class_id));
  return strata::common::make_result(&registered);
}

entity_type& entity_type::create_custom(strata::workspace::workspace& workspace,
                                        entity_kind_t kind,
                                        std::string name,
                                        std::string description) {
  auto uid = strata::schema::make_uid();
  return workspace.register_type(std::make_unique<entity_type>(
      kind, uid, std::move(name), std::move(description), uid));
}

const strata::schema::uid_t& entity_type::class_id() const {
  if (class_id_) {
    return *class_id_;
  }
  return uid_;
}

void entity_type::set_allow_move_content(bool allow) {
  if (kind_ != entity_kind_t::group) {
    strata::common::critical("allow_move_content only applies to group types");
  }
  allow_move_content_ = allow;
  modified_ = true;
}

void entity_type::set_allow_delete_content(bool allow) {
  if (kind_ != entity_kind_t::group) {
    strata::common::critical(
        "allow_delete_content only applies to group types");
  }
  allow_delete_content_ = allow;
  modified_ = true;
}

void entity_type::set_primitive_type(primitive_type_t primitive_type) {
  if (kind_ != entity_kind_t::data) {
    strata::common::critical("primitive_type only applies to data types");
  }
  primitive_type_ = primitive_type;
  modified_ = true;
}

}  // namespace strata::model
