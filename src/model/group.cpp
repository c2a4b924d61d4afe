#include <strata/model/group.hpp>

#include <utility>

namespace strata::model {

group::group(strata::workspace::workspace& workspace,
             const strata::schema::uid_t& uid,
             const strata::schema::uid_t& type_uid,
             std::string name)
    : entity{workspace, uid, type_uid, std::move(name)} {}

root_group::root_group(strata::workspace::workspace& workspace,
                       const strata::schema::uid_t& uid,
                       const strata::schema::uid_t& type_uid,
                       std::string name)
    : group{workspace, uid, type_uid, std::move(name)} {}

const entity_class_t& root_group::entity_class() {
  static const auto kClass = entity_class_t{
      .kind = entity_kind_t::group,
      .type_uid = strata::schema::make_uid(
          std::string_view{"dd99b610-be92-48c0-873c-5b5946ea2840"}),
      .class_id = std::nullopt,
      .name = "NoType",
      .description = "<Unknown>"};
  return kClass;
}

container_group::container_group(strata::workspace::workspace& workspace,
                                 const strata::schema::uid_t& uid,
                                 const strata::schema::uid_t& type_uid,
                                 std::string name)
    : group{workspace, uid, type_uid, std::move(name)} {}

const entity_class_t& container_group::entity_class() {
  static const auto kClass = entity_class_t{
      .kind = entity_kind_t::group,
      .type_uid = strata::schema::make_uid(
          std::string_view{"61fbb4e8-a480-11d3-8d5a-2049af2c5e1e"}),
      .class_id = std::nullopt,
      .name = "Container",
      .description = "Container"};
  return kClass;
}

custom_group::custom_group(strata::workspace::workspace& workspace,
                           const strata::schema::uid_t& uid,
                           const strata::schema::uid_t& type_uid,
                           std::string name)
    : group{workspace, uid, type_uid, std::move(name)} {}

}  // namespace strata::model
