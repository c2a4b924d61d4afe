#include <strata/model/object_base.hpp>

#include <utility>

namespace strata::model {

object_base::object_base(strata::workspace::workspace& workspace,
                         const strata::schema::uid_t& uid,
                         const strata::schema::uid_t& type_uid,
                         std::string name)
    : entity{workspace, uid, type_uid, std::move(name)} {}

property_group* object_base::find_property_group(std::string_view name) {
  for (auto& group : property_groups_) {
    if (group.name() == name) {
      return &group;
    }
  }
  return nullptr;
}

property_group& object_base::find_or_create_property_group(
    std::string name,
    association_t association) {
  if (auto* found = find_property_group(name)) {
    return *found;
  }
  set_modified(true);
  return property_groups_.emplace_back(strata::schema::make_uid(),
                                       std::move(name), association);
}

property_group& object_base::restore_property_group(
    const strata::schema::uid_t& uid,
    std::string name,
    association_t association) {
  if (auto* found = find_property_group(name)) {
    return *found;
  }
  return property_groups_.emplace_back(uid, std::move(name), association);
}

strata::common::result<property_group*> object_base::add_to_property_group(
    const strata::schema::uid_t& data_uid,
    std::string name,
    association_t association) {
  if (!has_child(data_uid)) {
    return strata::common::make_error<property_group*>(
        strata::common::error_code::not_a_child,
        "data " + strata::schema::to_string(data_uid) +
            " is not a child of object '" + this->name() + "'");
  }
  auto& group = find_or_create_property_group(std::move(name), association);
  if (group.add(data_uid)) {
    set_modified(true);
  }
  return strata::common::make_result(&group);
}

std::size_t object_base::remove_from_property_groups(
    const strata::schema::uid_t& data_uid) {
  auto removed = std::size_t{0};
  for (auto& group : property_groups_) {
    if (group.remove(data_uid)) {
      ++removed;
    }
  }
  if (removed > 0) {
    set_modified(true);
  }
  return removed;
}

}  // namespace strata::model
