#include <spdlog/spdlog.h>
#include <strata/common/critical.hpp>
#include <strata/workspace/workspace.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace strata::workspace {

namespace {

std::weak_ptr<workspace>& active_slot() {
  static auto slot = std::weak_ptr<workspace>{};
  return slot;
}

template <typename T>
T* find_in(const collection_t<T>& collection,
           const strata::schema::uid_t& uid) {
  auto it = collection.find(uid);
  if (it == std::end(collection)) {
    return nullptr;
  }
  return it->second.get();
}

template <typename T>
std::vector<T*> values_of(const collection_t<T>& collection) {
  auto values = std::vector<T*>{};
  values.reserve(collection.size());
  for (const auto& [uid, value] : collection) {
    values.push_back(value.get());
  }
  return values;
}

}  // namespace

std::shared_ptr<workspace> workspace::create(
    std::optional<strata::schema::uid_t> root_uid,
    std::string root_name) {
  return std::make_shared<workspace>(private_tag{}, std::move(root_uid),
                                     std::move(root_name));
}

workspace::workspace(private_tag,
                     std::optional<strata::schema::uid_t> root_uid,
                     std::string root_name) {
  auto type = strata::model::entity_type::find_or_create(
      *this, strata::model::root_group::entity_class());
  if (!type) {
    strata::common::critical(type.log);
  }
  auto uid = root_uid.value_or(strata::schema::make_uid());
  auto root = std::make_unique<strata::model::root_group>(
      *this, uid, type.value->uid(), std::move(root_name));
  root_ = root.get();
  groups_.emplace(uid, std::move(root));
  ++type_usage_[type.value->uid()];
  spdlog::debug("Created workspace with root group {}",
                strata::schema::to_string(uid));
}

workspace::~workspace() {
  spdlog::debug("Releasing workspace with {} group(s), {} object(s), {} "
                "data and {} type(s)",
                groups_.size(), objects_.size(), data_.size(), types_.size());
}

void workspace::activate() {
  auto& slot = active_slot();
  if (slot.lock().get() != this) {
    slot = weak_from_this();
  }
}

void workspace::deactivate() {
  auto& slot = active_slot();
  if (slot.lock().get() == this) {
    slot.reset();
  }
}

strata::common::result<std::shared_ptr<workspace>> workspace::active() {
  auto current = active_slot().lock();
  if (!current) {
    return strata::common::make_error<std::shared_ptr<workspace>>(
        strata::common::error_code::no_active_workspace,
        "no active workspace");
  }
  return strata::common::make_result(std::move(current));
}

strata::model::entity_type& workspace::register_type(
    std::unique_ptr<strata::model::entity_type> type) {
  if (!type) {
    strata::common::critical("register_type requires a type");
  }
  auto uid = type->uid();
  spdlog::debug("Registering {} type '{}' ({})", to_string(type->kind()),
                type->name(), strata::schema::to_string(uid));
  auto& stored = types_[uid];
  stored = std::move(type);
  return *stored;
}

strata::model::entity_type* workspace::find_type(
    const strata::schema::uid_t& uid,
    strata::model::entity_kind_t kind) const {
  auto* found = find_in(types_, uid);
  if (found == nullptr || found->kind() != kind) {
    return nullptr;
  }
  return found;
}

std::size_t workspace::type_usage(const strata::schema::uid_t& uid) const {
  auto it = type_usage_.find(uid);
  if (it == std::end(type_usage_)) {
    return 0;
  }
  return it->second;
}

strata::common::result<strata::model::custom_group*>
workspace::create_custom_group(const strata::schema::uid_t& type_uid,
                               std::string name,
                               std::optional<strata::schema::uid_t> parent) {
  auto resolved = resolve_parent(parent, strata::model::entity_kind_t::group);
  if (!resolved) {
    return strata::common::make_error<strata::model::custom_group*>(
        resolved.code, std::move(resolved.log));
  }
  if (strata::schema::is_nil(type_uid)) {
    return strata::common::make_error<strata::model::custom_group*>(
        strata::common::error_code::invalid_type,
        "cannot create a group with a null type uid");
  }
  auto* type = find_type(type_uid, strata::model::entity_kind_t::group);
  if (type == nullptr) {
    return strata::common::make_error<strata::model::custom_group*>(
        strata::common::error_code::unknown_type,
        "group type " + strata::schema::to_string(type_uid) +
            " is not registered");
  }
  auto& stored = register_entity(
      std::make_unique<strata::model::custom_group>(
          *this, strata::schema::make_uid(), type->uid(), std::move(name)),
      *resolved.value);
  return strata::common::make_result(
      static_cast<strata::model::custom_group*>(&stored));
}

strata::common::result<strata::model::data*> workspace::create_data(
    const strata::schema::uid_t& parent,
    std::string name,
    strata::model::association_t association,
    strata::model::data_values_t values,
    std::optional<strata::schema::uid_t> data_type,
    std::optional<std::string> property_group) {
  auto resolved = resolve_parent(parent, strata::model::entity_kind_t::data);
  if (!resolved) {
    return strata::common::make_error<strata::model::data*>(
        resolved.code, std::move(resolved.log));
  }

  strata::model::entity_type* type = nullptr;
  if (data_type) {
    type = find_type(*data_type, strata::model::entity_kind_t::data);
    if (type == nullptr) {
      return strata::common::make_error<strata::model::data*>(
          strata::common::error_code::unknown_type,
          "data type " + strata::schema::to_string(*data_type) +
              " is not registered");
    }
  } else {
    type = &strata::model::entity_type::create_custom(
        *this, strata::model::entity_kind_t::data, name);
    type->set_primitive_type(strata::model::primitive_type_of(values));
  }

  auto instance = std::make_unique<strata::model::data>(
      *this, strata::schema::make_uid(), type->uid(), std::move(name),
      association);
  instance->set_values(std::move(values));
  auto& stored = register_entity(std::move(instance), *resolved.value);

  if (property_group) {
    auto* owner = resolved.value->as_object();
    auto listed = owner->add_to_property_group(
        stored.uid(), std::move(*property_group), association);
    if (!listed) {
      strata::common::critical(listed.log);
    }
  }
  return strata::common::make_result(
      static_cast<strata::model::data*>(&stored));
}

strata::model::group* workspace::find_group(
    const strata::schema::uid_t& uid) const {
  return find_in(groups_, uid);
}

strata::model::object_base* workspace::find_object(
    const strata::schema::uid_t& uid) const {
  return find_in(objects_, uid);
}

strata::model::data* workspace::find_data(
    const strata::schema::uid_t& uid) const {
  return find_in(data_, uid);
}

strata::model::entity* workspace::find_entity(
    const strata::schema::uid_t& uid) const {
  if (auto* group = find_group(uid)) {
    return group;
  }
  if (auto* object = find_object(uid)) {
    return object;
  }
  return find_data(uid);
}

std::vector<strata::model::entity*> workspace::get_entity(
    std::string_view name) const {
  auto found = std::vector<strata::model::entity*>{};
  auto collect = [&](const auto& collection) {
    for (const auto& [uid, value] : collection) {
      if (value->name() == name) {
        found.push_back(value.get());
      }
    }
  };
  collect(groups_);
  collect(objects_);
  collect(data_);
  return found;
}

std::vector<strata::model::group*> workspace::all_groups() const {
  return values_of(groups_);
}

std::vector<strata::model::object_base*> workspace::all_objects() const {
  return values_of(objects_);
}

std::vector<strata::model::data*> workspace::all_data() const {
  return values_of(data_);
}

void workspace::remove_entity(const strata::schema::uid_t& entity_uid) {
  // Copy: `entity_uid` may refer into the entity being destroyed.
  const auto uid = entity_uid;
  auto* target = find_entity(uid);
  if (target == nullptr) {
    spdlog::debug("Entity {} is not registered; nothing to remove",
                  strata::schema::to_string(uid));
    return;
  }
  if (target == root_) {
    spdlog::warn("The root group cannot be removed from its workspace");
    return;
  }

  // Copy: removing a child edits this list.
  auto children = target->children();
  for (const auto& child : children) {
    remove_entity(child);
  }

  const auto kind = target->kind();
  const auto type_uid = target->type_uid();
  if (const auto& parent_uid = target->parent()) {
    if (auto* parent = find_entity(*parent_uid)) {
      if (kind == strata::model::entity_kind_t::data) {
        if (auto* owner = parent->as_object()) {
          owner->remove_from_property_groups(uid);
        }
      }
      parent->remove_child(uid);
    }
  }

  spdlog::debug("Removing {} '{}' ({})", to_string(kind), target->name(),
                strata::schema::to_string(uid));
  switch (kind) {
    case strata::model::entity_kind_t::group:
      groups_.erase(uid);
      break;
    case strata::model::entity_kind_t::object:
      objects_.erase(uid);
      break;
    case strata::model::entity_kind_t::data:
      data_.erase(uid);
      break;
  }
  pending_removals_.push_back(uid);
  release_type(type_uid);
}

void workspace::set_octree_cells_source(octree_cells_source_t source) {
  octree_cells_source_ = std::move(source);
}

std::optional<std::vector<strata::model::octree_cell_t>>
workspace::fetch_octree_cells(const strata::schema::uid_t& uid) const {
  if (!octree_cells_source_) {
    spdlog::warn("No container attached; cannot fetch cells of octree {}",
                 strata::schema::to_string(uid));
    return std::nullopt;
  }
  return octree_cells_source_(uid);
}

strata::common::result<strata::model::entity*> workspace::adopt(
    std::unique_ptr<strata::model::entity> entity,
    const strata::schema::uid_t& parent) {
  if (!entity) {
    strata::common::critical("adopt requires an entity");
  }
  if (&entity->owner() != this) {
    strata::common::critical("adopt requires an entity built for this "
                             "workspace");
  }
  if (find_entity(entity->uid()) != nullptr) {
    return strata::common::make_error<strata::model::entity*>(
        strata::common::error_code::invalid_record,
        "uid " + strata::schema::to_string(entity->uid()) + " of '" +
            entity->name() + "' is already registered");
  }
  auto resolved = resolve_parent(parent, entity->kind());
  if (!resolved) {
    return resolved;
  }
  if (find_type(entity->type_uid(), entity->kind()) == nullptr) {
    return strata::common::make_error<strata::model::entity*>(
        strata::common::error_code::unknown_type,
        "type " + strata::schema::to_string(entity->type_uid()) + " of '" +
            entity->name() + "' is not registered");
  }
  auto& stored = register_entity(std::move(entity), *resolved.value);
  return strata::common::make_result(&stored);
}

strata::common::result<strata::model::entity*> workspace::resolve_parent(
    const std::optional<strata::schema::uid_t>& parent,
    strata::model::entity_kind_t child_kind) const {
  if (!parent) {
    if (child_kind == strata::model::entity_kind_t::data) {
      return strata::common::make_error<strata::model::entity*>(
          strata::common::error_code::missing_parent,
          "data requires a parent object");
    }
    return strata::common::make_result<strata::model::entity*>(root_);
  }

  auto* found = find_entity(*parent);
  if (found == nullptr) {
    return strata::common::make_error<strata::model::entity*>(
        strata::common::error_code::missing_parent,
        "parent " + strata::schema::to_string(*parent) +
            " does not belong to this workspace");
  }

  const auto expected = child_kind == strata::model::entity_kind_t::data
                            ? strata::model::entity_kind_t::object
                            : strata::model::entity_kind_t::group;
  if (found->kind() != expected) {
    return strata::common::make_error<strata::model::entity*>(
        strata::common::error_code::invalid_parent_kind,
        std::string{to_string(child_kind)} + " cannot be a child of " +
            std::string{to_string(found->kind())} + " '" + found->name() +
            "'");
  }
  return strata::common::make_result(found);
}

strata::model::entity& workspace::register_entity(
    std::unique_ptr<strata::model::entity> entity,
    strata::model::entity& parent) {
  auto* raw = entity.get();
  const auto uid = raw->uid();
  if (find_entity(uid) != nullptr) {
    strata::common::critical("entity uid " + strata::schema::to_string(uid) +
                             " is already registered");
  }

  switch (raw->kind()) {
    case strata::model::entity_kind_t::group:
      groups_[uid].reset(static_cast<strata::model::group*>(entity.release()));
      break;
    case strata::model::entity_kind_t::object:
      objects_[uid].reset(
          static_cast<strata::model::object_base*>(entity.release()));
      break;
    case strata::model::entity_kind_t::data:
      data_[uid].reset(static_cast<strata::model::data*>(entity.release()));
      break;
  }
  ++type_usage_[raw->type_uid()];

  raw->set_parent(parent.uid());
  parent.add_child(uid);
  raw->set_modified(true);
  parent.set_modified(true);

  spdlog::debug("Registered {} '{}' ({}) under '{}'", to_string(raw->kind()),
                raw->name(), strata::schema::to_string(uid), parent.name());
  return *raw;
}

void workspace::release_type(const strata::schema::uid_t& type_uid) {
  auto it = type_usage_.find(type_uid);
  if (it == std::end(type_usage_)) {
    return;
  }
  if (--it->second > 0) {
    return;
  }
  type_usage_.erase(it);
  if (types_.erase(type_uid) > 0) {
    spdlog::debug("Evicted type {} with no remaining entities",
                  strata::schema::to_string(type_uid));
  }
}

active_workspace::active_workspace(std::shared_ptr<workspace> target)
    : workspace_{std::move(target)} {
  if (!workspace_) {
    strata::common::critical("active_workspace requires a workspace");
  }
  auto current = workspace::active();
  if (current) {
    previous_ = current.value;
  }
  workspace_->activate();
}

active_workspace::~active_workspace() {
  workspace_->deactivate();
  if (auto previous = previous_.lock()) {
    previous->activate();
  }
}

}  // namespace strata::workspace
