#include <spdlog/spdlog.h>
#include <strata/common/critical.hpp>
#include <strata/schema/key/container_keys.hpp>
#include <strata/storage/container.hpp>

#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace strata::storage {

namespace {

struct stored_entity final {
  strata::model::entity_kind_t kind{strata::model::entity_kind_t::group};
  entity_record_t record;
};

using stored_entities_t = std::unordered_map<strata::schema::uid_t,
                                             stored_entity,
                                             strata::schema::uid_hash_t>;

std::string_view keyspace_of(strata::model::entity_kind_t kind) {
  switch (kind) {
    case strata::model::entity_kind_t::group:
      return strata::schema::key::kGroupKeyPrefix;
    case strata::model::entity_kind_t::object:
      return strata::schema::key::kObjectKeyPrefix;
    case strata::model::entity_kind_t::data:
      return strata::schema::key::kDataKeyPrefix;
  }
  return strata::schema::key::kGroupKeyPrefix;
}

/// Children of `parent` in stored order. Records naming `parent` as their
/// parent but missing from its child list follow in scan order.
std::vector<strata::schema::uid_t> children_of(
    const stored_entities_t& stored,
    const std::vector<strata::schema::uid_t>& scan_order,
    const strata::schema::uid_t& parent,
    const std::vector<strata::schema::uid_bytes_t>& listed) {
  auto children = std::vector<strata::schema::uid_t>{};
  auto seen =
      std::unordered_set<strata::schema::uid_t, strata::schema::uid_hash_t>{};
  auto claims = [&](const strata::schema::uid_t& uid) {
    auto it = stored.find(uid);
    if (it == std::end(stored)) {
      return false;
    }
    const auto& stored_parent = std::get<2>(it->second.record);
    return stored_parent &&
           strata::schema::make_uid(*stored_parent) == parent;
  };
  for (const auto& bytes : listed) {
    auto uid = strata::schema::make_uid(bytes);
    if (claims(uid) && seen.insert(uid).second) {
      children.push_back(uid);
    }
  }
  for (const auto& uid : scan_order) {
    if (!seen.contains(uid) && claims(uid)) {
      seen.insert(uid);
      children.push_back(uid);
    }
  }
  return children;
}

}  // namespace

container::container(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

void container::save_entity(strata::workspace::workspace& workspace,
                            const strata::schema::uid_t& uid) {
  auto* entity = workspace.find_entity(uid);
  if (entity == nullptr) {
    spdlog::debug("Entity {} is not registered; nothing to save",
                  strata::schema::to_string(uid));
    return;
  }
  if (auto* type = workspace.find_type(entity->type_uid(), entity->kind())) {
    auto key = strata::schema::key::make_prefixed_key(
        strata::schema::key::kTypeKeyPrefix, type->uid());
    storage_.put(encoder_, strata::schema::make_bytes_view(key),
                 make_type_record(*type));
    type->set_modified(false);
  }
  write_entity(*entity);
  write_header(workspace);
  entity->set_modified(false);
  entity->set_existing_in_container(true);
  attach(workspace);
}

void container::finalize(strata::workspace::workspace& workspace) {
  for (const auto& uid : workspace.pending_removals()) {
    for (const auto& prefix : strata::schema::key::kEntityKeyspaces) {
      auto key = strata::schema::key::make_prefixed_key(prefix, uid);
      storage_.erase(strata::schema::make_bytes_view(key));
    }
    auto cells_key = strata::schema::key::make_prefixed_key(
        strata::schema::key::kCellsKeyPrefix, uid);
    storage_.erase(strata::schema::make_bytes_view(cells_key));
  }
  spdlog::debug("Deleted records of {} removed entit(ies)",
                workspace.pending_removals().size());
  workspace.clear_pending_removals();

  auto types = std::vector<key_value_entry_t>{};
  for (const auto& [uid, type] : workspace.types()) {
    types.push_back(key_value_entry_t{
        strata::schema::key::make_prefixed_key(
            strata::schema::key::kTypeKeyPrefix, uid),
        encoder_.encode(make_type_record(*type))});
    type->set_modified(false);
  }
  auto type_prefix =
      strata::schema::make_bytes(strata::schema::key::kTypeKeyPrefix);
  storage_.replace_by_prefix(strata::schema::make_bytes_view(type_prefix),
                             types);

  auto written = std::size_t{0};
  auto flush = [&](const auto& collection) {
    for (const auto& [uid, entity] : collection) {
      if (entity->modified() || !entity->existing_in_container()) {
        write_entity(*entity);
        ++written;
      }
      entity->set_modified(false);
      entity->set_existing_in_container(true);
    }
  };
  flush(workspace.groups());
  flush(workspace.objects());
  flush(workspace.data());
  write_header(workspace);
  attach(workspace);
  spdlog::info("Finalized container: {} type(s), {} entit(ies) written",
               types.size(), written);
}

strata::common::result<std::shared_ptr<strata::workspace::workspace>>
container::load() {
  using workspace_ptr_t = std::shared_ptr<strata::workspace::workspace>;

  auto header = storage_.load_header(encoder_);
  if (!header) {
    spdlog::info("Container is empty; starting a new workspace");
    auto fresh = strata::workspace::workspace::create();
    attach(*fresh);
    return strata::common::make_result(std::move(fresh));
  }

  auto workspace =
      strata::workspace::workspace::create(header->root_uid, header->root_name);

  auto type_prefix =
      strata::schema::make_bytes(strata::schema::key::kTypeKeyPrefix);
  for (const auto& [key, value] :
       storage_.list_by_prefix(strata::schema::make_bytes_view(type_prefix))) {
    auto type = make_type(encoder_.decode<type_record_t>(
        strata::schema::make_bytes_view(value)));
    workspace->register_type(std::move(type));
  }

  auto stored = stored_entities_t{};
  auto scan_order = std::vector<strata::schema::uid_t>{};
  for (auto kind : {strata::model::entity_kind_t::group,
                    strata::model::entity_kind_t::object,
                    strata::model::entity_kind_t::data}) {
    auto prefix = strata::schema::make_bytes(keyspace_of(kind));
    for (const auto& [key, value] :
         storage_.list_by_prefix(strata::schema::make_bytes_view(prefix))) {
      auto uid = strata::schema::key::parse_prefixed_key(
          keyspace_of(kind), strata::schema::make_bytes_view(key));
      if (!uid) {
        spdlog::warn("Skipping malformed {} key", to_string(kind));
        continue;
      }
      stored.emplace(*uid, stored_entity{
                               .kind = kind,
                               .record = encoder_.decode<entity_record_t>(
                                   strata::schema::make_bytes_view(value))});
      scan_order.push_back(*uid);
    }
  }

  auto& root = workspace->root();
  auto root_children = std::vector<strata::schema::uid_bytes_t>{};
  if (auto it = stored.find(root.uid()); it != std::end(stored)) {
    root_children = std::get<4>(it->second.record);
  }

  // Breadth first from the root so that every parent exists before its
  // children are adopted.
  auto pending = std::deque<strata::schema::uid_t>{};
  for (const auto& uid :
       children_of(stored, scan_order, root.uid(), root_children)) {
    pending.push_back(uid);
  }
  auto adopted = std::vector<strata::schema::uid_t>{};
  while (!pending.empty()) {
    auto uid = pending.front();
    pending.pop_front();
    const auto& [kind, record] = stored.at(uid);

    auto* type = workspace->find_type(
        strata::schema::make_uid(std::get<1>(record)), kind);
    if (type == nullptr) {
      return strata::common::make_error<workspace_ptr_t>(
          strata::common::error_code::unknown_type,
          "stored " + std::string{to_string(kind)} + " " +
              strata::schema::to_string(uid) + " has no registered type");
    }
    auto entity = make_entity(encoder_, *workspace, *type, record);
    if (!entity) {
      return strata::common::make_error<workspace_ptr_t>(
          strata::common::error_code::invalid_record,
          "stored " + std::string{to_string(kind)} + " " +
              strata::schema::to_string(uid) +
              " does not map to an entity class");
    }
    entity->set_existing_in_container(true);
    auto placed = workspace->adopt(
        std::move(entity), strata::schema::make_uid(*std::get<2>(record)));
    if (!placed) {
      return strata::common::make_error<workspace_ptr_t>(
          placed.code, std::move(placed.log));
    }
    adopted.push_back(uid);
    for (const auto& child :
         children_of(stored, scan_order, uid, std::get<4>(record))) {
      pending.push_back(child);
    }
  }

  // Property groups list data children, so they are restored last.
  for (const auto& uid : adopted) {
    auto* object = workspace->find_object(uid);
    if (object == nullptr) {
      continue;
    }
    for (const auto& [group_uid, name, association, properties] :
         std::get<5>(stored.at(uid).record)) {
      auto& group = object->restore_property_group(
          strata::schema::make_uid(group_uid), name,
          static_cast<strata::model::association_t>(association));
      for (const auto& property : properties) {
        auto data_uid = strata::schema::make_uid(property);
        if (object->has_child(data_uid)) {
          group.add(data_uid);
        } else {
          spdlog::warn("Property group '{}' lists {} which is not a child "
                       "of '{}'",
                       name, strata::schema::to_string(data_uid),
                       object->name());
        }
      }
    }
  }

  const auto reachable =
      adopted.size() + (stored.contains(root.uid()) ? 1 : 0);
  if (reachable < stored.size()) {
    spdlog::warn("{} stored entit(ies) are unreachable from the root",
                 stored.size() - reachable);
  }

  root.set_modified(false);
  root.set_existing_in_container(true);
  for (const auto& uid : adopted) {
    workspace->find_entity(uid)->set_modified(false);
  }
  for (const auto& [uid, type] : workspace->types()) {
    type->set_modified(false);
  }
  attach(*workspace);
  spdlog::info("Loaded container: {} group(s), {} object(s), {} data, {} "
               "type(s)",
               workspace->groups().size(), workspace->objects().size(),
               workspace->data().size(), workspace->types().size());
  return strata::common::make_result(std::move(workspace));
}

std::optional<std::vector<strata::model::octree_cell_t>>
container::fetch_octree_cells(const strata::schema::uid_t& uid) const {
  auto key = strata::schema::key::make_prefixed_key(
      strata::schema::key::kCellsKeyPrefix, uid);
  auto record = storage_.get<cells_record_t>(
      encoder_, strata::schema::make_bytes_view(key));
  if (!record) {
    return std::nullopt;
  }
  return make_octree_cells(*record);
}

void container::attach(strata::workspace::workspace& workspace) {
  workspace.set_octree_cells_source(
      [this](const strata::schema::uid_t& uid) {
        return fetch_octree_cells(uid);
      });
}

void container::write_entity(strata::model::entity& entity) {
  auto key = strata::schema::key::make_prefixed_key(keyspace_of(entity.kind()),
                                                    entity.uid());
  storage_.put(encoder_, strata::schema::make_bytes_view(key),
               make_entity_record(encoder_, entity));

  // Cells never read back from the container are left as stored.
  auto* mesh = entity.as_octree();
  if (mesh != nullptr && mesh->has_octree_cells()) {
    auto cells_key = strata::schema::key::make_prefixed_key(
        strata::schema::key::kCellsKeyPrefix, entity.uid());
    storage_.put(encoder_, strata::schema::make_bytes_view(cells_key),
                 make_cells_record(*mesh->octree_cells()));
  }
}

void container::write_header(const strata::workspace::workspace& workspace) {
  storage_.save_header(
      encoder_, container_header{.version = kContainerVersion,
                                 .root_uid = workspace.root().uid(),
                                 .root_name = workspace.root().name()});
}

}  // namespace strata::storage
