#include <spdlog/spdlog.h>
#include <strata/model/group.hpp>
#include <strata/model/points.hpp>
#include <strata/storage/records.hpp>

#include <algorithm>
#include <bit>
#include <iterator>
#include <variant>

namespace strata::storage {

namespace {

using vector3_record_t = std::tuple<uint64_t, uint64_t, uint64_t>;
using segment_record_t = std::tuple<uint32_t, uint32_t>;

/// (vertices, explicit segments)
using curve_payload_t =
    std::tuple<std::vector<vector3_record_t>, std::vector<segment_record_t>>;

/// (origin, rotation, u/v/w counts, u/v/w cell sizes)
using octree_payload_t = std::tuple<vector3_record_t,
                                    uint64_t,
                                    std::optional<int32_t>,
                                    std::optional<int32_t>,
                                    std::optional<int32_t>,
                                    std::optional<uint64_t>,
                                    std::optional<uint64_t>,
                                    std::optional<uint64_t>>;

/// (association, variant index, integers, floats, text)
using data_payload_t = std::tuple<uint8_t,
                                  uint8_t,
                                  std::vector<int32_t>,
                                  std::vector<uint64_t>,
                                  std::vector<std::string>>;

vector3_record_t make_vector3_record(const strata::schema::vector3_t& v) {
  return {to_bits(v.x), to_bits(v.y), to_bits(v.z)};
}

strata::schema::vector3_t make_vector3(const vector3_record_t& record) {
  return {from_bits(std::get<0>(record)), from_bits(std::get<1>(record)),
          from_bits(std::get<2>(record))};
}

std::vector<vector3_record_t> make_vertex_records(
    const std::vector<strata::schema::vector3_t>& vertices) {
  auto records = std::vector<vector3_record_t>{};
  records.reserve(vertices.size());
  std::transform(std::begin(vertices), std::end(vertices),
                 std::back_inserter(records), make_vector3_record);
  return records;
}

std::vector<strata::schema::vector3_t> make_vertices(
    const std::vector<vector3_record_t>& records) {
  auto vertices = std::vector<strata::schema::vector3_t>{};
  vertices.reserve(records.size());
  std::transform(std::begin(records), std::end(records),
                 std::back_inserter(vertices), make_vector3);
  return vertices;
}

template <typename T>
std::optional<uint64_t> optional_bits(const std::optional<T>& value) {
  if (!value) {
    return std::nullopt;
  }
  return to_bits(*value);
}

strata::schema::bytes_t encode_payload(encoder_t& encoder,
                                       strata::model::entity& entity) {
  // Curves are points too, so they are checked first.
  if (const auto* instance = entity.as_curve()) {
    auto segments = std::vector<segment_record_t>{};
    if (instance->has_explicit_cells()) {
      for (const auto& cell : instance->cells()) {
        segments.emplace_back(cell[0], cell[1]);
      }
    }
    return encoder.encode(
        curve_payload_t{make_vertex_records(instance->vertices()), segments});
  }
  if (const auto* instance = entity.as_points()) {
    return encoder.encode(make_vertex_records(instance->vertices()));
  }
  if (const auto* instance = entity.as_octree()) {
    return encoder.encode(octree_payload_t{
        make_vector3_record(instance->origin()),
        to_bits(instance->rotation()), instance->u_count(),
        instance->v_count(), instance->w_count(),
        optional_bits(instance->u_cell_size()),
        optional_bits(instance->v_cell_size()),
        optional_bits(instance->w_cell_size())});
  }
  if (const auto* instance = entity.as_data()) {
    auto payload = data_payload_t{};
    std::get<0>(payload) = static_cast<uint8_t>(instance->association());
    std::get<1>(payload) = static_cast<uint8_t>(instance->values().index());
    std::visit(
        overloaded{
            [](const std::monostate&) {},
            [&](const std::vector<int32_t>& values) {
              std::get<2>(payload) = values;
            },
            [&](const std::vector<double>& values) {
              auto& bits = std::get<3>(payload);
              bits.reserve(values.size());
              std::transform(std::begin(values), std::end(values),
                             std::back_inserter(bits), to_bits);
            },
            [&](const std::vector<std::string>& values) {
              std::get<4>(payload) = values;
            }},
        instance->values());
    return encoder.encode(payload);
  }
  return {};
}

strata::model::data_values_t make_data_values(data_payload_t& payload) {
  switch (std::get<1>(payload)) {
    case 1:
      return std::move(std::get<2>(payload));
    case 2: {
      auto values = std::vector<double>{};
      const auto& bits = std::get<3>(payload);
      values.reserve(bits.size());
      std::transform(std::begin(bits), std::end(bits),
                     std::back_inserter(values), from_bits);
      return values;
    }
    case 3:
      return std::move(std::get<4>(payload));
    default:
      return std::monostate{};
  }
}

}  // namespace

uint64_t to_bits(double value) {
  return std::bit_cast<uint64_t>(value);
}

double from_bits(uint64_t bits) {
  return std::bit_cast<double>(bits);
}

type_record_t make_type_record(const strata::model::entity_type& type) {
  return {static_cast<uint8_t>(type.kind()),
          strata::schema::to_uid_bytes(type.uid()),
          strata::schema::to_uid_bytes(type.class_id()),
          type.name(),
          type.description(),
          type.allow_move_content(),
          type.allow_delete_content(),
          static_cast<uint8_t>(type.primitive_type())};
}

std::unique_ptr<strata::model::entity_type> make_type(
    const type_record_t& record) {
  const auto kind = static_cast<strata::model::entity_kind_t>(
      std::get<0>(record));
  auto type = std::make_unique<strata::model::entity_type>(
      kind, strata::schema::make_uid(std::get<1>(record)),
      std::get<3>(record), std::get<4>(record),
      strata::schema::make_uid(std::get<2>(record)));
  if (kind == strata::model::entity_kind_t::group) {
    type->set_allow_move_content(std::get<5>(record));
    type->set_allow_delete_content(std::get<6>(record));
  }
  if (kind == strata::model::entity_kind_t::data) {
    type->set_primitive_type(
        static_cast<strata::model::primitive_type_t>(std::get<7>(record)));
  }
  type->set_modified(false);
  return type;
}

entity_record_t make_entity_record(encoder_t& encoder,
                                   strata::model::entity& entity) {
  auto record = entity_record_t{};
  std::get<0>(record) = strata::schema::to_uid_bytes(entity.uid());
  std::get<1>(record) = strata::schema::to_uid_bytes(entity.type_uid());
  if (const auto& parent = entity.parent()) {
    std::get<2>(record) = strata::schema::to_uid_bytes(*parent);
  }
  std::get<3>(record) = entity.name();
  for (const auto& child : entity.children()) {
    std::get<4>(record).push_back(strata::schema::to_uid_bytes(child));
  }
  if (const auto* object = entity.as_object()) {
    for (const auto& group : object->property_groups()) {
      auto properties = std::vector<strata::schema::uid_bytes_t>{};
      for (const auto& uid : group.properties()) {
        properties.push_back(strata::schema::to_uid_bytes(uid));
      }
      std::get<5>(record).emplace_back(
          strata::schema::to_uid_bytes(group.uid()), group.name(),
          static_cast<uint8_t>(group.association()), std::move(properties));
    }
  }
  std::get<6>(record) = encode_payload(encoder, entity);
  return record;
}

std::unique_ptr<strata::model::entity> make_entity(
    encoder_t& encoder,
    strata::workspace::workspace& workspace,
    const strata::model::entity_type& type,
    const entity_record_t& record) {
  const auto uid = strata::schema::make_uid(std::get<0>(record));
  const auto& name = std::get<3>(record);
  const auto payload = strata::schema::make_bytes_view(std::get<6>(record));

  switch (type.kind()) {
    case strata::model::entity_kind_t::group: {
      if (type.uid() == strata::model::root_group::entity_class().type_uid) {
        return nullptr;
      }
      if (type.uid() ==
          strata::model::container_group::entity_class().type_uid) {
        return std::make_unique<strata::model::container_group>(
            workspace, uid, type.uid(), name);
      }
      return std::make_unique<strata::model::custom_group>(workspace, uid,
                                                           type.uid(), name);
    }
    case strata::model::entity_kind_t::object: {
      if (type.uid() == strata::model::points::entity_class().type_uid) {
        auto instance = std::make_unique<strata::model::points>(
            workspace, uid, type.uid(), name);
        instance->set_vertices(make_vertices(
            encoder.decode<std::vector<vector3_record_t>>(payload)));
        return instance;
      }
      if (type.uid() == strata::model::curve::entity_class().type_uid) {
        auto instance = std::make_unique<strata::model::curve>(
            workspace, uid, type.uid(), name);
        auto decoded = encoder.decode<curve_payload_t>(payload);
        instance->set_vertices(make_vertices(std::get<0>(decoded)));
        if (!std::get<1>(decoded).empty()) {
          auto cells = std::vector<strata::model::segment_t>{};
          for (const auto& [first, second] : std::get<1>(decoded)) {
            cells.push_back(strata::model::segment_t{first, second});
          }
          instance->set_cells(std::move(cells));
        }
        return instance;
      }
      if (type.uid() == strata::model::octree::entity_class().type_uid) {
        auto instance = std::make_unique<strata::model::octree>(
            workspace, uid, type.uid(), name);
        auto decoded = encoder.decode<octree_payload_t>(payload);
        instance->set_origin(make_vector3(std::get<0>(decoded)));
        instance->set_rotation(from_bits(std::get<1>(decoded)));
        if (auto count = std::get<2>(decoded)) {
          instance->set_u_count(*count);
        }
        if (auto count = std::get<3>(decoded)) {
          instance->set_v_count(*count);
        }
        if (auto count = std::get<4>(decoded)) {
          instance->set_w_count(*count);
        }
        if (auto size = std::get<5>(decoded)) {
          instance->set_u_cell_size(from_bits(*size));
        }
        if (auto size = std::get<6>(decoded)) {
          instance->set_v_cell_size(from_bits(*size));
        }
        if (auto size = std::get<7>(decoded)) {
          instance->set_w_cell_size(from_bits(*size));
        }
        return instance;
      }
      spdlog::warn("Object type {} ('{}') has no entity class",
                   strata::schema::to_string(type.uid()), type.name());
      return nullptr;
    }
    case strata::model::entity_kind_t::data: {
      auto decoded = encoder.decode<data_payload_t>(payload);
      auto instance = std::make_unique<strata::model::data>(
          workspace, uid, type.uid(), name,
          static_cast<strata::model::association_t>(std::get<0>(decoded)));
      instance->set_values(make_data_values(decoded));
      return instance;
    }
  }
  return nullptr;
}

cells_record_t make_cells_record(
    const std::vector<strata::model::octree_cell_t>& cells) {
  auto record = cells_record_t{};
  record.reserve(cells.size());
  for (const auto& cell : cells) {
    record.emplace_back(cell.i, cell.j, cell.k, cell.n_cells);
  }
  return record;
}

std::vector<strata::model::octree_cell_t> make_octree_cells(
    const cells_record_t& record) {
  auto cells = std::vector<strata::model::octree_cell_t>{};
  cells.reserve(record.size());
  for (const auto& [i, j, k, n_cells] : record) {
    cells.push_back(strata::model::octree_cell_t{
        .i = i, .j = j, .k = k, .n_cells = n_cells});
  }
  return cells;
}

}  // namespace strata::storage
