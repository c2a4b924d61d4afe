#pragma once
#include <strata/model/data.hpp>
#include <strata/model/entity.hpp>
#include <strata/model/entity_type.hpp>
#include <strata/model/octree.hpp>
#include <strata/schema/encoding/scale/encoder.hpp>
#include <strata/schema/primitives.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

// Persisted shapes of the container records. Every record is a SCALE tuple;
// doubles travel as their IEEE-754 bit pattern.
namespace strata::storage {

using encoder_t = strata::schema::encoding::encoder<
    strata::schema::encoding::scale_encoder_tag>;

/// (kind, uid, class id, name, description, allow move content, allow
/// delete content, primitive type)
using type_record_t = std::tuple<uint8_t,
                                 strata::schema::uid_bytes_t,
                                 strata::schema::uid_bytes_t,
                                 std::string,
                                 std::string,
                                 bool,
                                 bool,
                                 uint8_t>;

/// (uid, name, association, data uids)
using property_group_record_t =
    std::tuple<strata::schema::uid_bytes_t,
               std::string,
               uint8_t,
               std::vector<strata::schema::uid_bytes_t>>;

/// (uid, type uid, parent, name, children, property groups, payload)
using entity_record_t =
    std::tuple<strata::schema::uid_bytes_t,
               strata::schema::uid_bytes_t,
               std::optional<strata::schema::uid_bytes_t>,
               std::string,
               std::vector<strata::schema::uid_bytes_t>,
               std::vector<property_group_record_t>,
               strata::schema::bytes_t>;

using octree_cell_record_t = std::tuple<int32_t, int32_t, int32_t, int32_t>;
using cells_record_t = std::vector<octree_cell_record_t>;

uint64_t to_bits(double value);
double from_bits(uint64_t bits);

type_record_t make_type_record(const strata::model::entity_type& type);
std::unique_ptr<strata::model::entity_type> make_type(
    const type_record_t& record);

/// Record of `entity` including the payload of its concrete class.
entity_record_t make_entity_record(encoder_t& encoder,
                                   strata::model::entity& entity);

/// Rebuild the concrete entity described by `record` for `workspace`.
/// Returns nullptr when the type does not map to a known entity class. The
/// root group is never rebuilt this way.
std::unique_ptr<strata::model::entity> make_entity(
    encoder_t& encoder,
    strata::workspace::workspace& workspace,
    const strata::model::entity_type& type,
    const entity_record_t& record);

cells_record_t make_cells_record(
    const std::vector<strata::model::octree_cell_t>& cells);
std::vector<strata::model::octree_cell_t> make_octree_cells(
    const cells_record_t& record);

}  // namespace strata::storage
