#pragma once

#include <strata/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace strata::model {

enum class entity_kind_t : uint8_t { group = 0, object = 1, data = 2 };

inline constexpr auto kEntityKindMappings = std::array{
    std::pair<std::string_view, entity_kind_t>{"group", entity_kind_t::group},
    std::pair<std::string_view, entity_kind_t>{"object",
                                               entity_kind_t::object},
    std::pair<std::string_view, entity_kind_t>{"data", entity_kind_t::data},
};

inline constexpr std::string_view to_string(const entity_kind_t value) {
  return strata::schema::to_string(value, kEntityKindMappings)
      .value_or("unknown");
}

// Value type of a data channel.
enum class primitive_type_t : uint8_t {
  invalid = 0,
  integer = 1,
  floating = 2,
  text = 3,
  referenced = 4
};

inline constexpr auto kPrimitiveTypeMappings = std::array{
    std::pair<std::string_view, primitive_type_t>{"invalid",
                                                  primitive_type_t::invalid},
    std::pair<std::string_view, primitive_type_t>{"integer",
                                                  primitive_type_t::integer},
    std::pair<std::string_view, primitive_type_t>{"float",
                                                  primitive_type_t::floating},
    std::pair<std::string_view, primitive_type_t>{"text",
                                                  primitive_type_t::text},
    std::pair<std::string_view, primitive_type_t>{
        "referenced", primitive_type_t::referenced},
};

inline constexpr std::string_view to_string(const primitive_type_t value) {
  return strata::schema::to_string(value, kPrimitiveTypeMappings)
      .value_or("unknown");
}

// Where the values of a data channel live on its parent object.
enum class association_t : uint8_t {
  unknown = 0,
  object = 1,
  cell = 2,
  vertex = 3,
  face = 4
};

inline constexpr auto kAssociationMappings = std::array{
    std::pair<std::string_view, association_t>{"unknown",
                                               association_t::unknown},
    std::pair<std::string_view, association_t>{"object",
                                               association_t::object},
    std::pair<std::string_view, association_t>{"cell", association_t::cell},
    std::pair<std::string_view, association_t>{"vertex",
                                               association_t::vertex},
    std::pair<std::string_view, association_t>{"face", association_t::face},
};

inline constexpr std::string_view to_string(const association_t value) {
  return strata::schema::to_string(value, kAssociationMappings)
      .value_or("unknown");
}

}  // namespace strata::model

namespace strata::schema {

template <>
inline std::optional<strata::model::entity_kind_t>
try_from_string<strata::model::entity_kind_t>(const std::string_view value) {
  return from_string(value, strata::model::kEntityKindMappings);
}

template <>
inline std::optional<strata::model::primitive_type_t>
try_from_string<strata::model::primitive_type_t>(
    const std::string_view value) {
  return from_string(value, strata::model::kPrimitiveTypeMappings);
}

template <>
inline std::optional<strata::model::association_t>
try_from_string<strata::model::association_t>(const std::string_view value) {
  return from_string(value, strata::model::kAssociationMappings);
}

}  // namespace strata::schema
