#pragma once

#include <strata/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Recoverable failure taxonomy of the workspace API: stable numeric codes
// callers branch on. Programmer errors do not appear here, they go through
// strata::common::critical.
namespace strata::common {

enum class error_code : uint32_t {
  ok = 0,
  invalid_type = 1,
  missing_parent = 2,
  invalid_parent_kind = 3,
  no_active_workspace = 4,
  unknown_type = 5,
  not_a_child = 6,
  invalid_record = 7,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"ok", error_code::ok},
    std::pair<std::string_view, error_code>{"invalid_type",
                                            error_code::invalid_type},
    std::pair<std::string_view, error_code>{"missing_parent",
                                            error_code::missing_parent},
    std::pair<std::string_view, error_code>{"invalid_parent_kind",
                                            error_code::invalid_parent_kind},
    std::pair<std::string_view, error_code>{"no_active_workspace",
                                            error_code::no_active_workspace},
    std::pair<std::string_view, error_code>{"unknown_type",
                                            error_code::unknown_type},
    std::pair<std::string_view, error_code>{"not_a_child",
                                            error_code::not_a_child},
    std::pair<std::string_view, error_code>{"invalid_record",
                                            error_code::invalid_record},
};

inline constexpr std::string_view to_string(const error_code value) {
  return strata::schema::to_string(value, kErrorCodeMappings)
      .value_or("unknown");
}

}  // namespace strata::common

namespace strata::schema {

template <>
inline std::optional<strata::common::error_code>
try_from_string<strata::common::error_code>(const std::string_view value) {
  return from_string(value, strata::common::kErrorCodeMappings);
}

}  // namespace strata::schema
