#pragma once

#include <strata/model/data.hpp>
#include <strata/model/points.hpp>
#include <strata/workspace/workspace.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace strata::testing {

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Curve with `n` vertices along x, under the root unless `parent` is set.
inline strata::model::curve& make_curve(
    strata::workspace::workspace& workspace,
    const std::string& name,
    const std::size_t n = 3,
    std::optional<strata::schema::uid_t> parent = std::nullopt) {
  auto created =
      workspace.create_object<strata::model::curve>(name, std::move(parent));
  auto vertices = std::vector<strata::schema::vector3_t>{};
  for (std::size_t i = 0; i < n; ++i) {
    vertices.push_back({static_cast<double>(i), 0.0, 0.0});
  }
  created.value->set_vertices(std::move(vertices));
  return *created.value;
}

inline strata::model::data& make_floats(
    strata::workspace::workspace& workspace,
    const strata::schema::uid_t& parent,
    const std::string& name,
    std::optional<strata::schema::uid_t> data_type = std::nullopt,
    std::optional<std::string> property_group = std::nullopt) {
  auto created = workspace.create_data(
      parent, name, strata::model::association_t::vertex,
      std::vector<double>{1.0, 2.0, 3.0}, data_type,
      std::move(property_group));
  return *created.value;
}

}  // namespace strata::testing
