#pragma once
#include <strata/model/object_base.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace strata::model {

/// Unconnected vertices.
class points : public object_base {
 public:
  points(strata::workspace::workspace& workspace,
         const strata::schema::uid_t& uid,
         const strata::schema::uid_t& type_uid,
         std::string name);

  static const entity_class_t& entity_class();

  points* as_points() override { return this; }

  const std::vector<strata::schema::vector3_t>& vertices() const {
    return vertices_;
  }
  void set_vertices(std::vector<strata::schema::vector3_t> vertices);
  std::size_t n_vertices() const { return vertices_.size(); }

 private:
  std::vector<strata::schema::vector3_t> vertices_;
};

using segment_t = std::array<uint32_t, 2>;

/// Vertices joined by line segments.
class curve final : public points {
 public:
  curve(strata::workspace::workspace& workspace,
        const strata::schema::uid_t& uid,
        const strata::schema::uid_t& type_uid,
        std::string name);

  static const entity_class_t& entity_class();

  curve* as_curve() override { return this; }

  /// Explicit segments, or consecutive vertex pairs when none were set.
  std::vector<segment_t> cells() const;
  void set_cells(std::vector<segment_t> cells);
  bool has_explicit_cells() const { return !cells_.empty(); }

 private:
  std::vector<segment_t> cells_;
};

}  // namespace strata::model
