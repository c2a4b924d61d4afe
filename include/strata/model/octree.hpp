#pragma once
#include <strata/model/object_base.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace strata::model {

/// One octree cell: base-grid origin indices on u/v/w and the edge length of
/// the (cubic) cell in base-cell units.
struct octree_cell_t final {
  int32_t i{};
  int32_t j{};
  int32_t k{};
  int32_t n_cells{};

  bool operator==(const octree_cell_t&) const = default;
};

/// Octree mesh: a regular base grid of `u/v/w_count` cells whose cells can
/// be subdivided into eight octants.
///
/// Cells start unset. A newly created mesh is refined once to its coarsest
/// level (`base_refine`); a mesh read from a container fetches its stored
/// cells through the workspace on first access. Centroids are derived
/// lazily and cached until any geometric parameter changes.
class octree final : public object_base {
 public:
  octree(strata::workspace::workspace& workspace,
         const strata::schema::uid_t& uid,
         const strata::schema::uid_t& type_uid,
         std::string name);

  static const entity_class_t& entity_class();

  octree* as_octree() override { return this; }

  const strata::schema::vector3_t& origin() const { return origin_; }
  void set_origin(const strata::schema::vector3_t& origin);

  /// Clockwise rotation angle (degrees) about the vertical axis.
  double rotation() const { return rotation_; }
  void set_rotation(double rotation);

  std::optional<int32_t> u_count() const { return u_count_; }
  std::optional<int32_t> v_count() const { return v_count_; }
  std::optional<int32_t> w_count() const { return w_count_; }
  void set_u_count(int32_t count);
  void set_v_count(int32_t count);
  void set_w_count(int32_t count);

  std::optional<double> u_cell_size() const { return u_cell_size_; }
  std::optional<double> v_cell_size() const { return v_cell_size_; }
  std::optional<double> w_cell_size() const { return w_cell_size_; }
  void set_u_cell_size(double size);
  void set_v_cell_size(double size);
  void set_w_cell_size(double size);

  /// Base cell counts along u, v and w, once all three are set.
  std::optional<std::array<int32_t, 3>> shape() const;

  /// Cell records, fetched or base-refined on first access when possible.
  const std::optional<std::vector<octree_cell_t>>& octree_cells();
  void set_octree_cells(std::vector<octree_cell_t> cells);
  /// Whether cell records are present without triggering a fetch/refine.
  bool has_octree_cells() const { return octree_cells_.has_value(); }

  std::optional<std::size_t> n_cells();

  /// Populate the cells at the coarsest level fitting the base grid: a
  /// single cell along the shortest axis. Cells must still be unset.
  void base_refine();

  /// World coordinates of every cell center, in cell order.
  const std::vector<strata::schema::vector3_t>& centroids();

 private:
  void invalidate();

  strata::schema::vector3_t origin_{};
  double rotation_{0.0};
  std::optional<int32_t> u_count_;
  std::optional<int32_t> v_count_;
  std::optional<int32_t> w_count_;
  std::optional<double> u_cell_size_;
  std::optional<double> v_cell_size_;
  std::optional<double> w_cell_size_;
  std::optional<std::vector<octree_cell_t>> octree_cells_;
  std::optional<std::vector<strata::schema::vector3_t>> centroids_;
};

}  // namespace strata::model
