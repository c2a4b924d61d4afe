#include <spdlog/spdlog.h>
#include <strata/common/critical.hpp>
#include <strata/model/octree.hpp>
#include <strata/workspace/workspace.hpp>

#include <algorithm>
#include <bit>
#include <cmath>
#include <numbers>
#include <utility>

namespace strata::model {

namespace {

int32_t checked_count(const int32_t count, const std::string_view axis) {
  if (count <= 0) {
    spdlog::error("{} must be positive, got {}", axis, count);
    strata::common::critical("octree base cell count must be positive");
  }
  return count;
}

double checked_size(const double size, const std::string_view axis) {
  if (!(size > 0.0) || !std::isfinite(size)) {
    spdlog::error("{} must be positive, got {}", axis, size);
    strata::common::critical("octree cell size must be positive");
  }
  return size;
}

int32_t axis_level(const std::optional<int32_t>& count,
                   const std::string_view axis) {
  if (!count) {
    spdlog::error("{} must be set before base_refine", axis);
    strata::common::critical("base_refine requires u, v and w counts");
  }
  auto value = static_cast<uint32_t>(*count);
  if (!std::has_single_bit(value)) {
    spdlog::error("{} must be a power of two, got {}", axis, *count);
    strata::common::critical("base_refine requires power of two counts");
  }
  return static_cast<int32_t>(std::countr_zero(value));
}

}  // namespace

octree::octree(strata::workspace::workspace& workspace,
               const strata::schema::uid_t& uid,
               const strata::schema::uid_t& type_uid,
               std::string name)
    : object_base{workspace, uid, type_uid, std::move(name)} {}

const entity_class_t& octree::entity_class() {
  static const auto kClass = entity_class_t{
      .kind = entity_kind_t::object,
      .type_uid = strata::schema::make_uid(
          std::string_view{"4ea87376-3ece-438b-bf12-3479733ded46"}),
      .class_id = std::nullopt,
      .name = "Octree",
      .description = "Octree"};
  return kClass;
}

void octree::invalidate() {
  set_modified(true);
  centroids_.reset();
}

void octree::set_origin(const strata::schema::vector3_t& origin) {
  origin_ = origin;
  invalidate();
}

void octree::set_rotation(double rotation) {
  if (!std::isfinite(rotation)) {
    strata::common::critical("octree rotation must be finite");
  }
  rotation_ = rotation;
  invalidate();
}

void octree::set_u_count(int32_t count) {
  u_count_ = checked_count(count, "u_count");
  invalidate();
}

void octree::set_v_count(int32_t count) {
  v_count_ = checked_count(count, "v_count");
  invalidate();
}

void octree::set_w_count(int32_t count) {
  w_count_ = checked_count(count, "w_count");
  invalidate();
}

void octree::set_u_cell_size(double size) {
  u_cell_size_ = checked_size(size, "u_cell_size");
  invalidate();
}

void octree::set_v_cell_size(double size) {
  v_cell_size_ = checked_size(size, "v_cell_size");
  invalidate();
}

void octree::set_w_cell_size(double size) {
  w_cell_size_ = checked_size(size, "w_cell_size");
  invalidate();
}

std::optional<std::array<int32_t, 3>> octree::shape() const {
  if (!u_count_ || !v_count_ || !w_count_) {
    return std::nullopt;
  }
  return std::array<int32_t, 3>{*u_count_, *v_count_, *w_count_};
}

const std::optional<std::vector<octree_cell_t>>& octree::octree_cells() {
  if (!octree_cells_) {
    if (existing_in_container()) {
      octree_cells_ = owner().fetch_octree_cells(uid());
      if (!octree_cells_) {
        spdlog::warn("No stored cells for octree '{}' ({})", name(),
                     strata::schema::to_string(uid()));
      }
    } else if (shape()) {
      base_refine();
    }
  }
  return octree_cells_;
}

void octree::set_octree_cells(std::vector<octree_cell_t> cells) {
  for (const auto& cell : cells) {
    if (cell.n_cells <= 0 || cell.i < 0 || cell.j < 0 || cell.k < 0) {
      strata::common::critical("octree cell requires non-negative indices "
                               "and a positive size");
    }
  }
  octree_cells_ = std::move(cells);
  invalidate();
}

std::optional<std::size_t> octree::n_cells() {
  const auto& cells = octree_cells();
  if (!cells) {
    return std::nullopt;
  }
  return cells->size();
}

void octree::base_refine() {
  if (octree_cells_) {
    strata::common::critical(
        "base_refine is only implemented while octree_cells is unset");
  }

  // Number of octree levels allowed on each dimension.
  const auto level_u = axis_level(u_count_, "u_count");
  const auto level_v = axis_level(v_count_, "v_count");
  const auto level_w = axis_level(w_count_, "w_count");

  const auto min_level = std::min({level_u, level_v, level_w});

  // The refine level can't exceed the shortest dimension.
  const auto level = std::min(0, min_level);

  // Additional breaks accounting for longer axes.
  const auto add_u = level_u - min_level;
  const auto add_v = level_v - min_level;
  const auto add_w = level_w - min_level;

  const auto step_u = int32_t{1} << (level_u - add_u - level);
  const auto step_v = int32_t{1} << (level_v - add_v - level);
  const auto step_w = int32_t{1} << (level_w - add_w - level);
  const auto n_cells = int32_t{1} << (min_level - level);

  auto cells = std::vector<octree_cell_t>{};
  cells.reserve(static_cast<std::size_t>((*u_count_ / step_u) *
                                         (*v_count_ / step_v) *
                                         (*w_count_ / step_w)));
  // Same ordering as flattening meshgrid(v, w, u): w slowest, u fastest.
  for (auto k = int32_t{0}; k < *w_count_; k += step_w) {
    for (auto j = int32_t{0}; j < *v_count_; j += step_v) {
      for (auto i = int32_t{0}; i < *u_count_; i += step_u) {
        cells.push_back(
            octree_cell_t{.i = i, .j = j, .k = k, .n_cells = n_cells});
      }
    }
  }

  spdlog::debug("Base refined octree '{}' into {} cell(s) of size {}", name(),
                cells.size(), n_cells);
  octree_cells_ = std::move(cells);
  invalidate();
}

const std::vector<strata::schema::vector3_t>& octree::centroids() {
  if (centroids_) {
    return *centroids_;
  }

  const auto& cells = octree_cells();
  if (!cells) {
    strata::common::critical("octree_cells must be set");
  }
  if (!u_cell_size_) {
    strata::common::critical("u_cell_size must be set");
  }
  if (!v_cell_size_) {
    strata::common::critical("v_cell_size must be set");
  }
  if (!w_cell_size_) {
    strata::common::critical("w_cell_size must be set");
  }

  const auto angle = rotation_ * std::numbers::pi / 180.0;
  const auto cos_angle = std::cos(angle);
  const auto sin_angle = std::sin(angle);

  auto centers = std::vector<strata::schema::vector3_t>{};
  centers.reserve(cells->size());
  for (const auto& cell : *cells) {
    const auto half = static_cast<double>(cell.n_cells) / 2.0;
    const auto u = (static_cast<double>(cell.i) + half) * *u_cell_size_;
    const auto v = (static_cast<double>(cell.j) + half) * *v_cell_size_;
    const auto w = (static_cast<double>(cell.k) + half) * *w_cell_size_;
    centers.push_back(strata::schema::vector3_t{
        .x = (cos_angle * u) - (sin_angle * v) + origin_.x,
        .y = (sin_angle * u) + (cos_angle * v) + origin_.y,
        .z = w + origin_.z});
  }
  centroids_ = std::move(centers);
  return *centroids_;
}

}  // namespace strata::model
