#include <strata/common/critical.hpp>
#include <strata/model/points.hpp>

#include <utility>

namespace strata::model {

points::points(strata::workspace::workspace& workspace,
               const strata::schema::uid_t& uid,
               const strata::schema::uid_t& type_uid,
               std::string name)
    : object_base{workspace, uid, type_uid, std::move(name)} {}

const entity_class_t& points::entity_class() {
  static const auto kClass = entity_class_t{
      .kind = entity_kind_t::object,
      .type_uid = strata::schema::make_uid(
          std::string_view{"202c5db1-a56d-4004-9cad-baafd8899406"}),
      .class_id = std::nullopt,
      .name = "Points",
      .description = "Points"};
  return kClass;
}

void points::set_vertices(std::vector<strata::schema::vector3_t> vertices) {
  vertices_ = std::move(vertices);
  set_modified(true);
}

curve::curve(strata::workspace::workspace& workspace,
             const strata::schema::uid_t& uid,
             const strata::schema::uid_t& type_uid,
             std::string name)
    : points{workspace, uid, type_uid, std::move(name)} {}

const entity_class_t& curve::entity_class() {
  static const auto kClass = entity_class_t{
      .kind = entity_kind_t::object,
      .type_uid = strata::schema::make_uid(
          std::string_view{"6a057fdc-b355-11e3-95be-fd84a7ffcb88"}),
      .class_id = std::nullopt,
      .name = "Curve",
      .description = "Curve"};
  return kClass;
}

std::vector<segment_t> curve::cells() const {
  if (!cells_.empty()) {
    return cells_;
  }
  auto segments = std::vector<segment_t>{};
  if (n_vertices() < 2) {
    return segments;
  }
  segments.reserve(n_vertices() - 1);
  for (auto i = uint32_t{0}; i + 1 < n_vertices(); ++i) {
    segments.push_back(segment_t{i, i + 1});
  }
  return segments;
}

void curve::set_cells(std::vector<segment_t> cells) {
  for (const auto& segment : cells) {
    if (segment[0] >= n_vertices() || segment[1] >= n_vertices()) {
      strata::common::critical("curve segment references a missing vertex");
    }
  }
  cells_ = std::move(cells);
  set_modified(true);
}

}  // namespace strata::model
