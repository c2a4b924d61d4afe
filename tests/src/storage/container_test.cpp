#include <gtest/gtest.h>
#include <strata/model/group.hpp>
#include <strata/model/octree.hpp>
#include <strata/model/points.hpp>
#include <strata/testing/container_fixture.hpp>

#include <algorithm>

namespace {

std::size_t type_count(const strata::workspace::workspace& workspace) {
  return workspace.types().size();
}

}  // namespace

TEST(container, empty_store_loads_a_fresh_workspace) {
  auto fixture = strata::testing::container_fixture{"strata_container_empty"};
  auto workspace = fixture.reload();
  ASSERT_NE(workspace, nullptr);
  EXPECT_EQ(workspace->groups().size(), 1u);
  EXPECT_TRUE(workspace->objects().empty());
  EXPECT_TRUE(workspace->data().empty());
}

TEST(container, finalize_and_reload_rebuild_the_tree) {
  auto fixture = strata::testing::container_fixture{"strata_container_tree"};
  auto root_uid = strata::schema::uid_t{};
  auto curve_uid = strata::schema::uid_t{};
  auto values_uid = strata::schema::uid_t{};
  {
    auto workspace = strata::workspace::workspace::create(std::nullopt,
                                                          "Project");
    root_uid = workspace->root().uid();
    auto survey =
        workspace->create_group<strata::model::container_group>("Survey");
    ASSERT_TRUE(survey.ok());
    auto curve = workspace->create_object<strata::model::curve>(
        "Line", survey.value->uid());
    ASSERT_TRUE(curve.ok());
    curve.value->set_vertices(
        {{0.0, 0.0, 0.0}, {1.0, 0.5, 0.0}, {2.0, 0.0, 1.0}});
    curve.value->set_cells({strata::model::segment_t{0, 2}});
    curve_uid = curve.value->uid();

    auto values = workspace->create_data(
        curve_uid, "Depth", strata::model::association_t::vertex,
        std::vector<double>{1.25, -2.5, 3.0}, std::nullopt, "Observed");
    ASSERT_TRUE(values.ok());
    values_uid = values.value->uid();
    auto labels = workspace->create_data(
        curve_uid, "Label", strata::model::association_t::object,
        std::vector<std::string>{"first line"});
    ASSERT_TRUE(labels.ok());

    fixture.container().finalize(*workspace);
    EXPECT_FALSE(curve.value->modified());
    EXPECT_TRUE(curve.value->existing_in_container());
  }

  auto loaded = fixture.reload();
  ASSERT_NE(loaded, nullptr);
  EXPECT_EQ(loaded->root().uid(), root_uid);
  EXPECT_EQ(loaded->root().name(), "Project");
  EXPECT_EQ(loaded->groups().size(), 2u);
  EXPECT_EQ(loaded->objects().size(), 1u);
  EXPECT_EQ(loaded->data().size(), 2u);
  EXPECT_EQ(type_count(*loaded), 5u);

  auto* object = loaded->find_object(curve_uid);
  ASSERT_NE(object, nullptr);
  EXPECT_EQ(object->name(), "Line");
  EXPECT_TRUE(object->existing_in_container());
  EXPECT_FALSE(object->modified());
  auto* line = object->as_curve();
  ASSERT_NE(line, nullptr);
  ASSERT_EQ(line->n_vertices(), 3u);
  EXPECT_EQ(line->vertices()[1], (strata::schema::vector3_t{1.0, 0.5, 0.0}));
  ASSERT_TRUE(line->has_explicit_cells());
  EXPECT_EQ(line->cells().front(), (strata::model::segment_t{0, 2}));

  auto* survey = loaded->find_group(*object->parent());
  ASSERT_NE(survey, nullptr);
  EXPECT_EQ(survey->name(), "Survey");
  EXPECT_EQ(survey->parent(), root_uid);

  ASSERT_EQ(object->children().size(), 2u);
  EXPECT_EQ(object->children()[0], values_uid);
  auto* depth = loaded->find_data(values_uid);
  ASSERT_NE(depth, nullptr);
  EXPECT_EQ(depth->association(), strata::model::association_t::vertex);
  EXPECT_EQ(std::get<std::vector<double>>(depth->values()),
            (std::vector<double>{1.25, -2.5, 3.0}));
  auto* depth_type = loaded->find_type(depth->type_uid(),
                                       strata::model::entity_kind_t::data);
  ASSERT_NE(depth_type, nullptr);
  EXPECT_EQ(depth_type->primitive_type(),
            strata::model::primitive_type_t::floating);

  auto* observed = object->find_property_group("Observed");
  ASSERT_NE(observed, nullptr);
  ASSERT_EQ(observed->properties().size(), 1u);
  EXPECT_EQ(observed->properties()[0], values_uid);
}

TEST(container, octree_cells_are_fetched_on_first_access) {
  auto fixture = strata::testing::container_fixture{"strata_container_cells"};
  auto mesh_uid = strata::schema::uid_t{};
  {
    auto workspace = strata::workspace::workspace::create();
    auto mesh = workspace->create_object<strata::model::octree>("Mesh");
    ASSERT_TRUE(mesh.ok());
    mesh.value->set_origin({10.0, 20.0, 30.0});
    mesh.value->set_rotation(30.0);
    mesh.value->set_u_count(8);
    mesh.value->set_v_count(4);
    mesh.value->set_w_count(4);
    mesh.value->set_u_cell_size(2.0);
    mesh.value->set_v_cell_size(2.0);
    mesh.value->set_w_cell_size(2.0);
    mesh.value->base_refine();
    mesh_uid = mesh.value->uid();
    fixture.container().save_entity(*workspace, mesh_uid);
    EXPECT_FALSE(mesh.value->modified());
  }

  auto loaded = fixture.reload();
  ASSERT_NE(loaded, nullptr);
  auto* object = loaded->find_object(mesh_uid);
  ASSERT_NE(object, nullptr);
  auto* mesh = object->as_octree();
  ASSERT_NE(mesh, nullptr);
  EXPECT_EQ(mesh->origin(), (strata::schema::vector3_t{10.0, 20.0, 30.0}));
  EXPECT_DOUBLE_EQ(mesh->rotation(), 30.0);
  EXPECT_EQ(*mesh->shape(), (std::array<int32_t, 3>{8, 4, 4}));
  EXPECT_FALSE(mesh->has_octree_cells());

  const auto& cells = mesh->octree_cells();
  ASSERT_TRUE(cells.has_value());
  ASSERT_EQ(cells->size(), 2u);
  EXPECT_EQ((*cells)[1],
            (strata::model::octree_cell_t{.i = 4, .j = 0, .k = 0, .n_cells = 4}));
  EXPECT_EQ(mesh->centroids().size(), 2u);
}

TEST(container, removals_are_persisted_by_finalize) {
  auto fixture = strata::testing::container_fixture{"strata_container_remove"};
  {
    auto workspace = strata::workspace::workspace::create();
    auto group =
        workspace->create_group<strata::model::container_group>("Survey");
    ASSERT_TRUE(group.ok());
    auto& curve_1 = strata::testing::make_curve(*workspace, "Curve1", 12,
                                                group.value->uid());
    auto& values = strata::testing::make_floats(*workspace, curve_1.uid(),
                                                "DataValues");
    auto& curve_2 = strata::testing::make_curve(*workspace, "Curve2", 12,
                                                group.value->uid());
    strata::testing::make_floats(*workspace, curve_2.uid(), "Period1",
                                 values.type_uid(), "myGroup");
    for (auto period : {"Period2", "Period3", "Period4"}) {
      strata::testing::make_floats(*workspace, curve_2.uid(), period,
                                   std::nullopt, "myGroup");
    }
    fixture.container().finalize(*workspace);

    workspace->remove_entity(curve_2.children()[0]);
    workspace->remove_entity(curve_2.children()[0]);
    workspace->remove_entity(curve_2.uid());
    fixture.container().finalize(*workspace);
    EXPECT_TRUE(workspace->pending_removals().empty());
  }

  auto loaded = fixture.reload();
  ASSERT_NE(loaded, nullptr);
  EXPECT_EQ(loaded->groups().size(), 2u);
  EXPECT_EQ(loaded->objects().size(), 1u);
  EXPECT_EQ(loaded->data().size(), 1u);
  EXPECT_EQ(type_count(*loaded), 4u);
  EXPECT_EQ(loaded->get_entity("Curve2").size(), 0u);
  auto curves = loaded->get_entity("Curve1");
  ASSERT_EQ(curves.size(), 1u);
  auto* survey = loaded->find_group(*curves[0]->parent());
  ASSERT_NE(survey, nullptr);
  EXPECT_EQ(survey->name(), "Survey");
  EXPECT_EQ(survey->children().size(), 1u);
}

TEST(container, removal_after_reload_is_persisted) {
  auto fixture = strata::testing::container_fixture{"strata_container_reload"};
  auto kept_uid = strata::schema::uid_t{};
  auto dropped_uid = strata::schema::uid_t{};
  {
    auto workspace = strata::workspace::workspace::create();
    kept_uid = strata::testing::make_curve(*workspace, "Kept").uid();
    auto& dropped = strata::testing::make_curve(*workspace, "Dropped");
    dropped_uid = dropped.uid();
    strata::testing::make_floats(*workspace, dropped_uid, "Z");
    fixture.container().finalize(*workspace);
  }
  {
    auto workspace = fixture.reload();
    ASSERT_NE(workspace, nullptr);
    workspace->remove_entity(dropped_uid);
    fixture.container().finalize(*workspace);
  }

  auto loaded = fixture.reload();
  ASSERT_NE(loaded, nullptr);
  EXPECT_NE(loaded->find_object(kept_uid), nullptr);
  EXPECT_EQ(loaded->find_object(dropped_uid), nullptr);
  EXPECT_TRUE(loaded->data().empty());
  EXPECT_EQ(loaded->root().children().size(), 1u);
}

TEST(container, renames_after_reload_are_written) {
  auto fixture = strata::testing::container_fixture{"strata_container_rename"};
  auto uid = strata::schema::uid_t{};
  {
    auto workspace = strata::workspace::workspace::create();
    uid = strata::testing::make_curve(*workspace, "Before").uid();
    fixture.container().finalize(*workspace);
  }
  {
    auto workspace = fixture.reload();
    ASSERT_NE(workspace, nullptr);
    workspace->find_entity(uid)->set_name("After");
    fixture.container().finalize(*workspace);
  }

  auto loaded = fixture.reload();
  ASSERT_NE(loaded, nullptr);
  EXPECT_EQ(loaded->find_entity(uid)->name(), "After");
}
