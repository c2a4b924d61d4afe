#include <gtest/gtest.h>
#include <strata/model/group.hpp>
#include <strata/model/points.hpp>
#include <strata/testing/common.hpp>
#include <strata/workspace/workspace.hpp>

#include <memory>
#include <stdexcept>

TEST(workspace, starts_with_a_root_group) {
  auto workspace = strata::workspace::workspace::create();
  EXPECT_EQ(workspace->groups().size(), 1u);
  EXPECT_TRUE(workspace->objects().empty());
  EXPECT_TRUE(workspace->data().empty());
  EXPECT_EQ(workspace->types().size(), 1u);

  auto& root = workspace->root();
  EXPECT_TRUE(root.is_root());
  EXPECT_EQ(root.name(), "Workspace");
  EXPECT_FALSE(root.parent().has_value());
  EXPECT_EQ(workspace->find_group(root.uid()), &root);
}

TEST(workspace, create_keeps_a_given_root_uid) {
  auto uid = strata::schema::make_uid();
  auto workspace = strata::workspace::workspace::create(uid, "Project");
  EXPECT_EQ(workspace->root().uid(), uid);
  EXPECT_EQ(workspace->root().name(), "Project");
}

TEST(workspace, entities_default_to_the_root_parent) {
  auto workspace = strata::workspace::workspace::create();
  auto group =
      workspace->create_group<strata::model::container_group>("Survey");
  ASSERT_TRUE(group.ok());
  EXPECT_EQ(group.value->parent(), workspace->root().uid());
  EXPECT_TRUE(workspace->root().has_child(group.value->uid()));

  auto points =
      workspace->create_object<strata::model::points>("Collars",
                                                      group.value->uid());
  ASSERT_TRUE(points.ok());
  EXPECT_EQ(points.value->parent(), group.value->uid());
  EXPECT_EQ(group.value->children().size(), 1u);
  EXPECT_EQ(workspace->find_object(points.value->uid()), points.value);
  EXPECT_EQ(workspace->find_entity(points.value->uid()), points.value);
}

TEST(workspace, parents_must_belong_to_the_workspace) {
  auto first = strata::workspace::workspace::create();
  auto second = strata::workspace::workspace::create();
  auto group = first->create_group<strata::model::container_group>("Survey");
  ASSERT_TRUE(group.ok());

  auto misplaced = second->create_object<strata::model::points>(
      "Collars", group.value->uid());
  EXPECT_FALSE(misplaced.ok());
  EXPECT_EQ(misplaced.code, strata::common::error_code::missing_parent);
  EXPECT_TRUE(second->objects().empty());
}

TEST(workspace, parents_must_be_of_the_right_kind) {
  auto workspace = strata::workspace::workspace::create();
  auto& curve = strata::testing::make_curve(*workspace, "Line");

  auto nested = workspace->create_group<strata::model::container_group>(
      "Nested", curve.uid());
  EXPECT_FALSE(nested.ok());
  EXPECT_EQ(nested.code, strata::common::error_code::invalid_parent_kind);

  auto on_group = workspace->create_data(
      workspace->root().uid(), "Z", strata::model::association_t::object,
      std::vector<int32_t>{1});
  EXPECT_FALSE(on_group.ok());
  EXPECT_EQ(on_group.code, strata::common::error_code::invalid_parent_kind);
  EXPECT_TRUE(workspace->data().empty());
}

TEST(workspace, custom_groups_need_a_registered_type) {
  auto workspace = strata::workspace::workspace::create();
  auto unknown =
      workspace->create_custom_group(strata::schema::make_uid(), "Drillholes");
  EXPECT_EQ(unknown.code, strata::common::error_code::unknown_type);

  auto nil = workspace->create_custom_group(strata::schema::make_nil_uid(),
                                            "Drillholes");
  EXPECT_EQ(nil.code, strata::common::error_code::invalid_type);

  auto& type = strata::model::entity_type::create_custom(
      *workspace, strata::model::entity_kind_t::group, "Drillholes");
  auto created = workspace->create_custom_group(type.uid(), "Drillholes");
  ASSERT_TRUE(created.ok());
  EXPECT_EQ(created.value->type_uid(), type.uid());
  EXPECT_EQ(workspace->type_usage(type.uid()), 1u);
}

TEST(workspace, create_data_with_an_unknown_type_fails) {
  auto workspace = strata::workspace::workspace::create();
  auto& curve = strata::testing::make_curve(*workspace, "Line");
  auto created = workspace->create_data(
      curve.uid(), "Z", strata::model::association_t::vertex,
      std::vector<double>{1.0}, strata::schema::make_uid());
  EXPECT_EQ(created.code, strata::common::error_code::unknown_type);
  EXPECT_TRUE(curve.children().empty());
}

TEST(workspace, create_data_records_the_primitive_type) {
  auto workspace = strata::workspace::workspace::create();
  auto& curve = strata::testing::make_curve(*workspace, "Line");
  auto created = workspace->create_data(
      curve.uid(), "Lithology", strata::model::association_t::vertex,
      std::vector<std::string>{"granite", "schist", "granite"});
  ASSERT_TRUE(created.ok());
  auto* type = workspace->find_type(created.value->type_uid(),
                                    strata::model::entity_kind_t::data);
  ASSERT_NE(type, nullptr);
  EXPECT_EQ(type->primitive_type(), strata::model::primitive_type_t::text);
  EXPECT_EQ(created.value->size(), 3u);
}

TEST(workspace, get_entity_matches_names) {
  auto workspace = strata::workspace::workspace::create();
  strata::testing::make_curve(*workspace, "Line");
  strata::testing::make_curve(*workspace, "Line");
  strata::testing::make_curve(*workspace, "Other");
  EXPECT_EQ(workspace->get_entity("Line").size(), 2u);
  EXPECT_TRUE(workspace->get_entity("Missing").empty());
  EXPECT_EQ(workspace->all_objects().size(), 3u);
}

TEST(workspace, active_fails_without_an_active_workspace) {
  auto active = strata::workspace::workspace::active();
  EXPECT_FALSE(active.ok());
  EXPECT_EQ(active.code, strata::common::error_code::no_active_workspace);
}

TEST(workspace, last_activation_wins) {
  auto first = strata::workspace::workspace::create();
  auto second = strata::workspace::workspace::create();
  first->activate();
  second->activate();
  EXPECT_EQ(strata::workspace::workspace::active().value, second);

  first->deactivate();
  EXPECT_EQ(strata::workspace::workspace::active().value, second);
  second->deactivate();
  EXPECT_FALSE(strata::workspace::workspace::active().ok());
}

TEST(workspace, active_slot_does_not_extend_lifetime) {
  {
    auto workspace = strata::workspace::workspace::create();
    workspace->activate();
  }
  EXPECT_FALSE(strata::workspace::workspace::active().ok());
}

TEST(workspace, scoped_activation_restores_the_previous_workspace) {
  auto outer = strata::workspace::workspace::create();
  auto inner = strata::workspace::workspace::create();
  {
    auto outer_scope = strata::workspace::active_workspace{outer};
    {
      auto inner_scope = strata::workspace::active_workspace{inner};
      EXPECT_EQ(strata::workspace::workspace::active().value, inner);
    }
    EXPECT_EQ(strata::workspace::workspace::active().value, outer);
  }
  EXPECT_FALSE(strata::workspace::workspace::active().ok());
}

TEST(workspace, scoped_activation_restores_during_unwinding) {
  auto outer = strata::workspace::workspace::create();
  auto outer_scope = strata::workspace::active_workspace{outer};
  try {
    auto inner_scope = strata::workspace::active_workspace{
        strata::workspace::workspace::create()};
    throw std::runtime_error{"abort"};
  } catch (const std::runtime_error&) {
  }
  EXPECT_EQ(strata::workspace::workspace::active().value, outer);
}

TEST(workspace, adopt_rejects_a_uid_used_by_its_parent) {
  auto workspace = strata::workspace::workspace::create();
  auto group =
      workspace->create_group<strata::model::container_group>("Survey");
  ASSERT_TRUE(group.ok());
  const auto group_uid = group.value->uid();

  auto adopted = workspace->adopt(
      std::make_unique<strata::model::points>(
          *workspace, group_uid,
          strata::model::points::entity_class().type_uid, "Collars"),
      group_uid);
  EXPECT_FALSE(adopted.ok());
  EXPECT_EQ(adopted.code, strata::common::error_code::invalid_record);
  EXPECT_EQ(workspace->find_group(group_uid), group.value);
  EXPECT_EQ(group.value->name(), "Survey");
  EXPECT_TRUE(group.value->children().empty());
  EXPECT_TRUE(workspace->objects().empty());
  EXPECT_TRUE(workspace->pending_removals().empty());
}

TEST(workspace, adopt_leaves_an_existing_entity_and_its_subtree_alone) {
  auto workspace = strata::workspace::workspace::create();
  auto group =
      workspace->create_group<strata::model::container_group>("Survey");
  ASSERT_TRUE(group.ok());
  auto points = workspace->create_object<strata::model::points>(
      "Collars", group.value->uid());
  ASSERT_TRUE(points.ok());
  const auto group_uid = group.value->uid();
  const auto types_before = workspace->types().size();

  auto adopted = workspace->adopt(
      std::make_unique<strata::model::container_group>(
          *workspace, group_uid,
          strata::model::container_group::entity_class().type_uid,
          "Duplicate"),
      workspace->root().uid());
  EXPECT_FALSE(adopted.ok());
  EXPECT_EQ(adopted.code, strata::common::error_code::invalid_record);
  EXPECT_EQ(workspace->groups().size(), 2u);
  EXPECT_EQ(workspace->objects().size(), 1u);
  EXPECT_EQ(workspace->types().size(), types_before);
  EXPECT_EQ(workspace->find_group(group_uid)->name(), "Survey");
  EXPECT_TRUE(group.value->has_child(points.value->uid()));
  EXPECT_EQ(workspace->root().children().size(), 1u);
  EXPECT_TRUE(workspace->pending_removals().empty());
}

TEST(workspace, capability_checks_follow_the_entity_class) {
  auto workspace = strata::workspace::workspace::create();
  auto collars = workspace->create_object<strata::model::points>("Collars");
  ASSERT_TRUE(collars.ok());
  auto& line = strata::testing::make_curve(*workspace, "Line");
  auto& depth = strata::testing::make_floats(*workspace, line.uid(), "Depth");

  EXPECT_EQ(collars.value->as_points(), collars.value);
  EXPECT_EQ(collars.value->as_curve(), nullptr);
  EXPECT_EQ(line.as_curve(), &line);
  EXPECT_EQ(line.as_points(), &line);
  EXPECT_EQ(line.as_octree(), nullptr);
  EXPECT_EQ(depth.as_data(), &depth);
  EXPECT_EQ(depth.as_object(), nullptr);
  EXPECT_EQ(workspace->root().as_points(), nullptr);
  EXPECT_EQ(workspace->root().as_data(), nullptr);
}
