#include <gtest/gtest.h>
#include <strata/model/property_group.hpp>
#include <strata/testing/common.hpp>

TEST(property_group, add_keeps_insertion_order_without_duplicates) {
  auto group = strata::model::property_group{strata::schema::make_uid(),
                                             "Observed"};
  auto first = strata::schema::make_uid();
  auto second = strata::schema::make_uid();

  EXPECT_TRUE(group.add(first));
  EXPECT_TRUE(group.add(second));
  EXPECT_FALSE(group.add(first));
  ASSERT_EQ(group.properties().size(), 2u);
  EXPECT_EQ(group.properties()[0], first);
  EXPECT_EQ(group.properties()[1], second);

  EXPECT_TRUE(group.remove(first));
  EXPECT_FALSE(group.remove(first));
  EXPECT_FALSE(group.contains(first));
  EXPECT_TRUE(group.contains(second));
}

TEST(property_group, objects_create_groups_on_demand) {
  auto workspace = strata::workspace::workspace::create();
  auto& curve = strata::testing::make_curve(*workspace, "Line");

  EXPECT_EQ(curve.find_property_group("myGroup"), nullptr);
  auto& created = curve.find_or_create_property_group("myGroup");
  auto& found = curve.find_or_create_property_group("myGroup");
  EXPECT_EQ(&created, &found);
  EXPECT_EQ(curve.property_groups().size(), 1u);
  EXPECT_EQ(curve.find_property_group("myGroup"), &created);
}

TEST(property_group, only_children_can_be_listed) {
  auto workspace = strata::workspace::workspace::create();
  auto& owner = strata::testing::make_curve(*workspace, "Owner");
  auto& other = strata::testing::make_curve(*workspace, "Other");
  auto& foreign = strata::testing::make_floats(*workspace, other.uid(), "Z");

  auto listed = owner.add_to_property_group(foreign.uid(), "myGroup");
  EXPECT_FALSE(listed.ok());
  EXPECT_EQ(listed.code, strata::common::error_code::not_a_child);

  auto& own = strata::testing::make_floats(*workspace, owner.uid(), "Z");
  listed = owner.add_to_property_group(own.uid(), "myGroup");
  ASSERT_TRUE(listed.ok());
  EXPECT_TRUE(listed.value->contains(own.uid()));
}

TEST(property_group, create_data_lists_the_channel) {
  auto workspace = strata::workspace::workspace::create();
  auto& curve = strata::testing::make_curve(*workspace, "Line");
  auto& first = strata::testing::make_floats(*workspace, curve.uid(),
                                             "Period1", std::nullopt,
                                             "myGroup");
  auto& second = strata::testing::make_floats(*workspace, curve.uid(),
                                              "Period2", std::nullopt,
                                              "myGroup");

  auto* group = curve.find_property_group("myGroup");
  ASSERT_NE(group, nullptr);
  ASSERT_EQ(group->properties().size(), 2u);
  EXPECT_EQ(group->properties()[0], first.uid());
  EXPECT_EQ(group->properties()[1], second.uid());
  EXPECT_EQ(group->association(), strata::model::association_t::vertex);
}

TEST(property_group, removing_data_drops_it_from_every_group) {
  auto workspace = strata::workspace::workspace::create();
  auto& curve = strata::testing::make_curve(*workspace, "Line");
  auto& values = strata::testing::make_floats(*workspace, curve.uid(), "Z",
                                              std::nullopt, "Observed");
  ASSERT_TRUE(curve.add_to_property_group(values.uid(), "Uncertainties").ok());
  const auto uid = values.uid();

  workspace->remove_entity(uid);

  EXPECT_FALSE(curve.find_property_group("Observed")->contains(uid));
  EXPECT_FALSE(curve.find_property_group("Uncertainties")->contains(uid));
  EXPECT_EQ(curve.remove_from_property_groups(uid), 0u);
}
