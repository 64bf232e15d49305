// tests/unit/types/test_union_types.cpp - Unit tests for union construction and algebra
//
#include <gtest/gtest.h>

#include <numeric>
#include <string>
#include <vector>

#include "bsl_gradual/types/standard_types.hpp"
#include "bsl_gradual/types/union_types.hpp"

using namespace bsl_gradual;

namespace
{

double weight_sum(const std::vector<WeightedType> & members)
{
  return std::accumulate(
    members.begin(), members.end(), 0.0,
    [](double acc, const WeightedType & wt) { return acc + wt.weight; });
}

std::vector<WeightedType> members_of(std::vector<std::pair<ConcreteType, double>> entries)
{
  std::vector<WeightedType> out;
  for (auto & [type, weight] : entries) {
    out.push_back(WeightedType{std::move(type), weight});
  }
  return out;
}

}  // namespace

class UnionTypesTest : public ::testing::Test
{
protected:
  UnionTypeManager manager;
};

// ============================================================================
// create_union
// ============================================================================

TEST_F(UnionTypesTest, EmptyInputIsNeverType)
{
  const auto r = manager.create_union({});
  EXPECT_TRUE(r.certainty.is_unknown());
  EXPECT_TRUE(r.result.is_dynamic());
  ASSERT_FALSE(r.metadata.notes.empty());
  EXPECT_NE(r.metadata.notes[0].find("empty union"), std::string::npos);
}

TEST_F(UnionTypesTest, SingleInputIsReturnedUnchanged)
{
  for (const auto & t : {string_type(), platform_type("Массив"), TypeResolution::unknown()}) {
    EXPECT_EQ(manager.create_union({t}), t);
  }
}

TEST_F(UnionTypesTest, EqualInputsMergeIntoOneMember)
{
  const auto r = manager.create_union({boolean_type(), boolean_type()});
  ASSERT_NE(r.concrete(), nullptr);
  EXPECT_EQ(*r.concrete(), ConcreteType(PrimitiveType::Boolean));
  EXPECT_TRUE(r.certainty.is_inferred());
  EXPECT_DOUBLE_EQ(r.certainty.value(), 1.0);
}

TEST_F(UnionTypesTest, NumbersCollapseToInferredNumber)
{
  const auto r = manager.create_union({number_type(), number_type(), number_type()});
  ASSERT_NE(r.concrete(), nullptr);
  EXPECT_TRUE(is_number(r));
  EXPECT_TRUE(r.certainty.is_inferred());
  EXPECT_FALSE(r.certainty.is_known());
}

TEST_F(UnionTypesTest, StringsCollapse)
{
  const auto r = manager.create_union({string_type(), string_type()});
  EXPECT_TRUE(is_string(r));
  EXPECT_EQ(r.union_members(), nullptr);
}

TEST_F(UnionTypesTest, DistinctTypesFormWeightedUnion)
{
  const auto r = manager.create_union({string_type(), number_type()});
  const auto * members = r.union_members();
  ASSERT_NE(members, nullptr);
  ASSERT_EQ(members->size(), 2U);
  EXPECT_DOUBLE_EQ((*members)[0].weight, 0.5);
  EXPECT_DOUBLE_EQ((*members)[1].weight, 0.5);
  EXPECT_TRUE(r.certainty.is_inferred());
  EXPECT_DOUBLE_EQ(r.certainty.value(), 0.9);
}

TEST_F(UnionTypesTest, UnknownInputsLowerConfidence)
{
  const auto r = manager.create_union({string_type(), number_type(), TypeResolution::unknown(),
                                        TypeResolution::unknown()});
  ASSERT_NE(r.union_members(), nullptr);
  EXPECT_DOUBLE_EQ(r.certainty.value(), 0.5);
  EXPECT_NEAR(weight_sum(*r.union_members()), 1.0, 1e-9);
}

TEST_F(UnionTypesTest, NestedUnionMembersKeepTheirShare)
{
  const auto inner = manager.create_union({string_type(), number_type()});
  const auto r = manager.create_union({inner, boolean_type()});
  const auto * members = r.union_members();
  ASSERT_NE(members, nullptr);
  ASSERT_EQ(members->size(), 3U);
  EXPECT_EQ((*members)[0].type, ConcreteType(PrimitiveType::Boolean));
  EXPECT_DOUBLE_EQ((*members)[0].weight, 0.5);
  EXPECT_DOUBLE_EQ(UnionTypeManager::get_type_weight(*members, PrimitiveType::String), 0.25);
}

TEST_F(UnionTypesTest, CardinalityIsBounded)
{
  std::vector<TypeResolution> inputs;
  for (int i = 0; i < 10; ++i) {
    inputs.push_back(platform_type("Тип" + std::to_string(i)));
  }
  const auto r = manager.create_union(inputs);
  const auto * members = r.union_members();
  ASSERT_NE(members, nullptr);
  EXPECT_LE(members->size(), 5U);
  EXPECT_NEAR(weight_sum(*members), 1.0, 1e-9);
  EXPECT_LE(r.certainty.value(), 0.9);
}

TEST_F(UnionTypesTest, LightMembersAreDropped)
{
  std::vector<TypeResolution> inputs(20, string_type());
  inputs.push_back(boolean_type());
  inputs.push_back(date_type());
  const auto r = manager.create_union(inputs);
  // Булево and Дата weigh 1/22 each, below the 0.05 floor.
  ASSERT_NE(r.concrete(), nullptr);
  EXPECT_TRUE(is_string(r));
}

TEST_F(UnionTypesTest, CustomLimits)
{
  const UnionTypeManager narrow(UnionLimits{2, 0.0, 0.6});
  const auto r = narrow.create_union({string_type(), number_type(), boolean_type()});
  const auto * members = r.union_members();
  ASSERT_NE(members, nullptr);
  EXPECT_EQ(members->size(), 2U);
  EXPECT_NEAR(weight_sum(*members), 1.0, 1e-9);
  EXPECT_DOUBLE_EQ(r.certainty.value(), 0.6);
}

TEST_F(UnionTypesTest, FromConcreteTypes)
{
  const auto r = manager.from_concrete_types({PrimitiveType::String, PrimitiveType::Date});
  ASSERT_NE(r.union_members(), nullptr);
  EXPECT_EQ(r.union_members()->size(), 2U);
}

TEST_F(UnionTypesTest, AddTypeToUnion)
{
  const auto base = manager.create_union({string_type(), number_type()});
  const auto r = manager.add_type_to_union(base, boolean_type());
  const auto * members = r.union_members();
  ASSERT_NE(members, nullptr);
  EXPECT_EQ(members->size(), 3U);
  EXPECT_TRUE(UnionTypeManager::contains_type(*members, PrimitiveType::Boolean));

  const auto plain = manager.add_type_to_union(string_type(), date_type());
  ASSERT_NE(plain.union_members(), nullptr);
  EXPECT_EQ(plain.union_members()->size(), 2U);
}

// ============================================================================
// Algebra
// ============================================================================

TEST_F(UnionTypesTest, NormalizeMergesAndSorts)
{
  const auto normalized = UnionTypeManager::normalize_union(members_of({
    {PrimitiveType::String, 0.2},
    {PrimitiveType::Number, 0.3},
    {PrimitiveType::String, 0.5},
  }));
  ASSERT_EQ(normalized.size(), 2U);
  EXPECT_EQ(normalized[0].type, ConcreteType(PrimitiveType::String));
  EXPECT_DOUBLE_EQ(normalized[0].weight, 0.7);
  EXPECT_DOUBLE_EQ(normalized[1].weight, 0.3);
}

TEST_F(UnionTypesTest, IntersectMultipliesWeights)
{
  const auto lhs = members_of({{PrimitiveType::String, 0.5}, {PrimitiveType::Number, 0.5}});
  const auto rhs = members_of({{PrimitiveType::Number, 0.4}, {PrimitiveType::Date, 0.6}});
  const auto common = UnionTypeManager::intersect_unions(lhs, rhs);
  ASSERT_EQ(common.size(), 1U);
  EXPECT_EQ(common[0].type, ConcreteType(PrimitiveType::Number));
  EXPECT_DOUBLE_EQ(common[0].weight, 0.2);
}

TEST_F(UnionTypesTest, MergeHalvesWeights)
{
  const auto lhs = members_of({{PrimitiveType::String, 1.0}});
  const auto rhs = members_of({{PrimitiveType::String, 0.5}, {PrimitiveType::Number, 0.5}});
  const auto merged = UnionTypeManager::merge_unions(lhs, rhs);
  ASSERT_EQ(merged.size(), 2U);
  EXPECT_DOUBLE_EQ(merged[0].weight, 0.75);
  EXPECT_DOUBLE_EQ(merged[1].weight, 0.25);
  EXPECT_NEAR(weight_sum(merged), 1.0, 1e-9);
}

TEST_F(UnionTypesTest, FilterAndQueries)
{
  const auto members = members_of({
    {PrimitiveType::Number, 0.6},
    {PrimitiveType::String, 0.3},
    {SpecialType::Undefined, 0.1},
  });

  const auto primitives = UnionTypeManager::filter_union(
    members, [](const ConcreteType & t) { return std::holds_alternative<PrimitiveType>(t); });
  EXPECT_EQ(primitives.size(), 2U);

  EXPECT_TRUE(UnionTypeManager::contains_type(members, SpecialType::Undefined));
  EXPECT_FALSE(UnionTypeManager::contains_type(members, PrimitiveType::Date));
  EXPECT_DOUBLE_EQ(UnionTypeManager::get_type_weight(members, PrimitiveType::Date), 0.0);

  const ConcreteType * top = UnionTypeManager::get_most_likely_type(members);
  ASSERT_NE(top, nullptr);
  EXPECT_EQ(*top, ConcreteType(PrimitiveType::Number));
  EXPECT_EQ(UnionTypeManager::get_most_likely_type({}), nullptr);
  EXPECT_EQ(UnionTypeManager::get_all_types(members).size(), 3U);
}

TEST_F(UnionTypesTest, CompatibilityWithUnion)
{
  const auto members = members_of({{PrimitiveType::Number, 0.5}, {PrimitiveType::String, 0.5}});
  EXPECT_TRUE(UnionTypeManager::is_compatible_with_union(number_type(), members));
  EXPECT_FALSE(UnionTypeManager::is_compatible_with_union(date_type(), members));
  EXPECT_TRUE(UnionTypeManager::is_compatible_with_union(TypeResolution::unknown(), members));
}
