// tests/unit/types/test_type_resolution.cpp - Unit tests for the gradual type model
//
#include <gtest/gtest.h>

#include <memory>

#include "bsl_gradual/types/standard_types.hpp"
#include "bsl_gradual/types/type_resolution.hpp"

using namespace bsl_gradual;

// ============================================================================
// Constructors
// ============================================================================

TEST(TypeResolutionTest, KnownIsStaticConcrete)
{
  const auto t = TypeResolution::known(PrimitiveType::String);
  EXPECT_TRUE(t.certainty.is_known());
  EXPECT_TRUE(t.is_resolved());
  EXPECT_FALSE(t.is_dynamic());
  EXPECT_EQ(t.source, ResolutionSource::Static);
  ASSERT_NE(t.concrete(), nullptr);
  EXPECT_EQ(*t.concrete(), ConcreteType(PrimitiveType::String));
}

TEST(TypeResolutionTest, UnknownIsDynamic)
{
  const auto t = TypeResolution::unknown();
  EXPECT_TRUE(t.certainty.is_unknown());
  EXPECT_TRUE(t.is_dynamic());
  EXPECT_TRUE(t.result.is_dynamic());
  EXPECT_EQ(t.concrete(), nullptr);
  EXPECT_EQ(t.source, ResolutionSource::Static);
}

TEST(TypeResolutionTest, InferredConfidenceIsClamped)
{
  EXPECT_DOUBLE_EQ(Certainty::inferred(1.7).value(), 1.0);
  EXPECT_DOUBLE_EQ(Certainty::inferred(-0.2).value(), 0.0);
  EXPECT_DOUBLE_EQ(Certainty::inferred(0.4).value(), 0.4);
  EXPECT_DOUBLE_EQ(Certainty::known().value(), 1.0);
  EXPECT_DOUBLE_EQ(Certainty::unknown().value(), 0.0);

  const auto t = TypeResolution::inferred(0.6, ConcreteType(PrimitiveType::Number));
  EXPECT_TRUE(t.certainty.is_inferred());
  EXPECT_EQ(t.source, ResolutionSource::Inferred);
  EXPECT_FALSE(t.is_resolved());
}

TEST(TypeResolutionTest, WithNoteReturnsCopy)
{
  const auto original = number_type();
  const auto noted = original.with_note("from literal");

  EXPECT_TRUE(original.metadata.notes.empty());
  ASSERT_EQ(noted.metadata.notes.size(), 1U);
  EXPECT_EQ(noted.metadata.notes[0], "from literal");
  EXPECT_NE(original, noted);
}

TEST(TypeResolutionTest, EqualityIsStructural)
{
  EXPECT_EQ(platform_type("Массив"), platform_type("Массив"));
  EXPECT_NE(platform_type("Массив"), platform_type("Структура"));
  EXPECT_NE(number_type(), string_type());
  EXPECT_EQ(Certainty::inferred(0.5), Certainty::inferred(0.5));
  EXPECT_NE(Certainty::inferred(0.5), Certainty::inferred(0.6));
}

TEST(TypeResolutionTest, GetName)
{
  EXPECT_EQ(string_type().get_name(), "Строка");
  EXPECT_EQ(platform_type("Массив").get_name(), "Массив");
  EXPECT_FALSE(special_type(SpecialType::Undefined).get_name().has_value());
  EXPECT_FALSE(TypeResolution::unknown().get_name().has_value());

  ConfigurationType catalog;
  catalog.kind = MetadataKind::Catalog;
  catalog.name = "Товары";
  EXPECT_EQ(TypeResolution::known(catalog).get_name(), "Справочник.Товары");
}

// ============================================================================
// Display names
// ============================================================================

TEST(TypeResolutionTest, DisplayName)
{
  EXPECT_EQ(display_name(number_type()), "Число");
  EXPECT_EQ(display_name(boolean_type()), "Булево");
  EXPECT_EQ(display_name(TypeResolution::unknown()), "Произвольный");
  EXPECT_EQ(display_name(special_type(SpecialType::Undefined)), "Неопределено");

  UnionType u;
  u.members.push_back(WeightedType{PrimitiveType::String, 0.5});
  u.members.push_back(WeightedType{PrimitiveType::Number, 0.5});
  EXPECT_EQ(display_name(TypeResolution::inferred(0.9, u)), "Строка | Число");
}

TEST(TypeResolutionTest, DisplayNameOfContextualUsesBase)
{
  ContextualType ctx;
  ctx.base_type = std::make_shared<const ResolutionResult>(ConcreteType(PrimitiveType::Date));
  ctx.context = ExecutionContext::Client;
  EXPECT_EQ(display_name(TypeResolution::inferred(0.9, ctx)), "Дата");
}

// ============================================================================
// Standard types
// ============================================================================

TEST(StandardTypesTest, TypeFromNameAcceptsBothSpellings)
{
  EXPECT_EQ(type_from_name("Строка"), string_type());
  EXPECT_EQ(type_from_name("String"), string_type());
  EXPECT_EQ(type_from_name("Number"), number_type());
  EXPECT_EQ(type_from_name("Дата"), date_type());
  EXPECT_EQ(type_from_name("Array"), platform_type("Массив"));
  EXPECT_EQ(type_from_name("Map"), platform_type("Соответствие"));
  EXPECT_EQ(type_from_name("ValueTable"), platform_type("ТаблицаЗначений"));
  EXPECT_FALSE(type_from_name("НетТакогоТипа").has_value());
}

TEST(StandardTypesTest, Predicates)
{
  EXPECT_TRUE(is_number(number_type()));
  EXPECT_FALSE(is_number(string_type()));
  EXPECT_TRUE(is_string(string_type()));
  EXPECT_TRUE(is_boolean(boolean_type()));
  EXPECT_TRUE(is_date(date_type()));
  EXPECT_TRUE(is_undefined(special_type(SpecialType::Undefined)));
  EXPECT_TRUE(is_null(special_type(SpecialType::Null)));
  EXPECT_TRUE(is_array(platform_type("Массив")));
  EXPECT_TRUE(is_array(platform_type("Array")));
  EXPECT_TRUE(is_structure(platform_type("Структура")));
  EXPECT_TRUE(is_map(platform_type("Соответствие")));
  EXPECT_FALSE(is_array(TypeResolution::unknown()));
}

TEST(StandardTypesTest, PredicatesIgnoreCertainty)
{
  const auto inferred = TypeResolution::inferred(0.3, ConcreteType(PrimitiveType::Number));
  EXPECT_TRUE(is_number(inferred));
}
