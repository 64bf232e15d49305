// tests/unit/analysis/test_expression_typer.cpp - Unit tests for expression type inference
//
#include <gtest/gtest.h>

#include "bsl_gradual/analysis/expression_typer.hpp"
#include "bsl_gradual/test_support/ast_builder.hpp"
#include "bsl_gradual/types/standard_types.hpp"

using namespace bsl_gradual;
using test_support::AstBuilder;

class ExpressionTyperTest : public ::testing::Test
{
protected:
  [[nodiscard]] TypeResolution infer(const Expr * expr) const
  {
    const ExpressionTyper typer(variables, unions, [](std::string_view name) {
      std::optional<TypeResolution> result;
      if (name == "ПолучитьИмя") result = string_type();
      return result;
    });
    return typer.infer(expr);
  }

  AstBuilder b;
  VariableTypes variables;
  UnionTypeManager unions;
};

TEST_F(ExpressionTyperTest, Literals)
{
  EXPECT_EQ(infer(b.num(42)), number_type());
  EXPECT_EQ(infer(b.str("текст")), string_type());
  EXPECT_EQ(infer(b.boolean(true)), boolean_type());
  EXPECT_EQ(infer(b.date("20240101")), date_type());
  EXPECT_TRUE(is_undefined(infer(b.undefined())));
  EXPECT_TRUE(is_null(infer(b.null())));
  EXPECT_TRUE(is_array(infer(b.array({b.num(1), b.num(2)}))));
  EXPECT_TRUE(is_structure(infer(b.structure({{"Ключ", b.num(1)}}))));
}

TEST_F(ExpressionTyperTest, IdentifiersReadVariableTypes)
{
  variables["x"] = date_type();
  EXPECT_EQ(infer(b.id("x")), date_type());
  EXPECT_TRUE(infer(b.id("y")).certainty.is_unknown());
}

TEST_F(ExpressionTyperTest, BinaryOperators)
{
  EXPECT_EQ(infer(b.binary(b.num(1), BinaryOp::Lt, b.num(2))), boolean_type());
  EXPECT_EQ(infer(b.binary(b.id("a"), BinaryOp::And, b.id("b"))), boolean_type());
  EXPECT_EQ(infer(b.binary(b.str("a"), BinaryOp::Add, b.num(1))), string_type());
  EXPECT_EQ(infer(b.binary(b.num(1), BinaryOp::Mul, b.id("u"))), number_type());
  EXPECT_EQ(infer(b.binary(b.id("u"), BinaryOp::Mod, b.id("v"))), number_type());
  EXPECT_TRUE(infer(b.binary(b.id("u"), BinaryOp::Add, b.id("v"))).certainty.is_unknown());
}

TEST_F(ExpressionTyperTest, DateArithmetic)
{
  variables["d"] = date_type();
  EXPECT_EQ(infer(b.binary(b.id("d"), BinaryOp::Add, b.num(86400))), date_type());
  EXPECT_EQ(infer(b.binary(b.id("d"), BinaryOp::Sub, b.id("d"))), number_type());
}

TEST_F(ExpressionTyperTest, UnaryOperators)
{
  EXPECT_EQ(infer(b.unary(UnaryOp::Not, b.id("x"))), boolean_type());
  EXPECT_EQ(infer(b.unary(UnaryOp::Neg, b.id("x"))), number_type());
}

TEST_F(ExpressionTyperTest, CallsUseBuiltinsThenResolver)
{
  EXPECT_EQ(infer(b.call("Строка", {b.num(1)})), string_type());
  EXPECT_EQ(infer(b.call("Number", {b.str("1")})), number_type());
  EXPECT_EQ(infer(b.call("ПолучитьИмя")), string_type());
  EXPECT_TRUE(infer(b.call("Неизвестная")).certainty.is_unknown());
}

TEST_F(ExpressionTyperTest, NewExpressionsMapEnglishNames)
{
  EXPECT_TRUE(is_array(infer(b.new_("Array"))));
  EXPECT_TRUE(is_map(infer(b.new_("Соответствие"))));

  const auto custom = infer(b.new_("ЗапросКБазе"));
  ASSERT_TRUE(custom.get_name().has_value());
  EXPECT_EQ(*custom.get_name(), "ЗапросКБазе");
}

TEST_F(ExpressionTyperTest, TernaryBuildsUnionOfBranches)
{
  EXPECT_EQ(infer(b.ternary(b.id("c"), b.num(1), b.num(2))), number_type());

  const auto mixed = infer(b.ternary(b.id("c"), b.str("a"), b.num(1)));
  const auto * members = mixed.union_members();
  ASSERT_NE(members, nullptr);
  EXPECT_TRUE(UnionTypeManager::contains_type(*members, *string_type().concrete()));
  EXPECT_TRUE(UnionTypeManager::contains_type(*members, *number_type().concrete()));
}

TEST_F(ExpressionTyperTest, MemberAccessIsUnknown)
{
  variables["s"] = platform_type("Структура");
  EXPECT_TRUE(infer(b.member(b.id("s"), "Поле")).certainty.is_unknown());
  EXPECT_TRUE(infer(nullptr).certainty.is_unknown());
}
