// tests/unit/sema/test_type_checker.cpp - End-to-end tests for TypeChecker
//
#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "bsl_gradual/sema/type_checker.hpp"
#include "bsl_gradual/test_support/ast_builder.hpp"
#include "bsl_gradual/types/standard_types.hpp"

using namespace bsl_gradual;
using test_support::AstBuilder;

namespace
{

bool is_debug_enabled()
{
  const char * v = std::getenv("BSL_GRADUAL_TEST_DEBUG");
  return v != nullptr && std::string(v) == "1";
}

std::vector<Diagnostic> with_code(const CheckResult & result, std::string_view code)
{
  std::vector<Diagnostic> out;
  for (const auto & d : result.diagnostics) {
    if (d.code == code) out.push_back(d);
  }
  return out;
}

}  // namespace

class TypeCheckerTest : public ::testing::Test
{
protected:
  CheckResult check(const std::vector<Stmt *> & statements)
  {
    CheckResult result = checker.check(*b.program(statements));
    if (is_debug_enabled()) {
      for (const auto & d : result.diagnostics) {
        std::cerr << "[debug] " << d.code << " " << d.message << "\n";
      }
    }
    return result;
  }

  AstBuilder b;
  CheckerOptions options;
  TypeChecker checker{"Module.bsl"};
};

// ============================================================================
// Module variables
// ============================================================================

TEST_F(TypeCheckerTest, LiteralAssignmentsAreKnown)
{
  const auto result = check({
    b.assign("Количество", b.num(42)),
    b.assign("Имя", b.str("Товар")),
    b.var("Активен", b.boolean(true)),
  });

  EXPECT_TRUE(result.diagnostics.empty());
  const auto & vars = result.context.variables;
  EXPECT_EQ(vars.at("Количество"), number_type());
  EXPECT_EQ(vars.at("Имя"), string_type());
  EXPECT_EQ(vars.at("Активен"), boolean_type());
}

TEST_F(TypeCheckerTest, ExpressionTypesFlowIntoVariables)
{
  const auto result = check({
    b.assign("Цена", b.num(10)),
    b.assign("Итог", b.binary(b.id("Цена"), BinaryOp::Mul, b.num(2))),
    b.assign("Подпись", b.binary(b.str("Итог: "), BinaryOp::Add, b.id("Итог"))),
    b.assign("Список", b.new_("Массив")),
  });

  const auto & vars = result.context.variables;
  EXPECT_EQ(vars.at("Итог"), number_type());
  EXPECT_EQ(vars.at("Подпись"), string_type());
  EXPECT_TRUE(is_array(vars.at("Список")));
}

TEST_F(TypeCheckerTest, BranchMergeGivesUnion)
{
  const auto result = check({
    b.var("флаг", b.boolean(true)),
    b.if_(
      b.id("флаг"), {b.assign("x", b.str("a"))}, std::vector<Stmt *>{b.assign("x", b.num(1))}),
  });

  const auto * members = result.context.variables.at("x").union_members();
  ASSERT_NE(members, nullptr);
  EXPECT_TRUE(UnionTypeManager::contains_type(*members, *string_type().concrete()));
  EXPECT_TRUE(UnionTypeManager::contains_type(*members, *number_type().concrete()));
  EXPECT_GE(result.stats.merge_points, 1U);
}

TEST_F(TypeCheckerTest, NarrowingInThenBranch)
{
  checker.add_external_signature("Получить", FunctionSignature{});
  const auto result = check({
    b.assign("x", b.call("Получить")),
    b.if_(b.type_check("x", "Строка"), {b.assign("y", b.id("x"))}),
  });

  EXPECT_TRUE(is_string(result.context.variables.at("y")));
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST_F(TypeCheckerTest, ArgumentCountMismatchIsError)
{
  const auto result = check({
    b.function("Сложить", {b.param("а"), b.param("б")},
      {b.ret(b.binary(b.id("а"), BinaryOp::Add, b.id("б")))}),
    b.assign("x", b.call("Сложить", {b.num(1)}, AstBuilder::at(7, 5))),
  });

  const auto errors = result.diagnostics.errors();
  ASSERT_EQ(errors.size(), 1U);
  EXPECT_EQ(errors[0].code, "BSL002");
  EXPECT_EQ(errors[0].message, "function 'Сложить' expects 2 arguments, 1 provided");
  EXPECT_EQ(errors[0].line(), 7U);
  EXPECT_TRUE(result.diagnostics.has_errors());
}

TEST_F(TypeCheckerTest, OptionalParametersWidenArity)
{
  const auto result = check({
    b.procedure("Вывести", {b.param("Текст"), b.param("Повторов", b.num(1), true)}, {}),
    b.call_stmt("Вывести", {b.str("a")}),
    b.call_stmt("Вывести", {b.str("a"), b.num(2)}),
    b.call_stmt("Вывести", {b.str("a"), b.num(2), b.num(3)}),
  });

  const auto errors = with_code(result, "BSL002");
  ASSERT_EQ(errors.size(), 1U);
  EXPECT_EQ(errors[0].message, "function 'Вывести' expects 1 to 2 arguments, 3 provided");
}

TEST_F(TypeCheckerTest, ArgumentTypeMismatch)
{
  const auto result = check({
    b.procedure("Повторить", {b.param("Раз", b.num(1), true)}, {}),
    b.call_stmt("Повторить", {b.str("много")}),
  });

  const auto warnings = with_code(result, "BSL003");
  ASSERT_EQ(warnings.size(), 1U);
  EXPECT_EQ(warnings[0].severity, Severity::Warning);
  EXPECT_NE(warnings[0].message.find("'Раз'"), std::string::npos);
}

TEST_F(TypeCheckerTest, UnknownFunctionIsInfo)
{
  const auto result = check({b.call_stmt("Сообщить", {b.str("Привет")})});

  const auto infos = with_code(result, "BSL004");
  ASSERT_EQ(infos.size(), 1U);
  EXPECT_EQ(infos[0].severity, Severity::Info);
  EXPECT_FALSE(result.diagnostics.has_errors());
}

TEST_F(TypeCheckerTest, UndeclaredVariableIsWarning)
{
  const auto result = check({b.assign("x", b.id("Итог", AstBuilder::at(3, 9)))});

  const auto warnings = with_code(result, "BSL001");
  ASSERT_EQ(warnings.size(), 1U);
  EXPECT_EQ(warnings[0].message, "variable 'Итог' is used before it is declared");
  EXPECT_EQ(warnings[0].line(), 3U);
  EXPECT_EQ(warnings[0].column(), 9U);
}

TEST_F(TypeCheckerTest, IncompatibleReassignment)
{
  const auto result = check({
    b.assign("x", b.num(1)),
    b.assign("x", b.str("a")),
  });

  const auto warnings = with_code(result, "BSL006");
  ASSERT_EQ(warnings.size(), 1U);
  EXPECT_EQ(
    warnings[0].message, "incompatible assignment to variable 'x': Строка assigned, Число expected");
  EXPECT_EQ(result.context.variables.at("x"), string_type());
}

TEST_F(TypeCheckerTest, ReassignmentPointsAtPreviousAssignment)
{
  const auto result = check({
    b.assign("x", b.num(1), AstBuilder::at(2, 5)),
    b.assign("x", b.str("a"), AstBuilder::at(4, 5)),
  });

  const auto warnings = with_code(result, "BSL006");
  ASSERT_EQ(warnings.size(), 1U);
  EXPECT_EQ(warnings[0].line(), 4U);
  ASSERT_EQ(warnings[0].labels.size(), 2U);
  const Label & previous = warnings[0].labels[1];
  EXPECT_EQ(previous.style, LabelStyle::Secondary);
  EXPECT_EQ(previous.range.line(), 2U);
  EXPECT_EQ(previous.message, "previously assigned Число here");
}

TEST_F(TypeCheckerTest, OrderingComparisonOfDifferentTypes)
{
  const auto result = check({
    b.assign("a", b.binary(b.num(1), BinaryOp::Lt, b.str("x"))),
    b.assign("b", b.binary(b.str("a"), BinaryOp::Ge, b.str("b"))),
    b.assign("c", b.binary(b.num(1), BinaryOp::Eq, b.str("x"))),
  });

  const auto mismatches = with_code(result, "BSL005");
  ASSERT_EQ(mismatches.size(), 1U);
  EXPECT_EQ(result.context.variables.at("a"), boolean_type());
}

TEST_F(TypeCheckerTest, ElseIfChainMergesFirstAlternativeOnly)
{
  IfStmt * chain = b.if_(b.type_check("x", "Строка"), {b.assign("y", b.str("s"))});
  b.else_if(chain, b.type_check("x", "Число"), {b.assign("y", b.num(1))});
  b.else_if(
    chain, b.id("флаг"),
    {b.assign("y", b.boolean(true)), b.assign("q", b.num(2)),
     b.assign("w", b.unary(UnaryOp::Neg, b.str("минус")))});
  const auto result = check({
    b.assign("x", b.call("Получить")),
    b.assign("флаг", b.boolean(false)),
    chain,
    b.assign("z", b.id("q", AstBuilder::at(9, 5))),
  });

  const TypeResolution & y = result.context.variables.at("y");
  ASSERT_NE(y.union_members(), nullptr);
  EXPECT_TRUE(UnionTypeManager::contains_type(*y.union_members(), PrimitiveType::String));
  EXPECT_TRUE(UnionTypeManager::contains_type(*y.union_members(), PrimitiveType::Number));
  EXPECT_FALSE(UnionTypeManager::contains_type(*y.union_members(), PrimitiveType::Boolean));

  // The third clause is still checked, but its assignments are dropped.
  EXPECT_EQ(with_code(result, "BSL009").size(), 1U);
  EXPECT_EQ(result.context.variables.count("q"), 0U);
  const auto undeclared = with_code(result, "BSL001");
  ASSERT_EQ(undeclared.size(), 1U);
  EXPECT_EQ(undeclared[0].message, "variable 'q' is used before it is declared");
  EXPECT_EQ(undeclared[0].line(), 9U);
}

TEST_F(TypeCheckerTest, OperandMismatches)
{
  const auto result = check({
    b.assign("a", b.binary(b.num(1), BinaryOp::Sub, b.boolean(true))),
    b.assign("b", b.unary(UnaryOp::Not, b.num(1))),
    b.assign("c", b.unary(UnaryOp::Neg, b.str("x"))),
    b.if_(b.num(1), {}),
  });

  EXPECT_EQ(with_code(result, "BSL005").size(), 1U);
  EXPECT_EQ(with_code(result, "BSL008").size(), 1U);
  EXPECT_EQ(with_code(result, "BSL009").size(), 1U);
  EXPECT_EQ(with_code(result, "BSL007").size(), 1U);
}

TEST_F(TypeCheckerTest, ConcatenationAndDateArithmeticAreAccepted)
{
  const auto result = check({
    b.assign("d", b.date("20240101")),
    b.assign("s", b.binary(b.str("n = "), BinaryOp::Add, b.num(1))),
    b.assign("e", b.binary(b.id("d"), BinaryOp::Add, b.num(86400))),
    b.assign("n", b.binary(b.id("e"), BinaryOp::Sub, b.id("d"))),
  });

  EXPECT_TRUE(result.diagnostics.empty());
  EXPECT_EQ(result.context.variables.at("e"), date_type());
  EXPECT_EQ(result.context.variables.at("n"), number_type());
}

TEST_F(TypeCheckerTest, OptionsDisableReports)
{
  options.report_undeclared_variables = false;
  options.report_unknown_functions = false;
  options.report_reassignment = false;
  TypeChecker quiet("Module.bsl", options);

  auto * program = b.program({
    b.assign("x", b.id("y")),
    b.call_stmt("Сообщить"),
    b.assign("z", b.num(1)),
    b.assign("z", b.str("a")),
  });
  const CheckResult result = quiet.check(*program);

  EXPECT_TRUE(result.diagnostics.empty());
}

// ============================================================================
// Functions
// ============================================================================

TEST_F(TypeCheckerTest, FunctionLocalsStayInFunctionScope)
{
  const auto result = check({
    b.assign("Общая", b.num(0)),
    b.procedure("Посчитать", {b.param("Вход")},
      {b.assign("Локальная", b.id("Вход")), b.assign("Общая", b.num(1))}),
  });

  EXPECT_EQ(result.context.variables.count("Локальная"), 0U);
  EXPECT_EQ(result.context.variables.count("Вход"), 0U);
  ASSERT_EQ(result.context.function_variables.count("Посчитать"), 1U);
  const auto & locals = result.context.function_variables.at("Посчитать");
  EXPECT_EQ(locals.count("Локальная"), 1U);
  EXPECT_EQ(locals.count("Вход"), 1U);
  EXPECT_EQ(locals.count("Общая"), 0U);
  EXPECT_TRUE(with_code(result, "BSL001").empty());
}

TEST_F(TypeCheckerTest, InferredSignaturesAreRecorded)
{
  const auto result = check({
    b.function("Имя", {}, {b.ret(b.str("Иван"))}, true),
    b.assign("x", b.call("Имя")),
  });

  ASSERT_NE(result.context.lookup_function("Имя"), nullptr);
  EXPECT_EQ(result.context.lookup_function("Имя")->return_type, string_type());
  EXPECT_TRUE(result.context.lookup_function("Имя")->exported);
  EXPECT_EQ(result.context.variables.at("x"), string_type());
  EXPECT_EQ(result.stats.functions_analyzed, 1U);
}

TEST_F(TypeCheckerTest, ExternalSignaturesAreChecked)
{
  FunctionSignature sig;
  sig.params.emplace_back("Код", string_type());
  sig.return_type = platform_type("СправочникСсылка.Товары");
  checker.add_external_signature("НайтиТовар", sig);

  const auto result = check({
    b.assign("т", b.call("НайтиТовар", {b.str("0001")})),
    b.assign("ошибка", b.call("НайтиТовар", {})),
  });

  EXPECT_EQ(result.context.variables.at("т").get_name(), "СправочникСсылка.Товары");
  EXPECT_EQ(with_code(result, "BSL002").size(), 1U);
  EXPECT_TRUE(with_code(result, "BSL004").empty());
}

TEST_F(TypeCheckerTest, CheckerIsReusable)
{
  const auto first = check({b.call_stmt("Сообщить")});
  const auto second = check({b.assign("x", b.num(1))});

  EXPECT_EQ(first.diagnostics.size(), 1U);
  EXPECT_TRUE(second.diagnostics.empty());
  EXPECT_EQ(second.context.variables.count("x"), 1U);
}
