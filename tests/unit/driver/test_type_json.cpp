// tests/unit/driver/test_type_json.cpp - Unit tests for type export and signature import
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

#include "bsl_gradual/driver/type_json.hpp"
#include "bsl_gradual/test_support/ast_builder.hpp"
#include "bsl_gradual/types/standard_types.hpp"

using nlohmann::json;
using namespace bsl_gradual;

// ============================================================================
// Export
// ============================================================================

TEST(DriverTypeJson, KnownPrimitive)
{
  const json j = to_json(string_type());
  EXPECT_EQ(j["certainty"]["kind"], "Known");
  EXPECT_FALSE(j["certainty"].contains("confidence"));
  EXPECT_EQ(j["result"]["kind"], "Concrete");
  EXPECT_EQ(j["result"]["type"]["kind"], "Primitive");
  EXPECT_EQ(j["display"], "Строка");
}

TEST(DriverTypeJson, InferredUnion)
{
  const UnionTypeManager unions;
  const json j = to_json(unions.create_union({string_type(), number_type()}));

  EXPECT_EQ(j["certainty"]["kind"], "Inferred");
  EXPECT_TRUE(j["certainty"].contains("confidence"));
  EXPECT_EQ(j["result"]["kind"], "Union");
  ASSERT_EQ(j["result"]["members"].size(), 2U);
  EXPECT_DOUBLE_EQ(j["result"]["members"][0]["weight"].get<double>(), 0.5);
}

TEST(DriverTypeJson, UnknownHasNotes)
{
  const json j = to_json(TypeResolution::unknown().with_note("Recursive call detected"));
  EXPECT_EQ(j["certainty"]["kind"], "Unknown");
  EXPECT_EQ(j["result"]["kind"], "Dynamic");
  ASSERT_TRUE(j.contains("notes"));
  EXPECT_EQ(j["notes"][0], "Recursive call detected");
}

TEST(DriverTypeJson, CheckResultShape)
{
  test_support::AstBuilder b;
  TypeChecker checker("Module.bsl");
  const CheckResult result = checker.check(*b.program({
    b.assign("x", b.num(1)),
    b.function("Имя", {}, {b.ret(b.str("Иван"))}),
    b.call_stmt("Сообщить", {b.id("x")}),
  }));

  const json j = to_json(result);
  EXPECT_EQ(j["context"]["variables"]["x"]["display"], "Число");
  EXPECT_TRUE(j["context"]["functions"].contains("Имя"));
  EXPECT_EQ(j["context"]["functions"]["Имя"]["return_type"]["display"], "Строка");
  ASSERT_EQ(j["diagnostics"].size(), 1U);
  EXPECT_EQ(j["diagnostics"][0]["code"], "BSL004");
  EXPECT_EQ(j["diagnostics"][0]["severity"], "info");
  EXPECT_EQ(j["statistics"]["functions_analyzed"], 1);
}

// ============================================================================
// Signature Import
// ============================================================================

TEST(DriverTypeJson, SignaturesFromBareObject)
{
  const auto loaded = signatures_from_json(json::parse(R"({
    "ПолучитьЦену": {
      "params": [{"name": "Товар"}, {"name": "Дата", "type": "Дата"}],
      "optional_count": 1,
      "return_type": "Число"
    },
    "НайтиКонтрагента": {"return_type": "СправочникСсылка.Контрагенты", "exported": false}
  })"));
  ASSERT_TRUE(loaded.success) << loaded.error;
  ASSERT_EQ(loaded.signatures.size(), 2U);

  const FunctionSignature & price = loaded.signatures.at("ПолучитьЦену");
  ASSERT_EQ(price.params.size(), 2U);
  EXPECT_TRUE(price.params[0].second.certainty.is_unknown());
  EXPECT_EQ(price.params[1].second, date_type());
  EXPECT_EQ(price.min_arity(), 1U);
  EXPECT_EQ(price.return_type, number_type());
  EXPECT_TRUE(price.exported);

  const FunctionSignature & find = loaded.signatures.at("НайтиКонтрагента");
  EXPECT_EQ(find.return_type.get_name(), "СправочникСсылка.Контрагенты");
  EXPECT_FALSE(find.exported);
}

TEST(DriverTypeJson, SignaturesFromExportedContext)
{
  test_support::AstBuilder b;
  TypeChecker checker("Common.bsl");
  const CheckResult result = checker.check(*b.program({
    b.function("Сумма", {b.param("а"), b.param("б", b.num(0))}, {b.ret(b.num(0))}, true),
  }));

  const auto loaded = signatures_from_json(to_json(result.context));
  ASSERT_TRUE(loaded.success) << loaded.error;
  const FunctionSignature & sig = loaded.signatures.at("Сумма");
  EXPECT_EQ(sig.params.size(), 2U);
  EXPECT_EQ(sig.optional_count, 1U);
  EXPECT_EQ(sig.return_type, number_type());
}

TEST(DriverTypeJson, SignatureErrors)
{
  EXPECT_FALSE(signatures_from_json(json::array()).success);
  EXPECT_FALSE(signatures_from_json(json::parse(R"({"Ф": 1})")).success);
  EXPECT_FALSE(
    signatures_from_json(json::parse(R"({"Ф": {"params": [{"type": "Число"}]}})")).success);

  const auto too_many = signatures_from_json(
    json::parse(R"({"Ф": {"params": [{"name": "а"}], "optional_count": 2}})"));
  EXPECT_FALSE(too_many.success);
  EXPECT_NE(too_many.error.find("'Ф'"), std::string::npos);
}

TEST(DriverTypeJson, MissingSignatureFile)
{
  const auto loaded =
    load_signatures_file(std::filesystem::temp_directory_path() / "bsl_missing_signatures.json");
  EXPECT_FALSE(loaded.success);
  EXPECT_NE(loaded.error.find("cannot open"), std::string::npos);
}
