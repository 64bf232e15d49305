// bsl_gradual/analysis/expression_typer.hpp - Type inference for expressions
//
// Pure inference: no diagnostics, no state changes. The composition rules
// are exposed separately so that the checker, which walks expressions itself
// to report problems, derives exactly the same types.
//
#pragma once

#include <functional>
#include <optional>
#include <string_view>

#include "bsl_gradual/ast/ast.hpp"
#include "bsl_gradual/sema/type_context.hpp"
#include "bsl_gradual/types/type_resolution.hpp"
#include "bsl_gradual/types/union_types.hpp"

namespace bsl_gradual
{

class ExpressionTyper
{
public:
  /// Return type of a user or external function, std::nullopt when unknown.
  using CallResolver = std::function<std::optional<TypeResolution>(std::string_view name)>;

  ExpressionTyper(
    const VariableTypes & variables, const UnionTypeManager & unions, CallResolver resolve_call = {});

  /// Type of `expr` under the current variable types (Unknown for null).
  [[nodiscard]] TypeResolution infer(const Expr * expr) const;

  /// Return type of a call to `name`: built-in conversions first, then the resolver.
  [[nodiscard]] std::optional<TypeResolution> call_result(std::string_view name) const;

  /// Union of both branches of ?(c, a, b); equal branches stay as they are.
  [[nodiscard]] TypeResolution ternary_result(
    const TypeResolution & then_type, const TypeResolution & else_type) const;

  // ---------------------------------------------------------------------------
  // Composition rules
  // ---------------------------------------------------------------------------

  /// Known type of a literal node, std::nullopt for anything else.
  [[nodiscard]] static std::optional<TypeResolution> literal_type(const Expr * expr);

  /**
   * Result of a binary operator.
   *
   * Comparisons and And/Or give Булево, % gives Число. Строка + x is
   * concatenation. Дата ± Число gives Дата and Дата - Дата gives Число.
   * Other arithmetic gives Число when either side is a number and Unknown
   * otherwise.
   */
  [[nodiscard]] static TypeResolution binary_result(
    BinaryOp op, const TypeResolution & lhs, const TypeResolution & rhs);

  [[nodiscard]] static TypeResolution unary_result(UnaryOp op, const TypeResolution & operand);

  /// Строка(x), Число(x), Булево(x), Дата(x), ТипЗнч(x), Тип("...")
  [[nodiscard]] static std::optional<TypeResolution> builtin_call_result(std::string_view name);

  /// Новый T: a platform type named T (English names are mapped to Russian).
  [[nodiscard]] static TypeResolution new_result(std::string_view type_name);

private:
  const VariableTypes & variables_;
  const UnionTypeManager & unions_;
  CallResolver resolve_call_;
};

}  // namespace bsl_gradual
