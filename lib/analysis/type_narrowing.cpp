// bsl_gradual/analysis/type_narrowing.cpp - Condition-based type refinement
#include "bsl_gradual/analysis/type_narrowing.hpp"

#include <array>
#include <optional>
#include <utility>

#include "bsl_gradual/types/standard_types.hpp"

namespace bsl_gradual
{

namespace
{

using Kind = RefinementCondition::Kind;

constexpr std::string_view k_narrowed_note = "Type narrowed from condition";

[[nodiscard]] bool is_named_call(const Expr * expr, std::string_view ru, std::string_view en)
{
  const auto * call = dyn_cast<CallExpr>(expr);
  if (call == nullptr) return false;
  const std::string_view name = call->callee_name();
  return name == ru || name == en;
}

/// ТипЗнч(x) -> x
[[nodiscard]] const IdentifierExpr * type_of_argument(const Expr * expr)
{
  if (!is_named_call(expr, "ТипЗнч", "TypeOf")) return nullptr;
  const auto * call = cast<CallExpr>(expr);
  if (call->args.empty()) return nullptr;
  return dyn_cast<IdentifierExpr>(call->args[0]);
}

/// Тип("Строка") -> "Строка"
[[nodiscard]] std::optional<std::string_view> type_literal_name(const Expr * expr)
{
  if (!is_named_call(expr, "Тип", "Type")) return std::nullopt;
  const auto * call = cast<CallExpr>(expr);
  if (call->args.empty()) return std::nullopt;
  if (const auto * str = dyn_cast<StringLiteralExpr>(call->args[0])) {
    return str->value;
  }
  return std::nullopt;
}

[[nodiscard]] std::optional<TypeResolution> narrowed_type(std::string_view name)
{
  auto type = type_from_name(name);
  if (!type) return std::nullopt;
  type->source = ResolutionSource::Inferred;
  return type->with_note(std::string(k_narrowed_note));
}

[[nodiscard]] TypeResolution narrowed_special(SpecialType spec)
{
  TypeResolution type = special_type(spec);
  type.source = ResolutionSource::Inferred;
  return type.with_note(std::string(k_narrowed_note));
}

/// Marker for "some value that passed a truthiness test".
[[nodiscard]] TypeResolution truthiness_marker(std::string note)
{
  return TypeResolution::inferred(0.8, DynamicType{}).with_note(std::move(note));
}

/// (lhs, rhs) and (rhs, lhs): patterns are matched in both operand orders.
[[nodiscard]] std::array<std::pair<const Expr *, const Expr *>, 2> operand_orders(
  const BinaryExpr * expr)
{
  return {{{expr->lhs, expr->rhs}, {expr->rhs, expr->lhs}}};
}

}  // namespace

// ============================================================================
// RefinementCondition
// ============================================================================

RefinementCondition RefinementCondition::inverted() const
{
  switch (kind) {
    case Kind::TypeEquals:
      return type_not_equals(type_name);
    case Kind::TypeNotEquals:
      return type_equals(type_name);
    case Kind::IsUndefined:
      return of(Kind::IsNotUndefined);
    case Kind::IsNotUndefined:
      return of(Kind::IsUndefined);
    case Kind::IsNull:
      return of(Kind::IsNotNull);
    case Kind::IsNotNull:
      return of(Kind::IsNull);
    case Kind::IsTruthy:
      return of(Kind::IsFalsy);
    case Kind::IsFalsy:
      return of(Kind::IsTruthy);
  }
  return *this;
}

std::string to_string(const RefinementCondition & condition)
{
  switch (condition.kind) {
    case Kind::TypeEquals:
      return "TypeEquals(" + condition.type_name + ")";
    case Kind::TypeNotEquals:
      return "TypeNotEquals(" + condition.type_name + ")";
    case Kind::IsUndefined:
      return "IsUndefined";
    case Kind::IsNotUndefined:
      return "IsNotUndefined";
    case Kind::IsNull:
      return "IsNull";
    case Kind::IsNotNull:
      return "IsNotNull";
    case Kind::IsTruthy:
      return "IsTruthy";
    case Kind::IsFalsy:
      return "IsFalsy";
  }
  return "";
}

// ============================================================================
// TypeNarrower
// ============================================================================

TypeResolution TypeNarrower::type_before(std::string_view name) const
{
  auto it = variables_->find(std::string(name));
  if (it != variables_->end()) return it->second;
  return TypeResolution::unknown();
}

std::vector<TypeRefinement> TypeNarrower::analyze_condition(const Expr * condition) const
{
  if (condition == nullptr) return {};

  if (const auto * bin = dyn_cast<BinaryExpr>(condition)) {
    return analyze_binary(bin);
  }

  if (const auto * unary = dyn_cast<UnaryExpr>(condition)) {
    const auto * id = dyn_cast<IdentifierExpr>(unary->operand);
    if (unary->op != UnaryOp::Not || id == nullptr) return {};
    return {TypeRefinement{
      std::string(id->name), truthiness_marker("Falsy value in condition"),
      RefinementCondition::of(Kind::IsFalsy)}};
  }

  if (const auto * id = dyn_cast<IdentifierExpr>(condition)) {
    return {TypeRefinement{
      std::string(id->name), truthiness_marker("Truthy value in condition"),
      RefinementCondition::of(Kind::IsTruthy)}};
  }

  return {};
}

std::vector<TypeRefinement> TypeNarrower::analyze_binary(const BinaryExpr * expr) const
{
  if (expr->op != BinaryOp::Eq && expr->op != BinaryOp::Ne) return {};
  const bool equal = expr->op == BinaryOp::Eq;

  // ТипЗнч(x) = Тип("...") in either operand order
  for (const auto & [lhs, rhs] : operand_orders(expr)) {
    const IdentifierExpr * var = type_of_argument(lhs);
    const auto name = type_literal_name(rhs);
    if (var == nullptr || !name) continue;

    auto refined = narrowed_type(*name);
    if (!refined) return {};
    const std::string variable(var->name);
    if (equal) {
      return {TypeRefinement{
        variable, std::move(*refined), RefinementCondition::type_equals(std::string(*name))}};
    }
    return {TypeRefinement{
      variable, type_before(var->name), RefinementCondition::type_not_equals(std::string(*name))}};
  }

  // x = Неопределено / x = Null in either operand order
  for (const auto & [lhs, rhs] : operand_orders(expr)) {
    const auto * var = dyn_cast<IdentifierExpr>(lhs);
    if (var == nullptr) continue;

    const bool undefined = isa<UndefinedLiteralExpr>(rhs);
    const bool null = isa<NullLiteralExpr>(rhs);
    if (!undefined && !null) continue;

    const std::string variable(var->name);
    if (equal) {
      return {TypeRefinement{
        variable, narrowed_special(undefined ? SpecialType::Undefined : SpecialType::Null),
        RefinementCondition::of(undefined ? Kind::IsUndefined : Kind::IsNull)}};
    }
    return {TypeRefinement{
      variable, type_before(var->name),
      RefinementCondition::of(undefined ? Kind::IsNotUndefined : Kind::IsNotNull)}};
  }

  return {};
}

std::vector<TypeRefinement> TypeNarrower::invert_refinements(
  const std::vector<TypeRefinement> & refinements) const
{
  std::vector<TypeRefinement> inverted;
  inverted.reserve(refinements.size());

  for (const TypeRefinement & r : refinements) {
    RefinementCondition condition = r.condition.inverted();
    TypeResolution type = r.refined_type;

    switch (condition.kind) {
      case Kind::TypeNotEquals:
      case Kind::IsNotUndefined:
      case Kind::IsNotNull:
        // The complement names no positive type.
        type = type_before(r.variable);
        break;
      case Kind::TypeEquals:
        if (auto named = narrowed_type(condition.type_name)) type = std::move(*named);
        break;
      case Kind::IsUndefined:
        type = narrowed_special(SpecialType::Undefined);
        break;
      case Kind::IsNull:
        type = narrowed_special(SpecialType::Null);
        break;
      case Kind::IsTruthy:
        type = truthiness_marker("Truthy value in condition");
        break;
      case Kind::IsFalsy:
        type = truthiness_marker("Falsy value in condition");
        break;
    }
    inverted.push_back(TypeRefinement{r.variable, std::move(type), std::move(condition)});
  }
  return inverted;
}

VariableTypes TypeNarrower::apply_refinements(
  VariableTypes variables, const std::vector<TypeRefinement> & refinements)
{
  for (const TypeRefinement & r : refinements) {
    variables.insert_or_assign(r.variable, r.refined_type);
  }
  return variables;
}

TypeContext TypeNarrower::apply_refinements_to_context(
  const std::vector<TypeRefinement> & refinements) const
{
  TypeContext refined;
  if (context_ != nullptr) {
    refined = *context_;
  } else {
    refined.variables = *variables_;
  }
  refined.variables = apply_refinements(std::move(refined.variables), refinements);
  return refined;
}

}  // namespace bsl_gradual
