// bsl_gradual/analysis/expression_typer.cpp
#include "bsl_gradual/analysis/expression_typer.hpp"

#include <string>
#include <utility>

#include "bsl_gradual/types/standard_types.hpp"

namespace bsl_gradual
{

ExpressionTyper::ExpressionTyper(
  const VariableTypes & variables, const UnionTypeManager & unions, CallResolver resolve_call)
: variables_(variables), unions_(unions), resolve_call_(std::move(resolve_call))
{
}

std::optional<TypeResolution> ExpressionTyper::literal_type(const Expr * expr)
{
  switch (expr->get_kind()) {
    case NodeKind::NumberLiteral:
      return number_type();
    case NodeKind::StringLiteral:
      return string_type();
    case NodeKind::BoolLiteral:
      return boolean_type();
    case NodeKind::DateLiteral:
      return date_type();
    case NodeKind::UndefinedLiteral:
      return special_type(SpecialType::Undefined);
    case NodeKind::NullLiteral:
      return special_type(SpecialType::Null);
    case NodeKind::ArrayLiteral:
      return platform_type(k_array_type);
    case NodeKind::StructureLiteral:
      return platform_type(k_structure_type);
    default:
      return std::nullopt;
  }
}

TypeResolution ExpressionTyper::binary_result(
  BinaryOp op, const TypeResolution & lhs, const TypeResolution & rhs)
{
  if (is_comparison(op) || is_logical(op)) {
    return boolean_type();
  }
  if (op == BinaryOp::Mod) {
    return number_type();
  }

  if (op == BinaryOp::Add && is_string(lhs)) {
    return string_type();
  }
  if (is_date(lhs)) {
    if ((op == BinaryOp::Add || op == BinaryOp::Sub) && is_number(rhs)) return date_type();
    if (op == BinaryOp::Sub && is_date(rhs)) return number_type();
  }

  if (is_number(lhs) || is_number(rhs)) {
    return number_type();
  }
  return TypeResolution::unknown();
}

TypeResolution ExpressionTyper::unary_result(UnaryOp op, const TypeResolution & /*operand*/)
{
  switch (op) {
    case UnaryOp::Not:
      return boolean_type();
    case UnaryOp::Neg:
      return number_type();
  }
  return TypeResolution::unknown();
}

std::optional<TypeResolution> ExpressionTyper::builtin_call_result(std::string_view name)
{
  if (name == "Строка" || name == "String") return string_type();
  if (name == "Число" || name == "Number") return number_type();
  if (name == "Булево" || name == "Boolean") return boolean_type();
  if (name == "Дата" || name == "Date") return date_type();
  if (name == "ТипЗнч" || name == "TypeOf" || name == "Тип" || name == "Type") {
    return special_type(SpecialType::Type);
  }
  return std::nullopt;
}

TypeResolution ExpressionTyper::new_result(std::string_view type_name)
{
  if (auto named = type_from_name(type_name)) {
    return std::move(*named);
  }
  return platform_type(type_name);
}

std::optional<TypeResolution> ExpressionTyper::call_result(std::string_view name) const
{
  if (auto builtin = builtin_call_result(name)) return builtin;
  if (resolve_call_) return resolve_call_(name);
  return std::nullopt;
}

TypeResolution ExpressionTyper::ternary_result(
  const TypeResolution & then_type, const TypeResolution & else_type) const
{
  if (then_type == else_type) return then_type;
  return unions_.create_union({then_type, else_type});
}

TypeResolution ExpressionTyper::infer(const Expr * expr) const
{
  if (expr == nullptr) return TypeResolution::unknown();

  if (auto literal = literal_type(expr)) {
    return std::move(*literal);
  }

  switch (expr->get_kind()) {
    case NodeKind::Identifier: {
      auto it = variables_.find(std::string(cast<IdentifierExpr>(expr)->name));
      return it != variables_.end() ? it->second : TypeResolution::unknown();
    }
    case NodeKind::Binary: {
      const auto * bin = cast<BinaryExpr>(expr);
      return binary_result(bin->op, infer(bin->lhs), infer(bin->rhs));
    }
    case NodeKind::Unary: {
      const auto * unary = cast<UnaryExpr>(expr);
      return unary_result(unary->op, infer(unary->operand));
    }
    case NodeKind::Call: {
      const std::string_view name = cast<CallExpr>(expr)->callee_name();
      if (name.empty()) return TypeResolution::unknown();
      return call_result(name).value_or(TypeResolution::unknown());
    }
    case NodeKind::New:
      return new_result(cast<NewExpr>(expr)->type_name);
    case NodeKind::Ternary: {
      const auto * ternary = cast<TernaryExpr>(expr);
      return ternary_result(infer(ternary->then_expr), infer(ternary->else_expr));
    }
    default:
      // Member access and indexing need platform type catalogs.
      return TypeResolution::unknown();
  }
}

}  // namespace bsl_gradual
