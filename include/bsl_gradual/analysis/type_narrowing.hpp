// bsl_gradual/analysis/type_narrowing.hpp - Type refinement from branch conditions
//
// Recognized condition shapes:
//   ТипЗнч(x) = Тип("Строка")     x is Строка          (TypeEquals)
//   ТипЗнч(x) <> Тип("Строка")    x keeps its type     (TypeNotEquals)
//   x = Неопределено / x <> ...   IsUndefined / IsNotUndefined
//   x = Null / x <> Null          IsNull / IsNotNull
//   x                             IsTruthy
//   НЕ x                          IsFalsy
// Every other condition yields no refinement.
//
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "bsl_gradual/ast/ast.hpp"
#include "bsl_gradual/sema/type_context.hpp"
#include "bsl_gradual/types/type_resolution.hpp"

namespace bsl_gradual
{

struct RefinementCondition
{
  enum class Kind : uint8_t {
    TypeEquals,
    TypeNotEquals,
    IsUndefined,
    IsNotUndefined,
    IsNull,
    IsNotNull,
    IsTruthy,
    IsFalsy,
  };

  Kind kind = Kind::IsTruthy;
  /// Type name as written, for TypeEquals / TypeNotEquals.
  std::string type_name;

  [[nodiscard]] static RefinementCondition type_equals(std::string name)
  {
    return {Kind::TypeEquals, std::move(name)};
  }
  [[nodiscard]] static RefinementCondition type_not_equals(std::string name)
  {
    return {Kind::TypeNotEquals, std::move(name)};
  }
  [[nodiscard]] static RefinementCondition of(Kind k) { return {k, {}}; }

  /// Logical complement (TypeEquals <-> TypeNotEquals, IsNull <-> IsNotNull, ...).
  [[nodiscard]] RefinementCondition inverted() const;
};

inline bool operator==(const RefinementCondition & a, const RefinementCondition & b)
{
  return a.kind == b.kind && a.type_name == b.type_name;
}
inline bool operator!=(const RefinementCondition & a, const RefinementCondition & b)
{
  return !(a == b);
}

[[nodiscard]] std::string to_string(const RefinementCondition & condition);

struct TypeRefinement
{
  std::string variable;
  TypeResolution refined_type;
  RefinementCondition condition;
};

/**
 * Extracts refinements from conditions and applies them.
 *
 * The narrower reads the variable types in effect before the condition;
 * it never modifies them.
 */
class TypeNarrower
{
public:
  explicit TypeNarrower(const TypeContext & context)
  : context_(&context), variables_(&context.variables)
  {
  }
  explicit TypeNarrower(const VariableTypes & variables) : variables_(&variables) {}

  [[nodiscard]] std::vector<TypeRefinement> analyze_condition(const Expr * condition) const;

  /// Refinements that hold when the condition is false.
  [[nodiscard]] std::vector<TypeRefinement> invert_refinements(
    const std::vector<TypeRefinement> & refinements) const;

  /// Copy of the narrower's context with the refined variables overwritten.
  [[nodiscard]] TypeContext apply_refinements_to_context(
    const std::vector<TypeRefinement> & refinements) const;

  /// Same on a bare variable map.
  [[nodiscard]] static VariableTypes apply_refinements(
    VariableTypes variables, const std::vector<TypeRefinement> & refinements);

private:
  [[nodiscard]] std::vector<TypeRefinement> analyze_binary(const BinaryExpr * expr) const;

  /// Type of `name` before the condition, Unknown when not tracked.
  [[nodiscard]] TypeResolution type_before(std::string_view name) const;

  const TypeContext * context_ = nullptr;
  const VariableTypes * variables_;
};

}  // namespace bsl_gradual
