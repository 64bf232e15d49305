// bsl_gradual/sema/type_context.hpp - Result of checking one module
//
// Variables, function signatures and the scope chain seen while checking.
// A context is a plain value: analyses that need a modified view (branch
// narrowing) copy it instead of editing the caller's instance.
//
#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "bsl_gradual/analysis/dependency_graph.hpp"
#include "bsl_gradual/types/type_resolution.hpp"

namespace bsl_gradual
{

/// Variable name -> type. Ordered so that exports are deterministic.
using VariableTypes = std::map<std::string, TypeResolution>;

/**
 * Signature of a procedure or function as seen by callers.
 */
struct FunctionSignature
{
  std::vector<std::pair<std::string, TypeResolution>> params;
  TypeResolution return_type = TypeResolution::unknown();
  bool exported = false;
  /// Number of parameters that declare a default value.
  size_t optional_count = 0;

  /// Fewest arguments a call must pass.
  [[nodiscard]] size_t min_arity() const noexcept
  {
    return optional_count >= params.size() ? 0 : params.size() - optional_count;
  }
  [[nodiscard]] size_t max_arity() const noexcept { return params.size(); }
};

bool operator==(const FunctionSignature & a, const FunctionSignature & b);

struct TypeContext
{
  VariableTypes variables;
  std::map<std::string, FunctionSignature> functions;
  /// Locals of each procedure/function body, keyed by its name.
  std::map<std::string, VariableTypes> function_variables;
  Scope current_scope = GlobalScope{};
  std::vector<Scope> scope_stack;

  /// Enter `scope`; the previous scope is saved on the stack.
  void push_scope(Scope scope);
  /// Return to the saved scope (no-op at the outermost scope).
  void pop_scope();

  [[nodiscard]] const TypeResolution * lookup_variable(std::string_view name) const;
  [[nodiscard]] const FunctionSignature * lookup_function(std::string_view name) const;
};

}  // namespace bsl_gradual
