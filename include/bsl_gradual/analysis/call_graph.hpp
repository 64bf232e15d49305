// bsl_gradual/analysis/call_graph.hpp - Procedures, functions and who calls whom
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <gsl/span>

#include "bsl_gradual/analysis/dependency_graph.hpp"
#include "bsl_gradual/ast/ast.hpp"
#include "bsl_gradual/types/type_resolution.hpp"

namespace bsl_gradual
{

struct ParameterInfo
{
  std::string name;
  /// Type of the default value, Unknown without one.
  TypeResolution type = TypeResolution::unknown();
  bool has_default = false;
  bool by_reference = true;
};

struct CallSite
{
  std::string callee;
  size_t argument_count = 0;
  /// Type the caller expects back (Булево for calls used as conditions).
  std::optional<TypeResolution> expected_return_type;
  SourceRange range;
};

struct FunctionInfo
{
  std::string name;
  std::vector<ParameterInfo> parameters;
  /// Filled in after interprocedural analysis.
  std::optional<TypeResolution> return_type;
  const MethodDecl * decl = nullptr;
  bool exported = false;
  bool is_function = false;
  Scope scope = GlobalScope{};

  [[nodiscard]] gsl::span<Stmt * const> body() const;
};

/**
 * Call graph of one module.
 *
 * Only calls made from inside a procedure or function are edges; callees
 * need not be declared in the module (external or platform functions).
 */
class CallGraph
{
public:
  /// Collect the top-level procedures/functions of `program` and their calls.
  [[nodiscard]] static CallGraph build(const Program & program, std::string_view module_name = {});

  void add_function(FunctionInfo info);
  void add_call(const std::string & caller, CallSite site);

  [[nodiscard]] const FunctionInfo * get_function_info(std::string_view name) const;
  [[nodiscard]] FunctionInfo * get_function_info(std::string_view name);
  /// Call sites inside `name` (empty for unknown names).
  [[nodiscard]] const std::vector<CallSite> & get_calls_from(std::string_view name) const;
  /// Distinct functions whose body calls `name`.
  [[nodiscard]] const std::vector<std::string> & get_callers(std::string_view name) const;

  /// Function names in declaration order.
  [[nodiscard]] const std::vector<std::string> & function_names() const noexcept { return order_; }
  [[nodiscard]] size_t size() const noexcept { return order_.size(); }
  [[nodiscard]] bool contains(std::string_view name) const;

  /**
   * Callees before callers, over the functions of this graph (calls to
   * unknown functions are ignored). Returns std::nullopt when the calls
   * contain a cycle, including direct recursion.
   */
  [[nodiscard]] std::optional<std::vector<std::string>> topological_sort() const;

private:
  std::unordered_map<std::string, FunctionInfo> functions_;
  std::map<std::string, std::vector<CallSite>> call_edges_;
  std::map<std::string, std::vector<std::string>> callers_;
  std::vector<std::string> order_;
};

}  // namespace bsl_gradual
