// bsl_gradual/analysis/interprocedural.hpp - Return type inference across calls
//
// Functions are analyzed callees first when the call graph is acyclic, in
// declaration order otherwise. Each analysis is memoized; a function that
// is reached again while it is being analyzed yields an Unknown type
// instead of recursing.
//
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "bsl_gradual/analysis/call_graph.hpp"
#include "bsl_gradual/sema/type_context.hpp"
#include "bsl_gradual/types/union_types.hpp"

namespace bsl_gradual
{

class InterproceduralAnalyzer
{
public:
  /// `context` supplies signatures of functions declared elsewhere.
  InterproceduralAnalyzer(CallGraph call_graph, TypeContext context, UnionTypeManager unions = {});

  /// Analyze every function of the call graph.
  void analyze_all_functions();

  /**
   * Return type of `name`.
   *
   * Functions outside the call graph give Unknown ("Function not found").
   * A procedure, or a function without a valued return, gives the void type.
   */
  TypeResolution analyze_function(std::string_view name);

  /// Signature of an analyzed (or at least declared) function.
  [[nodiscard]] std::optional<FunctionSignature> get_function_signature(std::string_view name) const;

  /// Return types computed so far, by function name.
  [[nodiscard]] const std::map<std::string, TypeResolution> & get_analyzed_functions() const noexcept
  {
    return results_;
  }

  /// Store the signatures of all analyzed functions into `context.functions`
  /// and into the analyzer's own context.
  void update_type_context(TypeContext & context);
  void update_type_context();

  [[nodiscard]] const TypeContext & type_context() const noexcept { return context_; }
  [[nodiscard]] const CallGraph & call_graph() const noexcept { return call_graph_; }

  /// Void type of procedures: Known, no concrete type.
  [[nodiscard]] static TypeResolution void_type();

private:
  [[nodiscard]] TypeResolution infer_return_type(const FunctionInfo & info);
  void collect_returns(
    gsl::span<Stmt * const> body, VariableTypes & env, std::vector<TypeResolution> & returns);
  [[nodiscard]] TypeResolution infer_in(const Expr * expr, const VariableTypes & env);

  CallGraph call_graph_;
  TypeContext context_;
  UnionTypeManager unions_;

  std::map<std::string, TypeResolution> results_;
  std::unordered_set<std::string> in_progress_;
};

}  // namespace bsl_gradual
