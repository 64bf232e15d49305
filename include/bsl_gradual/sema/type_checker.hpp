// bsl_gradual/sema/type_checker.hpp - Gradual type checking of one module
//
// Pipeline of check():
//   1. dependency graph of the module
//   2. call graph and interprocedural return type inference, which seeds
//      the function signatures
//   3. flow-sensitive walk over the top-level statements; procedure and
//      function bodies are walked in their own scope with parameters seeded
//   4. the final flow state becomes the module's variable types
//
#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <gsl/span>

#include "bsl_gradual/analysis/dependency_graph.hpp"
#include "bsl_gradual/analysis/flow_sensitive.hpp"
#include "bsl_gradual/ast/ast.hpp"
#include "bsl_gradual/basic/diagnostic.hpp"
#include "bsl_gradual/sema/type_context.hpp"
#include "bsl_gradual/types/union_types.hpp"

namespace bsl_gradual
{

/// Stable codes of the diagnostics reported by TypeChecker.
namespace diag_code
{
inline constexpr std::string_view k_undeclared_variable = "BSL001";
inline constexpr std::string_view k_argument_count = "BSL002";
inline constexpr std::string_view k_argument_type = "BSL003";
inline constexpr std::string_view k_unknown_function = "BSL004";
inline constexpr std::string_view k_operand_mismatch = "BSL005";
inline constexpr std::string_view k_incompatible_assignment = "BSL006";
inline constexpr std::string_view k_non_boolean_condition = "BSL007";
inline constexpr std::string_view k_not_operand = "BSL008";
inline constexpr std::string_view k_negation_operand = "BSL009";
}  // namespace diag_code

struct CheckerOptions
{
  UnionLimits union_limits;
  /// Inferred types at or above this confidence count as confident.
  double confidence_threshold = 0.7;

  bool report_undeclared_variables = true;
  bool report_unknown_functions = true;
  bool report_reassignment = true;
  /// Operator operands, conditions and argument types.
  bool report_operand_mismatch = true;
};

struct CheckStatistics
{
  size_t functions_analyzed = 0;
  size_t flow_states = 0;
  size_t merge_points = 0;
  size_t dependency_nodes = 0;
  size_t dependency_edges = 0;
};

struct CheckResult
{
  TypeContext context;
  DiagnosticBag diagnostics;
  DependencyGraph dependency_graph;
  CheckStatistics stats;
};

/**
 * Orchestrates the analyses over one module.
 *
 * Analysis never fails: every finding becomes a diagnostic and expressions
 * whose type cannot be determined are typed Unknown.
 *
 * ## Usage
 * ```cpp
 * TypeChecker checker("Module.bsl");
 * checker.add_external_signature("ОбщийМодуль", sig);
 * CheckResult result = checker.check(*program);
 * ```
 */
class TypeChecker
{
public:
  explicit TypeChecker(std::string file_name, CheckerOptions options = {});

  /// Signature of a function declared in another module. Signatures from
  /// the checked module take precedence.
  void add_external_signature(std::string name, FunctionSignature signature);

  [[nodiscard]] CheckResult check(const Program & program);

  [[nodiscard]] const CheckerOptions & options() const noexcept { return options_; }

private:
  // ===========================================================================
  // Statements
  // ===========================================================================

  void check_body(gsl::span<Stmt * const> body);
  void check_stmt(const Stmt * stmt);
  void check_var_decl(const VarDeclStmt * node);
  void check_method(const MethodDecl * node);
  void check_assignment(const AssignmentStmt * node);
  void check_if(const IfStmt * node);
  void check_for(const ForStmt * node);
  void check_for_each(const ForEachStmt * node);
  void check_try(const TryStmt * node);

  // ===========================================================================
  // Expressions
  // ===========================================================================

  TypeResolution check_expr(const Expr * expr);
  TypeResolution check_identifier(const IdentifierExpr * node);
  TypeResolution check_binary(const BinaryExpr * node);
  TypeResolution check_unary(const UnaryExpr * node);
  TypeResolution check_call(
    std::string_view name, gsl::span<Expr * const> args, SourceRange range);
  TypeResolution check_ternary(const TernaryExpr * node);

  /// Type the condition and warn when it is confidently not Булево.
  void check_condition(const Expr * condition);

  // ===========================================================================
  // Helpers
  // ===========================================================================

  /// Concrete type with Known or sufficiently high Inferred certainty.
  [[nodiscard]] bool is_confident(const TypeResolution & type) const;
  [[nodiscard]] static bool types_compatible(
    const TypeResolution & expected, const TypeResolution & actual);

  void declare_variable(std::string_view name, TypeResolution type);

  std::string file_;
  CheckerOptions options_;
  UnionTypeManager unions_;
  std::map<std::string, FunctionSignature> external_;

  // Per-check state
  TypeContext context_;
  DiagnosticBag diags_;
  std::optional<FlowSensitiveAnalyzer> flow_;
  std::set<std::string> module_variables_;
  std::set<std::string> function_locals_;
  /// Range of the latest assignment to each variable in scope.
  std::map<std::string, SourceRange> assigned_at_;
  bool in_function_ = false;
};

}  // namespace bsl_gradual
