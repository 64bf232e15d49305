// bsl_gradual/analysis/dependency_graph_builder.hpp - Build a DependencyGraph from a module
//
// Variables live in the module scope, or in the scope of the enclosing
// procedure/function. An assignment links its target to everything the value
// reads; a call links the caller to the callee and every argument to a
// positional parameter node of the callee.
//
#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "bsl_gradual/analysis/dependency_graph.hpp"
#include "bsl_gradual/ast/visitor.hpp"

namespace bsl_gradual
{

class DependencyGraphBuilder : public ConstAstVisitor<DependencyGraphBuilder>
{
public:
  explicit DependencyGraphBuilder(std::string file_name);

  /// Build the graph for `program`. The builder can be reused afterwards.
  [[nodiscard]] DependencyGraph build(const Program & program);

  // Statement visitors (dispatched through ConstAstVisitor)
  void visit_var_decl_stmt(const VarDeclStmt * node);
  void visit_procedure_decl(const ProcedureDecl * node);
  void visit_function_decl(const FunctionDecl * node);
  void visit_assignment_stmt(const AssignmentStmt * node);
  void visit_procedure_call_stmt(const ProcedureCallStmt * node);
  void visit_if_stmt(const IfStmt * node);
  void visit_for_stmt(const ForStmt * node);
  void visit_for_each_stmt(const ForEachStmt * node);
  void visit_while_stmt(const WhileStmt * node);
  void visit_return_stmt(const ReturnStmt * node);
  void visit_try_stmt(const TryStmt * node);
  void visit_stmt(const Stmt * /*node*/) {}
  void visit_expr(const Expr * /*node*/) {}

private:
  void visit_method(const MethodDecl * node);
  void visit_body(gsl::span<Stmt * const> body);

  /// Record that `target` depends on what `expr` reads. With a null target
  /// only nested calls are recorded.
  void add_expression_dependencies(
    const Expr * expr, const DependencyNode * target,
    DependencyType::Kind kind = DependencyType::Kind::Expression);

  void add_call_dependencies(
    std::string_view callee, gsl::span<Expr * const> args, const DependencyNode * target,
    SourceRange range);

  /// Edges from `target` to the variables read by enclosing conditions.
  void add_condition_dependencies(const DependencyNode & target);

  [[nodiscard]] DependencyNode make_variable_node(std::string_view name) const;
  [[nodiscard]] DependencyNode make_function_node(std::string_view name) const;
  void add_dependency(
    const DependencyNode & from, const DependencyNode & to, DependencyType type, SourceRange range);

  DependencyGraph graph_;
  std::string file_;
  Scope current_scope_;
  std::string current_function_;  // empty at module level

  std::unordered_set<std::string> exported_functions_;
  std::unordered_set<std::string> current_params_;
  std::unordered_set<std::string> current_locals_;
  std::unordered_set<std::string> module_variables_;
  std::vector<const Expr *> conditions_;
};

}  // namespace bsl_gradual
