// bsl_gradual/sema/type_checker.cpp - Gradual type checker implementation
//
#include "bsl_gradual/sema/type_checker.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "bsl_gradual/analysis/call_graph.hpp"
#include "bsl_gradual/analysis/dependency_graph_builder.hpp"
#include "bsl_gradual/analysis/expression_typer.hpp"
#include "bsl_gradual/analysis/interprocedural.hpp"
#include "bsl_gradual/types/standard_types.hpp"

namespace bsl_gradual
{

namespace
{

[[nodiscard]] std::string quoted(std::string_view name)
{
  return "'" + std::string(name) + "'";
}

[[nodiscard]] std::string arity_text(const FunctionSignature & sig)
{
  if (sig.min_arity() == sig.max_arity()) {
    return std::to_string(sig.max_arity());
  }
  return std::to_string(sig.min_arity()) + " to " + std::to_string(sig.max_arity());
}

}  // namespace

TypeChecker::TypeChecker(std::string file_name, CheckerOptions options)
: file_(std::move(file_name)), options_(options), unions_(options.union_limits), diags_(file_)
{
}

void TypeChecker::add_external_signature(std::string name, FunctionSignature signature)
{
  external_.insert_or_assign(std::move(name), std::move(signature));
}

// ============================================================================
// Entry Point
// ============================================================================

CheckResult TypeChecker::check(const Program & program)
{
  context_ = TypeContext{};
  context_.functions = external_;
  context_.current_scope = ModuleScope{file_};
  diags_ = DiagnosticBag(file_);
  module_variables_.clear();
  function_locals_.clear();
  assigned_at_.clear();
  in_function_ = false;

  CheckResult result;

  // 1. Dependencies
  DependencyGraphBuilder graph_builder(file_);
  result.dependency_graph = graph_builder.build(program);

  // 2. Function signatures
  InterproceduralAnalyzer interprocedural(CallGraph::build(program, file_), context_, unions_);
  interprocedural.analyze_all_functions();
  interprocedural.update_type_context(context_);

  // 3. Statements
  flow_.emplace(context_, unions_);
  check_body(program.statements);

  // 4. Module variables
  context_.variables = flow_->get_final_state().variable_types;

  result.stats.functions_analyzed = interprocedural.get_analyzed_functions().size();
  result.stats.flow_states = flow_->get_all_states().size();
  result.stats.merge_points = flow_->get_merge_points().size();
  result.stats.dependency_nodes = result.dependency_graph.node_count();
  result.stats.dependency_edges = result.dependency_graph.edge_count();

  flow_.reset();
  result.context = std::move(context_);
  result.diagnostics = std::move(diags_);
  context_ = TypeContext{};
  diags_ = DiagnosticBag(file_);
  return result;
}

// ============================================================================
// Helpers
// ============================================================================

bool TypeChecker::is_confident(const TypeResolution & type) const
{
  if (type.concrete() == nullptr) return false;
  if (type.certainty.is_known()) return true;
  return type.certainty.is_inferred() && type.certainty.value() >= options_.confidence_threshold;
}

bool TypeChecker::types_compatible(const TypeResolution & expected, const TypeResolution & actual)
{
  if (expected.certainty.is_unknown() || actual.certainty.is_unknown()) return true;

  if (const auto * members = expected.union_members()) {
    return UnionTypeManager::is_compatible_with_union(actual, *members);
  }
  if (const auto * members = actual.union_members()) {
    return UnionTypeManager::is_compatible_with_union(expected, *members);
  }

  const ConcreteType * a = expected.concrete();
  const ConcreteType * b = actual.concrete();
  if (a == nullptr || b == nullptr) return true;
  return *a == *b;
}

void TypeChecker::declare_variable(std::string_view name, TypeResolution type)
{
  const std::string key(name);
  if (in_function_) {
    if (module_variables_.count(key) == 0) function_locals_.insert(key);
  } else {
    module_variables_.insert(key);
  }
  flow_->update_variable_type(name, std::move(type));
}

// ============================================================================
// Statements
// ============================================================================

void TypeChecker::check_body(gsl::span<Stmt * const> body)
{
  for (const Stmt * stmt : body) {
    check_stmt(stmt);
  }
}

void TypeChecker::check_stmt(const Stmt * stmt)
{
  if (stmt == nullptr) return;

  switch (stmt->get_kind()) {
    case NodeKind::VarDecl:
      check_var_decl(cast<VarDeclStmt>(stmt));
      break;
    case NodeKind::ProcedureDecl:
    case NodeKind::FunctionDecl:
      check_method(cast<MethodDecl>(stmt));
      break;
    case NodeKind::Assignment:
      check_assignment(cast<AssignmentStmt>(stmt));
      break;
    case NodeKind::ProcedureCall: {
      const auto * call = cast<ProcedureCallStmt>(stmt);
      (void)check_call(call->name, call->args, call->get_range());
      break;
    }
    case NodeKind::If:
      check_if(cast<IfStmt>(stmt));
      break;
    case NodeKind::For:
      check_for(cast<ForStmt>(stmt));
      break;
    case NodeKind::ForEach:
      check_for_each(cast<ForEachStmt>(stmt));
      break;
    case NodeKind::While: {
      const auto * loop = cast<WhileStmt>(stmt);
      check_condition(loop->condition);
      check_body(loop->body);
      break;
    }
    case NodeKind::Return: {
      const auto * ret = cast<ReturnStmt>(stmt);
      if (ret->value != nullptr) (void)check_expr(ret->value);
      break;
    }
    case NodeKind::Try:
      check_try(cast<TryStmt>(stmt));
      break;
    case NodeKind::Break:
    case NodeKind::Continue:
    case NodeKind::Raise:
      break;
    default:
      break;
  }
}

void TypeChecker::check_var_decl(const VarDeclStmt * node)
{
  TypeResolution type =
    node->init != nullptr ? check_expr(node->init) : TypeResolution::unknown();
  declare_variable(node->name, std::move(type));
  assigned_at_.insert_or_assign(std::string(node->name), node->get_range());
}

void TypeChecker::check_method(const MethodDecl * node)
{
  const std::string name(node->name);
  context_.push_scope(FunctionScope{name});

  const StateId module_state = flow_->current_state_id();
  VariableTypes vars = flow_->current_state().variable_types;

  function_locals_.clear();
  const FunctionSignature * sig = context_.lookup_function(name);
  for (size_t i = 0; i < node->params.size(); ++i) {
    const ParamDecl * param = node->params[i];
    TypeResolution type = TypeResolution::unknown();
    if (param->default_value != nullptr) {
      type = check_expr(param->default_value);
    } else if (sig != nullptr && i < sig->params.size()) {
      type = sig->params[i].second;
    }
    function_locals_.emplace(param->name);
    vars.insert_or_assign(std::string(param->name), std::move(type));
  }

  flow_->reset_state(std::move(vars));
  in_function_ = true;
  check_body(node->body);
  in_function_ = false;

  VariableTypes locals;
  for (const auto & [var, type] : flow_->current_state().variable_types) {
    if (function_locals_.count(var) != 0) locals.emplace(var, type);
  }
  context_.function_variables.insert_or_assign(name, std::move(locals));
  for (const auto & local : function_locals_) assigned_at_.erase(local);
  function_locals_.clear();

  flow_->set_current_state(module_state);
  context_.pop_scope();
}

void TypeChecker::check_assignment(const AssignmentStmt * node)
{
  TypeResolution value_type = check_expr(node->value);

  const auto * target = dyn_cast<IdentifierExpr>(node->target);
  if (target == nullptr) {
    // Field or element store: only the object and index are read.
    if (const auto * member = dyn_cast<MemberAccessExpr>(node->target)) {
      (void)check_expr(member->object);
    } else if (const auto * index = dyn_cast<IndexExpr>(node->target)) {
      (void)check_expr(index->object);
      (void)check_expr(index->index);
    }
    return;
  }

  const TypeResolution * existing = flow_->get_variable_type(target->name);
  if (
    existing != nullptr && options_.report_reassignment &&
    !types_compatible(*existing, value_type)) {
    DiagnosticBuilder builder = diags_.report_warning(
      node->get_range(), "incompatible assignment to variable " + quoted(target->name) + ": " +
                           display_name(value_type) + " assigned, " + display_name(*existing) +
                           " expected");
    builder.with_code(std::string(diag_code::k_incompatible_assignment))
      .with_help("assign a value of the same type or use a new variable");
    auto previous = assigned_at_.find(std::string(target->name));
    if (previous != assigned_at_.end()) {
      builder.with_secondary_label(
        previous->second, "previously assigned " + display_name(*existing) + " here");
    }
  }

  declare_variable(target->name, std::move(value_type));
  assigned_at_.insert_or_assign(std::string(target->name), node->get_range());
}

void TypeChecker::check_if(const IfStmt * node)
{
  check_condition(node->condition);

  BranchPoint branch = flow_->enter_conditional(node->condition);
  check_body(node->then_body);

  if (!node->else_ifs.empty()) {
    const ElseIfClause * first = node->else_ifs[0];
    flow_->enter_else(branch);
    check_condition(first->condition);
    flow_->narrow_current(first->condition);
    check_body(first->body);
  } else if (node->has_else) {
    flow_->enter_else(branch);
    check_body(node->else_body);
  }
  flow_->exit_conditional(branch);

  if (node->else_ifs.empty()) return;

  // Later alternatives are checked, but only the first one joins the merge.
  const StateId merged = flow_->current_state_id();
  for (size_t i = 1; i < node->else_ifs.size(); ++i) {
    const ElseIfClause * clause = node->else_ifs[i];
    flow_->fork_state(branch.before);
    check_condition(clause->condition);
    flow_->narrow_current(clause->condition);
    check_body(clause->body);
  }
  if (node->has_else) {
    flow_->fork_state(branch.before);
    check_body(node->else_body);
  }
  flow_->set_current_state(merged);
}

void TypeChecker::check_for(const ForStmt * node)
{
  for (const Expr * bound : {node->from, node->to, node->step}) {
    if (bound == nullptr) continue;
    const TypeResolution type = check_expr(bound);
    if (options_.report_operand_mismatch && is_confident(type) && !is_number(type)) {
      diags_
        .report_warning(
          bound->get_range(), "loop bound should be Число, found " + display_name(type))
        .with_code(std::string(diag_code::k_operand_mismatch));
    }
  }
  declare_variable(node->variable, number_type());
  check_body(node->body);
}

void TypeChecker::check_for_each(const ForEachStmt * node)
{
  (void)check_expr(node->collection);
  declare_variable(node->variable, TypeResolution::unknown());
  check_body(node->body);
}

void TypeChecker::check_try(const TryStmt * node)
{
  const StateId before = flow_->current_state_id();
  check_body(node->try_body);
  const StateId try_end = flow_->current_state_id();

  flow_->fork_state(before);
  check_body(node->except_body);
  flow_->merge_states({try_end, flow_->current_state_id()});
}

// ============================================================================
// Expressions
// ============================================================================

void TypeChecker::check_condition(const Expr * condition)
{
  const TypeResolution type = check_expr(condition);
  if (options_.report_operand_mismatch && is_confident(type) && !is_boolean(type)) {
    diags_
      .report_warning(
        condition->get_range(), "condition should be Булево, found " + display_name(type))
      .with_code(std::string(diag_code::k_non_boolean_condition));
  }
}

TypeResolution TypeChecker::check_expr(const Expr * expr)
{
  if (expr == nullptr) return TypeResolution::unknown();

  if (auto literal = ExpressionTyper::literal_type(expr)) {
    if (const auto * array = dyn_cast<ArrayLiteralExpr>(expr)) {
      for (const Expr * e : array->elements) (void)check_expr(e);
    } else if (const auto * structure = dyn_cast<StructureLiteralExpr>(expr)) {
      for (const StructureField * f : structure->fields) (void)check_expr(f->value);
    }
    return std::move(*literal);
  }

  switch (expr->get_kind()) {
    case NodeKind::Identifier:
      return check_identifier(cast<IdentifierExpr>(expr));
    case NodeKind::Binary:
      return check_binary(cast<BinaryExpr>(expr));
    case NodeKind::Unary:
      return check_unary(cast<UnaryExpr>(expr));
    case NodeKind::Call: {
      const auto * call = cast<CallExpr>(expr);
      const std::string_view name = call->callee_name();
      if (!name.empty()) {
        return check_call(name, call->args, expr->get_range());
      }
      // Method call: the receiver and the arguments are still checked.
      if (const auto * member = dyn_cast<MemberAccessExpr>(call->callee)) {
        (void)check_expr(member->object);
      } else {
        (void)check_expr(call->callee);
      }
      for (const Expr * arg : call->args) (void)check_expr(arg);
      return TypeResolution::unknown();
    }
    case NodeKind::MemberAccess:
      (void)check_expr(cast<MemberAccessExpr>(expr)->object);
      return TypeResolution::unknown();
    case NodeKind::Index: {
      const auto * index = cast<IndexExpr>(expr);
      (void)check_expr(index->object);
      (void)check_expr(index->index);
      return TypeResolution::unknown();
    }
    case NodeKind::New: {
      const auto * node = cast<NewExpr>(expr);
      for (const Expr * arg : node->args) (void)check_expr(arg);
      return ExpressionTyper::new_result(node->type_name);
    }
    case NodeKind::Ternary:
      return check_ternary(cast<TernaryExpr>(expr));
    default:
      return TypeResolution::unknown();
  }
}

TypeResolution TypeChecker::check_identifier(const IdentifierExpr * node)
{
  if (const TypeResolution * type = flow_->get_variable_type(node->name)) {
    return *type;
  }
  if (options_.report_undeclared_variables) {
    diags_
      .report_warning(
        node->get_range(), "variable " + quoted(node->name) + " is used before it is declared",
        "not declared in this scope")
      .with_code(std::string(diag_code::k_undeclared_variable));
  }
  return TypeResolution::unknown();
}

TypeResolution TypeChecker::check_binary(const BinaryExpr * node)
{
  const TypeResolution lhs = check_expr(node->lhs);
  const TypeResolution rhs = check_expr(node->rhs);
  const BinaryOp op = node->op;

  if (options_.report_operand_mismatch) {
    bool mismatch = false;
    if (is_logical(op)) {
      mismatch = (is_confident(lhs) && !is_boolean(lhs)) || (is_confident(rhs) && !is_boolean(rhs));
    } else if (is_arithmetic(op)) {
      const bool concatenation = op == BinaryOp::Add && is_string(lhs);
      const bool date_arithmetic =
        is_date(lhs) && (op == BinaryOp::Add || op == BinaryOp::Sub) &&
        (!is_confident(rhs) || is_number(rhs) || (op == BinaryOp::Sub && is_date(rhs)));
      if (!concatenation && !date_arithmetic) {
        mismatch =
          (is_confident(lhs) && !is_number(lhs)) || (is_confident(rhs) && !is_number(rhs));
      }
    } else if (op != BinaryOp::Eq && op != BinaryOp::Ne) {
      // Ordering needs both sides of the same type.
      mismatch = is_confident(lhs) && is_confident(rhs) && *lhs.concrete() != *rhs.concrete();
    }

    if (mismatch) {
      diags_
        .report_warning(
          node->get_range(), "incompatible operand types for '" + std::string(to_string(op)) +
                               "': " + display_name(lhs) + " and " + display_name(rhs))
        .with_code(std::string(diag_code::k_operand_mismatch));
    }
  }

  return ExpressionTyper::binary_result(op, lhs, rhs);
}

TypeResolution TypeChecker::check_unary(const UnaryExpr * node)
{
  const TypeResolution operand = check_expr(node->operand);

  if (options_.report_operand_mismatch && is_confident(operand)) {
    if (node->op == UnaryOp::Not && !is_boolean(operand)) {
      diags_
        .report_warning(
          node->get_range(),
          "operator 'НЕ' requires a Булево operand, found " + display_name(operand))
        .with_code(std::string(diag_code::k_not_operand));
    } else if (node->op == UnaryOp::Neg && !is_number(operand)) {
      diags_
        .report_warning(
          node->get_range(),
          "unary minus requires a Число operand, found " + display_name(operand))
        .with_code(std::string(diag_code::k_negation_operand));
    }
  }

  return ExpressionTyper::unary_result(node->op, operand);
}

TypeResolution TypeChecker::check_call(
  std::string_view name, gsl::span<Expr * const> args, SourceRange range)
{
  std::vector<TypeResolution> arg_types;
  arg_types.reserve(args.size());
  for (const Expr * arg : args) {
    arg_types.push_back(check_expr(arg));
  }

  if (auto builtin = ExpressionTyper::builtin_call_result(name)) {
    return std::move(*builtin);
  }

  const FunctionSignature * sig = context_.lookup_function(name);
  if (sig == nullptr) {
    if (options_.report_unknown_functions) {
      diags_
        .report_info(range, "function " + quoted(name) + " is not defined in this module")
        .with_code(std::string(diag_code::k_unknown_function))
        .with_help("platform and common module functions are not checked");
    }
    return TypeResolution::unknown();
  }

  if (args.size() < sig->min_arity() || args.size() > sig->max_arity()) {
    diags_
      .report_error(
        range, "function " + quoted(name) + " expects " + arity_text(*sig) + " arguments, " +
                 std::to_string(args.size()) + " provided")
      .with_code(std::string(diag_code::k_argument_count));
  }

  if (options_.report_operand_mismatch) {
    const size_t checked = std::min(args.size(), sig->params.size());
    for (size_t i = 0; i < checked; ++i) {
      const auto & [param_name, param_type] = sig->params[i];
      if (
        is_confident(param_type) && is_confident(arg_types[i]) &&
        !types_compatible(param_type, arg_types[i])) {
        diags_
          .report_warning(
            args[i]->get_range(), "argument " + std::to_string(i + 1) + " of " + quoted(name) +
                                    " is " + display_name(arg_types[i]) + ", parameter " +
                                    quoted(param_name) + " expects " + display_name(param_type))
          .with_code(std::string(diag_code::k_argument_type));
      }
    }
  }

  return sig->return_type;
}

TypeResolution TypeChecker::check_ternary(const TernaryExpr * node)
{
  check_condition(node->condition);
  const TypeResolution then_type = check_expr(node->then_expr);
  const TypeResolution else_type = check_expr(node->else_expr);

  const ExpressionTyper typer(flow_->current_state().variable_types, unions_);
  return typer.ternary_result(then_type, else_type);
}

}  // namespace bsl_gradual
