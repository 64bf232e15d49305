// bsl_gradual/analysis/dependency_graph_builder.cpp
#include "bsl_gradual/analysis/dependency_graph_builder.hpp"

#include <utility>

namespace bsl_gradual
{

DependencyGraphBuilder::DependencyGraphBuilder(std::string file_name)
: file_(std::move(file_name)), current_scope_(ModuleScope{file_})
{
}

DependencyGraph DependencyGraphBuilder::build(const Program & program)
{
  graph_ = DependencyGraph{};
  current_scope_ = ModuleScope{file_};
  current_function_.clear();
  exported_functions_.clear();
  module_variables_.clear();
  conditions_.clear();

  // Exported flags are needed before the first call site is seen.
  for (const Stmt * stmt : program.statements) {
    if (const auto * method = dyn_cast<MethodDecl>(stmt)) {
      if (method->exported) exported_functions_.emplace(method->name);
    }
  }

  visit_body(program.statements);
  return std::move(graph_);
}

// ============================================================================
// Node helpers
// ============================================================================

DependencyNode DependencyGraphBuilder::make_variable_node(std::string_view name) const
{
  const std::string key(name);
  if (!current_function_.empty()) {
    if (current_params_.count(key) != 0) {
      return ParameterNode{current_function_, key};
    }
    if (current_locals_.count(key) == 0 && module_variables_.count(key) != 0) {
      return VariableNode{key, ModuleScope{file_}};
    }
  }
  return VariableNode{key, current_scope_};
}

DependencyNode DependencyGraphBuilder::make_function_node(std::string_view name) const
{
  const std::string key(name);
  return FunctionNode{key, exported_functions_.count(key) != 0};
}

void DependencyGraphBuilder::add_dependency(
  const DependencyNode & from, const DependencyNode & to, DependencyType type, SourceRange range)
{
  std::optional<EdgeLocation> location;
  if (range.is_valid()) {
    location = EdgeLocation{file_, range.line(), range.column()};
  }
  graph_.add_edge(DependencyEdge{from, to, type, std::move(location)});
}

// ============================================================================
// Expressions
// ============================================================================

void DependencyGraphBuilder::add_expression_dependencies(
  const Expr * expr, const DependencyNode * target, DependencyType::Kind kind)
{
  if (expr == nullptr) return;

  switch (expr->get_kind()) {
    case NodeKind::Identifier: {
      if (target != nullptr) {
        const auto * id = cast<IdentifierExpr>(expr);
        add_dependency(*target, make_variable_node(id->name), {kind, 0}, expr->get_range());
      }
      break;
    }
    case NodeKind::Binary: {
      const auto * bin = cast<BinaryExpr>(expr);
      add_expression_dependencies(bin->lhs, target, kind);
      add_expression_dependencies(bin->rhs, target, kind);
      break;
    }
    case NodeKind::Unary:
      add_expression_dependencies(cast<UnaryExpr>(expr)->operand, target, kind);
      break;
    case NodeKind::Call: {
      const auto * call = cast<CallExpr>(expr);
      if (const auto * id = dyn_cast<IdentifierExpr>(call->callee)) {
        add_call_dependencies(id->name, call->args, target, expr->get_range());
        break;
      }
      if (const auto * member = dyn_cast<MemberAccessExpr>(call->callee)) {
        const auto * object = dyn_cast<IdentifierExpr>(member->object);
        if (object != nullptr && target != nullptr) {
          add_dependency(
            *target, MethodNode{std::string(object->name), std::string(member->member)},
            {DependencyType::Kind::MethodCall, 0}, expr->get_range());
        }
      }
      for (const Expr * arg : call->args) {
        add_expression_dependencies(arg, target, kind);
      }
      break;
    }
    case NodeKind::MemberAccess: {
      const auto * member = cast<MemberAccessExpr>(expr);
      const auto * object = dyn_cast<IdentifierExpr>(member->object);
      if (object != nullptr && target != nullptr) {
        add_dependency(
          *target, FieldNode{std::string(object->name), std::string(member->member)},
          {DependencyType::Kind::FieldAccess, 0}, expr->get_range());
      }
      add_expression_dependencies(member->object, nullptr);
      break;
    }
    case NodeKind::Index: {
      const auto * index = cast<IndexExpr>(expr);
      add_expression_dependencies(index->object, target, kind);
      add_expression_dependencies(index->index, nullptr);
      break;
    }
    case NodeKind::Ternary: {
      const auto * ternary = cast<TernaryExpr>(expr);
      add_expression_dependencies(
        ternary->condition, target,
        target != nullptr ? DependencyType::Kind::Conditional : kind);
      add_expression_dependencies(ternary->then_expr, target, kind);
      add_expression_dependencies(ternary->else_expr, target, kind);
      break;
    }
    case NodeKind::ArrayLiteral:
      for (const Expr * e : cast<ArrayLiteralExpr>(expr)->elements) {
        add_expression_dependencies(e, nullptr);
      }
      break;
    case NodeKind::StructureLiteral:
      for (const StructureField * f : cast<StructureLiteralExpr>(expr)->fields) {
        add_expression_dependencies(f->value, nullptr);
      }
      break;
    case NodeKind::New:
      for (const Expr * e : cast<NewExpr>(expr)->args) {
        add_expression_dependencies(e, nullptr);
      }
      break;
    default:
      break;
  }
}

void DependencyGraphBuilder::add_call_dependencies(
  std::string_view callee, gsl::span<Expr * const> args, const DependencyNode * target,
  SourceRange range)
{
  const DependencyNode callee_node = make_function_node(callee);
  if (target != nullptr) {
    add_dependency(*target, callee_node, {DependencyType::Kind::Expression, 0}, range);
  }
  if (!current_function_.empty()) {
    add_dependency(
      make_function_node(current_function_), callee_node, {DependencyType::Kind::Expression, 0},
      range);
  }
  for (size_t i = 0; i < args.size(); ++i) {
    const DependencyNode param =
      ParameterNode{std::string(callee), "param_" + std::to_string(i)};
    add_dependency(param, callee_node, DependencyType::parameter(i), args[i]->get_range());
    add_expression_dependencies(args[i], &param);
  }
}

void DependencyGraphBuilder::add_condition_dependencies(const DependencyNode & target)
{
  for (const Expr * cond : conditions_) {
    add_expression_dependencies(cond, &target, DependencyType::Kind::Conditional);
  }
}

// ============================================================================
// Statements
// ============================================================================

void DependencyGraphBuilder::visit_body(gsl::span<Stmt * const> body)
{
  for (const Stmt * stmt : body) {
    visit(stmt);
  }
}

void DependencyGraphBuilder::visit_var_decl_stmt(const VarDeclStmt * node)
{
  const std::string name(node->name);
  if (current_function_.empty()) {
    module_variables_.insert(name);
  } else {
    current_locals_.insert(name);
  }

  const DependencyNode var = make_variable_node(node->name);
  graph_.add_node(var);
  if (node->exported) {
    graph_.add_node(VariableNode{name, GlobalScope{}});
  }
  add_expression_dependencies(node->init, &var, DependencyType::Kind::Assignment);
}

void DependencyGraphBuilder::visit_method(const MethodDecl * node)
{
  const std::string name(node->name);
  graph_.add_node(make_function_node(node->name));

  const Scope saved_scope = current_scope_;
  const std::string saved_function = current_function_;
  current_scope_ = FunctionScope{name};
  current_function_ = name;
  current_params_.clear();
  current_locals_.clear();

  for (const ParamDecl * param : node->params) {
    current_params_.emplace(param->name);
    const DependencyNode param_node = ParameterNode{name, std::string(param->name)};
    graph_.add_node(param_node);
    add_expression_dependencies(param->default_value, &param_node);
  }

  visit_body(node->body);

  current_scope_ = saved_scope;
  current_function_ = saved_function;
  current_params_.clear();
  current_locals_.clear();
}

void DependencyGraphBuilder::visit_procedure_decl(const ProcedureDecl * node) { visit_method(node); }

void DependencyGraphBuilder::visit_function_decl(const FunctionDecl * node) { visit_method(node); }

void DependencyGraphBuilder::visit_assignment_stmt(const AssignmentStmt * node)
{
  std::optional<DependencyNode> target;
  if (const auto * id = dyn_cast<IdentifierExpr>(node->target)) {
    const std::string name(id->name);
    if (current_function_.empty()) {
      module_variables_.insert(name);
    } else if (current_params_.count(name) == 0 && module_variables_.count(name) == 0) {
      current_locals_.insert(name);
    }
    target = make_variable_node(id->name);
  } else if (const auto * member = dyn_cast<MemberAccessExpr>(node->target)) {
    if (const auto * object = dyn_cast<IdentifierExpr>(member->object)) {
      target = FieldNode{std::string(object->name), std::string(member->member)};
    }
  }

  if (!target) {
    add_expression_dependencies(node->value, nullptr);
    return;
  }
  graph_.add_node(*target);
  add_expression_dependencies(node->value, &*target, DependencyType::Kind::Assignment);
  add_condition_dependencies(*target);
}

void DependencyGraphBuilder::visit_procedure_call_stmt(const ProcedureCallStmt * node)
{
  add_call_dependencies(node->name, node->args, nullptr, node->get_range());
}

void DependencyGraphBuilder::visit_if_stmt(const IfStmt * node)
{
  add_expression_dependencies(node->condition, nullptr);
  conditions_.push_back(node->condition);
  visit_body(node->then_body);
  for (const ElseIfClause * clause : node->else_ifs) {
    add_expression_dependencies(clause->condition, nullptr);
    conditions_.push_back(clause->condition);
    visit_body(clause->body);
  }
  visit_body(node->else_body);
  conditions_.resize(conditions_.size() - 1 - node->else_ifs.size());
}

void DependencyGraphBuilder::visit_for_stmt(const ForStmt * node)
{
  if (!current_function_.empty()) current_locals_.emplace(node->variable);
  const DependencyNode var = make_variable_node(node->variable);
  graph_.add_node(var);
  add_expression_dependencies(node->from, &var, DependencyType::Kind::Assignment);
  add_expression_dependencies(node->to, nullptr);
  add_expression_dependencies(node->step, nullptr);
  visit_body(node->body);
}

void DependencyGraphBuilder::visit_for_each_stmt(const ForEachStmt * node)
{
  if (!current_function_.empty()) current_locals_.emplace(node->variable);
  const DependencyNode var = make_variable_node(node->variable);
  graph_.add_node(var);
  add_expression_dependencies(node->collection, &var);
  visit_body(node->body);
}

void DependencyGraphBuilder::visit_while_stmt(const WhileStmt * node)
{
  add_expression_dependencies(node->condition, nullptr);
  conditions_.push_back(node->condition);
  visit_body(node->body);
  conditions_.pop_back();
}

void DependencyGraphBuilder::visit_return_stmt(const ReturnStmt * node)
{
  if (node->value == nullptr || current_function_.empty()) return;
  const DependencyNode ret = ReturnValueNode{current_function_};
  graph_.add_node(ret);
  add_expression_dependencies(node->value, &ret, DependencyType::Kind::Return);
}

void DependencyGraphBuilder::visit_try_stmt(const TryStmt * node)
{
  visit_body(node->try_body);
  visit_body(node->except_body);
}

}  // namespace bsl_gradual
