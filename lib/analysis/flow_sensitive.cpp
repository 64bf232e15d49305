// bsl_gradual/analysis/flow_sensitive.cpp - Flow-sensitive variable typing
#include "bsl_gradual/analysis/flow_sensitive.hpp"

#include <set>
#include <string>
#include <utility>

#include "bsl_gradual/analysis/expression_typer.hpp"
#include "bsl_gradual/types/standard_types.hpp"

namespace bsl_gradual
{

FlowSensitiveAnalyzer::FlowSensitiveAnalyzer(TypeContext context, UnionTypeManager unions)
: base_context_(std::move(context)), unions_(unions)
{
  states_.push_back(FlowState{base_context_.variables, 0, {}});
}

// ============================================================================
// Queries
// ============================================================================

const TypeResolution * FlowSensitiveAnalyzer::get_variable_type(std::string_view name) const
{
  const auto & vars = current_state().variable_types;
  auto it = vars.find(std::string(name));
  return it != vars.end() ? &it->second : nullptr;
}

TypeContext FlowSensitiveAnalyzer::create_type_context() const
{
  TypeContext context = base_context_;
  context.variables = current_state().variable_types;
  return context;
}

TypeResolution FlowSensitiveAnalyzer::analyze_expression(const Expr * expr) const
{
  const ExpressionTyper typer(
    current_state().variable_types, unions_,
    [this](std::string_view name) -> std::optional<TypeResolution> {
      if (const FunctionSignature * sig = base_context_.lookup_function(name)) {
        return sig->return_type;
      }
      return std::nullopt;
    });
  return typer.infer(expr);
}

// ============================================================================
// State primitives
// ============================================================================

StateId FlowSensitiveAnalyzer::create_state(
  VariableTypes variables, std::vector<StateId> predecessors)
{
  const StateId id = states_.size();
  states_.push_back(FlowState{std::move(variables), id, std::move(predecessors)});
  return id;
}

void FlowSensitiveAnalyzer::update_variable_type(std::string_view name, TypeResolution type)
{
  VariableTypes vars = current_state().variable_types;
  vars.insert_or_assign(std::string(name), std::move(type));
  current_ = create_state(std::move(vars), {current_});
}

StateId FlowSensitiveAnalyzer::fork_state(StateId from)
{
  current_ = create_state(states_.at(from).variable_types, {from});
  return current_;
}

StateId FlowSensitiveAnalyzer::reset_state(VariableTypes variables)
{
  current_ = create_state(std::move(variables), {current_});
  return current_;
}

void FlowSensitiveAnalyzer::set_current_state(StateId id)
{
  if (id < states_.size()) current_ = id;
}

void FlowSensitiveAnalyzer::merge_states(const std::vector<StateId> & state_ids)
{
  if (state_ids.empty()) return;
  if (state_ids.size() == 1) {
    current_ = state_ids.front();
    return;
  }

  std::set<std::string> names;
  for (StateId id : state_ids) {
    for (const auto & [name, type] : states_[id].variable_types) {
      names.insert(name);
    }
  }

  VariableTypes merged;
  for (const std::string & name : names) {
    std::vector<TypeResolution> types;
    for (StateId id : state_ids) {
      const auto & vars = states_[id].variable_types;
      auto it = vars.find(name);
      if (it != vars.end()) types.push_back(it->second);
    }
    merged.emplace(name, unions_.create_union(types));
  }

  const StateId merged_id = create_state(std::move(merged), state_ids);
  merge_points_.push_back(MergePoint{state_ids, merged_id});
  current_ = merged_id;
}

void FlowSensitiveAnalyzer::narrow_current(const Expr * condition)
{
  const TypeNarrower narrower(current_state().variable_types);
  const auto refinements = narrower.analyze_condition(condition);
  if (refinements.empty()) return;
  current_ = create_state(
    TypeNarrower::apply_refinements(current_state().variable_types, refinements), {current_});
}

// ============================================================================
// Branch protocol
// ============================================================================

BranchPoint FlowSensitiveAnalyzer::enter_conditional(const Expr * condition)
{
  BranchPoint branch;
  branch.before = current_;

  const TypeNarrower narrower(current_state().variable_types);
  branch.refinements = narrower.analyze_condition(condition);

  current_ = create_state(
    TypeNarrower::apply_refinements(current_state().variable_types, branch.refinements),
    {branch.before});
  return branch;
}

void FlowSensitiveAnalyzer::enter_else(BranchPoint & branch)
{
  branch.then_end = current_;

  const VariableTypes & before = states_[branch.before].variable_types;
  const TypeNarrower narrower(before);
  current_ = create_state(
    TypeNarrower::apply_refinements(before, narrower.invert_refinements(branch.refinements)),
    {branch.before});
}

void FlowSensitiveAnalyzer::exit_conditional(const BranchPoint & branch)
{
  if (branch.then_end) {
    merge_states({*branch.then_end, current_});
  } else {
    merge_states({current_, branch.before});
  }
}

// ============================================================================
// Statement analysis
// ============================================================================

void FlowSensitiveAnalyzer::analyze_statements(gsl::span<Stmt * const> body)
{
  for (const Stmt * stmt : body) {
    analyze_statement(stmt);
  }
}

void FlowSensitiveAnalyzer::analyze_assignment(const AssignmentStmt * stmt)
{
  TypeResolution value_type = analyze_expression(stmt->value);
  const std::string_view name = stmt->target_name();
  if (!name.empty()) {
    update_variable_type(name, std::move(value_type));
  }
}

void FlowSensitiveAnalyzer::analyze_conditional(const IfStmt * stmt)
{
  BranchPoint branch = enter_conditional(stmt->condition);
  analyze_statements(stmt->then_body);

  // Only the first alternative joins the merge.
  if (!stmt->else_ifs.empty()) {
    enter_else(branch);
    narrow_current(stmt->else_ifs[0]->condition);
    analyze_statements(stmt->else_ifs[0]->body);
  } else if (stmt->has_else) {
    enter_else(branch);
    analyze_statements(stmt->else_body);
  }
  exit_conditional(branch);
}

void FlowSensitiveAnalyzer::analyze_statement(const Stmt * stmt)
{
  if (stmt == nullptr) return;

  switch (stmt->get_kind()) {
    case NodeKind::Assignment:
      analyze_assignment(cast<AssignmentStmt>(stmt));
      break;
    case NodeKind::VarDecl: {
      const auto * decl = cast<VarDeclStmt>(stmt);
      update_variable_type(
        decl->name,
        decl->init != nullptr ? analyze_expression(decl->init) : TypeResolution::unknown());
      break;
    }
    case NodeKind::If:
      analyze_conditional(cast<IfStmt>(stmt));
      break;
    case NodeKind::While:
      analyze_statements(cast<WhileStmt>(stmt)->body);
      break;
    case NodeKind::For: {
      const auto * loop = cast<ForStmt>(stmt);
      update_variable_type(loop->variable, number_type());
      analyze_statements(loop->body);
      break;
    }
    case NodeKind::ForEach: {
      const auto * loop = cast<ForEachStmt>(stmt);
      update_variable_type(loop->variable, TypeResolution::unknown());
      analyze_statements(loop->body);
      break;
    }
    case NodeKind::Try: {
      const auto * try_stmt = cast<TryStmt>(stmt);
      const StateId before = current_;
      analyze_statements(try_stmt->try_body);
      const StateId try_end = current_;
      fork_state(before);
      analyze_statements(try_stmt->except_body);
      merge_states({try_end, current_});
      break;
    }
    default:
      // Declarations, calls, jumps and returns do not change variable types.
      break;
  }
}

}  // namespace bsl_gradual
