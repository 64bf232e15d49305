// bsl_gradual/analysis/flow_sensitive.hpp - Flow-sensitive variable typing
//
// Every change of a variable type creates a new FlowState; states are never
// edited after creation. Branches fork from the state before the condition
// and are joined again by a merge that unions the types of every variable.
// Loop bodies are analyzed once, in sequence, without a fixpoint.
//
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include <gsl/span>

#include "bsl_gradual/analysis/type_narrowing.hpp"
#include "bsl_gradual/ast/ast.hpp"
#include "bsl_gradual/sema/type_context.hpp"
#include "bsl_gradual/types/union_types.hpp"

namespace bsl_gradual
{

using StateId = size_t;

struct FlowState
{
  VariableTypes variable_types;
  StateId id = 0;
  std::vector<StateId> predecessors;
};

/// Record of one join of control flow.
struct MergePoint
{
  std::vector<StateId> states;
  StateId merged_state = 0;
};

/**
 * Bookkeeping for one two-way branch between enter_conditional() and
 * exit_conditional().
 */
struct BranchPoint
{
  StateId before = 0;
  std::vector<TypeRefinement> refinements;
  std::optional<StateId> then_end;  // set by enter_else()
};

class FlowSensitiveAnalyzer
{
public:
  /// State 0 is seeded with `context.variables`.
  explicit FlowSensitiveAnalyzer(TypeContext context, UnionTypeManager unions = {});

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] StateId current_state_id() const noexcept { return current_; }
  [[nodiscard]] const FlowState & current_state() const { return states_[current_]; }
  [[nodiscard]] const FlowState & get_state(StateId id) const { return states_.at(id); }
  [[nodiscard]] const TypeResolution * get_variable_type(std::string_view name) const;

  [[nodiscard]] const std::vector<FlowState> & get_all_states() const noexcept { return states_; }
  [[nodiscard]] const std::vector<MergePoint> & get_merge_points() const noexcept
  {
    return merge_points_;
  }
  /// The state that is current after the last analyzed statement.
  [[nodiscard]] const FlowState & get_final_state() const { return current_state(); }

  /// Base context with the variables of the current state.
  [[nodiscard]] TypeContext create_type_context() const;

  [[nodiscard]] const UnionTypeManager & unions() const noexcept { return unions_; }

  /// Pure inference under the current state, with calls resolved from the
  /// function signatures of the base context.
  [[nodiscard]] TypeResolution analyze_expression(const Expr * expr) const;

  // ===========================================================================
  // State primitives
  // ===========================================================================

  /// New current state equal to the current one except for `name`.
  void update_variable_type(std::string_view name, TypeResolution type);

  /// New current state copied from `from` (scratch branches, function bodies).
  StateId fork_state(StateId from);

  /// New current state holding exactly `variables` (predecessor: current).
  StateId reset_state(VariableTypes variables);

  void set_current_state(StateId id);

  /// Join `state_ids` into a new current state; one id just becomes current.
  void merge_states(const std::vector<StateId> & state_ids);

  /// New current state narrowed by the refinements of `condition`.
  void narrow_current(const Expr * condition);

  // ===========================================================================
  // Branch protocol (the checker drives the bodies itself)
  // ===========================================================================

  /// Narrow by `condition` into a new then-state and make it current.
  [[nodiscard]] BranchPoint enter_conditional(const Expr * condition);

  /// Close the then-branch and start the else-branch from the state before
  /// the condition, narrowed by the inverted refinements.
  void enter_else(BranchPoint & branch);

  /// Merge the then-branch with the else-branch (or with the state before
  /// the condition when there was no else-branch).
  void exit_conditional(const BranchPoint & branch);

  // ===========================================================================
  // Statement analysis
  // ===========================================================================

  void analyze_statement(const Stmt * stmt);
  void analyze_statements(gsl::span<Stmt * const> body);

  void analyze_assignment(const AssignmentStmt * stmt);
  void analyze_conditional(const IfStmt * stmt);

private:
  StateId create_state(VariableTypes variables, std::vector<StateId> predecessors);

  TypeContext base_context_;
  UnionTypeManager unions_;
  std::vector<FlowState> states_;
  std::vector<MergePoint> merge_points_;
  StateId current_ = 0;
};

}  // namespace bsl_gradual
