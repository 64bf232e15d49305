// bsl_gradual/ast/visitor.hpp - CRTP visitors for syntax tree traversal
#pragma once

#include <type_traits>

#include "bsl_gradual/ast/ast.hpp"
#include "bsl_gradual/ast/ast_enums.hpp"
#include "bsl_gradual/basic/casting.hpp"

namespace bsl_gradual
{

namespace detail
{

/// const-ness of NodePtrT carried over to the derived node pointer
template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = std::conditional_t<
  std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;

}  // namespace detail

/**
 * CRTP visitor without virtual dispatch.
 *
 * @code
 *   class LiteralCounter : public ConstAstVisitor<LiteralCounter> {
 *   public:
 *     void visit_number_literal_expr(const NumberLiteralExpr *) { ++count; }
 *     int count = 0;
 *   };
 * @endcode
 *
 * Unhandled kinds fall back to visit_expr / visit_stmt / visit_node.
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "bsl_gradual/ast/ast_nodes.def"
    }

    return ReturnType();
  }

  // Defaults, generated from ast_nodes.def
#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "bsl_gradual/ast/ast_nodes.def"

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }

  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * Visitor that walks into every child. Override a visit method and call the
 * base implementation to keep descending, or return without it to prune.
 * Returning false stops the whole traversal.
 */
template <typename Derived, typename NodePtrT = const AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  bool visit_node(NodePtrT /*node*/) { return true; }

  /// Visit an optional child; absent children do not stop the traversal.
  template <typename T>
  bool child(T * node)
  {
    return node == nullptr || get_derived().visit(node);
  }

  template <typename Range>
  bool visit_all(const Range & nodes)
  {
    for (auto * n : nodes) {
      if (!child(n)) return false;
    }
    return true;
  }

  bool visit_member_access_expr(NodePtr<MemberAccessExpr> node)
  {
    return child(node->object);
  }

  bool visit_index_expr(NodePtr<IndexExpr> node)
  {
    return child(node->object) && child(node->index);
  }

  bool visit_call_expr(NodePtr<CallExpr> node)
  {
    return child(node->callee) && visit_all(node->args);
  }

  bool visit_new_expr(NodePtr<NewExpr> node) { return visit_all(node->args); }

  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    return child(node->lhs) && child(node->rhs);
  }

  bool visit_unary_expr(NodePtr<UnaryExpr> node) { return child(node->operand); }

  bool visit_ternary_expr(NodePtr<TernaryExpr> node)
  {
    return child(node->condition) && child(node->then_expr) &&
           child(node->else_expr);
  }

  bool visit_array_literal_expr(NodePtr<ArrayLiteralExpr> node)
  {
    return visit_all(node->elements);
  }

  bool visit_structure_literal_expr(NodePtr<StructureLiteralExpr> node)
  {
    return visit_all(node->fields);
  }

  bool visit_structure_field(NodePtr<StructureField> node)
  {
    return child(node->value);
  }

  bool visit_param_decl(NodePtr<ParamDecl> node)
  {
    return child(node->default_value);
  }

  bool visit_else_if_clause(NodePtr<ElseIfClause> node)
  {
    return child(node->condition) && visit_all(node->body);
  }

  bool visit_var_decl_stmt(NodePtr<VarDeclStmt> node) { return child(node->init); }

  bool visit_procedure_decl(NodePtr<ProcedureDecl> node)
  {
    return visit_all(node->params) && visit_all(node->body);
  }

  bool visit_function_decl(NodePtr<FunctionDecl> node)
  {
    return visit_all(node->params) && visit_all(node->body);
  }

  bool visit_assignment_stmt(NodePtr<AssignmentStmt> node)
  {
    return child(node->target) && child(node->value);
  }

  bool visit_procedure_call_stmt(NodePtr<ProcedureCallStmt> node) { return visit_all(node->args); }

  bool visit_if_stmt(NodePtr<IfStmt> node)
  {
    return child(node->condition) && visit_all(node->then_body) &&
           visit_all(node->else_ifs) && visit_all(node->else_body);
  }

  bool visit_for_stmt(NodePtr<ForStmt> node)
  {
    return child(node->from) && child(node->to) &&
           child(node->step) && visit_all(node->body);
  }

  bool visit_for_each_stmt(NodePtr<ForEachStmt> node)
  {
    return child(node->collection) && visit_all(node->body);
  }

  bool visit_while_stmt(NodePtr<WhileStmt> node)
  {
    return child(node->condition) && visit_all(node->body);
  }

  bool visit_return_stmt(NodePtr<ReturnStmt> node) { return child(node->value); }

  bool visit_try_stmt(NodePtr<TryStmt> node)
  {
    return visit_all(node->try_body) && visit_all(node->except_body);
  }

  bool visit_program(NodePtr<Program> node) { return visit_all(node->statements); }
};

}  // namespace bsl_gradual
