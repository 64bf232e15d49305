// bsl_gradual/ast/ast.hpp - Syntax tree of a BSL module
//
// The tree is produced outside this library (see ast_json.hpp) and is
// read-only input to the analyses. Node classes follow the LLVM/Clang style
// with classof() for RTTI; every node lives in an AstContext arena.
//
#pragma once

#include <gsl/span>
#include <string_view>

#include "bsl_gradual/ast/ast_enums.hpp"
#include "bsl_gradual/basic/casting.hpp"
#include "bsl_gradual/basic/source_file.hpp"

namespace bsl_gradual
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Nodes are non-copyable and owned by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base that implements classof() for a single NodeKind.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

class NumberLiteralExpr : public NodeBase<NumberLiteralExpr, Expr, NodeKind::NumberLiteral>
{
public:
  double value;

  explicit NumberLiteralExpr(double v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Date literal: '20240131' (kept as written).
class DateLiteralExpr : public NodeBase<DateLiteralExpr, Expr, NodeKind::DateLiteral>
{
public:
  std::string_view value;

  explicit DateLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Неопределено / Undefined
class UndefinedLiteralExpr
: public NodeBase<UndefinedLiteralExpr, Expr, NodeKind::UndefinedLiteral>
{
public:
  explicit UndefinedLiteralExpr(SourceRange r = {}) : NodeBase(r) {}
};

class NullLiteralExpr : public NodeBase<NullLiteralExpr, Expr, NodeKind::NullLiteral>
{
public:
  explicit NullLiteralExpr(SourceRange r = {}) : NodeBase(r) {}
};

class IdentifierExpr : public NodeBase<IdentifierExpr, Expr, NodeKind::Identifier>
{
public:
  std::string_view name;

  explicit IdentifierExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// object.member
class MemberAccessExpr : public NodeBase<MemberAccessExpr, Expr, NodeKind::MemberAccess>
{
public:
  Expr * object;
  std::string_view member;

  MemberAccessExpr(Expr * obj, std::string_view m, SourceRange r = {})
  : NodeBase(r), object(obj), member(m)
  {
  }
};

/// object[index]
class IndexExpr : public NodeBase<IndexExpr, Expr, NodeKind::Index>
{
public:
  Expr * object;
  Expr * index;

  IndexExpr(Expr * obj, Expr * i, SourceRange r = {}) : NodeBase(r), object(obj), index(i) {}
};

/// callee(args...). `callee` is an identifier for plain calls and a member
/// access for method calls.
class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::Call>
{
public:
  Expr * callee;
  gsl::span<Expr *> args;

  CallExpr(Expr * c, gsl::span<Expr *> a, SourceRange r = {}) : NodeBase(r), callee(c), args(a) {}

  /// Name of a plain call (empty for method calls and computed callees).
  [[nodiscard]] std::string_view callee_name() const noexcept;
};

/// Новый ТипИмя(args...)
class NewExpr : public NodeBase<NewExpr, Expr, NodeKind::New>
{
public:
  std::string_view type_name;
  gsl::span<Expr *> args;

  NewExpr(std::string_view t, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), type_name(t), args(a)
  {
  }
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::Binary>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::Unary>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

/// ?(condition, then, else)
class TernaryExpr : public NodeBase<TernaryExpr, Expr, NodeKind::Ternary>
{
public:
  Expr * condition;
  Expr * then_expr;
  Expr * else_expr;

  TernaryExpr(Expr * c, Expr * t, Expr * e, SourceRange r = {})
  : NodeBase(r), condition(c), then_expr(t), else_expr(e)
  {
  }
};

class ArrayLiteralExpr : public NodeBase<ArrayLiteralExpr, Expr, NodeKind::ArrayLiteral>
{
public:
  gsl::span<Expr *> elements;

  explicit ArrayLiteralExpr(gsl::span<Expr *> elems, SourceRange r = {})
  : NodeBase(r), elements(elems)
  {
  }
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// Key/value pair of a structure literal.
class StructureField : public NodeBase<StructureField, AstNode, NodeKind::StructureField>
{
public:
  std::string_view key;
  Expr * value;

  StructureField(std::string_view k, Expr * v, SourceRange r = {}) : NodeBase(r), key(k), value(v)
  {
  }
};

class StructureLiteralExpr
: public NodeBase<StructureLiteralExpr, Expr, NodeKind::StructureLiteral>
{
public:
  gsl::span<StructureField *> fields;

  explicit StructureLiteralExpr(gsl::span<StructureField *> f, SourceRange r = {})
  : NodeBase(r), fields(f)
  {
  }
};

/// Formal parameter. Parameters are passed by reference unless marked Знач.
class ParamDecl : public NodeBase<ParamDecl, AstNode, NodeKind::ParamDecl>
{
public:
  std::string_view name;
  bool by_value = false;
  Expr * default_value = nullptr;

  ParamDecl(std::string_view n, bool by_val, Expr * def, SourceRange r = {})
  : NodeBase(r), name(n), by_value(by_val), default_value(def)
  {
  }

  [[nodiscard]] bool by_reference() const noexcept { return !by_value; }
};

/// ИначеЕсли condition Тогда body
class ElseIfClause : public NodeBase<ElseIfClause, AstNode, NodeKind::ElseIfClause>
{
public:
  Expr * condition;
  gsl::span<Stmt *> body;

  ElseIfClause(Expr * c, gsl::span<Stmt *> b, SourceRange r = {})
  : NodeBase(r), condition(c), body(b)
  {
  }
};

// ============================================================================
// Statement Nodes
// ============================================================================

/// Перем name [Экспорт] [= init];
class VarDeclStmt : public NodeBase<VarDeclStmt, Stmt, NodeKind::VarDecl>
{
public:
  std::string_view name;
  bool exported = false;
  Expr * init = nullptr;

  VarDeclStmt(std::string_view n, bool exp, Expr * i, SourceRange r = {})
  : NodeBase(r), name(n), exported(exp), init(i)
  {
  }
};

/**
 * Common part of Процедура and Функция declarations.
 */
class MethodDecl : public Stmt
{
public:
  std::string_view name;
  gsl::span<ParamDecl *> params;
  gsl::span<Stmt *> body;
  bool exported = false;

  static bool classof(const AstNode * node)
  {
    return node->kind == NodeKind::ProcedureDecl || node->kind == NodeKind::FunctionDecl;
  }

  [[nodiscard]] bool is_function() const noexcept { return kind == NodeKind::FunctionDecl; }

protected:
  explicit MethodDecl(NodeKind k, SourceRange r = {}) : Stmt(k, r) {}
};

class ProcedureDecl : public NodeBase<ProcedureDecl, MethodDecl, NodeKind::ProcedureDecl>
{
public:
  explicit ProcedureDecl(SourceRange r = {}) : NodeBase(r) {}
};

class FunctionDecl : public NodeBase<FunctionDecl, MethodDecl, NodeKind::FunctionDecl>
{
public:
  explicit FunctionDecl(SourceRange r = {}) : NodeBase(r) {}
};

/// target = value;  (target is an identifier, member access or index)
class AssignmentStmt : public NodeBase<AssignmentStmt, Stmt, NodeKind::Assignment>
{
public:
  Expr * target;
  Expr * value;

  AssignmentStmt(Expr * t, Expr * v, SourceRange r = {}) : NodeBase(r), target(t), value(v) {}

  /// Variable name when the target is a plain identifier, empty otherwise.
  [[nodiscard]] std::string_view target_name() const noexcept;
};

/// Call used as a statement: name(args...);
class ProcedureCallStmt : public NodeBase<ProcedureCallStmt, Stmt, NodeKind::ProcedureCall>
{
public:
  std::string_view name;
  gsl::span<Expr *> args;

  ProcedureCallStmt(std::string_view n, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), name(n), args(a)
  {
  }
};

class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::If>
{
public:
  Expr * condition;
  gsl::span<Stmt *> then_body;
  gsl::span<ElseIfClause *> else_ifs;
  gsl::span<Stmt *> else_body;
  bool has_else = false;

  IfStmt(Expr * c, gsl::span<Stmt *> t, SourceRange r = {})
  : NodeBase(r), condition(c), then_body(t)
  {
  }
};

/// Для variable = from По to Цикл ... КонецЦикла
class ForStmt : public NodeBase<ForStmt, Stmt, NodeKind::For>
{
public:
  std::string_view variable;
  Expr * from;
  Expr * to;
  Expr * step = nullptr;
  gsl::span<Stmt *> body;

  ForStmt(std::string_view v, Expr * f, Expr * t, gsl::span<Stmt *> b, SourceRange r = {})
  : NodeBase(r), variable(v), from(f), to(t), body(b)
  {
  }
};

/// Для Каждого variable Из collection Цикл ... КонецЦикла
class ForEachStmt : public NodeBase<ForEachStmt, Stmt, NodeKind::ForEach>
{
public:
  std::string_view variable;
  Expr * collection;
  gsl::span<Stmt *> body;

  ForEachStmt(std::string_view v, Expr * c, gsl::span<Stmt *> b, SourceRange r = {})
  : NodeBase(r), variable(v), collection(c), body(b)
  {
  }
};

class WhileStmt : public NodeBase<WhileStmt, Stmt, NodeKind::While>
{
public:
  Expr * condition;
  gsl::span<Stmt *> body;

  WhileStmt(Expr * c, gsl::span<Stmt *> b, SourceRange r = {}) : NodeBase(r), condition(c), body(b)
  {
  }
};

class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::Return>
{
public:
  Expr * value = nullptr;

  explicit ReturnStmt(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class BreakStmt : public NodeBase<BreakStmt, Stmt, NodeKind::Break>
{
public:
  explicit BreakStmt(SourceRange r = {}) : NodeBase(r) {}
};

class ContinueStmt : public NodeBase<ContinueStmt, Stmt, NodeKind::Continue>
{
public:
  explicit ContinueStmt(SourceRange r = {}) : NodeBase(r) {}
};

/// Попытка ... Исключение ... КонецПопытки
class TryStmt : public NodeBase<TryStmt, Stmt, NodeKind::Try>
{
public:
  gsl::span<Stmt *> try_body;
  gsl::span<Stmt *> except_body;

  TryStmt(gsl::span<Stmt *> t, gsl::span<Stmt *> e, SourceRange r = {})
  : NodeBase(r), try_body(t), except_body(e)
  {
  }
};

/// ВызватьИсключение "message";
class RaiseStmt : public NodeBase<RaiseStmt, Stmt, NodeKind::Raise>
{
public:
  std::string_view message;

  explicit RaiseStmt(std::string_view m, SourceRange r = {}) : NodeBase(r), message(m) {}
};

// ============================================================================
// Program (Root Node)
// ============================================================================

class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  std::string_view file;
  gsl::span<Stmt *> statements;

  explicit Program(std::string_view f, gsl::span<Stmt *> s, SourceRange r = {})
  : NodeBase(r), file(f), statements(s)
  {
  }
};

}  // namespace bsl_gradual
