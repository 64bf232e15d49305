// bsl_gradual/test_support/ast_builder.hpp - programmatic syntax trees for tests
//
// Trees normally arrive as JSON from the external parser. Tests build them
// directly instead:
//
//   AstBuilder b;
//   auto * prog = b.program({
//     b.var("x", b.num(42), b.at(1)),
//     b.if_(b.binary(b.id("x"), BinaryOp::Gt, b.num(0)), {b.assign("y", b.str("pos"))}),
//   });
//
#pragma once

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "bsl_gradual/ast/ast.hpp"
#include "bsl_gradual/ast/ast_context.hpp"

namespace bsl_gradual::test_support
{

class AstBuilder
{
public:
  AstBuilder() = default;

  AstBuilder(const AstBuilder &) = delete;
  AstBuilder & operator=(const AstBuilder &) = delete;

  [[nodiscard]] AstContext & context() noexcept { return ctx_; }

  [[nodiscard]] static SourceRange at(uint32_t line, uint32_t column = 1)
  {
    return SourceRange::at(line, column);
  }

  // ===========================================================================
  // Expressions
  // ===========================================================================

  Expr * num(double v, SourceRange r = {}) { return ctx_.create<NumberLiteralExpr>(v, r); }
  Expr * str(std::string_view v, SourceRange r = {})
  {
    return ctx_.create<StringLiteralExpr>(ctx_.intern(v), r);
  }
  Expr * boolean(bool v, SourceRange r = {}) { return ctx_.create<BoolLiteralExpr>(v, r); }
  Expr * date(std::string_view v, SourceRange r = {})
  {
    return ctx_.create<DateLiteralExpr>(ctx_.intern(v), r);
  }
  Expr * undefined(SourceRange r = {}) { return ctx_.create<UndefinedLiteralExpr>(r); }
  Expr * null(SourceRange r = {}) { return ctx_.create<NullLiteralExpr>(r); }

  Expr * id(std::string_view name, SourceRange r = {})
  {
    return ctx_.create<IdentifierExpr>(ctx_.intern(name), r);
  }

  Expr * member(Expr * object, std::string_view name, SourceRange r = {})
  {
    return ctx_.create<MemberAccessExpr>(object, ctx_.intern(name), r);
  }

  Expr * index(Expr * object, Expr * i, SourceRange r = {})
  {
    return ctx_.create<IndexExpr>(object, i, r);
  }

  /// Plain call by name.
  Expr * call(std::string_view name, const std::vector<Expr *> & args = {}, SourceRange r = {})
  {
    return ctx_.create<CallExpr>(id(name, r), ctx_.copy_to_arena(args), r);
  }

  Expr * method_call(
    Expr * object, std::string_view method, const std::vector<Expr *> & args = {},
    SourceRange r = {})
  {
    return ctx_.create<CallExpr>(member(object, method, r), ctx_.copy_to_arena(args), r);
  }

  Expr * new_(std::string_view type_name, const std::vector<Expr *> & args = {}, SourceRange r = {})
  {
    return ctx_.create<NewExpr>(ctx_.intern(type_name), ctx_.copy_to_arena(args), r);
  }

  Expr * binary(Expr * lhs, BinaryOp op, Expr * rhs, SourceRange r = {})
  {
    return ctx_.create<BinaryExpr>(lhs, op, rhs, r);
  }

  Expr * unary(UnaryOp op, Expr * operand, SourceRange r = {})
  {
    return ctx_.create<UnaryExpr>(op, operand, r);
  }

  Expr * ternary(Expr * cond, Expr * then_expr, Expr * else_expr, SourceRange r = {})
  {
    return ctx_.create<TernaryExpr>(cond, then_expr, else_expr, r);
  }

  Expr * array(const std::vector<Expr *> & elements, SourceRange r = {})
  {
    return ctx_.create<ArrayLiteralExpr>(ctx_.copy_to_arena(elements), r);
  }

  Expr * structure(
    const std::vector<std::pair<std::string_view, Expr *>> & fields, SourceRange r = {})
  {
    std::vector<StructureField *> nodes;
    nodes.reserve(fields.size());
    for (const auto & [key, value] : fields) {
      nodes.push_back(ctx_.create<StructureField>(ctx_.intern(key), value, r));
    }
    return ctx_.create<StructureLiteralExpr>(ctx_.copy_to_arena(nodes), r);
  }

  /// ТипЗнч(name) = Тип("type_name")
  Expr * type_check(std::string_view name, std::string_view type_name, SourceRange r = {})
  {
    Expr * lhs = call("ТипЗнч", {id(name, r)}, r);
    Expr * rhs = call("Тип", {str(type_name, r)}, r);
    return binary(lhs, BinaryOp::Eq, rhs, r);
  }

  // ===========================================================================
  // Statements
  // ===========================================================================

  Stmt * var(
    std::string_view name, Expr * init = nullptr, SourceRange r = {}, bool exported = false)
  {
    return ctx_.create<VarDeclStmt>(ctx_.intern(name), exported, init, r);
  }

  Stmt * assign(std::string_view name, Expr * value, SourceRange r = {})
  {
    return ctx_.create<AssignmentStmt>(id(name, r), value, r);
  }

  Stmt * assign_to(Expr * target, Expr * value, SourceRange r = {})
  {
    return ctx_.create<AssignmentStmt>(target, value, r);
  }

  Stmt * call_stmt(std::string_view name, const std::vector<Expr *> & args = {}, SourceRange r = {})
  {
    return ctx_.create<ProcedureCallStmt>(ctx_.intern(name), ctx_.copy_to_arena(args), r);
  }

  IfStmt * if_(
    Expr * cond, const std::vector<Stmt *> & then_body,
    std::optional<std::vector<Stmt *>> else_body = std::nullopt, SourceRange r = {})
  {
    auto * node = ctx_.create<IfStmt>(cond, ctx_.copy_to_arena(then_body), r);
    if (else_body) {
      node->has_else = true;
      node->else_body = ctx_.copy_to_arena(*else_body);
    }
    return node;
  }

  /// Append an ИначеЕсли clause to `node`.
  IfStmt * else_if(IfStmt * node, Expr * cond, const std::vector<Stmt *> & body, SourceRange r = {})
  {
    std::vector<ElseIfClause *> clauses(node->else_ifs.begin(), node->else_ifs.end());
    clauses.push_back(ctx_.create<ElseIfClause>(cond, ctx_.copy_to_arena(body), r));
    node->else_ifs = ctx_.copy_to_arena(clauses);
    return node;
  }

  Stmt * for_(
    std::string_view variable, Expr * from, Expr * to, const std::vector<Stmt *> & body,
    SourceRange r = {})
  {
    return ctx_.create<ForStmt>(ctx_.intern(variable), from, to, ctx_.copy_to_arena(body), r);
  }

  Stmt * for_each(
    std::string_view variable, Expr * collection, const std::vector<Stmt *> & body,
    SourceRange r = {})
  {
    return ctx_.create<ForEachStmt>(
      ctx_.intern(variable), collection, ctx_.copy_to_arena(body), r);
  }

  Stmt * while_(Expr * cond, const std::vector<Stmt *> & body, SourceRange r = {})
  {
    return ctx_.create<WhileStmt>(cond, ctx_.copy_to_arena(body), r);
  }

  Stmt * ret(Expr * value = nullptr, SourceRange r = {})
  {
    return ctx_.create<ReturnStmt>(value, r);
  }

  Stmt * brk(SourceRange r = {}) { return ctx_.create<BreakStmt>(r); }
  Stmt * cont(SourceRange r = {}) { return ctx_.create<ContinueStmt>(r); }

  Stmt * try_(
    const std::vector<Stmt *> & try_body, const std::vector<Stmt *> & except_body,
    SourceRange r = {})
  {
    return ctx_.create<TryStmt>(ctx_.copy_to_arena(try_body), ctx_.copy_to_arena(except_body), r);
  }

  Stmt * raise(std::string_view message, SourceRange r = {})
  {
    return ctx_.create<RaiseStmt>(ctx_.intern(message), r);
  }

  // ===========================================================================
  // Declarations
  // ===========================================================================

  ParamDecl * param(
    std::string_view name, Expr * default_value = nullptr, bool by_value = false,
    SourceRange r = {})
  {
    return ctx_.create<ParamDecl>(ctx_.intern(name), by_value, default_value, r);
  }

  MethodDecl * procedure(
    std::string_view name, const std::vector<ParamDecl *> & params,
    const std::vector<Stmt *> & body, bool exported = false, SourceRange r = {})
  {
    return fill_method(ctx_.create<ProcedureDecl>(r), name, params, body, exported);
  }

  MethodDecl * function(
    std::string_view name, const std::vector<ParamDecl *> & params,
    const std::vector<Stmt *> & body, bool exported = false, SourceRange r = {})
  {
    return fill_method(ctx_.create<FunctionDecl>(r), name, params, body, exported);
  }

  Program * program(const std::vector<Stmt *> & statements, std::string_view file = "Module.bsl")
  {
    return ctx_.create<Program>(ctx_.intern(file), ctx_.copy_to_arena(statements));
  }

private:
  MethodDecl * fill_method(
    MethodDecl * method, std::string_view name, const std::vector<ParamDecl *> & params,
    const std::vector<Stmt *> & body, bool exported)
  {
    method->name = ctx_.intern(name);
    method->params = ctx_.copy_to_arena(params);
    method->body = ctx_.copy_to_arena(body);
    method->exported = exported;
    return method;
  }

  AstContext ctx_;
};

}  // namespace bsl_gradual::test_support
