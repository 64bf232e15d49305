// bsl_gradual/ast/ast_json.cpp - JSON import and export of syntax trees
//
#include "bsl_gradual/ast/ast_json.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "bsl_gradual/ast/ast_enums.hpp"
#include "bsl_gradual/basic/casting.hpp"

namespace bsl_gradual
{
namespace
{

using nlohmann::json;

/// Structural problem in an otherwise well-formed JSON document.
class TreeFormatError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

// ============================================================================
// Reader
// ============================================================================

class TreeReader
{
public:
  explicit TreeReader(AstContext & ctx) : ctx_(ctx) {}

  Program * read_program(const json & j)
  {
    if (!j.is_object()) throw TreeFormatError("program must be an object");
    const std::string_view file = j.contains("file") ? intern(j, "file") : std::string_view{};
    return ctx_.create<Program>(file, read_stmts(j, "statements"), range(j));
  }

private:
  // --------------------------------------------------------------------------
  // Field access
  // --------------------------------------------------------------------------

  static const json & field(const json & j, const char * key)
  {
    auto it = j.find(key);
    if (it == j.end()) {
      throw TreeFormatError(std::string("missing field '") + key + "' in " + kind_name(j));
    }
    return *it;
  }

  static std::string kind_name(const json & j)
  {
    auto it = j.find("kind");
    return it != j.end() && it->is_string() ? it->get<std::string>() : std::string("node");
  }

  static bool has(const json & j, const char * key)
  {
    auto it = j.find(key);
    return it != j.end() && !it->is_null();
  }

  std::string_view intern(const json & j, const char * key)
  {
    return ctx_.intern(field(j, key).get<std::string>());
  }

  static bool flag(const json & j, const char * key)
  {
    return has(j, key) && j.at(key).get<bool>();
  }

  static SourceRange range(const json & j)
  {
    auto number = [&j](const char * key) -> uint32_t {
      return has(j, key) ? j.at(key).get<uint32_t>() : 0;
    };
    return SourceRange(
      SourceLocation{number("line"), number("column")},
      SourceLocation{number("end_line"), number("end_column")});
  }

  // --------------------------------------------------------------------------
  // Lists
  // --------------------------------------------------------------------------

  gsl::span<Stmt *> read_stmts(const json & j, const char * key)
  {
    if (!has(j, key)) return {};
    const json & list = j.at(key);
    if (!list.is_array()) throw TreeFormatError(std::string("'") + key + "' must be an array");
    std::vector<Stmt *> stmts;
    stmts.reserve(list.size());
    for (const json & s : list) stmts.push_back(read_stmt(s));
    return ctx_.copy_to_arena(stmts);
  }

  gsl::span<Expr *> read_exprs(const json & j, const char * key)
  {
    if (!has(j, key)) return {};
    const json & list = j.at(key);
    if (!list.is_array()) throw TreeFormatError(std::string("'") + key + "' must be an array");
    std::vector<Expr *> exprs;
    exprs.reserve(list.size());
    for (const json & e : list) exprs.push_back(read_expr(e));
    return ctx_.copy_to_arena(exprs);
  }

  Expr * optional_expr(const json & j, const char * key)
  {
    return has(j, key) ? read_expr(j.at(key)) : nullptr;
  }

  // --------------------------------------------------------------------------
  // Expressions
  // --------------------------------------------------------------------------

  Expr * read_expr(const json & j)
  {
    if (!j.is_object()) throw TreeFormatError("expression must be an object");
    const std::string kind = field(j, "kind").get<std::string>();
    const SourceRange r = range(j);

    if (kind == "NumberLiteral") {
      return ctx_.create<NumberLiteralExpr>(field(j, "value").get<double>(), r);
    }
    if (kind == "StringLiteral") return ctx_.create<StringLiteralExpr>(intern(j, "value"), r);
    if (kind == "BoolLiteral") {
      return ctx_.create<BoolLiteralExpr>(field(j, "value").get<bool>(), r);
    }
    if (kind == "DateLiteral") return ctx_.create<DateLiteralExpr>(intern(j, "value"), r);
    if (kind == "UndefinedLiteral") return ctx_.create<UndefinedLiteralExpr>(r);
    if (kind == "NullLiteral") return ctx_.create<NullLiteralExpr>(r);
    if (kind == "Identifier") return ctx_.create<IdentifierExpr>(intern(j, "name"), r);
    if (kind == "MemberAccess") {
      return ctx_.create<MemberAccessExpr>(
        read_expr(field(j, "object")), intern(j, "member"), r);
    }
    if (kind == "Index") {
      return ctx_.create<IndexExpr>(read_expr(field(j, "object")), read_expr(field(j, "index")), r);
    }
    if (kind == "Call") {
      return ctx_.create<CallExpr>(read_expr(field(j, "callee")), read_exprs(j, "args"), r);
    }
    if (kind == "New") return ctx_.create<NewExpr>(intern(j, "type_name"), read_exprs(j, "args"), r);
    if (kind == "Binary") {
      const std::string op_name = field(j, "op").get<std::string>();
      const auto op = binary_op_from_name(op_name);
      if (!op) throw TreeFormatError("unknown binary operator '" + op_name + "'");
      return ctx_.create<BinaryExpr>(
        read_expr(field(j, "lhs")), *op, read_expr(field(j, "rhs")), r);
    }
    if (kind == "Unary") {
      const std::string op_name = field(j, "op").get<std::string>();
      const auto op = unary_op_from_name(op_name);
      if (!op) throw TreeFormatError("unknown unary operator '" + op_name + "'");
      return ctx_.create<UnaryExpr>(*op, read_expr(field(j, "operand")), r);
    }
    if (kind == "Ternary") {
      return ctx_.create<TernaryExpr>(
        read_expr(field(j, "condition")), read_expr(field(j, "then")),
        read_expr(field(j, "else")), r);
    }
    if (kind == "ArrayLiteral") {
      return ctx_.create<ArrayLiteralExpr>(read_exprs(j, "elements"), r);
    }
    if (kind == "StructureLiteral") {
      std::vector<StructureField *> fields;
      if (has(j, "fields")) {
        for (const json & f : j.at("fields")) {
          fields.push_back(ctx_.create<StructureField>(
            intern(f, "key"), read_expr(field(f, "value")), range(f)));
        }
      }
      return ctx_.create<StructureLiteralExpr>(ctx_.copy_to_arena(fields), r);
    }

    throw TreeFormatError("unknown expression kind '" + kind + "'");
  }

  // --------------------------------------------------------------------------
  // Statements
  // --------------------------------------------------------------------------

  Stmt * read_method(const json & j, MethodDecl * method)
  {
    method->name = intern(j, "name");
    method->exported = flag(j, "exported");
    std::vector<ParamDecl *> params;
    if (has(j, "params")) {
      for (const json & p : j.at("params")) {
        params.push_back(ctx_.create<ParamDecl>(
          intern(p, "name"), flag(p, "by_value"), optional_expr(p, "default"), range(p)));
      }
    }
    method->params = ctx_.copy_to_arena(params);
    method->body = read_stmts(j, "body");
    return method;
  }

  Stmt * read_stmt(const json & j)
  {
    if (!j.is_object()) throw TreeFormatError("statement must be an object");
    const std::string kind = field(j, "kind").get<std::string>();
    const SourceRange r = range(j);

    if (kind == "VarDecl") {
      return ctx_.create<VarDeclStmt>(
        intern(j, "name"), flag(j, "exported"), optional_expr(j, "init"), r);
    }
    if (kind == "ProcedureDecl") return read_method(j, ctx_.create<ProcedureDecl>(r));
    if (kind == "FunctionDecl") return read_method(j, ctx_.create<FunctionDecl>(r));
    if (kind == "Assignment") {
      return ctx_.create<AssignmentStmt>(
        read_expr(field(j, "target")), read_expr(field(j, "value")), r);
    }
    if (kind == "ProcedureCall") {
      return ctx_.create<ProcedureCallStmt>(intern(j, "name"), read_exprs(j, "args"), r);
    }
    if (kind == "If") {
      auto * node = ctx_.create<IfStmt>(read_expr(field(j, "condition")), read_stmts(j, "then"), r);
      std::vector<ElseIfClause *> else_ifs;
      if (has(j, "else_ifs")) {
        for (const json & c : j.at("else_ifs")) {
          else_ifs.push_back(ctx_.create<ElseIfClause>(
            read_expr(field(c, "condition")), read_stmts(c, "body"), range(c)));
        }
      }
      node->else_ifs = ctx_.copy_to_arena(else_ifs);
      node->has_else = has(j, "else");
      node->else_body = read_stmts(j, "else");
      return node;
    }
    if (kind == "For") {
      auto * node = ctx_.create<ForStmt>(
        intern(j, "variable"), read_expr(field(j, "from")), read_expr(field(j, "to")),
        read_stmts(j, "body"), r);
      node->step = optional_expr(j, "step");
      return node;
    }
    if (kind == "ForEach") {
      return ctx_.create<ForEachStmt>(
        intern(j, "variable"), read_expr(field(j, "collection")), read_stmts(j, "body"), r);
    }
    if (kind == "While") {
      return ctx_.create<WhileStmt>(read_expr(field(j, "condition")), read_stmts(j, "body"), r);
    }
    if (kind == "Return") return ctx_.create<ReturnStmt>(optional_expr(j, "value"), r);
    if (kind == "Break") return ctx_.create<BreakStmt>(r);
    if (kind == "Continue") return ctx_.create<ContinueStmt>(r);
    if (kind == "Try") {
      return ctx_.create<TryStmt>(read_stmts(j, "try"), read_stmts(j, "except"), r);
    }
    if (kind == "Raise") {
      return ctx_.create<RaiseStmt>(
        has(j, "message") ? intern(j, "message") : std::string_view{}, r);
    }

    throw TreeFormatError("unknown statement kind '" + kind + "'");
  }

  AstContext & ctx_;
};

// ============================================================================
// Writer
// ============================================================================

json j_node(const AstNode * node);

json j_header(const AstNode * node)
{
  json j{{"kind", std::string(to_string(node->get_kind()))}};
  const SourceRange r = node->get_range();
  if (r.begin.is_valid()) {
    j["line"] = r.begin.line;
    j["column"] = r.begin.column;
  }
  if (r.end.is_valid()) {
    j["end_line"] = r.end.line;
    j["end_column"] = r.end.column;
  }
  return j;
}

template <typename Range>
json j_list(const Range & nodes)
{
  json list = json::array();
  for (const auto * n : nodes) list.push_back(j_node(n));
  return list;
}

json j_optional(const AstNode * node) { return node != nullptr ? j_node(node) : json(nullptr); }

json j_node(const AstNode * node)
{
  if (node == nullptr) return nullptr;
  json j = j_header(node);

  switch (node->get_kind()) {
    case NodeKind::NumberLiteral:
      j["value"] = cast<NumberLiteralExpr>(node)->value;
      break;
    case NodeKind::StringLiteral:
      j["value"] = std::string(cast<StringLiteralExpr>(node)->value);
      break;
    case NodeKind::BoolLiteral:
      j["value"] = cast<BoolLiteralExpr>(node)->value;
      break;
    case NodeKind::DateLiteral:
      j["value"] = std::string(cast<DateLiteralExpr>(node)->value);
      break;
    case NodeKind::UndefinedLiteral:
    case NodeKind::NullLiteral:
    case NodeKind::Break:
    case NodeKind::Continue:
      break;
    case NodeKind::Identifier:
      j["name"] = std::string(cast<IdentifierExpr>(node)->name);
      break;
    case NodeKind::MemberAccess: {
      const auto * n = cast<MemberAccessExpr>(node);
      j["object"] = j_node(n->object);
      j["member"] = std::string(n->member);
      break;
    }
    case NodeKind::Index: {
      const auto * n = cast<IndexExpr>(node);
      j["object"] = j_node(n->object);
      j["index"] = j_node(n->index);
      break;
    }
    case NodeKind::Call: {
      const auto * n = cast<CallExpr>(node);
      j["callee"] = j_node(n->callee);
      j["args"] = j_list(n->args);
      break;
    }
    case NodeKind::New: {
      const auto * n = cast<NewExpr>(node);
      j["type_name"] = std::string(n->type_name);
      j["args"] = j_list(n->args);
      break;
    }
    case NodeKind::Binary: {
      const auto * n = cast<BinaryExpr>(node);
      j["op"] = std::string(binary_op_name(n->op));
      j["lhs"] = j_node(n->lhs);
      j["rhs"] = j_node(n->rhs);
      break;
    }
    case NodeKind::Unary: {
      const auto * n = cast<UnaryExpr>(node);
      j["op"] = std::string(unary_op_name(n->op));
      j["operand"] = j_node(n->operand);
      break;
    }
    case NodeKind::Ternary: {
      const auto * n = cast<TernaryExpr>(node);
      j["condition"] = j_node(n->condition);
      j["then"] = j_node(n->then_expr);
      j["else"] = j_node(n->else_expr);
      break;
    }
    case NodeKind::ArrayLiteral:
      j["elements"] = j_list(cast<ArrayLiteralExpr>(node)->elements);
      break;
    case NodeKind::StructureLiteral:
      j["fields"] = j_list(cast<StructureLiteralExpr>(node)->fields);
      break;
    case NodeKind::StructureField: {
      const auto * n = cast<StructureField>(node);
      j["key"] = std::string(n->key);
      j["value"] = j_node(n->value);
      break;
    }
    case NodeKind::ParamDecl: {
      const auto * n = cast<ParamDecl>(node);
      j["name"] = std::string(n->name);
      j["by_value"] = n->by_value;
      if (n->default_value != nullptr) j["default"] = j_node(n->default_value);
      break;
    }
    case NodeKind::ElseIfClause: {
      const auto * n = cast<ElseIfClause>(node);
      j["condition"] = j_node(n->condition);
      j["body"] = j_list(n->body);
      break;
    }
    case NodeKind::VarDecl: {
      const auto * n = cast<VarDeclStmt>(node);
      j["name"] = std::string(n->name);
      j["exported"] = n->exported;
      if (n->init != nullptr) j["init"] = j_node(n->init);
      break;
    }
    case NodeKind::ProcedureDecl:
    case NodeKind::FunctionDecl: {
      const auto * n = cast<MethodDecl>(node);
      j["name"] = std::string(n->name);
      j["exported"] = n->exported;
      j["params"] = j_list(n->params);
      j["body"] = j_list(n->body);
      break;
    }
    case NodeKind::Assignment: {
      const auto * n = cast<AssignmentStmt>(node);
      j["target"] = j_node(n->target);
      j["value"] = j_node(n->value);
      break;
    }
    case NodeKind::ProcedureCall: {
      const auto * n = cast<ProcedureCallStmt>(node);
      j["name"] = std::string(n->name);
      j["args"] = j_list(n->args);
      break;
    }
    case NodeKind::If: {
      const auto * n = cast<IfStmt>(node);
      j["condition"] = j_node(n->condition);
      j["then"] = j_list(n->then_body);
      if (!n->else_ifs.empty()) j["else_ifs"] = j_list(n->else_ifs);
      if (n->has_else) j["else"] = j_list(n->else_body);
      break;
    }
    case NodeKind::For: {
      const auto * n = cast<ForStmt>(node);
      j["variable"] = std::string(n->variable);
      j["from"] = j_node(n->from);
      j["to"] = j_node(n->to);
      if (n->step != nullptr) j["step"] = j_node(n->step);
      j["body"] = j_list(n->body);
      break;
    }
    case NodeKind::ForEach: {
      const auto * n = cast<ForEachStmt>(node);
      j["variable"] = std::string(n->variable);
      j["collection"] = j_node(n->collection);
      j["body"] = j_list(n->body);
      break;
    }
    case NodeKind::While: {
      const auto * n = cast<WhileStmt>(node);
      j["condition"] = j_node(n->condition);
      j["body"] = j_list(n->body);
      break;
    }
    case NodeKind::Return:
      j["value"] = j_optional(cast<ReturnStmt>(node)->value);
      break;
    case NodeKind::Try: {
      const auto * n = cast<TryStmt>(node);
      j["try"] = j_list(n->try_body);
      j["except"] = j_list(n->except_body);
      break;
    }
    case NodeKind::Raise:
      j["message"] = std::string(cast<RaiseStmt>(node)->message);
      break;
    case NodeKind::Program: {
      const auto * n = cast<Program>(node);
      j["file"] = std::string(n->file);
      j["statements"] = j_list(n->statements);
      break;
    }
  }
  return j;
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

ProgramLoadResult load_program_json(const json & j, AstContext & ctx)
{
  try {
    TreeReader reader(ctx);
    return ProgramLoadResult::ok(reader.read_program(j));
  } catch (const TreeFormatError & e) {
    return ProgramLoadResult::fail(e.what());
  } catch (const json::exception & e) {
    return ProgramLoadResult::fail(std::string("invalid syntax tree: ") + e.what());
  }
}

ProgramLoadResult load_program_json_text(std::string_view text, AstContext & ctx)
{
  json j;
  try {
    j = json::parse(text.begin(), text.end());
  } catch (const json::parse_error & e) {
    return ProgramLoadResult::fail(std::string("failed to parse JSON: ") + e.what());
  }
  return load_program_json(j, ctx);
}

ProgramLoadResult load_program_json_file(const std::filesystem::path & path, AstContext & ctx)
{
  std::ifstream in(path);
  if (!in) {
    return ProgramLoadResult::fail("cannot open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return load_program_json_text(buffer.str(), ctx);
}

json to_json(const AstNode * node) { return j_node(node); }

json to_json(const Program * program) { return j_node(program); }

}  // namespace bsl_gradual
