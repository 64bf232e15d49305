// bsl_gradual/analysis/interprocedural.cpp
#include "bsl_gradual/analysis/interprocedural.hpp"

#include <algorithm>
#include <utility>

#include "bsl_gradual/analysis/expression_typer.hpp"
#include "bsl_gradual/types/standard_types.hpp"

namespace bsl_gradual
{

namespace
{

[[nodiscard]] TypeResolution unknown_because(std::string reason)
{
  TypeResolution type = TypeResolution::unknown();
  type.source = ResolutionSource::Inferred;
  return type.with_note(std::move(reason));
}

}  // namespace

InterproceduralAnalyzer::InterproceduralAnalyzer(
  CallGraph call_graph, TypeContext context, UnionTypeManager unions)
: call_graph_(std::move(call_graph)), context_(std::move(context)), unions_(unions)
{
}

TypeResolution InterproceduralAnalyzer::void_type()
{
  TypeResolution type;
  type.certainty = Certainty::known();
  type.result = DynamicType{};
  type.source = ResolutionSource::Inferred;
  return type.with_note("Void type (procedure)");
}

void InterproceduralAnalyzer::analyze_all_functions()
{
  const auto sorted = call_graph_.topological_sort();
  const std::vector<std::string> & order = sorted ? *sorted : call_graph_.function_names();

  for (const std::string & name : order) {
    if (results_.count(name) == 0) {
      (void)analyze_function(name);
    }
  }
}

TypeResolution InterproceduralAnalyzer::analyze_function(std::string_view name)
{
  const std::string key(name);
  if (auto it = results_.find(key); it != results_.end()) {
    return it->second;
  }
  if (in_progress_.count(key) != 0) {
    return unknown_because("Recursive call detected");
  }

  FunctionInfo * info = call_graph_.get_function_info(name);
  if (info == nullptr) {
    return unknown_because("Function not found");
  }

  in_progress_.insert(key);
  TypeResolution return_type = info->is_function ? infer_return_type(*info) : void_type();
  in_progress_.erase(key);

  info->return_type = return_type;
  results_.insert_or_assign(key, return_type);
  return return_type;
}

TypeResolution InterproceduralAnalyzer::infer_in(const Expr * expr, const VariableTypes & env)
{
  auto resolve = [this](std::string_view callee) -> std::optional<TypeResolution> {
    if (call_graph_.contains(callee)) {
      return analyze_function(callee);
    }
    if (const FunctionSignature * sig = context_.lookup_function(callee)) {
      return sig->return_type;
    }
    return std::nullopt;
  };
  const ExpressionTyper typer(env, unions_, resolve);
  return typer.infer(expr);
}

TypeResolution InterproceduralAnalyzer::infer_return_type(const FunctionInfo & info)
{
  VariableTypes env = context_.variables;
  for (const ParameterInfo & param : info.parameters) {
    env.insert_or_assign(param.name, param.type);
  }

  std::vector<TypeResolution> returns;
  collect_returns(info.body(), env, returns);

  if (returns.empty()) {
    return void_type();
  }
  const bool all_same =
    std::all_of(returns.begin() + 1, returns.end(), [&](const TypeResolution & t) {
      return t == returns.front();
    });
  if (all_same) {
    return returns.front();
  }
  return unions_.create_union(returns);
}

void InterproceduralAnalyzer::collect_returns(
  gsl::span<Stmt * const> body, VariableTypes & env, std::vector<TypeResolution> & returns)
{
  for (const Stmt * stmt : body) {
    switch (stmt->get_kind()) {
      case NodeKind::Return: {
        const auto * ret = cast<ReturnStmt>(stmt);
        returns.push_back(ret->value != nullptr ? infer_in(ret->value, env) : void_type());
        break;
      }
      case NodeKind::VarDecl: {
        const auto * decl = cast<VarDeclStmt>(stmt);
        env.insert_or_assign(
          std::string(decl->name),
          decl->init != nullptr ? infer_in(decl->init, env) : TypeResolution::unknown());
        break;
      }
      case NodeKind::Assignment: {
        const auto * assign = cast<AssignmentStmt>(stmt);
        const std::string_view target = assign->target_name();
        if (!target.empty()) {
          env.insert_or_assign(std::string(target), infer_in(assign->value, env));
        }
        break;
      }
      case NodeKind::If: {
        const auto * if_stmt = cast<IfStmt>(stmt);
        collect_returns(if_stmt->then_body, env, returns);
        for (const ElseIfClause * clause : if_stmt->else_ifs) {
          collect_returns(clause->body, env, returns);
        }
        collect_returns(if_stmt->else_body, env, returns);
        break;
      }
      case NodeKind::For: {
        const auto * loop = cast<ForStmt>(stmt);
        env.insert_or_assign(std::string(loop->variable), number_type());
        collect_returns(loop->body, env, returns);
        break;
      }
      case NodeKind::ForEach: {
        const auto * loop = cast<ForEachStmt>(stmt);
        env.insert_or_assign(std::string(loop->variable), TypeResolution::unknown());
        collect_returns(loop->body, env, returns);
        break;
      }
      case NodeKind::While:
        collect_returns(cast<WhileStmt>(stmt)->body, env, returns);
        break;
      case NodeKind::Try: {
        const auto * try_stmt = cast<TryStmt>(stmt);
        collect_returns(try_stmt->try_body, env, returns);
        collect_returns(try_stmt->except_body, env, returns);
        break;
      }
      default:
        break;
    }
  }
}

std::optional<FunctionSignature> InterproceduralAnalyzer::get_function_signature(
  std::string_view name) const
{
  const FunctionInfo * info = call_graph_.get_function_info(name);
  if (info == nullptr) return std::nullopt;

  FunctionSignature sig;
  for (const ParameterInfo & param : info->parameters) {
    sig.params.emplace_back(param.name, param.type);
    if (param.has_default) ++sig.optional_count;
  }
  auto it = results_.find(std::string(name));
  sig.return_type = it != results_.end() ? it->second : unknown_because("Not analyzed");
  sig.exported = info->exported;
  return sig;
}

void InterproceduralAnalyzer::update_type_context(TypeContext & context)
{
  for (const auto & [name, type] : results_) {
    if (auto sig = get_function_signature(name)) {
      context.functions.insert_or_assign(name, std::move(*sig));
    }
  }
}

void InterproceduralAnalyzer::update_type_context() { update_type_context(context_); }

}  // namespace bsl_gradual
