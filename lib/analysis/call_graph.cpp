// bsl_gradual/analysis/call_graph.cpp
#include "bsl_gradual/analysis/call_graph.hpp"

#include <algorithm>
#include <deque>
#include <unordered_set>
#include <utility>

#include "bsl_gradual/analysis/expression_typer.hpp"
#include "bsl_gradual/ast/visitor.hpp"
#include "bsl_gradual/types/standard_types.hpp"

namespace bsl_gradual
{

namespace
{

/// Collects the call sites of one procedure/function body.
class CallSiteCollector : public RecursiveAstVisitor<CallSiteCollector>
{
public:
  explicit CallSiteCollector(std::vector<CallSite> & sites) : sites_(sites) {}

  bool visit_call_expr(const CallExpr * node)
  {
    const std::string_view name = node->callee_name();
    if (!name.empty()) {
      CallSite site{std::string(name), node->args.size(), std::nullopt, node->get_range()};
      if (node == condition_) site.expected_return_type = boolean_type();
      sites_.push_back(std::move(site));
    }
    return RecursiveAstVisitor::visit_call_expr(node);
  }

  bool visit_procedure_call_stmt(const ProcedureCallStmt * node)
  {
    sites_.push_back(
      CallSite{std::string(node->name), node->args.size(), std::nullopt, node->get_range()});
    return RecursiveAstVisitor::visit_procedure_call_stmt(node);
  }

  bool visit_if_stmt(const IfStmt * node)
  {
    condition_ = node->condition;
    return RecursiveAstVisitor::visit_if_stmt(node);
  }

  bool visit_else_if_clause(const ElseIfClause * node)
  {
    condition_ = node->condition;
    return RecursiveAstVisitor::visit_else_if_clause(node);
  }

  bool visit_while_stmt(const WhileStmt * node)
  {
    condition_ = node->condition;
    return RecursiveAstVisitor::visit_while_stmt(node);
  }

private:
  std::vector<CallSite> & sites_;
  const Expr * condition_ = nullptr;
};

}  // namespace

gsl::span<Stmt * const> FunctionInfo::body() const
{
  if (decl == nullptr) return {};
  return decl->body;
}

CallGraph CallGraph::build(const Program & program, std::string_view module_name)
{
  CallGraph graph;

  for (const Stmt * stmt : program.statements) {
    const auto * method = dyn_cast<MethodDecl>(stmt);
    if (method == nullptr) continue;

    FunctionInfo info;
    info.name = std::string(method->name);
    info.decl = method;
    info.exported = method->exported;
    info.is_function = method->is_function();
    info.scope = module_name.empty() ? Scope{GlobalScope{}}
                                     : Scope{ModuleScope{std::string(module_name)}};
    for (const ParamDecl * param : method->params) {
      ParameterInfo p;
      p.name = std::string(param->name);
      p.by_reference = param->by_reference();
      p.has_default = param->default_value != nullptr;
      if (p.has_default) {
        p.type = ExpressionTyper::literal_type(param->default_value)
                   .value_or(TypeResolution::unknown());
      }
      info.parameters.push_back(std::move(p));
    }
    graph.add_function(std::move(info));
  }

  for (const std::string & name : graph.order_) {
    std::vector<CallSite> sites;
    CallSiteCollector collector(sites);
    for (const Stmt * stmt : graph.functions_.at(name).body()) {
      collector.visit(stmt);
    }
    for (CallSite & site : sites) {
      graph.add_call(name, std::move(site));
    }
  }
  return graph;
}

void CallGraph::add_function(FunctionInfo info)
{
  const std::string name = info.name;
  auto [it, inserted] = functions_.insert_or_assign(name, std::move(info));
  if (inserted) order_.push_back(name);
}

void CallGraph::add_call(const std::string & caller, CallSite site)
{
  auto & callers = callers_[site.callee];
  if (std::find(callers.begin(), callers.end(), caller) == callers.end()) {
    callers.push_back(caller);
  }
  call_edges_[caller].push_back(std::move(site));
}

const FunctionInfo * CallGraph::get_function_info(std::string_view name) const
{
  auto it = functions_.find(std::string(name));
  return it != functions_.end() ? &it->second : nullptr;
}

FunctionInfo * CallGraph::get_function_info(std::string_view name)
{
  auto it = functions_.find(std::string(name));
  return it != functions_.end() ? &it->second : nullptr;
}

const std::vector<CallSite> & CallGraph::get_calls_from(std::string_view name) const
{
  static const std::vector<CallSite> k_none;
  auto it = call_edges_.find(std::string(name));
  return it != call_edges_.end() ? it->second : k_none;
}

const std::vector<std::string> & CallGraph::get_callers(std::string_view name) const
{
  static const std::vector<std::string> k_none;
  auto it = callers_.find(std::string(name));
  return it != callers_.end() ? it->second : k_none;
}

bool CallGraph::contains(std::string_view name) const
{
  return functions_.count(std::string(name)) != 0;
}

std::optional<std::vector<std::string>> CallGraph::topological_sort() const
{
  // Kahn over caller -> callee edges, then reversed.
  std::unordered_map<std::string, size_t> in_degree;
  std::unordered_map<std::string, std::vector<std::string>> callees;
  for (const std::string & name : order_) {
    in_degree.emplace(name, 0);
  }
  for (const std::string & caller : order_) {
    std::unordered_set<std::string> seen;
    for (const CallSite & site : get_calls_from(caller)) {
      if (!contains(site.callee) || !seen.insert(site.callee).second) continue;
      callees[caller].push_back(site.callee);
      ++in_degree[site.callee];
    }
  }

  std::deque<std::string> ready;
  for (const std::string & name : order_) {
    if (in_degree[name] == 0) ready.push_back(name);
  }

  std::vector<std::string> sorted;
  sorted.reserve(order_.size());
  while (!ready.empty()) {
    std::string name = std::move(ready.front());
    ready.pop_front();
    for (const std::string & callee : callees[name]) {
      if (--in_degree[callee] == 0) ready.push_back(callee);
    }
    sorted.push_back(std::move(name));
  }

  if (sorted.size() != order_.size()) {
    return std::nullopt;
  }
  std::reverse(sorted.begin(), sorted.end());
  return sorted;
}

}  // namespace bsl_gradual
