// bsl_gradual/analysis/dependency_graph.cpp
#include "bsl_gradual/analysis/dependency_graph.hpp"

#include <deque>
#include <functional>
#include <utility>

namespace bsl_gradual
{

namespace
{

template <class... Ts>
struct Overloaded : Ts...
{
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void hash_combine(size_t & seed, size_t value) noexcept
{
  seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6U) + (seed >> 2U);
}

size_t hash_str(const std::string & s) noexcept { return std::hash<std::string>{}(s); }

size_t hash_scope(const Scope & scope) noexcept
{
  size_t seed = scope.index();
  std::visit(
    Overloaded{
      [](const GlobalScope &) {},
      [&](const ModuleScope & m) { hash_combine(seed, hash_str(m.name)); },
      [&](const FunctionScope & f) { hash_combine(seed, hash_str(f.name)); },
      [&](const LocalScope & l) {
        hash_combine(seed, hash_str(l.function));
        hash_combine(seed, l.block_id);
      },
    },
    scope);
  return seed;
}

}  // namespace

// ============================================================================
// Node identity
// ============================================================================

bool operator==(const VariableNode & a, const VariableNode & b)
{
  return a.name == b.name && a.scope == b.scope;
}
bool operator==(const FunctionNode & a, const FunctionNode & b)
{
  return a.name == b.name && a.exported == b.exported;
}
bool operator==(const ParameterNode & a, const ParameterNode & b)
{
  return a.function == b.function && a.name == b.name;
}
bool operator==(const ReturnValueNode & a, const ReturnValueNode & b)
{
  return a.function == b.function;
}
bool operator==(const FieldNode & a, const FieldNode & b)
{
  return a.object == b.object && a.field == b.field;
}
bool operator==(const MethodNode & a, const MethodNode & b)
{
  return a.object == b.object && a.method == b.method;
}

size_t DependencyNodeHash::operator()(const DependencyNode & node) const noexcept
{
  size_t seed = node.index();
  std::visit(
    Overloaded{
      [&](const VariableNode & n) {
        hash_combine(seed, hash_str(n.name));
        hash_combine(seed, hash_scope(n.scope));
      },
      [&](const FunctionNode & n) {
        hash_combine(seed, hash_str(n.name));
        hash_combine(seed, n.exported ? 1U : 0U);
      },
      [&](const ParameterNode & n) {
        hash_combine(seed, hash_str(n.function));
        hash_combine(seed, hash_str(n.name));
      },
      [&](const ReturnValueNode & n) { hash_combine(seed, hash_str(n.function)); },
      [&](const FieldNode & n) {
        hash_combine(seed, hash_str(n.object));
        hash_combine(seed, hash_str(n.field));
      },
      [&](const MethodNode & n) {
        hash_combine(seed, hash_str(n.object));
        hash_combine(seed, hash_str(n.method));
      },
    },
    node);
  return seed;
}

std::string to_string(const Scope & scope)
{
  return std::visit(
    Overloaded{
      [](const GlobalScope &) { return std::string("Global"); },
      [](const ModuleScope & m) { return "Module(" + m.name + ")"; },
      [](const FunctionScope & f) { return "Function(" + f.name + ")"; },
      [](const LocalScope & l) {
        return "Local(" + l.function + "#" + std::to_string(l.block_id) + ")";
      },
    },
    scope);
}

std::string to_string(const DependencyNode & node)
{
  return std::visit(
    Overloaded{
      [](const VariableNode & n) { return "Variable(" + n.name + " @ " + to_string(n.scope) + ")"; },
      [](const FunctionNode & n) {
        return "Function(" + n.name + (n.exported ? ", exported)" : ")");
      },
      [](const ParameterNode & n) { return "Parameter(" + n.function + "." + n.name + ")"; },
      [](const ReturnValueNode & n) { return "ReturnValue(" + n.function + ")"; },
      [](const FieldNode & n) { return "Field(" + n.object + "." + n.field + ")"; },
      [](const MethodNode & n) { return "Method(" + n.object + "." + n.method + ")"; },
    },
    node);
}

std::string to_string(const DependencyType & type)
{
  switch (type.kind) {
    case DependencyType::Kind::Assignment:
      return "Assignment";
    case DependencyType::Kind::Parameter:
      return "Parameter(" + std::to_string(type.index) + ")";
    case DependencyType::Kind::Return:
      return "Return";
    case DependencyType::Kind::FieldAccess:
      return "FieldAccess";
    case DependencyType::Kind::MethodCall:
      return "MethodCall";
    case DependencyType::Kind::Expression:
      return "Expression";
    case DependencyType::Kind::Conditional:
      return "Conditional";
  }
  return "";
}

// ============================================================================
// Construction
// ============================================================================

DependencyGraph::NodeId DependencyGraph::intern(const DependencyNode & node)
{
  auto it = index_.find(node);
  if (it != index_.end()) {
    return it->second;
  }
  const NodeId id = nodes_.size();
  nodes_.push_back(node);
  index_.emplace(node, id);
  outgoing_.emplace_back();
  incoming_.emplace_back();
  return id;
}

std::optional<DependencyGraph::NodeId> DependencyGraph::find(const DependencyNode & node) const
{
  auto it = index_.find(node);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void DependencyGraph::add_node(const DependencyNode & node) { (void)intern(node); }

void DependencyGraph::add_edge(DependencyEdge edge)
{
  const NodeId from = intern(edge.from);
  const NodeId to = intern(edge.to);
  const EdgeId id = edges_.size();
  edges_.push_back(std::move(edge));
  edge_from_.push_back(from);
  edge_to_.push_back(to);
  outgoing_[from].push_back(id);
  incoming_[to].push_back(id);
}

bool DependencyGraph::contains(const DependencyNode & node) const { return find(node).has_value(); }

// ============================================================================
// Queries
// ============================================================================

std::vector<DependencyNode> DependencyGraph::get_dependencies(const DependencyNode & node) const
{
  std::vector<DependencyNode> out;
  if (auto id = find(node)) {
    for (const EdgeId e : outgoing_[*id]) {
      out.push_back(nodes_[edge_to_[e]]);
    }
  }
  return out;
}

std::vector<DependencyNode> DependencyGraph::get_dependents(const DependencyNode & node) const
{
  std::vector<DependencyNode> out;
  if (auto id = find(node)) {
    for (const EdgeId e : incoming_[*id]) {
      out.push_back(nodes_[edge_from_[e]]);
    }
  }
  return out;
}

std::optional<std::vector<DependencyNode>> DependencyGraph::find_path(
  const DependencyNode & from, const DependencyNode & to) const
{
  const auto start = find(from);
  const auto goal = find(to);
  if (!start || !goal) {
    return std::nullopt;
  }

  constexpr NodeId k_none = static_cast<NodeId>(-1);
  std::vector<NodeId> parent(nodes_.size(), k_none);
  std::vector<bool> visited(nodes_.size(), false);
  std::deque<NodeId> queue{*start};
  visited[*start] = true;

  while (!queue.empty()) {
    const NodeId current = queue.front();
    queue.pop_front();

    if (current == *goal) {
      std::vector<DependencyNode> path;
      for (NodeId n = current; n != k_none; n = parent[n]) {
        path.push_back(nodes_[n]);
      }
      return std::vector<DependencyNode>(path.rbegin(), path.rend());
    }

    for (const EdgeId e : outgoing_[current]) {
      const NodeId next = edge_to_[e];
      if (!visited[next]) {
        visited[next] = true;
        parent[next] = current;
        queue.push_back(next);
      }
    }
  }
  return std::nullopt;
}

std::vector<std::vector<DependencyNode>> DependencyGraph::find_cycles() const
{
  struct Frame
  {
    NodeId node;
    size_t next_edge;
  };

  std::vector<std::vector<DependencyNode>> cycles;
  std::vector<bool> visited(nodes_.size(), false);
  std::vector<bool> on_stack(nodes_.size(), false);
  std::vector<Frame> stack;

  for (NodeId root = 0; root < nodes_.size(); ++root) {
    if (visited[root]) continue;

    visited[root] = true;
    on_stack[root] = true;
    stack.push_back(Frame{root, 0});

    while (!stack.empty()) {
      Frame & top = stack.back();
      if (top.next_edge == outgoing_[top.node].size()) {
        on_stack[top.node] = false;
        stack.pop_back();
        continue;
      }

      const NodeId next = edge_to_[outgoing_[top.node][top.next_edge++]];
      if (!visited[next]) {
        visited[next] = true;
        on_stack[next] = true;
        stack.push_back(Frame{next, 0});
      } else if (on_stack[next]) {
        // Back edge: the cycle is the stack suffix starting at `next`.
        size_t start = stack.size();
        while (start > 0 && stack[start - 1].node != next) {
          --start;
        }
        std::vector<DependencyNode> cycle;
        for (size_t i = start - 1; i < stack.size(); ++i) {
          cycle.push_back(nodes_[stack[i].node]);
        }
        cycles.push_back(std::move(cycle));
      }
    }
  }
  return cycles;
}

std::optional<std::vector<DependencyNode>> DependencyGraph::topological_sort() const
{
  std::vector<size_t> in_degree(nodes_.size(), 0);
  for (NodeId n = 0; n < nodes_.size(); ++n) {
    in_degree[n] = incoming_[n].size();
  }

  std::deque<NodeId> queue;
  for (NodeId n = 0; n < nodes_.size(); ++n) {
    if (in_degree[n] == 0) queue.push_back(n);
  }

  std::vector<DependencyNode> sorted;
  sorted.reserve(nodes_.size());
  while (!queue.empty()) {
    const NodeId current = queue.front();
    queue.pop_front();
    sorted.push_back(nodes_[current]);

    for (const EdgeId e : outgoing_[current]) {
      const NodeId next = edge_to_[e];
      if (--in_degree[next] == 0) {
        queue.push_back(next);
      }
    }
  }

  if (sorted.size() != nodes_.size()) {
    return std::nullopt;
  }
  return sorted;
}

std::vector<std::string> DependencyGraph::get_called_functions(const std::string & name) const
{
  std::vector<std::string> out;
  // The exported flag is part of node identity; look the caller up either way.
  for (const bool exported : {false, true}) {
    const auto id = find(FunctionNode{name, exported});
    if (!id) continue;
    for (const EdgeId e : outgoing_[*id]) {
      if (const auto * fn = std::get_if<FunctionNode>(&nodes_[edge_to_[e]])) {
        out.push_back(fn->name);
      }
    }
  }
  return out;
}

DependencyGraph::NodeSet DependencyGraph::get_reachable_nodes(const DependencyNode & start) const
{
  NodeSet reachable;
  reachable.insert(start);

  const auto start_id = find(start);
  if (!start_id) {
    return reachable;
  }

  std::vector<bool> visited(nodes_.size(), false);
  std::deque<NodeId> queue{*start_id};
  visited[*start_id] = true;
  while (!queue.empty()) {
    const NodeId current = queue.front();
    queue.pop_front();
    for (const EdgeId e : outgoing_[current]) {
      const NodeId next = edge_to_[e];
      if (!visited[next]) {
        visited[next] = true;
        reachable.insert(nodes_[next]);
        queue.push_back(next);
      }
    }
  }
  return reachable;
}

}  // namespace bsl_gradual
