// bsl_gradual/analysis/dependency_graph.hpp - Directed graph of program entities
//
// Nodes are variables, functions, parameters, return values, fields and
// methods; identity is value equality. Edges record how one entity depends
// on another. The graph is a multigraph and may contain cycles (recursion),
// so every query is cycle-safe. Storage is index based and all traversals
// use explicit worklists.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace bsl_gradual
{

// ============================================================================
// Scopes
// ============================================================================

struct GlobalScope
{
};
struct ModuleScope
{
  std::string name;
};
struct FunctionScope
{
  std::string name;
};
struct LocalScope
{
  std::string function;
  size_t block_id = 0;
};

using Scope = std::variant<GlobalScope, ModuleScope, FunctionScope, LocalScope>;

inline bool operator==(const GlobalScope &, const GlobalScope &) { return true; }
inline bool operator==(const ModuleScope & a, const ModuleScope & b) { return a.name == b.name; }
inline bool operator==(const FunctionScope & a, const FunctionScope & b)
{
  return a.name == b.name;
}
inline bool operator==(const LocalScope & a, const LocalScope & b)
{
  return a.function == b.function && a.block_id == b.block_id;
}

// ============================================================================
// Nodes
// ============================================================================

struct VariableNode
{
  std::string name;
  Scope scope;
};
struct FunctionNode
{
  std::string name;
  bool exported = false;
};
struct ParameterNode
{
  std::string function;
  std::string name;
};
struct ReturnValueNode
{
  std::string function;
};
struct FieldNode
{
  std::string object;
  std::string field;
};
struct MethodNode
{
  std::string object;
  std::string method;
};

using DependencyNode = std::variant<
  VariableNode, FunctionNode, ParameterNode, ReturnValueNode, FieldNode, MethodNode>;

bool operator==(const VariableNode & a, const VariableNode & b);
bool operator==(const FunctionNode & a, const FunctionNode & b);
bool operator==(const ParameterNode & a, const ParameterNode & b);
bool operator==(const ReturnValueNode & a, const ReturnValueNode & b);
bool operator==(const FieldNode & a, const FieldNode & b);
bool operator==(const MethodNode & a, const MethodNode & b);

struct DependencyNodeHash
{
  size_t operator()(const DependencyNode & node) const noexcept;
};

/// "Variable(Сумма @ Function(Рассчитать))", "Function(Ф)", ...
[[nodiscard]] std::string to_string(const Scope & scope);
[[nodiscard]] std::string to_string(const DependencyNode & node);

// ============================================================================
// Edges
// ============================================================================

struct DependencyType
{
  enum class Kind : uint8_t {
    Assignment,   ///< target = source
    Parameter,    ///< value passed as argument `index`
    Return,       ///< value returned from a function
    FieldAccess,  ///< object.field
    MethodCall,   ///< object.method(...)
    Expression,   ///< used inside an expression
    Conditional,  ///< used in a branch condition
  };

  Kind kind = Kind::Expression;
  size_t index = 0;  // argument position for Kind::Parameter

  [[nodiscard]] static DependencyType parameter(size_t i) { return {Kind::Parameter, i}; }
};

inline bool operator==(const DependencyType & a, const DependencyType & b)
{
  return a.kind == b.kind && (a.kind != DependencyType::Kind::Parameter || a.index == b.index);
}

[[nodiscard]] std::string to_string(const DependencyType & type);

struct EdgeLocation
{
  std::string file;
  uint32_t line = 0;
  uint32_t column = 0;
};

struct DependencyEdge
{
  DependencyNode from;
  DependencyNode to;
  DependencyType dep_type;
  std::optional<EdgeLocation> location;
};

// ============================================================================
// Graph
// ============================================================================

class DependencyGraph
{
public:
  using NodeSet = std::unordered_set<DependencyNode, DependencyNodeHash>;

  /// Insert a node; no-op if an equal node exists.
  void add_node(const DependencyNode & node);

  /// Insert an edge, adding missing endpoints first.
  void add_edge(DependencyEdge edge);

  [[nodiscard]] bool contains(const DependencyNode & node) const;

  /// Targets of outgoing edges, one entry per edge.
  [[nodiscard]] std::vector<DependencyNode> get_dependencies(const DependencyNode & node) const;

  /// Sources of incoming edges, one entry per edge.
  [[nodiscard]] std::vector<DependencyNode> get_dependents(const DependencyNode & node) const;

  /// Shortest path by edge count (BFS), including both endpoints.
  [[nodiscard]] std::optional<std::vector<DependencyNode>> find_path(
    const DependencyNode & from, const DependencyNode & to) const;

  /**
   * Cycles found by a depth-first search from every node in insertion
   * order. Each cycle lists its nodes starting at the node where the back
   * edge lands; a self-loop is a one-node cycle.
   */
  [[nodiscard]] std::vector<std::vector<DependencyNode>> find_cycles() const;

  /// Kahn's algorithm over edge in-degrees; std::nullopt if any cycle exists.
  [[nodiscard]] std::optional<std::vector<DependencyNode>> topological_sort() const;

  /// Names of functions reached by a direct edge from function `name`.
  [[nodiscard]] std::vector<std::string> get_called_functions(const std::string & name) const;

  /// All nodes reachable from `start`, including `start` itself.
  [[nodiscard]] NodeSet get_reachable_nodes(const DependencyNode & start) const;

  [[nodiscard]] size_t node_count() const noexcept { return nodes_.size(); }
  [[nodiscard]] size_t edge_count() const noexcept { return edges_.size(); }
  [[nodiscard]] const std::vector<DependencyNode> & nodes() const noexcept { return nodes_; }
  [[nodiscard]] const std::vector<DependencyEdge> & edges() const noexcept { return edges_; }

private:
  using NodeId = size_t;
  using EdgeId = size_t;

  NodeId intern(const DependencyNode & node);
  [[nodiscard]] std::optional<NodeId> find(const DependencyNode & node) const;

  std::vector<DependencyNode> nodes_;
  std::unordered_map<DependencyNode, NodeId, DependencyNodeHash> index_;

  std::vector<DependencyEdge> edges_;
  std::vector<NodeId> edge_to_;
  std::vector<NodeId> edge_from_;
  std::vector<std::vector<EdgeId>> outgoing_;
  std::vector<std::vector<EdgeId>> incoming_;
};

}  // namespace bsl_gradual
