// tests/unit/analysis/test_dependency_graph.cpp - Unit tests for the dependency graph
//
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "bsl_gradual/analysis/dependency_graph.hpp"
#include "bsl_gradual/analysis/dependency_graph_builder.hpp"
#include "bsl_gradual/test_support/ast_builder.hpp"

using namespace bsl_gradual;
using test_support::AstBuilder;

namespace
{

DependencyNode var(const std::string & name) { return VariableNode{name, GlobalScope{}}; }

DependencyEdge edge(const DependencyNode & from, const DependencyNode & to)
{
  return DependencyEdge{from, to, DependencyType{DependencyType::Kind::Assignment, 0}, std::nullopt};
}

bool contains(const std::vector<DependencyNode> & nodes, const DependencyNode & node)
{
  return std::find(nodes.begin(), nodes.end(), node) != nodes.end();
}

size_t index_of(const std::vector<DependencyNode> & nodes, const DependencyNode & node)
{
  return static_cast<size_t>(std::find(nodes.begin(), nodes.end(), node) - nodes.begin());
}

}  // namespace

// ============================================================================
// Graph operations
// ============================================================================

TEST(DependencyGraphTest, AddEdgeInsertsEndpoints)
{
  DependencyGraph g;
  g.add_edge(edge(var("a"), var("b")));

  EXPECT_TRUE(g.contains(var("a")));
  EXPECT_TRUE(g.contains(var("b")));
  EXPECT_EQ(g.node_count(), 2U);
  EXPECT_EQ(g.edge_count(), 1U);

  g.add_node(var("a"));
  EXPECT_EQ(g.node_count(), 2U);
}

TEST(DependencyGraphTest, DependenciesAndDependents)
{
  DependencyGraph g;
  g.add_edge(edge(var("x"), var("y")));
  g.add_edge(edge(var("x"), var("z")));

  const auto deps = g.get_dependencies(var("x"));
  EXPECT_EQ(deps.size(), 2U);
  EXPECT_TRUE(contains(deps, var("y")));
  EXPECT_TRUE(contains(deps, var("z")));

  const auto dependents = g.get_dependents(var("y"));
  ASSERT_EQ(dependents.size(), 1U);
  EXPECT_EQ(dependents[0], var("x"));

  EXPECT_TRUE(g.get_dependencies(var("missing")).empty());
}

TEST(DependencyGraphTest, FindPath)
{
  DependencyGraph g;
  g.add_edge(edge(var("a"), var("b")));
  g.add_edge(edge(var("b"), var("c")));
  g.add_node(var("d"));

  const auto path = g.find_path(var("a"), var("c"));
  ASSERT_TRUE(path.has_value());
  ASSERT_EQ(path->size(), 3U);
  EXPECT_EQ((*path)[0], var("a"));
  EXPECT_EQ((*path)[1], var("b"));
  EXPECT_EQ((*path)[2], var("c"));

  EXPECT_FALSE(g.find_path(var("c"), var("a")).has_value());
  EXPECT_FALSE(g.find_path(var("a"), var("d")).has_value());
}

TEST(DependencyGraphTest, TopologicalSortOfDag)
{
  DependencyGraph g;
  g.add_edge(edge(var("a"), var("b")));
  g.add_edge(edge(var("b"), var("c")));
  g.add_edge(edge(var("a"), var("c")));

  const auto order = g.topological_sort();
  ASSERT_TRUE(order.has_value());
  ASSERT_EQ(order->size(), 3U);
  EXPECT_LT(index_of(*order, var("a")), index_of(*order, var("b")));
  EXPECT_LT(index_of(*order, var("b")), index_of(*order, var("c")));
  EXPECT_TRUE(g.find_cycles().empty());
}

TEST(DependencyGraphTest, CycleIsReportedAndBlocksSort)
{
  DependencyGraph g;
  const DependencyNode f = FunctionNode{"Ф", false};
  const DependencyNode h = FunctionNode{"Г", false};
  g.add_edge(edge(f, h));
  g.add_edge(edge(h, f));

  EXPECT_FALSE(g.topological_sort().has_value());

  const auto cycles = g.find_cycles();
  ASSERT_EQ(cycles.size(), 1U);
  EXPECT_EQ(cycles[0].size(), 2U);
  EXPECT_TRUE(contains(cycles[0], f));
  EXPECT_TRUE(contains(cycles[0], h));
}

TEST(DependencyGraphTest, SelfLoop)
{
  DependencyGraph g;
  const DependencyNode f = FunctionNode{"Факториал", false};
  g.add_edge(edge(f, f));

  const auto cycles = g.find_cycles();
  ASSERT_EQ(cycles.size(), 1U);
  EXPECT_EQ(cycles[0].size(), 1U);
  EXPECT_FALSE(g.topological_sort().has_value());
}

TEST(DependencyGraphTest, ReachableNodes)
{
  DependencyGraph g;
  g.add_edge(edge(var("a"), var("b")));
  g.add_edge(edge(var("b"), var("c")));
  g.add_edge(edge(var("d"), var("a")));

  const auto reachable = g.get_reachable_nodes(var("a"));
  EXPECT_EQ(reachable.size(), 3U);
  EXPECT_EQ(reachable.count(var("c")), 1U);
  EXPECT_EQ(reachable.count(var("d")), 0U);
}

TEST(DependencyGraphTest, NodesAreDistinguishedByScope)
{
  DependencyGraph g;
  g.add_node(VariableNode{"x", GlobalScope{}});
  g.add_node(VariableNode{"x", FunctionScope{"Ф"}});
  g.add_node(VariableNode{"x", ModuleScope{"Module.bsl"}});
  EXPECT_EQ(g.node_count(), 3U);
}

// ============================================================================
// Builder
// ============================================================================

class DependencyGraphBuilderTest : public ::testing::Test
{
protected:
  AstBuilder b;

  DependencyNode module_var(const std::string & name) const
  {
    return VariableNode{name, ModuleScope{"Module.bsl"}};
  }
};

TEST_F(DependencyGraphBuilderTest, AssignmentEdges)
{
  auto * prog = b.program({
    b.var("a", b.num(1)),
    b.var("b", b.binary(b.id("a"), BinaryOp::Add, b.num(2))),
  });

  DependencyGraphBuilder builder("Module.bsl");
  const DependencyGraph g = builder.build(*prog);

  const auto deps = g.get_dependencies(module_var("b"));
  ASSERT_EQ(deps.size(), 1U);
  EXPECT_EQ(deps[0], module_var("a"));

  const auto & edges = g.edges();
  ASSERT_EQ(edges.size(), 1U);
  EXPECT_EQ(edges[0].dep_type.kind, DependencyType::Kind::Assignment);
}

TEST_F(DependencyGraphBuilderTest, ExportedVariableAlsoGlobal)
{
  auto * prog = b.program({b.var("Настройка", b.str("x"), {}, true)});
  DependencyGraphBuilder builder("Module.bsl");
  const DependencyGraph g = builder.build(*prog);

  EXPECT_TRUE(g.contains(module_var("Настройка")));
  EXPECT_TRUE(g.contains(VariableNode{"Настройка", GlobalScope{}}));
}

TEST_F(DependencyGraphBuilderTest, CallEdgesFromFunctions)
{
  auto * prog = b.program({
    b.function("Сумма", {b.param("А"), b.param("Б")}, {
      b.ret(b.binary(b.id("А"), BinaryOp::Add, b.id("Б"))),
    }),
    b.function("Удвоить", {b.param("Х")}, {
      b.ret(b.call("Сумма", {b.id("Х"), b.id("Х")})),
    }, true),
  });

  DependencyGraphBuilder builder("Module.bsl");
  const DependencyGraph g = builder.build(*prog);

  const auto called = g.get_called_functions("Удвоить");
  ASSERT_EQ(called.size(), 1U);
  EXPECT_EQ(called[0], "Сумма");
  EXPECT_TRUE(g.get_called_functions("Сумма").empty());

  // Arguments flow into the callee's positional parameters.
  const DependencyNode arg0 = ParameterNode{"Сумма", "param_0"};
  ASSERT_TRUE(g.contains(arg0));
  EXPECT_TRUE(g.contains(ParameterNode{"Сумма", "param_1"}));
}

TEST_F(DependencyGraphBuilderTest, RecursionProducesCycle)
{
  auto * prog = b.program({
    b.function("Ф", {b.param("н")}, {
      b.ret(b.binary(
        b.id("н"), BinaryOp::Mul,
        b.call("Ф", {b.binary(b.id("н"), BinaryOp::Sub, b.num(1))}))),
    }),
  });

  DependencyGraphBuilder builder("Module.bsl");
  const DependencyGraph g = builder.build(*prog);
  EXPECT_FALSE(g.find_cycles().empty());
}

TEST_F(DependencyGraphBuilderTest, ConditionFeedsAssignmentsInBranch)
{
  auto * prog = b.program({
    b.var("флаг", b.boolean(true)),
    b.var("итог"),
    b.if_(b.id("флаг"), {b.assign("итог", b.num(1))}),
  });

  DependencyGraphBuilder builder("Module.bsl");
  const DependencyGraph g = builder.build(*prog);

  bool conditional = false;
  for (const auto & e : g.edges()) {
    if (e.dep_type.kind == DependencyType::Kind::Conditional) {
      conditional = e.from == module_var("итог") && e.to == module_var("флаг");
    }
  }
  EXPECT_TRUE(conditional);
}

TEST_F(DependencyGraphBuilderTest, EdgesCarryLocations)
{
  auto * prog = b.program({
    b.var("a", b.num(1), b.at(1)),
    b.assign("b", b.id("a", b.at(2, 5)), b.at(2)),
  });

  DependencyGraphBuilder builder("Module.bsl");
  const DependencyGraph g = builder.build(*prog);

  ASSERT_FALSE(g.edges().empty());
  const auto & loc = g.edges().back().location;
  ASSERT_TRUE(loc.has_value());
  EXPECT_EQ(loc->file, "Module.bsl");
  EXPECT_EQ(loc->line, 2U);
}
