// bsl_gradual/ast/ast.cpp - Out-of-line helpers for syntax tree nodes
#include "bsl_gradual/ast/ast.hpp"

#include <array>
#include <utility>

namespace bsl_gradual
{

namespace
{

constexpr std::array<std::pair<BinaryOp, std::string_view>, 13> k_binary_op_names = {{
  {BinaryOp::Add, "Add"},
  {BinaryOp::Sub, "Subtract"},
  {BinaryOp::Mul, "Multiply"},
  {BinaryOp::Div, "Divide"},
  {BinaryOp::Mod, "Modulo"},
  {BinaryOp::Eq, "Equal"},
  {BinaryOp::Ne, "NotEqual"},
  {BinaryOp::Lt, "Less"},
  {BinaryOp::Le, "LessOrEqual"},
  {BinaryOp::Gt, "Greater"},
  {BinaryOp::Ge, "GreaterOrEqual"},
  {BinaryOp::And, "And"},
  {BinaryOp::Or, "Or"},
}};

}  // namespace

std::string_view binary_op_name(BinaryOp op) noexcept
{
  for (const auto & [value, name] : k_binary_op_names) {
    if (value == op) return name;
  }
  return "";
}

std::optional<BinaryOp> binary_op_from_name(std::string_view name) noexcept
{
  for (const auto & [value, n] : k_binary_op_names) {
    if (n == name) return value;
  }
  return std::nullopt;
}

std::string_view unary_op_name(UnaryOp op) noexcept
{
  return op == UnaryOp::Not ? "Not" : "Minus";
}

std::optional<UnaryOp> unary_op_from_name(std::string_view name) noexcept
{
  if (name == "Not") return UnaryOp::Not;
  if (name == "Minus") return UnaryOp::Neg;
  return std::nullopt;
}

std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Kind;
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Kind;
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Kind;
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Kind;
#include "bsl_gradual/ast/ast_nodes.def"
  }
  return "";
}

std::string_view CallExpr::callee_name() const noexcept
{
  if (const auto * id = dyn_cast<IdentifierExpr>(callee)) {
    return id->name;
  }
  return {};
}

std::string_view AssignmentStmt::target_name() const noexcept
{
  if (const auto * id = dyn_cast<IdentifierExpr>(target)) {
    return id->name;
  }
  return {};
}

}  // namespace bsl_gradual
