// bsl_gradual/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds and operators of the BSL syntax tree.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace bsl_gradual
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for range-based classof checks.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "bsl_gradual/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "bsl_gradual/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "bsl_gradual/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "bsl_gradual/ast/ast_nodes.def"
};

// ============================================================================
// Operators
// ============================================================================

enum class BinaryOp : uint8_t {
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
  // Comparison
  Eq,  ///< =
  Ne,  ///< <>
  Lt,  ///< <
  Le,  ///< <=
  Gt,  ///< >
  Ge,  ///< >=
  // Logical
  And,  ///< И / And
  Or,   ///< ИЛИ / Or
};

enum class UnaryOp : uint8_t {
  Not,  ///< НЕ / Not
  Neg,  ///< -
};

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Eq:
      return "=";
    case BinaryOp::Ne:
      return "<>";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::And:
      return "И";
    case BinaryOp::Or:
      return "ИЛИ";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "НЕ";
    case UnaryOp::Neg:
      return "-";
  }
  return "";
}

/// Spelling used by the JSON tree format ("Add", "NotEqual", ...).
[[nodiscard]] std::string_view binary_op_name(BinaryOp op) noexcept;
[[nodiscard]] std::optional<BinaryOp> binary_op_from_name(std::string_view name) noexcept;
[[nodiscard]] std::string_view unary_op_name(UnaryOp op) noexcept;
[[nodiscard]] std::optional<UnaryOp> unary_op_from_name(std::string_view name) noexcept;

[[nodiscard]] constexpr bool is_arithmetic(BinaryOp op) noexcept
{
  return op == BinaryOp::Add || op == BinaryOp::Sub || op == BinaryOp::Mul ||
         op == BinaryOp::Div || op == BinaryOp::Mod;
}

[[nodiscard]] constexpr bool is_comparison(BinaryOp op) noexcept
{
  return op >= BinaryOp::Eq && op <= BinaryOp::Ge;
}

[[nodiscard]] constexpr bool is_logical(BinaryOp op) noexcept
{
  return op == BinaryOp::And || op == BinaryOp::Or;
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::NumberLiteral;
inline constexpr NodeKind k_last_expr_kind = NodeKind::StructureLiteral;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::VarDecl;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::Raise;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

[[nodiscard]] std::string_view to_string(NodeKind kind) noexcept;

}  // namespace bsl_gradual
