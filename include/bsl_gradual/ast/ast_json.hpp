// bsl_gradual/ast/ast_json.hpp - JSON form of the syntax tree
//
// The external parser hands trees over as JSON:
//
//   {"file": "Module.bsl", "statements": [
//     {"kind": "VarDecl", "line": 1, "column": 1, "name": "x",
//      "init": {"kind": "NumberLiteral", "line": 1, "column": 10, "value": 42}}]}
//
// Every node object carries "kind" (a NodeKind name) and optionally "line",
// "column", "end_line", "end_column". Operators use their long names
// ("Add", "NotEqual", "Not", "Minus").
//
#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include "bsl_gradual/ast/ast.hpp"
#include "bsl_gradual/ast/ast_context.hpp"

namespace bsl_gradual
{

struct ProgramLoadResult
{
  /// Root of the tree, owned by the AstContext passed to the loader.
  Program * program = nullptr;

  bool success = false;
  std::string error;

  static ProgramLoadResult ok(Program * p)
  {
    ProgramLoadResult r;
    r.program = p;
    r.success = true;
    return r;
  }

  static ProgramLoadResult fail(std::string msg)
  {
    ProgramLoadResult r;
    r.error = std::move(msg);
    return r;
  }
};

/**
 * Build a tree from its JSON form. Malformed input (unknown kind, missing or
 * mistyped field) yields an error result.
 */
[[nodiscard]] ProgramLoadResult load_program_json(const nlohmann::json & json, AstContext & ctx);

/// Parse JSON text, then load_program_json().
[[nodiscard]] ProgramLoadResult load_program_json_text(std::string_view text, AstContext & ctx);

/// Read and parse a JSON file, then load_program_json().
[[nodiscard]] ProgramLoadResult load_program_json_file(
  const std::filesystem::path & path, AstContext & ctx);

/// Serialize a tree back into the same JSON form.
[[nodiscard]] nlohmann::json to_json(const AstNode * node);
[[nodiscard]] nlohmann::json to_json(const Program * program);

}  // namespace bsl_gradual
